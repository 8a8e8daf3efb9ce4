#include "agentfs/search/embedder.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/search/cached_embedder.hpp"
#include "agentfs/search/embedder_local.hpp"
#include "agentfs/search/embedder_noop.hpp"
#include "agentfs/search/embedder_openai.hpp"

#include <cstdlib>
#include <filesystem>

namespace agentfs::search {

common::Result<std::shared_ptr<IEmbedder>> create_embedder(const config::Config &config,
                                                           std::shared_ptr<IHttpClient> http_client) {
  using EmbedderResult = common::Result<std::shared_ptr<IEmbedder>>;
  const auto &search = config.search;
  const std::string provider = common::to_lower(common::trim(search.embedding_provider));

  std::shared_ptr<IEmbedder> embedder;
  if (provider == "noop" || provider == "none") {
    return EmbedderResult::success(std::make_shared<NoopEmbedder>());
  }
  if (provider == "local" || provider.empty()) {
    embedder = std::make_shared<LocalEmbedder>(search.embedding_dimensions);
  } else if (provider == "openai") {
    std::string key = search.api_key.value_or("");
    if (key.empty()) {
      if (const char *env = std::getenv("AGENTFS_API_KEY"); env != nullptr) {
        key = env;
      }
    }
    if (key.empty()) {
      return EmbedderResult::failure("openai embedding provider requires search.api_key",
                                     common::ErrorCode::Config);
    }
    if (http_client == nullptr) {
      http_client = std::make_shared<CurlHttpClient>();
    }
    embedder = std::make_shared<OpenAiEmbedder>(key, search.embedding_model,
                                                search.embedding_dimensions,
                                                search.embedding_base_url, std::move(http_client));
  } else {
    return EmbedderResult::failure("Unknown embedding provider: " + search.embedding_provider,
                                   common::ErrorCode::Config);
  }

  // only remote embeddings are worth caching on disk
  if (provider == "openai" && search.embedding_cache_size > 0 && !search.db_path.empty()) {
    const auto cache_path = std::filesystem::path(search.db_path).replace_extension(".cache.db");
    auto cached = std::make_shared<CachedEmbedder>(embedder, cache_path, search.embedding_cache_size);
    if (auto opened = cached->open(); !opened.ok()) {
      return EmbedderResult::propagate(opened);
    }
    embedder = cached;
  }
  return EmbedderResult::success(std::move(embedder));
}

} // namespace agentfs::search
