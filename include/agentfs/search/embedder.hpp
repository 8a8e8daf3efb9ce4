#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/config/schema.hpp"
#include "agentfs/search/http_client.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentfs::search {

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Builds the configured embedder. Remote embedders are wrapped in the
/// SQLite cache when `embedding_cache_size` and `db_path` are set.
[[nodiscard]] common::Result<std::shared_ptr<IEmbedder>>
create_embedder(const config::Config &config, std::shared_ptr<IHttpClient> http_client = nullptr);

} // namespace agentfs::search
