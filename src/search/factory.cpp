#include "agentfs/search/factory.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/search/sqlite_vector_store.hpp"

namespace agentfs::search {

common::Result<std::shared_ptr<IVectorStore>> create_vector_store(const config::Config &config) {
  using StoreResult = common::Result<std::shared_ptr<IVectorStore>>;
  const std::string backend = common::to_lower(common::trim(config.search.vector_store));
  if (backend.empty() || backend == "memory") {
    return StoreResult::success(std::make_shared<InMemoryVectorStore>());
  }
  if (backend == "sqlite") {
    if (config.search.db_path.empty()) {
      return StoreResult::failure("search.db_path is required for the sqlite vector store",
                                  common::ErrorCode::Config);
    }
    auto store = std::make_shared<SqliteVectorStore>(common::expand_path(config.search.db_path),
                                                     config.workspace.id);
    if (auto opened = store->open(); !opened.ok()) {
      return StoreResult::propagate(opened);
    }
    return StoreResult::success(std::move(store));
  }
  return StoreResult::failure("Unknown vector store: " + config.search.vector_store,
                              common::ErrorCode::Config);
}

common::Result<std::shared_ptr<HybridSearchIndex>>
create_search_index(const config::Config &config, std::shared_ptr<IHttpClient> http_client) {
  using IndexResult = common::Result<std::shared_ptr<HybridSearchIndex>>;
  auto embedder = create_embedder(config, std::move(http_client));
  if (!embedder.ok()) {
    return IndexResult::propagate(embedder);
  }
  auto store = create_vector_store(config);
  if (!store.ok()) {
    return IndexResult::propagate(store);
  }
  return IndexResult::success(
      std::make_shared<HybridSearchIndex>(embedder.value(), store.value()));
}

} // namespace agentfs::search
