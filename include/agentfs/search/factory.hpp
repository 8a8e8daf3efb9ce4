#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/config/schema.hpp"
#include "agentfs/search/hybrid_index.hpp"

#include <memory>

namespace agentfs::search {

[[nodiscard]] common::Result<std::shared_ptr<IVectorStore>>
create_vector_store(const config::Config &config);

[[nodiscard]] common::Result<std::shared_ptr<HybridSearchIndex>>
create_search_index(const config::Config &config,
                    std::shared_ptr<IHttpClient> http_client = nullptr);

} // namespace agentfs::search
