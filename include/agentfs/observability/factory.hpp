#pragma once

#include "agentfs/config/schema.hpp"
#include "agentfs/observability/observer.hpp"

#include <memory>

namespace agentfs::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace agentfs::observability
