#pragma once

#include "agentfs/observability/observer.hpp"

namespace agentfs::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace agentfs::observability
