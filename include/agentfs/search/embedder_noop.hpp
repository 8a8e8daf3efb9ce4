#pragma once

#include "agentfs/search/embedder.hpp"

namespace agentfs::search {

/// Produces empty vectors, which makes vector search return nothing.
class NoopEmbedder final : public IEmbedder {
public:
  [[nodiscard]] std::string_view name() const override { return "noop"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view) override {
    return common::Result<std::vector<float>>::success({});
  }
  [[nodiscard]] std::size_t dimensions() const override { return 0; }
};

} // namespace agentfs::search
