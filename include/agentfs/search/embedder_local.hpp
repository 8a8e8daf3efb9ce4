#pragma once

#include "agentfs/search/embedder.hpp"

namespace agentfs::search {

/// Offline, deterministic embedding: hashed bag of tokens and character
/// trigrams with non-negative weights, L2-normalized.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 256);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace agentfs::search
