#include "agentfs/search/embedder_local.hpp"

#include "agentfs/search/tokenizer.hpp"

#include <cmath>
#include <functional>

namespace agentfs::search {

namespace {

constexpr float kTokenWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  std::hash<std::string> hasher;
  for (const auto &token : tokenize(text)) {
    values[hasher(token) % dimensions_] += kTokenWeight;
    if (token.size() < 3) {
      continue;
    }
    const std::string padded = "#" + token + "#";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      values[hasher("3:" + padded.substr(i, 3)) % dimensions_] += kTrigramWeight;
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace agentfs::search
