#pragma once

#include "agentfs/search/embedder.hpp"

namespace agentfs::search {

/// OpenAI-compatible `POST {base_url}/embeddings`.
class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::size_t dimensions,
                 std::string base_url = "https://api.openai.com/v1",
                 std::shared_ptr<IHttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string api_key_;
  std::string model_;
  std::size_t dimensions_;
  std::string base_url_;
  std::shared_ptr<IHttpClient> http_client_;
};

} // namespace agentfs::search
