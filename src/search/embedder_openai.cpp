#include "agentfs/search/embedder_openai.hpp"

#include "agentfs/common/json_util.hpp"

#include <sstream>

namespace agentfs::search {

namespace {

constexpr std::uint64_t kEmbeddingTimeoutMs = 30'000;

common::Result<std::vector<float>> parse_embedding(const std::string &body) {
  const auto data = common::json_get_array(body, "data");
  const auto embedding = common::json_get_array(data.empty() ? body : data, "embedding");
  if (embedding.empty()) {
    return common::Result<std::vector<float>>::failure("embedding field missing",
                                                       common::ErrorCode::Embedding);
  }
  auto parsed = common::json_parse_float_array(embedding);
  if (!parsed.ok()) {
    return common::Result<std::vector<float>>::failure(parsed.error(),
                                                       common::ErrorCode::Embedding);
  }
  return parsed;
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, const std::size_t dimensions,
                               std::string base_url, std::shared_ptr<IHttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), dimensions_(dimensions),
      base_url_(std::move(base_url)), http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  if (api_key_.empty()) {
    return common::Result<std::vector<float>>::failure("missing API key",
                                                       common::ErrorCode::Embedding);
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"input\":\"" << common::json_escape(std::string(text)) << "\",";
  body << "\"dimensions\":" << dimensions_;
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json(base_url_ + "/embeddings", headers, body.str(), kEmbeddingTimeoutMs);
  if (response.timeout) {
    return common::Result<std::vector<float>>::failure("embedding request timed out",
                                                       common::ErrorCode::Embedding);
  }
  if (response.network_error) {
    return common::Result<std::vector<float>>::failure(response.network_error_message,
                                                       common::ErrorCode::Embedding);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string message = common::json_get_string(response.body, "message");
    return common::Result<std::vector<float>>::failure(
        "embedding API error (HTTP " + std::to_string(response.status) + ")" +
            (message.empty() ? "" : ": " + message),
        common::ErrorCode::Embedding);
  }

  auto parsed = parse_embedding(response.body);
  if (!parsed.ok()) {
    return parsed;
  }
  if (parsed.value().size() != dimensions_) {
    parsed.value().resize(dimensions_, 0.0F);
  }
  return parsed;
}

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

} // namespace agentfs::search
