#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace agentfs::search {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public IHttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

} // namespace agentfs::search
