#include "agentfs/tools/tool.hpp"

#include "agentfs/common/json_util.hpp"

namespace agentfs::tools {

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .toolkit = std::string(toolkit()),
                  .mutating = is_mutating()};
}

std::string error_output(const common::Status &status) {
  return R"({"error":{"code":")" + common::error_code_to_string(status.code()) +
         R"(","message":")" + common::json_escape(status.error()) + R"("}})";
}

ToolResult failure_result(const common::Status &status) {
  ToolResult result;
  result.success = false;
  result.output = error_output(status);
  result.metadata["error_code"] = common::error_code_to_string(status.code());
  if (common::is_recoverable(status.code())) {
    result.metadata["recoverable"] = "true";
  }
  return result;
}

} // namespace agentfs::tools
