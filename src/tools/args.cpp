#include "agentfs/tools/args.hpp"

#include "agentfs/common/fs.hpp"
#include "agentfs/common/json_util.hpp"

#include <cmath>
#include <stdexcept>

namespace agentfs::tools {

namespace {

std::optional<std::string> present(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end()) {
    return std::nullopt;
  }
  const std::string value = common::trim(it->second);
  if (value.empty() || value == "null") {
    return std::nullopt;
  }
  return value;
}

} // namespace

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end() || it->second.empty()) {
    return common::Result<std::string>::failure("Missing argument: " + name,
                                                common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::string>::success(it->second);
}

std::optional<std::string> optional_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

common::Result<bool> bool_arg(const ToolArgs &args, const std::string &name,
                              const bool fallback) {
  const auto value = present(args, name);
  if (!value.has_value()) {
    return common::Result<bool>::success(fallback);
  }
  const std::string lowered = common::to_lower(*value);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    return common::Result<bool>::success(true);
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure("Argument " + name + " must be a boolean",
                                       common::ErrorCode::InvalidArgument);
}

common::Result<std::int64_t> int_arg(const ToolArgs &args, const std::string &name,
                                     const std::int64_t fallback) {
  const auto value = present(args, name);
  if (!value.has_value()) {
    return common::Result<std::int64_t>::success(fallback);
  }
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(*value, &consumed);
    if (consumed != value->size()) {
      throw std::invalid_argument(*value);
    }
    return common::Result<std::int64_t>::success(static_cast<std::int64_t>(parsed));
  } catch (const std::exception &) {
    return common::Result<std::int64_t>::failure("Argument " + name + " must be an integer",
                                                 common::ErrorCode::InvalidArgument);
  }
}

common::Result<double> double_arg(const ToolArgs &args, const std::string &name,
                                  const double fallback) {
  const auto value = present(args, name);
  if (!value.has_value()) {
    return common::Result<double>::success(fallback);
  }
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(*value, &consumed);
    if (consumed != value->size() || !std::isfinite(parsed)) {
      throw std::invalid_argument(*value);
    }
    return common::Result<double>::success(parsed);
  } catch (const std::exception &) {
    return common::Result<double>::failure("Argument " + name + " must be a number",
                                           common::ErrorCode::InvalidArgument);
  }
}

common::Status check_range(const std::string &name, const double value, const double min,
                           const double max) {
  if (value < min || value > max) {
    return common::Status::error("Argument " + name + " must be between " +
                                     common::json_number(min) + " and " +
                                     common::json_number(max),
                                 common::ErrorCode::InvalidArgument);
  }
  return common::Status::success();
}

common::Result<ToolArgs> args_from_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty()) {
    return common::Result<ToolArgs>::success(ToolArgs{});
  }
  if (trimmed.front() != '{' || trimmed.back() != '}') {
    return common::Result<ToolArgs>::failure("Tool arguments must be a JSON object",
                                             common::ErrorCode::InvalidArgument);
  }
  auto flat = common::json_parse_flat(trimmed);
  return common::Result<ToolArgs>::success(ToolArgs(flat.begin(), flat.end()));
}

std::string json_quote(const std::string &value) {
  return "\"" + common::json_escape(value) + "\"";
}

} // namespace agentfs::tools
