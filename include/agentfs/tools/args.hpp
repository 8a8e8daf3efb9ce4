#pragma once

#include "agentfs/common/result.hpp"
#include "agentfs/tools/tool.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace agentfs::tools {

[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &name);
[[nodiscard]] std::optional<std::string> optional_arg(const ToolArgs &args,
                                                      const std::string &name);

/// Typed lookups falling back to `fallback` when the argument is absent or
/// `null`. Malformed values fail with InvalidArgument.
[[nodiscard]] common::Result<bool> bool_arg(const ToolArgs &args, const std::string &name,
                                            bool fallback);
[[nodiscard]] common::Result<std::int64_t> int_arg(const ToolArgs &args, const std::string &name,
                                                   std::int64_t fallback);
[[nodiscard]] common::Result<double> double_arg(const ToolArgs &args, const std::string &name,
                                                double fallback);

/// Fails unless `min <= value <= max`.
[[nodiscard]] common::Status check_range(const std::string &name, double value, double min,
                                         double max);

/// Flat JSON object to ToolArgs.
[[nodiscard]] common::Result<ToolArgs> args_from_json(const std::string &json);

/// `"value"` with JSON escaping.
[[nodiscard]] std::string json_quote(const std::string &value);

} // namespace agentfs::tools
