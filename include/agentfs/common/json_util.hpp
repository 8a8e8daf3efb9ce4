#pragma once

#include "agentfs/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentfs::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Render a double the way result payloads expect it (finite, up to 6 decimals).
[[nodiscard]] std::string json_number(double value);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a JSON array of numbers such as `[0.1, -2e-3]`.
[[nodiscard]] Result<std::vector<float>> json_parse_float_array(const std::string &array_json);

/// Parse a flat JSON object into a key→value map (top-level only, nested values kept raw).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

} // namespace agentfs::common
