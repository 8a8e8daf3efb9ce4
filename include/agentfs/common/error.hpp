#pragma once

#include <string>
#include <string_view>

namespace agentfs::common {

enum class ErrorCode {
  None,
  InvalidArgument,
  PathTraversal,
  PathEscape,
  ReadRequired,
  StaleRead,
  OperationCancelled,
  NotFound,
  AlreadyExists,
  Io,
  ToolDisabled,
  ApprovalDenied,
  Embedding,
  VectorStore,
  Config,
};

[[nodiscard]] std::string error_code_to_string(ErrorCode code);
[[nodiscard]] ErrorCode error_code_from_string(std::string_view value);

/// Errors the caller can resolve by re-reading the path and retrying.
[[nodiscard]] bool is_recoverable(ErrorCode code);

} // namespace agentfs::common
