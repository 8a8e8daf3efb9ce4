#include "agentfs/common/error.hpp"

#include <array>
#include <utility>

namespace agentfs::common {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 15> kCodeNames = {{
    {ErrorCode::None, "none"},
    {ErrorCode::InvalidArgument, "invalid_argument"},
    {ErrorCode::PathTraversal, "path_traversal"},
    {ErrorCode::PathEscape, "path_escape"},
    {ErrorCode::ReadRequired, "read_required"},
    {ErrorCode::StaleRead, "stale_read"},
    {ErrorCode::OperationCancelled, "operation_cancelled"},
    {ErrorCode::NotFound, "not_found"},
    {ErrorCode::AlreadyExists, "already_exists"},
    {ErrorCode::Io, "io"},
    {ErrorCode::ToolDisabled, "tool_disabled"},
    {ErrorCode::ApprovalDenied, "approval_denied"},
    {ErrorCode::Embedding, "embedding"},
    {ErrorCode::VectorStore, "vector_store"},
    {ErrorCode::Config, "config"},
}};

} // namespace

std::string error_code_to_string(const ErrorCode code) {
  for (const auto &[candidate, name] : kCodeNames) {
    if (candidate == code) {
      return std::string(name);
    }
  }
  return "io";
}

ErrorCode error_code_from_string(const std::string_view value) {
  for (const auto &[code, name] : kCodeNames) {
    if (name == value) {
      return code;
    }
  }
  return ErrorCode::Io;
}

bool is_recoverable(const ErrorCode code) {
  return code == ErrorCode::ReadRequired || code == ErrorCode::StaleRead;
}

} // namespace agentfs::common
