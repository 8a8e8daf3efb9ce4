#include "agentfs/tools/builtin/search.hpp"

#include "agentfs/search/snippet.hpp"

#include "builtin_internal.hpp"

#include <sstream>

namespace agentfs::tools {

namespace {

using builtin_internal::json_result;

constexpr std::int64_t kDefaultMaxFiles = 200;
constexpr std::int64_t kDefaultSnippetLength = 200;

} // namespace

SearchTool::SearchTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime,
                       std::shared_ptr<search::HybridSearchIndex> index)
    : runtime_(std::move(runtime)), index_(std::move(index)) {}

common::Result<ToolResult> SearchTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!runtime_ || !index_) {
    return common::Result<ToolResult>::failure("search index unavailable",
                                                common::ErrorCode::Config);
  }
  if (const auto active = ctx.check_active(); !active.ok()) {
    return common::Result<ToolResult>::propagate(active);
  }
  return run(args, ctx);
}

// workspace_index

std::string_view WorkspaceIndexTool::description() const {
  return "Index workspace files for BM25, vector, and hybrid search.";
}

std::string WorkspaceIndexTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string","description":"Workspace directory path starting with /"},"glob":{"type":"string","default":"**/*","description":"Glob filter"},"max_files":{"type":"integer","minimum":1,"default":200}}})";
}

common::Result<ToolResult> WorkspaceIndexTool::run(const ToolArgs &args, const ToolContext &ctx) {
  auto path = required_arg(args, "path");
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  auto max_files = int_arg(args, "max_files", kDefaultMaxFiles);
  if (!max_files.ok()) {
    return common::Result<ToolResult>::propagate(max_files);
  }
  if (max_files.value() <= 0) {
    return common::Result<ToolResult>::failure("Argument max_files must be positive",
                                                common::ErrorCode::InvalidArgument);
  }
  const std::string glob = optional_arg(args, "glob").value_or("**/*");

  auto &fs = runtime_->filesystem();
  auto matches = fs.glob_info(glob, path.value());
  if (!matches.ok()) {
    return common::Result<ToolResult>::propagate(matches);
  }

  // every glob match, directories included
  const std::size_t total_found = matches.value().size();
  std::size_t indexed = 0;
  std::size_t skipped = 0;
  std::size_t considered = 0;
  for (const auto &file : matches.value()) {
    if (file.is_dir) {
      continue;
    }
    if (considered >= static_cast<std::size_t>(max_files.value())) {
      break;
    }
    ++considered;
    if (auto active = ctx.check_active(); !active.ok()) {
      return common::Result<ToolResult>::propagate(active);
    }

    auto content = fs.read(file.path);
    if (!content.ok()) {
      if (content.code() == common::ErrorCode::InvalidArgument) {
        ++skipped;
        continue;
      }
      return common::Result<ToolResult>::propagate(content);
    }
    if (auto upserted = index_->upsert(search::IndexedDocument{
            .path = file.path, .content = content.value(), .source = "filesystem"});
        !upserted.ok()) {
      return common::Result<ToolResult>::propagate(upserted);
    }
    ++indexed;
  }

  runtime_->observer().record_event(observability::IndexEvent{
      .path = path.value(), .indexed = indexed, .total_found = total_found});

  std::string output = R"({"indexed":)" + std::to_string(indexed) + R"(,"totalFound":)" +
                       std::to_string(total_found);
  if (skipped > 0) {
    output += R"(,"skipped":)" + std::to_string(skipped);
  }
  output += "}";
  return common::Result<ToolResult>::success(json_result(std::move(output)));
}

// workspace_index_content

std::string_view WorkspaceIndexContentTool::description() const {
  return "Index raw content under a virtual path for later search.";
}

std::string WorkspaceIndexContentTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string","description":"Virtual path to store content under"},"content":{"type":"string","description":"Raw content"},"source":{"type":"string","default":"manual"}}})";
}

common::Result<ToolResult> WorkspaceIndexContentTool::run(const ToolArgs &args,
                                                          const ToolContext &) {
  auto raw_path = required_arg(args, "path");
  if (!raw_path.ok()) {
    return common::Result<ToolResult>::propagate(raw_path);
  }
  auto path = workspace::WorkspaceRuntime::normalize_path(raw_path.value());
  if (!path.ok()) {
    return common::Result<ToolResult>::propagate(path);
  }
  const auto content = args.find("content");
  if (content == args.end()) {
    return common::Result<ToolResult>::failure("Missing argument: content",
                                                common::ErrorCode::InvalidArgument);
  }

  if (auto upserted = index_->upsert(search::IndexedDocument{
          .path = path.value(),
          .content = content->second,
          .source = optional_arg(args, "source").value_or("manual")});
      !upserted.ok()) {
    return common::Result<ToolResult>::propagate(upserted);
  }
  runtime_->observer().record_event(
      observability::IndexEvent{.path = path.value(), .indexed = 1, .total_found = 1});
  return common::Result<ToolResult>::success(
      json_result(R"({"indexed":true,"path":)" + json_quote(path.value()) + "}"));
}

// workspace_search

WorkspaceSearchTool::WorkspaceSearchTool(std::shared_ptr<workspace::WorkspaceRuntime> runtime,
                                         std::shared_ptr<search::HybridSearchIndex> index,
                                         SearchToolDefaults defaults)
    : SearchTool(std::move(runtime), std::move(index)), defaults_(defaults) {}

std::string_view WorkspaceSearchTool::description() const {
  return "Search indexed workspace content using BM25, vector, or hybrid search.";
}

std::string WorkspaceSearchTool::parameters_schema() const {
  return R"({"type":"object","required":["query"],"properties":{"query":{"type":"string","minLength":1},"mode":{"type":"string","enum":["bm25","vector","hybrid"],"default":"hybrid"},"top_k":{"type":"integer","minimum":1,"default":5},"min_score":{"type":"number","minimum":0,"maximum":1,"default":0},"include_content":{"type":"boolean","default":true},"snippet_length":{"type":"integer","minimum":1,"default":200},"vector_weight":{"type":"number","minimum":0,"maximum":1,"default":0.6}}})";
}

common::Result<ToolResult> WorkspaceSearchTool::run(const ToolArgs &args, const ToolContext &) {
  auto query = required_arg(args, "query");
  if (!query.ok()) {
    return common::Result<ToolResult>::propagate(query);
  }

  const std::string mode_name = optional_arg(args, "mode").value_or("hybrid");
  const auto mode = search::search_mode_from_string(mode_name);
  if (!mode.has_value()) {
    return common::Result<ToolResult>::failure("Unknown search mode: " + mode_name,
                                                common::ErrorCode::InvalidArgument);
  }
  auto top_k = int_arg(args, "top_k", static_cast<std::int64_t>(defaults_.top_k));
  if (!top_k.ok()) {
    return common::Result<ToolResult>::propagate(top_k);
  }
  if (top_k.value() <= 0) {
    return common::Result<ToolResult>::failure("Argument top_k must be positive",
                                                common::ErrorCode::InvalidArgument);
  }
  auto min_score = double_arg(args, "min_score", 0.0);
  if (!min_score.ok()) {
    return common::Result<ToolResult>::propagate(min_score);
  }
  if (auto in_range = check_range("min_score", min_score.value(), 0.0, 1.0); !in_range.ok()) {
    return common::Result<ToolResult>::propagate(in_range);
  }
  auto include_content = bool_arg(args, "include_content", true);
  if (!include_content.ok()) {
    return common::Result<ToolResult>::propagate(include_content);
  }
  auto snippet_length = int_arg(args, "snippet_length", kDefaultSnippetLength);
  if (!snippet_length.ok()) {
    return common::Result<ToolResult>::propagate(snippet_length);
  }
  if (snippet_length.value() <= 0) {
    return common::Result<ToolResult>::failure("Argument snippet_length must be positive",
                                                common::ErrorCode::InvalidArgument);
  }
  auto vector_weight = double_arg(args, "vector_weight", defaults_.vector_weight);
  if (!vector_weight.ok()) {
    return common::Result<ToolResult>::propagate(vector_weight);
  }
  if (auto in_range = check_range("vector_weight", vector_weight.value(), 0.0, 1.0);
      !in_range.ok()) {
    return common::Result<ToolResult>::propagate(in_range);
  }

  auto hits = index_->search(query.value(),
                             search::SearchOptions{.mode = *mode,
                                                   .top_k = static_cast<std::size_t>(top_k.value()),
                                                   .vector_weight = vector_weight.value(),
                                                   .min_score = min_score.value()});
  if (!hits.ok()) {
    return common::Result<ToolResult>::propagate(hits);
  }

  std::ostringstream out;
  out << R"({"query":)" << json_quote(query.value()) << R"(,"results":[)";
  bool first = true;
  for (const auto &hit : hits.value()) {
    const auto document = index_->get(hit.path);
    const std::string content = document.has_value() ? document->content : std::string();
    const auto snippet = search::extract_snippet(content, query.value(),
                                                 static_cast<std::size_t>(snippet_length.value()));

    out << (first ? "" : ",") << R"({"path":)" << json_quote(hit.path) << R"(,"score":)"
        << common::json_number(hit.score) << R"(,"scoreDetails":{)";
    if (hit.bm25_score.has_value()) {
      out << R"("bm25":)" << common::json_number(*hit.bm25_score);
    }
    if (hit.vector_score.has_value()) {
      out << (hit.bm25_score.has_value() ? "," : "") << R"("vector":)"
          << common::json_number(*hit.vector_score);
    }
    out << "}";
    if (include_content.value()) {
      out << R"(,"content":)" << json_quote(content);
    }
    out << R"(,"snippet":)" << json_quote(snippet.text) << R"(,"lineRange":[)"
        << snippet.line_range.first << "," << snippet.line_range.second << "]}";
    first = false;
  }
  out << "]}";

  runtime_->observer().record_event(
      observability::SearchEvent{.mode = mode_name, .results = hits.value().size()});

  ToolResult result = json_result(out.str());
  result.metadata["results"] = std::to_string(hits.value().size());
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace agentfs::tools
