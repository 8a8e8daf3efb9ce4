#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentfs::search {

struct ScoredPath {
  std::string path;
  double score = 0.0;
};

/// Lexical half of the hybrid index. Implementations are not synchronized;
/// HybridSearchIndex serializes access.
class ILexicalIndex {
public:
  virtual ~ILexicalIndex() = default;

  /// Replaces any previous content for `path`.
  virtual void upsert(const std::string &path, const std::string &content) = 0;
  /// Raw scores of documents with a positive score, best first.
  [[nodiscard]] virtual std::vector<ScoredPath>
  score(const std::vector<std::string> &query_tokens) const = 0;
  [[nodiscard]] virtual std::size_t size() const = 0;
};

struct Bm25Parameters {
  double k1 = 1.2;
  double b = 0.75;
};

/// Okapi BM25 over in-memory documents. Term frequencies are recomputed from
/// the stored content at query time; document frequency, document lengths
/// and the average length are maintained on upsert.
class Bm25Index final : public ILexicalIndex {
public:
  explicit Bm25Index(Bm25Parameters params = {});

  void upsert(const std::string &path, const std::string &content) override;
  [[nodiscard]] std::vector<ScoredPath>
  score(const std::vector<std::string> &query_tokens) const override;
  [[nodiscard]] std::size_t size() const override { return contents_.size(); }

  [[nodiscard]] std::size_t document_frequency(const std::string &term) const;
  [[nodiscard]] double average_length() const { return average_length_; }

private:
  void adjust_document_frequency(const std::string &content, int delta);

  Bm25Parameters params_;
  std::unordered_map<std::string, std::string> contents_;
  std::unordered_map<std::string, std::size_t> document_frequency_;
  std::unordered_map<std::string, std::size_t> lengths_;
  std::size_t total_length_ = 0;
  double average_length_ = 0.0;
};

} // namespace agentfs::search
