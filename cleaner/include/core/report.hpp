#pragma once
#include "core/types.hpp"
#include <array>
#include <mutex>
#include <utility>
#include <vector>

namespace mahito {

struct KindCounts {
  size_t applied = 0;
  size_t wouldApply = 0;
  size_t skipped = 0;
  size_t failed = 0;
};

// Append-only during a run. Producers may add from several threads; each
// FileResult is added whole. finalize() orders results by submission index.
class CleanReport {
public:
  CleanReport() = default;
  CleanReport(CleanReport&& other) noexcept;
  CleanReport& operator=(CleanReport&& other) noexcept;

  void add(size_t seq, FileResult result);
  void merge(std::vector<std::pair<size_t, FileResult>>&& batch);
  void finalize();

  bool finalized() const { return finalized_; }
  const std::vector<FileResult>& results() const { return results_; }
  const KindCounts& counts(OperationKind k) const { return counts_[static_cast<int>(k)]; }
  size_t fileCount() const { return results_.size(); }
  bool hasFailures() const;

private:
  mutable std::mutex mu_;
  std::vector<std::pair<size_t, FileResult>> pending_;
  std::vector<FileResult> results_;
  std::array<KindCounts, kOperationKindCount> counts_{};
  bool finalized_ = false;
};

} // namespace mahito
