// src/core/report.cpp
#include "core/report.hpp"
#include <algorithm>

namespace mahito {

CleanReport::CleanReport(CleanReport&& other) noexcept {
  std::lock_guard<std::mutex> lk(other.mu_);
  pending_ = std::move(other.pending_);
  results_ = std::move(other.results_);
  counts_ = other.counts_;
  finalized_ = other.finalized_;
}

CleanReport& CleanReport::operator=(CleanReport&& other) noexcept {
  if (this == &other) return *this;
  std::scoped_lock lk(mu_, other.mu_);
  pending_ = std::move(other.pending_);
  results_ = std::move(other.results_);
  counts_ = other.counts_;
  finalized_ = other.finalized_;
  return *this;
}

void CleanReport::add(size_t seq, FileResult result) {
  std::lock_guard<std::mutex> lk(mu_);
  pending_.emplace_back(seq, std::move(result));
  finalized_ = false;
}

void CleanReport::merge(std::vector<std::pair<size_t, FileResult>>&& batch) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& item : batch) pending_.push_back(std::move(item));
  batch.clear();
  finalized_ = false;
}

void CleanReport::finalize() {
  std::lock_guard<std::mutex> lk(mu_);
  // stable: completion order never leaks into the report
  std::stable_sort(pending_.begin(), pending_.end(),
                   [](const auto& a, const auto& b){ return a.first < b.first; });
  for (auto& item : pending_) results_.push_back(std::move(item.second));
  pending_.clear();

  counts_ = {};
  for (auto& r : results_) {
    for (auto& o : r.outcomes) {
      auto& c = counts_[static_cast<int>(o.kind)];
      switch (o.status) {
        case OperationStatus::Applied:    c.applied++; break;
        case OperationStatus::WouldApply: c.wouldApply++; break;
        case OperationStatus::Skipped:    c.skipped++; break;
        case OperationStatus::Failed:     c.failed++; break;
      }
    }
  }
  finalized_ = true;
}

bool CleanReport::hasFailures() const {
  for (auto& r : results_) if (r.hasFailures()) return true;
  return false;
}

} // namespace mahito
