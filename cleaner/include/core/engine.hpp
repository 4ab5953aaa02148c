#pragma once
#include "core/types.hpp"
#include "core/report.hpp"
#include "core/snapshot.hpp"
#include "core/path_source.hpp"
#include <atomic>
#include <filesystem>
#include <string>

namespace mahito {

// Set from a signal handler; the engine stops dispatching new files once set.
class CancellationToken {
public:
  void cancel() noexcept { flag_.store(true, std::memory_order_relaxed); }
  bool cancelled() const noexcept { return flag_.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> flag_{false};
};

class CleaningEngine {
public:
  explicit CleaningEngine(CleanOptions options);

  // Runs every requested operation on one file in the order
  // Streams, Timestamps, OfficeProperties, Owner. Never throws.
  FileResult clean(const std::filesystem::path& path) const;

  // Drains 'source' through the worker pool into 'report' (finalized on return).
  // Returns false only when the source itself fails; 'err' then says why.
  bool cleanAll(PathSource& source, CleanReport& report, std::string& err,
                const CancellationToken* cancel = nullptr) const;

  FileSnapshot inspect(const std::filesystem::path& path) const;

  const CleanOptions& options() const { return options_; }

private:
  CleanOptions options_;
};

FileResult clean(const std::filesystem::path& path, const CleanOptions& options);
bool cleanAll(PathSource& source, const CleanOptions& options, CleanReport& report,
              std::string& err, const CancellationToken* cancel = nullptr);
FileSnapshot inspect(const std::filesystem::path& path, const CleanOptions& options = {});

} // namespace mahito
