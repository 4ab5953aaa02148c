#pragma once
#include "core/types.hpp"
#include "readers/IStreamEnumerator.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace mahito {

// Fixed neutral instant: 2000-01-01T00:00:00Z
constexpr int64_t kNeutralEpochSec = 946684800;

struct FileTime {
  int64_t  sec = 0;
  uint32_t nsec = 0;
  bool operator==(const FileTime& o) const { return sec == o.sec && nsec == o.nsec; }
  bool operator!=(const FileTime& o) const { return !(*this == o); }
};

struct FileTimes {
  FileTime access;
  FileTime modify;
  FileTime change;
  bool     hasBirth = false;
  FileTime birth;
};

// Stream backend for one file; the default is extended attributes.
using StreamEnumeratorFactory =
  std::function<std::unique_ptr<IStreamEnumerator>(const std::vector<std::string>& namespaces)>;

// Sets access and modification time together; returns errno (0 on success).
using TimeSetter =
  std::function<int(const std::filesystem::path& path, const FileTime& access, const FileTime& modify)>;

// Per-file state handed to every operation.
struct OpContext {
  const CleanOptions& options;
  std::string runId;
  std::chrono::steady_clock::time_point deadline;
  StreamEnumeratorFactory streams;   // empty: makeXattrEnumerator
  TimeSetter setTimes;               // empty: utimensat

  bool expired() const { return std::chrono::steady_clock::now() > deadline; }
};

OperationOutcome sanitizeStreams(const std::filesystem::path& path, const OpContext& ctx);
OperationOutcome normalizeTimestamps(const std::filesystem::path& path, const OpContext& ctx);
OperationOutcome scrubContainerProperties(const std::filesystem::path& path, const OpContext& ctx);
OperationOutcome clearOwnership(const std::filesystem::path& path, const OpContext& ctx);

// statx-based read; symlinks are not followed. Returns errno (0 on success).
int readFileTimes(const std::filesystem::path& path, FileTimes& out);

std::string formatUtc(const FileTime& t);

} // namespace mahito
