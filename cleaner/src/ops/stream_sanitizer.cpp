// src/ops/stream_sanitizer.cpp
#include "ops/operations.hpp"
#include "readers/IStreamEnumerator.hpp"
#include "fs_posix.h"
#include "log.h"
#include <cerrno>
#include <sys/stat.h>

namespace mahito {

static std::string joinNames(const std::vector<std::string>& names) {
  std::string s;
  for (auto& n : names) { if (!s.empty()) s += ", "; s += n; }
  return s;
}

OperationOutcome sanitizeStreams(const std::filesystem::path& path, const OpContext& ctx) {
  const auto kind = OperationKind::Streams;
  const bool dry = ctx.options.dryRun;

  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    int e = errno;
    return OperationOutcome::failed(kind, errorKindFromErrno(e), errnoText(e));
  }

  std::string err;
  auto streams = ctx.streams ? ctx.streams(ctx.options.streamNamespaces)
                             : makeXattrEnumerator(ctx.options.streamNamespaces);
  if (!streams->open(path, err)) {
    return OperationOutcome::failed(kind, errorKindFromErrno(streams->lastError()), err);
  }

  std::vector<std::string> removed;
  std::vector<std::string> failures;
  ErrorKind firstFailure = ErrorKind::None;

  StreamInfo si;
  while (true) {
    if (ctx.expired()) {
      streams->close();
      std::string detail = "stream enumeration exceeded " +
        std::to_string(ctx.options.limits.timeoutFileMs) + "ms";
      if (!removed.empty()) detail += "; removed: " + joinNames(removed);
      return OperationOutcome::failed(kind, ErrorKind::Timeout, detail);
    }

    err.clear();
    if (!streams->nextStream(si, err)) {
      if (!err.empty()) {
        // listing broke off; keep what we know
        if (firstFailure == ErrorKind::None) firstFailure = errorKindFromErrno(streams->lastError());
        failures.push_back(err);
      }
      break;
    }

    if (dry) {
      removed.push_back(si.name);
      logEvent(ctx.runId, "stream", {{"path", path.string()}, {"name", si.name},
                                     {"size", std::to_string(si.size)}, {"action", "would_remove"}});
      continue;
    }

    if (streams->removeStream(si, err)) {
      removed.push_back(si.name);
      logEvent(ctx.runId, "stream", {{"path", path.string()}, {"name", si.name}, {"action", "removed"}});
    } else {
      // a busy stream does not stop the rest of the listing.
      // EPERM from removexattr means an immutable/append-only inode, i.e. locked.
      int sysErr = streams->lastError();
      ErrorKind k = sysErr == EPERM ? ErrorKind::ResourceBusy : errorKindFromErrno(sysErr);
      if (firstFailure == ErrorKind::None) firstFailure = k;
      failures.push_back(err);
      LOGD(path.string() + ": " + err);
    }
  }
  streams->close();

  if (!failures.empty()) {
    std::string detail = joinNames(failures);
    if (!removed.empty()) detail += "; removed: " + joinNames(removed);
    return OperationOutcome::failed(kind, firstFailure, detail);
  }
  if (removed.empty()) return OperationOutcome::skipped(kind, SkipReason::NoStreamsFound);

  return OperationOutcome::applied(kind, dry,
    (dry ? "would remove " : "removed ") + std::to_string(removed.size()) + ": " + joinNames(removed));
}

} // namespace mahito
