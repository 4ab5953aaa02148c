// src/ops/timestamp_normalizer.cpp
#include "ops/operations.hpp"
#include "fs_posix.h"
#include "log.h"
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace mahito {

int readFileTimes(const std::filesystem::path& path, FileTimes& out) {
  struct statx stx{};
  if (::statx(AT_FDCWD, path.c_str(), AT_SYMLINK_NOFOLLOW,
              STATX_ATIME | STATX_MTIME | STATX_CTIME | STATX_BTIME, &stx) != 0) {
    return errno;
  }
  out.access = {stx.stx_atime.tv_sec, stx.stx_atime.tv_nsec};
  out.modify = {stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec};
  out.change = {stx.stx_ctime.tv_sec, stx.stx_ctime.tv_nsec};
  out.hasBirth = (stx.stx_mask & STATX_BTIME) != 0;
  if (out.hasBirth) out.birth = {stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec};
  return 0;
}

std::string formatUtc(const FileTime& t) {
  std::time_t s = static_cast<std::time_t>(t.sec);
  std::tm tm{};
  gmtime_r(&s, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static int utimensatTimes(const std::filesystem::path& path, const FileTime& access, const FileTime& modify) {
  struct timespec ts[2];
  ts[0].tv_sec = static_cast<time_t>(access.sec); ts[0].tv_nsec = access.nsec;
  ts[1].tv_sec = static_cast<time_t>(modify.sec); ts[1].tv_nsec = modify.nsec;
  // access and modification change together in one call
  if (::utimensat(AT_FDCWD, path.c_str(), ts, AT_SYMLINK_NOFOLLOW) != 0) return errno;
  return 0;
}

OperationOutcome normalizeTimestamps(const std::filesystem::path& path, const OpContext& ctx) {
  const auto kind = OperationKind::Timestamps;
  const FileTime target{kNeutralEpochSec, 0};
  const TimeSetter setTimes = ctx.setTimes ? ctx.setTimes : TimeSetter(utimensatTimes);

  FileTimes before;
  if (int e = readFileTimes(path, before)) {
    return OperationOutcome::failed(kind, errorKindFromErrno(e), errnoText(e));
  }

  std::string detail = "access " + formatUtc(before.access) + " -> " + formatUtc(target) +
                       ", modify " + formatUtc(before.modify) + " -> " + formatUtc(target);

  // read-only or locked files are refused up front rather than half-changed
  if (::faccessat(AT_FDCWD, path.c_str(), W_OK, AT_EACCESS) != 0) {
    int e = errno;
    if (e == ENOENT) return OperationOutcome::failed(kind, ErrorKind::NotFound, errnoText(e));
    if (e == ETXTBSY) return OperationOutcome::failed(kind, ErrorKind::ResourceBusy, errnoText(e));
    return OperationOutcome::failed(kind, ErrorKind::AccessDenied, "file is read-only: " + errnoText(e));
  }

  // Linux exposes the birth time through statx but offers no call that sets it.
  if (before.hasBirth && before.birth != target) {
    if (!ctx.options.ignoreBirthTime) {
      return OperationOutcome::failed(kind, ErrorKind::Unsupported,
                                      "birth " + formatUtc(before.birth) +
                                      " cannot be set on this host; timestamps left unchanged");
    }
    detail += ", birth " + formatUtc(before.birth) + " left as is";
  }

  if (ctx.options.dryRun) return OperationOutcome::applied(kind, true, detail);

  for (int attempt = 0; attempt < 2; ++attempt) {
    if (int e = setTimes(path, target, target)) {
      return OperationOutcome::failed(kind, errorKindFromErrno(e), errnoText(e));
    }

    FileTimes after;
    if (int e = readFileTimes(path, after)) {
      return OperationOutcome::failed(kind, errorKindFromErrno(e), errnoText(e));
    }
    if (after.access == target && after.modify == target) {
      return OperationOutcome::applied(kind, false, detail);
    }
    LOGD(path.string() + ": timestamps did not settle, retrying");
  }

  // another writer keeps touching the file: put the old values back
  if (int e = setTimes(path, before.access, before.modify)) {
    LOGW(path.string() + ": timestamp rollback failed: " + errnoText(e));
    return OperationOutcome::failed(kind, ErrorKind::ResourceBusy,
                                    "timestamps changed concurrently; rollback failed: " + errnoText(e));
  }
  return OperationOutcome::failed(kind, ErrorKind::ResourceBusy,
                                  "timestamps changed concurrently; previous values restored");
}

} // namespace mahito
