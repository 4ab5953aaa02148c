// src/core/engine.cpp
#include "core/engine.hpp"
#include "ops/operations.hpp"
#include "ops/doc_properties.hpp"
#include "readers/ZipReader.hpp"
#include "hash_sha256.h"
#include "fs_posix.h"
#include "worker_pool.h"
#include "log.h"

#include <atomic>
#include <cerrno>
#include <new>
#include <chrono>
#include <system_error>
#include <thread>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace mahito {

static constexpr OperationKind kOrder[] = {
  OperationKind::Streams, OperationKind::Timestamps,
  OperationKind::OfficeProperties, OperationKind::Owner
};

// ====== Local helpers ======
static std::string newRunId(const fs::path& path) {
  static std::atomic<uint64_t> seq{0};
  auto now = std::chrono::system_clock::now().time_since_epoch().count();
  std::string seed = path.string() + "|" + std::to_string(now) + "|" + std::to_string(seq++);
  return sha256_bytes(seed).substr(0, 12);
}

static unsigned effectiveWorkers(unsigned configured) {
  if (configured) return configured;
  unsigned hw = std::thread::hardware_concurrency();
  return hw ? hw : 1;
}

// Requested and applicable for this path (Owner only counts when elevation was asked for).
static bool applies(OperationKind k, const fs::path& path, const CleanOptions& options) {
  if (k == OperationKind::Owner) return options.elevateOwnership;
  if (k == OperationKind::OfficeProperties) return routeToHandler(path).family != DocumentFamily::None;
  return true;
}

// Requested operations of a file that was queued but never started.
static FileResult cancelledResult(const fs::path& path, const CleanOptions& options) {
  FileResult result;
  result.path = path;
  const OperationSet requested = operationsFor(options);
  for (auto k : kOrder) {
    if (requested.contains(k)) result.outcomes.push_back(OperationOutcome::skipped(k, SkipReason::Cancelled));
  }
  return result;
}

static OperationOutcome runOne(OperationKind k, const fs::path& path, const OpContext& ctx) {
  try {
    switch (k) {
      case OperationKind::Streams:          return sanitizeStreams(path, ctx);
      case OperationKind::Timestamps:       return normalizeTimestamps(path, ctx);
      case OperationKind::OfficeProperties: return scrubContainerProperties(path, ctx);
      case OperationKind::Owner:            return clearOwnership(path, ctx);
    }
  } catch (const std::system_error& ex) {
    // filesystem_error derives from system_error; its code carries the errno
    LOGW(path.string() + ": " + toString(k) + ": " + ex.what());
    return OperationOutcome::failed(k, errorKindFromErrno(ex.code().value()), ex.what());
  } catch (const std::bad_alloc&) {
    LOGE(path.string() + ": " + toString(k) + ": out of memory");
    return OperationOutcome::failed(k, ErrorKind::PartialWriteFailure, "out of memory");
  } catch (const std::exception& ex) {
    LOGE(path.string() + ": " + toString(k) + ": " + ex.what());
    return OperationOutcome::failed(k, ErrorKind::AccessDenied, ex.what());
  }
  return OperationOutcome::failed(k, ErrorKind::Unsupported, "unknown operation");
}

// ====== CleaningEngine ======
CleaningEngine::CleaningEngine(CleanOptions options) : options_(std::move(options)) {}

FileResult CleaningEngine::clean(const fs::path& path) const {
  FileResult result;
  result.path = path;

  const OperationSet requested = operationsFor(options_);
  OpContext ctx{options_, newRunId(path),
                std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.limits.timeoutFileMs)};

  struct stat st{};
  const int statErr = (::lstat(path.c_str(), &st) != 0) ? errno : 0;
  if (statErr == ENOENT || statErr == ENOTDIR) {
    // vanished before processing: every applicable operation fails the same way
    const std::string detail = errnoText(statErr);
    for (auto k : kOrder) {
      if (!requested.contains(k)) continue;
      if (k == OperationKind::Owner && !options_.elevateOwnership) {
        result.outcomes.push_back(OperationOutcome::skipped(k, SkipReason::NotRequested));
      } else if (applies(k, path, options_)) {
        result.outcomes.push_back(OperationOutcome::failed(k, ErrorKind::NotFound, detail));
      } else {
        result.outcomes.push_back(OperationOutcome::skipped(k, SkipReason::NotAnOfficeDocument));
      }
    }
    LOGW(path.string() + ": not found");
    return result;
  }

  for (auto k : kOrder) {
    if (!requested.contains(k)) continue;
    OperationOutcome o = runOne(k, path, ctx);
    logEvent(ctx.runId, "outcome", {{"path", path.string()}, {"op", toString(k)},
                                    {"status", toString(o.status)},
                                    {"reason", toString(o.reason)},
                                    {"error", toString(o.error)}});
    result.outcomes.push_back(std::move(o));
  }
  return result;
}

bool CleaningEngine::cleanAll(PathSource& source, CleanReport& report, std::string& err,
                              const CancellationToken* cancel) const {
  using Buffer = std::vector<std::pair<size_t, FileResult>>;

  const unsigned workers = effectiveWorkers(options_.workers);
  std::vector<Buffer> buffers(workers);   // one per worker, no locking on the hot path

  WorkerPool pool(workers, workers * 2);
  pool.start();

  bool ok = true;
  size_t seq = 0;
  while (true) {
    if (cancel && cancel->cancelled()) {
      LOGI("cancelled; " + std::to_string(seq) + " file(s) dispatched");
      break;
    }
    fs::path next;
    std::string srcErr;
    if (!source.next(next, srcErr)) {
      if (!srcErr.empty()) {
        LOGE(srcErr);
        err = srcErr;
        ok = false;
      }
      break;
    }
    const size_t index = seq++;
    pool.enqueue([this, &buffers, cancel, index, next](unsigned workerId) {
      // queued but not yet started when the interrupt came: reported, not touched
      if (cancel && cancel->cancelled()) {
        buffers[workerId].emplace_back(index, cancelledResult(next, options_));
        return;
      }
      buffers[workerId].emplace_back(index, clean(next));
    });
  }
  pool.finish();

  for (auto& b : buffers) report.merge(std::move(b));
  report.finalize();

  if (auto ex = pool.firstError()) std::rethrow_exception(ex);
  return ok;
}

FileSnapshot CleaningEngine::inspect(const fs::path& path) const {
  FileSnapshot snap;
  snap.path = path;

  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    snap.warnings.push_back(errnoText(errno));
    return snap;
  }
  snap.exists = true;
  snap.isRegular = S_ISREG(st.st_mode);
  snap.size = static_cast<uint64_t>(st.st_size);
  snap.uid = st.st_uid;
  snap.gid = st.st_gid;
  snap.owner = userName(st.st_uid);
  snap.group = groupName(st.st_gid);

  if (snap.isRegular) {
    snap.sha256 = sha256_file(path);
    if (snap.sha256.empty()) snap.warnings.push_back("content not readable");
  }

  if (int e = readFileTimes(path, snap.times)) {
    snap.warnings.push_back("timestamps: " + errnoText(e));
  }

  std::string err;
  auto streams = makeXattrEnumerator(options_.streamNamespaces);
  if (streams->open(path, err)) {
    StreamInfo si;
    while (streams->nextStream(si, err)) snap.streams.push_back(si);
    if (!err.empty()) snap.warnings.push_back("streams: " + err);
    streams->close();
  } else if (errorKindFromErrno(streams->lastError()) == ErrorKind::Unsupported) {
    snap.streamsSupported = false;
  } else {
    snap.warnings.push_back("streams: " + err);
  }

  snap.family = routeToHandler(path).family;
  if (snap.family == DocumentFamily::None || !snap.isRegular || !hasZipMagic(path)) return snap;

  ZipReader zip;
  err.clear();
  if (!zip.open(path, err)) {
    snap.warnings.push_back("container: " + err);
    return snap;
  }
  const std::pair<const char*, PropertyPart> parts[] = {
    {kCorePropsPart, PropertyPart::Core}, {kAppPropsPart, PropertyPart::App}
  };
  for (auto& p : parts) {
    EntryInfo e;
    std::string xml;
    err.clear();
    if (!zip.locate(p.first, e, err)) {
      snap.warnings.push_back(err.empty() ? std::string("missing ") + p.first : err);
      continue;
    }
    if (!zip.readEntry(e, xml, err) || !readPropertyValues(xml, p.second, snap.documentProperties, err)) {
      snap.warnings.push_back(std::string(p.first) + ": " + err);
    }
  }
  return snap;
}

// ====== Free entry points ======
FileResult clean(const fs::path& path, const CleanOptions& options) {
  return CleaningEngine(options).clean(path);
}

bool cleanAll(PathSource& source, const CleanOptions& options, CleanReport& report,
              std::string& err, const CancellationToken* cancel) {
  return CleaningEngine(options).cleanAll(source, report, err, cancel);
}

FileSnapshot inspect(const fs::path& path, const CleanOptions& options) {
  return CleaningEngine(options).inspect(path);
}

} // namespace mahito
