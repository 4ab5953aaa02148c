// src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>

namespace mahito {

OperationOutcome OperationOutcome::applied(OperationKind k, bool dryRun, std::string detail) {
  OperationOutcome o;
  o.kind = k;
  o.status = dryRun ? OperationStatus::WouldApply : OperationStatus::Applied;
  if (!detail.empty()) o.detail = std::move(detail);
  return o;
}

OperationOutcome OperationOutcome::skipped(OperationKind k, SkipReason r, std::string detail) {
  OperationOutcome o;
  o.kind = k;
  o.status = OperationStatus::Skipped;
  o.reason = r;
  if (!detail.empty()) o.detail = std::move(detail);
  return o;
}

OperationOutcome OperationOutcome::failed(OperationKind k, ErrorKind e, std::string detail) {
  OperationOutcome o;
  o.kind = k;
  o.status = OperationStatus::Failed;
  o.error = e;
  if (!detail.empty()) o.detail = std::move(detail);
  return o;
}

const OperationOutcome* FileResult::find(OperationKind k) const {
  for (auto& o : outcomes) if (o.kind == k) return &o;
  return nullptr;
}

bool FileResult::hasFailures() const {
  return std::any_of(outcomes.begin(), outcomes.end(),
                     [](const OperationOutcome& o){ return o.status == OperationStatus::Failed; });
}

OperationSet operationsFor(const CleanOptions& options) {
  switch (options.mode) {
    case CleanMode::Quick:
      return {OperationKind::Streams, OperationKind::Timestamps};
    case CleanMode::Standard:
      return {OperationKind::Streams, OperationKind::Timestamps, OperationKind::OfficeProperties};
    case CleanMode::Full:
      return {OperationKind::Streams, OperationKind::Timestamps,
              OperationKind::OfficeProperties, OperationKind::Owner};
    case CleanMode::Custom:
      return options.customOperations;
  }
  return {};
}

ErrorKind errorKindFromErrno(int err) {
  switch (err) {
    case 0:            return ErrorKind::None;
    case ENOENT:
    case ENOTDIR:
    case ELOOP:
    case ENAMETOOLONG: return ErrorKind::NotFound;
    case EACCES:
    case EPERM:
    case EROFS:        return ErrorKind::AccessDenied;
    case EBUSY:
    case ETXTBSY:
    case EAGAIN:       return ErrorKind::ResourceBusy;
#if defined(EOPNOTSUPP) && EOPNOTSUPP != ENOTSUP
    case EOPNOTSUPP:
#endif
    case ENOTSUP:
    case ENOSYS:       return ErrorKind::Unsupported;
    case ETIMEDOUT:    return ErrorKind::Timeout;
    case ENOSPC:
    case EDQUOT:
    case EIO:          return ErrorKind::PartialWriteFailure;
    // anything else (EINVAL, EFAULT, ...) means the call was refused for this
    // file; it is reported as a denial and the run moves on
    default:           return ErrorKind::AccessDenied;
  }
}

const char* toString(OperationKind k) {
  switch (k) { case OperationKind::Streams: return "streams";
               case OperationKind::Timestamps: return "timestamps";
               case OperationKind::OfficeProperties: return "office_properties";
               case OperationKind::Owner: return "owner"; }
  return "unknown";
}

const char* toString(CleanMode m) {
  switch (m) { case CleanMode::Quick: return "quick";
               case CleanMode::Standard: return "standard";
               case CleanMode::Full: return "full";
               case CleanMode::Custom: return "custom"; }
  return "standard";
}

const char* toString(OperationStatus s) {
  switch (s) { case OperationStatus::Applied: return "applied";
               case OperationStatus::WouldApply: return "would_apply";
               case OperationStatus::Skipped: return "skipped";
               case OperationStatus::Failed: return "failed"; }
  return "failed";
}

const char* toString(SkipReason r) {
  switch (r) { case SkipReason::None: return "none";
               case SkipReason::NotRequested: return "not_requested";
               case SkipReason::NoStreamsFound: return "no_streams_found";
               case SkipReason::NotAnOfficeDocument: return "not_an_office_document";
               case SkipReason::AlreadyClean: return "already_clean";
               case SkipReason::AlreadyNeutral: return "already_neutral";
               case SkipReason::Cancelled: return "cancelled"; }
  return "none";
}

const char* toString(ErrorKind e) {
  switch (e) { case ErrorKind::None: return "none";
               case ErrorKind::NotFound: return "not_found";
               case ErrorKind::AccessDenied: return "access_denied";
               case ErrorKind::ResourceBusy: return "resource_busy";
               case ErrorKind::PrivilegeRequired: return "privilege_required";
               case ErrorKind::Unsupported: return "unsupported";
               case ErrorKind::CorruptContainer: return "corrupt_container";
               case ErrorKind::PartialWriteFailure: return "partial_write_failure";
               case ErrorKind::Timeout: return "timeout"; }
  return "none";
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

bool parseCleanMode(const std::string& s, CleanMode& out) {
  auto v = lower(s);
  if (v=="quick")    { out = CleanMode::Quick; return true; }
  if (v=="standard") { out = CleanMode::Standard; return true; }
  if (v=="full")     { out = CleanMode::Full; return true; }
  if (v=="custom")   { out = CleanMode::Custom; return true; }
  return false;
}

bool parseOperationKind(const std::string& s, OperationKind& out) {
  auto v = lower(s);
  if (v=="streams")    { out = OperationKind::Streams; return true; }
  if (v=="timestamps") { out = OperationKind::Timestamps; return true; }
  if (v=="office_properties" || v=="properties") { out = OperationKind::OfficeProperties; return true; }
  if (v=="owner")      { out = OperationKind::Owner; return true; }
  return false;
}

} // namespace mahito
