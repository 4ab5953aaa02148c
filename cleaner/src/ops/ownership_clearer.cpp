// src/ops/ownership_clearer.cpp
#include "ops/operations.hpp"
#include "fs_posix.h"
#include "log.h"
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>

namespace mahito {

OperationOutcome clearOwnership(const std::filesystem::path& path, const OpContext& ctx) {
  const auto kind = OperationKind::Owner;

  if (!ctx.options.elevateOwnership) {
    return OperationOutcome::skipped(kind, SkipReason::NotRequested, "ownership change needs elevation");
  }

  // current owner first, so dry-run and live report the same thing
  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    int e = errno;
    return OperationOutcome::failed(kind, errorKindFromErrno(e), errnoText(e));
  }
  const std::string current = userName(st.st_uid);

  // capability check precedes any attempt
  if (!hasChownCapability()) {
    return OperationOutcome::failed(kind, ErrorKind::PrivilegeRequired,
                                    "CAP_CHOWN not held; owner stays " + current);
  }

  uid_t neutral = 0;
  std::string err;
  if (!resolveUser(ctx.options.neutralOwner, neutral, err)) {
    return OperationOutcome::failed(kind, ErrorKind::NotFound, "neutral owner: " + err);
  }
  const std::string target = userName(neutral);

  if (st.st_uid == neutral) {
    return OperationOutcome::skipped(kind, SkipReason::AlreadyNeutral, "owner " + current);
  }

  const std::string detail = "owner " + current + " -> " + target;
  if (ctx.options.dryRun) return OperationOutcome::applied(kind, true, detail);

  // group (-1) and ACL entries are left alone
  if (::lchown(path.c_str(), neutral, static_cast<gid_t>(-1)) != 0) {
    int e = errno;
    ErrorKind k = (e == EPERM) ? ErrorKind::PrivilegeRequired : errorKindFromErrno(e);
    return OperationOutcome::failed(kind, k, errnoText(e));
  }
  logEvent(ctx.runId, "owner", {{"path", path.string()}, {"from", current}, {"to", target}});
  return OperationOutcome::applied(kind, false, detail);
}

} // namespace mahito
