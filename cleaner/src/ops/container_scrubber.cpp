// src/ops/container_scrubber.cpp
#include "ops/operations.hpp"
#include "ops/doc_properties.hpp"
#include "readers/ZipReader.hpp"
#include "routing/router.hpp"
#include "temp_file.h"
#include "fs_posix.h"
#include "log.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/xattr.h>

namespace fs = std::filesystem;

namespace mahito {

// ====== Scrub plan for the two metadata parts ======
struct PartRewrite {
  const char* name = nullptr;
  PropertyPart part = PropertyPart::Core;
  EntryInfo entry;
  std::string scrubbed;
  bool changed = false;
};

static std::string describeChanges(const std::vector<PropertyChange>& changes) {
  std::string s;
  for (auto& c : changes) {
    if (!s.empty()) s += ", ";
    s += c.element + "=\"" + c.previous + "\"->\"\"";
  }
  return s;
}

// ====== Local helpers ======
static zip_source_t* bufferSource(zip_t* za, const std::string& data) {
  void* mem = std::malloc(data.empty() ? 1 : data.size());
  if (!mem) return nullptr;
  std::memcpy(mem, data.data(), data.size());
  zip_source_t* s = zip_source_buffer(za, mem, data.size(), 1);   // libzip frees mem
  if (!s) std::free(mem);
  return s;
}

// Errors raised by zip_close: source-side damage vs. failure to write the copy.
static ErrorKind classifyCloseError(int ze) {
  switch (ze) {
    case ZIP_ER_CRC:
    case ZIP_ER_READ:
    case ZIP_ER_INCONS:
    case ZIP_ER_ZLIB:
    case ZIP_ER_COMPNOTSUPP:
    case ZIP_ER_EOF:
      return ErrorKind::CorruptContainer;
    default:
      return ErrorKind::PartialWriteFailure;
  }
}

static const PartRewrite* rewriteFor(const std::vector<PartRewrite>& parts, const std::string& name) {
  for (auto& p : parts) if (p.changed && name == p.name) return &p;
  return nullptr;
}

// Copies every entry of 'src' into a new archive at 'dstPath' in the same order.
// Untouched entries are transferred as raw compressed bytes.
static bool writeScrubbedCopy(ZipReader& src, const fs::path& dstPath,
                              const std::vector<PartRewrite>& parts,
                              std::string& err, ErrorKind& kind) {
  int ze = 0;
  zip_t* dst = zip_open(dstPath.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &ze);
  if (!dst) {
    zip_error_t zerr; zip_error_init_with_code(&zerr, ze);
    err = std::string("cannot open temp archive: ") + zip_error_strerror(&zerr);
    zip_error_fini(&zerr);
    kind = ErrorKind::PartialWriteFailure;
    return false;
  }
  zip_t* in = src.native();

  auto fail = [&](ErrorKind k, const std::string& what) {
    err = what + ": " + zip_strerror(dst);
    kind = k;
    zip_discard(dst);
    return false;
  };

  int clen = 0;
  const char* comment = zip_get_archive_comment(in, &clen, ZIP_FL_ENC_RAW);
  if (comment && clen > 0 && zip_set_archive_comment(dst, comment, (zip_uint16_t)clen) != 0)
    return fail(ErrorKind::PartialWriteFailure, "archive comment");

  EntryInfo e;
  std::string nerr;
  while (src.nextEntry(e, nerr)) {
    zip_int64_t at = -1;

    if (e.isDir) {
      at = zip_dir_add(dst, e.name.c_str(), ZIP_FL_ENC_GUESS);
      if (at < 0) return fail(ErrorKind::PartialWriteFailure, e.name);
    } else {
      const PartRewrite* rw = rewriteFor(parts, e.name);
      zip_source_t* s = rw ? bufferSource(dst, rw->scrubbed)
                           : zip_source_zip(dst, in, (zip_uint64_t)e.index, ZIP_FL_COMPRESSED, 0, -1);
      if (!s) return fail(rw ? ErrorKind::PartialWriteFailure : ErrorKind::CorruptContainer, e.name);

      at = zip_file_add(dst, e.name.c_str(), s, ZIP_FL_ENC_GUESS);
      if (at < 0) {
        zip_source_free(s);
        return fail(ErrorKind::CorruptContainer, e.name);
      }
      // keep the original method so raw copies are not recompressed
      if (zip_set_file_compression(dst, (zip_uint64_t)at, e.compMethod, 0) != 0)
        return fail(ErrorKind::CorruptContainer, e.name + " compression");
    }

    if (zip_file_set_mtime(dst, (zip_uint64_t)at, e.mtime, 0) != 0)
      return fail(ErrorKind::PartialWriteFailure, e.name + " mtime");

    zip_uint8_t opsys = 0; zip_uint32_t attrs = 0;
    if (zip_file_get_external_attributes(in, (zip_uint64_t)e.index, 0, &opsys, &attrs) == 0 &&
        zip_file_set_external_attributes(dst, (zip_uint64_t)at, 0, opsys, attrs) != 0)
      return fail(ErrorKind::PartialWriteFailure, e.name + " attributes");

    zip_uint32_t flen = 0;
    const char* fcomment = zip_file_get_comment(in, (zip_uint64_t)e.index, &flen, ZIP_FL_ENC_RAW);
    if (fcomment && flen > 0 &&
        zip_file_set_comment(dst, (zip_uint64_t)at, fcomment, (zip_uint16_t)flen, 0) != 0)
      return fail(ErrorKind::PartialWriteFailure, e.name + " comment");
  }
  if (!nerr.empty()) {
    err = nerr;
    kind = ErrorKind::CorruptContainer;
    zip_discard(dst);
    return false;
  }

  if (zip_close(dst) != 0) {
    kind = classifyCloseError(zip_error_code_zip(zip_get_error(dst)));
    err = std::string("writing archive failed: ") + zip_strerror(dst);
    zip_discard(dst);
    return false;
  }
  return true;
}

static void copyXattrs(const fs::path& from, const fs::path& to) {
  ssize_t len = ::llistxattr(from.c_str(), nullptr, 0);
  if (len <= 0) return;
  std::vector<char> names((size_t)len);
  len = ::llistxattr(from.c_str(), names.data(), names.size());
  if (len <= 0) return;

  for (size_t pos = 0; pos < (size_t)len; pos += std::strlen(names.data() + pos) + 1) {
    const char* name = names.data() + pos;
    ssize_t vlen = ::lgetxattr(from.c_str(), name, nullptr, 0);
    std::vector<char> value(vlen > 0 ? (size_t)vlen : 1);
    if (vlen >= 0) vlen = ::lgetxattr(from.c_str(), name, value.data(), value.size());
    if (vlen < 0) {
      LOGD(from.string() + ": attribute " + name + " unreadable: " + errnoText(errno));
      continue;
    }
    if (::lsetxattr(to.c_str(), name, value.data(), (size_t)vlen, 0) != 0) {
      LOGD(to.string() + ": attribute " + name + " not carried over: " + errnoText(errno));
    }
  }
}

// The rewritten file keeps mode, owner, extended attributes and times of the original.
static bool carryFileAttributes(const struct stat& orig, const fs::path& origPath,
                                const fs::path& tmp, std::string& err) {
  copyXattrs(origPath, tmp);

  struct stat now{};
  if (::lstat(tmp.c_str(), &now) != 0) { err = "stat temp: " + errnoText(errno); return false; }
  if ((now.st_uid != orig.st_uid || now.st_gid != orig.st_gid) &&
      ::lchown(tmp.c_str(), orig.st_uid, orig.st_gid) != 0) {
    LOGW(origPath.string() + ": owner not preserved on rewrite: " + errnoText(errno));
  }

  if (::chmod(tmp.c_str(), orig.st_mode & 07777) != 0) {
    err = "chmod temp: " + errnoText(errno);
    return false;
  }

  struct timespec ts[2] = {orig.st_atim, orig.st_mtim};
  if (::utimensat(AT_FDCWD, tmp.c_str(), ts, AT_SYMLINK_NOFOLLOW) != 0) {
    err = "utimensat temp: " + errnoText(errno);
    return false;
  }
  return true;
}

// ====== Entry point ======
OperationOutcome scrubContainerProperties(const fs::path& path, const OpContext& ctx) {
  const auto kind = OperationKind::OfficeProperties;

  RoutingDecision rd = routeToHandler(path);
  if (rd.family == DocumentFamily::None) {
    return OperationOutcome::skipped(kind, SkipReason::NotAnOfficeDocument);
  }

  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    int e = errno;
    return OperationOutcome::failed(kind, errorKindFromErrno(e), errnoText(e));
  }
  if (!S_ISREG(st.st_mode)) {
    return OperationOutcome::skipped(kind, SkipReason::NotAnOfficeDocument, "not a regular file");
  }
  if (!hasZipMagic(path)) {
    return OperationOutcome::skipped(kind, SkipReason::NotAnOfficeDocument, "no zip signature");
  }

  std::string err;
  ZipReader src;
  if (!src.open(path, err)) {
    if (src.sysError() != 0)
      return OperationOutcome::failed(kind, errorKindFromErrno(src.sysError()), err);
    return OperationOutcome::failed(kind, ErrorKind::CorruptContainer, err);
  }

  std::vector<PartRewrite> parts(2);
  parts[0].name = kCorePropsPart; parts[0].part = PropertyPart::Core;
  parts[1].name = kAppPropsPart;  parts[1].part = PropertyPart::App;

  std::vector<PropertyChange> changes;
  for (auto& p : parts) {
    err.clear();
    if (!src.locate(p.name, p.entry, err)) {
      if (!err.empty()) return OperationOutcome::failed(kind, ErrorKind::CorruptContainer, err);
      return OperationOutcome::skipped(kind, SkipReason::NotAnOfficeDocument,
                                       std::string("missing ") + p.name);
    }
    std::string xml;
    if (!src.readEntry(p.entry, xml, err)) {
      return OperationOutcome::failed(kind, ErrorKind::CorruptContainer, err);
    }
    std::vector<PropertyChange> partChanges;
    if (!scrubPropertyXml(xml, p.part, p.scrubbed, partChanges, err)) {
      return OperationOutcome::failed(kind, ErrorKind::CorruptContainer, std::string(p.name) + ": " + err);
    }
    p.changed = !partChanges.empty();
    changes.insert(changes.end(), partChanges.begin(), partChanges.end());
  }

  if (changes.empty()) return OperationOutcome::skipped(kind, SkipReason::AlreadyClean);

  const std::string detail = describeChanges(changes);
  if (ctx.options.dryRun) return OperationOutcome::applied(kind, true, detail);

  // temp sibling + rename: the original stays intact until the very last step
  ScopedTempFile tmp(path);
  if (!tmp.create(err)) return OperationOutcome::failed(kind, ErrorKind::PartialWriteFailure, err);

  ErrorKind failKind = ErrorKind::None;
  if (!writeScrubbedCopy(src, tmp.path(), parts, err, failKind)) {
    LOGD(path.string() + ": rewrite aborted: " + err);
    return OperationOutcome::failed(kind, failKind, err);
  }
  src.close();

  if (!carryFileAttributes(st, path, tmp.path(), err) || !tmp.commit(err)) {
    return OperationOutcome::failed(kind, ErrorKind::PartialWriteFailure, err);
  }

  logEvent(ctx.runId, "office_properties", {{"path", path.string()},
                                            {"family", toString(rd.family)},
                                            {"changed", std::to_string(changes.size())}});
  return OperationOutcome::applied(kind, false, detail);
}

} // namespace mahito
