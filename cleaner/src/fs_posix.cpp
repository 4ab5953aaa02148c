// src/fs_posix.cpp
#include "fs_posix.h"
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <pwd.h>
#include <grp.h>
#include <sys/syscall.h>
#include <linux/capability.h>

namespace mahito {

int openReadNoAtime(const std::filesystem::path& p) {
  int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC | O_NOATIME);
  if (fd < 0 && errno == EPERM) {
    // not the owner: fall back to a plain open
    fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  }
  return fd;
}

bool hasChownCapability() {
  __user_cap_header_struct hdr{};
  __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3]{};
  hdr.version = _LINUX_CAPABILITY_VERSION_3;
  hdr.pid = 0;
  if (::syscall(SYS_capget, &hdr, data) != 0) return false;
  return (data[CAP_TO_INDEX(CAP_CHOWN)].effective & CAP_TO_MASK(CAP_CHOWN)) != 0;
}

bool resolveUser(const std::string& nameOrUid, uid_t& out, std::string& err) {
  if (nameOrUid.empty()) { err = "empty owner name"; return false; }

  bool numeric = true;
  for (char c : nameOrUid) if (c < '0' || c > '9') { numeric = false; break; }
  if (numeric) {
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(nameOrUid.c_str(), &end, 10);
    // (uid_t)-1 tells lchown to leave the owner alone, so it is not a usable uid
    const unsigned long long maxUid = static_cast<unsigned long long>(static_cast<uid_t>(-1)) - 1;
    if (errno == ERANGE || end == nullptr || *end != '\0' || v > maxUid) {
      err = "uid out of range: " + nameOrUid;
      return false;
    }
    out = static_cast<uid_t>(v);
    return true;
  }

  long sz = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buf(sz > 0 ? (size_t)sz : 16384);
  passwd pw{}; passwd* res = nullptr;
  int rc = ::getpwnam_r(nameOrUid.c_str(), &pw, buf.data(), buf.size(), &res);
  if (rc != 0) { err = "getpwnam_r failed: " + errnoText(rc); return false; }
  if (!res)    { err = "unknown user '" + nameOrUid + "'"; return false; }
  out = pw.pw_uid;
  return true;
}

std::string userName(uid_t uid) {
  long sz = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buf(sz > 0 ? (size_t)sz : 16384);
  passwd pw{}; passwd* res = nullptr;
  if (::getpwuid_r(uid, &pw, buf.data(), buf.size(), &res) == 0 && res && pw.pw_name)
    return pw.pw_name;
  return std::to_string(uid);
}

std::string groupName(gid_t gid) {
  long sz = ::sysconf(_SC_GETGR_R_SIZE_MAX);
  std::vector<char> buf(sz > 0 ? (size_t)sz : 16384);
  group gr{}; group* res = nullptr;
  if (::getgrgid_r(gid, &gr, buf.data(), buf.size(), &res) == 0 && res && gr.gr_name)
    return gr.gr_name;
  return std::to_string(gid);
}

std::string errnoText(int err) {
  char buf[256];
  // GNU strerror_r returns the message pointer
  const char* msg = ::strerror_r(err, buf, sizeof(buf));
  return msg ? std::string(msg) : std::to_string(err);
}

} // namespace mahito
