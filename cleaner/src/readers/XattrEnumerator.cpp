// src/readers/XattrEnumerator.cpp
#include "readers/IStreamEnumerator.hpp"
#include "fs_posix.h"
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/xattr.h>

namespace mahito {

class XattrEnumerator : public IStreamEnumerator {
  std::filesystem::path path_;
  std::vector<std::string> namespaces_;
  std::vector<char> names_;     // NUL-separated list from llistxattr
  size_t pos_ = 0;
  int errno_ = 0;
  bool open_ = false;

  bool wanted(const char* name) const {
    for (auto& ns : namespaces_)
      if (std::strncmp(name, ns.c_str(), ns.size()) == 0) return true;
    return false;
  }

public:
  explicit XattrEnumerator(std::vector<std::string> namespaces) : namespaces_(std::move(namespaces)) {}
  ~XattrEnumerator() override { close(); }

  bool open(const std::filesystem::path& path, std::string& err) override {
    path_ = path; names_.clear(); pos_ = 0; errno_ = 0; open_ = false;

    // the list can grow between the size query and the read
    for (int attempt = 0; attempt < 4; ++attempt) {
      ssize_t len = ::llistxattr(path_.c_str(), nullptr, 0);
      if (len < 0) { errno_ = errno; err = "llistxattr: " + errnoText(errno_); return false; }
      if (len == 0) { open_ = true; return true; }
      names_.resize((size_t)len);
      len = ::llistxattr(path_.c_str(), names_.data(), names_.size());
      if (len >= 0) { names_.resize((size_t)len); open_ = true; return true; }
      if (errno != ERANGE) { errno_ = errno; err = "llistxattr: " + errnoText(errno_); return false; }
    }
    errno_ = ERANGE;
    err = "stream list kept changing while reading";
    return false;
  }

  bool nextStream(StreamInfo& out, std::string& err) override {
    if (!open_) { err = "enumerator not open"; return false; }
    while (pos_ < names_.size()) {
      const char* name = names_.data() + pos_;
      pos_ += std::strlen(name) + 1;
      if (!*name || !wanted(name)) continue;

      out.name = name;
      out.size = 0;
      ssize_t vlen = ::lgetxattr(path_.c_str(), name, nullptr, 0);
      if (vlen >= 0) out.size = (uint64_t)vlen;
      else if (errno == ENODATA) continue;          // removed since the snapshot
      else if (errno == ETIMEDOUT) { errno_ = errno; err = "lgetxattr: " + errnoText(errno_); return false; }
      return true;
    }
    return false;
  }

  bool removeStream(const StreamInfo& s, std::string& err) override {
    if (::lremovexattr(path_.c_str(), s.name.c_str()) == 0) return true;
    errno_ = errno;
    if (errno_ == ENODATA) return true;             // already gone
    err = "lremovexattr(" + s.name + "): " + errnoText(errno_);
    return false;
  }

  int lastError() const override { return errno_; }

  void close() override { names_.clear(); pos_ = 0; open_ = false; }
};

std::unique_ptr<IStreamEnumerator> makeXattrEnumerator(std::vector<std::string> namespaces) {
  return std::make_unique<XattrEnumerator>(std::move(namespaces));
}

} // namespace mahito
