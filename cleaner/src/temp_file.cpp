// src/temp_file.cpp
#include "temp_file.h"
#include "fs_posix.h"
#include "log.h"
#include <cerrno>
#include <cstdio>
#include <vector>
#include <unistd.h>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace mahito {

ScopedTempFile::ScopedTempFile(fs::path target) : target_(std::move(target)) {}

ScopedTempFile::~ScopedTempFile() {
  if (!created_ || committed_) return;
  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    LOGW("could not remove temp file " + path_.string() + ": " + errnoText(errno));
  }
}

bool ScopedTempFile::create(std::string& err) {
  fs::path dir = target_.parent_path();
  if (dir.empty()) dir = ".";
  std::string tmpl = (dir / ("." + target_.filename().string() + ".mahito-XXXXXX")).string();

  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  int fd = ::mkstemp(buf.data());
  if (fd < 0) {
    sysErr_ = errno;
    err = "cannot create temp file in " + dir.string() + ": " + errnoText(sysErr_);
    return false;
  }
  ::close(fd);
  path_ = buf.data();
  created_ = true;
  return true;
}

bool ScopedTempFile::commit(std::string& err) {
  if (!created_) { err = "temp file was never created"; return false; }
  if (::rename(path_.c_str(), target_.c_str()) != 0) {
    sysErr_ = errno;
    err = "rename over " + target_.string() + " failed: " + errnoText(sysErr_);
    return false;
  }
  committed_ = true;
  return true;
}

} // namespace mahito
