// src/core/path_source.cpp
#include "core/path_source.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace mahito {

bool ListPathSource::next(fs::path& out, std::string& err) {
  (void)err;
  if (pos_ >= paths_.size()) return false;
  out = paths_[pos_++];
  return true;
}

DirectoryPathSource::DirectoryPathSource(fs::path root, bool recursive)
  : root_(std::move(root)), recursive_(recursive) {}

// Moves 'it' to the next regular, non-symlink entry (starting with the current one).
template <typename It>
static bool seekRegular(It& it, fs::path& out, std::string& err) {
  std::error_code ec;
  for (; it != It(); it.increment(ec)) {
    if (ec) { err = "directory walk failed: " + ec.message(); return false; }
    const auto& entry = *it;
    std::error_code ec1, ec2;
    if (entry.is_symlink(ec1)) continue;
    if (entry.is_regular_file(ec2)) { out = entry.path(); return true; }
  }
  if (ec) err = "directory walk failed: " + ec.message();
  return false;
}

bool DirectoryPathSource::advance(std::string& err) {
  std::error_code ec;
  if (!started_) {
    started_ = true;
    if (recursive_) deep_ = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
    else            flat_ = fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
  } else {
    if (recursive_) { if (deep_ != fs::recursive_directory_iterator()) deep_.increment(ec); }
    else            { if (flat_ != fs::directory_iterator()) flat_.increment(ec); }
  }
  if (ec) {
    err = "cannot read directory " + root_.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool DirectoryPathSource::next(fs::path& out, std::string& err) {
  if (!advance(err)) return false;
  return recursive_ ? seekRegular(deep_, out, err) : seekRegular(flat_, out, err);
}

} // namespace mahito
