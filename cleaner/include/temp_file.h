// include/temp_file.h
#pragma once
#include <string>
#include <filesystem>

namespace mahito {

// Sibling temp file for an in-place rewrite of 'target'. Removed on every exit
// path unless commit() renamed it over the target.
class ScopedTempFile {
public:
  explicit ScopedTempFile(std::filesystem::path target);
  ~ScopedTempFile();
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  // Creates an empty file in the target's directory; sysError() holds errno on failure.
  bool create(std::string& err);

  // rename(2) over the target; atomic within one filesystem.
  bool commit(std::string& err);

  const std::filesystem::path& path() const { return path_; }
  int sysError() const { return sysErr_; }

private:
  std::filesystem::path target_;
  std::filesystem::path path_;
  bool created_ = false;
  bool committed_ = false;
  int sysErr_ = 0;
};

} // namespace mahito
