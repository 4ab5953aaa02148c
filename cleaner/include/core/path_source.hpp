#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mahito {

// Lazy, finite, forward-only sequence of candidate paths.
class PathSource {
public:
  virtual ~PathSource() = default;
  // false at the end (err empty) or when the sequence itself cannot be read (err set).
  virtual bool next(std::filesystem::path& out, std::string& err) = 0;
};

class ListPathSource : public PathSource {
public:
  explicit ListPathSource(std::vector<std::filesystem::path> paths) : paths_(std::move(paths)) {}
  bool next(std::filesystem::path& out, std::string& err) override;

private:
  std::vector<std::filesystem::path> paths_;
  size_t pos_ = 0;
};

// Regular files under 'root': direct children only, or the whole tree.
class DirectoryPathSource : public PathSource {
public:
  DirectoryPathSource(std::filesystem::path root, bool recursive);
  bool next(std::filesystem::path& out, std::string& err) override;

private:
  bool advance(std::string& err);

  std::filesystem::path root_;
  bool recursive_;
  bool started_ = false;
  std::filesystem::directory_iterator flat_;
  std::filesystem::recursive_directory_iterator deep_;
};

} // namespace mahito
