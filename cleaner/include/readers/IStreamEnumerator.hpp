#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <memory>
#include <cstdint>

namespace mahito {

// One named stream attached to a file entry (the primary content is never listed).
struct StreamInfo {
  std::string name;
  uint64_t    size = 0;
};

class IStreamEnumerator {
public:
  virtual ~IStreamEnumerator() = default;

  // Snapshot the stream list of 'path'. On failure lastError() holds errno.
  virtual bool open(const std::filesystem::path& path, std::string& err) = 0;

  // Forward-only; returns false when exhausted (err empty) or on error.
  // The sequence is not restartable: a second pass needs a fresh open().
  virtual bool nextStream(StreamInfo& out, std::string& err) = 0;

  // Delete one stream previously returned by nextStream.
  virtual bool removeStream(const StreamInfo& s, std::string& err) = 0;

  virtual int lastError() const = 0;

  virtual void close() = 0;
};

// Extended-attribute backend. Only attributes whose name starts with one of
// 'namespaces' are reported (e.g. "user.").
std::unique_ptr<IStreamEnumerator> makeXattrEnumerator(std::vector<std::string> namespaces);

} // namespace mahito
