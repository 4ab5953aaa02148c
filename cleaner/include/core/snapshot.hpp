#pragma once
#include "ops/operations.hpp"
#include "readers/IStreamEnumerator.hpp"
#include "routing/router.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace mahito {

// Read-only view of one file's metadata surfaces (the "info" command).
struct FileSnapshot {
  std::filesystem::path path;
  bool exists = false;
  bool isRegular = false;
  uint64_t size = 0;
  std::string sha256;                 // primary content; empty for non-regular files

  bool streamsSupported = true;
  std::vector<StreamInfo> streams;

  FileTimes times;

  uid_t uid = 0;
  std::string owner;
  gid_t gid = 0;
  std::string group;

  DocumentFamily family = DocumentFamily::None;
  std::vector<std::pair<std::string, std::string>> documentProperties;  // "dc:creator" -> "Alice"

  std::vector<std::string> warnings;
};

} // namespace mahito
