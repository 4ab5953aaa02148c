#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <ctime>
#include <zip.h>

namespace mahito {

// Data for one entry in the archive (output of nextEntry / locate)
struct EntryInfo {
  zip_int64_t index = -1;
  std::string name;
  uint64_t    size = 0;
  uint64_t    compSize = 0;
  uint16_t    compMethod = ZIP_CM_STORE;
  std::time_t mtime = 0;
  bool        isDir = false;
  bool        isEncrypted = false;
};

// Read-only view of a zip container. The file is opened without moving its atime.
class ZipReader {
  zip_t* z_ = nullptr;
  zip_int64_t idx_ = 0;
  zip_int64_t total_ = 0;
  int zipError_ = ZIP_ER_OK;
  int sysError_ = 0;

public:
  ZipReader() = default;
  ~ZipReader() { close(); }
  ZipReader(const ZipReader&) = delete;
  ZipReader& operator=(const ZipReader&) = delete;

  bool open(const std::filesystem::path& path, std::string& err);

  // Info for the next entry in central-directory order; false when done or on error.
  bool nextEntry(EntryInfo& out, std::string& err);

  bool locate(const std::string& name, EntryInfo& out, std::string& err);

  // Decompressed content of an entry.
  bool readEntry(const EntryInfo& e, std::string& out, std::string& err);

  zip_int64_t entryCount() const { return total_; }
  zip_t* native() const { return z_; }

  // libzip error from the last failed open (ZIP_ER_*), and errno if the file itself failed.
  int zipError() const { return zipError_; }
  int sysError() const { return sysError_; }

  void close();
};

} // namespace mahito
