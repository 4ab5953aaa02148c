// src/readers/ZipReader.cpp
#include "readers/ZipReader.hpp"
#include "fs_posix.h"
#include <cerrno>
#include <vector>
#include <unistd.h>

namespace mahito {

static std::string zipErrorText(int ze) {
  zip_error_t zerr;
  zip_error_init_with_code(&zerr, ze);
  std::string s = zip_error_strerror(&zerr);
  zip_error_fini(&zerr);
  return s;
}

static bool statToEntry(zip_t* z, zip_int64_t idx, EntryInfo& out, std::string& err) {
  zip_stat_t st; zip_stat_init(&st);
  if (zip_stat_index(z, (zip_uint64_t)idx, 0, &st) != 0) {
    err = std::string("zip_stat_index failed: ") + zip_strerror(z);
    return false;
  }
  out.index = idx;
  out.name = st.name ? st.name : "";
  out.size = (st.valid & ZIP_STAT_SIZE) ? (uint64_t)st.size : 0;
  out.compSize = (st.valid & ZIP_STAT_COMP_SIZE) ? (uint64_t)st.comp_size : 0;
  out.compMethod = (st.valid & ZIP_STAT_COMP_METHOD) ? st.comp_method : ZIP_CM_STORE;
  out.mtime = (st.valid & ZIP_STAT_MTIME) ? st.mtime : 0;
  out.isDir = (!out.name.empty() && out.name.back()=='/');
  out.isEncrypted = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE;
  return true;
}

bool ZipReader::open(const std::filesystem::path& path, std::string& err) {
  close();
  zipError_ = ZIP_ER_OK; sysError_ = 0;

  int fd = openReadNoAtime(path);
  if (fd < 0) {
    sysError_ = errno;
    zipError_ = ZIP_ER_OPEN;
    err = "open failed: " + errnoText(sysError_);
    return false;
  }

  int ze = 0;
  z_ = zip_fdopen(fd, 0, &ze);
  if (!z_) {
    ::close(fd);                     // zip_fdopen leaves fd open on failure
    zipError_ = ze;
    err = "zip_fdopen failed: " + zipErrorText(ze);
    return false;
  }
  total_ = zip_get_num_entries(z_, 0);
  idx_ = 0;
  return true;
}

bool ZipReader::nextEntry(EntryInfo& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  if (idx_ >= total_) return false;   // done
  if (!statToEntry(z_, idx_, out, err)) return false;
  idx_++;
  return true;
}

bool ZipReader::locate(const std::string& name, EntryInfo& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  zip_int64_t idx = zip_name_locate(z_, name.c_str(), 0);
  if (idx < 0) return false;
  return statToEntry(z_, idx, out, err);
}

bool ZipReader::readEntry(const EntryInfo& e, std::string& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  out.clear();
  if (e.isDir) return true;

  zip_file_t* zf = zip_fopen_index(z_, (zip_uint64_t)e.index, 0);
  if (!zf) { err = e.name + ": zip_fopen_index failed: " + zip_strerror(z_); return false; }

  std::vector<char> buf(1<<16);
  zip_int64_t n;
  while ((n = zip_fread(zf, buf.data(), buf.size())) > 0) {
    out.append(buf.data(), (size_t)n);
  }
  if (n < 0) {
    err = e.name + ": zip_fread failed: " + zip_file_strerror(zf);
    zip_fclose(zf);
    return false;
  }
  // zip_fclose reports CRC mismatches
  int rc = zip_fclose(zf);
  if (rc != 0) { err = e.name + ": " + zipErrorText(rc); return false; }
  return true;
}

void ZipReader::close() {
  if (z_) { zip_discard(z_); z_ = nullptr; }
  idx_ = 0; total_ = 0;
}

} // namespace mahito
