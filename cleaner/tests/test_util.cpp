#include "test_util.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <zip.h>

namespace fs = std::filesystem;

namespace mahito {
namespace testutil {

void TempDirTest::SetUp() {
  std::string tmpl = (fs::temp_directory_path() / "mahito-test-XXXXXX").string();
  ASSERT_NE(::mkdtemp(tmpl.data()), nullptr) << "mkdtemp failed";
  dir_ = tmpl;
}

void TempDirTest::TearDown() {
  std::error_code ec;
  // read-only subdirectories from tests would block removal
  for (auto it = fs::recursive_directory_iterator(dir_, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_directory(ec)) fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
  }
  fs::remove_all(dir_, ec);
}

void writeFile(const fs::path& p, const std::string& content) {
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  if (!f) throw std::runtime_error("cannot write " + p.string());
  f << content;
}

std::string readFile(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

void writeZip(const fs::path& p, const ZipEntries& entries, const std::vector<std::string>& stored) {
  int ze = 0;
  zip_t* za = zip_open(p.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &ze);
  if (!za) throw std::runtime_error("zip_open failed for " + p.string());
  for (auto& e : entries) {
    // entries outlive zip_close, so the buffer need not be copied
    zip_source_t* src = zip_source_buffer(za, e.second.data(), e.second.size(), 0);
    if (!src) { zip_discard(za); throw std::runtime_error("zip_source_buffer failed"); }
    zip_int64_t idx = zip_file_add(za, e.first.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (idx < 0) { zip_source_free(src); zip_discard(za); throw std::runtime_error("zip_file_add failed"); }
    bool store = false;
    for (auto& s : stored) if (s == e.first) store = true;
    zip_set_file_compression(za, (zip_uint64_t)idx, store ? ZIP_CM_STORE : ZIP_CM_DEFLATE, 0);
  }
  if (zip_close(za) != 0) {
    std::string msg = zip_strerror(za);
    zip_discard(za);
    throw std::runtime_error("zip_close failed: " + msg);
  }
}

ZipEntries readZip(const fs::path& p) {
  ZipEntries out;
  int ze = 0;
  zip_t* za = zip_open(p.c_str(), ZIP_RDONLY, &ze);
  if (!za) throw std::runtime_error("zip_open failed for " + p.string());
  zip_int64_t n = zip_get_num_entries(za, 0);
  for (zip_int64_t i = 0; i < n; ++i) {
    zip_stat_t st;
    zip_stat_init(&st);
    zip_stat_index(za, (zip_uint64_t)i, 0, &st);
    std::string data(st.size, '\0');
    zip_file_t* zf = zip_fopen_index(za, (zip_uint64_t)i, 0);
    if (!zf) { zip_discard(za); throw std::runtime_error("zip_fopen_index failed"); }
    zip_int64_t got = data.empty() ? 0 : zip_fread(zf, data.data(), data.size());
    zip_fclose(zf);
    if (got < 0 || (zip_uint64_t)got != st.size) { zip_discard(za); throw std::runtime_error("short read"); }
    out.emplace_back(st.name, std::move(data));
  }
  zip_discard(za);
  return out;
}

std::string coreXml(const std::string& creator, const std::string& lastModifiedBy, const std::string& title) {
  return
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\""
    " xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:dcterms=\"http://purl.org/dc/terms/\""
    " xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
    "<dc:title>" + title + "</dc:title>"
    "<dc:creator>" + creator + "</dc:creator>"
    "<cp:lastModifiedBy>" + lastModifiedBy + "</cp:lastModifiedBy>"
    "<cp:revision>3</cp:revision>"
    "<dcterms:created xsi:type=\"dcterms:W3CDTF\">2021-05-01T09:00:00Z</dcterms:created>"
    "</cp:coreProperties>";
}

std::string appXml(const std::string& company, const std::string& manager) {
  return
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Properties xmlns=\"http://schemas.openxmlformats.org/officeDocument/2006/extended-properties\">"
    "<Application>Microsoft Office Word</Application>"
    "<Company>" + company + "</Company>"
    "<Manager>" + manager + "</Manager>"
    "<Pages>1</Pages>"
    "</Properties>";
}

ZipEntries officePackage(const std::string& creator, const std::string& company) {
  return {
    {"[Content_Types].xml",
     "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>"},
    {"_rels/.rels",
     "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\"/>"},
    {"word/document.xml",
     "<?xml version=\"1.0\" encoding=\"UTF-8\"?><w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
     "<w:body><w:p><w:r><w:t>Hello from the body text, repeated to compress. Hello again. Hello again.</w:t></w:r></w:p></w:body></w:document>"},
    {"docProps/core.xml", coreXml(creator)},
    {"docProps/app.xml", appXml(company)},
    {"word/media/image1.bin", std::string("\x89PNG\r\n\x1a\n\x00\x01\x02\x03", 12)},
  };
}

bool setStream(const fs::path& p, const std::string& name, const std::string& value) {
  return ::lsetxattr(p.c_str(), name.c_str(), value.data(), value.size(), 0) == 0;
}

bool hasStream(const fs::path& p, const std::string& name) {
  return ::lgetxattr(p.c_str(), name.c_str(), nullptr, 0) >= 0;
}

bool userXattrsSupported(const fs::path& dir) {
  fs::path marker = dir / ".xattr-check";
  writeFile(marker, "x");
  bool ok = setStream(marker, "user.mahito.check", "1");
  std::error_code ec;
  fs::remove(marker, ec);
  return ok;
}

void setTimes(const fs::path& p, int64_t atimeSec, int64_t mtimeSec) {
  struct timespec ts[2];
  ts[0].tv_sec = (time_t)atimeSec; ts[0].tv_nsec = 0;
  ts[1].tv_sec = (time_t)mtimeSec; ts[1].tv_nsec = 0;
  if (::utimensat(AT_FDCWD, p.c_str(), ts, AT_SYMLINK_NOFOLLOW) != 0)
    throw std::runtime_error("utimensat failed for " + p.string());
}

bool runningAsRoot() { return ::geteuid() == 0; }

OperationOutcome findOutcome(const FileResult& r, OperationKind k) {
  const OperationOutcome* o = r.find(k);
  if (!o) throw std::runtime_error(std::string("no outcome for ") + toString(k));
  return *o;
}

} // namespace testutil
} // namespace mahito
