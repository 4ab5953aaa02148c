// src/routing/router.cpp
#include "routing/router.hpp"
#include "fs_posix.h"
#include <array>
#include <algorithm>
#include <cctype>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mahito {

static std::string extLower(const fs::path& p) {
  std::string e = p.extension().string();
  if (!e.empty() && e[0] == '.') e.erase(0, 1);
  std::transform(e.begin(), e.end(), e.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return e;
}

RoutingDecision routeToHandler(const fs::path& path) {
  RoutingDecision rd{};
  auto e = extLower(path);

  if (e == "docx" || e == "docm" || e == "dotx" || e == "dotm") {
    rd.family = DocumentFamily::WordProcessing;
  } else if (e == "xlsx" || e == "xlsm" || e == "xltx" || e == "xltm") {
    rd.family = DocumentFamily::Spreadsheet;
  } else if (e == "pptx" || e == "pptm" || e == "potx" || e == "potm") {
    rd.family = DocumentFamily::Presentation;
  } else {
    return rd;   // unknown
  }
  rd.reason = "ext";
  return rd;
}

bool hasZipMagic(const fs::path& path) {
  std::array<unsigned char, 4> buf{0,0,0,0};
  int fd = openReadNoAtime(path);
  if (fd < 0) return false;
  ssize_t got = ::read(fd, buf.data(), buf.size());
  ::close(fd);
  return got == 4 && buf[0] == 0x50 && buf[1] == 0x4B && buf[2] == 0x03 && buf[3] == 0x04;
}

const char* toString(DocumentFamily f) {
  switch (f) { case DocumentFamily::WordProcessing: return "word_processing";
               case DocumentFamily::Spreadsheet: return "spreadsheet";
               case DocumentFamily::Presentation: return "presentation";
               default: return "none"; }
}

} // namespace mahito
