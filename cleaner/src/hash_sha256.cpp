// src/hash_sha256.cpp
#include "hash_sha256.h"
#include "fs_posix.h"
#include <vector>
#include <memory>
#include <cerrno>
#include <unistd.h>
#include <openssl/evp.h>

namespace mahito {

static std::string hex(const unsigned char* d, size_t n) {
  static const char* he = "0123456789abcdef";
  std::string s; s.resize(n*2);
  for (size_t i=0;i<n;++i){ s[2*i]=he[d[i]>>4]; s[2*i+1]=he[d[i]&0xF]; }
  return s;
}

using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string sha256_bytes(const std::string& data) {
  unsigned char md[EVP_MAX_MD_SIZE]; unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr) != 1) return "";
  return hex(md, len);
}

std::string sha256_file(const std::filesystem::path& path, size_t chunk) {
  int fd = openReadNoAtime(path);
  if (fd < 0) return "";

  MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) { ::close(fd); return ""; }

  std::vector<unsigned char> buf(chunk);
  bool ok = true;
  while (true) {
    ssize_t got = ::read(fd, buf.data(), buf.size());
    if (got < 0) { if (errno == EINTR) continue; ok = false; break; }
    if (got == 0) break;
    EVP_DigestUpdate(ctx.get(), buf.data(), (size_t)got);
  }
  ::close(fd);
  if (!ok) return "";

  unsigned char md[EVP_MAX_MD_SIZE]; unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) return "";
  return hex(md, len);
}

} // namespace mahito
