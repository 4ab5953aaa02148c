// include/hash_sha256.h
#pragma once
#include <string>
#include <filesystem>

namespace mahito {

std::string sha256_bytes(const std::string& data);
// Hex digest of the primary content; "" if the file cannot be read.
std::string sha256_file(const std::filesystem::path& path, size_t chunk = 1<<20); // 1MB chunk

} // namespace mahito
