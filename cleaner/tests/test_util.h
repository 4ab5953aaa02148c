#pragma once
#include "ops/operations.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace mahito {
namespace testutil {

using ZipEntries = std::vector<std::pair<std::string, std::string>>;

// Fresh directory under the system temp dir, removed in TearDown.
class TempDirTest : public ::testing::Test {
protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path file(const std::string& name) const { return dir_ / name; }

  std::filesystem::path dir_;
};

void writeFile(const std::filesystem::path& p, const std::string& content);
std::string readFile(const std::filesystem::path& p);

// Deflated entries in the given order; "stored" names are written uncompressed.
void writeZip(const std::filesystem::path& p, const ZipEntries& entries,
              const std::vector<std::string>& stored = {});

// Decompressed content of every entry, in archive order.
ZipEntries readZip(const std::filesystem::path& p);

std::string coreXml(const std::string& creator, const std::string& lastModifiedBy = "Bob",
                    const std::string& title = "Quarterly plan");
std::string appXml(const std::string& company, const std::string& manager = "Carol");

// Minimal word-processing package with the two metadata parts.
ZipEntries officePackage(const std::string& creator, const std::string& company);

bool setStream(const std::filesystem::path& p, const std::string& name, const std::string& value);
bool hasStream(const std::filesystem::path& p, const std::string& name);
// Whether user.* extended attributes work in 'dir'.
bool userXattrsSupported(const std::filesystem::path& dir);

void setTimes(const std::filesystem::path& p, int64_t atimeSec, int64_t mtimeSec);

bool runningAsRoot();

OperationOutcome findOutcome(const FileResult& r, OperationKind k);

} // namespace testutil
} // namespace mahito
