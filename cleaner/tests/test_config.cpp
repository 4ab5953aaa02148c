#include "core/config.hpp"
#include "env_config.h"
#include "test_util.h"
#include <cstdlib>

using namespace mahito;
using namespace mahito::testutil;

class ConfigTest : public TempDirTest {
protected:
  void TearDown() override {
    ::unsetenv("MAHITO_MODE");
    ::unsetenv("MAHITO_WORKERS");
    ::unsetenv("MAHITO_NEUTRAL_OWNER");
    TempDirTest::TearDown();
  }
};

TEST_F(ConfigTest, LoadsAllKeys) {
  writeFile(file("mahito.yaml"),
    "engine:\n"
    "  mode: custom\n"
    "  custom_operations: [streams, office_properties]\n"
    "  workers: 3\n"
    "  neutral_owner: nobody\n"
    "  ignore_birth_time: true\n"
    "  stream_namespaces: [\"user.\", \"trusted.\"]\n"
    "limits:\n"
    "  timeouts:\n"
    "    per_file_ms: 1234\n");

  AppConfig cfg;
  std::string err;
  ASSERT_TRUE(loadConfigYaml(file("mahito.yaml").string(), cfg, err)) << err;
  EXPECT_EQ(cfg.options.mode, CleanMode::Custom);
  EXPECT_TRUE(cfg.options.customOperations ==
              (OperationSet{OperationKind::Streams, OperationKind::OfficeProperties}));
  EXPECT_EQ(cfg.options.workers, 3u);
  EXPECT_EQ(cfg.options.neutralOwner, "nobody");
  EXPECT_TRUE(cfg.options.ignoreBirthTime);
  ASSERT_EQ(cfg.options.streamNamespaces.size(), 2u);
  EXPECT_EQ(cfg.options.streamNamespaces[1], "trusted.");
  EXPECT_EQ(cfg.options.limits.timeoutFileMs, 1234u);
}

TEST_F(ConfigTest, AbsentKeysKeepDefaults) {
  writeFile(file("mahito.yaml"), "engine:\n  workers: 2\n");
  AppConfig cfg;
  std::string err;
  ASSERT_TRUE(loadConfigYaml(file("mahito.yaml").string(), cfg, err)) << err;
  EXPECT_EQ(cfg.options.mode, CleanMode::Standard);
  EXPECT_EQ(cfg.options.neutralOwner, "root");
  EXPECT_FALSE(cfg.options.ignoreBirthTime);
  ASSERT_EQ(cfg.options.streamNamespaces.size(), 1u);
  EXPECT_EQ(cfg.options.streamNamespaces[0], "user.");
  EXPECT_EQ(cfg.options.limits.timeoutFileMs, 5000u);
}

TEST_F(ConfigTest, UnknownModeIsAnError) {
  writeFile(file("mahito.yaml"), "engine:\n  mode: paranoid\n");
  AppConfig cfg;
  std::string err;
  EXPECT_FALSE(loadConfigYaml(file("mahito.yaml").string(), cfg, err));
  EXPECT_NE(err.find("paranoid"), std::string::npos);
}

TEST_F(ConfigTest, UnknownOperationIsAnError) {
  writeFile(file("mahito.yaml"), "engine:\n  custom_operations: [streams, exif]\n");
  AppConfig cfg;
  std::string err;
  EXPECT_FALSE(loadConfigYaml(file("mahito.yaml").string(), cfg, err));
  EXPECT_NE(err.find("exif"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileIsAnError) {
  AppConfig cfg;
  std::string err;
  EXPECT_FALSE(loadConfigYaml(file("absent.yaml").string(), cfg, err));
  EXPECT_FALSE(err.empty());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  ::setenv("MAHITO_MODE", "quick", 1);
  ::setenv("MAHITO_WORKERS", "7", 1);
  ::setenv("MAHITO_NEUTRAL_OWNER", "65534", 1);
  CleanOptions o;
  std::string err;
  ASSERT_TRUE(applyEnvOverrides(o, err)) << err;
  EXPECT_EQ(o.mode, CleanMode::Quick);
  EXPECT_EQ(o.workers, 7u);
  EXPECT_EQ(o.neutralOwner, "65534");
}

TEST_F(ConfigTest, BadEnvironmentValues) {
  CleanOptions o;
  std::string err;
  ::setenv("MAHITO_WORKERS", "four", 1);
  EXPECT_FALSE(applyEnvOverrides(o, err));
  ::setenv("MAHITO_WORKERS", "4x", 1);
  EXPECT_FALSE(applyEnvOverrides(o, err));
  EXPECT_NE(err.find("4x"), std::string::npos);
  EXPECT_EQ(o.workers, 0u);

  ::unsetenv("MAHITO_WORKERS");
  ::setenv("MAHITO_MODE", "turbo", 1);
  err.clear();
  EXPECT_FALSE(applyEnvOverrides(o, err));
  EXPECT_NE(err.find("turbo"), std::string::npos);
}

TEST(WorkerCount, DigitsOnly) {
  unsigned n = 9;
  EXPECT_TRUE(parseWorkerCount("4", n));
  EXPECT_EQ(n, 4u);
  EXPECT_TRUE(parseWorkerCount("0", n));
  EXPECT_EQ(n, 0u);

  n = 9;
  EXPECT_FALSE(parseWorkerCount("4x", n));
  EXPECT_FALSE(parseWorkerCount("-1", n));
  EXPECT_FALSE(parseWorkerCount(" 4", n));
  EXPECT_FALSE(parseWorkerCount("", n));
  EXPECT_FALSE(parseWorkerCount("99999999999999999999", n));
  EXPECT_EQ(n, 9u);
}
