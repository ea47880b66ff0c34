#include <gtest/gtest.h>

#include "llm_server_cpp/server_locator.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <string>

using namespace std;
using llm_server_cpp::LocatorConfig;
using llm_server_cpp::ModelDescriptor;
using llm_server_cpp::ServerLocator;
using llm_server_cpp::test::TempDir;
using llm_server_cpp::test::write_file;
using llm_server_cpp::test::write_script;

namespace fs = std::filesystem;


class ServerLocatorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    cfg_.home_dir = tmp_.str();
    cfg_.install_dir = (tmp_ / "install").string();
    cfg_.path_env = (tmp_ / "path_a").string() + ":" + (tmp_ / "path_b").string();
    cfg_.legacy_dirs = {(tmp_ / "legacy").string()};
  }

  string make_binary(const string & dir)
  {
    return write_script(tmp_ / dir / "llama-server", "exit 0");
  }

  TempDir tmp_;
  LocatorConfig cfg_;
};

TEST_F(ServerLocatorTest, ConfiguredPathWinsOverInstallDirAndPath)
{
  const string configured = write_script(tmp_ / "custom" / "my-llama", "exit 0");
  make_binary("install");
  make_binary("path_a");

  const ServerLocator locator(cfg_);
  const auto found = locator.find_binary(configured);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, configured);
}

TEST_F(ServerLocatorTest, PrecedenceFallsThroughInOrder)
{
  const string install = make_binary("install");
  const string path_b = make_binary("path_b");
  const string legacy = make_binary("legacy");

  const ServerLocator locator(cfg_);
  EXPECT_EQ(locator.find_binary().value_or(""), install);

  fs::remove(install);
  EXPECT_EQ(locator.find_binary().value_or(""), path_b);

  fs::remove(path_b);
  EXPECT_EQ(locator.find_binary().value_or(""), legacy);

  fs::remove(legacy);
  EXPECT_FALSE(locator.find_binary().has_value());
}

TEST_F(ServerLocatorTest, MissingConfiguredPathFallsBack)
{
  const string path_a = make_binary("path_a");
  const ServerLocator locator(cfg_);
  EXPECT_EQ(locator.find_binary((tmp_ / "nope" / "llama-server").string()).value_or(""), path_a);
}

TEST_F(ServerLocatorTest, NonExecutableFileIsSkipped)
{
  write_file(tmp_ / "install" / "llama-server", "not executable");
  const string path_a = make_binary("path_a");
  const ServerLocator locator(cfg_);
  EXPECT_EQ(locator.find_binary().value_or(""), path_a);
}

TEST_F(ServerLocatorTest, PathLookupCanBeDisabled)
{
  make_binary("path_a");
  cfg_.use_path_env = false;
  const ServerLocator locator(cfg_);
  EXPECT_FALSE(locator.find_binary().has_value());
}

TEST_F(ServerLocatorTest, CandidateOrderIsDeterministic)
{
  const ServerLocator locator(cfg_);
  const auto candidates = locator.binary_candidates("/opt/custom/llama-server");
  ASSERT_EQ(candidates.size(), 5u);
  EXPECT_EQ(candidates[0], "/opt/custom/llama-server");
  EXPECT_EQ(candidates[1], (tmp_ / "install" / "llama-server").string());
  EXPECT_EQ(candidates[2], (tmp_ / "path_a" / "llama-server").string());
  EXPECT_EQ(candidates[3], (tmp_ / "path_b" / "llama-server").string());
  EXPECT_EQ(candidates[4], (tmp_ / "legacy" / "llama-server").string());
}

TEST_F(ServerLocatorTest, FindModelsRecursesAndSortsCaseInsensitive)
{
  const fs::path models = tmp_ / "models";
  write_file(models / "zeta.gguf", "zz");
  write_file(models / "Alpha.GGUF", "a");
  write_file(models / "nested" / "deep" / "beta.gguf", "bbbb");
  write_file(models / "readme.txt", "ignored");

  const ServerLocator locator(cfg_);
  const auto found = locator.find_models(models.string());
  ASSERT_EQ(found.size(), 3u);
  EXPECT_EQ(found[0].name, "Alpha");
  EXPECT_EQ(found[1].name, "beta");
  EXPECT_EQ(found[1].path, (models / "nested" / "deep" / "beta.gguf").string());
  EXPECT_EQ(found[1].size_bytes, 4u);
  EXPECT_EQ(found[2].name, "zeta");
}

TEST_F(ServerLocatorTest, MissingModelDirectoryYieldsEmptyList)
{
  const ServerLocator locator(cfg_);
  EXPECT_TRUE(locator.find_models((tmp_ / "does_not_exist").string()).empty());
}

TEST_F(ServerLocatorTest, DefaultModelDirUnderHome)
{
  write_file(tmp_ / "models" / "m.gguf", "x");
  const ServerLocator locator(cfg_);
  EXPECT_EQ(locator.default_model_dir(), (tmp_ / "models").string());
  EXPECT_EQ(locator.find_models().size(), 1u);
}

TEST(ModelDescriptor, SizeInGigabytesRoundsToTwoDecimals)
{
  ModelDescriptor model;
  model.size_bytes = static_cast<uintmax_t>(4.368 * 1024 * 1024 * 1024);
  EXPECT_DOUBLE_EQ(model.size_gb(), 4.37);
}
