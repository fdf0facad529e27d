// tests/unit/project/test_link_config.cpp - Unit tests for scopelink.yaml handling
//

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "scopelink/project/link_config.hpp"

using namespace scopelink;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

TEST(ProjectLinkConfig, EmptyTextGivesDefaults)
{
  const auto result = parse_link_config("", "/project");
  ASSERT_TRUE(result.success) << result.error;

  const LinkConfig & config = result.config;
  EXPECT_EQ(
    config.link.global_packages, (std::vector<std::string>{"std.lang", "std.lib", "std.game"}));
  EXPECT_EQ(config.link.id_strategy, IdStrategy::Counter);
  EXPECT_FALSE(config.verbose);
  EXPECT_TRUE(config.check.unresolved_references);
  EXPECT_TRUE(config.inputs.empty());
  EXPECT_EQ(config.project_root, fs::path("/project"));
}

TEST(ProjectLinkConfig, ParsesEverySection)
{
  const auto result = parse_link_config(
    R"(
link:
  global_packages: [base, base.util]
  ids: random
  verbose: true
check:
  unresolved_references: false
inputs:
  - models/app.json
  - ../shared/./lib.json
  - /abs/model.json
)",
    "/project");
  ASSERT_TRUE(result.success) << result.error;

  const LinkConfig & config = result.config;
  EXPECT_EQ(config.link.global_packages, (std::vector<std::string>{"base", "base.util"}));
  EXPECT_EQ(config.link.id_strategy, IdStrategy::Random);
  EXPECT_TRUE(config.verbose);
  EXPECT_FALSE(config.check.unresolved_references);
  ASSERT_EQ(config.inputs.size(), 3U);
  EXPECT_EQ(config.inputs[0], fs::path("/project/models/app.json"));
  EXPECT_EQ(config.inputs[1], fs::path("/shared/lib.json"));
  EXPECT_EQ(config.inputs[2], fs::path("/abs/model.json"));
}

TEST(ProjectLinkConfig, EmptyGlobalPackageListDisablesInjection)
{
  const auto result = parse_link_config("link:\n  global_packages: []\n", "/p");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.link.global_packages.empty());
}

TEST(ProjectLinkConfig, RejectsInvalidIdStrategy)
{
  const auto result = parse_link_config("link:\n  ids: uuid\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("uuid"), std::string::npos);
}

TEST(ProjectLinkConfig, RejectsMalformedShapes)
{
  EXPECT_FALSE(parse_link_config("- just\n- a list\n", "/p").success);
  EXPECT_FALSE(parse_link_config("link:\n  global_packages: std\n", "/p").success);
  EXPECT_FALSE(parse_link_config("inputs: app.json\n", "/p").success);
  EXPECT_FALSE(parse_link_config("check:\n  unresolved_references: maybe\n", "/p").success);
}

TEST(ProjectLinkConfig, RejectsInvalidYaml)
{
  const auto result = parse_link_config("link: [unclosed\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(ProjectLinkConfig, LoadsFileRelativeToItsDirectory)
{
  const fs::path dir = make_temp_dir("scopelink_config");
  write_all(dir / k_link_config_file_name, "inputs:\n  - app.json\n");

  const auto result = load_link_config(dir / k_link_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, fs::absolute(dir));
  ASSERT_EQ(result.config.inputs.size(), 1U);
  EXPECT_EQ(result.config.inputs[0], (fs::absolute(dir) / "app.json").lexically_normal());

  fs::remove_all(dir);
}

TEST(ProjectLinkConfig, MissingFileFails)
{
  const auto result = load_link_config("/nonexistent/scopelink.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectLinkConfig, FindsConfigInParentDirectories)
{
  const fs::path dir = make_temp_dir("scopelink_find");
  const fs::path nested = dir / "a" / "b";
  fs::create_directories(nested);
  write_all(dir / k_link_config_file_name, "");
  write_all(nested / "model.json", "{}");

  const auto from_dir = find_link_config(nested);
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(fs::canonical(*from_dir), fs::canonical(dir / k_link_config_file_name));

  const auto from_file = find_link_config(nested / "model.json");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(dir / k_link_config_file_name));

  fs::remove_all(dir);
}
