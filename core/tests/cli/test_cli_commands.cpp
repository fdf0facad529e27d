// test_cli_commands.cpp - CLI integration tests for the scopelink commands

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/// Run the CLI with `args` (already quoted) from `cwd`; stdout goes to `out`.
int run_cli(const std::string & args, const fs::path & cwd, const fs::path & out)
{
#ifndef SCOPELINK_CLI_PATH
  (void)args;
  (void)cwd;
  (void)out;
  return 0;
#else
  const std::string cli = SCOPELINK_CLI_PATH;
  const std::string cmd = "cd " + shell_quote(cwd.string()) + " && " + shell_quote(cli) + " " +
                          args + " > " + shell_quote(out.string()) + " 2>/dev/null";

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    return 127;
  }
  if (WIFEXITED(rc)) {
    return WEXITSTATUS(rc);
  }
  return 128;
#else
  // Best-effort fallback.
  return rc;
#endif
#endif
}

constexpr const char * k_model = R"({
  "kind": "Package", "name": "zoo", "fileName": "zoo.src",
  "members": [
    {"kind": "Class", "name": "Animal", "members": [{"kind": "Field", "name": "legs"}]},
    {"kind": "Class", "name": "Dog", "supertypes": ["Animal"]}
  ]
})";

}  // namespace

TEST(CliCommandsTest, NoArgumentsIsAUsageError)
{
#ifndef SCOPELINK_CLI_PATH
  GTEST_SKIP() << "SCOPELINK_CLI_PATH is not configured (scopelink target missing?)";
#endif
  const fs::path dir = make_temp_dir("scopelink_cli_usage");
  EXPECT_EQ(run_cli("", dir, dir / "out.txt"), 2);
  EXPECT_EQ(run_cli("--help", dir, dir / "out.txt"), 0);
  EXPECT_EQ(run_cli("frobnicate", dir, dir / "out.txt"), 2);
}

TEST(CliCommandsTest, CheckPassesOnResolvedModel)
{
#ifndef SCOPELINK_CLI_PATH
  GTEST_SKIP() << "SCOPELINK_CLI_PATH is not configured (scopelink target missing?)";
#endif
  const fs::path dir = make_temp_dir("scopelink_cli_check_ok");
  write_all(dir / "zoo.json", k_model);

  EXPECT_EQ(run_cli("check --no-stdlib zoo.json", dir, dir / "out.txt"), 0);
  EXPECT_NE(read_all(dir / "out.txt").find("OK"), std::string::npos);
}

TEST(CliCommandsTest, CheckFailsOnUnresolvedReference)
{
#ifndef SCOPELINK_CLI_PATH
  GTEST_SKIP() << "SCOPELINK_CLI_PATH is not configured (scopelink target missing?)";
#endif
  const fs::path dir = make_temp_dir("scopelink_cli_check_bad");
  write_all(
    dir / "app.json",
    R"({"kind": "Package", "name": "app",
        "members": [{"kind": "Class", "name": "Dog", "supertypes": ["Animl"]}]})");

  EXPECT_EQ(run_cli("check --no-stdlib app.json", dir, dir / "out.txt"), 1);
  // Linking alone does not check references
  EXPECT_EQ(run_cli("link --no-stdlib app.json", dir, dir / "out.txt"), 0);
}

TEST(CliCommandsTest, ResolvePrintsTheTarget)
{
#ifndef SCOPELINK_CLI_PATH
  GTEST_SKIP() << "SCOPELINK_CLI_PATH is not configured (scopelink target missing?)";
#endif
  const fs::path dir = make_temp_dir("scopelink_cli_resolve");
  write_all(dir / "zoo.json", k_model);

  ASSERT_EQ(
    run_cli("resolve legs zoo.json --no-stdlib --from zoo.Dog", dir, dir / "out.json"), 0);
  const auto out = nlohmann::json::parse(read_all(dir / "out.json"));
  EXPECT_EQ(out["kind"], "Field");
  EXPECT_EQ(out["qualifiedName"], "zoo.Animal");

  EXPECT_EQ(run_cli("resolve legs zoo.json --no-stdlib", dir, dir / "out.json"), 1);
}

TEST(CliCommandsTest, InitCreatesACheckableProject)
{
#ifndef SCOPELINK_CLI_PATH
  GTEST_SKIP() << "SCOPELINK_CLI_PATH is not configured (scopelink target missing?)";
#endif
  const fs::path dir = make_temp_dir("scopelink_cli_init");

  ASSERT_EQ(run_cli("init demo", dir, dir / "out.txt"), 0);
  EXPECT_TRUE(fs::exists(dir / "demo" / "scopelink.yaml"));
  EXPECT_TRUE(fs::exists(dir / "demo" / "model" / "app.json"));
  EXPECT_EQ(run_cli("init demo", dir, dir / "out.txt"), 1);

  EXPECT_EQ(run_cli("check --no-stdlib", dir / "demo", dir / "out.txt"), 0);
}
