/***
 * Name: test_cli_end_to_end
 * Purpose: Exercise the labelkit binary: help, script replay, reproducibility,
 *   metrics output and error exit codes.
 * Theory of Operation: LABELKIT_CLI_PATH is injected by the build; scripts and
 *   captured output live in a per-test temporary directory.
 */
#include <gtest/gtest.h>

#include <sys/wait.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#ifndef LABELKIT_CLI_PATH
#define LABELKIT_CLI_PATH "labelkit"
#endif

namespace fs = std::filesystem;

namespace {

fs::path TestDir() {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  fs::path dir = fs::temp_directory_path() / (std::string("labelkit_e2e_") + info->name());
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
}

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  std::string all;
  std::string line;
  while (std::getline(in, line)) {
    all += line;
    all += '\n';
  }
  return all;
}

// Runs the CLI with `args`, capturing stdout/stderr; returns the exit status.
int RunCli(const std::string& args, const fs::path& out, const fs::path& err) {
  const std::string cmd = std::string("\"") + LABELKIT_CLI_PATH + "\" " + args + " > \"" + out.string() +
                          "\" 2> \"" + err.string() + "\"";
  const int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

}  // namespace

TEST(CliEndToEnd, HelpPrintsUsage) {
  const auto dir = TestDir();
  ASSERT_EQ(0, RunCli("--help", dir / "out.txt", dir / "err.txt"));
  EXPECT_NE(ReadAll(dir / "out.txt").find("[options] script..."), std::string::npos);
}

TEST(CliEndToEnd, ReplaysScript) {
  const auto dir = TestDir();
  WriteFile(dir / "model.lbl",
            "# walkthrough\n"
            "scope model\n"
            "label\nlabel\nlabel foo\n"
            "scope\nlabel\nlabel\nend\n"
            "end\n"
            "scope model\nlabel\nend\n"
            "label\nlabel\n");
  ASSERT_EQ(0, RunCli("\"" + (dir / "model.lbl").string() + "\"", dir / "out.txt", dir / "err.txt"));
  EXPECT_EQ("model/1\nmodel/2\nmodel/foo\nmodel/3/1\nmodel/3/2\nmodel/1\nglobal/1\nglobal/2\n",
            ReadAll(dir / "out.txt"));
  EXPECT_NE(ReadAll(dir / "err.txt").find("labelkit: warning:"), std::string::npos);
}

TEST(CliEndToEnd, SameScriptTwiceIsReproducible) {
  const auto dir = TestDir();
  const auto script = (dir / "s.lbl").string();
  WriteFile(script, "scope net\nscope\nlabel\nend\nscope\nlabel w\nend\nend\n");
  ASSERT_EQ(0, RunCli("--no-fallback-warning \"" + script + "\" \"" + script + "\"", dir / "out.txt",
                      dir / "err.txt"));
  EXPECT_EQ("net/1/1\nnet/2/w\nnet/1/1\nnet/2/w\n", ReadAll(dir / "out.txt"));
  EXPECT_EQ("", ReadAll(dir / "err.txt"));
}

TEST(CliEndToEnd, MetricsJson) {
  const auto dir = TestDir();
  WriteFile(dir / "m.lbl", "scope a\nlabel\nend\n");
  ASSERT_EQ(0, RunCli("--metrics=json \"" + (dir / "m.lbl").string() + "\"", dir / "out.txt", dir / "err.txt"));
  const auto out = ReadAll(dir / "out.txt");
  EXPECT_NE(out.find("a/1"), std::string::npos);
  EXPECT_NE(out.find("\"labels_generated\": 1"), std::string::npos);
  EXPECT_NE(out.find("\"scopes_entered\": 2"), std::string::npos);
}

TEST(CliEndToEnd, InvalidNameFailsWithLine) {
  const auto dir = TestDir();
  WriteFile(dir / "bad.lbl", "scope model\nlabel a/b\n");
  EXPECT_EQ(2, RunCli("\"" + (dir / "bad.lbl").string() + "\"", dir / "out.txt", dir / "err.txt"));
  const auto err = ReadAll(dir / "err.txt");
  EXPECT_NE(err.find("line 2"), std::string::npos);
  EXPECT_NE(err.find("slash"), std::string::npos);
}

TEST(CliEndToEnd, StrictNamesRejectUnderscore) {
  const auto dir = TestDir();
  WriteFile(dir / "u.lbl", "scope my_model\n");
  EXPECT_EQ(0, RunCli("\"" + (dir / "u.lbl").string() + "\"", dir / "out.txt", dir / "err.txt"));
  EXPECT_EQ(2, RunCli("--strict-names \"" + (dir / "u.lbl").string() + "\"", dir / "out.txt", dir / "err.txt"));
  EXPECT_NE(ReadAll(dir / "err.txt").find("underscore"), std::string::npos);
}

TEST(CliEndToEnd, MissingFileAndBadUsage) {
  const auto dir = TestDir();
  EXPECT_EQ(2, RunCli("\"" + (dir / "nope.lbl").string() + "\"", dir / "out.txt", dir / "err.txt"));
  EXPECT_NE(ReadAll(dir / "err.txt").find("cannot read label script"), std::string::npos);
  EXPECT_EQ(2, RunCli("--bogus x.lbl", dir / "out.txt", dir / "err.txt"));
  EXPECT_NE(ReadAll(dir / "err.txt").find("unknown option '--bogus'"), std::string::npos);
}
