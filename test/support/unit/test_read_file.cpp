/***
 * Name: test_read_file
 * Purpose: Validate loading label scripts from files and streams.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "labelkit/support/fs.h"

using labelkit::support::ReadFile;
using labelkit::support::ReadStream;

TEST(ReadFile, LoadsWholeScript) {
  const auto path = std::filesystem::temp_directory_path() / "labelkit_read_file_test.lbl";
  {
    std::ofstream out(path);
    out << "scope model\nlabel\nend\n";
  }
  std::string text;
  std::string err;
  ASSERT_TRUE(ReadFile(path.string(), text, err)) << err;
  EXPECT_EQ("scope model\nlabel\nend\n", text);
  std::filesystem::remove(path);
}

TEST(ReadFile, MissingScriptNamesPath) {
  std::string text = "unchanged";
  std::string err;
  EXPECT_FALSE(ReadFile("/nonexistent/dir/model.lbl", text, err));
  EXPECT_EQ("cannot read label script '/nonexistent/dir/model.lbl'", err);
  EXPECT_EQ("unchanged", text);
}

TEST(ReadStream, FailedStreamIsError) {
  std::istringstream in("label\n");
  in.setstate(std::ios::failbit);
  std::string text;
  std::string err;
  EXPECT_FALSE(ReadStream(in, text, err));
  EXPECT_FALSE(err.empty());
}
