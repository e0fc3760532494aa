#include "commands.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Logger.hpp"
#include "markup.hpp"

namespace {

std::string writeTempFile(const std::string& name, const std::string& data) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path.c_str(), std::ios::out | std::ios::binary);
  out << data;
  return path;
}

Options optionsFor(Command command) {
  Options opts;
  opts.command = command;
  return opts;
}

}  // namespace

// ==================== readInput ====================

TEST(ReadInputTests, ReadsWholeFile) {
  std::string path = writeTempFile("markupctl_read.txt", "a <b>\nline 2\n");
  EXPECT_EQ(readInput(path), "a <b>\nline 2\n");
  std::remove(path.c_str());
}

TEST(ReadInputTests, MissingFileThrowsAndLogs) {
  std::ostringstream log;
  Logger::setOutput(&log);
  EXPECT_THROW(readInput(::testing::TempDir() + "markupctl_missing/none.txt"),
               std::runtime_error);
  Logger::setOutput(NULL);
  EXPECT_NE(log.str().find("[ERROR]"), std::string::npos);
  EXPECT_NE(log.str().find("cannot open"), std::string::npos);
}

// ==================== runCommand ====================

TEST(RunCommandTests, Escape) {
  EXPECT_EQ(runCommand(optionsFor(CMD_ESCAPE), "<a href=\"x\">&</a>"),
            "&lt;a href=&#34;x&#34;&gt;&amp;&lt;/a&gt;");
}

TEST(RunCommandTests, Unescape) {
  EXPECT_EQ(runCommand(optionsFor(CMD_UNESCAPE), "&lt;b&gt; &amp;amp;"),
            "<b> &amp;");
}

TEST(RunCommandTests, StripTags) {
  EXPECT_EQ(runCommand(optionsFor(CMD_STRIPTAGS),
                       "<p>Foo &amp;\n  <em>Bar</em></p>\n"),
            "Foo & Bar");
}

TEST(RunCommandTests, FormatEscapesArguments) {
  Options opts = optionsFor(CMD_FORMAT);
  opts.positional.push_back("<i>");
  opts.named.push_back(std::make_pair("user", "Tom & Jerry"));
  EXPECT_EQ(runCommand(opts, "<p>{0} {user}</p>"),
            "<p>&lt;i&gt; Tom &amp; Jerry</p>");
}

TEST(RunCommandTests, FormatErrorPropagates) {
  Options opts = optionsFor(CMD_FORMAT);
  EXPECT_THROW(runCommand(opts, "{0}"), markup::FormatError);
  EXPECT_THROW(runCommand(opts, "{missing}"), markup::Error);
}
