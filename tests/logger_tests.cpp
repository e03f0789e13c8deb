#include "utilities/logger.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

std::string readFileContents(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return "";
  }
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

int countOccurrences(const std::string &text, const std::string &sub) {
  int count = 0;
  size_t pos = text.find(sub, 0);
  while (pos != std::string::npos) {
    count++;
    pos = text.find(sub, pos + sub.length());
  }
  return count;
}

} // namespace

// Each test points the singleton at its own file; TearDown restores the
// suite-wide log so later tests keep logging somewhere sensible.
class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "appendfs_logger_tests";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    Logger::init((std::filesystem::temp_directory_path() /
                  "appendfs_test_logs" / "appendfs_tests.log")
                     .string(),
                 LogLevel::DEBUG);
    std::filesystem::remove_all(dir_);
  }

  std::string pathFor(const std::string &name) {
    return (dir_ / name).string();
  }

  // Re-initializing closes the current file and flushes it.
  void flushLogger() {
    Logger::init(pathFor("flush.log"), LogLevel::DEBUG);
  }

  std::filesystem::path dir_;
};

TEST_F(LoggerTest, LogLevelFiltering) {
  const std::string file = pathFor("level_filter.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::INFO));
  Logger &logger = Logger::getInstance();

  logger.log(LogLevel::TRACE, "This is a trace message.");
  logger.log(LogLevel::DEBUG, "This is a debug message.");
  logger.log(LogLevel::INFO, "This is an info message.");
  logger.log(LogLevel::WARN, "This is a warning message.");
  logger.log(LogLevel::ERROR, "This is an error message.");
  flushLogger();

  std::string contents = readFileContents(file);
  ASSERT_NE(contents, "");
  EXPECT_EQ(countOccurrences(contents, "This is a trace message."), 0);
  EXPECT_EQ(countOccurrences(contents, "This is a debug message."), 0);
  EXPECT_NE(contents.find("This is an info message."), std::string::npos);
  EXPECT_NE(contents.find("This is a warning message."), std::string::npos);
  EXPECT_NE(contents.find("This is an error message."), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
  const std::string file = pathFor("json_format.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO,
                            "special chars \" \\ / \b \n \r \t");
  flushLogger();

  std::string contents = readFileContents(file);
  ASSERT_FALSE(contents.empty());
  EXPECT_NE(contents.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(contents.find(
                "\"message\":\"special chars \\\" \\\\ / \\b \\n \\r \\t\""),
            std::string::npos);
  EXPECT_NE(contents.find("\"timestamp\":\""), std::string::npos);
  EXPECT_EQ(contents.front(), '{');
  EXPECT_EQ(contents[contents.find_last_not_of("\n\r")], '}');
}

TEST_F(LoggerTest, InvalidUtf8IsReplacedSoLinesStayValidJson) {
  const std::string file = pathFor("invalid_utf8.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO, "[STREAM] Closed /caf\xE9\xFF");
  Logger::getInstance().log(LogLevel::INFO, "[STREAM] Closed /caf\xC3\xA9");
  flushLogger();

  std::string contents = readFileContents(file);
  EXPECT_NE(contents.find("[STREAM] Closed /caf\xEF\xBF\xBD"), std::string::npos);
  EXPECT_EQ(contents.find('\xE9'), std::string::npos);
  EXPECT_EQ(contents.find('\xFF'), std::string::npos);
  // Well-formed UTF-8 passes through unchanged.
  EXPECT_NE(contents.find("[STREAM] Closed /caf\xC3\xA9\""), std::string::npos);
}

TEST_F(LoggerTest, LogRotation) {
  const std::string file = pathFor("rotation.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::DEBUG, 1024, 2));

  std::string message(800, 'r');
  for (int i = 0; i < 6; ++i) {
    Logger::getInstance().log(LogLevel::INFO, message + " #" + std::to_string(i));
  }
  flushLogger();

  EXPECT_TRUE(std::filesystem::exists(file));
  EXPECT_TRUE(std::filesystem::exists(file + ".1"));
  EXPECT_TRUE(std::filesystem::exists(file + ".2"));
  EXPECT_FALSE(std::filesystem::exists(file + ".3"));
}

TEST_F(LoggerTest, LogRotationNoBackups) {
  const std::string file = pathFor("no_backup.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::DEBUG, 512, 0));

  std::string message(300, 'n');
  for (int i = 0; i < 5; ++i) {
    Logger::getInstance().log(LogLevel::INFO, message);
  }
  flushLogger();

  EXPECT_TRUE(std::filesystem::exists(file));
  EXPECT_FALSE(std::filesystem::exists(file + ".1"));
}

TEST_F(LoggerTest, ReinitializationSwitchesFileAndLevel) {
  const std::string file1 = pathFor("reinit1.log");
  const std::string file2 = pathFor("reinit2.log");

  ASSERT_NO_THROW(Logger::init(file1, LogLevel::INFO));
  Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");
  ASSERT_NO_THROW(Logger::init(file2, LogLevel::WARN));
  Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
  Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2");
  flushLogger();

  std::string contents1 = readFileContents(file1);
  std::string contents2 = readFileContents(file2);
  EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
  EXPECT_EQ(contents1.find("Message for logfile2"), std::string::npos);
  EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
  EXPECT_EQ(contents2.find("Info message for logfile2"), std::string::npos);
}

TEST_F(LoggerTest, SetLogLevelAtRuntime) {
  const std::string file = pathFor("runtime_level.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::ERROR));
  Logger::getInstance().log(LogLevel::INFO, "hidden");
  Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  EXPECT_EQ(Logger::getInstance().getLogLevel(), LogLevel::DEBUG);
  Logger::getInstance().log(LogLevel::DEBUG, "shown");
  Logger::trace("trace %d", 1);
  flushLogger();

  std::string contents = readFileContents(file);
  EXPECT_EQ(contents.find("hidden"), std::string::npos);
  EXPECT_NE(contents.find("shown"), std::string::npos);
  EXPECT_EQ(contents.find("trace 1"), std::string::npos);
}

TEST(LoggerLevels, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(Logger::levelFromString("trace"), LogLevel::TRACE);
  EXPECT_EQ(Logger::levelFromString("Debug"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::levelFromString("WARNING"), LogLevel::WARN);
  EXPECT_EQ(Logger::levelFromString("fatal"), LogLevel::FATAL);
  EXPECT_THROW(Logger::levelFromString("verbose"), std::invalid_argument);
}
