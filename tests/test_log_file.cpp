#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/log_file.hpp"

#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace onova {
namespace {

std::vector<std::string> Lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream is(text);
    for (std::string line; std::getline(is, line);) out.push_back(line);
    return out;
}

TEST(LogFileTest, FormatsTimestampPrefix) {
    const std::string line = LogFile::FormatLine("hello");
    const std::regex pattern(R"(^\d{2}-[A-Z][a-z]{2}-\d{4} \d{2}:\d{2}:\d{2}\.\d{3}> hello\n$)");
    EXPECT_TRUE(std::regex_match(line, pattern)) << line;
}

TEST(LogFileTest, AppendsAcrossReopen) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("app.UpdateManager.log");

    {
        LogFile log;
        ASSERT_TRUE(log.Open(path).is_ok());
        log.Write(LogLevel::Info, "first %d", 1);
    }
    {
        LogFile log;
        ASSERT_TRUE(log.Open(path).is_ok());
        log.Write(LogLevel::Info, "second %s", "line");
    }

    const auto lines = Lines(testutil::ReadTextFile(path));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(lines[0].ends_with("> first 1"));
    EXPECT_TRUE(lines[1].ends_with("> second line"));
}

TEST(LogFileTest, SkipsLinesBelowLevel) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("x.log");

    LogFile log;
    ASSERT_TRUE(log.Open(path).is_ok());
    log.SetLevel(LogLevel::Warn);
    log.Write(LogLevel::Debug, "debug");
    log.Write(LogLevel::Info, "info");
    log.Write(LogLevel::Error, "error");

    const auto lines = Lines(testutil::ReadTextFile(path));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(lines[0].ends_with("> error"));
}

TEST(LogFileTest, OpenFailsForMissingDirectory) {
    LogFile log;
    auto r = log.Open("/nonexistent/onova/dir/x.log");
    EXPECT_TRUE(r.Is(UpdateErrc::Io));
    EXPECT_FALSE(log.IsOpen());
    log.Write(LogLevel::Info, "dropped");
}

} // namespace
} // namespace onova
