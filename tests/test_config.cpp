/**
 * test_config.cpp - Tests for SerializeConfig logging
 */

#include <gtest/gtest.h>
#include <xschema/config.hpp>
#include <string>
#include <vector>

using xschema::SerializeConfig;

TEST(ConfigTest, DefaultsAreCompactAndQuiet) {
    SerializeConfig config;
    EXPECT_EQ(config.indent, -1);
    EXPECT_EQ(config.indent_char, ' ');
    EXPECT_FALSE(config.ensure_ascii);
    EXPECT_FALSE(config.verbose);

    testing::internal::CaptureStderr();
    config.log("dropped");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(ConfigTest, VerboseWritesToStderr) {
    SerializeConfig config;
    config.verbose = true;

    testing::internal::CaptureStderr();
    config.log("sorting 3 properties");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[xschema] sorting 3 properties\n");
}

TEST(ConfigTest, LogFuncTakesPriorityOverVerbose) {
    std::vector<std::string> messages;
    SerializeConfig config;
    config.verbose = true;
    config.set_log_func([&](const std::string& msg) { messages.push_back(msg); });

    testing::internal::CaptureStderr();
    config.log("hello");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "hello");
}
