#include "bastion/utils/string_utils.hpp"

#include <gtest/gtest.h>

using bastion::utils::StringUtils;

TEST(StringUtilsTest, TrimAndCollapse) {
    EXPECT_EQ(StringUtils::Trim("  ls -la \n"), "ls -la");
    EXPECT_EQ(StringUtils::Trim("   "), "");
    EXPECT_EQ(StringUtils::CollapseWhitespace("  ls \t  -la\n\n foo  "), "ls -la foo");
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    auto parts = StringUtils::Split("a,,b,c,", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[2], "c");
    EXPECT_EQ(StringUtils::Join(parts, "-"), "a-b-c");
}

TEST(StringUtilsTest, ShellSplitHonorsQuotes) {
    auto words = StringUtils::ShellSplit(R"(grep -r "hello world" 'single quoted' plain\ space)");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 5u);
    EXPECT_EQ((*words)[0], "grep");
    EXPECT_EQ((*words)[2], "hello world");
    EXPECT_EQ((*words)[3], "single quoted");
    EXPECT_EQ((*words)[4], "plain space");
}

TEST(StringUtilsTest, ShellSplitEscapesInsideDoubleQuotes) {
    auto words = StringUtils::ShellSplit(R"(echo "a \"b\" \$HOME \n")");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ((*words)[1], R"(a "b" $HOME \n)");
}

TEST(StringUtilsTest, ShellSplitKeepsEmptyQuotedWord) {
    auto words = StringUtils::ShellSplit("echo ''");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ((*words)[1], "");
}

TEST(StringUtilsTest, ShellSplitRejectsUnbalancedInput) {
    EXPECT_FALSE(StringUtils::ShellSplit("echo 'unterminated").has_value());
    EXPECT_FALSE(StringUtils::ShellSplit("echo \"unterminated").has_value());
    EXPECT_FALSE(StringUtils::ShellSplit("echo trailing\\").has_value());
}

TEST(StringUtilsTest, FindShellCommentIgnoresQuotedHashes) {
    EXPECT_EQ(StringUtils::FindShellComment("ls # list"), 3u);
    EXPECT_EQ(StringUtils::FindShellComment("echo '# not a comment'"), std::string::npos);
    EXPECT_EQ(StringUtils::FindShellComment("echo \"# nope\" # yes"), 14u);
    EXPECT_EQ(StringUtils::FindShellComment("echo a#b"), std::string::npos);
}

TEST(StringUtilsTest, ExecutableNameCharset) {
    EXPECT_TRUE(StringUtils::IsExecutableName("python3"));
    EXPECT_TRUE(StringUtils::IsExecutableName("docker-compose"));
    EXPECT_TRUE(StringUtils::IsExecutableName("django_admin.py"));
    EXPECT_FALSE(StringUtils::IsExecutableName(""));
    EXPECT_FALSE(StringUtils::IsExecutableName("g++"));
    EXPECT_FALSE(StringUtils::IsExecutableName("bin/ls"));
    EXPECT_FALSE(StringUtils::IsExecutableName("$(whoami)"));
}
