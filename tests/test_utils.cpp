#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <regex>
#include <set>

TEST(Utils, NormalizeUrlAddsHttps) {
    EXPECT_EQ(normalize_url("myapp.vercel.app"), "https://myapp.vercel.app");
}

TEST(Utils, NormalizeUrlKeepsScheme) {
    EXPECT_EQ(normalize_url("http://localhost:3000"), "http://localhost:3000");
    EXPECT_EQ(normalize_url("https://example.com/a"), "https://example.com/a");
}

TEST(Utils, NormalizeUrlProtocolRelative) {
    EXPECT_EQ(normalize_url("//cdn.example.com"), "https://cdn.example.com");
}

TEST(Utils, NormalizeUrlTrimsWhitespace) {
    EXPECT_EQ(normalize_url("  example.com \n"), "https://example.com");
    EXPECT_EQ(normalize_url("   "), "");
}

TEST(Utils, SplitLinesDropsTrailingNewline) {
    auto lines = split_lines("a\nb\r\n\nc\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");
}

TEST(Utils, LastLines) {
    EXPECT_EQ(last_lines("1\n2\n3\n4\n", 2), "3\n4");
    EXPECT_EQ(last_lines("1\n2", 10), "1\n2");
    EXPECT_EQ(last_lines("", 5), "");
}

TEST(Utils, SessionIdFormat) {
    std::regex pattern("^s-[0-9a-f]{8}$");
    std::set<std::string> seen;
    for (int i = 0; i < 20; i++) {
        auto id = generate_session_id();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        seen.insert(id);
    }
    EXPECT_GT(seen.size(), 1u);
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("", 7), 7);
    EXPECT_EQ(safe_stoi("abc", -1), -1);
}

TEST(StringUtils, SplitArgsQuotes) {
    auto words = StringUtils::split_args(R"(deploy "/my project" --provider 'net lify' a\ b)");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 5u);
    EXPECT_EQ((*words)[0], "deploy");
    EXPECT_EQ((*words)[1], "/my project");
    EXPECT_EQ((*words)[2], "--provider");
    EXPECT_EQ((*words)[3], "net lify");
    EXPECT_EQ((*words)[4], "a b");
}

TEST(StringUtils, SplitArgsUnterminatedQuote) {
    EXPECT_FALSE(StringUtils::split_args("plan \"/oops").has_value());
}

TEST(StringUtils, JoinArgsSurvivesSplit) {
    std::vector<std::string> words = {"plain", "with space", "it's", "$(rm -rf /); echo", ""};
    auto back = StringUtils::split_args(StringUtils::join_args(words));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, words);
}
