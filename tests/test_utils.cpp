#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <platform/platform.hpp>

TEST(Utils, HashIdIsStable) {
    EXPECT_EQ(hash_id("/scratch/runs/offline-run-1"), hash_id("/scratch/runs/offline-run-1"));
    EXPECT_NE(hash_id("/scratch/runs/offline-run-1"), hash_id("/scratch/runs/offline-run-2"));
}

TEST(Utils, HashIdIsSixteenHexDigits) {
    std::string h = hash_id("anything");
    EXPECT_EQ(h.size(), 16u);
    EXPECT_EQ(h.find_first_not_of("0123456789abcdef"), std::string::npos);
    // FNV-1a offset basis for the empty string
    EXPECT_EQ(hash_id(""), "cbf29ce484222325");
}

TEST(Utils, ExpandUser) {
    EXPECT_EQ(expand_user("~"), platform::home_dir());
    EXPECT_EQ(expand_user("~/runs"), platform::home_dir() / "runs");
    EXPECT_EQ(expand_user("/abs/path"), std::filesystem::path("/abs/path"));
    EXPECT_EQ(expand_user("rel/~x"), std::filesystem::path("rel/~x"));
}

TEST(Utils, SafeParsers) {
    EXPECT_EQ(safe_stoi("4"), 4);
    EXPECT_EQ(safe_stoi("4x", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
    EXPECT_DOUBLE_EQ(safe_stod("0.25"), 0.25);
    EXPECT_DOUBLE_EQ(safe_stod("abc", 3.0), 3.0);
}

TEST(Utils, TrimStripsNewlines) {
    std::string s = "  /data/run\n";
    trim(s);
    EXPECT_EQ(s, "/data/run");

    std::string blank = " \t\r\n";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}
