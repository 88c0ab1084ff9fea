#include <gtest/gtest.h>
#include <managers/safety_guard.hpp>

TEST(SafetyGuard, RootAndHomeAreDangerous) {
    EXPECT_TRUE(is_dangerous_remote_path(""));
    EXPECT_TRUE(is_dangerous_remote_path("/"));
    EXPECT_TRUE(is_dangerous_remote_path("~"));
    EXPECT_TRUE(is_dangerous_remote_path("$HOME"));
}

TEST(SafetyGuard, WhitespaceIsIgnored) {
    EXPECT_TRUE(is_dangerous_remote_path("   "));
    EXPECT_TRUE(is_dangerous_remote_path(" / "));
    EXPECT_TRUE(is_dangerous_remote_path("\t~\n"));
    EXPECT_TRUE(is_dangerous_remote_path("  $HOME"));
}

TEST(SafetyGuard, SpellingsOfRootAndHomeAreDangerous) {
    EXPECT_TRUE(is_dangerous_remote_path("~/"));
    EXPECT_TRUE(is_dangerous_remote_path("~//"));
    EXPECT_TRUE(is_dangerous_remote_path("~/."));
    EXPECT_TRUE(is_dangerous_remote_path("$HOME/"));
    EXPECT_TRUE(is_dangerous_remote_path("${HOME}"));
    EXPECT_TRUE(is_dangerous_remote_path("${HOME}/"));
    EXPECT_TRUE(is_dangerous_remote_path("//"));
    EXPECT_TRUE(is_dangerous_remote_path("///"));
    EXPECT_TRUE(is_dangerous_remote_path("/."));
    EXPECT_TRUE(is_dangerous_remote_path("."));
    EXPECT_TRUE(is_dangerous_remote_path(" ~/ "));
}

TEST(SafetyGuard, OrdinaryPathsAreAllowed) {
    EXPECT_FALSE(is_dangerous_remote_path("~/.claude"));
    EXPECT_FALSE(is_dangerous_remote_path("$HOME/.config/app"));
    EXPECT_FALSE(is_dangerous_remote_path("/etc/app"));
    EXPECT_FALSE(is_dangerous_remote_path("relative/dir"));
    EXPECT_FALSE(is_dangerous_remote_path("~//.claude/"));
    EXPECT_FALSE(is_dangerous_remote_path("${HOME}/.config"));
    EXPECT_FALSE(is_dangerous_remote_path("/tmp/"));
}

TEST(SafetyGuard, CheckNamesPathAndAction) {
    auto r = check_remote_path("~", "remove");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Refusing to remove dangerous remote path: '~'");

    EXPECT_TRUE(check_remote_path("~/.claude/agents", "sync into").is_ok());
}
