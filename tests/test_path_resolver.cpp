#include <gtest/gtest.h>
#include <managers/path_resolver.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

// ── Local expansion ─────────────────────────────────────────

TEST(ExpandLocalPath, LeadingTilde) {
    auto home = platform::find_home_dir();
    if (!home) GTEST_SKIP() << "HOME not set";

    EXPECT_EQ(expand_local_path("~"), home->string());
    EXPECT_EQ(expand_local_path("~/.claude/settings.json"), home->string() + "/.claude/settings.json");
    EXPECT_EQ(expand_local_path("/etc/~/x"), "/etc/~/x");
}

TEST(ExpandLocalPath, HomeVariableBothSpellings) {
    auto home = platform::get_env("HOME");
    if (!home) GTEST_SKIP() << "HOME not set";

    EXPECT_EQ(expand_local_path("$HOME/.config"), *home + "/.config");
    EXPECT_EQ(expand_local_path("%HOME%/.config"), *home + "/.config");
}

TEST(ExpandLocalPath, PlainPathUnchanged) {
    EXPECT_EQ(expand_local_path("/opt/app/config.yaml"), "/opt/app/config.yaml");
    EXPECT_EQ(expand_local_path("relative/file"), "relative/file");
    EXPECT_EQ(expand_local_path(""), "");
}

#ifndef _WIN32
TEST(ExpandLocalPath, SetAndUnsetVariables) {
    const char* old_appdata = std::getenv("APPDATA");
    std::string saved_appdata = old_appdata ? old_appdata : "";
    const char* old_local = std::getenv("LOCALAPPDATA");
    std::string saved_local = old_local ? old_local : "";
    bool had_appdata = old_appdata != nullptr;
    bool had_local = old_local != nullptr;

    setenv("APPDATA", "/data/roaming", 1);
    unsetenv("LOCALAPPDATA");

    EXPECT_EQ(expand_local_path("%APPDATA%/Code/settings.json"), "/data/roaming/Code/settings.json");
    EXPECT_EQ(expand_local_path("$APPDATA/x"), "/data/roaming/x");
    EXPECT_EQ(expand_local_path("%LOCALAPPDATA%/x"), "%LOCALAPPDATA%/x");

    if (had_appdata) setenv("APPDATA", saved_appdata.c_str(), 1);
    else unsetenv("APPDATA");
    if (had_local) setenv("LOCALAPPDATA", saved_local.c_str(), 1);
}
#endif

TEST(RemoteShellPath, TildeBecomesHomeVariable) {
    EXPECT_EQ(to_remote_shell_path("~/.claude/agents"), "$HOME/.claude/agents");
    EXPECT_EQ(to_remote_shell_path("~"), "$HOME");
    EXPECT_EQ(to_remote_shell_path("/etc/app"), "/etc/app");
}

TEST(RemoteShellPath, LeadingHomeVariableIsKept) {
    EXPECT_EQ(to_remote_shell_path("$HOME/.config"), "$HOME/.config");
    EXPECT_EQ(to_remote_shell_path("${HOME}/.config"), "${HOME}/.config");
    EXPECT_EQ(to_remote_shell_path("$HOME"), "$HOME");
    // Only a whole leading component counts
    EXPECT_EQ(to_remote_shell_path("$HOMEDIR/x"), "\\$HOMEDIR/x");
}

TEST(RemoteShellPath, QuoteBreakingCharactersAreEscaped) {
    EXPECT_EQ(to_remote_shell_path("~/a\"b"), "$HOME/a\\\"b");
    EXPECT_EQ(to_remote_shell_path("/tmp/$(rm -rf ~)"), "/tmp/\\$(rm -rf $HOME)");
    EXPECT_EQ(to_remote_shell_path("/tmp/`id`"), "/tmp/\\`id\\`");
    EXPECT_EQ(to_remote_shell_path("/tmp/back\\slash"), "/tmp/back\\\\slash");
    EXPECT_EQ(to_remote_shell_path("$HOME/$USER"), "$HOME/\\$USER");
    EXPECT_EQ(to_remote_shell_path("~/with space"), "$HOME/with space");
}

// ── Glob expansion ──────────────────────────────────────────

class GlobTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "sshmirror_test_glob";
        fs::remove_all(root_);
        touch("a.md");
        touch("b.md");
        touch(".hidden.md");
        touch("c.txt");
        touch("sub/d.md");
        touch("sub/deep/e.md");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void touch(const std::string& rel) {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << rel;
    }

    std::vector<std::string> glob(const std::string& rel) {
        auto r = expand_glob((root_ / rel).string());
        EXPECT_TRUE(r.is_ok()) << r.error;
        std::vector<std::string> out;
        for (const auto& p : r.value) out.push_back(p.lexically_relative(root_).generic_string());
        return out;
    }

    fs::path root_;
};

TEST_F(GlobTest, StarMatchesSortedIncludingDotfiles) {
    std::vector<std::string> expected = {".hidden.md", "a.md", "b.md"};
    EXPECT_EQ(glob("*.md"), expected);
}

TEST_F(GlobTest, QuestionMarkAndClasses) {
    std::vector<std::string> ab = {"a.md", "b.md"};
    EXPECT_EQ(glob("?.md"), ab);
    EXPECT_EQ(glob("[ab].md"), ab);

    std::vector<std::string> not_a = {"b.md"};
    EXPECT_EQ(glob("[!a].md"), not_a);
}

TEST_F(GlobTest, RecursiveMatchesAnyDepth) {
    std::vector<std::string> expected = {".hidden.md", "a.md", "b.md", "sub/d.md", "sub/deep/e.md"};
    EXPECT_EQ(glob("**/*.md"), expected);
}

TEST_F(GlobTest, WildcardDirectoryComponent) {
    std::vector<std::string> expected = {"sub/d.md"};
    EXPECT_EQ(glob("s*/*.md"), expected);
}

TEST_F(GlobTest, LiteralPathMatchesItself) {
    std::vector<std::string> expected = {"c.txt"};
    EXPECT_EQ(glob("c.txt"), expected);
    EXPECT_TRUE(glob("missing.txt").empty());
}

TEST_F(GlobTest, NoMatchesIsEmpty) {
    EXPECT_TRUE(glob("*.json").empty());
    EXPECT_TRUE(glob("nowhere/*.md").empty());
}

TEST_F(GlobTest, UnclosedClassIsError) {
    auto r = expand_glob((root_ / "[abc").string());
    EXPECT_TRUE(r.is_err());
}

TEST_F(GlobTest, DoubleStarInsideComponentIsError) {
    auto r = expand_glob((root_ / "a**b").string());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("**"), std::string::npos);
}
