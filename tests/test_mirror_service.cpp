#include <gtest/gtest.h>
#include <managers/mirror_service.hpp>
#include "fake_runner.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

class MirrorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "sshmirror_test_service";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        SshSettings settings;
        settings.app_data_dir = (test_dir_ / "app").string();
        runner_ = std::make_shared<FakeRunner>();
        service_ = std::make_unique<MirrorService>(settings, runner_, "/tmp/sshmirror-test-%C");
    }

    void TearDown() override {
        service_.reset();
        fs::remove_all(test_dir_);
    }

    static ConnectionDescriptor conn() {
        ConnectionDescriptor c;
        c.id = "svc";
        c.host = "h";
        c.username = "u";
        return c;
    }

    std::vector<SSHFileMapping> one_file_mapping() {
        fs::path local = test_dir_ / "settings.json";
        std::ofstream(local) << "{}";
        return {{"settings", "claude", local.string(), "~/.claude/settings.json", false, false, true}};
    }

    fs::path test_dir_;
    std::shared_ptr<FakeRunner> runner_;
    std::unique_ptr<MirrorService> service_;
};

TEST_F(MirrorServiceTest, SyncPushesMappingsAndReleasesLock) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());

    auto r = service_->sync(one_file_mapping());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.success);
    EXPECT_EQ(r.value.synced_files.size(), 1u);
    EXPECT_FALSE(service_->session().sync_in_progress());
}

TEST_F(MirrorServiceTest, SyncFailsFastWhileAnotherSyncHoldsTheLock) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());
    ASSERT_TRUE(service_->session().try_acquire_sync_lock());
    runner_->calls.clear();

    auto r = service_->sync(one_file_mapping());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "A sync is already in progress");
    EXPECT_TRUE(runner_->calls.empty());

    service_->session().release_sync_lock();
    EXPECT_TRUE(service_->sync(one_file_mapping()).is_ok());
}

TEST_F(MirrorServiceTest, SyncReleasesLockWhenTransferThrows) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());
    runner_->handler = [](const SshCommand& cmd) -> std::optional<SSHResult> {
        if (is_copy(cmd)) throw std::runtime_error("runner blew up");
        return std::nullopt;
    };

    EXPECT_THROW(service_->sync(one_file_mapping()), std::runtime_error);
    EXPECT_FALSE(service_->session().sync_in_progress());

    runner_->handler = nullptr;
    auto r = service_->sync(one_file_mapping());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.success);
}

TEST_F(MirrorServiceTest, SyncWithoutSessionFailsAndReleasesLock) {
    auto r = service_->sync(one_file_mapping());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "No SSH session configured");
    EXPECT_FALSE(service_->session().sync_in_progress());
}

TEST_F(MirrorServiceTest, SyncAppliesModuleFilter) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());

    auto r = service_->sync(one_file_mapping(), std::string("codex"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.synced_files.empty());
    EXPECT_TRUE(r.value.skipped_files.empty());
}

TEST_F(MirrorServiceTest, OperationsReconnectWhenMasterIsGone) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());
    EXPECT_EQ(service_->session().spawn_count(), 1);

    // The first check after connect reports the master as dead
    bool failed_once = false;
    runner_->handler = [&failed_once](const SshCommand& cmd) -> std::optional<SSHResult> {
        if (is_check(cmd) && !failed_once) {
            failed_once = true;
            return SSHResult{255, "", "Control socket connect: No such file or directory\n"};
        }
        return std::nullopt;
    };

    ASSERT_TRUE(service_->write_file("~/a.txt", "data").is_ok());
    EXPECT_EQ(service_->session().spawn_count(), 2);
    EXPECT_EQ(service_->status(), SessionStatus::Connected);

    auto read = service_->read_file("~/a.txt");
    ASSERT_TRUE(read.is_ok()) << read.error;
    EXPECT_EQ(read.value, "data");
    EXPECT_EQ(service_->session().spawn_count(), 2);
}

TEST_F(MirrorServiceTest, HealReportsWhetherItReconnected) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());

    auto healthy = service_->heal();
    ASSERT_TRUE(healthy.is_ok());
    EXPECT_FALSE(healthy.value);

    bool failed_once = false;
    runner_->handler = [&failed_once](const SshCommand& cmd) -> std::optional<SSHResult> {
        if (is_check(cmd) && !failed_once) {
            failed_once = true;
            return SSHResult{255, "", ""};
        }
        return std::nullopt;
    };
    auto healed = service_->heal();
    ASSERT_TRUE(healed.is_ok()) << healed.error;
    EXPECT_TRUE(healed.value);
}

TEST_F(MirrorServiceTest, HealWithoutSessionIsError) {
    EXPECT_TRUE(service_->heal().is_err());
}

TEST_F(MirrorServiceTest, OperationsWithoutSessionFail) {
    EXPECT_TRUE(service_->read_file("~/x").is_err());
    EXPECT_TRUE(service_->write_file("~/x", "y").is_err());
    EXPECT_TRUE(service_->create_symlink("~/t", "~/l").is_err());
    EXPECT_TRUE(service_->remove_path("~/x").is_err());
    EXPECT_TRUE(service_->list_dir("~").is_err());
    EXPECT_FALSE(service_->check_symlink("~/l", "~/t"));
    EXPECT_EQ(runner_->count(is_shell), 0u);
}

TEST_F(MirrorServiceTest, SymlinkRoundTrip) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());
    ASSERT_TRUE(service_->create_symlink("~/dotfiles/vimrc", "~/.vimrc").is_ok());
    EXPECT_TRUE(service_->check_symlink("~/.vimrc", "~/dotfiles/vimrc"));
}

TEST_F(MirrorServiceTest, RemoveRefusesHome) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());
    runner_->calls.clear();

    EXPECT_TRUE(service_->remove_path("~").is_err());
    EXPECT_EQ(runner_->count(is_shell), 0u);
}

TEST_F(MirrorServiceTest, DisconnectForgetsDescriptor) {
    ASSERT_TRUE(service_->connect(conn()).is_ok());
    ASSERT_TRUE(service_->descriptor().has_value());

    service_->disconnect();
    EXPECT_FALSE(service_->descriptor().has_value());
    EXPECT_EQ(service_->status(), SessionStatus::Disconnected);
}
