#include <gtest/gtest.h>
#include "common/interrupt.hpp"
#include "restore/restore_cli.hpp"
#include "restore/restore_orchestrator.hpp"
#include "test_helpers.hpp"
#include <csignal>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

class RestoreOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.dataDir = dir_ / "data";
        config_.tunnelDir = tunnels_.path();
        runner_ = std::make_shared<FakeCommandRunner>();
        shell_ = std::make_shared<RemoteShell>(runner_, config_.ssh);
        store_ = std::make_shared<SnapshotStore>(config_.dataDir);
        options_.host = "appliance.example.com";
    }

    void TearDown() override {
        Interrupt::reset();
    }

    // A committed standalone snapshot with every datastore but assets,
    // storage and hookshot.
    Snapshot makeSnapshot(const std::string& strategy, const std::string& version) {
        Snapshot snapshot;
        EXPECT_TRUE(store_->begin(snapshot));
        writeFile(snapshot.path + "/settings.json", "{}");
        writeFile(snapshot.path + "/mysql.sql.gz", "mysql");
        writeFile(snapshot.path + "/redis.rdb", "redis");
        writeFile(snapshot.path + "/authorized-keys.json", "[]");
        writeFile(snapshot.path + "/repositories/org/repo.git/HEAD", "ref: refs/heads/main\n");
        writeFile(snapshot.path + "/pages/site/index.html", "<html/>");
        writeFile(snapshot.path + "/git-hooks/pre-receive", "#!/bin/sh\n");
        writeFile(snapshot.path + "/elasticsearch/nodes/0/state", "es");
        writeFile(snapshot.path + "/ssh-host-keys.tar", "keys");
        writeFile(snapshot.path + "/strategy", strategy + "\n");
        writeFile(snapshot.path + "/version", version + "\n");
        EXPECT_TRUE(store_->commit(snapshot));
        return snapshot;
    }

    std::unique_ptr<RestoreOrchestrator> orchestrator() {
        return std::make_unique<RestoreOrchestrator>(shell_, store_, config_);
    }

    bool published(const std::string& value) const {
        return runner_->count("echo " + value + " | sudo tee") > 0;
    }

    TempDir dir_;
    TempDir tunnels_;
    AppConfig config_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::shared_ptr<RemoteShell> shell_;
    std::shared_ptr<SnapshotStore> store_;
    RestoreOptions options_;
};

TEST_F(RestoreOrchestratorTest, ConfiguredStandaloneOutsideMaintenanceIsRejected) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, false, false, false);

    auto restore = orchestrator();
    options_.force = true;
    EXPECT_FALSE(restore->run(options_));

    EXPECT_EQ(restore->getState(), RestoreState::Failed);
    EXPECT_NE(restore->getLastError().find("maintenance"), std::string::npos);
    EXPECT_FALSE(published("restoring"));
    EXPECT_FALSE(published("failed"));
    EXPECT_EQ(runner_->count("appliance-import"), 0u);
    EXPECT_EQ(runner_->count("rsync"), 0u);
}

TEST_F(RestoreOrchestratorTest, OldSnapshotCannotBeRestoredToCluster) {
    makeSnapshot("cluster", "2.4.9");
    scriptTarget(*runner_, "2.12.3", true, true, true, false);

    auto restore = orchestrator();
    options_.force = true;
    EXPECT_FALSE(restore->run(options_));

    EXPECT_EQ(restore->getState(), RestoreState::Failed);
    EXPECT_NE(restore->getLastError().find("Version mismatch"), std::string::npos);
    EXPECT_EQ(runner_->count("sudo tee"), 0u);
    EXPECT_EQ(runner_->count("appliance-cluster-nodes"), 0u);
}

TEST_F(RestoreOrchestratorTest, ClusterSnapshotCannotBeRestoredToStandalone) {
    makeSnapshot("cluster", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_EQ(restore->getState(), RestoreState::Failed);
    EXPECT_EQ(runner_->count("sudo tee"), 0u);
}

TEST_F(RestoreOrchestratorTest, SnapshotFromNewerReleaseIsRejected) {
    makeSnapshot("rsync", "2.13.0");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_NE(restore->getLastError().find("newer"), std::string::npos);
    EXPECT_EQ(runner_->count("sudo tee"), 0u);
}

TEST_F(RestoreOrchestratorTest, UnsupportedTargetIsRejected) {
    makeSnapshot("rsync", "2.10.0");
    scriptTarget(*runner_, "2.10.4", false, false, false, false);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_NE(restore->getLastError().find("not supported"), std::string::npos);
}

TEST_F(RestoreOrchestratorTest, UnreachableTargetIsRejected) {
    makeSnapshot("rsync", "2.12.1");
    runner_->on("cat /etc/appliance-release", 255);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_NE(restore->getLastError().find("Cannot connect"), std::string::npos);
    EXPECT_EQ(runner_->count("sudo tee"), 0u);
}

TEST_F(RestoreOrchestratorTest, UnconfiguredLegacyTargetNeedsExplicitSettingsRestore) {
    config_.versions.supportedMin = "1.0.0";
    makeSnapshot("rsync", "1.9.0");
    scriptTarget(*runner_, "1.9.2", false, false, false, false);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_NE(restore->getLastError().find("-c"), std::string::npos);
    EXPECT_EQ(runner_->count("sudo tee"), 0u);

    options_.restoreSettings = true;
    auto explicitRestore = orchestrator();
    EXPECT_TRUE(explicitRestore->run(options_));
}

TEST_F(RestoreOrchestratorTest, UnconfiguredStandaloneRestoresEverythingInOrder) {
    Snapshot snapshot = makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);

    auto restore = orchestrator();
    ASSERT_TRUE(restore->run(options_)) << restore->getLastError();
    EXPECT_EQ(restore->getState(), RestoreState::Complete);
    EXPECT_TRUE(restore->getSession().restoreSettings);

    std::vector<std::string> order = {
        "echo restoring",
        "appliance-import-settings",
        "appliance-import-mysql",
        "appliance-import-redis",
        "appliance-import-authorized-keys",
        "appliance.example.com:/data/repositories/",
        "appliance.example.com:/data/user/pages/",
        "appliance.example.com:/data/user/git-hooks/",
        "appliance.example.com:/data/user/elasticsearch/",
        "echo complete",
        "appliance-import-ssh-host-keys",
    };
    int previous = -1;
    for (const auto& marker : order) {
        int index = runner_->indexOf(marker);
        EXPECT_GT(index, previous) << marker;
        previous = index;
    }
    EXPECT_NE(runner_->lines().back().find("appliance-import-ssh-host-keys"), std::string::npos);

    EXPECT_EQ(runner_->stdinOf("appliance-import-mysql"), snapshot.path + "/mysql.sql.gz");
    EXPECT_EQ(runner_->count("--delete"), 4u);
    EXPECT_EQ(runner_->count("/data/user/assets"), 0u);
    EXPECT_EQ(runner_->count("appliance-config-apply"), 0u);
    EXPECT_FALSE(published("failed"));
}

TEST_F(RestoreOrchestratorTest, ConfiguredStandaloneAppliesConfigurationAfterComplete) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, false, true, false);

    auto restore = orchestrator();
    options_.force = true;
    ASSERT_TRUE(restore->run(options_)) << restore->getLastError();

    EXPECT_FALSE(restore->getSession().restoreSettings);
    EXPECT_EQ(runner_->count("appliance-import-settings"), 0u);
    EXPECT_GT(runner_->indexOf("appliance-config-apply"), runner_->indexOf("echo complete"));
    EXPECT_GT(runner_->indexOf("appliance-import-ssh-host-keys"),
              runner_->indexOf("appliance-config-apply"));
}

TEST_F(RestoreOrchestratorTest, ConfigurationApplyFailureIsOnlyAWarning) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, false, true, false);
    runner_->on("appliance-config-apply", 1);

    auto restore = orchestrator();
    options_.force = true;
    EXPECT_TRUE(restore->run(options_));
    EXPECT_EQ(restore->getState(), RestoreState::Complete);
}

TEST_F(RestoreOrchestratorTest, DeclinedPromptPublishesNothing) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, false, true, false);

    std::istringstream in("\nno\n");
    std::ostringstream out;
    auto restore = orchestrator();
    restore->setConfirmCallback([&](const RestoreSession& session) {
        return RestoreCLI::confirm(in, out, session);
    });

    EXPECT_FALSE(restore->run(options_));
    EXPECT_EQ(restore->getState(), RestoreState::Aborted);
    EXPECT_EQ(runner_->count("sudo tee"), 0u);
    EXPECT_EQ(runner_->count("appliance-import"), 0u);
}

TEST_F(RestoreOrchestratorTest, AcceptedPromptRestores) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, false, true, true);

    int asked = 0;
    auto restore = orchestrator();
    restore->setConfirmCallback([&](const RestoreSession& session) {
        ++asked;
        EXPECT_TRUE(session.isReplicated);
        return true;
    });

    EXPECT_TRUE(restore->run(options_));
    EXPECT_EQ(asked, 1);
}

TEST_F(RestoreOrchestratorTest, UnconfiguredTargetIsNotPrompted) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);

    auto restore = orchestrator();
    restore->setConfirmCallback([](const RestoreSession&) {
        ADD_FAILURE() << "prompted";
        return false;
    });
    EXPECT_TRUE(restore->run(options_));
}

TEST_F(RestoreOrchestratorTest, UnfinishedPreviousRestoreIsOnlyReported) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);
    runner_->on("cat /data/user/common/restore-status", 0, "restoring\n");

    auto restore = orchestrator();
    EXPECT_TRUE(restore->run(options_));
    EXPECT_EQ(runner_->count("cat /data/user/common/restore-status"), 1u);
    EXPECT_LT(runner_->indexOf("cat /data/user/common/restore-status"),
              runner_->indexOf("echo restoring"));
}

TEST_F(RestoreOrchestratorTest, StepFailureStopsSessionAndPublishesFailed) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);
    runner_->on("appliance-import-mysql", 1);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));

    EXPECT_EQ(restore->getState(), RestoreState::Failed);
    EXPECT_EQ(restore->getSession().failedStep, "mysql");
    EXPECT_NE(restore->getLastError().find("mysql"), std::string::npos);
    EXPECT_GT(runner_->indexOf("echo failed"), runner_->indexOf("echo restoring"));
    EXPECT_FALSE(published("complete"));
    EXPECT_EQ(runner_->count("appliance-import-redis"), 0u);
    EXPECT_EQ(runner_->count("appliance-import-mysql"), 1u);
}

TEST_F(RestoreOrchestratorTest, MissingRequiredDatastoreFailsStep) {
    Snapshot snapshot = makeSnapshot("rsync", "2.12.1");
    fs::remove_all(snapshot.path + "/repositories");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_EQ(restore->getSession().failedStep, "repositories");
    EXPECT_TRUE(published("failed"));
}

TEST_F(RestoreOrchestratorTest, StatusPublishFailureDoesNotChangeOutcome) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);
    runner_->on("sudo tee", 1);

    auto restore = orchestrator();
    EXPECT_TRUE(restore->run(options_));
    EXPECT_EQ(restore->getState(), RestoreState::Complete);
}

TEST_F(RestoreOrchestratorTest, HostKeyFailureLeavesStatusComplete) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", false, false, false, false);
    runner_->on("appliance-import-ssh-host-keys", 1);

    auto restore = orchestrator();
    EXPECT_FALSE(restore->run(options_));
    EXPECT_EQ(restore->getState(), RestoreState::Failed);
    EXPECT_EQ(restore->getSession().failedStep, "ssh-host-keys");
    EXPECT_TRUE(published("complete"));
    EXPECT_FALSE(published("failed"));
}

TEST_F(RestoreOrchestratorTest, ClusterRestoreFansOutThroughTunnel) {
    makeSnapshot("cluster", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, true, false, false);
    runner_->on("appliance-cluster-nodes --role git --json", 0,
                R"([{"hostname": "git-2"}, {"hostname": "git-1"}])");
    runner_->on("appliance-cluster-nodes --role pages --json", 0, R"([{"hostname": "pages-1"}])");
    runner_->on("appliance-cluster-nodes --role storage --json", 1);

    auto restore = orchestrator();
    options_.force = true;
    ASSERT_TRUE(restore->run(options_)) << restore->getLastError();

    EXPECT_EQ(runner_->count("git-1:/data/repositories/"), 1u);
    EXPECT_EQ(runner_->count("git-2:/data/repositories/"), 1u);
    EXPECT_EQ(runner_->count("git-1:/data/user/git-hooks/"), 1u);
    EXPECT_EQ(runner_->count("git-2:/data/user/git-hooks/"), 1u);
    EXPECT_EQ(runner_->count("pages-1:/data/user/pages/"), 1u);
    EXPECT_EQ(runner_->count("/data/user/storage"), 0u);
    EXPECT_EQ(runner_->count("--delete"), 0u);
    EXPECT_GT(runner_->indexOf("appliance-es-reindex"), runner_->indexOf("git-1:/data/repositories/"));
    EXPECT_EQ(runner_->count("appliance-import-ssh-host-keys"), 0u);
    EXPECT_EQ(runner_->count("appliance-config-apply"), 0u);
    EXPECT_NE(runner_->lines().back().find("echo complete"), std::string::npos);

    // Every tunnel config was removed again
    EXPECT_TRUE(fs::is_empty(tunnels_.path()));
    EXPECT_GT(runner_->count(" -F " + tunnels_.path()), 0u);
}

TEST_F(RestoreOrchestratorTest, StandaloneSnapshotRestoresToClusterWithClusterRoutines) {
    makeSnapshot("rsync", "2.12.1");
    scriptTarget(*runner_, "2.12.3", true, true, false, false);
    runner_->on("appliance-cluster-nodes --role git --json", 0, R"([{"hostname": "git-1"}])");

    auto restore = orchestrator();
    options_.force = true;
    ASSERT_TRUE(restore->run(options_)) << restore->getLastError();
    EXPECT_EQ(runner_->count("git-1:/data/repositories/"), 1u);
    EXPECT_EQ(runner_->count("appliance.example.com:/data/repositories/"), 0u);
}

TEST_F(RestoreOrchestratorTest, InterruptPublishesFailedAndPropagates) {
    makeSnapshot("rsync", "2.12.1");

    // Signal arrives while redis is being imported
    class InterruptingRunner : public FakeCommandRunner {
    public:
        CommandResult run(const Command& command) override {
            CommandResult result = FakeCommandRunner::run(command);
            for (const auto& arg : command.argv) {
                if (arg.find("appliance-import-redis") != std::string::npos) {
                    Interrupt::raise(SIGINT);
                }
            }
            return result;
        }
    };
    auto runner = std::make_shared<InterruptingRunner>();
    scriptTarget(*runner, "2.12.3", false, false, false, false);
    shell_ = std::make_shared<RemoteShell>(runner, config_.ssh);

    auto restore = orchestrator();
    EXPECT_THROW(restore->run(options_), InterruptedError);
    EXPECT_EQ(restore->getState(), RestoreState::Failed);
    EXPECT_EQ(runner->count("appliance-import-authorized-keys"), 0u);
    EXPECT_EQ(runner->count("echo failed"), 1u);
    EXPECT_TRUE(Interrupt::requested());
}
