#include <gtest/gtest.h>
#include "transport/remote_shell.hpp"
#include "transport/target_inspector.hpp"
#include "test_helpers.hpp"

class RemoteShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<FakeCommandRunner>();
        settings_.user = "admin";
        settings_.port = 122;
        settings_.extraOptions = {"-o", "ConnectTimeout=5"};
        target_.host = "appliance.example.com";
        target_.user = "admin";
        target_.port = 122;
    }

    std::shared_ptr<FakeCommandRunner> runner_;
    SshSettings settings_;
    SshEndpoint target_;
};

TEST_F(RemoteShellTest, ParsesHostAndPort) {
    SshEndpoint endpoint;
    std::string error;
    ASSERT_TRUE(SshEndpoint::parse("appliance.example.com:2222", settings_, endpoint, error));
    EXPECT_EQ(endpoint.host, "appliance.example.com");
    EXPECT_EQ(endpoint.port, 2222);
    EXPECT_EQ(endpoint.user, "admin");

    ASSERT_TRUE(SshEndpoint::parse("appliance.example.com", settings_, endpoint, error));
    EXPECT_EQ(endpoint.port, 122);

    EXPECT_FALSE(SshEndpoint::parse("", settings_, endpoint, error));
    EXPECT_FALSE(SshEndpoint::parse("appliance.example.com:99999", settings_, endpoint, error));
    EXPECT_FALSE(SshEndpoint::parse("appliance.example.com:ssh", settings_, endpoint, error));
    EXPECT_FALSE(SshEndpoint::parse("-oProxyCommand=x", settings_, endpoint, error));
}

TEST_F(RemoteShellTest, ExecBuildsBatchModeSshLine) {
    RemoteShell shell(runner_, settings_);
    EXPECT_TRUE(shell.exec(target_, "appliance-config-apply").ok());

    ASSERT_EQ(runner_->lines().size(), 1u);
    EXPECT_EQ(runner_->lines()[0],
              "ssh -p 122 -l admin -o BatchMode=yes -o ConnectTimeout=5 "
              "appliance.example.com -- appliance-config-apply");
}

TEST_F(RemoteShellTest, PullUsesLinkDestAndPushUsesDelete) {
    RemoteShell shell(runner_, settings_, true);

    TransferSpec pull;
    pull.localPath = "/backups/20240102T000000/pages";
    pull.remotePath = "/data/user/pages";
    pull.dedupBase = "/backups/20240101T000000/pages";
    pull.deleteExtraneous = false;
    EXPECT_TRUE(shell.transfer(target_, pull).ok());

    TransferSpec push = pull;
    push.direction = TransferDirection::Push;
    push.deleteExtraneous = true;
    EXPECT_TRUE(shell.transfer(target_, push).ok());

    auto lines = runner_->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0],
              "rsync -a --numeric-ids --checksum --link-dest=/backups/20240101T000000/pages "
              "-e ssh -p 122 -l admin -o BatchMode=yes -o ConnectTimeout=5 "
              "--rsync-path=sudo rsync appliance.example.com:/data/user/pages/ "
              "/backups/20240102T000000/pages/");
    EXPECT_EQ(lines[1],
              "rsync -a --numeric-ids --checksum --delete "
              "-e ssh -p 122 -l admin -o BatchMode=yes -o ConnectTimeout=5 "
              "--rsync-path=sudo rsync /backups/20240102T000000/pages/ "
              "appliance.example.com:/data/user/pages/");
}

TEST_F(RemoteShellTest, PathExistsDistinguishesUnreachable) {
    RemoteShell shell(runner_, settings_);
    bool exists = true;

    runner_->on("test -e /data/user/hookshot", 1);
    ASSERT_TRUE(shell.pathExists(target_, "/data/user/hookshot", exists));
    EXPECT_FALSE(exists);

    runner_->on("test -e /data/user/hookshot", 255);
    EXPECT_FALSE(shell.pathExists(target_, "/data/user/hookshot", exists));
    EXPECT_NE(shell.getLastError().find("hookshot"), std::string::npos);
}

TEST_F(RemoteShellTest, InspectorReadsTargetState) {
    auto shell = std::make_shared<RemoteShell>(runner_, settings_);
    scriptTarget(*runner_, "2.12.3", true, false, true, true);

    TargetInspector inspector(shell, RemoteLayout());
    TargetInfo info;
    ASSERT_TRUE(inspector.inspect(target_, info));
    EXPECT_EQ(info.version, "2.12.3");
    EXPECT_TRUE(info.isConfigured);
    EXPECT_FALSE(info.isCluster);
    EXPECT_TRUE(info.inMaintenance);
    EXPECT_TRUE(info.isReplicated);
}

TEST_F(RemoteShellTest, InspectorReportsUnreachableTarget) {
    auto shell = std::make_shared<RemoteShell>(runner_, settings_);
    runner_->on("cat /etc/appliance-release", 255);

    TargetInspector inspector(shell, RemoteLayout());
    TargetInfo info;
    EXPECT_FALSE(inspector.inspect(target_, info));
    EXPECT_NE(inspector.getLastError().find("Cannot connect"), std::string::npos);
    EXPECT_EQ(runner_->count("test -e"), 0u);

    runner_->on("cat /etc/appliance-release", 1);
    EXPECT_FALSE(inspector.inspect(target_, info));
    EXPECT_NE(inspector.getLastError().find("appliance"), std::string::npos);
}
