#include <gtest/gtest.h>
#include "common/interrupt.hpp"
#include "transport/tunnel_transport.hpp"
#include "test_helpers.hpp"
#include <csignal>
#include <filesystem>

namespace fs = std::filesystem;

class TunnelTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.tunnelDir = tunnels_.path();
        runner_ = std::make_shared<FakeCommandRunner>();
        shell_ = std::make_shared<RemoteShell>(runner_, config_.ssh);

        entry_.host = "entry.example.com";
        entry_.user = "admin";
        entry_.port = 122;

        for (const char* name : {"node-a", "node-b", "node-c"}) {
            Node node;
            node.hostname = name;
            node.role = "git";
            members_.push_back(node);
        }
    }

    bool tunnelDirEmpty() const {
        return fs::is_empty(tunnels_.path());
    }

    TempDir tunnels_;
    TempDir local_;
    AppConfig config_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::shared_ptr<RemoteShell> shell_;
    SshEndpoint entry_;
    std::vector<Node> members_;
};

TEST_F(TunnelTransportTest, ConfigRoutesMembersThroughEntry) {
    std::string text = TunnelTransport::renderConfig(entry_, members_, config_.ssh);

    for (const auto& member : members_) {
        EXPECT_NE(text.find("Host " + member.hostname + "\n"), std::string::npos);
    }
    EXPECT_NE(text.find("ProxyCommand ssh -p 122 -l admin -o BatchMode=yes entry.example.com "
                        "nc.openbsd %h %p"),
              std::string::npos);
    EXPECT_NE(text.find("StrictHostKeyChecking no"), std::string::npos);
    EXPECT_NE(text.find("UserKnownHostsFile /dev/null"), std::string::npos);
    EXPECT_EQ(text.find("Host entry.example.com"), std::string::npos);
}

TEST_F(TunnelTransportTest, CommandsUseTunnelConfig) {
    TunnelTransport transport(shell_, config_);
    std::string seen;

    bool ok = transport.withTunnel(entry_, members_, [&](const TunnelConfig& tunnel) {
        seen = tunnel.path;
        EXPECT_TRUE(fs::exists(tunnel.path));
        return transport.runOverTunnel(tunnel, members_[1], "uptime").ok();
    });

    EXPECT_TRUE(ok);
    auto lines = runner_->matching("uptime");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("-F " + seen), std::string::npos);
    EXPECT_NE(lines[0].find("node-b -- uptime"), std::string::npos);
    EXPECT_TRUE(tunnelDirEmpty());
}

TEST_F(TunnelTransportTest, ConfigRemovedWhenBodyFails) {
    TunnelTransport transport(shell_, config_);
    EXPECT_FALSE(transport.withTunnel(entry_, members_, [](const TunnelConfig&) { return false; }));
    EXPECT_TRUE(tunnelDirEmpty());
}

TEST_F(TunnelTransportTest, ConfigRemovedOnInterrupt) {
    TunnelTransport transport(shell_, config_);
    EXPECT_THROW(transport.withTunnel(entry_, members_, [](const TunnelConfig&) -> bool {
        throw InterruptedError(SIGINT);
    }), InterruptedError);
    EXPECT_TRUE(tunnelDirEmpty());
}

TEST_F(TunnelTransportTest, FirstSuccessTransfersFromFirstApplicableMemberOnly) {
    TunnelTransport transport(shell_, config_);
    std::vector<std::string> probed;

    bool ok = transport.withTunnel(entry_, members_, [&](const TunnelConfig& tunnel) {
        auto applies = [&](const Node& member) {
            probed.push_back(member.hostname);
            return member.hostname == "node-b";
        };
        auto pull = [&](const Node& member) {
            return transport.transferOverTunnel(tunnel, member, TransferDirection::Pull,
                                                local_.path(), "/data/user/git-hooks");
        };
        return transport.firstSuccess(members_, applies, pull);
    });

    EXPECT_TRUE(ok);
    EXPECT_EQ(probed, (std::vector<std::string>{"node-a", "node-b"}));

    auto transfers = runner_->matching("rsync");
    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_NE(transfers[0].find("node-b:/data/user/git-hooks/"), std::string::npos);
    EXPECT_EQ(runner_->count("node-a:"), 0u);
    EXPECT_EQ(runner_->count("node-c:"), 0u);
}

TEST_F(TunnelTransportTest, FirstSuccessWithoutApplicableMemberIsNoOp) {
    TunnelTransport transport(shell_, config_);
    int actions = 0;

    bool ok = transport.firstSuccess(members_, [](const Node&) { return false; },
                                     [&](const Node&) { ++actions; return true; });

    EXPECT_TRUE(ok);
    EXPECT_EQ(actions, 0);
}

TEST_F(TunnelTransportTest, FirstSuccessDoesNotRetryFailedAction) {
    TunnelTransport transport(shell_, config_);
    std::vector<std::string> acted;

    bool ok = transport.firstSuccess(members_, [](const Node&) { return true; },
                                     [&](const Node& member) {
                                         acted.push_back(member.hostname);
                                         return false;
                                     });

    EXPECT_FALSE(ok);
    EXPECT_EQ(acted, std::vector<std::string>{"node-a"});
}

TEST_F(TunnelTransportTest, FanOutFailureOnOneMemberFailsOperation) {
    runner_->on("node-b:/data/user/storage", 23);
    TunnelTransport transport(shell_, config_);

    bool ok = transport.withTunnel(entry_, members_, [&](const TunnelConfig& tunnel) {
        return transport.fanOut(members_, [&](const Node& member) {
            return transport.transferOverTunnel(tunnel, member, TransferDirection::Push,
                                                local_.path(), "/data/user/storage");
        });
    });

    EXPECT_FALSE(ok);
    EXPECT_EQ(runner_->count("rsync"), 3u);
    EXPECT_EQ(runner_->count("node-a:/data/user/storage/"), 1u);
    EXPECT_EQ(runner_->count("node-c:/data/user/storage/"), 1u);
    EXPECT_NE(transport.getLastError().find("node-b"), std::string::npos);
    EXPECT_TRUE(tunnelDirEmpty());
}

TEST_F(TunnelTransportTest, ParallelFanOutReportsSameOutcome) {
    config_.parallelTransfers = true;
    runner_->on("node-b:/data/user/storage", 23);
    TunnelTransport transport(shell_, config_);

    bool ok = transport.withTunnel(entry_, members_, [&](const TunnelConfig& tunnel) {
        return transport.fanOut(members_, [&](const Node& member) {
            return transport.transferOverTunnel(tunnel, member, TransferDirection::Push,
                                                local_.path(), "/data/user/storage");
        });
    });

    EXPECT_FALSE(ok);
    EXPECT_EQ(runner_->count("rsync"), 3u);
    EXPECT_NE(transport.getLastError().find("node-b"), std::string::npos);
}

TEST_F(TunnelTransportTest, FanOutSucceedsWhenAllMembersSucceed) {
    TunnelTransport transport(shell_, config_);
    int visited = 0;
    EXPECT_TRUE(transport.fanOut(members_, [&](const Node&) { ++visited; return true; }));
    EXPECT_EQ(visited, 3);
}
