#include <gtest/gtest.h>
#include "restore/datastore_dispatcher.hpp"

namespace {

std::vector<std::string> stepNames(const std::vector<DatastoreStep>& steps) {
    std::vector<std::string> names;
    for (const auto& step : steps) {
        names.push_back(step.name);
    }
    return names;
}

} // namespace

class DatastoreDispatcherTest : public ::testing::Test {
protected:
    RestoreSession session(bool cluster, const std::string& tag) {
        RestoreSession result;
        result.isCluster = cluster;
        result.snapshot.id = "20240101T000000";
        result.snapshot.strategy = tag;
        EXPECT_TRUE(dispatcher_.resolveStrategy(result));
        return result;
    }

    DatastoreDispatcher dispatcher_;
};

TEST_F(DatastoreDispatcherTest, StrategyComesFromSnapshot) {
    RestoreSession result;
    result.snapshot.strategy = "tarball";
    ASSERT_TRUE(dispatcher_.resolveStrategy(result));
    EXPECT_EQ(result.strategy, BackupStrategy::Tarball);
}

TEST_F(DatastoreDispatcherTest, UnknownStrategyIsRejected) {
    RestoreSession result;
    result.snapshot.strategy = "zfs";
    EXPECT_FALSE(dispatcher_.resolveStrategy(result));
    EXPECT_NE(dispatcher_.getLastError().find("zfs"), std::string::npos);

    result.snapshot.strategy = "";
    EXPECT_FALSE(dispatcher_.resolveStrategy(result));
}

TEST_F(DatastoreDispatcherTest, ClusterTopologyTakesPrecedenceOverStrategy) {
    for (const char* tag : {"rsync", "tarball", "cluster"}) {
        RestoreSession s = session(true, tag);
        EXPECT_EQ(dispatcher_.routineFor(Datastore::Repositories, s), Routine::ClusterFanOut) << tag;
        EXPECT_EQ(dispatcher_.routineFor(Datastore::Storage, s), Routine::ClusterFanOut) << tag;
        EXPECT_EQ(dispatcher_.routineFor(Datastore::SearchIndices, s), Routine::ClusterReindex) << tag;
        EXPECT_FALSE(dispatcher_.routineFor(Datastore::Assets, s)) << tag;
        EXPECT_FALSE(dispatcher_.routineFor(Datastore::Hookshot, s)) << tag;
        EXPECT_FALSE(dispatcher_.routineFor(Datastore::SshHostKeys, s)) << tag;
    }
}

TEST_F(DatastoreDispatcherTest, StandaloneRoutinesFollowStrategy) {
    RestoreSession rsync = session(false, "rsync");
    EXPECT_EQ(dispatcher_.routineFor(Datastore::Repositories, rsync), Routine::RsyncPush);
    EXPECT_EQ(dispatcher_.routineFor(Datastore::SearchIndices, rsync), Routine::RsyncPush);
    EXPECT_EQ(dispatcher_.routineFor(Datastore::Mysql, rsync), Routine::ImportDump);

    RestoreSession tarball = session(false, "tarball");
    EXPECT_EQ(dispatcher_.routineFor(Datastore::Repositories, tarball), Routine::TarballImport);
    EXPECT_EQ(dispatcher_.routineFor(Datastore::SearchIndices, tarball), Routine::TarballImport);
    EXPECT_EQ(dispatcher_.routineFor(Datastore::Pages, tarball), Routine::RsyncPush);
}

TEST_F(DatastoreDispatcherTest, StandalonePlanOrder) {
    RestoreSession s = session(false, "rsync");
    s.restoreSettings = true;

    EXPECT_EQ(stepNames(dispatcher_.plan(s)),
              (std::vector<std::string>{"settings", "mysql", "redis", "authorized-keys",
                                        "repositories", "pages", "assets", "storage",
                                        "hookshot", "git-hooks", "search-indices"}));

    auto final = dispatcher_.finalStep(s);
    ASSERT_TRUE(final);
    EXPECT_EQ(final->name, "ssh-host-keys");
}

TEST_F(DatastoreDispatcherTest, ClusterPlanSkipsPerApplianceSteps) {
    RestoreSession s = session(true, "cluster");

    EXPECT_EQ(stepNames(dispatcher_.plan(s)),
              (std::vector<std::string>{"mysql", "redis", "authorized-keys", "repositories",
                                        "pages", "storage", "git-hooks", "search-indices"}));
    EXPECT_FALSE(dispatcher_.finalStep(s));
}

TEST_F(DatastoreDispatcherTest, EveryStepCarriesRationale) {
    RestoreSession s = session(false, "rsync");
    s.restoreSettings = true;
    for (const auto& step : dispatcher_.plan(s)) {
        EXPECT_FALSE(step.rationale.empty()) << step.name;
    }
}
