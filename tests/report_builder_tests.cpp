#include <gtest/gtest.h>

#include "fake_instance_client.hpp"
#include "sscope/report_builder.hpp"

using sscope::Adjacency;
using sscope::ClientErrorKind;
using sscope::HealthEvaluator;
using sscope::HealthStatus;
using sscope::InstanceKey;
using sscope::InstanceReport;
using sscope::PeerReference;
using sscope::PollOutcome;
using sscope::ReportBuilder;
using sscope::ReportSection;
using sscope::fakes::FakeInstance;
using sscope::fakes::FakeInstanceClient;
using sscope::fakes::seed;
using sscope::fakes::server;

namespace {

FakeInstance indexer() {
    FakeInstance instance;
    instance.server = server("idx01");
    instance.roles = {"indexer", "cluster_slave", "search_peer"};
    instance.cluster.mode = "slave";
    instance.cluster.clusterMasterUris = {"https://cm01:8089"};
    instance.deployment.deploymentServerUri = "ds01:8089";
    sscope::DiskPartition root;
    root.mountPoint = "/";
    root.capacityMb = 100000.0;
    root.freeMb = 50000.0;
    sscope::DiskPartition hot;
    hot.mountPoint = "/opt/splunk/var";
    hot.capacityMb = 200000.0;
    hot.freeMb = 8192.0;
    instance.resources.partitions = {root, hot};
    instance.resources.cpuUsagePct = 35.0;
    instance.resources.memUsagePct = 91.0;
    instance.messages = {{"banner", "info", "Welcome", 0}, {"restart", "warn", "Restart required", 0}};
    return instance;
}

class ReportBuilderTest : public ::testing::Test {
protected:
    HealthEvaluator evaluator_{HealthEvaluator::defaultRules()};
    FakeInstanceClient client_;
};

}  // namespace

// A failed first call stops the poll: no fact calls follow.
TEST_F(ReportBuilderTest, FailedConnectMakesNoFurtherCalls) {
    FakeInstance down = indexer();
    down.reachable = false;
    down.connectError = ClientErrorKind::Auth;
    client_.setInstance(InstanceKey("idx01", 8089), down);

    const ReportBuilder builder(evaluator_);
    const InstanceReport report = builder.build(client_, seed("idx01"));

    EXPECT_EQ(report.outcome, PollOutcome::Failed);
    EXPECT_TRUE(report.errorDetail.contains("auth"));
    EXPECT_TRUE(report.roles.isEmpty());
    EXPECT_TRUE(report.adjacencies.isEmpty());
    EXPECT_TRUE(report.health.isEmpty());
    EXPECT_EQ(client_.calls(InstanceKey("idx01", 8089)).connect, 1);
    EXPECT_EQ(client_.calls(InstanceKey("idx01", 8089)).factCalls(), 0);
}

TEST_F(ReportBuilderTest, SuccessfulPollCollectsEverySection) {
    client_.setInstance(InstanceKey("idx01", 8089), indexer());

    const ReportBuilder builder(evaluator_);
    const InstanceReport report = builder.build(client_, seed("idx01"));

    EXPECT_EQ(report.outcome, PollOutcome::Success);
    EXPECT_TRUE(report.errorDetail.isEmpty());
    EXPECT_EQ(report.server.serverName, QString("idx01"));
    EXPECT_EQ(report.username, QString("admin"));
    EXPECT_EQ(report.deploymentServerUri, QString("ds01:8089"));
    EXPECT_EQ(report.clusterMasterUris, QStringList({"https://cm01:8089"}));
    EXPECT_TRUE(report.roles.contains("deployment_client"));
    EXPECT_EQ(report.roles, QStringList({"cluster_slave", "deployment_client", "indexer", "search_peer"}));

    ASSERT_EQ(report.adjacencies.size(), 2);
    EXPECT_EQ(report.adjacencies.at(0).target, InstanceKey("ds01", 8089));
    EXPECT_EQ(report.adjacencies.at(0).relation, QString("deployment client of"));
    EXPECT_EQ(report.adjacencies.at(1).target, InstanceKey("cm01", 8089));
    EXPECT_EQ(report.adjacencies.at(1).relation, QString("cluster member of"));

    const auto calls = client_.calls(InstanceKey("idx01", 8089));
    EXPECT_EQ(calls.factCalls(), 6);
}

TEST_F(ReportBuilderTest, HealthIsEvaluatedFromFacts) {
    client_.setInstance(InstanceKey("idx01", 8089), indexer());
    const InstanceReport report = ReportBuilder(evaluator_).build(client_, seed("idx01"));

    EXPECT_EQ(report.health.value("version").rawValue, QString("9.1.2"));
    EXPECT_EQ(report.health.value("version").status, HealthStatus::Normal);
    EXPECT_EQ(report.health.value("mem_usage_pct").rawValue, QString("91.0"));
    EXPECT_EQ(report.health.value("mem_usage_pct").status, HealthStatus::Warning);
    EXPECT_EQ(report.health.value("cpu_usage_pct").status, HealthStatus::Normal);
    EXPECT_EQ(report.health.value("swap_usage_pct").status, HealthStatus::Unknown);
    EXPECT_EQ(report.health.value("disk_usage_pct").rawValue, QString("95.9"));
    EXPECT_EQ(report.health.value("disk_usage_pct").status, HealthStatus::Warning);
    EXPECT_EQ(report.health.value("disk_free_gb").rawValue, QString("8.00"));
    EXPECT_EQ(report.health.value("disk_free_gb").status, HealthStatus::Caution);
    EXPECT_EQ(report.health.value("messages").rawValue, QString("1"));
    EXPECT_EQ(report.health.value("messages").status, HealthStatus::Caution);
    EXPECT_FALSE(report.health.contains("cluster_maintenance"));
    EXPECT_FALSE(report.health.contains("shc_members_not_up"));
}

// One failed section downgrades the report; the rest is still gathered.
TEST_F(ReportBuilderTest, FailedSectionGivesPartial) {
    FakeInstance instance = indexer();
    instance.failingSections = {ReportSection::Resources};
    client_.setInstance(InstanceKey("idx01", 8089), instance);

    const InstanceReport report = ReportBuilder(evaluator_).build(client_, seed("idx01"));

    EXPECT_EQ(report.outcome, PollOutcome::Partial);
    EXPECT_TRUE(report.errorDetail.contains("resources"));
    EXPECT_TRUE(report.sectionErrors.contains(ReportSection::Resources));
    EXPECT_FALSE(report.isSectionAvailable(ReportSection::Resources));
    EXPECT_TRUE(report.isSectionAvailable(ReportSection::Roles));
    EXPECT_EQ(report.roles.size(), 4);
    EXPECT_EQ(report.adjacencies.size(), 2);
    EXPECT_EQ(report.health.value("disk_usage_pct").status, HealthStatus::Unknown);
    EXPECT_EQ(report.health.value("cpu_usage_pct").status, HealthStatus::Unknown);
    EXPECT_EQ(client_.calls(InstanceKey("idx01", 8089)).factCalls(), 6);
}

TEST_F(ReportBuilderTest, ClusterMasterGetsClusterHealth) {
    FakeInstance master;
    master.server = server("cm01");
    master.roles = {"cluster_master"};
    master.cluster.mode = "master";
    master.cluster.maintenanceMode = false;
    master.cluster.allDataSearchable = false;
    master.cluster.peerCount = 3;
    master.cluster.peersSearchable = 2;
    client_.setInstance(InstanceKey("cm01", 8089), master);

    const InstanceReport report = ReportBuilder(evaluator_).build(client_, seed("cm01"));

    EXPECT_EQ(report.health.value("cluster_maintenance").status, HealthStatus::Normal);
    EXPECT_EQ(report.health.value("cluster_all_data_searchable").status, HealthStatus::Warning);
    EXPECT_EQ(report.health.value("cluster_peers_not_searchable").rawValue, QString("1"));
    EXPECT_EQ(report.health.value("cluster_peers_not_searchable").status, HealthStatus::Warning);
    EXPECT_EQ(report.health.value("cluster_rolling_restart").status, HealthStatus::Unknown);
}

// Counts the master never answered stay Unknown instead of reading as zero.
TEST_F(ReportBuilderTest, MissingClusterCountsAreUnknown) {
    FakeInstance master;
    master.server = server("cm01");
    master.roles = {"cluster_master"};
    master.cluster.mode = "master";
    master.cluster.searchHeadCount = 2;
    master.cluster.searchHeadsConnected = 2;
    client_.setInstance(InstanceKey("cm01", 8089), master);

    const InstanceReport report = ReportBuilder(evaluator_).build(client_, seed("cm01"));

    EXPECT_EQ(report.outcome, PollOutcome::Success);
    EXPECT_TRUE(report.health.value("cluster_peers_not_searchable").rawValue.isEmpty());
    EXPECT_EQ(report.health.value("cluster_peers_not_searchable").status, HealthStatus::Unknown);
    EXPECT_EQ(report.health.value("cluster_search_heads_not_connected").rawValue, QString("0"));
    EXPECT_EQ(report.health.value("cluster_search_heads_not_connected").status, HealthStatus::Normal);
}

TEST_F(ReportBuilderTest, WebWithoutSslIsCaution) {
    FakeInstance instance = indexer();
    instance.server.webSslEnabled = false;
    client_.setInstance(InstanceKey("idx01", 8089), instance);
    client_.setInstance(InstanceKey("idx02", 8089), indexer());

    const InstanceReport plain = ReportBuilder(evaluator_).build(client_, seed("idx01"));
    EXPECT_EQ(plain.health.value("http_ssl").rawValue, QString("false"));
    EXPECT_EQ(plain.health.value("http_ssl").status, HealthStatus::Caution);

    const InstanceReport secured = ReportBuilder(evaluator_).build(client_, seed("idx02"));
    EXPECT_EQ(secured.health.value("http_ssl").status, HealthStatus::Normal);
}

// An unanswered server/settings read leaves the instance partial.
TEST_F(ReportBuilderTest, SettingsFailureGivesPartial) {
    FakeInstance instance = indexer();
    instance.failingSections = {ReportSection::Settings};
    client_.setInstance(InstanceKey("idx01", 8089), instance);

    const InstanceReport report = ReportBuilder(evaluator_).build(client_, seed("idx01"));

    EXPECT_EQ(report.outcome, PollOutcome::Partial);
    EXPECT_TRUE(report.sectionErrors.contains(ReportSection::Settings));
    EXPECT_TRUE(report.errorDetail.contains("settings"));
    EXPECT_EQ(report.health.value("http_ssl").status, HealthStatus::Unknown);
    EXPECT_EQ(report.roles.size(), 4);
    EXPECT_EQ(client_.calls(InstanceKey("idx01", 8089)).factCalls(), 6);
}

TEST_F(ReportBuilderTest, ConfiguredManagementConsoleGainsRole) {
    FakeInstance console;
    console.server = server("mc01");
    console.roles = {"search_head"};
    client_.setInstance(InstanceKey("mc01", 8089), console);

    const ReportBuilder builder(evaluator_, {InstanceKey("mc01", 8089)});
    const InstanceReport report = builder.build(client_, seed("mc01"));
    EXPECT_TRUE(report.roles.contains("management_console"));
}

TEST(ReportBuilderNormalize, DropsSelfInvalidAndDuplicateReferences) {
    const InstanceKey self("sh01", 8089);
    const QVector<PeerReference> peers = {
        {"https://idx01:8089", "distributed search peer"},
        {"idx01:8089", "distributed search peer"},
        {"idx01:8089", "cluster search head"},
        {"sh01:8089", "shc member"},
        {"", "shc member"},
        {"host:notaport", "shc member"},
    };
    const QVector<Adjacency> out =
        ReportBuilder::normalizeAdjacencies(self, "https://sh01:8089", {}, "https://deployer:8089", peers);
    ASSERT_EQ(out.size(), 3);
    EXPECT_EQ(out.at(0).target, InstanceKey("deployer", 8089));
    EXPECT_EQ(out.at(0).relation, QString("shc deployer client of"));
    EXPECT_EQ(out.at(1).target, InstanceKey("idx01", 8089));
    EXPECT_EQ(out.at(1).relation, QString("distributed search peer"));
    EXPECT_EQ(out.at(2).relation, QString("cluster search head"));
}
