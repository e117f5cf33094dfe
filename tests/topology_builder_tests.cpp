#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "fake_instance_client.hpp"
#include "sscope/discovery_orchestrator.hpp"
#include "sscope/seed_list.hpp"
#include "sscope/tool_config.hpp"
#include "sscope/topology_builder.hpp"

using sscope::Adjacency;
using sscope::CancellationToken;
using sscope::DiscoveredNode;
using sscope::DiscoveryOrchestrator;
using sscope::DiscoveryResult;
using sscope::HealthEvaluator;
using sscope::InstanceKey;
using sscope::InstanceReport;
using sscope::PollOutcome;
using sscope::ReportBuilder;
using sscope::RoleClassifier;
using sscope::RoleLayer;
using sscope::SeedList;
using sscope::TopologyBuilder;
using sscope::TopologyGraph;
using sscope::TopologyStyle;
using sscope::fakes::FakeInstance;
using sscope::fakes::FakeInstanceClient;
using sscope::fakes::server;

namespace {

InstanceReport report(const QString& address, const QStringList& roles, const QVector<Adjacency>& adjacencies) {
    InstanceReport out;
    out.key = InstanceKey(address, 8089);
    out.server = server(address);
    out.roles = roles;
    out.adjacencies = adjacencies;
    out.outcome = PollOutcome::Success;
    return out;
}

Adjacency adjacency(const QString& address, const QString& relation) {
    return Adjacency{InstanceKey(address, 8089), relation};
}

}  // namespace

// A↔B reported from both sides is one edge carrying both relations.
TEST(TopologyBuilder, EdgesAreDeduplicatedInEitherDirection) {
    DiscoveryResult result;
    result.reports = {
        report("sh01", {"search_head", "shc_member"}, {adjacency("idx01", "distributed search peer")}),
        report("idx01", {"indexer"}, {adjacency("sh01", "cluster search head"), adjacency("sh01", "cluster search head")}),
    };

    const RoleClassifier classifier;
    const TopologyGraph graph = TopologyBuilder(classifier).build(result);

    ASSERT_EQ(graph.nodes.size(), 2);
    ASSERT_EQ(graph.edges.size(), 1);
    const sscope::TopologyEdge* edge = graph.edgeBetween(InstanceKey("idx01", 8089), InstanceKey("sh01", 8089));
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->from, InstanceKey("sh01", 8089));
    EXPECT_EQ(edge->primaryRelation(), QString("distributed search peer"));
    EXPECT_EQ(edge->relations, QStringList({"distributed search peer", "cluster search head"}));
}

TEST(TopologyBuilder, GroupsNodesByLayerInAddressOrder) {
    DiscoveryResult result;
    result.reports = {
        report("idx02", {"indexer"}, {}),
        report("cm01", {"cluster_master"}, {}),
        report("idx01", {"indexer", "search_peer"}, {}),
    };
    InstanceReport failed = report("uf01", {}, {});
    failed.outcome = PollOutcome::Failed;
    failed.errorDetail = "connect error: connection refused";
    result.reports.append(failed);
    result.discovered = {DiscoveredNode{InstanceKey("ds01", 8089), InstanceKey("uf01", 8089), "deployment client of"}};

    const RoleClassifier classifier;
    const TopologyGraph graph = TopologyBuilder(classifier).build(result);

    ASSERT_EQ(graph.nodes.size(), 5);
    ASSERT_TRUE(graph.layers.contains(RoleLayer::Indexer));
    const QVector<int> indexers = graph.layers.value(RoleLayer::Indexer);
    ASSERT_EQ(indexers.size(), 2);
    EXPECT_EQ(graph.nodes.at(indexers.at(0)).key, InstanceKey("idx01", 8089));
    EXPECT_EQ(graph.nodes.at(indexers.at(1)).key, InstanceKey("idx02", 8089));
    EXPECT_EQ(graph.node(InstanceKey("cm01", 8089))->layer, RoleLayer::ClusterMaster);

    const sscope::TopologyNode* placeholder = graph.node(InstanceKey("ds01", 8089));
    ASSERT_NE(placeholder, nullptr);
    EXPECT_FALSE(placeholder->polled);
    EXPECT_EQ(placeholder->layer, RoleLayer::DiscoveredNode);
    EXPECT_EQ(placeholder->stateName(), QString("unvisited"));

    const sscope::TopologyNode* down = graph.node(InstanceKey("uf01", 8089));
    ASSERT_NE(down, nullptr);
    EXPECT_TRUE(down->polled);
    EXPECT_EQ(down->stateName(), QString("failed"));

    // Layer map iterates topmost first.
    EXPECT_EQ(graph.layers.firstKey(), RoleLayer::ClusterMaster);
    EXPECT_EQ(graph.layers.lastKey(), RoleLayer::DiscoveredNode);
}

TEST(TopologyBuilder, DotMarksStatesAndOrdersLayers) {
    DiscoveryResult result;
    InstanceReport partial = report("sh01", {"search_head"}, {adjacency("idx09", "distributed search peer")});
    partial.outcome = PollOutcome::Partial;
    partial.errorDetail = "messages: fetch error: HTTP 500";
    result.reports = {partial};
    result.discovered = {DiscoveredNode{InstanceKey("idx09", 8089), partial.key, "distributed search peer"}};

    const RoleClassifier classifier;
    const TopologyGraph graph = TopologyBuilder(classifier).build(result);
    TopologyStyle style = sscope::ToolConfig::defaults().topologyStyle();
    style.layerLabels.insert(RoleLayer::StandaloneSearchHead, "Ad-hoc \"SH\"");
    const QString dot = TopologyBuilder::toDot(graph, style);

    EXPECT_TRUE(dot.startsWith("digraph SplunkTopology {"));
    EXPECT_TRUE(dot.contains("rankdir=TB;"));
    EXPECT_TRUE(dot.contains("subgraph \"layer_standalone_search_head\""));
    EXPECT_TRUE(dot.contains("label=\"Ad-hoc \\\"SH\\\"\""));
    EXPECT_TRUE(dot.contains("(unvisited)"));
    EXPECT_TRUE(dot.contains("rounded,dashed,filled"));
    EXPECT_TRUE(dot.contains("penwidth=2"));
    EXPECT_TRUE(dot.contains("tooltip=\"messages: fetch error: HTTP 500\""));
    EXPECT_TRUE(dot.contains("\"label_standalone_search_head\" -> \"label_discovered_node\" [style=invis];"));
    EXPECT_TRUE(dot.contains("\"sh01:8089\" -> \"idx09:8089\" [label=\"distributed search peer\"];"));
    EXPECT_TRUE(dot.trimmed().endsWith("}"));
}

TEST(TopologyBuilder, ExportRejectsUnknownFormat) {
    const QJsonObject status = TopologyBuilder::exportImage(TopologyGraph{}, TopologyStyle{}, "out.bmp", "bmp");
    EXPECT_FALSE(status.value("success").toBool());
    EXPECT_TRUE(status.value("error").toString().contains("bmp"));
}

TEST(TopologyBuilder, ExportReportsMissingRenderer) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QJsonObject status = TopologyBuilder::exportImage(
        TopologyGraph{},
        TopologyStyle{},
        dir.filePath("topology.png"),
        "png",
        dir.filePath("no-such-dot"));
    EXPECT_FALSE(status.value("success").toBool());
    EXPECT_FALSE(status.value("error").toString().isEmpty());
}

// Seed list of two; the first instance points at the second and at an unlisted third.
TEST(DiscoveryEndToEnd, TwoSeedsThreeNodes) {
    const auto seeds = SeedList::parse(
        "address,port,username,password\n"
        "sh01,8089,admin,pw\n"
        "idx01,8089,admin,pw\n",
        {"admin", "", 8089});
    ASSERT_TRUE(seeds.success());

    FakeInstanceClient client;
    FakeInstance searchHead;
    searchHead.server = server("sh01");
    searchHead.roles = {"search_head"};
    searchHead.peers = {{"https://idx01:8089", "distributed search peer"}, {"idx03:8089", "distributed search peer"}};
    client.setInstance(InstanceKey("sh01", 8089), searchHead);
    FakeInstance indexer;
    indexer.server = server("idx01");
    indexer.roles = {"indexer", "search_peer"};
    client.setInstance(InstanceKey("idx01", 8089), indexer);

    const HealthEvaluator evaluator(HealthEvaluator::defaultRules());
    const ReportBuilder builder(evaluator);
    const CancellationToken token;
    const DiscoveryResult result = DiscoveryOrchestrator(client, builder).run(seeds.seeds, token);

    const RoleClassifier classifier;
    const TopologyGraph graph = TopologyBuilder(classifier).build(result);

    EXPECT_EQ(result.reports.size(), 2);
    EXPECT_EQ(result.discovered.size(), 1);
    ASSERT_EQ(graph.nodes.size(), 3);
    EXPECT_GE(graph.edges.size(), 2);

    const sscope::TopologyNode* third = graph.node(InstanceKey("idx03", 8089));
    ASSERT_NE(third, nullptr);
    EXPECT_FALSE(third->polled);
    EXPECT_TRUE(third->roles.isEmpty());
    EXPECT_EQ(third->layer, RoleLayer::DiscoveredNode);
    EXPECT_EQ(result.report(InstanceKey("idx03", 8089)), nullptr);
    EXPECT_EQ(client.calls(InstanceKey("idx03", 8089)).connect, 0);

    EXPECT_EQ(graph.node(InstanceKey("sh01", 8089))->layer, RoleLayer::StandaloneSearchHead);
    EXPECT_EQ(graph.node(InstanceKey("idx01", 8089))->layer, RoleLayer::Indexer);
}
