#include <gtest/gtest.h>

#include "sscope/role_classifier.hpp"

using sscope::RoleClassifier;
using sscope::RoleLayer;

namespace {

RoleLayer classify(const QStringList& roles) {
    static const RoleClassifier classifier;
    return classifier.classify(roles);
}

}  // namespace

TEST(RoleClassifier, EmptyRoleSetIsDiscoveredNode) {
    EXPECT_EQ(classify({}), RoleLayer::DiscoveredNode);
}

// Higher-priority roles win regardless of what else the instance does.
TEST(RoleClassifier, FirstMatchingRuleWins) {
    EXPECT_EQ(classify({"indexer", "license_master", "search_head"}), RoleLayer::StandaloneSearchHead);
    EXPECT_EQ(classify({"cluster_master", "license_master"}), RoleLayer::LicenseMaster);
    EXPECT_EQ(classify({"management_console", "search_head", "license_master"}), RoleLayer::ManagementConsole);
    EXPECT_EQ(classify({"shc_deployer", "deployment_server"}), RoleLayer::ShcDeployer);
}

TEST(RoleClassifier, ClusteredSearchHeadsAreNotStandalone) {
    EXPECT_EQ(classify({"search_head", "shc_member"}), RoleLayer::SearchHead);
    EXPECT_EQ(classify({"search_head", "cluster_search_head"}), RoleLayer::SearchHead);
    EXPECT_EQ(classify({"search_head"}), RoleLayer::StandaloneSearchHead);
}

TEST(RoleClassifier, IndexersAndForwarders) {
    EXPECT_EQ(classify({"indexer", "cluster_slave", "search_peer"}), RoleLayer::Indexer);
    EXPECT_EQ(classify({"cluster_master"}), RoleLayer::ClusterMaster);
    EXPECT_EQ(classify({"heavyweight_forwarder", "deployment_client"}), RoleLayer::HeavyForwarder);
    EXPECT_EQ(classify({"universal_forwarder", "deployment_client"}), RoleLayer::ManagedUniversalForwarder);
    EXPECT_EQ(classify({"universal_forwarder"}), RoleLayer::InputOnly);
    EXPECT_EQ(classify({"lightweight_forwarder"}), RoleLayer::InputOnly);
}

TEST(RoleClassifier, UnrecognisedRolesFallIntoOther) {
    EXPECT_EQ(classify({"kv_store"}), RoleLayer::Other);
    EXPECT_EQ(classify({"deployment_client"}), RoleLayer::Other);
}

// Same set, any order, any number of calls: same layer.
TEST(RoleClassifier, IsDeterministic) {
    const RoleClassifier classifier;
    const QStringList forward = {"indexer", "deployment_server", "search_peer"};
    const QStringList reversed = {"search_peer", "deployment_server", "indexer"};
    const RoleLayer first = classifier.classify(forward);
    EXPECT_EQ(first, RoleLayer::DeploymentServer);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(classifier.classify(forward), first);
        EXPECT_EQ(classifier.classify(reversed), first);
    }
}

TEST(RoleClassifier, LayerIdsRoundTrip) {
    const QVector<RoleLayer> layers = sscope::allRoleLayers();
    ASSERT_EQ(layers.size(), sscope::kRoleLayerCount);
    for (int i = 0; i < layers.size(); ++i) {
        EXPECT_EQ(static_cast<int>(layers.at(i)), i);
        RoleLayer parsed = RoleLayer::Other;
        ASSERT_TRUE(sscope::roleLayerFromId(sscope::roleLayerId(layers.at(i)), &parsed));
        EXPECT_EQ(parsed, layers.at(i));
    }
    RoleLayer untouched = RoleLayer::Indexer;
    EXPECT_FALSE(sscope::roleLayerFromId("no_such_layer", &untouched));
    EXPECT_EQ(untouched, RoleLayer::Indexer);
}
