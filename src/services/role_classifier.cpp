#include "sscope/role_classifier.hpp"

#include <initializer_list>

namespace sscope {

namespace {

struct LayerName {
    RoleLayer layer;
    const char* id;
    const char* label;
};

const LayerName kLayerNames[] = {
    {RoleLayer::ManagementConsole, "management_console", "Management Console"},
    {RoleLayer::ShcDeployer, "shc_deployer", "SHC Deployer"},
    {RoleLayer::StandaloneSearchHead, "standalone_search_head", "Standalone Search Head"},
    {RoleLayer::LicenseMaster, "license_master", "License Master"},
    {RoleLayer::DeploymentServer, "deployment_server", "Deployment Server"},
    {RoleLayer::SearchHead, "search_head", "Search Head"},
    {RoleLayer::ClusterMaster, "cluster_master", "Cluster Master"},
    {RoleLayer::Indexer, "indexer", "Indexer"},
    {RoleLayer::HeavyForwarder, "heavy_forwarder", "Heavy Forwarder"},
    {RoleLayer::ManagedUniversalForwarder, "managed_universal_forwarder", "Managed Universal Forwarder"},
    {RoleLayer::InputOnly, "input_only", "Input Only"},
    {RoleLayer::Other, "other", "Other"},
    {RoleLayer::DiscoveredNode, "discovered_node", "Discovered Node"},
};

bool hasAny(const QSet<QString>& roleSet, std::initializer_list<QString> wanted) {
    for (const QString& role : wanted) {
        if (roleSet.contains(role)) {
            return true;
        }
    }
    return false;
}

bool isForwarder(const QSet<QString>& roleSet) {
    return hasAny(roleSet, {roles::kUniversalForwarder, roles::kLightweightForwarder});
}

}  // namespace

QString roleLayerId(RoleLayer layer) {
    for (const LayerName& entry : kLayerNames) {
        if (entry.layer == layer) {
            return QString::fromLatin1(entry.id);
        }
    }
    return QStringLiteral("other");
}

QString roleLayerLabel(RoleLayer layer) {
    for (const LayerName& entry : kLayerNames) {
        if (entry.layer == layer) {
            return QString::fromLatin1(entry.label);
        }
    }
    return QStringLiteral("Other");
}

bool roleLayerFromId(const QString& id, RoleLayer* out) {
    const QString wanted = id.trimmed().toLower();
    for (const LayerName& entry : kLayerNames) {
        if (wanted == QLatin1String(entry.id)) {
            *out = entry.layer;
            return true;
        }
    }
    return false;
}

QVector<RoleLayer> allRoleLayers() {
    QVector<RoleLayer> out;
    out.reserve(kRoleLayerCount);
    for (const LayerName& entry : kLayerNames) {
        out.append(entry.layer);
    }
    return out;
}

RoleClassifier::RoleClassifier() {
    rules_ = {
        {"management_console",
         [](const QSet<QString>& r) { return r.contains(roles::kManagementConsole); },
         RoleLayer::ManagementConsole},
        {"shc_deployer",
         [](const QSet<QString>& r) { return r.contains(roles::kShcDeployer); },
         RoleLayer::ShcDeployer},
        {"standalone_search_head",
         [](const QSet<QString>& r) {
             return r.contains(roles::kSearchHead)
                 && !hasAny(r, {roles::kShcMember, roles::kShcCaptain, roles::kClusterSearchHead});
         },
         RoleLayer::StandaloneSearchHead},
        {"license_master",
         [](const QSet<QString>& r) { return r.contains(roles::kLicenseMaster); },
         RoleLayer::LicenseMaster},
        {"deployment_server",
         [](const QSet<QString>& r) { return r.contains(roles::kDeploymentServer); },
         RoleLayer::DeploymentServer},
        {"search_head",
         [](const QSet<QString>& r) {
             return hasAny(
                 r,
                 {roles::kSearchHead, roles::kShcMember, roles::kShcCaptain, roles::kClusterSearchHead});
         },
         RoleLayer::SearchHead},
        {"cluster_master",
         [](const QSet<QString>& r) { return r.contains(roles::kClusterMaster); },
         RoleLayer::ClusterMaster},
        {"indexer",
         [](const QSet<QString>& r) {
             return hasAny(r, {roles::kIndexer, roles::kClusterSlave, roles::kSearchPeer});
         },
         RoleLayer::Indexer},
        {"heavy_forwarder",
         [](const QSet<QString>& r) { return r.contains(roles::kHeavyForwarder); },
         RoleLayer::HeavyForwarder},
        {"managed_universal_forwarder",
         [](const QSet<QString>& r) { return isForwarder(r) && r.contains(roles::kDeploymentClient); },
         RoleLayer::ManagedUniversalForwarder},
        {"input_only",
         [](const QSet<QString>& r) { return isForwarder(r); },
         RoleLayer::InputOnly},
        {"other",
         [](const QSet<QString>& r) { return !r.isEmpty(); },
         RoleLayer::Other},
    };
}

RoleLayer RoleClassifier::classify(const QSet<QString>& roleSet) const {
    if (roleSet.isEmpty()) {
        return RoleLayer::DiscoveredNode;
    }
    for (const Rule& rule : rules_) {
        if (rule.matches(roleSet)) {
            return rule.layer;
        }
    }
    return RoleLayer::Other;
}

RoleLayer RoleClassifier::classify(const QStringList& roleList) const {
    return classify(QSet<QString>(roleList.cbegin(), roleList.cend()));
}

}  // namespace sscope
