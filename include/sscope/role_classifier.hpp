#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

namespace sscope {

// Topology tier, topmost first. Used only to order layout rows.
enum class RoleLayer {
    ManagementConsole = 0,
    ShcDeployer = 1,
    StandaloneSearchHead = 2,
    LicenseMaster = 3,
    DeploymentServer = 4,
    SearchHead = 5,
    ClusterMaster = 6,
    Indexer = 7,
    HeavyForwarder = 8,
    ManagedUniversalForwarder = 9,
    InputOnly = 10,
    Other = 11,
    DiscoveredNode = 12,
};

constexpr int kRoleLayerCount = 13;

QString roleLayerId(RoleLayer layer);
QString roleLayerLabel(RoleLayer layer);
// Returns false and leaves *out untouched for unknown ids.
bool roleLayerFromId(const QString& id, RoleLayer* out);
QVector<RoleLayer> allRoleLayers();

namespace roles {
inline const QString kManagementConsole = QStringLiteral("management_console");
inline const QString kShcDeployer = QStringLiteral("shc_deployer");
inline const QString kShcMember = QStringLiteral("shc_member");
inline const QString kShcCaptain = QStringLiteral("shc_captain");
inline const QString kSearchHead = QStringLiteral("search_head");
inline const QString kClusterSearchHead = QStringLiteral("cluster_search_head");
inline const QString kLicenseMaster = QStringLiteral("license_master");
inline const QString kDeploymentServer = QStringLiteral("deployment_server");
inline const QString kDeploymentClient = QStringLiteral("deployment_client");
inline const QString kClusterMaster = QStringLiteral("cluster_master");
inline const QString kIndexer = QStringLiteral("indexer");
inline const QString kClusterSlave = QStringLiteral("cluster_slave");
inline const QString kSearchPeer = QStringLiteral("search_peer");
inline const QString kHeavyForwarder = QStringLiteral("heavyweight_forwarder");
inline const QString kUniversalForwarder = QStringLiteral("universal_forwarder");
inline const QString kLightweightForwarder = QStringLiteral("lightweight_forwarder");
}  // namespace roles

// Maps a role set to the single layer of the first matching rule in a fixed
// priority list. Pure: the result depends on the role set only.
class RoleClassifier {
public:
    using Predicate = std::function<bool(const QSet<QString>&)>;

    struct Rule {
        QString name;
        Predicate matches;
        RoleLayer layer;
    };

    RoleClassifier();

    [[nodiscard]] RoleLayer classify(const QSet<QString>& roleSet) const;
    [[nodiscard]] RoleLayer classify(const QStringList& roleList) const;
    [[nodiscard]] const QVector<Rule>& rules() const { return rules_; }

private:
    QVector<Rule> rules_;
};

}  // namespace sscope
