#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include "sscope/health_evaluator.hpp"
#include "sscope/instance_client.hpp"
#include "sscope/instance_key.hpp"

namespace sscope {

enum class PollOutcome {
    Success,
    Partial,
    Failed,
};

QString pollOutcomeName(PollOutcome outcome);

enum class ReportSection {
    Roles,
    Adjacencies,
    Deployment,
    Cluster,
    Resources,
    Messages,
    Settings,
};

QString reportSectionName(ReportSection section);

namespace relations {
inline const QString kDeploymentClientOf = QStringLiteral("deployment client of");
inline const QString kClusterMemberOf = QStringLiteral("cluster member of");
inline const QString kShcDeployerClientOf = QStringLiteral("shc deployer client of");
inline const QString kDistributedSearchPeer = QStringLiteral("distributed search peer");
inline const QString kClusterPeer = QStringLiteral("cluster peer");
inline const QString kClusterSearchHead = QStringLiteral("cluster search head");
inline const QString kShcMember = QStringLiteral("shc member");
}  // namespace relations

struct Adjacency {
    InstanceKey target;
    QString relation;
};

struct HealthReading {
    QString rawValue;
    HealthStatus status = HealthStatus::Unknown;
};

// Everything learned about one polled instance during a run. Built once by
// ReportBuilder and not modified afterwards.
struct InstanceReport {
    InstanceKey key;
    QString username;
    ServerInfo server;
    QStringList roles;
    QString deploymentServerUri;
    QStringList clusterMasterUris;
    QString shcDeployerUri;
    QVector<Adjacency> adjacencies;
    QMap<QString, HealthReading> health;
    ClusterInfo cluster;
    ResourceUsage resources;
    QVector<InstanceMessage> messages;

    PollOutcome outcome = PollOutcome::Failed;
    QString errorDetail;
    QMap<ReportSection, QString> sectionErrors;
    QString polledAtUtc;
    qint64 durationMs = 0;

    [[nodiscard]] bool isSectionAvailable(ReportSection section) const {
        return outcome != PollOutcome::Failed && !sectionErrors.contains(section);
    }
    [[nodiscard]] QString displayName() const;
    [[nodiscard]] QJsonObject toJson() const;
};

// Key referenced by an adjacency but never polled in this run.
struct DiscoveredNode {
    InstanceKey key;
    InstanceKey firstSeenFrom;
    QString relation;

    [[nodiscard]] QJsonObject toJson() const;
};

}  // namespace sscope
