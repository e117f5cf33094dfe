#include "sscope/report_builder.hpp"

#include <QDateTime>
#include <QElapsedTimer>

#include <algorithm>
#include <utility>

#include "sscope/role_classifier.hpp"

namespace sscope {

namespace {

QString boolRaw(const std::optional<bool>& value) {
    if (!value.has_value()) {
        return {};
    }
    return *value ? "true" : "false";
}

// Unknown unless both counts were read.
QString shortfallRaw(const std::optional<int>& total, const std::optional<int>& healthy) {
    if (!total.has_value() || !healthy.has_value()) {
        return {};
    }
    return QString::number(qMax(0, *total - *healthy));
}

QString percentRaw(const std::optional<double>& value) {
    return value.has_value() ? QString::number(*value, 'f', 1) : QString();
}

QString describeFailure(ClientErrorKind kind, const QString& message) {
    return QString("%1 error: %2").arg(clientErrorKindName(kind), message);
}

void appendAdjacency(
    QVector<Adjacency>* out,
    const InstanceKey& self,
    const QString& uri,
    const QString& relation) {
    const InstanceKey target = InstanceKey::fromUri(uri);
    if (!target.isValid() || target == self) {
        return;
    }
    const bool duplicate = std::any_of(out->cbegin(), out->cend(), [&](const Adjacency& existing) {
        return existing.target == target && existing.relation == relation;
    });
    if (!duplicate) {
        out->append(Adjacency{target, relation});
    }
}

}  // namespace

ReportBuilder::ReportBuilder(
    const HealthEvaluator& evaluator,
    QSet<InstanceKey> managementConsoles,
    int timeoutMs)
    : evaluator_(evaluator),
      managementConsoles_(std::move(managementConsoles)),
      timeoutMs_(timeoutMs) {}

QVector<Adjacency> ReportBuilder::normalizeAdjacencies(
    const InstanceKey& self,
    const QString& deploymentServerUri,
    const QStringList& clusterMasterUris,
    const QString& shcDeployerUri,
    const QVector<PeerReference>& peers) {
    QVector<Adjacency> out;
    if (!deploymentServerUri.isEmpty()) {
        appendAdjacency(&out, self, deploymentServerUri, relations::kDeploymentClientOf);
    }
    for (const QString& uri : clusterMasterUris) {
        appendAdjacency(&out, self, uri, relations::kClusterMemberOf);
    }
    if (!shcDeployerUri.isEmpty()) {
        appendAdjacency(&out, self, shcDeployerUri, relations::kShcDeployerClientOf);
    }
    for (const PeerReference& peer : peers) {
        appendAdjacency(&out, self, peer.uri, peer.relation);
    }
    return out;
}

InstanceReport ReportBuilder::build(InstanceClient& client, const SeedEntry& seed) const {
    QElapsedTimer timer;
    timer.start();

    InstanceReport report;
    report.key = seed.key;
    report.username = seed.username;
    report.polledAtUtc = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

    const ClientResult<SessionHandle> session =
        client.connect(seed.key, seed.username, seed.password, timeoutMs_);
    if (!session.success()) {
        report.outcome = PollOutcome::Failed;
        report.errorDetail = describeFailure(session.error, session.message);
        report.durationMs = timer.elapsed();
        return report;
    }

    const SessionHandle& handle = *session.value;
    report.server = handle.server;

    const auto markUnavailable = [&report](ReportSection section, ClientErrorKind kind, const QString& message) {
        report.sectionErrors.insert(section, describeFailure(kind, message));
    };
    if (handle.settingsError != ClientErrorKind::None) {
        markUnavailable(ReportSection::Settings, handle.settingsError, handle.settingsMessage);
    }

    QSet<QString> roleSet;
    const ClientResult<QStringList> roles = client.getRoles(handle);
    if (roles.success()) {
        roleSet = QSet<QString>(roles.value->cbegin(), roles.value->cend());
    } else {
        markUnavailable(ReportSection::Roles, roles.error, roles.message);
    }

    QVector<PeerReference> peers;
    const ClientResult<QVector<PeerReference>> adjacencies = client.getAdjacencies(handle);
    if (adjacencies.success()) {
        peers = *adjacencies.value;
    } else {
        markUnavailable(ReportSection::Adjacencies, adjacencies.error, adjacencies.message);
    }

    const ClientResult<DeploymentInfo> deployment = client.getDeploymentInfo(handle);
    if (deployment.success()) {
        if (!deployment.value->clientDisabled) {
            report.deploymentServerUri = deployment.value->deploymentServerUri.trimmed();
        }
    } else {
        markUnavailable(ReportSection::Deployment, deployment.error, deployment.message);
    }

    const ClientResult<ClusterInfo> cluster = client.getClusterInfo(handle);
    if (cluster.success()) {
        report.cluster = *cluster.value;
        report.clusterMasterUris = report.cluster.clusterMasterUris;
        report.shcDeployerUri = report.cluster.shcDeployerUri;
    } else {
        markUnavailable(ReportSection::Cluster, cluster.error, cluster.message);
    }

    const ClientResult<ResourceUsage> resources = client.getDiskUsage(handle);
    if (resources.success()) {
        report.resources = *resources.value;
    } else {
        markUnavailable(ReportSection::Resources, resources.error, resources.message);
    }

    const ClientResult<QVector<InstanceMessage>> messages = client.getMessages(handle);
    if (messages.success()) {
        report.messages = *messages.value;
    } else {
        markUnavailable(ReportSection::Messages, messages.error, messages.message);
    }

    if (!report.deploymentServerUri.isEmpty()) {
        roleSet.insert(roles::kDeploymentClient);
    }
    if (managementConsoles_.contains(seed.key)) {
        roleSet.insert(roles::kManagementConsole);
    }
    report.roles = QStringList(roleSet.cbegin(), roleSet.cend());
    report.roles.sort();

    report.adjacencies = normalizeAdjacencies(
        report.key,
        report.deploymentServerUri,
        report.clusterMasterUris,
        report.shcDeployerUri,
        peers);

    if (report.sectionErrors.isEmpty()) {
        report.outcome = PollOutcome::Success;
    } else {
        report.outcome = PollOutcome::Partial;
        QStringList details;
        for (auto it = report.sectionErrors.constBegin(); it != report.sectionErrors.constEnd(); ++it) {
            details.append(QString("%1: %2").arg(reportSectionName(it.key()), it.value()));
        }
        report.errorDetail = details.join("; ");
    }

    evaluateHealth(&report);
    report.durationMs = timer.elapsed();
    return report;
}

void ReportBuilder::recordMetric(InstanceReport* report, const QString& metric, const QString& rawValue) const {
    report->health.insert(metric, {rawValue, evaluator_.evaluate(metric, rawValue)});
}

void ReportBuilder::evaluateHealth(InstanceReport* report) const {
    const ServerInfo& server = report->server;
    recordMetric(report, metrics::kVersion, server.version);

    QString uptime;
    if (server.startupTimeEpoch > 0) {
        const qint64 seconds = QDateTime::currentSecsSinceEpoch() - server.startupTimeEpoch;
        uptime = QString::number(qMax<qint64>(0, seconds));
    }
    recordMetric(report, metrics::kUptimeSeconds, uptime);
    recordMetric(report, metrics::kCpuCores, server.cores > 0 ? QString::number(server.cores) : QString());
    recordMetric(report, metrics::kMemCapacityMb, server.ramMb > 0 ? QString::number(server.ramMb) : QString());
    recordMetric(report, metrics::kHttpSsl, boolRaw(server.webSslEnabled));

    QString messageCount;
    if (report->isSectionAvailable(ReportSection::Messages)) {
        const auto notable = std::count_if(
            report->messages.cbegin(),
            report->messages.cend(),
            [](const InstanceMessage& message) { return message.severity.compare("info", Qt::CaseInsensitive) != 0; });
        messageCount = QString::number(static_cast<qint64>(notable));
    }
    recordMetric(report, metrics::kMessages, messageCount);

    QString diskUsage;
    QString diskFree;
    if (report->isSectionAvailable(ReportSection::Resources)) {
        const ResourceUsage& resources = report->resources;
        recordMetric(report, metrics::kCpuUsagePct, percentRaw(resources.cpuUsagePct));
        recordMetric(report, metrics::kMemUsagePct, percentRaw(resources.memUsagePct));
        recordMetric(report, metrics::kSwapUsagePct, percentRaw(resources.swapUsagePct));
        if (!resources.partitions.isEmpty()) {
            double maxUsed = 0.0;
            double minFreeMb = resources.partitions.first().freeMb;
            for (const DiskPartition& partition : resources.partitions) {
                maxUsed = qMax(maxUsed, partition.usedPercent());
                minFreeMb = qMin(minFreeMb, partition.freeMb);
            }
            diskUsage = QString::number(maxUsed, 'f', 1);
            diskFree = QString::number(minFreeMb / 1024.0, 'f', 2);
        }
    } else {
        recordMetric(report, metrics::kCpuUsagePct, {});
        recordMetric(report, metrics::kMemUsagePct, {});
        recordMetric(report, metrics::kSwapUsagePct, {});
    }
    recordMetric(report, metrics::kDiskUsagePct, diskUsage);
    recordMetric(report, metrics::kDiskFreeGb, diskFree);

    const ClusterInfo& cluster = report->cluster;
    if (report->roles.contains(roles::kClusterMaster)) {
        recordMetric(report, metrics::kClusterMaintenance, boolRaw(cluster.maintenanceMode));
        recordMetric(report, metrics::kClusterRollingRestart, boolRaw(cluster.rollingRestart));
        recordMetric(report, metrics::kClusterAllDataSearchable, boolRaw(cluster.allDataSearchable));
        recordMetric(report, metrics::kClusterSearchFactorMet, boolRaw(cluster.searchFactorMet));
        recordMetric(report, metrics::kClusterReplicationFactorMet, boolRaw(cluster.replicationFactorMet));
        recordMetric(report, metrics::kClusterPeersNotSearchable, shortfallRaw(cluster.peerCount, cluster.peersSearchable));
        recordMetric(
            report,
            metrics::kClusterSearchHeadsNotConnected,
            shortfallRaw(cluster.searchHeadCount, cluster.searchHeadsConnected));
    }
    if (report->roles.contains(roles::kShcMember)) {
        recordMetric(report, metrics::kShcRollingRestart, boolRaw(cluster.shcRollingRestart));
        recordMetric(report, metrics::kShcServiceReady, boolRaw(cluster.shcServiceReady));
        recordMetric(report, metrics::kShcMinPeersJoined, boolRaw(cluster.shcMinPeersJoined));
        recordMetric(report, metrics::kShcMembersNotUp, shortfallRaw(cluster.shcMemberCount, cluster.shcMembersUp));
    }
}

}  // namespace sscope
