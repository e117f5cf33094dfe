#include "sscope/instance_report.hpp"

#include <QJsonArray>

namespace sscope {

namespace {

QJsonValue optionalBool(const std::optional<bool>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonValue optionalDouble(const std::optional<double>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonValue optionalInt(const std::optional<int>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonArray toJsonArray(const QStringList& values) {
    QJsonArray out;
    for (const QString& value : values) {
        out.append(value);
    }
    return out;
}

QJsonObject clusterToJson(const ClusterInfo& cluster) {
    return {
        {"mode", cluster.mode},
        {"site", cluster.site},
        {"label", cluster.label},
        {"cluster_master_uris", toJsonArray(cluster.clusterMasterUris)},
        {"shc_deployer_uri", cluster.shcDeployerUri},
        {"shc_label", cluster.shcLabel},
        {"maintenance_mode", optionalBool(cluster.maintenanceMode)},
        {"rolling_restart", optionalBool(cluster.rollingRestart)},
        {"all_data_searchable", optionalBool(cluster.allDataSearchable)},
        {"search_factor_met", optionalBool(cluster.searchFactorMet)},
        {"replication_factor_met", optionalBool(cluster.replicationFactorMet)},
        {"peer_count", optionalInt(cluster.peerCount)},
        {"peers_searchable", optionalInt(cluster.peersSearchable)},
        {"search_head_count", optionalInt(cluster.searchHeadCount)},
        {"search_heads_connected", optionalInt(cluster.searchHeadsConnected)},
        {"shc_rolling_restart", optionalBool(cluster.shcRollingRestart)},
        {"shc_service_ready", optionalBool(cluster.shcServiceReady)},
        {"shc_min_peers_joined", optionalBool(cluster.shcMinPeersJoined)},
        {"shc_member_count", optionalInt(cluster.shcMemberCount)},
        {"shc_members_up", optionalInt(cluster.shcMembersUp)},
    };
}

QJsonObject resourcesToJson(const ResourceUsage& resources) {
    QJsonArray partitions;
    for (const DiskPartition& partition : resources.partitions) {
        partitions.append(QJsonObject{
            {"mount_point", partition.mountPoint},
            {"fs_type", partition.fsType},
            {"capacity_mb", partition.capacityMb},
            {"free_mb", partition.freeMb},
            {"used_pct", partition.usedPercent()},
        });
    }
    return {
        {"partitions", partitions},
        {"cpu_usage_pct", optionalDouble(resources.cpuUsagePct)},
        {"mem_usage_pct", optionalDouble(resources.memUsagePct)},
        {"swap_usage_pct", optionalDouble(resources.swapUsagePct)},
    };
}

}  // namespace

QString clientErrorKindName(ClientErrorKind kind) {
    switch (kind) {
        case ClientErrorKind::None:
            return "none";
        case ClientErrorKind::Connect:
            return "connect";
        case ClientErrorKind::Auth:
            return "auth";
        case ClientErrorKind::Timeout:
            return "timeout";
        case ClientErrorKind::Fetch:
            return "fetch";
        case ClientErrorKind::Parse:
            return "parse";
        case ClientErrorKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

QString pollOutcomeName(PollOutcome outcome) {
    switch (outcome) {
        case PollOutcome::Success:
            return "success";
        case PollOutcome::Partial:
            return "partial";
        case PollOutcome::Failed:
            return "failed";
    }
    return "failed";
}

QString reportSectionName(ReportSection section) {
    switch (section) {
        case ReportSection::Roles:
            return "roles";
        case ReportSection::Adjacencies:
            return "adjacencies";
        case ReportSection::Deployment:
            return "deployment";
        case ReportSection::Cluster:
            return "cluster";
        case ReportSection::Resources:
            return "resources";
        case ReportSection::Messages:
            return "messages";
        case ReportSection::Settings:
            return "settings";
    }
    return "unknown";
}

QString InstanceReport::displayName() const {
    return server.serverName.isEmpty() ? key.toString() : server.serverName;
}

QJsonObject InstanceReport::toJson() const {
    QJsonArray adjacencyArray;
    for (const Adjacency& adjacency : adjacencies) {
        adjacencyArray.append(QJsonObject{
            {"target", adjacency.target.toString()},
            {"relation", adjacency.relation},
        });
    }

    QJsonObject healthObject;
    for (auto it = health.constBegin(); it != health.constEnd(); ++it) {
        healthObject.insert(
            it.key(),
            QJsonObject{
                {"value", it->rawValue},
                {"status", healthStatusLabel(it->status)},
            });
    }

    QJsonArray messageArray;
    for (const InstanceMessage& message : messages) {
        messageArray.append(QJsonObject{
            {"title", message.title},
            {"severity", message.severity},
            {"text", message.text},
            {"created_epoch", static_cast<double>(message.createdEpoch)},
        });
    }

    QJsonObject sectionErrorObject;
    for (auto it = sectionErrors.constBegin(); it != sectionErrors.constEnd(); ++it) {
        sectionErrorObject.insert(reportSectionName(it.key()), it.value());
    }

    return {
        {"address", key.address},
        {"port", key.port},
        {"username", username},
        {"server_name", server.serverName},
        {"guid", server.guid},
        {"version", server.version},
        {"product", server.product},
        {"os", server.os},
        {"cpu_cores", server.cores},
        {"ram_mb", static_cast<double>(server.ramMb)},
        {"startup_time", static_cast<double>(server.startupTimeEpoch)},
        {"splunk_home", server.splunkHome},
        {"web_enabled", optionalBool(server.webEnabled)},
        {"web_ssl", optionalBool(server.webSslEnabled)},
        {"web_port", optionalInt(server.webPort)},
        {"roles", toJsonArray(roles)},
        {"deployment_server_uri", deploymentServerUri},
        {"cluster_master_uris", toJsonArray(clusterMasterUris)},
        {"shc_deployer_uri", shcDeployerUri},
        {"adjacencies", adjacencyArray},
        {"health", healthObject},
        {"cluster", clusterToJson(cluster)},
        {"resources", resourcesToJson(resources)},
        {"messages", messageArray},
        {"outcome", pollOutcomeName(outcome)},
        {"error", errorDetail},
        {"section_errors", sectionErrorObject},
        {"polled_at_utc", polledAtUtc},
        {"duration_ms", static_cast<double>(durationMs)},
    };
}

QJsonObject DiscoveredNode::toJson() const {
    return {
        {"address", key.address},
        {"port", key.port},
        {"first_seen_from", firstSeenFrom.toString()},
        {"relation", relation},
        {"outcome", "unvisited"},
    };
}

}  // namespace sscope
