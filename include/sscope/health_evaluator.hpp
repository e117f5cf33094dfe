#pragma once

#include <QMap>
#include <QString>

#include <optional>

namespace sscope {

enum class HealthStatus {
    Normal,
    Caution,
    Warning,
    Unknown,
};

QString healthStatusLabel(HealthStatus status);

enum class ThresholdDirection {
    AtOrAbove,
    AtOrBelow,
};

// A missing level is not checked. A rule with neither level is unconfigured.
struct ThresholdRule {
    std::optional<double> caution;
    std::optional<double> warning;
    ThresholdDirection direction = ThresholdDirection::AtOrAbove;

    [[nodiscard]] bool isConfigured() const { return caution.has_value() || warning.has_value(); }
};

namespace metrics {
inline const QString kVersion = QStringLiteral("version");
inline const QString kUptimeSeconds = QStringLiteral("uptime_seconds");
inline const QString kCpuCores = QStringLiteral("cpu_cores");
inline const QString kMemCapacityMb = QStringLiteral("mem_capacity_mb");
inline const QString kMessages = QStringLiteral("messages");
inline const QString kHttpSsl = QStringLiteral("http_ssl");
inline const QString kCpuUsagePct = QStringLiteral("cpu_usage_pct");
inline const QString kMemUsagePct = QStringLiteral("mem_usage_pct");
inline const QString kSwapUsagePct = QStringLiteral("swap_usage_pct");
inline const QString kDiskUsagePct = QStringLiteral("disk_usage_pct");
inline const QString kDiskFreeGb = QStringLiteral("disk_free_gb");
inline const QString kClusterMaintenance = QStringLiteral("cluster_maintenance");
inline const QString kClusterRollingRestart = QStringLiteral("cluster_rolling_restart");
inline const QString kClusterAllDataSearchable = QStringLiteral("cluster_all_data_searchable");
inline const QString kClusterSearchFactorMet = QStringLiteral("cluster_search_factor_met");
inline const QString kClusterReplicationFactorMet = QStringLiteral("cluster_replication_factor_met");
inline const QString kClusterPeersNotSearchable = QStringLiteral("cluster_peers_not_searchable");
inline const QString kClusterSearchHeadsNotConnected = QStringLiteral("cluster_search_heads_not_connected");
inline const QString kShcRollingRestart = QStringLiteral("shc_rolling_restart");
inline const QString kShcServiceReady = QStringLiteral("shc_service_ready");
inline const QString kShcMinPeersJoined = QStringLiteral("shc_min_peers_joined");
inline const QString kShcMembersNotUp = QStringLiteral("shc_members_not_up");
}  // namespace metrics

class HealthEvaluator {
public:
    explicit HealthEvaluator(QMap<QString, ThresholdRule> rules);

    // Metrics without a configured rule are Normal whatever the value;
    // configured metrics whose value does not parse are Unknown.
    [[nodiscard]] HealthStatus evaluate(const QString& metric, const QString& rawValue) const;
    [[nodiscard]] HealthStatus evaluate(const QString& metric, std::optional<double> value) const;
    [[nodiscard]] bool isConfigured(const QString& metric) const;
    [[nodiscard]] const QMap<QString, ThresholdRule>& rules() const { return rules_; }

    static std::optional<double> parseRawValue(const QString& rawValue);
    static QMap<QString, ThresholdRule> defaultRules();

private:
    QMap<QString, ThresholdRule> rules_;
};

}  // namespace sscope
