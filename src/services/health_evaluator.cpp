#include "sscope/health_evaluator.hpp"

#include <QRegularExpression>

#include <utility>

namespace sscope {

namespace {

bool crosses(double value, double threshold, ThresholdDirection direction) {
    return direction == ThresholdDirection::AtOrAbove ? value >= threshold : value <= threshold;
}

ThresholdRule above(std::optional<double> caution, std::optional<double> warning) {
    return {caution, warning, ThresholdDirection::AtOrAbove};
}

ThresholdRule below(std::optional<double> caution, std::optional<double> warning) {
    return {caution, warning, ThresholdDirection::AtOrBelow};
}

}  // namespace

QString healthStatusLabel(HealthStatus status) {
    switch (status) {
        case HealthStatus::Normal:
            return "Normal";
        case HealthStatus::Caution:
            return "Caution";
        case HealthStatus::Warning:
            return "Warning";
        case HealthStatus::Unknown:
            break;
    }
    return "Unknown";
}

HealthEvaluator::HealthEvaluator(QMap<QString, ThresholdRule> rules)
    : rules_(std::move(rules)) {}

bool HealthEvaluator::isConfigured(const QString& metric) const {
    const auto it = rules_.constFind(metric);
    return it != rules_.constEnd() && it->isConfigured();
}

HealthStatus HealthEvaluator::evaluate(const QString& metric, const QString& rawValue) const {
    if (!isConfigured(metric)) {
        return HealthStatus::Normal;
    }
    return evaluate(metric, parseRawValue(rawValue));
}

HealthStatus HealthEvaluator::evaluate(const QString& metric, std::optional<double> value) const {
    const auto it = rules_.constFind(metric);
    if (it == rules_.constEnd() || !it->isConfigured()) {
        return HealthStatus::Normal;
    }
    if (!value.has_value()) {
        return HealthStatus::Unknown;
    }

    const ThresholdRule& rule = *it;
    if (rule.warning.has_value() && crosses(*value, *rule.warning, rule.direction)) {
        return HealthStatus::Warning;
    }
    if (rule.caution.has_value() && crosses(*value, *rule.caution, rule.direction)) {
        return HealthStatus::Caution;
    }
    return HealthStatus::Normal;
}

std::optional<double> HealthEvaluator::parseRawValue(const QString& rawValue) {
    const QString text = rawValue.trimmed().toLower();
    if (text.isEmpty()) {
        return std::nullopt;
    }
    if (text == "true" || text == "yes") {
        return 1.0;
    }
    if (text == "false" || text == "no") {
        return 0.0;
    }

    static const QRegularExpression leadingNumber("^[-+]?(?:[0-9]+(?:\\.[0-9]+)?|\\.[0-9]+)");
    const QRegularExpressionMatch match = leadingNumber.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = match.captured(0).toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

QMap<QString, ThresholdRule> HealthEvaluator::defaultRules() {
    QMap<QString, ThresholdRule> rules;
    rules.insert(metrics::kVersion, below(6.0, 5.0));
    rules.insert(metrics::kUptimeSeconds, below(604800.0, 86400.0));
    rules.insert(metrics::kCpuCores, below(12.0, std::nullopt));
    rules.insert(metrics::kMemCapacityMb, below(31744.0, std::nullopt));
    rules.insert(metrics::kMessages, above(1.0, std::nullopt));
    rules.insert(metrics::kHttpSsl, below(0.0, std::nullopt));
    rules.insert(metrics::kCpuUsagePct, above(80.0, 90.0));
    rules.insert(metrics::kMemUsagePct, above(80.0, 90.0));
    rules.insert(metrics::kSwapUsagePct, above(80.0, 90.0));
    rules.insert(metrics::kDiskUsagePct, above(80.0, 90.0));
    rules.insert(metrics::kDiskFreeGb, below(10.0, 5.0));
    rules.insert(metrics::kClusterMaintenance, above(1.0, std::nullopt));
    rules.insert(metrics::kClusterRollingRestart, above(1.0, std::nullopt));
    rules.insert(metrics::kClusterAllDataSearchable, below(std::nullopt, 0.0));
    rules.insert(metrics::kClusterSearchFactorMet, below(0.0, std::nullopt));
    rules.insert(metrics::kClusterReplicationFactorMet, below(0.0, std::nullopt));
    rules.insert(metrics::kClusterPeersNotSearchable, above(std::nullopt, 1.0));
    rules.insert(metrics::kClusterSearchHeadsNotConnected, above(std::nullopt, 1.0));
    rules.insert(metrics::kShcRollingRestart, above(1.0, std::nullopt));
    rules.insert(metrics::kShcServiceReady, below(std::nullopt, 0.0));
    rules.insert(metrics::kShcMinPeersJoined, below(std::nullopt, 0.0));
    rules.insert(metrics::kShcMembersNotUp, above(std::nullopt, 1.0));
    return rules;
}

}  // namespace sscope
