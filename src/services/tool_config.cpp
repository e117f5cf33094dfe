#include "sscope/tool_config.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace sscope {

namespace {

const QMap<RoleLayer, QString>& defaultLayerColors() {
    static const QMap<RoleLayer, QString> colors = {
        {RoleLayer::ManagementConsole, "#b48ead"},
        {RoleLayer::ShcDeployer, "#a3be8c"},
        {RoleLayer::StandaloneSearchHead, "#88c0d0"},
        {RoleLayer::LicenseMaster, "#ebcb8b"},
        {RoleLayer::DeploymentServer, "#d08770"},
        {RoleLayer::SearchHead, "#81a1c1"},
        {RoleLayer::ClusterMaster, "#8fbcbb"},
        {RoleLayer::Indexer, "#5e81ac"},
        {RoleLayer::HeavyForwarder, "#bf616a"},
        {RoleLayer::ManagedUniversalForwarder, "#a3d9a5"},
        {RoleLayer::InputOnly, "#c9d1a7"},
        {RoleLayer::Other, "#d8dee9"},
        {RoleLayer::DiscoveredNode, "#eceff4"},
    };
    return colors;
}

std::optional<double> thresholdValue(const QJsonValue& value, bool* ok) {
    *ok = true;
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    if (value.isDouble()) {
        return value.toDouble();
    }
    if (value.isBool()) {
        return value.toBool() ? 1.0 : 0.0;
    }
    if (value.isString()) {
        const std::optional<double> parsed = HealthEvaluator::parseRawValue(value.toString());
        if (parsed.has_value()) {
            return parsed;
        }
    }
    *ok = false;
    return std::nullopt;
}

void appendError(QStringList* errors, const QString& message) {
    if (errors != nullptr) {
        errors->append(message);
    }
}

QJsonValue thresholdToJson(const std::optional<double>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

void readLayerMap(
    const QJsonObject& object,
    const QString& section,
    QMap<RoleLayer, QString>* out,
    QStringList* errors) {
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        RoleLayer layer = RoleLayer::Other;
        if (!roleLayerFromId(it.key(), &layer)) {
            appendError(errors, QString("topology.%1: unknown layer '%2'").arg(section, it.key()));
            continue;
        }
        out->insert(layer, it.value().toString());
    }
}

}  // namespace

QString TopologyStyle::labelFor(RoleLayer layer) const {
    const QString label = layerLabels.value(layer);
    return label.isEmpty() ? roleLayerLabel(layer) : label;
}

QString TopologyStyle::colorFor(RoleLayer layer) const {
    const QString color = layerColors.value(layer);
    return color.isEmpty() ? defaultLayerColors().value(layer, "#d8dee9") : color;
}

ToolConfig ToolConfig::defaults() {
    ToolConfig config;
    config.healthRules_ = HealthEvaluator::defaultRules();
    config.topologyStyle_.layerColors = defaultLayerColors();
    return config;
}

ToolConfig ToolConfig::fromJson(const QJsonObject& object, QStringList* errors) {
    ToolConfig config = defaults();

    const QJsonObject main = object.value("main").toObject();
    if (main.contains("default_username")) {
        config.defaultUsername_ = main.value("default_username").toString();
    }
    if (main.contains("default_password")) {
        config.defaultPassword_ = main.value("default_password").toString();
    }
    if (main.contains("default_port")) {
        const int port = main.value("default_port").toInt(-1);
        if (port > 0 && port < 65536) {
            config.defaultPort_ = port;
        } else {
            appendError(errors, "main.default_port must be between 1 and 65535");
        }
    }
    if (main.contains("request_timeout_ms")) {
        const int timeoutMs = main.value("request_timeout_ms").toInt(-1);
        if (timeoutMs > 0) {
            config.requestTimeoutMs_ = timeoutMs;
        } else {
            appendError(errors, "main.request_timeout_ms must be a positive integer");
        }
    }
    if (main.contains("log_file")) {
        config.logFile_ = main.value("log_file").toString();
    }

    const QJsonObject healthchecks = object.value("healthchecks").toObject();
    for (auto it = healthchecks.constBegin(); it != healthchecks.constEnd(); ++it) {
        const QString metric = it.key();
        if (it.value().isBool() && !it.value().toBool()) {
            config.healthRules_.remove(metric);
            continue;
        }
        if (!it.value().isObject()) {
            appendError(errors, QString("healthchecks.%1 must be an object or false").arg(metric));
            continue;
        }
        const QJsonObject ruleObject = it.value().toObject();
        ThresholdRule rule;
        bool cautionOk = true;
        bool warningOk = true;
        rule.caution = thresholdValue(ruleObject.value("caution"), &cautionOk);
        rule.warning = thresholdValue(ruleObject.value("warning"), &warningOk);
        if (!cautionOk || !warningOk) {
            appendError(errors, QString("healthchecks.%1 has a non-numeric threshold").arg(metric));
            continue;
        }
        const QString direction = ruleObject.value("direction").toString("above").trimmed().toLower();
        if (direction == "above") {
            rule.direction = ThresholdDirection::AtOrAbove;
        } else if (direction == "below") {
            rule.direction = ThresholdDirection::AtOrBelow;
        } else {
            appendError(
                errors,
                QString("healthchecks.%1.direction must be 'above' or 'below'").arg(metric));
            continue;
        }
        config.healthRules_.insert(metric, rule);
    }

    const QJsonObject topology = object.value("topology").toObject();
    for (const QJsonValue& value : topology.value("management_consoles").toArray()) {
        const InstanceKey key = InstanceKey::fromUri(value.toString(), config.defaultPort_);
        if (!key.isValid()) {
            appendError(
                errors,
                QString("topology.management_consoles: invalid address '%1'").arg(value.toString()));
            continue;
        }
        config.managementConsoles_.insert(key);
    }
    readLayerMap(topology.value("layer_labels").toObject(), "layer_labels", &config.topologyStyle_.layerLabels, errors);
    readLayerMap(topology.value("layer_colors").toObject(), "layer_colors", &config.topologyStyle_.layerColors, errors);
    config.topologyStyle_.failedColor =
        topology.value("failed_color").toString(config.topologyStyle_.failedColor);
    config.topologyStyle_.partialColor =
        topology.value("partial_color").toString(config.topologyStyle_.partialColor);
    config.topologyStyle_.discoveredColor =
        topology.value("discovered_color").toString(config.topologyStyle_.discoveredColor);
    const QString rankDirection =
        topology.value("rank_direction").toString(config.topologyStyle_.rankDirection).toUpper();
    if (rankDirection == "TB" || rankDirection == "LR" || rankDirection == "BT" || rankDirection == "RL") {
        config.topologyStyle_.rankDirection = rankDirection;
    } else {
        appendError(errors, "topology.rank_direction must be one of TB, LR, BT, RL");
    }

    const QJsonObject tools = object.value("tools").toObject();
    config.curlProgram_ = tools.value("curl").toString(config.curlProgram_);
    config.dotProgram_ = tools.value("dot").toString(config.dotProgram_);
    return config;
}

QJsonObject ToolConfig::loadFromFile(const QString& filePath, ToolConfig* out) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open configuration file."},
            {"path", filePath},
        };
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {
            {"success", false},
            {"error", parseError.error != QJsonParseError::NoError
                          ? QString("Configuration is not valid JSON: %1").arg(parseError.errorString())
                          : QString("Configuration file must contain a JSON object.")},
            {"path", filePath},
        };
    }

    QStringList errors;
    ToolConfig config = fromJson(doc.object(), &errors);
    if (!errors.isEmpty()) {
        return {
            {"success", false},
            {"error", errors.join("; ")},
            {"path", filePath},
        };
    }

    config.sourcePath_ = QFileInfo(filePath).absoluteFilePath();
    *out = config;
    return {
        {"success", true},
        {"path", config.sourcePath_},
        {"health_rules", config.healthRules_.size()},
    };
}

QJsonObject ToolConfig::toJson() const {
    QJsonObject healthchecks;
    for (auto it = healthRules_.constBegin(); it != healthRules_.constEnd(); ++it) {
        healthchecks.insert(
            it.key(),
            QJsonObject{
                {"caution", thresholdToJson(it->caution)},
                {"warning", thresholdToJson(it->warning)},
                {"direction", it->direction == ThresholdDirection::AtOrAbove ? "above" : "below"},
            });
    }

    QJsonArray consoles;
    QStringList consoleNames;
    for (const InstanceKey& key : managementConsoles_) {
        consoleNames.append(key.toString());
    }
    consoleNames.sort();
    for (const QString& name : consoleNames) {
        consoles.append(name);
    }

    QJsonObject labels;
    QJsonObject colors;
    for (RoleLayer layer : allRoleLayers()) {
        labels.insert(roleLayerId(layer), topologyStyle_.labelFor(layer));
        colors.insert(roleLayerId(layer), topologyStyle_.colorFor(layer));
    }

    return {
        {"main",
         QJsonObject{
             {"default_username", defaultUsername_},
             {"default_port", defaultPort_},
             {"request_timeout_ms", requestTimeoutMs_},
             {"log_file", logFile_},
         }},
        {"healthchecks", healthchecks},
        {"topology",
         QJsonObject{
             {"management_consoles", consoles},
             {"layer_labels", labels},
             {"layer_colors", colors},
             {"failed_color", topologyStyle_.failedColor},
             {"partial_color", topologyStyle_.partialColor},
             {"discovered_color", topologyStyle_.discoveredColor},
             {"rank_direction", topologyStyle_.rankDirection},
         }},
        {"tools",
         QJsonObject{
             {"curl", curlProgram_},
             {"dot", dotProgram_},
         }},
    };
}

}  // namespace sscope
