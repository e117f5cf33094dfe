#pragma once

#include <QJsonObject>
#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>

#include "sscope/health_evaluator.hpp"
#include "sscope/instance_key.hpp"
#include "sscope/role_classifier.hpp"

namespace sscope {

struct TopologyStyle {
    QMap<RoleLayer, QString> layerLabels;
    QMap<RoleLayer, QString> layerColors;
    QString failedColor = "#d64545";
    QString partialColor = "#e0a030";
    QString discoveredColor = "#9aa5b1";
    QString rankDirection = "TB";

    [[nodiscard]] QString labelFor(RoleLayer layer) const;
    [[nodiscard]] QString colorFor(RoleLayer layer) const;
};

// Settings read once before a discovery run. Never mutated afterwards; a
// reload produces a new instance.
class ToolConfig {
public:
    static ToolConfig defaults();
    // Values not present in the object keep their defaults. Problems are
    // appended to *errors when given; the offending entries are skipped.
    static ToolConfig fromJson(const QJsonObject& object, QStringList* errors = nullptr);
    // On failure *out is left untouched and the status carries the error.
    static QJsonObject loadFromFile(const QString& filePath, ToolConfig* out);

    [[nodiscard]] QJsonObject toJson() const;

    [[nodiscard]] const QMap<QString, ThresholdRule>& healthRules() const { return healthRules_; }
    [[nodiscard]] const TopologyStyle& topologyStyle() const { return topologyStyle_; }
    [[nodiscard]] const QSet<InstanceKey>& managementConsoles() const { return managementConsoles_; }
    [[nodiscard]] QString defaultUsername() const { return defaultUsername_; }
    [[nodiscard]] QString defaultPassword() const { return defaultPassword_; }
    [[nodiscard]] int defaultPort() const { return defaultPort_; }
    [[nodiscard]] int requestTimeoutMs() const { return requestTimeoutMs_; }
    [[nodiscard]] QString logFile() const { return logFile_; }
    [[nodiscard]] QString curlProgram() const { return curlProgram_; }
    [[nodiscard]] QString dotProgram() const { return dotProgram_; }
    [[nodiscard]] QString sourcePath() const { return sourcePath_; }

private:
    ToolConfig() = default;

    QMap<QString, ThresholdRule> healthRules_;
    TopologyStyle topologyStyle_;
    QSet<InstanceKey> managementConsoles_;
    QString defaultUsername_ = "admin";
    QString defaultPassword_;
    int defaultPort_ = kDefaultManagementPort;
    int requestTimeoutMs_ = 8000;
    QString logFile_ = "logs/splunkscope.log";
    QString curlProgram_ = "curl";
    QString dotProgram_ = "dot";
    QString sourcePath_;
};

}  // namespace sscope
