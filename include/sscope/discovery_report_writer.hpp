#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "sscope/discovery_orchestrator.hpp"
#include "sscope/tool_config.hpp"
#include "sscope/topology_builder.hpp"

namespace sscope {

// Writes a finished discovery run as CSV (one row per node) or JSON.
class DiscoveryReportWriter {
public:
    explicit DiscoveryReportWriter(const ToolConfig& config);

    [[nodiscard]] QStringList csvHeader() const;
    [[nodiscard]] QString toCsv(const DiscoveryResult& result, const TopologyGraph& graph) const;
    [[nodiscard]] QJsonObject toJson(const DiscoveryResult& result, const TopologyGraph& graph) const;

    QJsonObject exportCsv(const DiscoveryResult& result, const TopologyGraph& graph, const QString& filePath) const;
    QJsonObject exportJson(const DiscoveryResult& result, const TopologyGraph& graph, const QString& filePath) const;

    // reports/splunkscope_discovery_<utc timestamp>.<extension>
    static QString defaultPath(const QString& extension);

private:
    static QJsonObject writeFile(const QString& filePath, const QByteArray& data, const QString& format);

    QStringList metrics_;
    TopologyStyle style_;
};

}  // namespace sscope
