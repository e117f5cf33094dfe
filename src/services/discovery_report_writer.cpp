#include "sscope/discovery_report_writer.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>

#include <optional>

#include "sscope/seed_list.hpp"
#include "sscope/telemetry.hpp"

namespace sscope {

namespace {

// Product through HTTP SSL.
constexpr int kServerColumns = 9;

QString csvLine(const QStringList& cells) {
    QStringList quoted;
    quoted.reserve(cells.size());
    for (const QString& cell : cells) {
        quoted.append(SeedList::quoteField(cell));
    }
    return quoted.join(',') + "\r\n";
}

QString describeAdjacencies(const QVector<Adjacency>& adjacencies) {
    QStringList out;
    for (const Adjacency& adjacency : adjacencies) {
        out.append(QString("%1 (%2)").arg(adjacency.target.toString(), adjacency.relation));
    }
    return out.join("; ");
}

QString flagCell(const std::optional<bool>& flag) {
    if (!flag.has_value()) {
        return QString();
    }
    return *flag ? "true" : "false";
}

// Zero means server/info did not report the value.
QString countCell(qint64 value) {
    return value > 0 ? QString::number(value) : QString();
}

QString startupCell(qint64 epoch) {
    if (epoch <= 0) {
        return QString();
    }
    return QDateTime::fromSecsSinceEpoch(epoch, Qt::UTC).toString(Qt::ISODate);
}

}  // namespace

DiscoveryReportWriter::DiscoveryReportWriter(const ToolConfig& config)
    : style_(config.topologyStyle()) {
    const QMap<QString, ThresholdRule>& rules = config.healthRules();
    for (auto it = rules.constBegin(); it != rules.constEnd(); ++it) {
        if (it.value().isConfigured()) {
            metrics_.append(it.key());
        }
    }
}

QStringList DiscoveryReportWriter::csvHeader() const {
    QStringList header = {
        "Address",
        "Port",
        "Server Name",
        "GUID",
        "Version",
        "Outcome",
        "Error",
        "Layer",
        "Roles",
        "Deployment Server",
        "Cluster Masters",
        "SHC Deployer",
        "Adjacencies",
        "Unavailable Sections",
        "Product",
        "OS",
        "Cores",
        "RAM (MB)",
        "Startup (UTC)",
        "Splunk Home",
        "Web Enabled",
        "Web Port",
        "HTTP SSL",
    };
    for (const QString& metric : metrics_) {
        header << metric << QString("%1 Health").arg(metric);
    }
    return header;
}

QString DiscoveryReportWriter::toCsv(const DiscoveryResult& result, const TopologyGraph& graph) const {
    QString out;
    out += "# SplunkScope discovery report\r\n";
    out += QString("# Report produced %1\r\n").arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    if (result.cancelled) {
        out += "# Run was cancelled before every seed was polled\r\n";
    }
    out += csvLine(csvHeader());

    const auto layerLabel = [&](const InstanceKey& key) {
        const TopologyNode* node = graph.node(key);
        return node != nullptr ? style_.labelFor(node->layer) : QString();
    };

    for (const InstanceReport& report : result.reports) {
        QStringList unavailable;
        for (auto it = report.sectionErrors.constBegin(); it != report.sectionErrors.constEnd(); ++it) {
            unavailable.append(reportSectionName(it.key()));
        }
        QStringList row = {
            report.key.address,
            QString::number(report.key.port),
            report.server.serverName,
            report.server.guid,
            report.server.version,
            pollOutcomeName(report.outcome),
            report.errorDetail,
            layerLabel(report.key),
            report.roles.join("; "),
            report.deploymentServerUri,
            report.clusterMasterUris.join("; "),
            report.shcDeployerUri,
            describeAdjacencies(report.adjacencies),
            unavailable.join("; "),
            report.server.product,
            report.server.os,
            countCell(report.server.cores),
            countCell(report.server.ramMb),
            startupCell(report.server.startupTimeEpoch),
            report.server.splunkHome,
            flagCell(report.server.webEnabled),
            report.server.webPort.has_value() ? QString::number(*report.server.webPort) : QString(),
            flagCell(report.server.webSslEnabled),
        };
        // Failed instances report every configured metric as Unknown.
        const QString missingStatus =
            report.outcome == PollOutcome::Failed ? healthStatusLabel(HealthStatus::Unknown) : QString();
        for (const QString& metric : metrics_) {
            const auto reading = report.health.constFind(metric);
            if (reading == report.health.constEnd()) {
                row << QString() << missingStatus;
            } else {
                row << reading->rawValue << healthStatusLabel(reading->status);
            }
        }
        out += csvLine(row);
    }

    for (const DiscoveredNode& placeholder : result.discovered) {
        QStringList row = {
            placeholder.key.address,
            QString::number(placeholder.key.port),
            QString(),
            QString(),
            QString(),
            "unvisited",
            QString(),
            layerLabel(placeholder.key),
            QString(),
            QString(),
            QString(),
            QString(),
            QString("referenced by %1 (%2)").arg(placeholder.firstSeenFrom.toString(), placeholder.relation),
            QString(),
        };
        for (int i = 0; i < kServerColumns; ++i) {
            row << QString();
        }
        for (int i = 0; i < metrics_.size(); ++i) {
            row << QString() << QString();
        }
        out += csvLine(row);
    }
    return out;
}

QJsonObject DiscoveryReportWriter::toJson(const DiscoveryResult& result, const TopologyGraph& graph) const {
    QJsonObject out = result.toJson();
    out.insert("generated_at_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    out.insert("topology", graph.toJson(style_));
    return out;
}

QString DiscoveryReportWriter::defaultPath(const QString& extension) {
    const QString ts = QDateTime::currentDateTimeUtc().toString("yyyyMMdd_HHmmss");
    return QDir(QDir::currentPath()).filePath(QString("reports/splunkscope_discovery_%1.%2").arg(ts, extension));
}

QJsonObject DiscoveryReportWriter::writeFile(const QString& filePath, const QByteArray& data, const QString& format) {
    QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"path", filePath},
            {"error", QString("Failed to open report file for writing: %1").arg(file.errorString())},
        };
    }
    file.write(data);
    file.close();
    Telemetry::instance().recordEvent("report_exported", {{"path", filePath}, {"format", format}});
    return {
        {"success", true},
        {"path", filePath},
        {"format", format},
    };
}

QJsonObject DiscoveryReportWriter::exportCsv(
    const DiscoveryResult& result,
    const TopologyGraph& graph,
    const QString& filePath) const {
    return writeFile(filePath, toCsv(result, graph).toUtf8(), "csv");
}

QJsonObject DiscoveryReportWriter::exportJson(
    const DiscoveryResult& result,
    const TopologyGraph& graph,
    const QString& filePath) const {
    return writeFile(filePath, QJsonDocument(toJson(result, graph)).toJson(QJsonDocument::Indented), "json");
}

}  // namespace sscope
