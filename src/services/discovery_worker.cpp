#include "sscope/discovery_worker.hpp"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include <utility>

#include "sscope/discovery_report_writer.hpp"
#include "sscope/health_evaluator.hpp"
#include "sscope/report_builder.hpp"
#include "sscope/rest_instance_client.hpp"
#include "sscope/seed_list.hpp"
#include "sscope/telemetry.hpp"

namespace sscope {

DiscoveryWorker::DiscoveryWorker(
    std::shared_ptr<const ToolConfig> config,
    std::unique_ptr<InstanceClient> client,
    QObject* parent)
    : QObject(parent),
      config_(std::move(config)),
      client_(std::move(client)) {
    if (!config_) {
        config_ = std::make_shared<const ToolConfig>(ToolConfig::defaults());
    }
    runConfig_ = config_;
    if (!client_) {
        ownsRestClient_ = true;
        client_ = makeRestClient();
    }
}

std::unique_ptr<InstanceClient> DiscoveryWorker::makeRestClient() const {
    auto client = std::make_unique<RestInstanceClient>(config_->curlProgram());
    client->setCancellationToken(&cancel_);
    return client;
}

void DiscoveryWorker::requestCancel() {
    cancel_.cancel();
    Telemetry::instance().recordEvent("discovery_cancel_requested");
}

void DiscoveryWorker::resetCancel() {
    cancel_.reset();
}

void DiscoveryWorker::runDiscovery(const QString& seedPath) {
    if (busy_) {
        emit discoveryFinished({
            {"success", false},
            {"error", "A discovery run is already in progress."},
            {"seed_path", seedPath},
        });
        return;
    }
    busy_ = true;

    // The run keeps this configuration even if a reload lands meanwhile.
    const std::shared_ptr<const ToolConfig> config = config_;
    const SeedDefaults defaults{config->defaultUsername(), config->defaultPassword(), config->defaultPort()};
    const SeedListResult seeds = SeedList::loadFromFile(seedPath, defaults);
    if (!seeds.success()) {
        busy_ = false;
        emit discoveryFinished({
            {"success", false},
            {"error", seeds.errors.join("\n")},
            {"seed_path", seedPath},
        });
        return;
    }

    const HealthEvaluator evaluator(config->healthRules());
    const ReportBuilder builder(evaluator, config->managementConsoles(), config->requestTimeoutMs());
    const DiscoveryOrchestrator orchestrator(*client_, builder);
    DiscoveryResult result = orchestrator.run(seeds.seeds, cancel_, [this](const DiscoveryProgress& progress) {
        emit instanceCompleted(progress.toJson());
    });

    lastGraph_ = TopologyBuilder(classifier_).build(result);
    lastResult_ = std::move(result);
    runConfig_ = config;
    hasResult_ = lastResult_.success();
    busy_ = false;

    QJsonObject summary = lastResult_.summaryJson();
    summary.insert("seed_path", seedPath);
    summary.insert("seed_entries", seeds.seeds.size());
    summary.insert("result", lastResult_.toJson());
    summary.insert("topology", lastGraph_.toJson(config->topologyStyle()));
    emit discoveryFinished(summary);
}

QJsonObject DiscoveryWorker::exportTopology(const QString& format, const QString& path) const {
    const QString normalized = format.trimmed().toLower();
    const QString target = path.isEmpty() ? DiscoveryReportWriter::defaultPath(normalized) : path;
    if (normalized != "dot") {
        return TopologyBuilder::exportImage(
            lastGraph_,
            runConfig_->topologyStyle(),
            target,
            normalized,
            runConfig_->dotProgram());
    }

    QDir dir = QFileInfo(target).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    QFile file(target);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"path", target},
            {"error", "Failed to open topology file for writing."},
        };
    }
    file.write(TopologyBuilder::toDot(lastGraph_, runConfig_->topologyStyle()).toUtf8());
    file.close();
    return {
        {"success", true},
        {"path", target},
        {"format", "dot"},
    };
}

QJsonObject DiscoveryWorker::loadConfig(const QString& path) {
    ToolConfig loaded = *config_;
    QJsonObject result = ToolConfig::loadFromFile(path, &loaded);
    if (!result.value("success").toBool(false)) {
        return result;
    }
    config_ = std::make_shared<const ToolConfig>(loaded);
    if (ownsRestClient_) {
        client_ = makeRestClient();
    }
    const QString logFile = config_->logFile();
    Telemetry::instance().setLogFile(logFile.isEmpty() ? QString() : QDir(QDir::currentPath()).filePath(logFile));
    result.insert("config", config_->toJson());
    return result;
}

void DiscoveryWorker::runAction(const QString& action, const QJsonObject& payload) {
    QElapsedTimer actionTimer;
    actionTimer.start();
    Telemetry::instance().incrementCounter("actions.count");
    QJsonObject result;
    result.insert("success", false);

    const QString path = payload.value("path").toString();
    const bool needsResult = action == "export_csv" || action == "export_json" || action == "export_topology";
    if (needsResult && !hasResult_) {
        result.insert("error", "No discovery result to export yet.");
    } else if (busy_ && needsResult) {
        result.insert("error", "Discovery is still running.");
    } else if (action == "export_csv") {
        const DiscoveryReportWriter writer(*runConfig_);
        result = writer.exportCsv(lastResult_, lastGraph_, path.isEmpty() ? DiscoveryReportWriter::defaultPath("csv") : path);
    } else if (action == "export_json") {
        const DiscoveryReportWriter writer(*runConfig_);
        result =
            writer.exportJson(lastResult_, lastGraph_, path.isEmpty() ? DiscoveryReportWriter::defaultPath("json") : path);
    } else if (action == "export_topology") {
        result = exportTopology(payload.value("format").toString("dot"), path);
    } else if (action == "load_config") {
        result = loadConfig(path);
    } else if (action == "export_telemetry") {
        result = Telemetry::instance().exportToFile(
            path.isEmpty() ? QDir(QDir::currentPath()).filePath("logs/telemetry.json") : path);
    } else {
        result.insert("error", QString("Unknown action '%1'.").arg(action));
    }

    result.insert("action", action);
    if (!result.value("success").toBool(false)) {
        Telemetry::instance().incrementCounter("actions.failures");
    }
    Telemetry::instance().recordDurationMs("actions.duration_ms", actionTimer.elapsed());
    emit actionFinished(result);
}

}  // namespace sscope
