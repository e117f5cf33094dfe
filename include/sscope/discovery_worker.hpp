#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <memory>

#include "sscope/discovery_orchestrator.hpp"
#include "sscope/instance_client.hpp"
#include "sscope/role_classifier.hpp"
#include "sscope/tool_config.hpp"
#include "sscope/topology_builder.hpp"

namespace sscope {

// Background worker that runs discovery and the export actions. Lives on its
// own QThread; slots are invoked through queued connections.
class DiscoveryWorker final : public QObject {
    Q_OBJECT

public:
    // A null client means a RestInstanceClient built from the configuration.
    explicit DiscoveryWorker(
        std::shared_ptr<const ToolConfig> config,
        std::unique_ptr<InstanceClient> client = nullptr,
        QObject* parent = nullptr);

    // Safe to call from any thread. The owned REST client stops before its next
    // request; the run stops before the next instance.
    void requestCancel();
    // Clears a previous cancel. Call before queueing a new run so a cancel
    // issued while the run waits in the queue still applies.
    void resetCancel();

    [[nodiscard]] std::shared_ptr<const ToolConfig> config() const { return config_; }
    [[nodiscard]] const DiscoveryResult& lastResult() const { return lastResult_; }
    [[nodiscard]] const TopologyGraph& lastGraph() const { return lastGraph_; }

public slots:
    void runDiscovery(const QString& seedPath);
    void runAction(const QString& action, const QJsonObject& payload);

signals:
    void instanceCompleted(const QJsonObject& progress);
    void discoveryFinished(const QJsonObject& summary);
    void actionFinished(const QJsonObject& result);

private:
    QJsonObject exportTopology(const QString& format, const QString& path) const;
    QJsonObject loadConfig(const QString& path);
    std::unique_ptr<InstanceClient> makeRestClient() const;

    std::shared_ptr<const ToolConfig> config_;
    // Configuration the last run was made with; exports use its styling.
    std::shared_ptr<const ToolConfig> runConfig_;
    // Declared before client_; the owned REST client points at it.
    CancellationToken cancel_;
    std::unique_ptr<InstanceClient> client_;
    bool ownsRestClient_ = false;
    RoleClassifier classifier_;

    DiscoveryResult lastResult_;
    TopologyGraph lastGraph_;
    bool hasResult_ = false;
    bool busy_ = false;
};

}  // namespace sscope
