#pragma once

#include <QSet>
#include <QString>

#include "sscope/health_evaluator.hpp"
#include "sscope/instance_client.hpp"
#include "sscope/instance_key.hpp"
#include "sscope/instance_report.hpp"
#include "sscope/seed_list.hpp"

namespace sscope {

// Polls one instance through an InstanceClient and condenses the answers into
// an InstanceReport. Per-call failures are captured on the report.
class ReportBuilder {
public:
    ReportBuilder(
        const HealthEvaluator& evaluator,
        QSet<InstanceKey> managementConsoles = {},
        int timeoutMs = 8000);

    [[nodiscard]] InstanceReport build(InstanceClient& client, const SeedEntry& seed) const;

    // Turns raw URIs into keyed adjacencies, dropping self references,
    // unparseable entries and exact duplicates.
    static QVector<Adjacency> normalizeAdjacencies(
        const InstanceKey& self,
        const QString& deploymentServerUri,
        const QStringList& clusterMasterUris,
        const QString& shcDeployerUri,
        const QVector<PeerReference>& peers);

private:
    void evaluateHealth(InstanceReport* report) const;
    void recordMetric(InstanceReport* report, const QString& metric, const QString& rawValue) const;

    const HealthEvaluator& evaluator_;
    QSet<InstanceKey> managementConsoles_;
    int timeoutMs_;
};

}  // namespace sscope
