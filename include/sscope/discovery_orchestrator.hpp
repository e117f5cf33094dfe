#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <functional>

#include "sscope/cancellation_token.hpp"
#include "sscope/instance_client.hpp"
#include "sscope/instance_report.hpp"
#include "sscope/report_builder.hpp"
#include "sscope/seed_list.hpp"

namespace sscope {

struct DiscoveryProgress {
    int completed = 0;
    int total = 0;
    int placeholderCount = 0;
    InstanceReport report;

    [[nodiscard]] QJsonObject toJson() const;
};

struct DiscoveryResult {
    QVector<InstanceReport> reports;
    QVector<DiscoveredNode> discovered;
    bool cancelled = false;
    int skippedDuplicates = 0;
    qint64 durationMs = 0;
    QString startedAtUtc;
    // Set only when the seed list was rejected before polling.
    QString error;

    [[nodiscard]] bool success() const { return error.isEmpty(); }
    [[nodiscard]] const InstanceReport* report(const InstanceKey& key) const;
    [[nodiscard]] const DiscoveredNode* placeholder(const InstanceKey& key) const;
    [[nodiscard]] QJsonObject summaryJson() const;
    [[nodiscard]] QJsonObject toJson() const;
};

using ProgressCallback = std::function<void(const DiscoveryProgress&)>;

// Polls every seed once, in order, and gathers the unpolled instances their
// adjacencies reference as placeholders. Only seeds are ever polled.
class DiscoveryOrchestrator {
public:
    DiscoveryOrchestrator(InstanceClient& client, const ReportBuilder& builder);

    DiscoveryResult run(
        const QVector<SeedEntry>& seeds,
        const CancellationToken& token,
        const ProgressCallback& onProgress = {}) const;

    // Empty string when the list can be polled.
    static QString validateSeeds(const QVector<SeedEntry>& seeds);

private:
    InstanceClient& client_;
    const ReportBuilder& builder_;
};

}  // namespace sscope
