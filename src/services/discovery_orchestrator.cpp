#include "sscope/discovery_orchestrator.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QHash>
#include <QJsonArray>
#include <QSet>

#include "sscope/telemetry.hpp"

namespace sscope {

QJsonObject DiscoveryProgress::toJson() const {
    return {
        {"completed", completed},
        {"total", total},
        {"placeholders", placeholderCount},
        {"report", report.toJson()},
    };
}

const InstanceReport* DiscoveryResult::report(const InstanceKey& key) const {
    for (const InstanceReport& item : reports) {
        if (item.key == key) {
            return &item;
        }
    }
    return nullptr;
}

const DiscoveredNode* DiscoveryResult::placeholder(const InstanceKey& key) const {
    for (const DiscoveredNode& item : discovered) {
        if (item.key == key) {
            return &item;
        }
    }
    return nullptr;
}

QJsonObject DiscoveryResult::summaryJson() const {
    int failed = 0;
    int partial = 0;
    for (const InstanceReport& item : reports) {
        if (item.outcome == PollOutcome::Failed) {
            failed++;
        } else if (item.outcome == PollOutcome::Partial) {
            partial++;
        }
    }
    return {
        {"success", success()},
        {"error", error},
        {"started_at_utc", startedAtUtc},
        {"polled", reports.size()},
        {"failed", failed},
        {"partial", partial},
        {"placeholders", discovered.size()},
        {"skipped_duplicates", skippedDuplicates},
        {"cancelled", cancelled},
        {"duration_ms", static_cast<double>(durationMs)},
    };
}

QJsonObject DiscoveryResult::toJson() const {
    QJsonArray reportArray;
    for (const InstanceReport& item : reports) {
        reportArray.append(item.toJson());
    }
    QJsonArray discoveredArray;
    for (const DiscoveredNode& item : discovered) {
        discoveredArray.append(item.toJson());
    }
    QJsonObject out = summaryJson();
    out.insert("reports", reportArray);
    out.insert("discovered", discoveredArray);
    return out;
}

DiscoveryOrchestrator::DiscoveryOrchestrator(InstanceClient& client, const ReportBuilder& builder)
    : client_(client),
      builder_(builder) {}

QString DiscoveryOrchestrator::validateSeeds(const QVector<SeedEntry>& seeds) {
    if (seeds.isEmpty()) {
        return "Seed list is empty.";
    }
    for (const SeedEntry& seed : seeds) {
        if (!seed.key.isValid()) {
            return QString("line %1: '%2' is not a valid instance address")
                .arg(seed.lineNumber)
                .arg(seed.key.toString());
        }
    }
    return {};
}

DiscoveryResult DiscoveryOrchestrator::run(
    const QVector<SeedEntry>& seeds,
    const CancellationToken& token,
    const ProgressCallback& onProgress) const {
    QElapsedTimer runTimer;
    runTimer.start();
    Telemetry& telemetry = Telemetry::instance();

    DiscoveryResult result;
    result.startedAtUtc = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    result.error = validateSeeds(seeds);
    if (!result.error.isEmpty()) {
        telemetry.recordEvent("seed_list_rejected", {{"error", result.error}});
        return result;
    }

    // Seeds not yet reached; adjacencies pointing at them wait for the poll.
    QHash<InstanceKey, int> pending;
    for (const SeedEntry& seed : seeds) {
        pending[seed.key]++;
    }
    const int total = pending.size();
    QSet<InstanceKey> polled;
    QSet<InstanceKey> placeholders;

    const auto addPlaceholder = [&](const InstanceKey& key, const InstanceKey& from, const QString& relation) {
        if (polled.contains(key) || placeholders.contains(key)) {
            return;
        }
        placeholders.insert(key);
        result.discovered.append(DiscoveredNode{key, from, relation});
        telemetry.incrementCounter("discovery.placeholders");
    };

    telemetry.incrementCounter("discovery.runs");
    telemetry.recordEvent("discovery_started", {{"seeds", seeds.size()}, {"unique_instances", total}});

    for (const SeedEntry& seed : seeds) {
        if (token.isCancelled()) {
            result.cancelled = true;
            break;
        }
        pending[seed.key]--;
        if (polled.contains(seed.key)) {
            result.skippedDuplicates++;
            continue;
        }

        InstanceReport report = builder_.build(client_, seed);
        polled.insert(report.key);
        telemetry.incrementCounter("discovery.instances_polled");
        telemetry.recordDurationMs("discovery.instance_duration_ms", report.durationMs);
        if (report.outcome == PollOutcome::Failed) {
            telemetry.incrementCounter("discovery.instances_failed");
        } else if (report.outcome == PollOutcome::Partial) {
            telemetry.incrementCounter("discovery.instances_partial");
        }
        telemetry.recordEvent(
            "instance_polled",
            {
                {"instance", report.key.toString()},
                {"outcome", pollOutcomeName(report.outcome)},
                {"error", report.errorDetail},
                {"duration_ms", static_cast<double>(report.durationMs)},
            });

        for (const Adjacency& adjacency : report.adjacencies) {
            if (pending.value(adjacency.target) > 0) {
                continue;
            }
            addPlaceholder(adjacency.target, report.key, adjacency.relation);
        }
        result.reports.append(report);

        if (onProgress) {
            DiscoveryProgress progress;
            progress.completed = polled.size();
            progress.total = total;
            progress.placeholderCount = result.discovered.size();
            progress.report = report;
            onProgress(progress);
        }
    }

    // Adjacencies deferred for seeds that were never reached still need a node.
    for (const InstanceReport& report : result.reports) {
        for (const Adjacency& adjacency : report.adjacencies) {
            addPlaceholder(adjacency.target, report.key, adjacency.relation);
        }
    }

    result.durationMs = runTimer.elapsed();
    telemetry.recordDurationMs("discovery.run_duration_ms", result.durationMs);
    if (result.cancelled) {
        telemetry.incrementCounter("discovery.cancelled");
        telemetry.recordEvent(
            "discovery_cancelled",
            {{"polled", result.reports.size()}, {"remaining", total - polled.size()}});
    }
    telemetry.recordEvent("discovery_finished", result.summaryJson());
    return result;
}

}  // namespace sscope
