#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QQueue>
#include <QString>

namespace sscope {

// Process-wide counters, durations and a bounded structured event log.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});
    void recordRequest();

    // Events are mirrored to this file as JSON lines. Empty path disables the mirror.
    void setLogFile(const QString& filePath);
    [[nodiscard]] QString logFile() const;

    [[nodiscard]] QJsonObject snapshot() const;
    [[nodiscard]] QJsonArray recentEvents(int limit) const;
    QJsonObject exportToFile(const QString& filePath) const;
    void reset();

private:
    Telemetry() = default;

    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 maxMs = 0;
    };

    void trimEventsLocked();
    void trimRequestTimesLocked();
    void appendLogLineLocked(const QJsonObject& row) const;

    mutable QMutex mutex_;
    QJsonObject counters_;
    QJsonObject gauges_;
    QMap<QString, DurationStats> durations_;
    QJsonArray events_;
    QQueue<qint64> requestTimesMs_;
    QString logFilePath_;

    int maxEvents_ = 1500;
    int maxRequestSamples_ = 2400;
};

}  // namespace sscope
