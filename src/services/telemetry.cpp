#include "sscope/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>

namespace sscope {

namespace {

QJsonObject durationToJson(qint64 count, qint64 totalMs, qint64 maxMs) {
    QJsonObject obj;
    obj.insert("count", static_cast<double>(count));
    obj.insert("total_ms", static_cast<double>(totalMs));
    obj.insert("max_ms", static_cast<double>(maxMs));
    obj.insert("avg_ms", count > 0 ? static_cast<double>(totalMs) / static_cast<double>(count) : 0.0);
    return obj;
}

}  // namespace

Telemetry& Telemetry::instance() {
    static Telemetry singleton;
    return singleton;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    const qint64 prev = static_cast<qint64>(counters_.value(key).toDouble(0));
    counters_.insert(key, static_cast<double>(prev + delta));
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    DurationStats& stats = durations_[key];
    stats.count++;
    stats.totalMs += durationMs;
    stats.maxMs = qMax(stats.maxMs, durationMs);
}

void Telemetry::trimEventsLocked() {
    while (events_.size() > maxEvents_) {
        events_.removeFirst();
    }
}

void Telemetry::trimRequestTimesLocked() {
    while (requestTimesMs_.size() > maxRequestSamples_) {
        requestTimesMs_.dequeue();
    }
    const qint64 cutoff = QDateTime::currentMSecsSinceEpoch() - 60000;
    while (!requestTimesMs_.isEmpty() && requestTimesMs_.head() < cutoff) {
        requestTimesMs_.dequeue();
    }
}

void Telemetry::appendLogLineLocked(const QJsonObject& row) const {
    if (logFilePath_.isEmpty()) {
        return;
    }
    QFile file(logFilePath_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return;
    }
    file.write(QJsonDocument(row).toJson(QJsonDocument::Compact));
    file.write("\n");
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    row.insert("epoch_ms", static_cast<double>(QDateTime::currentMSecsSinceEpoch()));
    events_.append(row);
    trimEventsLocked();
    appendLogLineLocked(row);
}

void Telemetry::recordRequest() {
    QMutexLocker lock(&mutex_);
    requestTimesMs_.enqueue(QDateTime::currentMSecsSinceEpoch());
    trimRequestTimesLocked();
}

void Telemetry::setLogFile(const QString& filePath) {
    QMutexLocker lock(&mutex_);
    logFilePath_ = filePath;
    if (logFilePath_.isEmpty()) {
        return;
    }
    QDir dir = QFileInfo(logFilePath_).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }
}

QString Telemetry::logFile() const {
    QMutexLocker lock(&mutex_);
    return logFilePath_;
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonObject durations;
    for (auto it = durations_.constBegin(); it != durations_.constEnd(); ++it) {
        durations.insert(it.key(), durationToJson(it->count, it->totalMs, it->maxMs));
    }

    QJsonObject out;
    out.insert("counters", counters_);
    out.insert("gauges", gauges_);
    out.insert("durations", durations);
    out.insert("events", events_);
    out.insert("requests_per_minute", requestTimesMs_.size());
    out.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    return out;
}

QJsonArray Telemetry::recentEvents(int limit) const {
    QMutexLocker lock(&mutex_);
    QJsonArray out;
    const int start = qMax(0, events_.size() - qMax(0, limit));
    for (int i = start; i < events_.size(); ++i) {
        out.append(events_.at(i));
    }
    return out;
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QJsonObject payload = snapshot();

    QFile file(filePath);
    QDir dir = QFileInfo(file).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }

    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", "Failed to open telemetry export path."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(payload).toJson(QJsonDocument::Indented));
    file.close();
    return {
        {"success", true},
        {"path", filePath},
    };
}

void Telemetry::reset() {
    QMutexLocker lock(&mutex_);
    counters_ = QJsonObject{};
    gauges_ = QJsonObject{};
    durations_.clear();
    events_ = QJsonArray{};
    requestTimesMs_.clear();
}

}  // namespace sscope
