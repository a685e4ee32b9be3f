#include "dockpulse/telemetry.hpp"

#include <QDateTime>
#include <QMutexLocker>

namespace dockpulse {

Telemetry& Telemetry::instance() {
    static Telemetry singleton;
    return singleton;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
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

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("epoch_ms", static_cast<double>(QDateTime::currentMSecsSinceEpoch()));
    events_.append(row);
    while (events_.size() > maxEvents_) {
        events_.removeFirst();
    }
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

double Telemetry::gauge(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return gauges_.value(key, 0.0);
}

DurationStats Telemetry::duration(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return durations_.value(key);
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonObject counters;
    for (auto it = counters_.cbegin(); it != counters_.cend(); ++it) {
        counters.insert(it.key(), static_cast<double>(it.value()));
    }
    QJsonObject gauges;
    for (auto it = gauges_.cbegin(); it != gauges_.cend(); ++it) {
        gauges.insert(it.key(), it.value());
    }
    QJsonObject durations;
    for (auto it = durations_.cbegin(); it != durations_.cend(); ++it) {
        durations.insert(it.key(), QJsonObject{
            {"count", static_cast<double>(it.value().count)},
            {"total_ms", static_cast<double>(it.value().totalMs)},
            {"max_ms", static_cast<double>(it.value().maxMs)},
        });
    }

    QJsonObject out;
    out.insert("counters", counters);
    out.insert("gauges", gauges);
    out.insert("durations", durations);
    out.insert("events", events_);
    return out;
}

void Telemetry::reset() {
    QMutexLocker lock(&mutex_);
    counters_.clear();
    gauges_.clear();
    durations_.clear();
    events_ = QJsonArray{};
}

}  // namespace dockpulse
