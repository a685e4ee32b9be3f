#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace dockpulse {

struct DurationStats {
    qint64 count = 0;
    qint64 totalMs = 0;
    qint64 maxMs = 0;
};

class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] double gauge(const QString& key) const;
    [[nodiscard]] DurationStats duration(const QString& key) const;
    [[nodiscard]] QJsonObject snapshot() const;
    void reset();

private:
    Telemetry() = default;

    mutable QMutex mutex_;
    QHash<QString, qint64> counters_;
    QHash<QString, double> gauges_;
    QHash<QString, DurationStats> durations_;
    QJsonArray events_;

    int maxEvents_ = 500;
};

}  // namespace dockpulse
