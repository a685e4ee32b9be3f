#pragma once

#include <QVector>

namespace dockpulse {

class ResourceTrend {
public:
    explicit ResourceTrend(int capacity = 60);

    void push(double cpuPercent, double memPercent, qint64 timestampMs);
    void clear();

    int capacity() const { return capacity_; }
    const QVector<double>& cpuHistory() const { return cpuHistory_; }
    const QVector<double>& memoryHistory() const { return memoryHistory_; }
    qint64 lastUpdatedMs() const { return lastUpdatedMs_; }

private:
    static void trim(QVector<double>& history, int capacity);

    int capacity_;
    QVector<double> cpuHistory_;
    QVector<double> memoryHistory_;
    qint64 lastUpdatedMs_ = 0;
};

}  // namespace dockpulse
