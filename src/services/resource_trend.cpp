#include "dockpulse/resource_trend.hpp"

#include "dockpulse/unit_converter.hpp"

namespace dockpulse {

ResourceTrend::ResourceTrend(int capacity)
    : capacity_(qMax(1, capacity)) {}

void ResourceTrend::trim(QVector<double>& history, int capacity) {
    if (history.size() > capacity) {
        history.remove(0, history.size() - capacity);
    }
}

void ResourceTrend::push(double cpuPercent, double memPercent, qint64 timestampMs) {
    cpuHistory_.append(UnitConverter::clampPercent(cpuPercent));
    memoryHistory_.append(UnitConverter::clampPercent(memPercent));
    trim(cpuHistory_, capacity_);
    trim(memoryHistory_, capacity_);
    lastUpdatedMs_ = timestampMs;
}

void ResourceTrend::clear() {
    cpuHistory_.clear();
    memoryHistory_.clear();
    lastUpdatedMs_ = 0;
}

}  // namespace dockpulse
