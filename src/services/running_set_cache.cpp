#include "dockpulse/running_set_cache.hpp"

#include <QDateTime>

#include <utility>

#include "dockpulse/telemetry.hpp"

namespace dockpulse {

RunningSetCache::RunningSetCache(qint64 ttlMs, Clock clock)
    : ttlMs_(qMax<qint64>(0, ttlMs)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return QDateTime::currentMSecsSinceEpoch(); };
    }
}

const QSet<QString>& RunningSetCache::ensure(const std::shared_ptr<const ContainerList>& items) {
    const qint64 nowMs = clock_();
    // An expired weak_ptr locks to null, so a freed list can never match
    // a new one allocated at the same address.
    const bool sameSource = valid_ && items && source_.lock() == items;
    if (sameSource && nowMs - computedAtMs_ < ttlMs_) {
        Telemetry::instance().incrementCounter("running_cache.hits");
        return runningIds_;
    }

    recompute(items, nowMs);
    return runningIds_;
}

void RunningSetCache::recompute(const std::shared_ptr<const ContainerList>& items, qint64 nowMs) {
    QSet<QString> running;
    if (items) {
        for (const ContainerRecord& item : *items) {
            if (isContainerRunning(item.status)) {
                running.insert(item.id);
            }
        }
    }

    runningIds_ = std::move(running);
    source_ = items;
    computedAtMs_ = nowMs;
    valid_ = static_cast<bool>(items);
    Telemetry::instance().incrementCounter("running_cache.recomputes");
}

void RunningSetCache::clear() {
    runningIds_.clear();
    source_.reset();
    computedAtMs_ = 0;
    valid_ = false;
    Telemetry::instance().incrementCounter("running_cache.clears");
}

}  // namespace dockpulse
