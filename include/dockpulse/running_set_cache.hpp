#pragma once

#include <QSet>
#include <QString>

#include <functional>
#include <memory>

#include "dockpulse/docker_records.hpp"

namespace dockpulse {

// In-place status edits on a cached list stay invisible until the TTL
// expires or clear() is called.
class RunningSetCache {
public:
    using Clock = std::function<qint64()>;

    static constexpr qint64 kDefaultTtlMs = 3000;

    explicit RunningSetCache(qint64 ttlMs = kDefaultTtlMs, Clock clock = {});

    const QSet<QString>& ensure(const std::shared_ptr<const ContainerList>& items);
    void clear();

    [[nodiscard]] const QSet<QString>& runningIds() const { return runningIds_; }

private:
    void recompute(const std::shared_ptr<const ContainerList>& items, qint64 nowMs);

    qint64 ttlMs_;
    Clock clock_;
    std::weak_ptr<const ContainerList> source_;
    bool valid_ = false;
    qint64 computedAtMs_ = 0;
    QSet<QString> runningIds_;
};

}  // namespace dockpulse
