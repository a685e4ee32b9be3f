#pragma once

#include <QString>

#include <memory>

#include "dockpulse/docker_records.hpp"
#include "dockpulse/running_set_cache.hpp"

namespace dockpulse {

class RecordFilter {
public:
    explicit RecordFilter(
        qint64 runningCacheTtlMs = RunningSetCache::kDefaultTtlMs,
        RunningSetCache::Clock clock = {});

    ContainerList filterContainers(
        const std::shared_ptr<const ContainerList>& items,
        const FilterState& filters);
    ImageList filterImages(const ImageList& items, const QString& search) const;
    StatList filterStats(const StatList& items, const QString& search) const;
    ComposeList filterCompose(const ComposeList& items, const QString& search) const;

    static bool matchesSearch(const ContainerRecord& item, const QString& normalizedSearch);
    static bool matchesSearch(const ImageRecord& item, const QString& normalizedSearch);
    static bool matchesSearch(const StatRecord& item, const QString& normalizedSearch);
    static bool matchesSearch(const ComposeRecord& item, const QString& normalizedSearch);
    static QString normalizeSearch(const QString& search);

    void clearCache() { runningCache_.clear(); }

private:
    RunningSetCache runningCache_;
};

}  // namespace dockpulse
