#include "dockpulse/record_filter.hpp"

#include <utility>

namespace dockpulse {

namespace {

template <typename Record>
QVector<Record> filterBySearch(const QVector<Record>& items, const QString& search) {
    const QString normalized = RecordFilter::normalizeSearch(search);
    if (normalized.isEmpty()) {
        return items;
    }
    QVector<Record> out;
    for (const Record& item : items) {
        if (RecordFilter::matchesSearch(item, normalized)) {
            out.append(item);
        }
    }
    return out;
}

}  // namespace

RecordFilter::RecordFilter(qint64 runningCacheTtlMs, RunningSetCache::Clock clock)
    : runningCache_(runningCacheTtlMs, std::move(clock)) {}

QString RecordFilter::normalizeSearch(const QString& search) {
    return search.trimmed().toLower();
}

bool RecordFilter::matchesSearch(const ContainerRecord& item, const QString& normalizedSearch) {
    return normalizedSearch.isEmpty()
        || item.name.toLower().contains(normalizedSearch)
        || item.id.toLower().contains(normalizedSearch)
        || item.status.toLower().contains(normalizedSearch)
        || item.ports.toLower().contains(normalizedSearch);
}

bool RecordFilter::matchesSearch(const ImageRecord& item, const QString& normalizedSearch) {
    return normalizedSearch.isEmpty()
        || item.repository.toLower().contains(normalizedSearch)
        || item.tag.toLower().contains(normalizedSearch)
        || item.id.toLower().contains(normalizedSearch);
}

bool RecordFilter::matchesSearch(const StatRecord& item, const QString& normalizedSearch) {
    return normalizedSearch.isEmpty() || item.name.toLower().contains(normalizedSearch);
}

bool RecordFilter::matchesSearch(const ComposeRecord& item, const QString& normalizedSearch) {
    return normalizedSearch.isEmpty()
        || item.name.toLower().contains(normalizedSearch)
        || item.status.toLower().contains(normalizedSearch)
        || item.configFiles.toLower().contains(normalizedSearch);
}

ContainerList RecordFilter::filterContainers(
    const std::shared_ptr<const ContainerList>& items,
    const FilterState& filters) {
    ContainerList out;
    if (!items) {
        return out;
    }

    const QSet<QString>& running = runningCache_.ensure(items);
    const QString search = normalizeSearch(filters.search);
    for (const ContainerRecord& item : *items) {
        if (!matchesSearch(item, search)) {
            continue;
        }
        if (filters.status == StatusFilter::Running && !running.contains(item.id)) {
            continue;
        }
        if (filters.status == StatusFilter::Exited && running.contains(item.id)) {
            continue;
        }
        out.append(item);
    }
    return out;
}

ImageList RecordFilter::filterImages(const ImageList& items, const QString& search) const {
    return filterBySearch(items, search);
}

StatList RecordFilter::filterStats(const StatList& items, const QString& search) const {
    return filterBySearch(items, search);
}

ComposeList RecordFilter::filterCompose(const ComposeList& items, const QString& search) const {
    return filterBySearch(items, search);
}

}  // namespace dockpulse
