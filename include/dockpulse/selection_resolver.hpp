#pragma once

#include <QString>
#include <QVector>

#include <optional>

#include "dockpulse/docker_records.hpp"
#include "dockpulse/record_filter.hpp"
#include "dockpulse/workbench_types.hpp"

namespace dockpulse {

class SelectionResolver {
public:
    explicit SelectionResolver(
        qint64 runningCacheTtlMs = RunningSetCache::kDefaultTtlMs,
        RunningSetCache::Clock clock = {});

    QVector<SelectionEntry> getEntries(
        DockerView view,
        const DockerSnapshot& snapshot,
        const FilterState& filters);

    std::optional<WorkbenchSelection> normalizeSelection(
        DockerView view,
        const DockerSnapshot& snapshot,
        const FilterState& filters,
        const std::optional<WorkbenchSelection>& previous);

    std::optional<SelectionEntry> findEntry(
        DockerView view,
        const DockerSnapshot& snapshot,
        const FilterState& filters,
        const std::optional<WorkbenchSelection>& selection);

    std::optional<QString> resolveActionTarget(
        DockerAction action,
        DockerView view,
        const DockerSnapshot& snapshot,
        const FilterState& filters,
        const std::optional<WorkbenchSelection>& selection);
    std::optional<QString> resolveActionTarget(
        const QString& action,
        DockerView view,
        const DockerSnapshot& snapshot,
        const FilterState& filters,
        const std::optional<WorkbenchSelection>& selection);

    static std::optional<QString> normalizeImageTarget(const QString& rawId);

    RecordFilter& filter() { return filter_; }

private:
    QVector<SelectionEntry> containerEntries(
        const DockerSnapshot& snapshot,
        const FilterState& filters);
    QVector<SelectionEntry> imageEntries(const ImageList& items, const QString& search) const;
    QVector<SelectionEntry> statEntries(const StatList& items, const QString& search) const;
    QVector<SelectionEntry> composeEntries(const ComposeList& items, const QString& search) const;

    RecordFilter filter_;
};

}  // namespace dockpulse
