#include "dockpulse/selection_resolver.hpp"

#include <QJsonObject>
#include <QRegularExpression>

#include <utility>

#include "dockpulse/action_catalog.hpp"
#include "dockpulse/telemetry.hpp"

namespace dockpulse {

SelectionResolver::SelectionResolver(qint64 runningCacheTtlMs, RunningSetCache::Clock clock)
    : filter_(runningCacheTtlMs, std::move(clock)) {}

std::optional<QString> SelectionResolver::normalizeImageTarget(const QString& rawId) {
    static const QRegularExpression digestPrefix(
        "^sha(256|384|512):", QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression disallowed("[^A-Za-z0-9._-]");

    const QString trimmed = rawId.trimmed();
    if (trimmed.isEmpty() || trimmed == "--") {
        return std::nullopt;
    }

    QString normalized = trimmed;
    normalized.remove(digestPrefix);
    normalized.remove(disallowed);
    if (normalized.isEmpty()) {
        return std::nullopt;
    }
    return normalized;
}

QVector<SelectionEntry> SelectionResolver::containerEntries(
    const DockerSnapshot& snapshot,
    const FilterState& filters) {
    QVector<SelectionEntry> entries;
    for (const ContainerRecord& item : filter_.filterContainers(snapshot.containers, filters)) {
        SelectionEntry entry;
        entry.kind = SelectionKind::Container;
        entry.key = item.id;
        entry.title = item.name;
        entry.subtitle = item.status;
        entry.target = item.name;
        entries.append(entry);
    }
    return entries;
}

QVector<SelectionEntry> SelectionResolver::imageEntries(
    const ImageList& items,
    const QString& search) const {
    QVector<SelectionEntry> entries;
    for (const ImageRecord& item : filter_.filterImages(items, search)) {
        SelectionEntry entry;
        entry.kind = SelectionKind::Image;
        entry.key = item.id;
        entry.title = QString("%1:%2").arg(item.repository, item.tag);
        entry.subtitle = QString("%1 · %2").arg(item.size, item.id);
        entry.target = normalizeImageTarget(item.id);
        entries.append(entry);
    }
    return entries;
}

QVector<SelectionEntry> SelectionResolver::statEntries(
    const StatList& items,
    const QString& search) const {
    QVector<SelectionEntry> entries;
    for (const StatRecord& item : filter_.filterStats(items, search)) {
        SelectionEntry entry;
        entry.kind = SelectionKind::Stat;
        entry.key = item.name;
        entry.title = item.name;
        entry.subtitle = QString("CPU %1 · MEM %2").arg(item.cpuText, item.memUsageText);
        entries.append(entry);
    }
    return entries;
}

QVector<SelectionEntry> SelectionResolver::composeEntries(
    const ComposeList& items,
    const QString& search) const {
    QVector<SelectionEntry> entries;
    for (const ComposeRecord& item : filter_.filterCompose(items, search)) {
        SelectionEntry entry;
        entry.kind = SelectionKind::Compose;
        entry.key = item.name;
        entry.title = item.name;
        entry.subtitle = item.status;
        entries.append(entry);
    }
    return entries;
}

QVector<SelectionEntry> SelectionResolver::getEntries(
    DockerView view,
    const DockerSnapshot& snapshot,
    const FilterState& filters) {
    switch (view) {
    case DockerView::Containers:
        return containerEntries(snapshot, filters);
    case DockerView::Images:
        return imageEntries(*snapshot.images, filters.search);
    case DockerView::Stats:
        return statEntries(*snapshot.stats, filters.search);
    case DockerView::Compose:
        return composeEntries(*snapshot.compose, filters.search);
    }
    return {};
}

std::optional<WorkbenchSelection> SelectionResolver::normalizeSelection(
    DockerView view,
    const DockerSnapshot& snapshot,
    const FilterState& filters,
    const std::optional<WorkbenchSelection>& previous) {
    const QVector<SelectionEntry> entries = getEntries(view, snapshot, filters);
    if (entries.isEmpty()) {
        return std::nullopt;
    }

    const SelectionKind kind = selectionKindForView(view);
    if (previous.has_value() && previous->kind == kind) {
        for (const SelectionEntry& entry : entries) {
            if (entry.key == previous->key) {
                return previous;
            }
        }
    }

    return WorkbenchSelection{kind, entries.first().key};
}

std::optional<SelectionEntry> SelectionResolver::findEntry(
    DockerView view,
    const DockerSnapshot& snapshot,
    const FilterState& filters,
    const std::optional<WorkbenchSelection>& selection) {
    if (!selection.has_value()) {
        return std::nullopt;
    }

    for (const SelectionEntry& entry : getEntries(view, snapshot, filters)) {
        if (entry.kind == selection->kind && entry.key == selection->key) {
            return entry;
        }
    }
    return std::nullopt;
}

std::optional<QString> SelectionResolver::resolveActionTarget(
    DockerAction action,
    DockerView view,
    const DockerSnapshot& snapshot,
    const FilterState& filters,
    const std::optional<WorkbenchSelection>& selection) {
    const std::optional<SelectionEntry> entry = findEntry(view, snapshot, filters, selection);
    if (!entry.has_value()) {
        return std::nullopt;
    }

    if (!ActionCatalog::supportsKind(action, entry->kind)) {
        Telemetry::instance().incrementCounter("selection.target_rejected");
        Telemetry::instance().recordEvent(
            "selection.target_rejected",
            {
                {"action", actionName(action)},
                {"selection_kind", selectionKindName(entry->kind)},
                {"key", entry->key},
            });
        return std::nullopt;
    }
    return entry->target;
}

std::optional<QString> SelectionResolver::resolveActionTarget(
    const QString& action,
    DockerView view,
    const DockerSnapshot& snapshot,
    const FilterState& filters,
    const std::optional<WorkbenchSelection>& selection) {
    const std::optional<DockerAction> parsed = actionFromString(action);
    if (!parsed.has_value()) {
        Telemetry::instance().incrementCounter("selection.unknown_action");
        return std::nullopt;
    }
    return resolveActionTarget(*parsed, view, snapshot, filters, selection);
}

}  // namespace dockpulse
