#include "dockpulse/dashboard_engine.hpp"

#include <QJsonArray>
#include <QJsonValue>

#include <utility>

#include "dockpulse/telemetry.hpp"

namespace dockpulse {

namespace {

QString viewName(DockerView view) {
    switch (view) {
    case DockerView::Images:
        return "images";
    case DockerView::Stats:
        return "stats";
    case DockerView::Compose:
        return "compose";
    case DockerView::Containers:
        break;
    }
    return "containers";
}

QJsonValue optionalText(const std::optional<QString>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

}  // namespace

DashboardEngine::DashboardEngine(const EngineConfig& config, RunningSetCache::Clock clock)
    : config_(config),
      store_(config),
      resolver_(config.runningCacheTtlMs, std::move(clock)),
      rankEngine_(config.usageWarnPercent, config.usageDangerPercent),
      searchDebouncer_(config.searchDebounceMs),
      rankDimension_(config.defaultDimension),
      topN_(RankEngine::normalizeTopN(config.defaultTopN)) {
    QObject::connect(
        &searchDebouncer_, &SearchDebouncer::triggered, &searchDebouncer_, [this](const QString& search) {
            setFilters({search, filters_.status});
        });
}

void DashboardEngine::refresh(const RawOutputs& outputs) {
    store_.refresh(outputs);
    normalizeSelection();
}

void DashboardEngine::replaceSource(SourceKind kind, const QString& raw) {
    store_.replaceSource(kind, raw);
    normalizeSelection();
}

void DashboardEngine::setView(DockerView view) {
    if (view_ == view) {
        return;
    }
    view_ = view;
    normalizeSelection();
}

void DashboardEngine::setFilters(const FilterState& filters) {
    filters_ = filters;
    normalizeSelection();
}

void DashboardEngine::select(const WorkbenchSelection& selection) {
    selection_ = selection;
    normalizeSelection();
}

void DashboardEngine::setTopN(int topN) {
    topN_ = RankEngine::normalizeTopN(topN, topN_);
}

void DashboardEngine::normalizeSelection() {
    const std::shared_ptr<const DockerSnapshot> snapshot = store_.current();
    selection_ = resolver_.normalizeSelection(view_, *snapshot, filters_, selection_);
}

QVector<SelectionEntry> DashboardEngine::entries() {
    const std::shared_ptr<const DockerSnapshot> snapshot = store_.current();
    return resolver_.getEntries(view_, *snapshot, filters_);
}

std::optional<QString> DashboardEngine::actionTarget(DockerAction action) {
    const std::shared_ptr<const DockerSnapshot> snapshot = store_.current();
    return resolver_.resolveActionTarget(action, view_, *snapshot, filters_, selection_);
}

ActionState DashboardEngine::actionState(
    DockerAction action,
    const std::optional<QString>& pendingAction) {
    const std::shared_ptr<const DockerSnapshot> snapshot = store_.current();
    const std::optional<SelectionEntry> entry =
        resolver_.findEntry(view_, *snapshot, filters_, selection_);

    std::optional<SelectionKind> kind;
    std::optional<QString> target;
    if (entry.has_value()) {
        kind = entry->kind;
        if (ActionCatalog::supportsKind(action, entry->kind)) {
            target = entry->target;
        }
    }
    return ActionCatalog::resolveActionState(action, kind, target, pendingAction);
}

RankedView DashboardEngine::rankedView() const {
    return rankEngine_.buildView(*store_.current()->stats, rankDimension_, topN_);
}

QVector<RowInstruction> DashboardEngine::updateRanking() {
    return rankEngine_.reconcile(rankedView());
}

QJsonObject DashboardEngine::buildResponse() {
    QJsonObject response = store_.toJson();
    response.insert("view", viewName(view_));
    response.insert("search", filters_.search);

    QJsonArray entryRows;
    for (const SelectionEntry& entry : entries()) {
        QJsonObject row;
        row.insert("kind", selectionKindName(entry.kind));
        row.insert("key", entry.key);
        row.insert("title", entry.title);
        row.insert("subtitle", entry.subtitle);
        row.insert("target", optionalText(entry.target));
        entryRows.append(row);
    }
    response.insert("entries", entryRows);

    if (selection_.has_value()) {
        response.insert("selection", QJsonObject{
            {"kind", selectionKindName(selection_->kind)},
            {"key", selection_->key},
        });
    } else {
        response.insert("selection", QJsonValue(QJsonValue::Null));
    }

    QJsonArray actions;
    for (const ActionMeta& meta : ActionCatalog::all()) {
        const ActionState state = actionState(meta.action, std::nullopt);
        actions.append(QJsonObject{
            {"action", actionName(meta.action)},
            {"label", meta.label},
            {"danger", meta.risk == ActionRisk::Danger},
            {"disabled", state.disabled},
            {"reason", optionalText(state.reason)},
            {"target", optionalText(state.target)},
        });
    }
    response.insert("actions", actions);

    Telemetry::instance().incrementCounter("dashboard.responses");
    response.insert("telemetry", Telemetry::instance().snapshot());
    return response;
}

}  // namespace dockpulse
