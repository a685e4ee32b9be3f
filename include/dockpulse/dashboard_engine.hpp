#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <optional>

#include "dockpulse/action_catalog.hpp"
#include "dockpulse/docker_records.hpp"
#include "dockpulse/engine_config.hpp"
#include "dockpulse/rank_engine.hpp"
#include "dockpulse/search_debouncer.hpp"
#include "dockpulse/selection_resolver.hpp"
#include "dockpulse/snapshot_store.hpp"
#include "dockpulse/workbench_types.hpp"

namespace dockpulse {

class DashboardEngine {
public:
    explicit DashboardEngine(const EngineConfig& config = {}, RunningSetCache::Clock clock = {});

    void refresh(const RawOutputs& outputs);
    void replaceSource(SourceKind kind, const QString& raw);

    void setView(DockerView view);
    void setFilters(const FilterState& filters);
    void scheduleSearch(const QString& search) { searchDebouncer_.schedule(search); }
    void cancelSearch() { searchDebouncer_.cancel(); }
    void select(const WorkbenchSelection& selection);
    void setRankDimension(RankDimension dimension) { rankDimension_ = dimension; }
    void setTopN(int topN);

    [[nodiscard]] DockerView view() const { return view_; }
    [[nodiscard]] const FilterState& filters() const { return filters_; }
    [[nodiscard]] const std::optional<WorkbenchSelection>& selection() const { return selection_; }
    [[nodiscard]] RankDimension rankDimension() const { return rankDimension_; }
    [[nodiscard]] int topN() const { return topN_; }
    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] const SnapshotStore& store() const { return store_; }
    [[nodiscard]] const SearchDebouncer& searchDebouncer() const { return searchDebouncer_; }

    QVector<SelectionEntry> entries();
    std::optional<QString> actionTarget(DockerAction action);
    ActionState actionState(DockerAction action, const std::optional<QString>& pendingAction);

    RankedView rankedView() const;
    QVector<RowInstruction> updateRanking();

    void invalidateRunningCache() { resolver_.filter().clearCache(); }

    QJsonObject buildResponse();

private:
    void normalizeSelection();

    EngineConfig config_;
    SnapshotStore store_;
    SelectionResolver resolver_;
    RankEngine rankEngine_;
    SearchDebouncer searchDebouncer_;

    DockerView view_ = DockerView::Containers;
    FilterState filters_;
    std::optional<WorkbenchSelection> selection_;
    RankDimension rankDimension_;
    int topN_;
};

}  // namespace dockpulse
