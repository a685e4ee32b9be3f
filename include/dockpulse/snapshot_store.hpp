#pragma once

#include <QJsonObject>
#include <QString>

#include <memory>

#include "dockpulse/docker_records.hpp"
#include "dockpulse/engine_config.hpp"
#include "dockpulse/resource_trend.hpp"
#include "dockpulse/summary_aggregator.hpp"

namespace dockpulse {

class SnapshotStore {
public:
    explicit SnapshotStore(const EngineConfig& config = {});

    void refresh(const RawOutputs& outputs);
    void replaceSource(SourceKind kind, const QString& raw);
    void clear();

    [[nodiscard]] std::shared_ptr<const DockerSnapshot> current() const { return snapshot_; }
    [[nodiscard]] const ResourceSummary& summary() const { return summary_; }
    [[nodiscard]] const ResourceTrend& trend() const { return trend_; }
    [[nodiscard]] quint64 generation() const { return generation_; }

    QJsonObject toJson() const;

private:
    void publish(std::shared_ptr<const DockerSnapshot> next, bool statsChanged);

    SummaryAggregator aggregator_;
    ResourceTrend trend_;
    std::shared_ptr<const DockerSnapshot> snapshot_;
    ResourceSummary summary_;
    quint64 generation_ = 0;
};

}  // namespace dockpulse
