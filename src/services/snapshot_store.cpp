#include "dockpulse/snapshot_store.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonArray>

#include <utility>

#include "dockpulse/table_parser.hpp"
#include "dockpulse/telemetry.hpp"

namespace dockpulse {

namespace {

template <typename Record>
QJsonArray toJsonArray(const QVector<Record>& items) {
    QJsonArray out;
    for (const Record& item : items) {
        out.append(toJson(item));
    }
    return out;
}

QJsonArray historyArray(const QVector<double>& values) {
    QJsonArray out;
    for (double value : values) {
        out.append(value);
    }
    return out;
}

}  // namespace

SnapshotStore::SnapshotStore(const EngineConfig& config)
    : aggregator_(config.placeholderText),
      trend_(config.trendCapacity),
      snapshot_(std::make_shared<const DockerSnapshot>()),
      summary_(aggregator_.empty()) {}

void SnapshotStore::refresh(const RawOutputs& outputs) {
    QElapsedTimer timer;
    timer.start();
    publish(std::make_shared<const DockerSnapshot>(TableParser::parseSnapshot(outputs)), true);
    Telemetry::instance().recordDurationMs("snapshot.refresh_ms", timer.elapsed());
}

void SnapshotStore::replaceSource(SourceKind kind, const QString& raw) {
    QElapsedTimer timer;
    timer.start();
    DockerSnapshot next = *snapshot_;
    switch (kind) {
    case SourceKind::Containers:
        next.containers = std::make_shared<const ContainerList>(TableParser::parseContainers(raw));
        break;
    case SourceKind::Images:
        next.images = std::make_shared<const ImageList>(TableParser::parseImages(raw));
        break;
    case SourceKind::Stats:
        next.stats = std::make_shared<const StatList>(TableParser::parseStats(raw));
        break;
    case SourceKind::Compose:
        next.compose = std::make_shared<const ComposeList>(TableParser::parseCompose(raw));
        break;
    }
    publish(std::make_shared<const DockerSnapshot>(std::move(next)), kind == SourceKind::Stats);
    Telemetry::instance().recordDurationMs(
        QString("snapshot.replace.%1_ms").arg(sourceKindName(kind)), timer.elapsed());
}

void SnapshotStore::clear() {
    snapshot_ = std::make_shared<const DockerSnapshot>();
    summary_ = aggregator_.empty();
    trend_.clear();
    generation_++;
}

void SnapshotStore::publish(std::shared_ptr<const DockerSnapshot> next, bool statsChanged) {
    ResourceSummary summary = aggregator_.build(*next);
    if (statsChanged && !next->stats->isEmpty()) {
        trend_.push(
            summary.avgCpuPercent,
            summary.totalMemUsagePercent.value_or(0.0),
            QDateTime::currentMSecsSinceEpoch());
    }

    snapshot_ = std::move(next);
    summary_ = std::move(summary);
    generation_++;

    Telemetry& telemetry = Telemetry::instance();
    telemetry.incrementCounter("snapshot.generations");
    telemetry.setGauge("snapshot.containers", summary_.totalContainers);
    telemetry.setGauge("snapshot.running_containers", summary_.runningContainers);
    telemetry.setGauge("snapshot.images", summary_.totalImages);
    telemetry.setGauge("snapshot.compose_projects", summary_.composeProjects);
}

QJsonObject SnapshotStore::toJson() const {
    const std::shared_ptr<const DockerSnapshot> snapshot = snapshot_;
    QJsonObject out;
    out.insert("generation", static_cast<double>(generation_));
    out.insert("containers", toJsonArray(*snapshot->containers));
    out.insert("images", toJsonArray(*snapshot->images));
    out.insert("stats", toJsonArray(*snapshot->stats));
    out.insert("compose", toJsonArray(*snapshot->compose));
    out.insert("summary", dockpulse::toJson(summary_));
    out.insert("trend", QJsonObject{
        {"cpu", historyArray(trend_.cpuHistory())},
        {"memory", historyArray(trend_.memoryHistory())},
        {"updated_ms", static_cast<double>(trend_.lastUpdatedMs())},
    });
    return out;
}

}  // namespace dockpulse
