#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "dockpulse/rank_engine.hpp"
#include "dockpulse/running_set_cache.hpp"
#include "dockpulse/unit_converter.hpp"

namespace dockpulse {

struct EngineConfig {
    qint64 runningCacheTtlMs = RunningSetCache::kDefaultTtlMs;
    int defaultTopN = RankEngine::kDefaultTopN;
    RankDimension defaultDimension = RankDimension::Cpu;
    int searchDebounceMs = 100;
    int trendCapacity = 60;
    double usageWarnPercent = UnitConverter::kDefaultWarnPercent;
    double usageDangerPercent = UnitConverter::kDefaultDangerPercent;
    QString placeholderText = "Not measured";

    static EngineConfig fromJson(const QJsonObject& payload);
    QJsonObject toJson() const;

    QJsonObject load(const QByteArray& document);
};

}  // namespace dockpulse
