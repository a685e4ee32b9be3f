#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "dockpulse/docker_records.hpp"
#include "dockpulse/unit_converter.hpp"

namespace dockpulse {

enum class RankDimension {
    Cpu,
    Mem,
    Net,
};

struct RankedItem {
    StatRecord record;
    int position = 0;
    double sortKey = 0.0;
    double barPercent = 0.0;
    UsageLevel level = UsageLevel::Ok;
    QString valueLabel;
    QString tooltip;
};

struct RankedView {
    RankDimension dimension = RankDimension::Cpu;
    int topN = 5;
    int totalCount = 0;
    QVector<RankedItem> items;

    QStringList names() const;
};

enum class RowOp {
    Enter,
    Update,
    Exit,
};

struct RowInstruction {
    RowOp op = RowOp::Update;
    QString name;
    int position = -1;
    std::optional<RankedItem> item;
};

class RankEngine {
public:
    static constexpr int kDefaultTopN = 5;

    explicit RankEngine(
        double warnPercent = UnitConverter::kDefaultWarnPercent,
        double dangerPercent = UnitConverter::kDefaultDangerPercent);

    static bool isValidTopN(int topN);
    static int normalizeTopN(int topN, int fallback = kDefaultTopN);
    static std::optional<RankDimension> dimensionFromString(const QString& value);
    static QString dimensionName(RankDimension dimension);

    static double sortKey(const StatRecord& stat, RankDimension dimension);
    static StatList dedupeByName(const StatList& stats);
    static StatList sortStats(const StatList& stats, RankDimension dimension);

    RankedView buildView(const StatList& stats, RankDimension dimension, int topN) const;

    QVector<RowInstruction> reconcile(const RankedView& view);
    QVector<RowInstruction> update(const StatList& stats, RankDimension dimension, int topN);
    void reset() { displayed_.clear(); }

    [[nodiscard]] const QStringList& displayedRows() const { return displayed_; }

private:
    RankedItem makeItem(
        const StatRecord& stat,
        RankDimension dimension,
        int position,
        double netMaxBytes) const;
    static QString valueLabel(const StatRecord& stat, RankDimension dimension);
    static QString tooltip(const StatRecord& stat);

    double warnPercent_;
    double dangerPercent_;
    QStringList displayed_;
};

}  // namespace dockpulse
