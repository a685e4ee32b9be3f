#include "dockpulse/rank_engine.hpp"

#include <QHash>
#include <QSet>

#include <algorithm>
#include <iterator>

#include "dockpulse/telemetry.hpp"

namespace dockpulse {

namespace {

constexpr int kTopNOptions[] = {3, 5, 10};

double netTotal(const StatRecord& stat) {
    return stat.netRxBytes + stat.netTxBytes;
}

QString percentText(const std::optional<double>& percent) {
    return percent.has_value() ? QString::number(*percent, 'f', 1) + "%" : QString("--");
}

}  // namespace

QStringList RankedView::names() const {
    QStringList out;
    out.reserve(items.size());
    for (const RankedItem& item : items) {
        out.append(item.record.name);
    }
    return out;
}

RankEngine::RankEngine(double warnPercent, double dangerPercent)
    : warnPercent_(warnPercent),
      dangerPercent_(dangerPercent) {}

bool RankEngine::isValidTopN(int topN) {
    return std::find(std::begin(kTopNOptions), std::end(kTopNOptions), topN)
        != std::end(kTopNOptions);
}

int RankEngine::normalizeTopN(int topN, int fallback) {
    if (isValidTopN(topN)) {
        return topN;
    }
    return isValidTopN(fallback) ? fallback : kDefaultTopN;
}

std::optional<RankDimension> RankEngine::dimensionFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "cpu") {
        return RankDimension::Cpu;
    }
    if (normalized == "mem") {
        return RankDimension::Mem;
    }
    if (normalized == "net") {
        return RankDimension::Net;
    }
    return std::nullopt;
}

QString RankEngine::dimensionName(RankDimension dimension) {
    switch (dimension) {
    case RankDimension::Mem:
        return "mem";
    case RankDimension::Net:
        return "net";
    case RankDimension::Cpu:
        break;
    }
    return "cpu";
}

double RankEngine::sortKey(const StatRecord& stat, RankDimension dimension) {
    switch (dimension) {
    case RankDimension::Mem:
        return stat.memUsagePercent.value_or(0.0);
    case RankDimension::Net:
        return netTotal(stat);
    case RankDimension::Cpu:
        break;
    }
    return stat.cpuPercent;
}

StatList RankEngine::dedupeByName(const StatList& stats) {
    QHash<QString, int> lastIndex;
    for (int i = 0; i < stats.size(); ++i) {
        lastIndex.insert(stats[i].name, i);
    }
    if (lastIndex.size() == stats.size()) {
        return stats;
    }

    StatList out;
    out.reserve(lastIndex.size());
    for (int i = 0; i < stats.size(); ++i) {
        if (lastIndex.value(stats[i].name) == i) {
            out.append(stats[i]);
        }
    }
    return out;
}

StatList RankEngine::sortStats(const StatList& stats, RankDimension dimension) {
    StatList sorted = stats;
    std::stable_sort(sorted.begin(), sorted.end(), [dimension](const StatRecord& a, const StatRecord& b) {
        return sortKey(a, dimension) > sortKey(b, dimension);
    });
    return sorted;
}

QString RankEngine::valueLabel(const StatRecord& stat, RankDimension dimension) {
    switch (dimension) {
    case RankDimension::Mem: {
        QString used = stat.memUsageText.split('/').value(0).trimmed();
        if (used.isEmpty()) {
            used = "--";
        }
        return QString("%1 (%2)").arg(used, percentText(stat.memUsagePercent));
    }
    case RankDimension::Net:
        return stat.netIoText;
    case RankDimension::Cpu:
        break;
    }
    return stat.cpuText;
}

QString RankEngine::tooltip(const StatRecord& stat) {
    return QString("CPU: %1 | MEM: %2 (%3) | NET: %4")
        .arg(stat.cpuText, stat.memUsageText, percentText(stat.memUsagePercent), stat.netIoText);
}

RankedItem RankEngine::makeItem(
    const StatRecord& stat,
    RankDimension dimension,
    int position,
    double netMaxBytes) const {
    RankedItem item;
    item.record = stat;
    item.position = position;
    item.sortKey = sortKey(stat, dimension);
    item.valueLabel = valueLabel(stat, dimension);
    item.tooltip = tooltip(stat);

    if (dimension == RankDimension::Net) {
        item.barPercent = netMaxBytes > 0.0 ? (netTotal(stat) / netMaxBytes) * 100.0 : 0.0;
        item.level = UsageLevel::Ok;
    } else {
        item.barPercent = UnitConverter::clampPercent(item.sortKey);
        item.level = UnitConverter::usageLevel(item.barPercent, warnPercent_, dangerPercent_);
    }
    return item;
}

RankedView RankEngine::buildView(const StatList& stats, RankDimension dimension, int topN) const {
    RankedView view;
    view.dimension = dimension;
    view.topN = topN > 0 ? topN : kDefaultTopN;

    const StatList sorted = sortStats(dedupeByName(stats), dimension);
    view.totalCount = static_cast<int>(sorted.size());
    const StatList visible = sorted.mid(0, view.topN);

    // Net bars are relative to the busiest visible row, not the whole set.
    double netMaxBytes = 0.0;
    if (dimension == RankDimension::Net) {
        for (const StatRecord& stat : visible) {
            netMaxBytes = qMax(netMaxBytes, netTotal(stat));
        }
    }

    view.items.reserve(visible.size());
    for (int i = 0; i < visible.size(); ++i) {
        view.items.append(makeItem(visible[i], dimension, i, netMaxBytes));
    }
    return view;
}

QVector<RowInstruction> RankEngine::reconcile(const RankedView& view) {
    const QStringList nextNames = view.names();
    const QSet<QString> visibleNames(nextNames.cbegin(), nextNames.cend());
    const QSet<QString> previousNames(displayed_.cbegin(), displayed_.cend());

    QVector<RowInstruction> instructions;
    int exits = 0;
    int updates = 0;
    int enters = 0;

    for (int i = 0; i < displayed_.size(); ++i) {
        if (visibleNames.contains(displayed_[i])) {
            continue;
        }
        RowInstruction exit;
        exit.op = RowOp::Exit;
        exit.name = displayed_[i];
        exit.position = i;
        instructions.append(exit);
        exits++;
    }

    for (const RankedItem& item : view.items) {
        RowInstruction row;
        row.name = item.record.name;
        row.position = item.position;
        row.item = item;
        if (previousNames.contains(item.record.name)) {
            row.op = RowOp::Update;
            updates++;
        } else {
            row.op = RowOp::Enter;
            enters++;
        }
        instructions.append(row);
    }

    displayed_ = nextNames;

    Telemetry& telemetry = Telemetry::instance();
    telemetry.incrementCounter("rank.rows_added", enters);
    telemetry.incrementCounter("rank.rows_updated", updates);
    telemetry.incrementCounter("rank.rows_removed", exits);
    return instructions;
}

QVector<RowInstruction> RankEngine::update(const StatList& stats, RankDimension dimension, int topN) {
    return reconcile(buildView(stats, dimension, topN));
}

}  // namespace dockpulse
