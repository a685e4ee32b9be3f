#include "dockpulse/summary_aggregator.hpp"

#include <utility>

#include "dockpulse/unit_converter.hpp"

namespace dockpulse {

SummaryAggregator::SummaryAggregator(QString placeholderText)
    : placeholderText_(std::move(placeholderText)) {}

ResourceSummary SummaryAggregator::empty() const {
    ResourceSummary summary;
    summary.memUsageText = placeholderText_;
    summary.netRxText = placeholderText_;
    summary.netTxText = placeholderText_;
    return summary;
}

ResourceSummary SummaryAggregator::build(
    const ContainerList& containers,
    const ImageList& images,
    const StatList& stats,
    const ComposeList& compose) const {
    ResourceSummary summary = empty();
    summary.totalContainers = static_cast<int>(containers.size());
    summary.totalImages = static_cast<int>(images.size());
    summary.composeProjects = static_cast<int>(compose.size());

    for (const ContainerRecord& container : containers) {
        if (isContainerRunning(container.status)) {
            summary.runningContainers++;
        }
    }

    double memUsed = 0.0;
    double memLimit = 0.0;
    double rx = 0.0;
    double tx = 0.0;
    for (const StatRecord& stat : stats) {
        summary.totalCpuPercent += stat.cpuPercent;
        memUsed += stat.memUsedBytes.value_or(0.0);
        memLimit += stat.memLimitBytes.value_or(0.0);
        rx += stat.netRxBytes;
        tx += stat.netTxBytes;
    }
    summary.avgCpuPercent = stats.isEmpty() ? 0.0 : summary.totalCpuPercent / stats.size();

    if (memLimit > 0.0) {
        summary.totalMemUsagePercent = (memUsed / memLimit) * 100.0;
        summary.memUsageText = QString("%1 / %2").arg(
            UnitConverter::formatBytes(memUsed), UnitConverter::formatBytes(memLimit));
    }
    if (rx > 0.0) {
        summary.netRxText = UnitConverter::formatBytes(rx);
    }
    if (tx > 0.0) {
        summary.netTxText = UnitConverter::formatBytes(tx);
    }
    return summary;
}

ResourceSummary SummaryAggregator::build(const DockerSnapshot& snapshot) const {
    return build(*snapshot.containers, *snapshot.images, *snapshot.stats, *snapshot.compose);
}

}  // namespace dockpulse
