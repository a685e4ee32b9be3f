#include "dockpulse/docker_records.hpp"

#include <QJsonValue>

namespace dockpulse {

namespace {

QJsonValue optionalNumber(const std::optional<double>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

}  // namespace

QString& RawOutputs::text(SourceKind kind) {
    switch (kind) {
    case SourceKind::Images:
        return images;
    case SourceKind::Stats:
        return stats;
    case SourceKind::Compose:
        return compose;
    case SourceKind::Containers:
        break;
    }
    return containers;
}

const QString& RawOutputs::text(SourceKind kind) const {
    switch (kind) {
    case SourceKind::Images:
        return images;
    case SourceKind::Stats:
        return stats;
    case SourceKind::Compose:
        return compose;
    case SourceKind::Containers:
        break;
    }
    return containers;
}

bool isContainerRunning(const QString& status) {
    const QString normalized = status.toLower();
    return normalized.contains("up") || normalized.contains("running");
}

QString sourceKindName(SourceKind kind) {
    switch (kind) {
    case SourceKind::Containers:
        return "containers";
    case SourceKind::Images:
        return "images";
    case SourceKind::Stats:
        return "stats";
    case SourceKind::Compose:
        return "compose";
    }
    return "containers";
}

QJsonObject toJson(const ContainerRecord& record) {
    return {
        {"id", record.id},
        {"name", record.name},
        {"status", record.status},
        {"ports", record.ports},
    };
}

QJsonObject toJson(const ImageRecord& record) {
    return {
        {"repository", record.repository},
        {"tag", record.tag},
        {"id", record.id},
        {"size", record.size},
    };
}

QJsonObject toJson(const StatRecord& record) {
    QJsonObject out;
    out.insert("name", record.name);
    out.insert("cpu_percent", record.cpuPercent);
    out.insert("cpu_text", record.cpuText);
    out.insert("mem_usage_text", record.memUsageText);
    out.insert("mem_used_bytes", optionalNumber(record.memUsedBytes));
    out.insert("mem_limit_bytes", optionalNumber(record.memLimitBytes));
    out.insert("mem_usage_percent", optionalNumber(record.memUsagePercent));
    out.insert("net_io_text", record.netIoText);
    out.insert("net_rx_bytes", record.netRxBytes);
    out.insert("net_tx_bytes", record.netTxBytes);
    return out;
}

QJsonObject toJson(const ComposeRecord& record) {
    return {
        {"name", record.name},
        {"status", record.status},
        {"config_files", record.configFiles},
    };
}

QJsonObject toJson(const ResourceSummary& summary) {
    QJsonObject out;
    out.insert("total_containers", summary.totalContainers);
    out.insert("running_containers", summary.runningContainers);
    out.insert("total_images", summary.totalImages);
    out.insert("compose_projects", summary.composeProjects);
    out.insert("total_cpu_percent", summary.totalCpuPercent);
    out.insert("avg_cpu_percent", summary.avgCpuPercent);
    out.insert("total_mem_usage_percent", optionalNumber(summary.totalMemUsagePercent));
    out.insert("mem_usage_text", summary.memUsageText);
    out.insert("net_rx_text", summary.netRxText);
    out.insert("net_tx_text", summary.netTxText);
    return out;
}

}  // namespace dockpulse
