#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <memory>
#include <optional>

namespace dockpulse {

struct ContainerRecord {
    QString id;
    QString name;
    QString status;
    QString ports;
};

struct ImageRecord {
    QString repository;
    QString tag;
    QString id;
    QString size;
};

struct StatRecord {
    QString name;
    double cpuPercent = 0.0;
    QString cpuText;
    QString memUsageText;
    std::optional<double> memUsedBytes;
    std::optional<double> memLimitBytes;
    std::optional<double> memUsagePercent;
    QString netIoText;
    double netRxBytes = 0.0;
    double netTxBytes = 0.0;
};

struct ComposeRecord {
    QString name;
    QString status;
    QString configFiles;
};

using ContainerList = QVector<ContainerRecord>;
using ImageList = QVector<ImageRecord>;
using StatList = QVector<StatRecord>;
using ComposeList = QVector<ComposeRecord>;

// Lists are replaced whole, never edited in place.
struct DockerSnapshot {
    std::shared_ptr<const ContainerList> containers = std::make_shared<const ContainerList>();
    std::shared_ptr<const ImageList> images = std::make_shared<const ImageList>();
    std::shared_ptr<const StatList> stats = std::make_shared<const StatList>();
    std::shared_ptr<const ComposeList> compose = std::make_shared<const ComposeList>();
};

struct ResourceSummary {
    int totalContainers = 0;
    int runningContainers = 0;
    int totalImages = 0;
    int composeProjects = 0;
    double totalCpuPercent = 0.0;
    double avgCpuPercent = 0.0;
    std::optional<double> totalMemUsagePercent;
    QString memUsageText;
    QString netRxText;
    QString netTxText;
};

enum class StatusFilter {
    All,
    Running,
    Exited,
};

struct FilterState {
    QString search;
    StatusFilter status = StatusFilter::All;
};

enum class SourceKind {
    Containers,
    Images,
    Stats,
    Compose,
};

struct RawOutputs {
    QString containers;
    QString images;
    QString stats;
    QString compose;

    QString& text(SourceKind kind);
    const QString& text(SourceKind kind) const;
};

bool isContainerRunning(const QString& status);

QString sourceKindName(SourceKind kind);

QJsonObject toJson(const ContainerRecord& record);
QJsonObject toJson(const ImageRecord& record);
QJsonObject toJson(const StatRecord& record);
QJsonObject toJson(const ComposeRecord& record);
QJsonObject toJson(const ResourceSummary& summary);

}  // namespace dockpulse
