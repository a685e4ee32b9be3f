#pragma once

#include <QString>

#include "dockpulse/docker_records.hpp"

namespace dockpulse {

class SummaryAggregator {
public:
    explicit SummaryAggregator(QString placeholderText = "Not measured");

    ResourceSummary build(
        const ContainerList& containers,
        const ImageList& images,
        const StatList& stats,
        const ComposeList& compose) const;
    ResourceSummary build(const DockerSnapshot& snapshot) const;

    ResourceSummary empty() const;

    const QString& placeholderText() const { return placeholderText_; }

private:
    QString placeholderText_;
};

}  // namespace dockpulse
