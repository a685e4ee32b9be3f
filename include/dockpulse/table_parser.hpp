#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "dockpulse/docker_records.hpp"

namespace dockpulse {

class TableParser {
public:
    TableParser() = default;

    static ContainerList parseContainers(const QString& raw);
    static ImageList parseImages(const QString& raw);
    static StatList parseStats(const QString& raw);
    static ComposeList parseCompose(const QString& raw);

    static DockerSnapshot parseSnapshot(const RawOutputs& outputs);

    static QVector<QStringList> tableRows(const QString& raw);
    static QStringList splitColumns(const QString& line);
    static QString firstMeaningfulLine(const QString& raw);
};

}  // namespace dockpulse
