#include "dockpulse/table_parser.hpp"

#include <QRegularExpression>

#include <memory>

#include "dockpulse/telemetry.hpp"
#include "dockpulse/unit_converter.hpp"

namespace dockpulse {

namespace {

constexpr const char* kMissing = "--";

QStringList normalizedLines(const QString& raw) {
    static const QRegularExpression lineBreak("\\r?\\n");
    QStringList lines;
    for (const QString& line : raw.split(lineBreak)) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            lines.append(trimmed);
        }
    }
    return lines;
}

QStringList nonEmptyTrimmed(const QStringList& parts) {
    QStringList out;
    for (const QString& part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            out.append(trimmed);
        }
    }
    return out;
}

QString column(const QStringList& parts, int index, const QString& fallback = kMissing) {
    return index < parts.size() ? parts[index] : fallback;
}

QString remainder(const QStringList& parts, int index) {
    if (index >= parts.size()) {
        return kMissing;
    }
    const QString joined = parts.mid(index).join("  ");
    return joined.isEmpty() ? QString(kMissing) : joined;
}

}  // namespace

QString TableParser::firstMeaningfulLine(const QString& raw) {
    const QStringList lines = normalizedLines(raw);
    return lines.isEmpty() ? QString() : lines.first();
}

QStringList TableParser::splitColumns(const QString& line) {
    const QStringList tabParts = nonEmptyTrimmed(line.split('\t'));
    if (tabParts.size() > 1) {
        return tabParts;
    }

    static const QRegularExpression alignedGap("\\s{2,}");
    return nonEmptyTrimmed(line.split(alignedGap));
}

QVector<QStringList> TableParser::tableRows(const QString& raw) {
    const QStringList lines = normalizedLines(raw);
    QVector<QStringList> rows;
    if (lines.size() <= 1) {
        return rows;
    }

    rows.reserve(lines.size() - 1);
    for (int i = 1; i < lines.size(); ++i) {
        const QStringList parts = splitColumns(lines[i]);
        if (!parts.isEmpty()) {
            rows.append(parts);
        }
    }
    return rows;
}

ContainerList TableParser::parseContainers(const QString& raw) {
    ContainerList out;
    for (const QStringList& parts : tableRows(raw)) {
        ContainerRecord record;
        record.id = column(parts, 0);
        record.name = column(parts, 1);
        record.status = column(parts, 2);
        record.ports = remainder(parts, 3);
        out.append(record);
    }
    Telemetry::instance().incrementCounter("parser.containers.rows", out.size());
    return out;
}

ImageList TableParser::parseImages(const QString& raw) {
    ImageList out;
    for (const QStringList& parts : tableRows(raw)) {
        ImageRecord record;
        record.repository = column(parts, 0);
        record.tag = column(parts, 1);
        record.id = column(parts, 2);
        record.size = remainder(parts, 3);
        out.append(record);
    }
    Telemetry::instance().incrementCounter("parser.images.rows", out.size());
    return out;
}

StatList TableParser::parseStats(const QString& raw) {
    StatList out;
    int memoryUnparsed = 0;
    int networkUnparsed = 0;
    for (const QStringList& parts : tableRows(raw)) {
        StatRecord record;
        record.name = column(parts, 0);
        record.cpuText = column(parts, 1, "0%");
        record.memUsageText = column(parts, 2);
        record.netIoText = remainder(parts, 3);
        record.cpuPercent = UnitConverter::parsePercent(record.cpuText);

        const MemoryUsage memory = UnitConverter::parseMemoryUsage(record.memUsageText);
        record.memUsedBytes = memory.usedBytes;
        record.memLimitBytes = memory.limitBytes;
        record.memUsagePercent = memory.usagePercent;
        if (!memory.limitBytes.has_value()) {
            memoryUnparsed++;
        }

        const NetworkUsage network = UnitConverter::parseNetworkUsage(record.netIoText);
        record.netRxBytes = network.rxBytes;
        record.netTxBytes = network.txBytes;
        if (record.netIoText == kMissing) {
            networkUnparsed++;
        }
        out.append(record);
    }

    Telemetry& telemetry = Telemetry::instance();
    telemetry.incrementCounter("parser.stats.rows", out.size());
    if (memoryUnparsed > 0) {
        telemetry.incrementCounter("parser.stats.memory_unparsed", memoryUnparsed);
    }
    if (networkUnparsed > 0) {
        telemetry.incrementCounter("parser.stats.network_unparsed", networkUnparsed);
    }
    return out;
}

ComposeList TableParser::parseCompose(const QString& raw) {
    ComposeList out;
    for (const QStringList& parts : tableRows(raw)) {
        ComposeRecord record;
        record.name = column(parts, 0);
        record.status = column(parts, 1);
        record.configFiles = remainder(parts, 2);
        out.append(record);
    }
    Telemetry::instance().incrementCounter("parser.compose.rows", out.size());
    return out;
}

DockerSnapshot TableParser::parseSnapshot(const RawOutputs& outputs) {
    DockerSnapshot snapshot;
    snapshot.containers =
        std::make_shared<const ContainerList>(parseContainers(outputs.text(SourceKind::Containers)));
    snapshot.images = std::make_shared<const ImageList>(parseImages(outputs.text(SourceKind::Images)));
    snapshot.stats = std::make_shared<const StatList>(parseStats(outputs.text(SourceKind::Stats)));
    snapshot.compose =
        std::make_shared<const ComposeList>(parseCompose(outputs.text(SourceKind::Compose)));
    return snapshot;
}

}  // namespace dockpulse
