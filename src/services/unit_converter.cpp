#include "dockpulse/unit_converter.hpp"

#include <QPair>
#include <QRegularExpression>
#include <QStringList>

#include <cmath>
#include <iterator>

namespace dockpulse {

namespace {

struct UnitPower {
    const char* unit;
    int power;
};

constexpr UnitPower kBinaryUnits[] = {
    {"kib", 1},
    {"mib", 2},
    {"gib", 3},
    {"tib", 4},
    {"pib", 5},
    {"eib", 6},
};

constexpr UnitPower kDecimalUnits[] = {
    {"kb", 1},
    {"mb", 2},
    {"gb", 3},
    {"tb", 4},
    {"pb", 5},
    {"eb", 6},
};

std::optional<int> unitPower(const QString& unit, const UnitPower* table, int size) {
    for (int i = 0; i < size; ++i) {
        if (unit == QLatin1String(table[i].unit)) {
            return table[i].power;
        }
    }
    return std::nullopt;
}

QPair<QString, QString> splitPair(const QString& text) {
    const QStringList parts = text.split('/');
    return {parts.value(0).trimmed(), parts.value(1).trimmed()};
}

}  // namespace

double UnitConverter::parsePercent(const QString& text) {
    static const QRegularExpression numberRegex("-?\\d+(\\.\\d+)?");
    const QRegularExpressionMatch match = numberRegex.match(text);
    if (!match.hasMatch()) {
        return 0.0;
    }
    return match.captured(0).toDouble();
}

std::optional<double> UnitConverter::parseSize(const QString& text) {
    static const QRegularExpression whitespace("\\s+");
    static const QRegularExpression sizeRegex("^([\\d.]+)([a-zA-Z]+)?$");
    static const QRegularExpression leadingNumber("^(\\d+(?:\\.\\d*)?|\\.\\d+)");

    QString normalized = text;
    normalized.remove(whitespace);
    if (normalized.isEmpty()) {
        return std::nullopt;
    }

    const QRegularExpressionMatch match = sizeRegex.match(normalized);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    // "1.5.2" reads as 1.5; a bare "." has no number at all.
    const QRegularExpressionMatch numberMatch = leadingNumber.match(match.captured(1));
    if (!numberMatch.hasMatch()) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = numberMatch.captured(1).toDouble(&ok);
    if (!ok || !std::isfinite(value)) {
        return std::nullopt;
    }

    const QString unit = match.captured(2).isEmpty() ? QString("b") : match.captured(2).toLower();
    if (unit == "b") {
        return value;
    }

    if (const auto power = unitPower(unit, kBinaryUnits, static_cast<int>(std::size(kBinaryUnits)))) {
        return value * std::pow(1024.0, *power);
    }
    if (const auto power = unitPower(unit, kDecimalUnits, static_cast<int>(std::size(kDecimalUnits)))) {
        return value * std::pow(1000.0, *power);
    }
    return std::nullopt;
}

MemoryUsage UnitConverter::parseMemoryUsage(const QString& text) {
    const auto [usedRaw, limitRaw] = splitPair(text);
    if (usedRaw.isEmpty() || limitRaw.isEmpty()) {
        return {};
    }

    const std::optional<double> used = parseSize(usedRaw);
    const std::optional<double> limit = parseSize(limitRaw);
    if (!used.has_value() || !limit.has_value()) {
        return {};
    }

    MemoryUsage usage;
    usage.usedBytes = used;
    usage.limitBytes = limit;
    if (*limit > 0.0) {
        usage.usagePercent = (*used / *limit) * 100.0;
    }
    return usage;
}

NetworkUsage UnitConverter::parseNetworkUsage(const QString& text) {
    const auto [rxRaw, txRaw] = splitPair(text);
    NetworkUsage usage;
    usage.rxBytes = parseSize(rxRaw).value_or(0.0);
    usage.txBytes = parseSize(txRaw).value_or(0.0);
    return usage;
}

QString UnitConverter::formatBytes(double bytes) {
    if (!std::isfinite(bytes) || bytes <= 0.0) {
        return "0 B";
    }

    static const QStringList units = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = bytes;
    int unitIndex = 0;
    while (value >= 1024.0 && unitIndex < units.size() - 1) {
        value /= 1024.0;
        unitIndex++;
    }

    const int digits = value >= 100.0 ? 0 : (value >= 10.0 ? 1 : 2);
    return QString("%1 %2").arg(QString::number(value, 'f', digits), units[unitIndex]);
}

double UnitConverter::clampPercent(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return qBound(0.0, value, 100.0);
}

QString UnitConverter::formatPercent(double value, bool bounded) {
    const double safeValue = std::isfinite(value) ? value : 0.0;
    const double displayValue = bounded ? clampPercent(safeValue) : safeValue;
    return QString::number(displayValue, 'f', 1) + "%";
}

UsageLevel UnitConverter::usageLevel(double percent, double warnPercent, double dangerPercent) {
    if (percent >= dangerPercent) {
        return UsageLevel::Danger;
    }
    if (percent >= warnPercent) {
        return UsageLevel::Warn;
    }
    return UsageLevel::Ok;
}

QString UnitConverter::usageLevelName(UsageLevel level) {
    switch (level) {
    case UsageLevel::Warn:
        return "warn";
    case UsageLevel::Danger:
        return "danger";
    case UsageLevel::Ok:
        break;
    }
    return "ok";
}

}  // namespace dockpulse
