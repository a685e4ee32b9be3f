#pragma once

#include <QString>

#include <optional>

namespace dockpulse {

struct MemoryUsage {
    std::optional<double> usedBytes;
    std::optional<double> limitBytes;
    std::optional<double> usagePercent;
};

struct NetworkUsage {
    double rxBytes = 0.0;
    double txBytes = 0.0;
};

enum class UsageLevel {
    Ok,
    Warn,
    Danger,
};

class UnitConverter {
public:
    static constexpr double kDefaultWarnPercent = 60.0;
    static constexpr double kDefaultDangerPercent = 85.0;

    static double parsePercent(const QString& text);

    static std::optional<double> parseSize(const QString& text);

    static MemoryUsage parseMemoryUsage(const QString& text);

    static NetworkUsage parseNetworkUsage(const QString& text);

    static QString formatBytes(double bytes);

    static double clampPercent(double value);
    static QString formatPercent(double value, bool bounded = false);
    static UsageLevel usageLevel(
        double percent,
        double warnPercent = kDefaultWarnPercent,
        double dangerPercent = kDefaultDangerPercent);
    static QString usageLevelName(UsageLevel level);
};

}  // namespace dockpulse
