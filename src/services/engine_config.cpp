#include "dockpulse/engine_config.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace dockpulse {

namespace {

int positiveInt(const QJsonValue& value, int fallback) {
    if (!value.isDouble()) {
        return fallback;
    }
    const int parsed = value.toInt(fallback);
    return parsed > 0 ? parsed : fallback;
}

double percentValue(const QJsonValue& value, double fallback) {
    if (!value.isDouble()) {
        return fallback;
    }
    const double parsed = value.toDouble(fallback);
    return (parsed >= 0.0 && parsed <= 100.0) ? parsed : fallback;
}

}  // namespace

EngineConfig EngineConfig::fromJson(const QJsonObject& payload) {
    EngineConfig config;

    const QJsonValue ttl = payload.value("running_cache_ttl_ms");
    if (ttl.isDouble() && ttl.toDouble() >= 0.0) {
        config.runningCacheTtlMs = static_cast<qint64>(ttl.toDouble());
    }

    config.defaultTopN = RankEngine::normalizeTopN(
        payload.value("default_top_n").toInt(config.defaultTopN),
        config.defaultTopN);

    const auto dimension =
        RankEngine::dimensionFromString(payload.value("default_dimension").toString());
    if (dimension.has_value()) {
        config.defaultDimension = *dimension;
    }

    config.searchDebounceMs = positiveInt(payload.value("search_debounce_ms"), config.searchDebounceMs);
    config.trendCapacity = positiveInt(payload.value("trend_capacity"), config.trendCapacity);

    const double warn = percentValue(payload.value("usage_warn_percent"), config.usageWarnPercent);
    const double danger = percentValue(payload.value("usage_danger_percent"), config.usageDangerPercent);
    if (warn <= danger) {
        config.usageWarnPercent = warn;
        config.usageDangerPercent = danger;
    }

    const QString placeholder = payload.value("placeholder_text").toString().trimmed();
    if (!placeholder.isEmpty()) {
        config.placeholderText = placeholder;
    }
    return config;
}

QJsonObject EngineConfig::toJson() const {
    QJsonObject out;
    out.insert("running_cache_ttl_ms", static_cast<double>(runningCacheTtlMs));
    out.insert("default_top_n", defaultTopN);
    out.insert("default_dimension", RankEngine::dimensionName(defaultDimension));
    out.insert("search_debounce_ms", searchDebounceMs);
    out.insert("trend_capacity", trendCapacity);
    out.insert("usage_warn_percent", usageWarnPercent);
    out.insert("usage_danger_percent", usageDangerPercent);
    out.insert("placeholder_text", placeholderText);
    return out;
}

QJsonObject EngineConfig::load(const QByteArray& document) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(document, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return {
            {"success", false},
            {"error", QString("Config is not valid JSON: %1").arg(parseError.errorString())},
        };
    }
    if (!doc.isObject()) {
        return {
            {"success", false},
            {"error", "Config must be a JSON object."},
        };
    }

    *this = fromJson(doc.object());
    return {
        {"success", true},
    };
}

}  // namespace dockpulse
