#include "config.hpp"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <string_view>

namespace tidemark::config {

namespace {

size_t read_period(const YAML::Node& node, std::string_view key, size_t fallback) {
    if (!node) {
        return fallback;
    }
    const auto value = node.as<long long>();
    if (value <= 0) {
        throw ConfigError(std::string(key) + " must be a positive integer, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

data::Field parse_field(const std::string& name) {
    if (name == "open") return data::Field::OPEN;
    if (name == "high") return data::Field::HIGH;
    if (name == "low") return data::Field::LOW;
    if (name == "close") return data::Field::CLOSE;
    if (name == "volume") return data::Field::VOLUME;
    throw ConfigError("unknown price_field: " + name);
}

indicators::DIIndexing parse_di_indexing(const std::string& name) {
    if (name == "latest") return indicators::DIIndexing::LATEST;
    if (name == "legacy_offset") return indicators::DIIndexing::LEGACY_OFFSET;
    throw ConfigError("unknown adx.di_indexing: " + name);
}

SnapshotConfig decode(const YAML::Node& root) {
    SnapshotConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    if (const auto ma = root["moving_averages"]) {
        config.short_ma = read_period(ma["short"], "moving_averages.short", config.short_ma);
        config.long_ma = read_period(ma["long"], "moving_averages.long", config.long_ma);
    }

    if (const auto offset = root["reference_offset"]) {
        const auto value = offset.as<long long>();
        if (value < 0) {
            throw ConfigError("reference_offset must not be negative");
        }
        config.reference_offset = static_cast<size_t>(value);
    }

    if (const auto macd = root["macd"]) {
        config.macd_fast = read_period(macd["fast"], "macd.fast", config.macd_fast);
        config.macd_slow = read_period(macd["slow"], "macd.slow", config.macd_slow);
        config.macd_signal = read_period(macd["signal"], "macd.signal", config.macd_signal);
    }

    if (const auto bb = root["bollinger"]) {
        config.bollinger_period = read_period(bb["period"], "bollinger.period", config.bollinger_period);
        if (const auto mult = bb["multiplier"]) {
            config.bollinger_multiplier = mult.as<double>();
        }
    }

    if (const auto adx = root["adx"]) {
        config.adx_period = read_period(adx["period"], "adx.period", config.adx_period);
        if (const auto indexing = adx["di_indexing"]) {
            config.di_indexing = parse_di_indexing(indexing.as<std::string>());
        }
    }

    if (const auto field = root["price_field"]) {
        config.price_field = parse_field(field.as<std::string>());
    }

    if (const auto tf = root["timeframe"]) {
        const auto name = tf.as<std::string>();
        const auto timeframe = data::parse_timeframe(name);
        if (!timeframe) {
            throw ConfigError("unknown timeframe: " + name);
        }
        config.timeframe = *timeframe;
    }

    return config;
}

} // namespace

void validate(const SnapshotConfig& config) {
    if (config.short_ma == 0 || config.long_ma == 0) {
        throw ConfigError("moving average lookbacks must be positive");
    }
    if (config.macd_fast == 0 || config.macd_slow == 0 || config.macd_signal == 0) {
        throw ConfigError("MACD periods must be positive");
    }
    if (config.macd_fast >= config.macd_slow) {
        throw ConfigError("macd.fast must be shorter than macd.slow");
    }
    if (config.bollinger_period == 0) {
        throw ConfigError("bollinger.period must be positive");
    }
    if (!(config.bollinger_multiplier >= 0.0)) {
        throw ConfigError("bollinger.multiplier must not be negative");
    }
    if (config.adx_period == 0) {
        throw ConfigError("adx.period must be positive");
    }
}

SnapshotConfig parse_config(const std::string& yaml_text) {
    SnapshotConfig config;
    try {
        config = decode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    validate(config);
    return config;
}

SnapshotConfig load_config(const std::string& path) {
    SnapshotConfig config;
    try {
        config = decode(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load " + path + ": " + e.what());
    }
    validate(config);

    spdlog::debug("Loaded config {}: ma={}/{} macd={}/{}/{} bb={}x{} adx={}",
                  path, config.short_ma, config.long_ma,
                  config.macd_fast, config.macd_slow, config.macd_signal,
                  config.bollinger_period, config.bollinger_multiplier, config.adx_period);
    return config;
}

} // namespace tidemark::config
