#include "config_manager.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace y2m {

namespace {

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

std::string stripTrailingSlash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

InteractionConfig parseInteraction(const std::string& name, const YAML::Node& node) {
    InteractionConfig ic;
    ic.name = name;

    if (!node["slots"] || !node["slots"].IsSequence()) {
        throw ConfigError("interaction '" + name + "': 'slots' must be a list of label lists");
    }
    for (const auto& slot : node["slots"]) {
        if (slot.IsScalar()) {
            ic.slots.push_back({slot.as<std::string>()});
        } else {
            ic.slots.push_back(slot.as<std::vector<std::string>>());
        }
    }

    readValue(node, "threshold", ic.overlap_threshold);
    readValue(node, "min_time", ic.min_sustain_seconds);
    readValue(node, "expire_time", ic.expire_after_seconds);
    return ic;
}

AppConfig parse(const YAML::Node& root) {
    AppConfig config;

    if (auto n = root["mqtt"]) {
        readValue(n, "broker", config.mqtt.broker);
        readValue(n, "port", config.mqtt.port);
        readValue(n, "username", config.mqtt.username);
        readValue(n, "password", config.mqtt.password);
        readValue(n, "topic_prefix", config.mqtt.topic_prefix);
        readValue(n, "events_topic", config.mqtt.events_topic);
        readValue(n, "detections_topic", config.mqtt.detections_topic);
        readValue(n, "client_id", config.mqtt.client_id);
    }
    config.mqtt.topic_prefix = stripTrailingSlash(config.mqtt.topic_prefix);

    if (auto n = root["home_assistant"]) {
        readValue(n, "discovery_enabled", config.home_assistant.discovery_enabled);
        readValue(n, "discovery_prefix", config.home_assistant.discovery_prefix);
        readValue(n, "entity_prefix", config.home_assistant.entity_prefix);
        readValue(n, "device_name", config.home_assistant.device_name);
    }
    config.home_assistant.discovery_prefix =
        stripTrailingSlash(config.home_assistant.discovery_prefix);

    if (auto n = root["engine"]) {
        readValue(n, "tick_interval_ms", config.engine.tick_interval_ms);
        readValue(n, "max_slot_depth", config.engine.max_slot_depth);
    }

    if (auto n = root["api"]) {
        readValue(n, "host", config.api.host);
        readValue(n, "port", config.api.port);
    }

    if (auto n = root["logging"]) {
        readValue(n, "level", config.logging.level);
        readValue(n, "file", config.logging.file);
        readValue(n, "max_bytes", config.logging.max_bytes);
        readValue(n, "backup_count", config.logging.backup_count);
    }

    if (auto n = root["interactions"]) {
        if (!n.IsMap()) {
            throw ConfigError("'interactions' must be a map of name -> interaction");
        }
        for (const auto& entry : n) {
            auto name = entry.first.as<std::string>();
            config.interactions[name] = parseInteraction(name, entry.second);
        }
    }

    ConfigManager::validate(config);
    return config;
}

}  // anonymous namespace

AppConfig ConfigManager::load(const std::string& path) {
    try {
        return parse(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load config '" + path + "': " + e.what());
    }
}

AppConfig ConfigManager::loadFromString(const std::string& yaml) {
    try {
        return parse(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("failed to parse config: ") + e.what());
    }
}

void ConfigManager::validate(const AppConfig& config) {
    if (config.engine.tick_interval_ms <= 0) {
        throw ConfigError("engine.tick_interval_ms must be positive");
    }
    if (config.engine.max_slot_depth <= 0) {
        throw ConfigError("engine.max_slot_depth must be positive");
    }

    for (const auto& [name, ic] : config.interactions) {
        if (ic.slots.empty()) {
            throw ConfigError("interaction '" + name + "' has no slots");
        }
        if (static_cast<int>(ic.slots.size()) > config.engine.max_slot_depth) {
            throw ConfigError("interaction '" + name + "' declares " +
                              std::to_string(ic.slots.size()) +
                              " slots, above engine.max_slot_depth");
        }
        for (const auto& slot : ic.slots) {
            if (slot.empty()) {
                throw ConfigError("interaction '" + name + "' has an empty slot");
            }
        }
        if (ic.overlap_threshold < 0.0 || ic.overlap_threshold > 1.0) {
            throw ConfigError("interaction '" + name + "': threshold must be within [0, 1]");
        }
        if (ic.min_sustain_seconds < 0.0 || ic.expire_after_seconds < 0.0) {
            throw ConfigError("interaction '" + name + "': min_time/expire_time must be >= 0");
        }
        if (ic.slots.size() > 2) {
            // Only pairwise overlaps are evaluated, see OverlapMatcher
            spdlog::warn("Config: interaction '{}' has {} slots; only two-member "
                         "overlaps are matched so it will never trigger",
                         name, ic.slots.size());
        }
    }
}

}  // namespace y2m
