#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace y2m {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct MqttConfig {
    std::string broker = "mqtt";
    int port = 1883;
    std::string username;
    std::string password;
    std::string topic_prefix = "myhome/ObjectTrackers";
    std::string events_topic = "events";
    std::string detections_topic = "detections";
    std::string client_id = "interaction_tracker";
};

struct HomeAssistantConfig {
    bool discovery_enabled = false;
    std::string discovery_prefix = "homeassistant";
    std::string entity_prefix = "Tracker";
    std::string device_name = "InteractionTracker";
};

struct EngineConfig {
    int tick_interval_ms = 1000;
    int max_slot_depth = 8;
};

struct ApiConfig {
    std::string host = "0.0.0.0";
    int port = 8090;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    size_t max_bytes = 10 * 1024 * 1024;
    size_t backup_count = 3;
};

/// A named relationship between overlapping labeled entities.
/// Each slot is a set of acceptable labels; order of slots is significant.
struct InteractionConfig {
    std::string name;
    std::vector<std::vector<std::string>> slots;
    double overlap_threshold = 0.5;
    double min_sustain_seconds = 3.0;
    double expire_after_seconds = 5.0;
};

struct AppConfig {
    MqttConfig mqtt;
    HomeAssistantConfig home_assistant;
    EngineConfig engine;
    ApiConfig api;
    LoggingConfig logging;
    std::map<std::string, InteractionConfig> interactions;
};

class ConfigManager {
public:
    /// Load and validate a YAML config file. Throws ConfigError.
    static AppConfig load(const std::string& path);

    /// Same as load(), from an in-memory YAML document
    static AppConfig loadFromString(const std::string& yaml);

    /// Throws ConfigError describing the first invalid setting
    static void validate(const AppConfig& config);
};

}  // namespace y2m
