#pragma once

#include "config_manager.h"
#include "interaction_engine.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include <spdlog/logger.h>

namespace itrack {

/// Turns engine transitions into bus messages.
///
/// State channel: JSON {name, slots} on activation, empty retained payload on
/// clear. Discovery channel (optional): a retained Home Assistant
/// binary_sensor config sent once per entity id for the lifetime of the
/// process, always before that entity's first ON/OFF state.
class EventPublisher {
public:
    using PublishFn = std::function<void(const std::string& topic,
                                         const std::string& payload,
                                         int qos, bool retain)>;

    EventPublisher(PublishFn publish,
                   const y2m::MqttConfig& mqtt_config,
                   const y2m::HomeAssistantConfig& ha_config,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

    void handle(const EventTransition& transition);

    /// {prefix}/{events}/{context}/{interaction}/{slot1}/...
    std::string stateTopic(const std::string& context, const EventKey& key) const;

    /// {entity_prefix}-{context}-{interaction}-{slot1}-... with '-' and '_'
    /// stripped from each component
    std::string entityId(const std::string& context, const EventKey& key) const;

    /// {discovery_prefix}/binary_sensor/{entityId}
    std::string discoveryTopic(const std::string& context, const EventKey& key) const;

    size_t registeredCount() const;

private:
    void publishActivated(const std::string& context, const EventKey& key);
    void publishCleared(const std::string& context, const EventKey& key);
    void registerOnce(const std::string& context, const EventKey& key);
    void send(const std::string& topic, const std::string& payload, bool retain);

    PublishFn publish_;
    y2m::MqttConfig mqtt_config_;
    y2m::HomeAssistantConfig ha_config_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex registered_mutex_;
    std::unordered_set<std::string> registered_;
};

}  // namespace itrack
