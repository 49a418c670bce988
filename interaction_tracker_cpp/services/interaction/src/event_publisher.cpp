#include "event_publisher.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

namespace itrack {

namespace {

std::string stripSeparators(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(),
                           [](char c) { return c == '-' || c == '_'; }),
            s.end());
    return s;
}

}  // anonymous namespace

EventPublisher::EventPublisher(PublishFn publish,
                               const y2m::MqttConfig& mqtt_config,
                               const y2m::HomeAssistantConfig& ha_config,
                               std::shared_ptr<spdlog::logger> logger)
    : publish_(std::move(publish))
    , mqtt_config_(mqtt_config)
    , ha_config_(ha_config)
    , log_(logger ? std::move(logger) : spdlog::default_logger())
{
}

void EventPublisher::handle(const EventTransition& transition) {
    switch (transition.kind) {
    case TransitionKind::Activated:
        publishActivated(transition.context, transition.key);
        break;
    case TransitionKind::Cleared:
        publishCleared(transition.context, transition.key);
        break;
    }
}

std::string EventPublisher::stateTopic(const std::string& context, const EventKey& key) const {
    return mqtt_config_.topic_prefix + "/" + mqtt_config_.events_topic + "/" +
           context + "/" + key.path();
}

std::string EventPublisher::entityId(const std::string& context, const EventKey& key) const {
    std::string id = ha_config_.entity_prefix + "-" + stripSeparators(context) + "-" +
                     stripSeparators(key.interaction);
    for (const auto& slot : key.slots) {
        id += "-" + stripSeparators(slot);
    }
    return id;
}

std::string EventPublisher::discoveryTopic(const std::string& context, const EventKey& key) const {
    return ha_config_.discovery_prefix + "/binary_sensor/" + entityId(context, key);
}

size_t EventPublisher::registeredCount() const {
    std::lock_guard lock(registered_mutex_);
    return registered_.size();
}

void EventPublisher::publishActivated(const std::string& context, const EventKey& key) {
    if (ha_config_.discovery_enabled) {
        registerOnce(context, key);
    }

    json payload = {
        {"name", key.interaction},
        {"slots", key.slots},
    };
    send(stateTopic(context, key), payload.dump(), false);

    if (ha_config_.discovery_enabled) {
        send(discoveryTopic(context, key) + "/state", "ON", true);
    }
}

void EventPublisher::publishCleared(const std::string& context, const EventKey& key) {
    send(stateTopic(context, key), "", true);

    if (ha_config_.discovery_enabled) {
        send(discoveryTopic(context, key) + "/state", "OFF", true);
    }
}

void EventPublisher::registerOnce(const std::string& context, const EventKey& key) {
    auto id = entityId(context, key);
    {
        std::lock_guard lock(registered_mutex_);
        if (!registered_.insert(id).second) return;
    }

    auto base = discoveryTopic(context, key);
    std::string label_path = key.interaction;
    for (const auto& slot : key.slots) label_path += "|" + slot;
    auto friendly = ha_config_.entity_prefix + " - [" + label_path + "] [" + context + "]";

    json config = {
        {"name", friendly},
        {"friendly_name", friendly},
        {"unique_id", id},
        {"state_topic", base + "/state"},
        {"device", {
            {"identifiers", {ha_config_.device_name}},
            {"name", ha_config_.device_name},
        }},
    };
    log_->info("EventPublisher: registering {}", id);
    send(base + "/config", config.dump(), true);
}

void EventPublisher::send(const std::string& topic, const std::string& payload, bool retain) {
    if (!publish_) return;
    try {
        publish_(topic, payload, 1, retain);
    } catch (const std::exception& e) {
        // Delivery is best effort; engine state has already moved on
        log_->error("EventPublisher: publish to {} failed: {}", topic, e.what());
    }
}

}  // namespace itrack
