#include "interaction_service.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>

using json = nlohmann::json;

namespace itrack {

InteractionService::InteractionService(std::shared_ptr<InteractionEngine> engine,
                                       std::shared_ptr<EventPublisher> publisher,
                                       std::shared_ptr<y2m::MqttClient> mqtt,
                                       const y2m::AppConfig& config,
                                       std::string config_path)
    : engine_(std::move(engine))
    , publisher_(std::move(publisher))
    , mqtt_(std::move(mqtt))
    , config_(config)
    , config_path_(std::move(config_path))
    , detections_root_(config.mqtt.topic_prefix + "/" + config.mqtt.detections_topic + "/")
{
}

InteractionService::~InteractionService() {
    stop();
}

void InteractionService::start() {
    if (running_.exchange(true)) return;
    if (thread_.joinable()) thread_.join();

    if (mqtt_) {
        mqtt_->subscribe(detections_root_ + "#",
                         [this](const std::string& topic, const std::string& payload) {
                             handleMessage(topic, payload);
                         }, 1);
    } else {
        spdlog::warn("InteractionService: no MQTT client, detection feed disabled");
    }

    thread_ = std::thread(&InteractionService::evaluatorLoop, this);
    spdlog::info("InteractionService: started (tick={}ms, feed={}#)",
                 config_.engine.tick_interval_ms, detections_root_);
}

void InteractionService::stop() {
    bool was_running;
    {
        std::lock_guard lock(wake_mutex_);
        was_running = running_.exchange(false);
    }
    wake_.notify_all();
    // The evaluator may already have exited on its own after a fatal error
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    if (was_running) spdlog::info("InteractionService: stopped");
}

std::optional<InteractionService::DetectionTopic>
InteractionService::parseDetectionTopic(const std::string& topic) const {
    if (topic.compare(0, detections_root_.size(), detections_root_) != 0) {
        return std::nullopt;
    }

    auto rest = topic.substr(detections_root_.size());
    auto slash = rest.find('/');
    if (slash == std::string::npos || slash == 0) return std::nullopt;

    DetectionTopic result;
    result.context = rest.substr(0, slash);
    auto id_str = rest.substr(slash + 1);

    auto [ptr, ec] = std::from_chars(id_str.data(), id_str.data() + id_str.size(), result.id);
    if (ec != std::errc() || ptr != id_str.data() + id_str.size() || id_str.empty()) {
        return std::nullopt;
    }
    return result;
}

void InteractionService::handleMessage(const std::string& topic, const std::string& payload) {
    auto parsed = parseDetectionTopic(topic);
    if (!parsed) {
        ++messages_dropped_;
        spdlog::warn("InteractionService: ignoring message on unexpected topic {}", topic);
        return;
    }

    if (payload.empty()) {
        engine_->removeEntity(parsed->context, parsed->id);
        return;
    }

    try {
        auto entity = TrackedEntity::fromJson(json::parse(payload));
        engine_->upsertEntity(parsed->context, parsed->id, std::move(entity));
    } catch (const json::exception& e) {
        ++messages_dropped_;
        spdlog::error("InteractionService: failed to parse detection on {}: {}", topic, e.what());
    } catch (const std::invalid_argument& e) {
        ++messages_dropped_;
        spdlog::error("InteractionService: invalid detection on {}: {}", topic, e.what());
    }
}

void InteractionService::tick(Clock::time_point now) {
    if (reload_requested_.exchange(false)) {
        reloadInteractions();
    }

    auto transitions = engine_->evaluate(now);
    if (!publisher_) return;
    for (const auto& t : transitions) {
        publisher_->handle(t);
    }
}

void InteractionService::reloadInteractions() {
    if (config_path_.empty()) {
        spdlog::warn("InteractionService: reload requested but no config path is known");
        return;
    }

    try {
        auto config = y2m::ConfigManager::load(config_path_);
        std::vector<y2m::InteractionConfig> interactions;
        for (const auto& [name, ic] : config.interactions) {
            interactions.push_back(ic);
        }
        engine_->setInteractions(std::move(interactions));
        spdlog::info("InteractionService: reloaded interactions from {}", config_path_);
    } catch (const y2m::ConfigError& e) {
        spdlog::error("InteractionService: reload failed, keeping current interactions: {}",
                      e.what());
    }
}

void InteractionService::evaluatorLoop() {
    const auto interval = std::chrono::milliseconds(config_.engine.tick_interval_ms);
    auto next = Clock::now() + interval;

    while (running_) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_.wait_until(lock, next, [this] { return !running_; });
        }
        if (!running_) break;
        next += interval;

        try {
            tick(Clock::now());
        } catch (const SlotDepthError& e) {
            spdlog::critical("InteractionService: fatal interaction configuration: {}", e.what());
            running_ = false;
            if (on_fatal_) on_fatal_(e.what());
            return;
        }
    }
}

}  // namespace itrack
