#pragma once

#include "config_manager.h"
#include "event_publisher.h"
#include "interaction_engine.h"
#include "mqtt_client.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace itrack {

/// Detection feed -> engine -> event topics.
/// Subscribes to {prefix}/{detections}/{context}/{objectId} and runs the
/// periodic evaluator on its own thread.
class InteractionService {
public:
    using FatalHandler = std::function<void(const std::string& reason)>;

    InteractionService(std::shared_ptr<InteractionEngine> engine,
                       std::shared_ptr<EventPublisher> publisher,
                       std::shared_ptr<y2m::MqttClient> mqtt,
                       const y2m::AppConfig& config,
                       std::string config_path = {});
    ~InteractionService();

    InteractionService(const InteractionService&) = delete;
    InteractionService& operator=(const InteractionService&) = delete;

    /// Subscribe to detection topics and start the evaluator thread
    void start();

    /// Stop the evaluator thread
    void stop();

    bool isRunning() const { return running_; }

    /// Apply one detection-feed message. Malformed input is logged and dropped.
    void handleMessage(const std::string& topic, const std::string& payload);

    /// One evaluation pass; transitions are handed to the publisher
    void tick(Clock::time_point now);

    /// Reload interactions from the config file on the next tick
    void requestReload() { reload_requested_ = true; }

    /// Called from the evaluator thread when evaluation hits a fatal error
    void setFatalHandler(FatalHandler handler) { on_fatal_ = std::move(handler); }

    uint64_t messagesDropped() const { return messages_dropped_; }

    struct DetectionTopic {
        std::string context;
        EntityId id = 0;
    };

    /// Split a detection topic into context and object id
    std::optional<DetectionTopic> parseDetectionTopic(const std::string& topic) const;

private:
    void evaluatorLoop();
    void reloadInteractions();

    std::shared_ptr<InteractionEngine> engine_;
    std::shared_ptr<EventPublisher> publisher_;
    std::shared_ptr<y2m::MqttClient> mqtt_;
    y2m::AppConfig config_;
    std::string config_path_;
    std::string detections_root_;  // "{prefix}/{detections}/"

    FatalHandler on_fatal_;

    std::atomic<bool> running_{false};
    std::atomic<bool> reload_requested_{false};
    std::atomic<uint64_t> messages_dropped_{0};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

}  // namespace itrack
