#pragma once

#include "config_manager.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <mqtt/async_client.h>

namespace y2m {

/// Paho async_client wrapper for a service with one inbound feed.
/// Announces itself on `{topic_prefix}/status` ("online", last will "offline"),
/// publishes fire-and-forget and routes one wildcard subscription to a handler.
/// The subscription is re-issued whenever Paho reconnects.
class MqttClient : public mqtt::callback {
public:
    using MessageHandler = std::function<void(const std::string& topic,
                                              const std::string& payload)>;

    explicit MqttClient(const MqttConfig& config);
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    /// Waits up to 10s for the first connection; Paho keeps retrying after a false return
    bool connect();
    void disconnect();

    void publish(const std::string& topic, const std::string& payload,
                 int qos = 1, bool retain = false);

    /// Replaces the feed subscription. Takes effect now if connected, else on connect.
    void subscribe(const std::string& pattern, MessageHandler handler, int qos = 1);

    /// Hands a message to the feed handler when its topic matches the pattern.
    /// Handler exceptions are logged. Returns true if the handler ran.
    bool dispatch(const std::string& topic, const std::string& payload);

    bool isConnected() const;

    static bool topicMatches(std::string_view pattern, std::string_view topic);

private:
    void connected(const std::string& cause) override;
    void connection_lost(const std::string& cause) override;
    void message_arrived(mqtt::const_message_ptr msg) override;

    void announce(const char* status);
    void requestFeed(bool wait);

    MqttConfig config_;
    std::string status_topic_;
    std::unique_ptr<mqtt::async_client> client_;
    mqtt::connect_options conn_opts_;

    mutable std::mutex feed_mutex_;
    std::string feed_pattern_;
    int feed_qos_ = 1;
    MessageHandler feed_handler_;
};

}  // namespace y2m
