#include "mqtt_client.h"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace y2m {

namespace {

constexpr auto kConnectWait = std::chrono::seconds(10);
constexpr auto kSubscribeWait = std::chrono::seconds(5);
constexpr auto kDisconnectWait = std::chrono::seconds(2);

// Splits off the next topic level; `rest` loses the level and its separator
std::string_view nextLevel(std::string_view& rest, bool& more) {
    auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        auto level = rest;
        rest = {};
        more = false;
        return level;
    }
    auto level = rest.substr(0, slash);
    rest.remove_prefix(slash + 1);
    more = true;
    return level;
}

}  // anonymous namespace

MqttClient::MqttClient(const MqttConfig& config)
    : config_(config)
    , status_topic_(config.topic_prefix + "/status")
{
    client_ = std::make_unique<mqtt::async_client>(
        "tcp://" + config_.broker + ":" + std::to_string(config_.port),
        config_.client_id + "_" + std::to_string(::getpid()));
    client_->set_callback(*this);

    auto builder = mqtt::connect_options_builder()
        .automatic_reconnect(std::chrono::seconds(1), std::chrono::seconds(64))
        .clean_session(true)
        .keep_alive_interval(std::chrono::seconds(30))
        .connect_timeout(kConnectWait)
        .will(mqtt::will_options(status_topic_, std::string("offline"), 1, true));
    if (!config_.username.empty()) {
        builder.user_name(config_.username).password(config_.password);
    }
    conn_opts_ = builder.finalize();
}

MqttClient::~MqttClient() {
    disconnect();
}

bool MqttClient::connect() {
    spdlog::info("MQTT: connecting to {}:{} (client {})",
                 config_.broker, config_.port, config_.client_id);
    try {
        client_->connect(conn_opts_)->wait_for(kConnectWait);
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: initial connect failed: {}, retrying in background", e.what());
        return false;
    }

    if (!client_->is_connected()) {
        spdlog::warn("MQTT: broker not reachable yet, retrying in background");
        return false;
    }
    return true;
}

void MqttClient::disconnect() {
    if (!client_ || !client_->is_connected()) return;

    announce("offline");
    try {
        client_->disconnect()->wait_for(kDisconnectWait);
        spdlog::info("MQTT: disconnected");
    } catch (const mqtt::exception& e) {
        spdlog::debug("MQTT: disconnect error: {}", e.what());
    }
}

void MqttClient::publish(const std::string& topic, const std::string& payload,
                         int qos, bool retain) {
    if (!isConnected()) {
        spdlog::debug("MQTT: offline, dropped message for {}", topic);
        return;
    }
    try {
        client_->publish(topic, payload.data(), payload.size(), qos, retain);
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: publish to {} failed: {}", topic, e.what());
    }
}

void MqttClient::subscribe(const std::string& pattern, MessageHandler handler, int qos) {
    {
        std::lock_guard lock(feed_mutex_);
        feed_pattern_ = pattern;
        feed_qos_ = qos;
        feed_handler_ = std::move(handler);
    }
    if (isConnected()) requestFeed(true);
}

bool MqttClient::dispatch(const std::string& topic, const std::string& payload) {
    MessageHandler handler;
    {
        std::lock_guard lock(feed_mutex_);
        if (!feed_handler_ || !topicMatches(feed_pattern_, topic)) return false;
        handler = feed_handler_;
    }

    try {
        handler(topic, payload);
    } catch (const std::exception& e) {
        spdlog::error("MQTT: handler failed for {}: {}", topic, e.what());
    }
    return true;
}

bool MqttClient::isConnected() const {
    return client_ && client_->is_connected();
}

void MqttClient::announce(const char* status) {
    publish(status_topic_, status, 1, true);
}

void MqttClient::requestFeed(bool wait) {
    std::string pattern;
    int qos;
    {
        std::lock_guard lock(feed_mutex_);
        if (feed_pattern_.empty()) return;
        pattern = feed_pattern_;
        qos = feed_qos_;
    }

    try {
        auto tok = client_->subscribe(pattern, qos);
        // Paho callbacks must not block on their own tokens
        if (wait) tok->wait_for(kSubscribeWait);
        spdlog::info("MQTT: subscribed to {}", pattern);
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: subscribe to {} failed: {}", pattern, e.what());
    }
}

void MqttClient::connected(const std::string& cause) {
    spdlog::info("MQTT: connected to {}:{}{}", config_.broker, config_.port,
                 cause.empty() ? "" : " (" + cause + ")");
    announce("online");
    requestFeed(false);
}

void MqttClient::connection_lost(const std::string& cause) {
    spdlog::warn("MQTT: connection lost ({}), reconnecting",
                 cause.empty() ? "no reason given" : cause);
}

void MqttClient::message_arrived(mqtt::const_message_ptr msg) {
    if (!dispatch(msg->get_topic(), msg->get_payload_str())) {
        spdlog::debug("MQTT: no handler for {}", msg->get_topic());
    }
}

bool MqttClient::topicMatches(std::string_view pattern, std::string_view topic) {
    bool pattern_more = true;
    bool topic_more = true;

    while (pattern_more) {
        auto p = nextLevel(pattern, pattern_more);
        // "#" matches the remaining levels, including none ("a/#" matches "a")
        if (p == "#") return !pattern_more;
        if (!topic_more) return false;
        auto t = nextLevel(topic, topic_more);
        if (p != "+" && p != t) return false;
    }
    return !topic_more;
}

}  // namespace y2m
