#include "controllers/health_controller.h"
#include "interaction_engine.h"
#include "mqtt_client.h"
#include "time_utils.h"

#include <drogon/HttpResponse.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace itrack {

using json = nlohmann::json;

namespace {

drogon::HttpResponsePtr jsonResponse(const json& body, drogon::HttpStatusCode code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(code);
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

}  // anonymous namespace

void HealthController::setEngine(std::shared_ptr<InteractionEngine> engine) {
    engine_ = std::move(engine);
}

void HealthController::setMqttClient(std::shared_ptr<y2m::MqttClient> mqtt) {
    mqtt_ = std::move(mqtt);
}

void HealthController::getHealth(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    bool mqtt_connected = mqtt_ && mqtt_->isConnected();

    json contexts_json = json::object();
    if (engine_) {
        for (const auto& s : engine_->stats()) {
            contexts_json[s.name] = {
                {"entities", s.entities},
                {"pending_events", s.pending_events},
                {"active_events", s.active_events},
            };
        }
    }

    json result = {
        {"service", "interaction-tracker"},
        {"status", mqtt_connected ? "healthy" : "degraded"},
        {"timestamp", y2m::time_utils::now_iso8601()},
        {"mqtt_connected", mqtt_connected},
        {"contexts", contexts_json},
    };

    callback(jsonResponse(result, mqtt_connected ? drogon::k200OK
                                                 : drogon::k503ServiceUnavailable));
}

void HealthController::getContext(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& context)
{
    auto snap = engine_ ? engine_->snapshot(context) : std::nullopt;
    if (!snap) {
        callback(jsonResponse({{"error", "Unknown context: " + context}}, drogon::k404NotFound));
        return;
    }

    auto now = Clock::now();
    auto secondsSince = [now](Clock::time_point t) {
        return std::chrono::duration<double>(now - t).count();
    };

    json entities = json::object();
    for (const auto& [id, entity] : snap->entities) {
        entities[std::to_string(id)] = entity.toJson();
    }

    json events = json::array();
    for (const auto& [key, record] : snap->events) {
        events.push_back({
            {"name", key.interaction},
            {"slots", key.slots},
            {"state", record.published ? "active" : "pending"},
            {"first_seen_s_ago", secondsSince(record.first_seen)},
            {"last_seen_s_ago", secondsSince(record.last_seen)},
        });
    }

    callback(jsonResponse({
        {"context", snap->name},
        {"entities", entities},
        {"events", events},
    }, drogon::k200OK));
}

}  // namespace itrack
