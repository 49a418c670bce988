#pragma once

#include <drogon/HttpController.h>
#include <memory>

namespace y2m {
class MqttClient;
}

namespace itrack {

class InteractionEngine;

class HealthController : public drogon::HttpController<HealthController> {
public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HealthController::getHealth, "/health", drogon::Get);
    ADD_METHOD_TO(HealthController::getContext, "/api/contexts/{context}", drogon::Get);
    METHOD_LIST_END

    void getHealth(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void getContext(const drogon::HttpRequestPtr& req,
                    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                    const std::string& context);

    static void setEngine(std::shared_ptr<InteractionEngine> engine);
    static void setMqttClient(std::shared_ptr<y2m::MqttClient> mqtt);

private:
    static inline std::shared_ptr<InteractionEngine> engine_;
    static inline std::shared_ptr<y2m::MqttClient> mqtt_;
};

}  // namespace itrack
