#include <catch2/catch_test_macros.hpp>

#include "interaction_service.h"

#include <spdlog/sinks/null_sink.h>

using namespace itrack;
using namespace std::chrono_literals;

namespace {

y2m::AppConfig makeTestConfig() {
    y2m::AppConfig config;
    config.mqtt.topic_prefix = "home/trk";
    config.mqtt.events_topic = "events";
    config.mqtt.detections_topic = "detections";
    config.engine.tick_interval_ms = 20;

    y2m::InteractionConfig ic;
    ic.name = "Eating";
    ic.slots = {{"cat"}, {"bowl"}};
    ic.overlap_threshold = 0.5;
    ic.min_sustain_seconds = 1.0;
    ic.expire_after_seconds = 1.0;
    config.interactions[ic.name] = ic;
    return config;
}

std::shared_ptr<spdlog::logger> quietLogger() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

struct Harness {
    y2m::AppConfig config = makeTestConfig();
    std::shared_ptr<InteractionEngine> engine;
    std::vector<std::pair<std::string, std::string>> sent;
    std::shared_ptr<EventPublisher> publisher;
    std::unique_ptr<InteractionService> service;

    Harness() {
        std::vector<y2m::InteractionConfig> interactions;
        for (const auto& [name, ic] : config.interactions) interactions.push_back(ic);
        engine = std::make_shared<InteractionEngine>(interactions, 8, quietLogger());
        publisher = std::make_shared<EventPublisher>(
            [this](const std::string& topic, const std::string& payload, int, bool) {
                sent.emplace_back(topic, payload);
            },
            config.mqtt, config.home_assistant, quietLogger());
        service = std::make_unique<InteractionService>(engine, publisher, nullptr, config);
    }
};

const char* kCat = R"({"label":"cat","confidence":0.9,"age":4,"missingStreak":0,"box":[0.25,0.0,0.5,0.5]})";
const char* kBowl = R"({"label":"bowl","confidence":0.8,"age":9,"missingStreak":0,"box":[0.0,0.0,0.5,0.5]})";

}  // namespace

TEST_CASE("InteractionService parses detection topics", "[interaction_service]") {
    Harness h;

    auto ok = h.service->parseDetectionTopic("home/trk/detections/kitchen/42");
    REQUIRE(ok);
    REQUIRE(ok->context == "kitchen");
    REQUIRE(ok->id == 42);

    REQUIRE_FALSE(h.service->parseDetectionTopic("home/trk/events/kitchen/42"));
    REQUIRE_FALSE(h.service->parseDetectionTopic("home/trk/detections/kitchen"));
    REQUIRE_FALSE(h.service->parseDetectionTopic("home/trk/detections/kitchen/"));
    REQUIRE_FALSE(h.service->parseDetectionTopic("home/trk/detections/kitchen/cat"));
    REQUIRE_FALSE(h.service->parseDetectionTopic("home/trk/detections/kitchen/4/2"));
}

TEST_CASE("InteractionService ingests and removes entities", "[interaction_service]") {
    Harness h;

    h.service->handleMessage("home/trk/detections/kitchen/1", kCat);
    auto snap = h.engine->snapshot("kitchen");
    REQUIRE(snap);
    REQUIRE(snap->entities.at(1).bestLabel() == "cat");
    REQUIRE(snap->entities.at(1).age() == 4);

    h.service->handleMessage("home/trk/detections/kitchen/1", "");
    REQUIRE(h.engine->snapshot("kitchen")->entities.empty());
}

TEST_CASE("InteractionService drops malformed payloads", "[interaction_service]") {
    Harness h;
    h.service->handleMessage("home/trk/detections/kitchen/1", kCat);

    h.service->handleMessage("home/trk/detections/kitchen/1", "{not json");
    h.service->handleMessage("home/trk/detections/kitchen/1", R"({"label":"dog"})");
    h.service->handleMessage("home/trk/detections/kitchen/1",
                             R"({"label":"dog","confidence":0.5,"box":[1,2]})");
    h.service->handleMessage("home/trk/detections/kitchen/abc", kCat);

    REQUIRE(h.service->messagesDropped() == 4);
    auto snap = h.engine->snapshot("kitchen");
    REQUIRE(snap->entities.size() == 1);
    REQUIRE(snap->entities.at(1).bestLabel() == "cat");
}

TEST_CASE("InteractionService tick publishes transitions", "[interaction_service]") {
    Harness h;
    h.service->handleMessage("home/trk/detections/kitchen/1", kCat);
    h.service->handleMessage("home/trk/detections/kitchen/2", kBowl);

    auto t0 = Clock::now();
    h.service->tick(t0);
    REQUIRE(h.sent.empty());

    h.service->tick(t0 + 1s);
    REQUIRE(h.sent.size() == 1);
    REQUIRE(h.sent[0].first == "home/trk/events/kitchen/Eating/cat/bowl");

    h.service->handleMessage("home/trk/detections/kitchen/2", "");
    h.service->tick(t0 + 3s);
    REQUIRE(h.sent.size() == 2);
    REQUIRE(h.sent[1].first == "home/trk/events/kitchen/Eating/cat/bowl");
    REQUIRE(h.sent[1].second.empty());
}

TEST_CASE("InteractionService start and stop without broker", "[interaction_service]") {
    Harness h;
    h.service->start();
    REQUIRE(h.service->isRunning());
    std::this_thread::sleep_for(100ms);
    h.service->stop();
    REQUIRE_FALSE(h.service->isRunning());
    h.service->stop();  // idempotent
}

TEST_CASE("InteractionService reports fatal slot configuration", "[interaction_service]") {
    Harness h;
    h.engine = std::make_shared<InteractionEngine>(
        std::vector<y2m::InteractionConfig>{h.config.interactions.at("Eating")}, 1, quietLogger());
    InteractionService service(h.engine, h.publisher, nullptr, h.config);

    std::atomic<bool> fatal{false};
    service.setFatalHandler([&](const std::string&) { fatal = true; });
    service.handleMessage("home/trk/detections/kitchen/1", kCat);
    service.handleMessage("home/trk/detections/kitchen/2", kBowl);

    service.start();
    for (int i = 0; i < 100 && !fatal; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    service.stop();
    REQUIRE(fatal);
}

TEST_CASE("InteractionService stop wakes a long tick wait", "[interaction_service]") {
    Harness h;
    h.config.engine.tick_interval_ms = 60000;
    InteractionService service(h.engine, h.publisher, nullptr, h.config);

    // Repeat to catch a stop that lands between the predicate check and the wait
    for (int round = 0; round < 20; ++round) {
        service.start();
        auto begin = std::chrono::steady_clock::now();
        service.stop();
        REQUIRE(std::chrono::steady_clock::now() - begin < 5s);
    }
}
