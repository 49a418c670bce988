#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tracked_entity.h"

#include <nlohmann/json.hpp>

using namespace itrack;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {
Detection det(const std::string& label, double conf, Box box = {0.1, 0.1, 0.2, 0.2}) {
    return Detection{label, conf, box};
}
}  // namespace

// ============================================================
// Best-label resolution
// ============================================================

TEST_CASE("TrackedEntity single label keeps exact confidence", "[tracked_entity]") {
    TrackedEntity e;
    for (int i = 0; i < 17; ++i) {
        e.markSeen(det("cat", 0.83));
    }

    REQUIRE(e.bestLabel() == "cat");
    REQUIRE(e.bestConfidence() == 0.83);
    REQUIRE(e.labelConf("cat") == 1.0);
    REQUIRE(e.age() == 17);
}

TEST_CASE("TrackedEntity multi-label resolution weights frequency and confidence",
          "[tracked_entity]") {
    TrackedEntity e;
    e.markSeen(det("cat", 0.9));
    e.markSeen(det("cat", 0.9));
    e.markSeen(det("dog", 0.6));
    e.markSeen(det("cat", 0.9));

    // total mass 3.3, share(cat) = 2.7 / 3.3
    REQUIRE(e.bestLabel() == "cat");
    REQUIRE_THAT(e.labelConf("cat"), WithinAbs(2.7 / 3.3, 1e-9));
    REQUIRE_THAT(e.labelConf("dog"), WithinAbs(0.6 / 3.3, 1e-9));
    REQUIRE_THAT(e.bestConfidence(), WithinAbs(0.9 * 2.7 / 3.3, 1e-9));
    REQUIRE_THAT(e.bestConfidence(), WithinAbs(0.736, 1e-3));
}

TEST_CASE("TrackedEntity frequent low-confidence label beats rare confident one",
          "[tracked_entity]") {
    TrackedEntity e;
    e.markSeen(det("dog", 0.95));
    for (int i = 0; i < 4; ++i) {
        e.markSeen(det("cat", 0.5));
    }

    REQUIRE(e.bestLabel() == "cat");
    REQUIRE_THAT(e.bestConfidence(), WithinAbs(0.5 * (2.0 / 2.95), 1e-9));
}

TEST_CASE("TrackedEntity tie on share keeps first observed label", "[tracked_entity]") {
    TrackedEntity e;
    e.markSeen(det("dog", 0.5));
    e.markSeen(det("cat", 0.5));

    REQUIRE(e.bestLabel() == "dog");
    REQUIRE(e.bestConfidence() == 0.25);
}

TEST_CASE("TrackedEntity labelConf of unseen label is zero", "[tracked_entity]") {
    TrackedEntity e(det("cat", 0.7));
    REQUIRE(e.labelConf("bowl") == 0.0);
}

TEST_CASE("TrackedEntity zero-confidence detections still yield a label", "[tracked_entity]") {
    TrackedEntity e(det("cat", 0.0));
    REQUIRE(e.bestLabel() == "cat");
    REQUIRE(e.bestConfidence() == 0.0);
}

// ============================================================
// Poll-cycle counters
// ============================================================

TEST_CASE("TrackedEntity markMissing only advances missing streak", "[tracked_entity]") {
    TrackedEntity e(det("cat", 0.8));
    e.markMissing();
    e.markMissing();

    REQUIRE(e.missingStreak() == 2);
    REQUIRE(e.age() == 1);
    REQUIRE(e.bestConfidence() == 0.8);

    e.markSeen(det("cat", 0.8));
    REQUIRE(e.missingStreak() == 0);
    REQUIRE(e.age() == 2);
}

TEST_CASE("TrackedEntity tracking-only cycle leaves labels untouched", "[tracked_entity]") {
    TrackedEntity e(det("cat", 0.8, {0.1, 0.1, 0.2, 0.2}));
    e.markMissing();
    e.markSeen();

    REQUIRE(e.missingStreak() == 0);
    REQUIRE(e.age() == 2);
    REQUIRE(e.labelCount() == 1);
    REQUIRE(e.bestConfidence() == 0.8);
    REQUIRE(e.lastBox().x == 0.1);
}

TEST_CASE("TrackedEntity same-cycle detection does not advance age", "[tracked_entity]") {
    TrackedEntity e(det("cat", 0.8));
    e.markSeen(det("dog", 0.4), false);

    REQUIRE(e.age() == 1);
    REQUIRE(e.labelCount() == 2);
}

TEST_CASE("TrackedEntity lastBox follows most recent detection of any label",
          "[tracked_entity]") {
    TrackedEntity e;
    e.markSeen(det("cat", 0.9, {0.1, 0.1, 0.1, 0.1}));
    e.markSeen(det("dog", 0.2, {0.5, 0.5, 0.2, 0.2}));

    REQUIRE(e.bestLabel() == "cat");
    REQUIRE(e.lastBox().x == 0.5);
    REQUIRE(e.lastBox().w == 0.2);
}

// ============================================================
// Wire record
// ============================================================

TEST_CASE("TrackedEntity serialization round trip", "[tracked_entity][json]") {
    TrackedEntity e;
    e.markSeen(det("cat", 0.9, {0.125, 0.25, 0.3, 0.4}));
    e.markSeen(det("dog", 0.6, {0.125, 0.25, 0.3, 0.4}));
    e.markSeen(det("cat", 0.7, {0.2, 0.3, 0.31, 0.41}));
    e.markMissing();
    e.markMissing();

    auto restored = TrackedEntity::fromJson(json::parse(e.toJson().dump()));

    REQUIRE(restored.bestLabel() == e.bestLabel());
    REQUIRE(restored.bestConfidence() == e.bestConfidence());
    REQUIRE(restored.age() == e.age());
    REQUIRE(restored.missingStreak() == e.missingStreak());
    REQUIRE(restored.lastBox().x == e.lastBox().x);
    REQUIRE(restored.lastBox().y == e.lastBox().y);
    REQUIRE(restored.lastBox().w == e.lastBox().w);
    REQUIRE(restored.lastBox().h == e.lastBox().h);
}

TEST_CASE("TrackedEntity wire record carries framesSeen", "[tracked_entity][json]") {
    auto j = json::parse(R"({"label":"cat","confidence":0.5,"age":3,"missingStreak":1,
                             "framesSeen":9,"box":[0.1,0.2,0.3,0.4]})");
    auto e = TrackedEntity::fromJson(j);

    REQUIRE(e.framesSeen() == 9);
    REQUIRE(e.toJson()["framesSeen"] == 9);
    REQUIRE(e.age() == 3);
    REQUIRE(e.missingStreak() == 1);
}

TEST_CASE("TrackedEntity fromJson rejects malformed records", "[tracked_entity][json]") {
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(R"({"confidence":0.5,"box":[0,0,1,1]})")),
                      json::exception);
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(R"({"label":"cat","confidence":"high","box":[0,0,1,1]})")),
                      json::exception);
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(R"({"label":"cat","confidence":0.5,"box":[0,0,1]})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(R"({"label":"cat","confidence":1.5,"box":[0,0,1,1]})")),
                      std::invalid_argument);
}

TEST_CASE("TrackedEntity fromJson rejects negative counters", "[tracked_entity][json]") {
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(
                          R"({"label":"cat","confidence":0.5,"age":-1,"box":[0,0,1,1]})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(
                          R"({"label":"cat","confidence":0.5,"missingStreak":-3,"box":[0,0,1,1]})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(
                          R"({"label":"cat","confidence":0.5,"framesSeen":-2,"box":[0,0,1,1]})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TrackedEntity::fromJson(json::parse(
                          R"({"label":"cat","confidence":0.5,"age":4294967296,"box":[0,0,1,1]})")),
                      std::invalid_argument);

    auto e = TrackedEntity::fromJson(json::parse(
        R"({"label":"cat","confidence":0.5,"age":4294967295,"box":[0,0,1,1]})"));
    REQUIRE(e.age() == 4294967295u);
    REQUIRE(e.missingStreak() == 0);
}

// ============================================================
// Geometry
// ============================================================

TEST_CASE("Box intersection over smaller area", "[tracked_entity][geometry]") {
    Box big{0.0, 0.0, 0.5, 0.5};
    Box inside{0.125, 0.125, 0.25, 0.25};
    Box half{0.25, 0.0, 0.5, 0.5};
    Box apart{0.75, 0.75, 0.125, 0.125};
    Box touching{0.5, 0.0, 0.25, 0.25};

    REQUIRE(intersectionOverSmaller(big, inside) == 1.0);
    REQUIRE(intersectionOverSmaller(big, half) == 0.5);
    REQUIRE(intersectionOverSmaller(big, apart) == 0.0);
    REQUIRE(intersectionOverSmaller(big, touching) == 0.0);
    REQUIRE(intersectionOverSmaller(big, Box{0.1, 0.1, 0.0, 0.3}) == 0.0);
}
