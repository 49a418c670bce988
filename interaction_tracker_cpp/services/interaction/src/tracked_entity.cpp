#include "tracked_entity.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace itrack {

double intersectionArea(const Box& a, const Box& b) {
    double x1 = std::max(a.x, b.x);
    double y1 = std::max(a.y, b.y);
    double x2 = std::min(a.x + a.w, b.x + b.w);
    double y2 = std::min(a.y + a.h, b.y + b.h);
    if (x2 <= x1 || y2 <= y1) return 0.0;
    return (x2 - x1) * (y2 - y1);
}

double intersectionOverSmaller(const Box& a, const Box& b) {
    double inter = intersectionArea(a, b);
    if (inter <= 0.0) return 0.0;
    double smaller = std::min(a.area(), b.area());
    return smaller > 0.0 ? inter / smaller : 0.0;
}

void TrackedEntity::markSeen(const std::optional<Detection>& detection, bool new_poll_cycle) {
    if (new_poll_cycle) ++age_;
    missing_streak_ = 0;

    if (!detection) return;

    auto* obs = findLabel(detection->label);
    if (!obs) {
        labels_.push_back(LabelObservation{detection->label, {}, {}, 0.0});
        obs = &labels_.back();
    }
    obs->confidence.addValue(detection->confidence);
    obs->last_box = detection->box;
    last_box_ = detection->box;

    recalculateBest();
}

double TrackedEntity::labelConf(const std::string& label) const {
    const auto* obs = findLabel(label);
    return obs ? obs->share : 0.0;
}

TrackedEntity::LabelObservation* TrackedEntity::findLabel(const std::string& label) {
    auto it = std::find_if(labels_.begin(), labels_.end(),
                           [&](const LabelObservation& o) { return o.label == label; });
    return it == labels_.end() ? nullptr : &*it;
}

const TrackedEntity::LabelObservation* TrackedEntity::findLabel(const std::string& label) const {
    auto it = std::find_if(labels_.begin(), labels_.end(),
                           [&](const LabelObservation& o) { return o.label == label; });
    return it == labels_.end() ? nullptr : &*it;
}

void TrackedEntity::recalculateBest() {
    if (labels_.empty()) return;

    double total_mass = 0.0;
    for (const auto& obs : labels_) {
        total_mass += obs.confidence.sum();
    }

    for (auto& obs : labels_) {
        obs.share = total_mass > 0.0 ? obs.confidence.sum() / total_mass : 0.0;
    }

    // Strict comparison: on equal shares the earlier-observed label stays best
    const LabelObservation* best = &labels_.front();
    for (const auto& obs : labels_) {
        if (obs.share > best->share) best = &obs;
    }

    best_label_ = best->label;
    best_confidence_ = best->confidence.avg() * best->share;
}

json TrackedEntity::toJson() const {
    return json{
        {"label", best_label_},
        {"confidence", best_confidence_},
        {"age", age_},
        {"missingStreak", missing_streak_},
        {"framesSeen", frames_seen_},
        {"box", {last_box_.x, last_box_.y, last_box_.w, last_box_.h}},
    };
}

namespace {

// Optional non-negative counter field, 0 when absent
uint32_t readCounter(const json& j, const char* key) {
    auto value = j.value(key, int64_t{0});
    if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

TrackedEntity TrackedEntity::fromJson(const json& j) {
    auto label = j.at("label").get<std::string>();
    auto confidence = j.at("confidence").get<double>();
    auto box = j.at("box").get<std::vector<double>>();

    if (box.size() != 4) {
        throw std::invalid_argument("box must be [x, y, w, h], got " +
                                    std::to_string(box.size()) + " values");
    }
    if (confidence < 0.0 || confidence > 1.0) {
        throw std::invalid_argument("confidence out of range: " + std::to_string(confidence));
    }

    TrackedEntity entity;
    Box b{box[0], box[1], box[2], box[3]};
    if (!label.empty()) {
        // A single observation has share 1.0, so the confidence survives exactly
        entity.markSeen(Detection{label, confidence, b}, false);
    }
    entity.last_box_ = b;
    entity.age_ = readCounter(j, "age");
    entity.missing_streak_ = readCounter(j, "missingStreak");
    entity.frames_seen_ = readCounter(j, "framesSeen");
    return entity;
}

}  // namespace itrack
