#pragma once

#include "running_stats.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace itrack {

/// Axis-aligned rectangle in normalized frame coordinates (top-left + size)
struct Box {
    double x = 0, y = 0, w = 0, h = 0;

    double area() const { return (w > 0 && h > 0) ? w * h : 0.0; }
};

double intersectionArea(const Box& a, const Box& b);

/// Intersection over the smaller of the two areas; 0 if they do not intersect
double intersectionOverSmaller(const Box& a, const Box& b);

using EntityId = int64_t;

struct Detection {
    std::string label;
    double confidence = 0.0;
    Box box;
};

/// Folds a stream of per-frame classifications for one tracked id into a
/// single (label, confidence) judgment.
///
/// Every label ever reported keeps its own confidence statistics. A label's
/// share is its summed confidence over the summed confidence of all labels,
/// so frequent and confident reports both count. The best label is the one
/// with the largest share; ties go to the label observed first. The reported
/// confidence is avg(best) * share(best).
class TrackedEntity {
public:
    TrackedEntity() = default;
    explicit TrackedEntity(const Detection& first) { markSeen(first); }

    /// Entity was present this cycle. Without a detection only the missing
    /// streak is reset (tracking-only cycle); label statistics are untouched.
    void markSeen(const std::optional<Detection>& detection = std::nullopt,
                  bool new_poll_cycle = true);

    /// Entity was absent this cycle
    void markMissing() { ++missing_streak_; }

    /// Share of the given label, 0 if it was never observed
    double labelConf(const std::string& label) const;

    const std::string& bestLabel() const { return best_label_; }
    double bestConfidence() const { return best_confidence_; }
    const Box& lastBox() const { return last_box_; }
    uint32_t age() const { return age_; }
    uint32_t missingStreak() const { return missing_streak_; }
    uint32_t framesSeen() const { return frames_seen_; }
    size_t labelCount() const { return labels_.size(); }

    /// Flat wire record: {label, confidence, age, missingStreak, framesSeen, box}
    nlohmann::json toJson() const;

    /// Rebuild from a wire record. Throws nlohmann::json::exception on
    /// missing or mistyped fields.
    static TrackedEntity fromJson(const nlohmann::json& j);

private:
    struct LabelObservation {
        std::string label;
        RunningStats confidence;
        Box last_box;
        double share = 0.0;
    };

    LabelObservation* findLabel(const std::string& label);
    const LabelObservation* findLabel(const std::string& label) const;
    void recalculateBest();

    std::vector<LabelObservation> labels_;  // in first-observed order
    std::string best_label_;
    double best_confidence_ = 0.0;
    Box last_box_;
    uint32_t age_ = 0;
    uint32_t missing_streak_ = 0;
    uint32_t frames_seen_ = 0;  // carried on the wire, never advanced
};

}  // namespace itrack
