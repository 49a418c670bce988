#pragma once

#include "config_manager.h"
#include "tracked_entity.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace itrack {

/// Slot assignment recursed deeper than the configured limit. This is a
/// configuration fault and is not meant to be caught by the evaluator.
class SlotDepthError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

using EntityRef = std::pair<EntityId, const TrackedEntity*>;

struct OverlapPair {
    size_t a = 0;  // indices into the entity snapshot, a < b
    size_t b = 0;
    double ios = 0.0;
};

/// One way of filling an interaction's slots. Identity is the label sequence;
/// entity_ids are kept for logging only.
struct CandidateMatch {
    std::string interaction;
    std::vector<std::string> slot_labels;
    std::vector<EntityId> entity_ids;
};

/// Finds configured interactions among overlapping entities of one context.
/// Only pairs of entities are ever considered, so an interaction with more
/// than two slots cannot match. Does not modify the entities.
class OverlapMatcher {
public:
    explicit OverlapMatcher(std::vector<y2m::InteractionConfig> interactions,
                            size_t max_depth = 8);

    /// All candidate matches for the snapshot, interactions in configured
    /// order, pairs in index order, every valid slot permutation per pair.
    /// Throws SlotDepthError for an interaction with more slots than max_depth.
    std::vector<CandidateMatch> match(const std::vector<EntityRef>& entities) const;

    /// Every intersecting pair with its intersection-over-smaller ratio
    static std::vector<OverlapPair> computeOverlaps(const std::vector<EntityRef>& entities);

    /// Every assignment of members to slots (as member indices per slot) that
    /// uses each member exactly once and respects each slot's label set.
    /// Throws SlotDepthError when the interaction has more slots than max_depth.
    std::vector<std::vector<size_t>> assignSlots(const y2m::InteractionConfig& interaction,
                                                 const std::vector<std::string>& member_labels) const;

    const std::vector<y2m::InteractionConfig>& interactions() const { return interactions_; }

private:
    void assignRecursive(const y2m::InteractionConfig& interaction,
                         const std::vector<std::string>& member_labels,
                         std::vector<bool>& used,
                         std::vector<size_t>& assignment,
                         std::vector<std::vector<size_t>>& out) const;

    std::vector<y2m::InteractionConfig> interactions_;
    size_t max_depth_;
};

}  // namespace itrack
