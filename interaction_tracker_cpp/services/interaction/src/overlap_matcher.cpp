#include "overlap_matcher.h"

#include <algorithm>

namespace itrack {

OverlapMatcher::OverlapMatcher(std::vector<y2m::InteractionConfig> interactions,
                               size_t max_depth)
    : interactions_(std::move(interactions))
    , max_depth_(max_depth)
{
}

std::vector<OverlapPair> OverlapMatcher::computeOverlaps(const std::vector<EntityRef>& entities) {
    std::vector<OverlapPair> pairs;
    for (size_t i = 0; i < entities.size(); ++i) {
        for (size_t j = i + 1; j < entities.size(); ++j) {
            double ios = intersectionOverSmaller(entities[i].second->lastBox(),
                                                 entities[j].second->lastBox());
            if (ios > 0.0) {
                pairs.push_back({i, j, ios});
            }
        }
    }
    return pairs;
}

std::vector<CandidateMatch> OverlapMatcher::match(const std::vector<EntityRef>& entities) const {
    std::vector<CandidateMatch> matches;
    if (entities.size() < 2 || interactions_.empty()) return matches;

    auto pairs = computeOverlaps(entities);

    for (const auto& interaction : interactions_) {
        for (const auto& pair : pairs) {
            if (pair.ios < interaction.overlap_threshold) continue;

            const size_t members[2] = {pair.a, pair.b};
            std::vector<std::string> labels = {
                entities[pair.a].second->bestLabel(),
                entities[pair.b].second->bestLabel(),
            };

            for (const auto& assignment : assignSlots(interaction, labels)) {
                CandidateMatch cm;
                cm.interaction = interaction.name;
                for (size_t member : assignment) {
                    cm.slot_labels.push_back(labels[member]);
                    cm.entity_ids.push_back(entities[members[member]].first);
                }
                matches.push_back(std::move(cm));
            }
        }
    }
    return matches;
}

std::vector<std::vector<size_t>> OverlapMatcher::assignSlots(
    const y2m::InteractionConfig& interaction,
    const std::vector<std::string>& member_labels) const
{
    if (interaction.slots.size() > max_depth_) {
        throw SlotDepthError("interaction '" + interaction.name + "' declares " +
                             std::to_string(interaction.slots.size()) +
                             " slots, max depth is " + std::to_string(max_depth_));
    }

    std::vector<std::vector<size_t>> out;
    std::vector<bool> used(member_labels.size(), false);
    std::vector<size_t> assignment;
    assignment.reserve(interaction.slots.size());
    assignRecursive(interaction, member_labels, used, assignment, out);
    return out;
}

void OverlapMatcher::assignRecursive(const y2m::InteractionConfig& interaction,
                                     const std::vector<std::string>& member_labels,
                                     std::vector<bool>& used,
                                     std::vector<size_t>& assignment,
                                     std::vector<std::vector<size_t>>& out) const
{
    const size_t depth = assignment.size();
    if (depth == interaction.slots.size()) {
        if (std::all_of(used.begin(), used.end(), [](bool u) { return u; })) {
            out.push_back(assignment);
        }
        return;
    }

    const auto& accepted = interaction.slots[depth];
    for (size_t i = 0; i < member_labels.size(); ++i) {
        if (used[i]) continue;
        if (std::find(accepted.begin(), accepted.end(), member_labels[i]) == accepted.end()) {
            continue;
        }
        used[i] = true;
        assignment.push_back(i);
        assignRecursive(interaction, member_labels, used, assignment, out);
        assignment.pop_back();
        used[i] = false;
    }
}

}  // namespace itrack
