#pragma once

#include "config_manager.h"
#include "overlap_matcher.h"
#include "tracked_entity.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace itrack {

using Clock = std::chrono::steady_clock;

/// Canonical event identity: interaction name plus the label filling each
/// slot. Different physical entities with the same labels share a key.
struct EventKey {
    std::string interaction;
    std::vector<std::string> slots;

    bool operator==(const EventKey& other) const = default;

    /// "interaction/slot1/slot2/..."
    std::string path() const;
};

struct EventKeyHash {
    size_t operator()(const EventKey& key) const;
};

struct EventRecord {
    Clock::time_point first_seen;
    Clock::time_point last_seen;
    bool published = false;
};

enum class TransitionKind { Activated, Cleared };

struct EventTransition {
    TransitionKind kind;
    std::string context;
    EventKey key;
};

struct ContextStats {
    std::string name;
    size_t entities = 0;
    size_t pending_events = 0;
    size_t active_events = 0;
};

/// Copy of one context's state, for status reporting
struct ContextSnapshot {
    std::string name;
    std::map<EntityId, TrackedEntity> entities;
    std::vector<std::pair<EventKey, EventRecord>> events;
};

/// Debounces overlap matches into activate/clear transitions, per context.
///
/// Each event key moves UNSEEN -> PENDING on its first sighting, PENDING ->
/// ACTIVE once it is seen again at least min_time after the first sighting,
/// and is dropped when it has not been seen for more than expire_time.
/// Only ACTIVE records produce a Cleared transition when dropped.
///
/// Ingestion and evaluation of the same context are serialized by that
/// context's mutex; different contexts proceed independently. Transitions
/// are returned to the caller rather than emitted under the lock.
class InteractionEngine {
public:
    explicit InteractionEngine(std::vector<y2m::InteractionConfig> interactions,
                               size_t max_slot_depth = 8,
                               std::shared_ptr<spdlog::logger> logger = nullptr);

    InteractionEngine(const InteractionEngine&) = delete;
    InteractionEngine& operator=(const InteractionEngine&) = delete;

    /// Insert or replace an entity. Creates the context on first use.
    void upsertEntity(const std::string& context, EntityId id, TrackedEntity entity);

    /// Drop an entity. Returns false if the context or id is unknown.
    bool removeEntity(const std::string& context, EntityId id);

    /// One evaluation pass over every context, sharing a single `now`.
    /// Throws SlotDepthError on a pathological interaction definition.
    std::vector<EventTransition> evaluate(Clock::time_point now);

    std::vector<EventTransition> evaluateContext(const std::string& context,
                                                 Clock::time_point now);

    /// Swap the interaction set. Records whose interaction disappeared are
    /// expired on the next evaluation.
    void setInteractions(std::vector<y2m::InteractionConfig> interactions);

    std::vector<ContextStats> stats() const;
    std::optional<ContextSnapshot> snapshot(const std::string& context) const;
    std::vector<std::string> contextNames() const;

private:
    struct Context {
        explicit Context(std::string n) : name(std::move(n)) {}

        std::string name;
        mutable std::mutex mutex;
        std::map<EntityId, TrackedEntity> entities;
        std::unordered_map<EventKey, EventRecord, EventKeyHash> events;
    };

    struct Rules {
        Rules(std::vector<y2m::InteractionConfig> interactions, size_t max_depth);

        const y2m::InteractionConfig* find(const std::string& name) const;

        OverlapMatcher matcher;
        std::unordered_map<std::string, y2m::InteractionConfig> by_name;
    };

    std::shared_ptr<Context> findContext(const std::string& name) const;
    std::shared_ptr<const Rules> currentRules() const;
    void evaluateLocked(Context& ctx, const Rules& rules, Clock::time_point now,
                        std::vector<EventTransition>& out);
    void logContext(const Context& ctx) const;

    std::shared_ptr<spdlog::logger> log_;
    size_t max_slot_depth_;

    mutable std::mutex rules_mutex_;
    std::shared_ptr<const Rules> rules_;

    mutable std::mutex contexts_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Context>> contexts_;
};

}  // namespace itrack
