#include "interaction_engine.h"

#include <spdlog/spdlog.h>

#include <functional>
#include <unordered_set>

namespace itrack {

namespace {

std::chrono::duration<double> seconds(double s) {
    return std::chrono::duration<double>(s);
}

std::string joinIds(const std::vector<EntityId>& ids) {
    std::string out;
    for (auto id : ids) {
        if (!out.empty()) out += ',';
        out += std::to_string(id);
    }
    return out;
}

}  // anonymous namespace

std::string EventKey::path() const {
    std::string p = interaction;
    for (const auto& s : slots) {
        p += '/';
        p += s;
    }
    return p;
}

size_t EventKeyHash::operator()(const EventKey& key) const {
    std::hash<std::string> h;
    size_t seed = h(key.interaction);
    for (const auto& s : key.slots) {
        seed ^= h(s) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

InteractionEngine::Rules::Rules(std::vector<y2m::InteractionConfig> interactions,
                                size_t max_depth)
    : matcher(interactions, max_depth)
{
    for (auto& ic : interactions) {
        auto name = ic.name;
        by_name.emplace(std::move(name), std::move(ic));
    }
}

const y2m::InteractionConfig* InteractionEngine::Rules::find(const std::string& name) const {
    auto it = by_name.find(name);
    return it == by_name.end() ? nullptr : &it->second;
}

InteractionEngine::InteractionEngine(std::vector<y2m::InteractionConfig> interactions,
                                     size_t max_slot_depth,
                                     std::shared_ptr<spdlog::logger> logger)
    : log_(logger ? std::move(logger) : spdlog::default_logger())
    , max_slot_depth_(max_slot_depth)
    , rules_(std::make_shared<const Rules>(std::move(interactions), max_slot_depth))
{
    log_->info("InteractionEngine: {} interactions configured", rules_->by_name.size());
}

void InteractionEngine::upsertEntity(const std::string& context, EntityId id,
                                     TrackedEntity entity) {
    std::shared_ptr<Context> ctx;
    {
        std::lock_guard lock(contexts_mutex_);
        auto& slot = contexts_[context];
        if (!slot) {
            slot = std::make_shared<Context>(context);
            log_->info("InteractionEngine: new context '{}'", context);
        }
        ctx = slot;
    }

    std::lock_guard lock(ctx->mutex);
    auto [it, inserted] = ctx->entities.insert_or_assign(id, std::move(entity));
    if (inserted) {
        log_->info("[{}] Added {} ({}). Tracking {} objects.",
                   context, id, it->second.bestLabel(), ctx->entities.size());
    }
}

bool InteractionEngine::removeEntity(const std::string& context, EntityId id) {
    auto ctx = findContext(context);
    if (!ctx) return false;

    std::lock_guard lock(ctx->mutex);
    if (ctx->entities.erase(id) == 0) return false;

    log_->info("[{}] Removed {}. Tracking {} objects.", context, id, ctx->entities.size());
    return true;
}

std::vector<EventTransition> InteractionEngine::evaluate(Clock::time_point now) {
    std::vector<std::shared_ptr<Context>> contexts;
    {
        std::lock_guard lock(contexts_mutex_);
        contexts.reserve(contexts_.size());
        for (const auto& [name, ctx] : contexts_) {
            contexts.push_back(ctx);
        }
    }

    auto rules = currentRules();
    std::vector<EventTransition> transitions;
    for (const auto& ctx : contexts) {
        std::lock_guard lock(ctx->mutex);
        evaluateLocked(*ctx, *rules, now, transitions);
    }
    return transitions;
}

std::vector<EventTransition> InteractionEngine::evaluateContext(const std::string& context,
                                                                Clock::time_point now) {
    std::vector<EventTransition> transitions;
    auto ctx = findContext(context);
    if (!ctx) return transitions;

    auto rules = currentRules();
    std::lock_guard lock(ctx->mutex);
    evaluateLocked(*ctx, *rules, now, transitions);
    return transitions;
}

void InteractionEngine::evaluateLocked(Context& ctx, const Rules& rules,
                                       Clock::time_point now,
                                       std::vector<EventTransition>& out) {
    std::vector<EntityRef> refs;
    refs.reserve(ctx.entities.size());
    for (const auto& [id, entity] : ctx.entities) {
        refs.emplace_back(id, &entity);
    }

    auto candidates = rules.matcher.match(refs);

    // Several permutations or entities can produce the same key; first one wins
    std::unordered_set<EventKey, EventKeyHash> seen;
    for (auto& candidate : candidates) {
        EventKey key{candidate.interaction, candidate.slot_labels};
        if (!seen.insert(key).second) continue;

        auto it = ctx.events.find(key);
        if (it == ctx.events.end()) {
            ctx.events.emplace(key, EventRecord{now, now, false});
            log_->debug("[{}] {} pending (entities {})", ctx.name, key.path(),
                        joinIds(candidate.entity_ids));
            continue;
        }

        auto& record = it->second;
        const auto* interaction = rules.find(key.interaction);
        if (interaction && !record.published &&
            now - record.first_seen >= seconds(interaction->min_sustain_seconds)) {
            record.published = true;
            log_->info("[{}] {} activated", ctx.name, key.path());
            out.push_back({TransitionKind::Activated, ctx.name, key});
        }
        record.last_seen = now;
    }

    for (auto it = ctx.events.begin(); it != ctx.events.end();) {
        if (seen.count(it->first)) {
            ++it;
            continue;
        }

        const auto* interaction = rules.find(it->first.interaction);
        bool expired = !interaction ||
            now - it->second.last_seen > seconds(interaction->expire_after_seconds);
        if (!expired) {
            ++it;
            continue;
        }

        if (it->second.published) {
            log_->info("[{}] {} cleared", ctx.name, it->first.path());
            out.push_back({TransitionKind::Cleared, ctx.name, it->first});
        } else {
            log_->debug("[{}] {} expired before activation", ctx.name, it->first.path());
        }
        it = ctx.events.erase(it);
    }

    if (log_->should_log(spdlog::level::debug)) {
        logContext(ctx);
    }
}

void InteractionEngine::setInteractions(std::vector<y2m::InteractionConfig> interactions) {
    auto rules = std::make_shared<const Rules>(std::move(interactions), max_slot_depth_);
    std::lock_guard lock(rules_mutex_);
    rules_ = std::move(rules);
    log_->info("InteractionEngine: interactions replaced ({} configured)",
               rules_->by_name.size());
}

std::vector<ContextStats> InteractionEngine::stats() const {
    std::vector<std::shared_ptr<Context>> contexts;
    {
        std::lock_guard lock(contexts_mutex_);
        for (const auto& [name, ctx] : contexts_) contexts.push_back(ctx);
    }

    std::vector<ContextStats> result;
    result.reserve(contexts.size());
    for (const auto& ctx : contexts) {
        std::lock_guard lock(ctx->mutex);
        ContextStats s;
        s.name = ctx->name;
        s.entities = ctx->entities.size();
        for (const auto& [key, record] : ctx->events) {
            if (record.published) ++s.active_events;
            else ++s.pending_events;
        }
        result.push_back(std::move(s));
    }
    return result;
}

std::optional<ContextSnapshot> InteractionEngine::snapshot(const std::string& context) const {
    auto ctx = findContext(context);
    if (!ctx) return std::nullopt;

    std::lock_guard lock(ctx->mutex);
    ContextSnapshot snap;
    snap.name = ctx->name;
    snap.entities = ctx->entities;
    snap.events.assign(ctx->events.begin(), ctx->events.end());
    return snap;
}

std::vector<std::string> InteractionEngine::contextNames() const {
    std::lock_guard lock(contexts_mutex_);
    std::vector<std::string> names;
    names.reserve(contexts_.size());
    for (const auto& [name, ctx] : contexts_) names.push_back(name);
    return names;
}

std::shared_ptr<InteractionEngine::Context> InteractionEngine::findContext(
    const std::string& name) const {
    std::lock_guard lock(contexts_mutex_);
    auto it = contexts_.find(name);
    return it == contexts_.end() ? nullptr : it->second;
}

std::shared_ptr<const InteractionEngine::Rules> InteractionEngine::currentRules() const {
    std::lock_guard lock(rules_mutex_);
    return rules_;
}

void InteractionEngine::logContext(const Context& ctx) const {
    for (const auto& [id, entity] : ctx.entities) {
        const auto& b = entity.lastBox();
        log_->debug("[{}]   {} {} {:.2f} age={} missing={} box=[{:.3f},{:.3f},{:.3f},{:.3f}]",
                    ctx.name, id, entity.bestLabel(), entity.bestConfidence(),
                    entity.age(), entity.missingStreak(), b.x, b.y, b.w, b.h);
    }
    for (const auto& [key, record] : ctx.events) {
        log_->debug("[{}]   event {} {}", ctx.name, key.path(),
                    record.published ? "ACTIVE" : "PENDING");
    }
}

}  // namespace itrack
