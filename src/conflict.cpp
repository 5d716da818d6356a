#include "agenthub/conflict.hpp"

#include <algorithm>
#include <mutex>

namespace agenthub {

// ========== PriorityModel ==========

void PriorityModel::load_default_roles() {
    std::unique_lock lock(mutex_);
    roles_["security_validator"] = AgentRole::Security;
    roles_["intent_router"]      = AgentRole::Orchestrator;
    roles_["audit_agent"]        = AgentRole::Compliance;
    roles_["test_agent"]         = AgentRole::QualityAssurance;
    roles_["product_architect"]  = AgentRole::Design;
    roles_["code_engineer"]      = AgentRole::Implementation;
    roles_["research_agent"]     = AgentRole::Information;
}

void PriorityModel::assign_role(const AgentId& agent, AgentRole role) {
    std::unique_lock lock(mutex_);
    roles_[agent] = role;
}

void PriorityModel::set_priority(const AgentId& agent, int priority) {
    std::unique_lock lock(mutex_);
    overrides_[agent] = priority;
}

void PriorityModel::remove(const AgentId& agent) {
    std::unique_lock lock(mutex_);
    roles_.erase(agent);
    overrides_.erase(agent);
}

AgentRole PriorityModel::role_of(const AgentId& agent) const {
    std::shared_lock lock(mutex_);
    auto it = roles_.find(agent);
    return it != roles_.end() ? it->second : AgentRole::None;
}

int PriorityModel::priority_of(const AgentId& agent) const {
    std::shared_lock lock(mutex_);
    return priority_of_unlocked(agent);
}

int PriorityModel::priority_of_unlocked(const AgentId& agent) const {
    auto ov = overrides_.find(agent);
    if (ov != overrides_.end()) {
        return ov->second;
    }
    auto it = roles_.find(agent);
    return it != roles_.end() ? rank(it->second) : UNRANKED;
}

AgentId PriorityModel::resolve(const std::vector<AgentId>& agents) const {
    std::shared_lock lock(mutex_);

    for (const auto& agent : agents) {
        auto it = roles_.find(agent);
        if (it != roles_.end() && it->second == AgentRole::Security) {
            return agent;
        }
    }

    const AgentId* best = nullptr;
    int best_priority = UNRANKED;
    for (const auto& agent : agents) {
        int p = priority_of_unlocked(agent);
        if (p < best_priority) {
            best_priority = p;
            best = &agent;
        }
    }
    return best ? *best : HUMAN_OVERSIGHT;
}

std::vector<AgentId> PriorityModel::ascending_authority(std::vector<AgentId> agents) const {
    std::shared_lock lock(mutex_);
    std::stable_sort(agents.begin(), agents.end(),
        [this](const AgentId& a, const AgentId& b) {
            return priority_of_unlocked(a) > priority_of_unlocked(b);
        });
    return agents;
}

int PriorityModel::rank(AgentRole role) noexcept {
    switch (role) {
        case AgentRole::Security:         return 1;
        case AgentRole::Orchestrator:     return 2;
        case AgentRole::Compliance:       return 3;
        case AgentRole::QualityAssurance: return 4;
        case AgentRole::Design:           return 5;
        case AgentRole::Implementation:   return 6;
        case AgentRole::Information:      return 7;
        case AgentRole::None:             return UNRANKED;
    }
    return UNRANKED;
}

// ========== Resolvers ==========

std::optional<Value> LastWriterWinsResolver::resolve(const StateEntry& /*existing*/,
                                                     const Value& incoming,
                                                     const AgentId& /*writer*/) const {
    return incoming;
}

std::optional<Value> VersionVectorResolver::resolve(const StateEntry& /*existing*/,
                                                    const Value& incoming,
                                                    const AgentId& /*writer*/) const {
    // TODO: track per-agent version vectors on StateEntry once concurrent
    // writers across stores need causal ordering.
    return incoming;
}

AgentPriorityResolver::AgentPriorityResolver(const PriorityModel& priorities)
    : priorities_(priorities) {}

std::optional<Value> AgentPriorityResolver::resolve(const StateEntry& existing,
                                                    const Value& incoming,
                                                    const AgentId& writer) const {
    if (writer == existing.owner) {
        return incoming;
    }
    if (priorities_.priority_of(writer) <= priorities_.priority_of(existing.owner)) {
        return incoming;
    }
    return std::nullopt;
}

std::optional<Value> MergeResolver::resolve(const StateEntry& existing,
                                            const Value& incoming,
                                            const AgentId& /*writer*/) const {
    if (!existing.value.isObject() || !incoming.isObject()) {
        return incoming;
    }

    Value merged = existing.value;
    for (const auto& name : incoming.getMemberNames()) {
        merged[name] = incoming[name];
    }
    return merged;
}

std::optional<Value> HumanInterventionResolver::resolve(const StateEntry& /*existing*/,
                                                        const Value& /*incoming*/,
                                                        const AgentId& /*writer*/) const {
    return std::nullopt;
}

std::unique_ptr<ConflictResolver> make_resolver(ConflictStrategy strategy,
                                                const PriorityModel& priorities) {
    switch (strategy) {
        case ConflictStrategy::LastWriterWins:
            return std::make_unique<LastWriterWinsResolver>();
        case ConflictStrategy::VersionVector:
            return std::make_unique<VersionVectorResolver>();
        case ConflictStrategy::AgentPriority:
            return std::make_unique<AgentPriorityResolver>(priorities);
        case ConflictStrategy::Merge:
            return std::make_unique<MergeResolver>();
        case ConflictStrategy::HumanIntervention:
            return std::make_unique<HumanInterventionResolver>();
    }
    return std::make_unique<LastWriterWinsResolver>();
}

} // namespace agenthub
