#pragma once

#include "agenthub/types.hpp"
#include "agenthub/state_entry.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agenthub {

// Role hierarchy shared by the router, the state store and the workflow
// engine. Lower number = higher authority.
class PriorityModel {
public:
    static constexpr int UNRANKED = 999;

    PriorityModel() = default;

    PriorityModel(const PriorityModel&) = delete;
    PriorityModel& operator=(const PriorityModel&) = delete;

    // Registers the stock agent names (security_validator, intent_router, ...)
    void load_default_roles();

    void assign_role(const AgentId& agent, AgentRole role);
    // Explicit number, overriding the role's rank for agent-priority writes
    void set_priority(const AgentId& agent, int priority);
    void remove(const AgentId& agent);

    AgentRole role_of(const AgentId& agent) const;
    int priority_of(const AgentId& agent) const;

    // Winner among conflicting agents: any security-role agent, else the
    // highest ranked one (first on ties), else HUMAN_OVERSIGHT.
    AgentId resolve(const std::vector<AgentId>& agents) const;

    // Orders agents from lowest to highest authority (escalation chains).
    std::vector<AgentId> ascending_authority(std::vector<AgentId> agents) const;

    static int rank(AgentRole role) noexcept;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<AgentId, AgentRole> roles_;
    std::unordered_map<AgentId, int> overrides_;

    int priority_of_unlocked(const AgentId& agent) const;
};

// Decides what happens when a write hits an existing entry.
class ConflictResolver {
public:
    virtual ~ConflictResolver() = default;

    // The value to persist, or nullopt to reject the write.
    virtual std::optional<Value> resolve(const StateEntry& existing,
                                         const Value& incoming,
                                         const AgentId& writer) const = 0;

    virtual ConflictStrategy strategy() const noexcept = 0;
    virtual std::string name() const = 0;
};

// Accepts unconditionally
class LastWriterWinsResolver : public ConflictResolver {
public:
    std::optional<Value> resolve(const StateEntry& existing, const Value& incoming,
                                 const AgentId& writer) const override;
    ConflictStrategy strategy() const noexcept override { return ConflictStrategy::LastWriterWins; }
    std::string name() const override { return "LastWriterWins"; }
};

// Placeholder: no vector clocks are tracked yet, so this accepts like
// last-writer-wins.
class VersionVectorResolver : public ConflictResolver {
public:
    std::optional<Value> resolve(const StateEntry& existing, const Value& incoming,
                                 const AgentId& writer) const override;
    ConflictStrategy strategy() const noexcept override { return ConflictStrategy::VersionVector; }
    std::string name() const override { return "VersionVector"; }
};

// Accepts only if the writer's priority number is <= the current owner's
class AgentPriorityResolver : public ConflictResolver {
public:
    explicit AgentPriorityResolver(const PriorityModel& priorities);

    std::optional<Value> resolve(const StateEntry& existing, const Value& incoming,
                                 const AgentId& writer) const override;
    ConflictStrategy strategy() const noexcept override { return ConflictStrategy::AgentPriority; }
    std::string name() const override { return "AgentPriority"; }

private:
    const PriorityModel& priorities_;
};

// Shallow merge of top-level object keys; anything else is overwritten
class MergeResolver : public ConflictResolver {
public:
    std::optional<Value> resolve(const StateEntry& existing, const Value& incoming,
                                 const AgentId& writer) const override;
    ConflictStrategy strategy() const noexcept override { return ConflictStrategy::Merge; }
    std::string name() const override { return "Merge"; }
};

// Never accepts an overwrite; the caller escalates for manual review
class HumanInterventionResolver : public ConflictResolver {
public:
    std::optional<Value> resolve(const StateEntry& existing, const Value& incoming,
                                 const AgentId& writer) const override;
    ConflictStrategy strategy() const noexcept override { return ConflictStrategy::HumanIntervention; }
    std::string name() const override { return "HumanIntervention"; }
};

std::unique_ptr<ConflictResolver> make_resolver(ConflictStrategy strategy,
                                                const PriorityModel& priorities);

} // namespace agenthub
