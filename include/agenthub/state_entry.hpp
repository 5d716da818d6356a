#pragma once

#include "agenthub/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agenthub {

struct StateEntry {
    std::string key;
    StateScope scope{StateScope::Global};
    StateType state_type{StateType::Configuration};
    Value value;
    AgentId owner;
    std::uint64_t version{0};
    Timestamp created_at{};
    Timestamp updated_at{};
    std::optional<Timestamp> expires_at;
    ConsistencyLevel consistency{ConsistencyLevel::Eventual};
    std::string checksum;
    std::vector<std::string> dependencies;

    bool checksum_valid() const;
    void refresh_checksum();
    bool is_expired(Timestamp now) const;

    Value to_json() const;
    // Throws ValidationException on missing or mistyped fields.
    static StateEntry from_json(const Value& json);

    // "state:{scope}:{key}"
    static std::string store_key(StateScope scope, const std::string& key);
    static std::string store_prefix(StateScope scope);
};

} // namespace agenthub
