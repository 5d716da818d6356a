#include "agenthub/state_entry.hpp"
#include "agenthub/exceptions.hpp"
#include "agenthub/util.hpp"

namespace agenthub {

bool StateEntry::checksum_valid() const {
    return checksum == compute_checksum(value);
}

void StateEntry::refresh_checksum() {
    checksum = compute_checksum(value);
}

bool StateEntry::is_expired(Timestamp now) const {
    return expires_at.has_value() && now >= expires_at.value();
}

Value StateEntry::to_json() const {
    Value json(Json::objectValue);
    json["key"] = key;
    json["scope"] = to_string(scope);
    json["state_type"] = to_string(state_type);
    json["value"] = value;
    json["owner_agent"] = owner;
    json["version"] = Json::UInt64(version);
    json["created_at"] = format_timestamp(created_at);
    json["updated_at"] = format_timestamp(updated_at);
    if (expires_at.has_value()) {
        json["expires_at"] = format_timestamp(expires_at.value());
    }
    json["consistency_level"] = to_string(consistency);
    json["checksum"] = checksum;

    Value deps(Json::arrayValue);
    for (const auto& d : dependencies) {
        deps.append(d);
    }
    json["dependencies"] = deps;
    return json;
}

StateEntry StateEntry::from_json(const Value& json) {
    if (!json.isObject() || !json["key"].isString() || !json["version"].isIntegral()) {
        throw ValidationException("State entry is missing key or version");
    }

    auto scope = parse_state_scope(json["scope"].asString());
    auto state_type = parse_state_type(json["state_type"].asString());
    auto consistency = parse_consistency_level(json["consistency_level"].asString());
    auto created = parse_timestamp(json["created_at"].asString());
    auto updated = parse_timestamp(json["updated_at"].asString());
    if (!scope || !state_type || !consistency || !created || !updated) {
        throw ValidationException("State entry has malformed fields: " + json["key"].asString());
    }

    StateEntry entry;
    entry.key = json["key"].asString();
    entry.scope = scope.value();
    entry.state_type = state_type.value();
    entry.value = json["value"];
    entry.owner = json["owner_agent"].asString();
    entry.version = json["version"].asUInt64();
    entry.created_at = created.value();
    entry.updated_at = updated.value();
    if (json.isMember("expires_at")) {
        entry.expires_at = parse_timestamp(json["expires_at"].asString());
    }
    entry.consistency = consistency.value();
    entry.checksum = json["checksum"].asString();
    for (const auto& d : json["dependencies"]) {
        entry.dependencies.push_back(d.asString());
    }
    return entry;
}

std::string StateEntry::store_key(StateScope scope, const std::string& key) {
    return store_prefix(scope) + key;
}

std::string StateEntry::store_prefix(StateScope scope) {
    return std::string("state:") + to_string(scope) + ":";
}

} // namespace agenthub
