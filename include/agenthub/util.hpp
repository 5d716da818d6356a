#pragma once

#include "agenthub/types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace agenthub {

// Random 128-bit identifier rendered as a UUID-style hex string.
std::string generate_id();

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
std::string format_timestamp(Timestamp ts);
std::optional<Timestamp> parse_timestamp(const std::string& s);

// Milliseconds since the epoch, for compact storage of lease expiries.
std::int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(std::int64_t ms);

std::string to_lower(std::string s);

// Canonical compact JSON (object keys are ordered by jsoncpp).
std::string to_json_string(const Value& value);

// Throws ValidationException on malformed input.
Value parse_json(const std::string& text);

// FNV-1a 64 over the canonical JSON form, as 16 hex digits.
std::string compute_checksum(const Value& value);

} // namespace agenthub
