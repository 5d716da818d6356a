#include "agenthub/util.hpp"
#include "agenthub/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>

namespace agenthub {

namespace {

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME        = 0x100000001b3ULL;

std::uint64_t fnv1a64(const std::string& data) {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

} // anonymous namespace

std::string generate_id() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        hi = rng();
        lo = rng();
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<std::uint32_t>(hi >> 32) << '-'
       << std::setw(4) << static_cast<std::uint32_t>((hi >> 16) & 0xffff) << '-'
       << std::setw(4) << static_cast<std::uint32_t>(hi & 0xffff) << '-'
       << std::setw(4) << static_cast<std::uint32_t>(lo >> 48) << '-'
       << std::setw(12) << (lo & 0xffffffffffffULL);
    return os.str();
}

std::string format_timestamp(Timestamp ts) {
    auto ms = to_epoch_ms(ts);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

std::optional<Timestamp> parse_timestamp(const std::string& s) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0, millis = 0;
    int n = std::sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%d",
                        &year, &mon, &day, &hour, &min, &sec, &millis);
    if (n < 6) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return from_epoch_ms(static_cast<std::int64_t>(secs) * 1000 + (n == 7 ? millis : 0));
}

std::int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(std::int64_t ms) {
    return Timestamp{std::chrono::duration_cast<Duration>(std::chrono::milliseconds(ms))};
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_json_string(const Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["commentStyle"] = "None";
    return Json::writeString(builder, value);
}

Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ValidationException("Malformed JSON: " + errors);
    }
    return root;
}

std::string compute_checksum(const Value& value) {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(16) << fnv1a64(to_json_string(value));
    return os.str();
}

} // namespace agenthub
