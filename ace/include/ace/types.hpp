#pragma once
// Core types: the delta record and its confidence
//
// A delta is one learned heuristic. Confidence is derived, never stored
// on its own: it is recomputed from the counters every time they change.

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace ace {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Thrown by from_json for entries that cannot be coerced into a Delta
struct InvalidDelta : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Human feedback counts this many times an automated success
constexpr uint32_t HUMAN_FEEDBACK_WEIGHT = 3;

// Confidence of a record with no feedback at all
constexpr double NEUTRAL_CONFIDENCE = 0.5;

// ═══════════════════════════════════════════════════════════════════════════
// ISO-8601 timestamps (the on-disk format of last_helpful / created)
// ═══════════════════════════════════════════════════════════════════════════

inline std::string format_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) millis += 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z]". Returns nullopt on anything else.
inline std::optional<Timestamp> parse_iso8601(const std::string& s) {
    std::tm tm{};
    int millis = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = timegm(&tm);
    return static_cast<Timestamp>(secs) * 1000 + millis;
}

// ═══════════════════════════════════════════════════════════════════════════
// Delta: a learned heuristic
// ═══════════════════════════════════════════════════════════════════════════

struct Delta {
    std::string id;                     // Unique, immutable
    std::string condition;              // When this applies ("when using /cook")
    std::string problem;
    std::string solution;

    uint32_t helpful_count = 0;         // Automated successes
    uint32_t not_helpful_count = 0;     // Failures (automated or human)
    uint32_t human_feedback_count = 0;  // Human confirmations, weighted 3x

    std::optional<Timestamp> last_helpful;
    std::optional<Timestamp> created;
    double confidence = NEUTRAL_CONFIDENCE;

    // Keys written by other tools, carried through untouched
    json extra = json::object();

    uint32_t feedback_volume() const {
        return helpful_count + not_helpful_count + human_feedback_count;
    }
};

// S = helpful + 3 * human, F = not_helpful, confidence = S / (S + F)
inline double recalculate_confidence(const Delta& d) {
    double successes = static_cast<double>(d.helpful_count) +
                       static_cast<double>(HUMAN_FEEDBACK_WEIGHT) * d.human_feedback_count;
    double failures = static_cast<double>(d.not_helpful_count);
    double total = successes + failures;
    if (total <= 0.0) return NEUTRAL_CONFIDENCE;
    return successes / total;
}

// Every counter mutation goes through one of these so confidence never
// drifts from the counters it is saved with.
inline void mark_helpful(Delta& d, Timestamp at) {
    d.helpful_count++;
    d.last_helpful = at;
    d.confidence = recalculate_confidence(d);
}

inline void mark_not_helpful(Delta& d) {
    d.not_helpful_count++;
    d.confidence = recalculate_confidence(d);
}

inline void mark_human_helpful(Delta& d, Timestamp at) {
    d.human_feedback_count++;
    d.last_helpful = at;
    d.confidence = recalculate_confidence(d);
}

inline void reset_counters(Delta& d) {
    d.helpful_count = 0;
    d.not_helpful_count = 0;
    d.human_feedback_count = 0;
    d.last_helpful.reset();
    d.confidence = recalculate_confidence(d);
}

// Feedback that can be applied to a delta
enum class Reinforcement {
    Helpful,       // Automated success
    NotHelpful,    // Automated failure or human correction (unit weight)
    HumanHelpful,  // Explicit human confirmation (weighted 3x)
};

inline const char* to_string(Reinforcement r) {
    switch (r) {
        case Reinforcement::Helpful:      return "helpful";
        case Reinforcement::NotHelpful:   return "not_helpful";
        case Reinforcement::HumanHelpful: return "human_helpful";
    }
    return "unknown";
}

inline void reinforce(Delta& d, Reinforcement r, Timestamp at) {
    switch (r) {
        case Reinforcement::Helpful:      mark_helpful(d, at); break;
        case Reinforcement::NotHelpful:   mark_not_helpful(d); break;
        case Reinforcement::HumanHelpful: mark_human_helpful(d, at); break;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON boundary
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

inline uint32_t read_counter(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0;
    if (it->is_number_unsigned()) return it->get<uint32_t>();
    if (it->is_number_integer()) {
        int64_t v = it->get<int64_t>();
        return v > 0 ? static_cast<uint32_t>(v) : 0;
    }
    if (it->is_number_float()) {
        double v = it->get<double>();
        return v > 0.0 ? static_cast<uint32_t>(v) : 0;
    }
    throw InvalidDelta(std::string("counter '") + key + "' is not a number");
}

inline std::string read_text(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (!it->is_string()) throw InvalidDelta(std::string("'") + key + "' is not a string");
    return it->get<std::string>();
}

inline std::optional<Timestamp> read_time(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_number()) return it->get<Timestamp>();
    if (it->is_string()) return parse_iso8601(it->get<std::string>());
    return std::nullopt;
}

inline const char* const KNOWN_KEYS[] = {
    "id", "condition", "problem", "solution",
    "helpful_count", "not_helpful_count", "human_feedback_count",
    "last_helpful", "created", "confidence",
};

}  // namespace detail

inline void to_json(json& j, const Delta& d) {
    j = d.extra.is_object() ? d.extra : json::object();
    j["id"] = d.id;
    j["condition"] = d.condition;
    if (!d.problem.empty()) j["problem"] = d.problem;
    if (!d.solution.empty()) j["solution"] = d.solution;
    j["helpful_count"] = d.helpful_count;
    j["not_helpful_count"] = d.not_helpful_count;
    j["human_feedback_count"] = d.human_feedback_count;
    j["last_helpful"] = d.last_helpful ? json(format_iso8601(*d.last_helpful)) : json(nullptr);
    if (d.created) j["created"] = format_iso8601(*d.created);
    j["confidence"] = d.confidence;
}

// Throws InvalidDelta for entries that cannot be coerced into a Delta.
// The persisted confidence is ignored and recomputed.
inline void from_json(const json& j, Delta& d) {
    if (!j.is_object()) {
        throw InvalidDelta("delta is not an object");
    }
    d.id = detail::read_text(j, "id");
    if (d.id.empty()) {
        throw InvalidDelta("delta has no id");
    }
    d.condition = detail::read_text(j, "condition");
    d.problem = detail::read_text(j, "problem");
    d.solution = detail::read_text(j, "solution");
    d.helpful_count = detail::read_counter(j, "helpful_count");
    d.not_helpful_count = detail::read_counter(j, "not_helpful_count");
    d.human_feedback_count = detail::read_counter(j, "human_feedback_count");
    d.last_helpful = detail::read_time(j, "last_helpful");
    d.created = detail::read_time(j, "created");
    d.confidence = recalculate_confidence(d);

    d.extra = j;
    for (const char* key : detail::KNOWN_KEYS) {
        d.extra.erase(key);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

inline std::string parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    std::string dir = parent_dir(path);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file in the same directory, fsync, rename.
// A reader sees the complete old or the complete new file, never a mix.
inline bool safe_save(const std::string& path, const std::string& content) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = ::fwrite(content.data(), 1, content.size(), f) == content.size();
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Whole-file read. nullopt if the file cannot be opened.
inline std::optional<std::string> read_file(const std::string& path) {
    FILE* f = ::fopen(path.c_str(), "rb");
    if (!f) return std::nullopt;
    std::string out;
    char buf[8192];
    size_t n;
    while ((n = ::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    bool failed = ::ferror(f) != 0;
    ::fclose(f);
    if (failed) return std::nullopt;
    return out;
}

// mkdir -p
inline bool ensure_directory(const std::string& dir) {
    if (dir.empty()) return false;
    struct stat st;
    if (::stat(dir.c_str(), &st) == 0) return S_ISDIR(st.st_mode);
    std::string parent = parent_dir(dir);
    if (parent != dir && parent != "." && parent != "/") {
        if (!ensure_directory(parent)) return false;
    }
    return ::mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST;
}

} // namespace ace
