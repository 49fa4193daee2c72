#pragma once
// Configuration: where the playbook lives and how much of it to show
//
// Defaults are tuned for hook invocations: small budgets, short lock waits.
// Everything can be overridden from the environment.

#include <cstdint>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace ace {

// Lock retry policy for the cross-process guard
struct LockOptions {
    int max_attempts = 50;           // Give up after this many tries
    int retry_interval_ms = 100;     // Sleep between tries
    int64_t stale_after_ms = 10000;  // Max hold time before a lock is reclaimed
};

struct Config {
    std::string memory_dir;
    std::string project_dir;         // Root holding .github/ for the Copilot sync

    // Selection
    size_t token_budget = 500;
    size_t chars_per_token = 4;      // Conservative: real ratio is usually higher
    size_t max_selected = 10;

    // Session tracking
    size_t max_sessions = 100;
    size_t max_ids_per_session = 10;

    // Playbook capacity (reported, not enforced)
    size_t max_deltas = 50;

    // Hook payloads larger than this are ignored
    size_t max_payload_bytes = 1024 * 1024;

    LockOptions lock;
    bool verbose = false;

    size_t char_budget() const { return token_budget * chars_per_token; }

    std::string deltas_path() const { return memory_dir + "/deltas.json"; }
    std::string sessions_path() const { return memory_dir + "/ace-sessions.json"; }
    std::string events_path() const { return memory_dir + "/ace-events.log"; }
    std::string candidates_path() const { return memory_dir + "/delta-candidates.json"; }
    std::string archive_dir() const { return memory_dir + "/archive"; }
    std::string copilot_path() const { return project_dir + "/.github/copilot-instructions.md"; }

    static Config from_env();
};

inline std::string default_memory_dir() {
    if (const char* dir = std::getenv("ACE_MEMORY_DIR")) {
        if (*dir) return dir;
    }
    // Project-scoped playbook when running under the host
    if (const char* project = std::getenv("CLAUDE_PROJECT_DIR")) {
        if (*project) return std::string(project) + "/.claude/memory";
    }
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.claude/memory";
}

inline std::string default_project_dir() {
    for (const char* name : {"ACE_PROJECT_DIR", "CLAUDE_PROJECT_DIR"}) {
        const char* dir = std::getenv(name);
        if (dir && *dir) return dir;
    }
    char buf[4096];
    if (::getcwd(buf, sizeof(buf))) return buf;
    return ".";
}

namespace detail {

inline size_t env_size(const char* name, size_t fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(v, &end, 10);
    if (end == v || *end != '\0' || parsed == 0) return fallback;
    return static_cast<size_t>(parsed);
}

inline bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    std::string s(v);
    return s == "1" || s == "true" || s == "yes";
}

}  // namespace detail

inline Config Config::from_env() {
    Config config;
    config.memory_dir = default_memory_dir();
    config.project_dir = default_project_dir();
    config.token_budget = detail::env_size("ACE_TOKEN_BUDGET", config.token_budget);
    config.max_selected = detail::env_size("ACE_MAX_SELECTED", config.max_selected);
    config.max_sessions = detail::env_size("ACE_MAX_SESSIONS", config.max_sessions);
    config.verbose = detail::env_flag("ACE_VERBOSE");
    return config;
}

} // namespace ace
