#pragma once
// SessionTracker: which deltas were shown to which session
//
// Feedback arrives in a later process than the injection it judges, so the
// pairing has to live on disk. Bounded in both directions: ids per session
// and total sessions. The oldest session by insertion is evicted first.
// Once evicted, feedback for that session finds nothing and is dropped.

#include "config.hpp"
#include "file_lock.hpp"
#include "log.hpp"
#include "types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ace {

struct SessionInjection {
    std::string session_id;
    std::vector<std::string> delta_ids;  // In injection order
    Timestamp injected_at = 0;
};

inline void to_json(json& j, const SessionInjection& s) {
    j = json{
        {"session_id", s.session_id},
        {"delta_ids", s.delta_ids},
        {"injected_at", format_iso8601(s.injected_at)},
    };
}

inline void from_json(const json& j, SessionInjection& s) {
    s.session_id = j.at("session_id").get<std::string>();
    s.delta_ids = j.at("delta_ids").get<std::vector<std::string>>();
    auto it = j.find("injected_at");
    if (it != j.end() && it->is_string()) {
        s.injected_at = parse_iso8601(it->get<std::string>()).value_or(0);
    }
}

struct TrackerLimits {
    size_t max_sessions = 100;
    size_t max_ids_per_session = 10;
};

class SessionTracker {
public:
    SessionTracker(std::string path, TrackerLimits limits = {}, LockOptions lock = {})
        : path_(std::move(path)), limits_(limits), lock_(lock) {}

    // Replace the record for session_id and make it the newest entry.
    // Returns false if the lock could not be taken or the write failed.
    bool record_injection(const std::string& session_id, const std::vector<std::string>& ids) {
        if (session_id.empty()) return false;

        SessionInjection entry;
        entry.session_id = session_id;
        entry.delta_ids.assign(ids.begin(),
                               ids.begin() + std::min(ids.size(), limits_.max_ids_per_session));
        entry.injected_at = now();

        auto saved = with_lock(path_, lock_, [&]() -> bool {
            auto sessions = read_all();
            sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                          [&](const SessionInjection& s) {
                                              return s.session_id == session_id;
                                          }),
                           sessions.end());
            sessions.push_back(entry);

            if (sessions.size() > limits_.max_sessions) {
                size_t evict = sessions.size() - limits_.max_sessions;
                log_debug("sessions", "evicting %zu oldest session(s)", evict);
                sessions.erase(sessions.begin(), sessions.begin() + evict);
            }
            return write_all(sessions);
        });
        return saved.value_or(false);
    }

    // Ids surfaced to session_id, or nullopt if it was never injected or
    // has been evicted.
    std::optional<std::vector<std::string>> lookup_injection(const std::string& session_id) const {
        for (const auto& s : read_all()) {
            if (s.session_id == session_id) return s.delta_ids;
        }
        return std::nullopt;
    }

    size_t size() const { return read_all().size(); }

    const std::string& path() const { return path_; }

private:
    // Corrupt or missing tracker reads as empty; the next write rebuilds it
    std::vector<SessionInjection> read_all() const {
        std::vector<SessionInjection> sessions;
        auto content = read_file(path_);
        if (!content) return sessions;

        json doc;
        try {
            doc = json::parse(*content);
        } catch (const json::parse_error& e) {
            log_warn("sessions", "%s unreadable: %s", path_.c_str(), e.what());
            return sessions;
        }

        auto list = doc.find("sessions");
        if (list == doc.end() || !list->is_array()) return sessions;
        for (const auto& item : *list) {
            try {
                sessions.push_back(item.get<SessionInjection>());
            } catch (const json::exception& e) {
                log_debug("sessions", "dropping malformed entry: %s", e.what());
            }
        }
        return sessions;
    }

    bool write_all(const std::vector<SessionInjection>& sessions) const {
        json doc = {{"sessions", sessions}};
        return safe_save(path_, doc.dump(2) + "\n");
    }

    std::string path_;
    TrackerLimits limits_;
    LockOptions lock_;
};

} // namespace ace
