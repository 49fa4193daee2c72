#pragma once
// Playbook: the persisted delta collection
//
// One JSON array in one file for the whole installation. Reads are
// lock-free (writers always rename a complete file into place). Every
// mutation is a full load → mutate → save cycle under the FileLock.
//
// Reads fail open: a missing or corrupt file reads as an empty playbook.
// Mutations do not: a corrupt file is left exactly as it is.

#include "config.hpp"
#include "file_lock.hpp"
#include "log.hpp"
#include "types.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ace {

struct PlaybookSnapshot {
    enum class Status { Ok, Missing, Corrupt };

    Status status = Status::Missing;
    std::vector<Delta> deltas;
    std::vector<json> quarantined;  // Entries we could not read, kept verbatim
    std::string error;

    Delta* find(const std::string& id) {
        for (auto& d : deltas) {
            if (d.id == id) return &d;
        }
        return nullptr;
    }
};

struct UpdateResult {
    bool success = false;
    bool lock_failed = false;      // Update skipped, nothing written
    size_t changed = 0;       // Records touched by the mutation
    std::string error;
};

class Playbook {
public:
    explicit Playbook(std::string path, LockOptions lock = {})
        : path_(std::move(path)), lock_(lock) {}

    const std::string& path() const { return path_; }

    // Create the directory and an empty collection if there is none.
    // Never replaces an existing file, even an empty or corrupt one.
    bool init() const {
        if (!ensure_directory(parent_dir(path_))) {
            log_warn("playbook", "cannot create %s", parent_dir(path_).c_str());
            return false;
        }
        struct stat st;
        if (::stat(path_.c_str(), &st) == 0) return true;

        std::string tmp = path_ + ".init." + std::to_string(::getpid());
        if (!safe_save(tmp, "[]\n")) return false;
        // link() refuses to replace, so a concurrent init cannot clobber data
        int rc = ::link(tmp.c_str(), path_.c_str());
        int link_errno = errno;
        ::unlink(tmp.c_str());
        return rc == 0 || link_errno == EEXIST;
    }

    PlaybookSnapshot read() const {
        PlaybookSnapshot snap;
        auto content = read_file(path_);
        if (!content) {
            snap.status = PlaybookSnapshot::Status::Missing;
            return snap;
        }

        json doc;
        try {
            doc = json::parse(*content);
        } catch (const json::parse_error& e) {
            snap.status = PlaybookSnapshot::Status::Corrupt;
            snap.error = e.what();
            return snap;
        }
        if (!doc.is_array()) {
            snap.status = PlaybookSnapshot::Status::Corrupt;
            snap.error = "playbook is not a JSON array";
            return snap;
        }

        std::unordered_set<std::string> seen;
        for (const auto& entry : doc) {
            try {
                Delta d = entry.get<Delta>();
                if (!seen.insert(d.id).second) {
                    log_warn("playbook", "duplicate delta id %s quarantined", d.id.c_str());
                    snap.quarantined.push_back(entry);
                    continue;
                }
                snap.deltas.push_back(std::move(d));
            } catch (const std::exception& e) {
                log_debug("playbook", "quarantined entry: %s", e.what());
                snap.quarantined.push_back(entry);
            }
        }
        snap.status = PlaybookSnapshot::Status::Ok;
        return snap;
    }

    // Fail-open view for advisory callers
    std::vector<Delta> load() const {
        auto snap = read();
        if (snap.status == PlaybookSnapshot::Status::Corrupt) {
            log_warn("playbook", "%s unreadable, treating as empty: %s",
                     path_.c_str(), snap.error.c_str());
        }
        return std::move(snap.deltas);
    }

    // Run mutate(snapshot) under the lock and persist the result. mutate
    // returns how many records it changed; zero skips the write.
    template <typename Mutator>
    UpdateResult update(Mutator&& mutate) const {
        UpdateResult result;
        auto outcome = with_lock(path_, lock_, [&]() -> bool {
            PlaybookSnapshot snap = read();
            if (snap.status == PlaybookSnapshot::Status::Corrupt) {
                result.error = "playbook is corrupt: " + snap.error;
                return false;
            }
            result.changed = mutate(snap);
            if (result.changed == 0) return true;
            if (!save(snap)) {
                result.error = "failed to write " + path_;
                return false;
            }
            return true;
        });

        if (!outcome) {
            result.lock_failed = true;
            result.error = "could not lock " + path_;
            return result;
        }
        result.success = *outcome;
        return result;
    }

    // Apply one reinforcement to every listed delta that still exists.
    // Human confirmations only land on deltas whose automated record is
    // not failing.
    UpdateResult record_outcome(const std::vector<std::string>& ids, Reinforcement r) const {
        Timestamp at = now();
        return update([&](PlaybookSnapshot& snap) -> size_t {
            size_t changed = 0;
            std::unordered_set<std::string> applied;
            for (const auto& id : ids) {
                if (!applied.insert(id).second) continue;
                Delta* d = snap.find(id);
                if (!d) continue;
                if (r == Reinforcement::HumanHelpful &&
                    d->helpful_count < d->not_helpful_count) {
                    log_debug("playbook", "human confirmation on failing delta %s ignored", id.c_str());
                    continue;
                }
                reinforce(*d, r, at);
                changed++;
            }
            return changed;
        });
    }

    UpdateResult reset(const std::string& id) const {
        return update([&](PlaybookSnapshot& snap) -> size_t {
            Delta* d = snap.find(id);
            if (!d) return 0;
            reset_counters(*d);
            return 1;
        });
    }

    // Entry point for the learning workflow. Ids are never reused.
    UpdateResult add(Delta delta) const {
        if (delta.id.empty()) {
            UpdateResult result;
            result.error = "delta id is empty";
            return result;
        }
        bool duplicate = false;
        auto result = update([&](PlaybookSnapshot& snap) -> size_t {
            bool taken = snap.find(delta.id) != nullptr;
            for (const auto& q : snap.quarantined) {
                if (!q.is_object()) continue;
                auto it = q.find("id");
                if (it != q.end() && *it == delta.id) taken = true;
            }
            if (taken) {
                duplicate = true;
                return 0;
            }
            if (!delta.created) delta.created = now();
            delta.confidence = recalculate_confidence(delta);
            snap.deltas.push_back(delta);
            return 1;
        });
        if (duplicate) {
            result.success = false;
            result.error = "delta id already exists: " + delta.id;
        }
        return result;
    }

private:
    // Only reachable from update(), i.e. with the lock held
    bool save(const PlaybookSnapshot& snap) const {
        json doc = json::array();
        for (const auto& d : snap.deltas) {
            doc.push_back(json(d));
        }
        for (const auto& q : snap.quarantined) {
            doc.push_back(q);
        }
        return safe_save(path_, doc.dump(2) + "\n");
    }

    std::string path_;
    LockOptions lock_;
};

} // namespace ace
