#pragma once
// FileLock: cross-process mutual exclusion for read-modify-write cycles
//
// Every hook is its own short-lived process, so in-memory mutexes are
// useless here. The lock is a marker file created with O_CREAT|O_EXCL next
// to the guarded file. It records the holder's pid and creation time.
//
// A marker is stale when its holder is gone or it has been held longer than
// stale_after_ms. Stale markers are renamed aside before deletion, which
// makes reclaiming safe when several waiters notice the same stale lock.
//
// Known limits: a holder that overstays stale_after_ms can overlap with the
// waiter that reclaims it. A live marker that replaced a stale one between
// our last read and the rename is moved aside by mistake; it is linked back,
// but if a third process creates a marker inside that window the restore
// fails and two holders overlap.
//
// Acquisition is bounded. Callers that cannot get the lock skip their
// update; they never block the host.

#include "config.hpp"
#include "log.hpp"
#include "types.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ace {

class FileLock {
public:
    explicit FileLock(const std::string& target_path, LockOptions options = {})
        : lock_path_(target_path + ".lock"), options_(options) {}

    ~FileLock() { release(); }

    // Non-copyable, non-movable
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Try up to max_attempts times. Returns false on timeout or I/O error.
    bool acquire() {
        if (held_) return true;
        int attempts = options_.max_attempts > 0 ? options_.max_attempts : 1;

        for (int attempt = 0; attempt < attempts; ++attempt) {
            int rc = try_create();
            if (rc == 0) {
                held_ = true;
                log_debug("lock", "acquired %s after %d attempt(s)", lock_path_.c_str(), attempt + 1);
                return true;
            }
            if (rc < 0) {
                return false;  // error_ already set
            }
            if (reclaim_if_stale()) {
                continue;  // Retry at once
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.retry_interval_ms));
        }

        error_ = "timed out waiting for " + lock_path_;
        return false;
    }

    // Remove the marker, but only if it is still ours. A holder that
    // overstayed stale_after_ms may have been reclaimed by someone else.
    void release() {
        if (!held_) return;
        held_ = false;
        auto content = read_file(lock_path_);
        if (content && *content == token_) {
            ::unlink(lock_path_.c_str());
        } else {
            log_warn("lock", "lock %s was reclaimed while held", lock_path_.c_str());
        }
    }

    bool held() const { return held_; }
    const std::string& path() const { return lock_path_; }
    const std::string& error() const { return error_; }

private:
    // 0 = created, 1 = exists, -1 = error
    int try_create() {
        int fd = ::open(lock_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd < 0) {
            if (errno == EEXIST) return 1;
            error_ = std::string("cannot create ") + lock_path_ + ": " + std::strerror(errno);
            return -1;
        }

        token_ = std::to_string(::getpid()) + " " + std::to_string(now()) + " " + nonce() + "\n";
        ssize_t written = ::write(fd, token_.data(), token_.size());
        ::close(fd);
        if (written != static_cast<ssize_t>(token_.size())) {
            ::unlink(lock_path_.c_str());
            error_ = "short write on " + lock_path_;
            return -1;
        }
        return 0;
    }

    // Returns true if a stale marker was removed (or vanished) and the
    // caller should retry immediately.
    bool reclaim_if_stale() {
        auto observed = read_file(lock_path_);
        if (!observed) {
            return errno == ENOENT;  // Released between our create and read
        }
        if (!is_stale(*observed)) return false;

        // Judging staleness takes a kill() and a stat(); make sure the marker
        // we judged is still the one in place right before moving it
        auto current = read_file(lock_path_);
        if (!current) return errno == ENOENT;
        if (*current != *observed) return true;

        std::string aside = lock_path_ + ".stale." + std::to_string(::getpid()) + "." + nonce();
        if (::rename(lock_path_.c_str(), aside.c_str()) != 0) {
            return errno == ENOENT;  // Another waiter got there first
        }

        auto moved = read_file(aside);
        if (moved && *moved == *observed) {
            ::unlink(aside.c_str());
            log_warn("lock", "reclaimed stale lock %s", lock_path_.c_str());
            return true;
        }

        // Someone released and re-created the lock between our read and the
        // rename: we moved a live marker. Put it back if the slot is free.
        if (::link(aside.c_str(), lock_path_.c_str()) != 0) {
            log_warn("lock", "could not restore live lock %s: %s", lock_path_.c_str(), std::strerror(errno));
        }
        ::unlink(aside.c_str());
        return false;
    }

    bool is_stale(const std::string& content) const {
        long long pid = 0;
        long long created = 0;
        if (std::sscanf(content.c_str(), "%lld %lld", &pid, &created) != 2 || pid <= 0) {
            // Holder may still be writing its token: judge by file age
            struct stat st;
            if (::stat(lock_path_.c_str(), &st) != 0) return false;
            Timestamp mtime = static_cast<Timestamp>(st.st_mtime) * 1000;
            return now() - mtime > options_.stale_after_ms;
        }

        if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) {
            return true;  // Holder crashed
        }
        return now() - created > options_.stale_after_ms;
    }

    static std::string nonce() {
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
        return buf;
    }

    std::string lock_path_;
    LockOptions options_;
    std::string token_;
    std::string error_;
    bool held_ = false;
};

// Run fn while holding the lock on path. nullopt means the lock could not be
// acquired and fn did not run. Exceptions from fn propagate after release.
template <typename Fn>
auto with_lock(const std::string& path, const LockOptions& options, Fn&& fn)
    -> std::optional<decltype(fn())> {
    FileLock lock(path, options);
    if (!lock.acquire()) {
        log_warn("lock", "skipping update: %s", lock.error().c_str());
        return std::nullopt;
    }
    return fn();
}

} // namespace ace
