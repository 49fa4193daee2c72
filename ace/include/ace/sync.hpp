#pragma once
// Sync: export the playbook into Copilot's instruction file
//
// The learned patterns are written as a marked section of
// .github/copilot-instructions.md. Anything outside the markers belongs to
// the user and is never touched. Validation checks that the section lists
// as many patterns as the playbook holds and that it is not too old.

#include "config.hpp"
#include "log.hpp"
#include "playbook.hpp"
#include "selector.hpp"
#include "types.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ace {

constexpr const char* SYNC_SECTION_START = "<!-- ACE-LEARNED-PATTERNS-START -->";
constexpr const char* SYNC_SECTION_END = "<!-- ACE-LEARNED-PATTERNS-END -->";
constexpr const char* SYNC_STAMP_PREFIX = "*Last synced: ";

// Older syncs only warn
constexpr int64_t SYNC_STALE_DAYS = 7;

struct SyncResult {
    bool success = false;
    size_t deltas_count = 0;
    bool changed = false;     // File content differs (or would, on dry run)
    std::string content;      // Resulting file content
    std::string message;      // Informational, e.g. nothing to do
    std::string error;
};

struct SyncValidation {
    bool valid = false;
    bool skipped = false;     // No playbook, or an empty one
    size_t claude_count = 0;
    size_t copilot_count = 0;
    std::optional<std::string> last_synced;
    int64_t days_since_sync = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct SyncStatus {
    size_t claude_count = 0;
    size_t copilot_count = 0;
    bool copilot_exists = false;
    std::optional<std::string> last_synced;
    bool in_sync = false;
};

namespace detail {

inline std::string one_line(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    return out;
}

inline std::string iso_date(Timestamp ts) {
    return format_iso8601(ts).substr(0, 10);
}

// [begin, end) of the marked section, end marker and its newline included
inline std::optional<std::pair<size_t, size_t>> find_sync_section(const std::string& content) {
    size_t begin = content.find(SYNC_SECTION_START);
    if (begin == std::string::npos) return std::nullopt;
    size_t end = content.find(SYNC_SECTION_END, begin);
    if (end == std::string::npos) {
        end = content.size();
    } else {
        end += std::char_traits<char>::length(SYNC_SECTION_END);
        if (end < content.size() && content[end] == '\n') ++end;
    }
    return std::make_pair(begin, end);
}

// Entry lines look like "- **condition**: text [NN%]"
inline size_t count_synced_entries(const std::string& section) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < section.size()) {
        size_t eol = section.find('\n', pos);
        if (eol == std::string::npos) eol = section.size();
        std::string line = section.substr(pos, eol - pos);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (line.compare(0, 4, "- **") == 0 && ends_with(line, "%]")) {
            size_t open = line.rfind('[');
            if (open != std::string::npos && open + 2 < line.size()) {
                std::string digits = line.substr(open + 1, line.size() - open - 3);
                bool numeric = !digits.empty() &&
                               std::all_of(digits.begin(), digits.end(),
                                           [](char c) { return c >= '0' && c <= '9'; });
                if (numeric) count++;
            }
        }
        pos = eol + 1;
    }
    return count;
}

// "YYYY-MM-DD" from "*Last synced: YYYY-MM-DD*"
inline std::optional<std::string> last_synced_date(const std::string& content) {
    size_t pos = content.find(SYNC_STAMP_PREFIX);
    if (pos == std::string::npos) return std::nullopt;
    pos += std::char_traits<char>::length(SYNC_STAMP_PREFIX);
    if (pos + 11 > content.size() || content[pos + 10] != '*') return std::nullopt;
    std::string date = content.substr(pos, 10);
    if (!parse_iso8601(date + "T00:00:00Z")) return std::nullopt;
    return date;
}

inline int64_t days_between(const std::string& date, Timestamp at) {
    auto day = parse_iso8601(date + "T00:00:00Z");
    if (!day) return 0;
    return (at - *day) / (24LL * 60 * 60 * 1000);
}

// Remove the section plus the blank line that separated it
inline std::string strip_sync_section(const std::string& content) {
    auto range = find_sync_section(content);
    if (!range) return content;
    std::string before = content.substr(0, range->first);
    std::string after = content.substr(range->second);
    while (!before.empty() && before.back() == '\n' &&
           before.size() >= 2 && before[before.size() - 2] == '\n') {
        before.pop_back();
    }
    if (!before.empty() && after.empty()) {
        while (!before.empty() && before.back() == '\n') before.pop_back();
        before += '\n';
    }
    return before + after;
}

}  // namespace detail

// Ranked exactly as the selector ranks them
inline std::string render_sync_section(std::vector<Delta> deltas, Timestamp at) {
    std::sort(deltas.begin(), deltas.end(),
              [](const Delta& a, const Delta& b) { return ranks_before(a, b); });

    std::string out;
    out += SYNC_SECTION_START;
    out += "\n## Learned Patterns (ACE)\n\n";
    out += SYNC_STAMP_PREFIX + detail::iso_date(at) + "*\n\n";
    out += "Patterns learned from Claude Code sessions, highest confidence first.\n\n";
    for (const auto& d : deltas) {
        int percent = static_cast<int>(std::lround(d.confidence * 100.0));
        std::string text = d.solution.empty() ? d.problem : d.solution;
        out += "- **" + detail::one_line(d.condition) + "**:";
        if (!text.empty()) out += " " + detail::one_line(text);
        out += " [" + std::to_string(percent) + "%]\n";
    }
    out += SYNC_SECTION_END;
    out += "\n";
    return out;
}

// Replace the section in place, or append it after the user's content
inline std::string merge_sync_section(const std::string& existing, const std::string& section) {
    auto range = detail::find_sync_section(existing);
    if (range) {
        return existing.substr(0, range->first) + section + existing.substr(range->second);
    }
    if (existing.empty()) return section;
    std::string out = existing;
    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out + "\n\n" + section;
}

inline SyncResult sync_to_copilot(const Config& config, bool dry_run, Timestamp at = now()) {
    SyncResult result;
    Playbook playbook(config.deltas_path(), config.lock);
    PlaybookSnapshot snap = playbook.read();
    if (snap.status == PlaybookSnapshot::Status::Corrupt) {
        result.error = "playbook is corrupt: " + snap.error;
        return result;
    }
    result.deltas_count = snap.deltas.size();
    if (snap.deltas.empty()) {
        result.success = true;
        result.message = "No deltas to sync";
        return result;
    }

    std::string existing = read_file(config.copilot_path()).value_or("");
    result.content = merge_sync_section(existing, render_sync_section(snap.deltas, at));
    result.changed = result.content != existing;
    if (dry_run || !result.changed) {
        result.success = true;
        return result;
    }

    if (!ensure_directory(parent_dir(config.copilot_path()))) {
        result.error = "cannot create " + parent_dir(config.copilot_path());
        return result;
    }
    if (!safe_save(config.copilot_path(), result.content)) {
        result.error = "failed to write " + config.copilot_path();
        return result;
    }
    log_debug("sync", "wrote %zu deltas to %s", result.deltas_count, config.copilot_path().c_str());
    result.success = true;
    return result;
}

inline SyncValidation validate_sync(const Config& config, Timestamp at = now()) {
    SyncValidation v;
    auto raw = read_file(config.deltas_path());
    if (!raw) {
        v.valid = true;
        v.skipped = true;
        return v;
    }

    Playbook playbook(config.deltas_path(), config.lock);
    PlaybookSnapshot snap = playbook.read();
    if (snap.status == PlaybookSnapshot::Status::Corrupt) {
        v.errors.push_back("failed to parse " + config.deltas_path() + ": " + snap.error);
        return v;
    }
    v.claude_count = snap.deltas.size();
    if (v.claude_count == 0) {
        v.valid = true;
        v.skipped = true;
        return v;
    }

    auto copilot = read_file(config.copilot_path());
    if (!copilot) {
        v.errors.push_back("Copilot instructions file missing: " + config.copilot_path());
        return v;
    }
    auto range = detail::find_sync_section(*copilot);
    if (!range) {
        v.errors.push_back(std::to_string(v.claude_count) + " deltas exist but Copilot missing ACE section");
        return v;
    }

    std::string section = copilot->substr(range->first, range->second - range->first);
    v.copilot_count = detail::count_synced_entries(section);
    if (v.copilot_count != v.claude_count) {
        v.errors.push_back("Delta count mismatch: Claude=" + std::to_string(v.claude_count) +
                           ", Copilot=" + std::to_string(v.copilot_count));
    }

    v.last_synced = detail::last_synced_date(section);
    if (v.last_synced) {
        v.days_since_sync = detail::days_between(*v.last_synced, at);
        if (v.days_since_sync > SYNC_STALE_DAYS) {
            v.warnings.push_back("Last sync was " + std::to_string(v.days_since_sync) +
                                 " days ago - consider re-syncing");
        }
    }

    v.valid = v.errors.empty();
    return v;
}

inline SyncStatus sync_status(const Config& config) {
    SyncStatus status;
    Playbook playbook(config.deltas_path(), config.lock);
    status.claude_count = playbook.load().size();

    auto copilot = read_file(config.copilot_path());
    status.copilot_exists = copilot.has_value();
    if (copilot) {
        auto range = detail::find_sync_section(*copilot);
        if (range) {
            std::string section = copilot->substr(range->first, range->second - range->first);
            status.copilot_count = detail::count_synced_entries(section);
            status.last_synced = detail::last_synced_date(section);
        }
    }
    status.in_sync = status.claude_count == status.copilot_count &&
                     (status.claude_count == 0 || status.last_synced.has_value());
    return status;
}

inline SyncResult remove_sync_section(const Config& config, bool dry_run) {
    SyncResult result;
    auto existing = read_file(config.copilot_path());
    if (!existing) {
        result.success = true;
        result.message = "No Copilot instructions file";
        return result;
    }
    result.content = detail::strip_sync_section(*existing);
    result.changed = result.content != *existing;
    if (!result.changed) {
        result.success = true;
        result.message = "No ACE section to remove";
        return result;
    }
    if (dry_run) {
        result.success = true;
        return result;
    }
    if (!safe_save(config.copilot_path(), result.content)) {
        result.error = "failed to write " + config.copilot_path();
        return result;
    }
    result.success = true;
    return result;
}

} // namespace ace
