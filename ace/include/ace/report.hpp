#pragma once
// Report: playbook effectiveness at a glance
//
// Capacity, pending candidates, audit event count, archive size, feedback
// totals, the top deltas by confidence and a per-skill breakdown.

#include "config.hpp"
#include "playbook.hpp"
#include "selector.hpp"
#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <dirent.h>

namespace ace {

struct ReportEntry {
    std::string id;
    double confidence = 0.0;
    std::string condition;
    std::string problem;  // Truncated
};

struct PlaybookReport {
    size_t active_deltas = 0;
    size_t max_deltas = 0;
    size_t pending_candidates = 0;
    size_t total_events = 0;
    size_t archived_deltas = 0;
    size_t quarantined = 0;

    double avg_confidence = 0.0;
    uint64_t total_helpful = 0;
    uint64_t total_not_helpful = 0;
    uint64_t human_feedback = 0;

    std::vector<ReportEntry> top;
    std::vector<std::pair<std::string, size_t>> skills;  // Most common first

    int capacity_percent() const {
        if (max_deltas == 0) return 0;
        return static_cast<int>(std::lround(100.0 * active_deltas / max_deltas));
    }
};

namespace detail {

inline size_t json_array_size(const std::string& path) {
    auto content = read_file(path);
    if (!content) return 0;
    try {
        json doc = json::parse(*content);
        return doc.is_array() ? doc.size() : 0;
    } catch (const json::parse_error&) {
        return 0;
    }
}

inline size_t count_lines(const std::string& path) {
    auto content = read_file(path);
    if (!content) return 0;
    size_t lines = 0;
    bool pending = false;
    for (char c : *content) {
        if (c == '\n') {
            if (pending) lines++;
            pending = false;
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            pending = true;
        }
    }
    return lines + (pending ? 1 : 0);
}

inline size_t count_archived(const std::string& dir) {
    DIR* d = ::opendir(dir.c_str());
    if (!d) return 0;
    size_t total = 0;
    while (struct dirent* entry = ::readdir(d)) {
        std::string name = entry->d_name;
        if (name.size() > 5 && ends_with(name, ".json")) {
            total += json_array_size(dir + "/" + name);
        }
    }
    ::closedir(d);
    return total;
}

// Cut at max_len bytes, backed off to a UTF-8 character boundary
inline std::string truncate(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "...";
}

inline std::string percent(double fraction, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << fraction * 100.0 << "%";
    return oss.str();
}

}  // namespace detail

inline PlaybookReport generate_report(const Config& config) {
    Playbook playbook(config.deltas_path(), config.lock);
    PlaybookSnapshot snap = playbook.read();

    PlaybookReport report;
    report.active_deltas = snap.deltas.size();
    report.max_deltas = config.max_deltas;
    report.pending_candidates = detail::json_array_size(config.candidates_path());
    report.total_events = detail::count_lines(config.events_path());
    report.archived_deltas = detail::count_archived(config.archive_dir());
    report.quarantined = snap.quarantined.size();

    double confidence_sum = 0.0;
    std::map<std::string, size_t> skill_counts;
    for (const auto& d : snap.deltas) {
        confidence_sum += d.confidence;
        report.total_helpful += d.helpful_count;
        report.total_not_helpful += d.not_helpful_count;
        report.human_feedback += d.human_feedback_count;

        auto skills = detail::skill_mentions(detail::to_lower(d.condition));
        skill_counts[skills.empty() ? "unknown" : skills.front()]++;
    }
    if (!snap.deltas.empty()) {
        report.avg_confidence = confidence_sum / snap.deltas.size();
    }

    std::vector<const Delta*> ranked;
    for (const auto& d : snap.deltas) ranked.push_back(&d);
    std::sort(ranked.begin(), ranked.end(),
              [](const Delta* a, const Delta* b) { return ranks_before(*a, *b); });
    for (size_t i = 0; i < ranked.size() && i < 10; ++i) {
        report.top.push_back({ranked[i]->id, ranked[i]->confidence, ranked[i]->condition,
                              detail::truncate(ranked[i]->problem, 50)});
    }

    report.skills.assign(skill_counts.begin(), skill_counts.end());
    std::stable_sort(report.skills.begin(), report.skills.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return report;
}

inline json report_to_json(const PlaybookReport& r) {
    json top = json::array();
    for (const auto& e : r.top) {
        top.push_back({
            {"id", e.id},
            {"confidence", std::to_string(static_cast<int>(std::lround(e.confidence * 100))) + "%"},
            {"condition", e.condition},
            {"problem", e.problem},
        });
    }
    json skills = json::object();
    for (const auto& [skill, count] : r.skills) skills[skill] = count;

    return {
        {"summary", {
            {"active_deltas", r.active_deltas},
            {"max_deltas", r.max_deltas},
            {"capacity_used", std::to_string(r.capacity_percent()) + "%"},
            {"pending_candidates", r.pending_candidates},
            {"total_events", r.total_events},
            {"archived_deltas", r.archived_deltas},
            {"quarantined_entries", r.quarantined},
        }},
        {"statistics", {
            {"avg_confidence", detail::percent(r.avg_confidence, 1)},
            {"total_helpful", r.total_helpful},
            {"total_not_helpful", r.total_not_helpful},
            {"human_feedback", r.human_feedback},
            {"human_weight_applied", std::to_string(r.human_feedback * HUMAN_FEEDBACK_WEIGHT) + "x"},
        }},
        {"top_deltas", top},
        {"skill_breakdown", skills},
    };
}

inline void print_report(const PlaybookReport& r, std::ostream& out) {
    out << "\nACE Playbook Report\n";
    out << "═══════════════════════════════\n";
    out << "Summary:\n";
    out << "  Active deltas:      " << r.active_deltas << " / " << r.max_deltas
        << " (" << r.capacity_percent() << "%)\n";
    out << "  Pending candidates: " << r.pending_candidates << "\n";
    out << "  Total events:       " << r.total_events << "\n";
    out << "  Archived deltas:    " << r.archived_deltas << "\n";
    if (r.quarantined > 0) {
        out << "  Quarantined:        " << r.quarantined << "\n";
    }

    out << "\nStatistics:\n";
    out << "  Average confidence: " << detail::percent(r.avg_confidence, 1) << "\n";
    out << "  Total helpful:      " << r.total_helpful << "\n";
    out << "  Total not helpful:  " << r.total_not_helpful << "\n";
    out << "  Human feedback:     " << r.human_feedback
        << " (weighted " << r.human_feedback * HUMAN_FEEDBACK_WEIGHT << "x)\n";

    if (!r.top.empty()) {
        out << "\nTop " << r.top.size() << " deltas by confidence:\n";
        for (size_t i = 0; i < r.top.size(); ++i) {
            const auto& e = r.top[i];
            out << "  " << std::setw(2) << (i + 1) << ". ["
                << std::setw(4) << detail::percent(e.confidence, 0) << "] " << e.condition << "\n";
            if (!e.problem.empty()) out << "      " << e.problem << "\n";
        }
    }

    if (!r.skills.empty()) {
        out << "\nSkill breakdown:\n";
        for (const auto& [skill, count] : r.skills) {
            out << "  " << std::left << std::setw(15) << skill << std::right
                << std::setw(3) << count << " " << std::string(std::min<size_t>(count * 2, 20), '#') << "\n";
        }
    }
    out << "\n";
}

} // namespace ace
