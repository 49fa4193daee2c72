#pragma once
// Selector: which deltas to surface, and how much of them
//
// Relevance is a permissive keyword match of the condition against the
// current context. A rule only excludes a delta when the context carries a
// signal for that rule and the signal disagrees. No signal means match.
//
// Ranking: confidence, then freshness, then feedback volume.
// Output is greedily packed into a fixed character budget. Entries are
// never cut in half, and an empty selection produces no text at all.

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <vector>

namespace ace {

// What we know about the moment of injection. Any field may be empty.
struct SelectionContext {
    std::string cwd;
    std::string tool_name;     // "Bash", "Edit", "Skill", ...
    std::string skill;         // Active skill, without the leading '/'
    std::string branch;
    std::string project_type;  // "node", "dotnet", "python", ...
    std::string file_path;     // Target file of the pending tool call
    std::string prompt;        // Free-text fragment (prompt, command, description)
};

struct Selection {
    std::string text;
    std::vector<std::string> ids;  // Same order as in text

    bool empty() const { return ids.empty(); }
};

constexpr const char* INJECTION_HEADER =
    "## Learned Patterns (ACE)\n\n"
    "Heuristics learned in earlier sessions, highest confidence first:\n\n";

// Tool names the host uses; mentioned in a condition they scope it to that tool
inline const char* const KNOWN_TOOLS[] = {
    "Bash", "Edit", "MultiEdit", "Write", "Read", "Grep", "Glob",
    "Task", "Skill", "WebFetch", "WebSearch", "NotebookEdit", "TodoWrite",
};

namespace detail {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '-' || c == ':';
}

// "/cook", "/plan:fast" preceded by start, whitespace or quotes.
// Paths like "src/app" are not skills.
inline std::vector<std::string> skill_mentions(const std::string& text) {
    std::vector<std::string> skills;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '/') continue;
        if (i > 0) {
            char prev = text[i - 1];
            if (!(std::isspace(static_cast<unsigned char>(prev)) || prev == '"' ||
                  prev == '\'' || prev == '`' || prev == '(')) {
                continue;
            }
        }
        size_t j = i + 1;
        while (j < text.size() && is_word_char(text[j])) ++j;
        if (j < text.size() && text[j] == '/') continue;  // "/usr/bin": a path
        if (j > i + 1) skills.push_back(to_lower(text.substr(i + 1, j - i - 1)));
        i = j;
    }
    return skills;
}

// Extensions named by glob-ish tokens: "*.ts", "**/*.component.ts" -> "ts"
inline std::vector<std::string> file_pattern_extensions(const std::string& text) {
    std::vector<std::string> exts;
    size_t pos = 0;
    while ((pos = text.find("*.", pos)) != std::string::npos) {
        size_t start = pos + 2;
        size_t end = start;
        while (end < text.size() &&
               (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '.')) {
            ++end;
        }
        std::string token = text.substr(start, end - start);
        auto dot = token.find_last_of('.');
        std::string ext = dot == std::string::npos ? token : token.substr(dot + 1);
        if (!ext.empty()) exts.push_back(to_lower(ext));
        pos = end;
    }
    return exts;
}

inline bool contains_word(const std::string& text, const std::string& word) {
    size_t pos = 0;
    while ((pos = text.find(word, pos)) != std::string::npos) {
        bool left = pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        size_t after = pos + word.size();
        bool right = after >= text.size() || !std::isalnum(static_cast<unsigned char>(text[after]));
        if (left && right) return true;
        pos = after;
    }
    return false;
}

// "on branch main", "branch: release/2.0"
inline std::string branch_mention(const std::string& lower) {
    for (const char* marker : {"on branch ", "branch:"}) {
        size_t pos = lower.find(marker);
        if (pos == std::string::npos) continue;
        size_t i = pos + std::char_traits<char>::length(marker);
        while (i < lower.size() && lower[i] == ' ') ++i;
        size_t j = i;
        while (j < lower.size() && !std::isspace(static_cast<unsigned char>(lower[j])) &&
               lower[j] != ',' && lower[j] != ')' && lower[j] != '`') {
            ++j;
        }
        if (j > i) return lower.substr(i, j - i);
    }
    return "";
}

inline std::vector<std::string> project_extensions(const std::string& project_type) {
    std::string t = to_lower(project_type);
    if (t == "node" || t == "typescript" || t == "javascript" || t == "angular" || t == "react") {
        return {"ts", "tsx", "js", "jsx", "mjs", "cjs", "json", "html", "scss", "css"};
    }
    if (t == "dotnet" || t == "csharp" || t == ".net") return {"cs", "csproj", "razor", "cshtml", "sln"};
    if (t == "python") return {"py", "pyi", "toml"};
    if (t == "cpp" || t == "c++" || t == "cmake") return {"cpp", "cc", "cxx", "hpp", "h", "cmake"};
    if (t == "go") return {"go", "mod"};
    if (t == "rust") return {"rs", "toml"};
    if (t == "java" || t == "kotlin") return {"java", "kt", "gradle"};
    return {t};
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace detail

// Permissive relevance test. Each rule can only veto when the context
// carries the kind of signal it talks about.
inline bool matches(const std::string& condition, const SelectionContext& ctx) {
    std::string lower = detail::to_lower(condition);

    // Skill rule
    auto skills = detail::skill_mentions(lower);
    if (!skills.empty()) {
        std::vector<std::string> active;
        if (!ctx.skill.empty()) {
            std::string s = detail::to_lower(ctx.skill);
            if (!s.empty() && s[0] == '/') s.erase(0, 1);
            active.push_back(s);
        } else {
            active = detail::skill_mentions(detail::to_lower(ctx.prompt));
        }
        if (!active.empty()) {
            bool hit = std::any_of(skills.begin(), skills.end(), [&](const std::string& s) {
                return std::find(active.begin(), active.end(), s) != active.end();
            });
            if (!hit) return false;
        }
    }

    // File pattern rule: the extension has to be plausible from context
    auto exts = detail::file_pattern_extensions(lower);
    if (!exts.empty()) {
        std::string file = detail::to_lower(ctx.file_path);
        std::string prompt = detail::to_lower(ctx.prompt);
        bool any_signal = !file.empty() || !prompt.empty() || !ctx.project_type.empty();
        if (any_signal) {
            bool plausible = false;
            for (const auto& ext : exts) {
                if (!file.empty() && detail::ends_with(file, "." + ext)) plausible = true;
                if (prompt.find("." + ext) != std::string::npos) plausible = true;
                if (!ctx.project_type.empty()) {
                    auto known = detail::project_extensions(ctx.project_type);
                    if (std::find(known.begin(), known.end(), ext) != known.end()) plausible = true;
                }
            }
            if (!plausible) return false;
        }
    }

    // Tool rule (tool names are case-sensitive in the host)
    if (!ctx.tool_name.empty()) {
        bool mentions_tool = false;
        bool mentions_active = false;
        for (const char* tool : KNOWN_TOOLS) {
            if (detail::contains_word(condition, tool)) {
                mentions_tool = true;
                if (ctx.tool_name == tool) mentions_active = true;
            }
        }
        if (mentions_tool && !mentions_active) return false;
    }

    // Branch rule
    if (!ctx.branch.empty()) {
        std::string branch = detail::branch_mention(lower);
        if (!branch.empty() && branch != detail::to_lower(ctx.branch)) return false;
    }

    return true;
}

// Confidence desc, last_helpful desc (never-helped last), volume desc, id asc
inline bool ranks_before(const Delta& a, const Delta& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    Timestamp la = a.last_helpful.value_or(-1);
    Timestamp lb = b.last_helpful.value_or(-1);
    if (la != lb) return la > lb;
    if (a.feedback_volume() != b.feedback_volume()) return a.feedback_volume() > b.feedback_volume();
    return a.id < b.id;
}

inline std::string format_entry(const Delta& d) {
    int percent = static_cast<int>(std::lround(d.confidence * 100.0));
    std::string entry = "- [" + std::to_string(percent) + "%] " + d.condition + "\n";
    if (!d.problem.empty()) entry += "  Problem: " + d.problem + "\n";
    if (!d.solution.empty()) entry += "  Do: " + d.solution + "\n";
    entry += "  (delta " + d.id + ")\n";
    return entry;
}

// Pick, rank and pack. text.size() never exceeds budget_chars.
inline Selection select(const std::vector<Delta>& deltas, const SelectionContext& ctx,
                        size_t budget_chars, size_t max_entries) {
    std::vector<const Delta*> candidates;
    for (const auto& d : deltas) {
        if (matches(d.condition, ctx)) candidates.push_back(&d);
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const Delta* a, const Delta* b) { return ranks_before(*a, *b); });

    Selection selection;
    std::string body;
    size_t header_size = std::char_traits<char>::length(INJECTION_HEADER);
    for (const Delta* d : candidates) {
        if (selection.ids.size() >= max_entries) break;
        std::string entry = format_entry(*d);
        if (header_size + body.size() + entry.size() > budget_chars) break;
        body += entry;
        selection.ids.push_back(d->id);
    }

    if (!selection.ids.empty()) {
        selection.text = INJECTION_HEADER + body;
    }
    return selection;
}

} // namespace ace
