#pragma once
// Hooks: host events in, injections and score updates out
//
// One process per event. SessionStart and PreToolUse surface deltas and
// remember what was shown. PostToolUse and UserPromptSubmit turn the
// outcome into reinforcement for exactly those deltas.
//
// Nothing here may fail the host: every error ends as a log line.

#include "config.hpp"
#include "feedback.hpp"
#include "log.hpp"
#include "playbook.hpp"
#include "selector.hpp"
#include "session_tracker.hpp"
#include "types.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace ace {

enum class HookKind { SessionStart, PreToolUse, PostToolUse, UserPromptSubmit, Unknown };

inline HookKind hook_kind_from_string(const std::string& s) {
    if (s == "SessionStart") return HookKind::SessionStart;
    if (s == "PreToolUse") return HookKind::PreToolUse;
    if (s == "PostToolUse") return HookKind::PostToolUse;
    if (s == "UserPromptSubmit") return HookKind::UserPromptSubmit;
    return HookKind::Unknown;
}

// The host payload, reduced to what we use
struct HookEvent {
    HookKind kind = HookKind::Unknown;
    std::string event_name;
    std::string session_id;
    std::string tool_name;
    json tool_input = json::object();
    json tool_response;
    std::string prompt;
    std::string cwd;
    std::string transcript_path;

    // nullopt for oversized, malformed or non-object payloads
    static std::optional<HookEvent> parse(const std::string& payload, size_t max_bytes) {
        if (payload.empty() || payload.size() > max_bytes) return std::nullopt;

        json doc;
        try {
            doc = json::parse(payload);
        } catch (const json::parse_error& e) {
            log_debug("hook", "payload is not JSON: %s", e.what());
            return std::nullopt;
        }
        if (!doc.is_object()) return std::nullopt;

        auto text = [&doc](const char* key) -> std::string {
            auto it = doc.find(key);
            return (it != doc.end() && it->is_string()) ? it->get<std::string>() : "";
        };

        HookEvent event;
        event.event_name = text("hook_event_name");
        event.kind = hook_kind_from_string(event.event_name);
        event.session_id = text("session_id");
        event.tool_name = text("tool_name");
        event.prompt = text("prompt");
        event.cwd = text("cwd");
        event.transcript_path = text("transcript_path");

        auto input = doc.find("tool_input");
        if (input != doc.end() && input->is_object()) event.tool_input = *input;
        auto response = doc.find("tool_response");
        if (response != doc.end()) event.tool_response = *response;

        if (event.session_id.empty()) {
            if (const char* env = std::getenv("CLAUDE_SESSION_ID")) event.session_id = env;
        }
        return event;
    }
};

namespace detail {

inline std::string input_text(const json& input, const char* key) {
    auto it = input.find(key);
    return (it != input.end() && it->is_string()) ? it->get<std::string>() : "";
}

inline std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? v : "";
}

// Branch from the environment, else from .git/HEAD under cwd
inline std::string current_branch(const std::string& cwd) {
    for (const char* name : {"ACE_BRANCH", "GIT_BRANCH"}) {
        std::string v = env_or_empty(name);
        if (!v.empty()) return v;
    }
    if (cwd.empty()) return "";
    auto head = read_file(cwd + "/.git/HEAD");
    if (!head) return "";
    const std::string prefix = "ref: refs/heads/";
    if (head->compare(0, prefix.size(), prefix) != 0) return "";
    std::string branch = head->substr(prefix.size());
    while (!branch.empty() && (branch.back() == '\n' || branch.back() == '\r')) branch.pop_back();
    return branch;
}

inline std::string join(const std::vector<std::string>& items, char sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

}  // namespace detail

class HookRunner {
public:
    explicit HookRunner(Config config)
        : config_(std::move(config)),
          playbook_(config_.deltas_path(), config_.lock),
          tracker_(config_.sessions_path(),
                   TrackerLimits{config_.max_sessions, config_.max_ids_per_session},
                   config_.lock),
          audit_(config_.events_path()) {}

    // Returns the text to print for the host (empty for nothing)
    std::string handle(const HookEvent& event) {
        if (!playbook_.init()) {
            log_warn("hook", "playbook directory unavailable: %s", config_.memory_dir.c_str());
            return "";
        }

        switch (event.kind) {
            case HookKind::SessionStart:
            case HookKind::PreToolUse:
                return inject(event);
            case HookKind::PostToolUse:
                on_tool_result(event);
                return "";
            case HookKind::UserPromptSubmit:
                on_user_message(event);
                return "";
            case HookKind::Unknown:
                log_debug("hook", "ignoring event '%s'", event.event_name.c_str());
                return "";
        }
        return "";
    }

    SelectionContext context_for(const HookEvent& event) const {
        SelectionContext ctx;
        ctx.cwd = event.cwd;
        if (ctx.cwd.empty()) {
            char buf[4096];
            if (::getcwd(buf, sizeof(buf))) ctx.cwd = buf;
        }
        ctx.tool_name = event.tool_name;
        ctx.branch = detail::current_branch(ctx.cwd);
        ctx.project_type = detail::env_or_empty("ACE_PROJECT_TYPE");

        const json& in = event.tool_input;
        ctx.skill = detail::input_text(in, "skill");
        if (ctx.skill.empty() && event.tool_name == "SlashCommand") {
            std::string command = detail::input_text(in, "command");
            auto skills = detail::skill_mentions(command);
            if (!skills.empty()) ctx.skill = skills.front();
        }

        for (const char* key : {"file_path", "notebook_path", "path"}) {
            ctx.file_path = detail::input_text(in, key);
            if (!ctx.file_path.empty()) break;
        }

        ctx.prompt = event.prompt;
        for (const char* key : {"command", "description", "prompt", "pattern", "args"}) {
            std::string fragment = detail::input_text(in, key);
            if (fragment.empty()) continue;
            if (!ctx.prompt.empty()) ctx.prompt += ' ';
            ctx.prompt += fragment;
        }
        return ctx;
    }

private:
    std::string inject(const HookEvent& event) {
        auto deltas = playbook_.load();
        Selection selection;
        if (!deltas.empty()) {
            selection = select(deltas, context_for(event),
                               config_.char_budget(), config_.max_selected);
        }
        if (selection.empty()) {
            log_debug("hook", "no delta fits the context");
            clear_injection(event.session_id);
            return "";
        }

        if (event.session_id.empty()) {
            log_debug("hook", "no session id: injection will not be tracked");
        } else if (!tracker_.record_injection(event.session_id, selection.ids)) {
            log_warn("hook", "could not record injection for session %s", event.session_id.c_str());
        }
        audit_.append("inject", "event=" + event.event_name + " session=" + event.session_id +
                                " ids=" + detail::join(selection.ids, ','));
        return selection.text;
    }

    // Nothing was shown this time, so later outcomes must not reach the
    // deltas of an earlier injection
    void clear_injection(const std::string& session_id) {
        if (session_id.empty()) return;
        auto previous = tracker_.lookup_injection(session_id);
        if (!previous || previous->empty()) return;
        if (!tracker_.record_injection(session_id, {})) {
            log_warn("hook", "could not clear injection for session %s", session_id.c_str());
        }
    }

    void on_tool_result(const HookEvent& event) {
        Outcome outcome = classify_tool_outcome(ToolResult::from_response(event.tool_response));
        apply(event, outcome == Outcome::Success ? Reinforcement::Helpful : Reinforcement::NotHelpful,
              std::string("tool=") + event.tool_name + " outcome=" + to_string(outcome));
    }

    void on_user_message(const HookEvent& event) {
        if (!detect_negative_feedback(event.prompt)) return;
        apply(event, Reinforcement::NotHelpful, "source=human");
    }

    void apply(const HookEvent& event, Reinforcement r, const std::string& why) {
        if (event.session_id.empty()) return;

        auto ids = tracker_.lookup_injection(event.session_id);
        if (!ids || ids->empty()) {
            // Never injected, or evicted since: nothing to attribute
            log_debug("hook", "no injection on record for session %s", event.session_id.c_str());
            return;
        }

        UpdateResult result = playbook_.record_outcome(*ids, r);
        if (!result.success) {
            log_warn("hook", "feedback not applied: %s", result.error.c_str());
            audit_.append("skip", "session=" + event.session_id + " signal=" + to_string(r) +
                                  " reason=" + (result.lock_failed ? "lock" : "error"));
            return;
        }
        audit_.append("feedback", "session=" + event.session_id + " signal=" + to_string(r) +
                                  " " + why + " changed=" + std::to_string(result.changed));
    }

    Config config_;
    Playbook playbook_;
    SessionTracker tracker_;
    AuditLog audit_;
};

} // namespace ace
