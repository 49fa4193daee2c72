#pragma once
// Feedback: turning observed outcomes into reinforcement
//
// Two sources. Tool results are judged mechanically (exit code, error
// field, failure markers in the output). User messages are scanned for
// corrective phrasing; a hit penalizes whatever the session was shown.
// There is deliberately no positive detector for free text.

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace ace {

enum class Outcome { Success, Failure };

inline const char* to_string(Outcome o) {
    return o == Outcome::Success ? "success" : "failure";
}

// What the host tells us about a finished tool call
struct ToolResult {
    std::optional<int64_t> exit_code;
    bool has_error = false;
    std::string text;  // Flattened response output

    static ToolResult from_response(const json& response);
};

// Case-sensitive: "error" in prose is common, "Error:" at a boundary is not
inline const char* const FAILURE_MARKERS[] = {
    "Error:",
    "ERROR",
    "FAILED",
    "Failed",
    "BLOCKED",
    "[BLOCKED]",
    "Traceback",
};

// Lowercase phrases; matched case-insensitively
inline const char* const NEGATIVE_PHRASES[] = {
    "that's wrong",
    "that is wrong",
    "thats wrong",
    "not what i asked",
    "not what i wanted",
    "that's not right",
    "that is not right",
    "doesn't work",
    "does not work",
    "didn't work",
    "did not work",
    "still broken",
    "still failing",
    "you broke",
    "incorrect",
    "revert that",
    "undo that",
    "try again",
    "stop doing",
    "wrong approach",
    "wrong file",
    "why did you",
};

namespace detail {

inline std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Collect all string leaves of a JSON value, newline separated
inline void flatten_text(const json& j, std::string& out) {
    if (j.is_string()) {
        if (!out.empty()) out += '\n';
        out += j.get<std::string>();
    } else if (j.is_array() || j.is_object()) {
        for (const auto& item : j) {
            flatten_text(item, out);
        }
    }
}

inline std::optional<int64_t> exit_code_of(const json& j) {
    for (const char* key : {"exit_code", "exitCode", "returncode"}) {
        auto it = j.find(key);
        if (it == j.end()) continue;
        if (it->is_number_integer()) return it->get<int64_t>();
        if (it->is_number_float()) return static_cast<int64_t>(it->get<double>());
    }
    return std::nullopt;
}

inline bool error_present(const json& j) {
    auto it = j.find("error");
    if (it == j.end() || it->is_null()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_string()) return !it->get<std::string>().empty();
    return true;
}

}  // namespace detail

inline ToolResult ToolResult::from_response(const json& response) {
    ToolResult result;
    if (response.is_object()) {
        result.exit_code = detail::exit_code_of(response);
        auto is_error = response.find("is_error");
        result.has_error = detail::error_present(response) ||
                           (is_error != response.end() && is_error->is_boolean() &&
                            is_error->get<bool>());
        // stderr and stdout are judged the same way
        for (const char* key : {"stdout", "stderr", "output", "content", "result", "text"}) {
            auto it = response.find(key);
            if (it != response.end()) detail::flatten_text(*it, result.text);
        }
        if (result.text.empty()) detail::flatten_text(response, result.text);
    } else {
        detail::flatten_text(response, result.text);
    }
    return result;
}

// Failure if the exit code is non-zero, an error is present, or the output
// carries a failure marker. Otherwise success.
inline Outcome classify_tool_outcome(const ToolResult& result) {
    if (result.exit_code && *result.exit_code != 0) return Outcome::Failure;
    if (result.has_error) return Outcome::Failure;
    for (const char* marker : FAILURE_MARKERS) {
        if (result.text.find(marker) != std::string::npos) return Outcome::Failure;
    }
    return Outcome::Success;
}

inline bool detect_negative_feedback(const std::string& text) {
    if (text.empty()) return false;
    std::string lower = detail::lowercase(text);
    // Normalize curly apostrophes so "that’s wrong" matches too
    std::string normalized;
    normalized.reserve(lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        if (i + 2 < lower.size() && lower.compare(i, 3, "\xE2\x80\x99") == 0) {
            normalized += '\'';
            i += 2;
        } else {
            normalized += lower[i];
        }
    }
    for (const char* phrase : NEGATIVE_PHRASES) {
        if (normalized.find(phrase) != std::string::npos) return true;
    }
    return false;
}

} // namespace ace
