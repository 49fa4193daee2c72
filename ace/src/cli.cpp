// ace: learned-pattern playbook for Claude Code hooks
//
// Usage: ace <command> [options]
//
// Commands:
//   hook       Handle one host event (JSON on stdin), always exits 0
//   report     Playbook effectiveness report
//   feedback   Record explicit human feedback on a delta
//   reset      Zero a delta's feedback counters
//   add        Add a delta (learning workflow entry point)
//   sync       Export the playbook to Copilot instructions
//   help       Show this help

#include <ace/config.hpp>
#include <ace/hooks.hpp>
#include <ace/log.hpp>
#include <ace/playbook.hpp>
#include <ace/report.hpp>
#include <ace/sync.hpp>
#include <ace/version.hpp>

#include <cstring>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>

using namespace ace;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "ace " << ACE_VERSION << " - Learned-pattern playbook\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  hook               Handle one hook event read from stdin\n"
              << "  report             Show playbook statistics\n"
              << "  feedback           Record human feedback (--id ID --helpful|--not-helpful)\n"
              << "  reset              Zero feedback counters (--id ID)\n"
              << "  add                Add a delta (--id ID --condition TEXT)\n"
              << "  sync               Export deltas to .github/copilot-instructions.md\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --path DIR         Memory directory (default: $CLAUDE_PROJECT_DIR/.claude/memory)\n"
              << "  --json             Output as JSON (report)\n"
              << "  --id ID            Delta id\n"
              << "  --condition TEXT   When the delta applies (add)\n"
              << "  --problem TEXT     What goes wrong (add)\n"
              << "  --solution TEXT    What to do instead (add)\n"
              << "  --helpful          Positive human feedback (weighted 3x)\n"
              << "  --not-helpful      Negative human feedback\n"
              << "  --budget TOKENS    Injection budget in tokens\n"
              << "  --project DIR      Project root for sync (default: $CLAUDE_PROJECT_DIR or cwd)\n"
              << "  --dry-run          Preview sync or remove without writing\n"
              << "  --validate         Check the Copilot section against the playbook (sync)\n"
              << "  --status           Show sync status (sync)\n"
              << "  --remove           Remove the ACE section from Copilot instructions (sync)\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

// Always exit 0: a failing hook must never block the host
int cmd_hook(const Config& config) {
    try {
        std::string payload;
        char buf[8192];
        while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount() > 0) {
            payload.append(buf, static_cast<size_t>(std::cin.gcount()));
            if (payload.size() > config.max_payload_bytes) {
                log_debug("hook", "payload exceeds %zu bytes, ignoring", config.max_payload_bytes);
                return 0;
            }
        }

        auto event = HookEvent::parse(payload, config.max_payload_bytes);
        if (!event) {
            log_debug("hook", "nothing to do");
            return 0;
        }

        HookRunner runner(config);
        std::string output = runner.handle(*event);
        if (!output.empty()) {
            std::cout << output << std::flush;
        }
    } catch (const std::exception& e) {
        log_warn("hook", "error: %s", e.what());
    }
    return 0;
}

int cmd_report(const Config& config, bool json_output) {
    PlaybookReport report = generate_report(config);
    if (json_output) {
        std::cout << report_to_json(report).dump(2) << "\n";
    } else {
        print_report(report, std::cout);
    }
    return 0;
}

int cmd_feedback(const Config& config, const std::string& id, int direction) {
    if (id.empty() || direction == 0) {
        std::cerr << "Usage: ace feedback --id ID --helpful|--not-helpful\n";
        return 1;
    }

    Playbook playbook(config.deltas_path(), config.lock);
    Reinforcement r = direction > 0 ? Reinforcement::HumanHelpful : Reinforcement::NotHelpful;
    UpdateResult result = playbook.record_outcome({id}, r);
    if (!result.success) {
        std::cerr << "Feedback failed: " << result.error << "\n";
        return 1;
    }
    if (result.changed == 0) {
        std::cerr << "No change: delta " << id << " not found"
                  << (r == Reinforcement::HumanHelpful ? " or its automated record is failing" : "")
                  << "\n";
        return 1;
    }

    AuditLog(config.events_path()).append("feedback", "source=cli signal=" + std::string(to_string(r)) + " id=" + id);
    std::cout << "Recorded " << to_string(r) << " for " << id << "\n";
    return 0;
}

int cmd_reset(const Config& config, const std::string& id) {
    if (id.empty()) {
        std::cerr << "Usage: ace reset --id ID\n";
        return 1;
    }

    Playbook playbook(config.deltas_path(), config.lock);
    UpdateResult result = playbook.reset(id);
    if (!result.success) {
        std::cerr << "Reset failed: " << result.error << "\n";
        return 1;
    }
    if (result.changed == 0) {
        std::cerr << "Delta not found: " << id << "\n";
        return 1;
    }

    AuditLog(config.events_path()).append("reset", "id=" + id);
    std::cout << "Reset " << id << "\n";
    return 0;
}

int cmd_add(const Config& config, const Delta& delta) {
    if (delta.id.empty() || delta.condition.empty()) {
        std::cerr << "Usage: ace add --id ID --condition TEXT [--problem TEXT] [--solution TEXT]\n";
        return 1;
    }

    Playbook playbook(config.deltas_path(), config.lock);
    if (!playbook.init()) {
        std::cerr << "Cannot initialize " << playbook.path() << "\n";
        return 1;
    }
    UpdateResult result = playbook.add(delta);
    if (!result.success) {
        std::cerr << "Add failed: " << result.error << "\n";
        return 1;
    }

    AuditLog(config.events_path()).append("add", "id=" + delta.id);
    std::cout << "Added " << delta.id << "\n";
    return 0;
}

enum class SyncMode { Sync, Validate, Status, Remove };

void print_validation(const SyncValidation& v) {
    if (v.skipped) {
        std::cout << "No deltas to validate\n";
        return;
    }
    std::cout << "Claude deltas:  " << v.claude_count << "\n";
    std::cout << "Copilot deltas: " << v.copilot_count << "\n";
    if (v.last_synced) {
        std::cout << "Last synced:    " << *v.last_synced << " (" << v.days_since_sync << " days ago)\n";
    }
    for (const auto& w : v.warnings) std::cout << "  warning: " << w << "\n";
    for (const auto& e : v.errors) std::cout << "  error: " << e << "\n";
}

int cmd_sync(const Config& config, SyncMode mode, bool dry_run) {
    switch (mode) {
        case SyncMode::Status: {
            SyncStatus status = sync_status(config);
            std::cout << "=== ACE Sync Status ===\n\n"
                      << "Claude deltas:  " << status.claude_count << "\n"
                      << "Copilot deltas: " << status.copilot_count << "\n"
                      << "Copilot file:   " << (status.copilot_exists ? "exists" : "missing") << "\n"
                      << "Last synced:    " << status.last_synced.value_or("never") << "\n"
                      << "In sync:        " << (status.in_sync ? "yes" : "NO") << "\n";
            if (!status.in_sync) std::cout << "\nRun 'ace sync' to sync.\n";
            return 0;
        }
        case SyncMode::Validate: {
            SyncValidation v = validate_sync(config);
            print_validation(v);
            if (!v.valid) {
                std::cout << "Validation FAILED. Run 'ace sync'.\n";
                return 1;
            }
            std::cout << "Validation passed\n";
            return 0;
        }
        case SyncMode::Remove: {
            SyncResult result = remove_sync_section(config, dry_run);
            if (!result.success) {
                std::cerr << "Remove failed: " << result.error << "\n";
                return 1;
            }
            if (!result.message.empty()) {
                std::cout << result.message << "\n";
            } else {
                std::cout << (dry_run ? "Dry run - would remove ACE section from "
                                      : "ACE section removed from ")
                          << config.copilot_path() << "\n";
            }
            return 0;
        }
        case SyncMode::Sync:
            break;
    }

    SyncResult result = sync_to_copilot(config, dry_run);
    if (!result.success) {
        std::cerr << "Sync failed: " << result.error << "\n";
        return 1;
    }
    if (!result.message.empty()) {
        std::cout << result.message << "\n";
        return 0;
    }
    if (dry_run) {
        std::cout << result.content << "\nDry run complete. Would sync "
                  << result.deltas_count << " deltas.\n";
        return 0;
    }

    std::cout << "Synced " << result.deltas_count << " deltas to " << config.copilot_path() << "\n";
    SyncValidation v = validate_sync(config);
    if (!v.valid) {
        print_validation(v);
        std::cout << "Post-sync validation warning\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Config config = Config::from_env();
    std::string command;
    bool json_output = false;
    int direction = 0;  // +1 helpful, -1 not helpful
    Delta delta;
    std::string unknown_option;
    SyncMode sync_mode = SyncMode::Sync;
    bool dry_run = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            config.memory_dir = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--id") == 0 && i + 1 < argc) {
            delta.id = argv[++i];
        } else if (strcmp(argv[i], "--condition") == 0 && i + 1 < argc) {
            delta.condition = argv[++i];
        } else if (strcmp(argv[i], "--problem") == 0 && i + 1 < argc) {
            delta.problem = argv[++i];
        } else if (strcmp(argv[i], "--solution") == 0 && i + 1 < argc) {
            delta.solution = argv[++i];
        } else if (strcmp(argv[i], "--helpful") == 0) {
            direction = 1;
        } else if (strcmp(argv[i], "--not-helpful") == 0) {
            direction = -1;
        } else if (strcmp(argv[i], "--budget") == 0 && i + 1 < argc) {
            std::istringstream iss(argv[++i]);
            size_t budget = 0;
            if (iss >> budget && budget > 0) config.token_budget = budget;
        } else if (strcmp(argv[i], "--project") == 0 && i + 1 < argc) {
            config.project_dir = argv[++i];
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (strcmp(argv[i], "--validate") == 0) {
            sync_mode = SyncMode::Validate;
        } else if (strcmp(argv[i], "--status") == 0) {
            sync_mode = SyncMode::Status;
        } else if (strcmp(argv[i], "--remove") == 0) {
            sync_mode = SyncMode::Remove;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "ace " << ACE_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else if (unknown_option.empty()) {
            unknown_option = argv[i];
        }
    }

    verbose_mode() = config.verbose;

    // Host may pass extra arguments; the hook never fails on them
    if (!unknown_option.empty() && command != "hook") {
        std::cerr << "Unknown option: " << unknown_option << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (command == "hook") {
        return cmd_hook(config);
    } else if (command == "report") {
        return cmd_report(config, json_output);
    } else if (command == "feedback") {
        return cmd_feedback(config, delta.id, direction);
    } else if (command == "reset") {
        return cmd_reset(config, delta.id);
    } else if (command == "add") {
        return cmd_add(config, delta);
    } else if (command == "sync") {
        return cmd_sync(config, sync_mode, dry_run);
    } else if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
