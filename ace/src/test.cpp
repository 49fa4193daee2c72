#include <ace/config.hpp>
#include <ace/feedback.hpp>
#include <ace/file_lock.hpp>
#include <ace/hooks.hpp>
#include <ace/playbook.hpp>
#include <ace/report.hpp>
#include <ace/selector.hpp>
#include <ace/session_tracker.hpp>
#include <ace/sync.hpp>
#include <ace/types.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace ace;

namespace fs = std::filesystem;

// Fresh scratch directory per test
struct TempDir {
    std::string path;

    TempDir() {
        char tmpl[] = "/tmp/ace_test_XXXXXX";
        char* made = ::mkdtemp(tmpl);
        assert(made != nullptr);
        path = made;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return path + "/" + name; }
};

Delta make_delta(const std::string& id, const std::string& condition,
                 uint32_t helpful = 0, uint32_t not_helpful = 0, uint32_t human = 0) {
    Delta d;
    d.id = id;
    d.condition = condition;
    d.helpful_count = helpful;
    d.not_helpful_count = not_helpful;
    d.human_feedback_count = human;
    d.confidence = recalculate_confidence(d);
    return d;
}

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

std::string read_text(const std::string& path) {
    auto content = read_file(path);
    return content ? *content : "";
}

// Ids embedded in an injection, in order
std::vector<std::string> embedded_ids(const std::string& text) {
    std::vector<std::string> ids;
    const std::string marker = "(delta ";
    size_t pos = 0;
    while ((pos = text.find(marker, pos)) != std::string::npos) {
        size_t start = pos + marker.size();
        size_t end = text.find(')', start);
        ids.push_back(text.substr(start, end - start));
        pos = end;
    }
    return ids;
}

LockOptions fast_lock() {
    LockOptions opts;
    opts.max_attempts = 2000;
    opts.retry_interval_ms = 2;
    opts.stale_after_ms = 10000;
    return opts;
}

Playbook seeded_playbook(const TempDir& dir, const std::vector<Delta>& deltas) {
    Playbook playbook(dir.file("deltas.json"), fast_lock());
    assert(playbook.init());
    for (const auto& d : deltas) {
        auto result = playbook.add(d);
        assert(result.success);
    }
    return playbook;
}

bool wait_all(const std::vector<pid_t>& children) {
    bool ok = true;
    for (pid_t pid : children) {
        int status = 0;
        if (::waitpid(pid, &status, 0) != pid) ok = false;
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) ok = false;
    }
    return ok;
}

// ═══════════════════════════════════════════════════════════════════════════
// Record model
// ═══════════════════════════════════════════════════════════════════════════

void test_confidence() {
    std::cout << "Testing confidence..." << std::endl;

    Delta d = make_delta("d", "any");
    assert(recalculate_confidence(d) == NEUTRAL_CONFIDENCE);

    // Stays in [0,1] and moves the right way under every kind of feedback
    for (int i = 0; i < 50; ++i) {
        double before = recalculate_confidence(d);
        Delta up = d;
        mark_helpful(up, now());
        assert(up.confidence >= before);
        Delta human = d;
        mark_human_helpful(human, now());
        assert(human.confidence >= before);
        Delta down = d;
        mark_not_helpful(down);
        assert(down.confidence <= before);

        switch (i % 3) {
            case 0: mark_not_helpful(d); break;
            case 1: mark_helpful(d, now()); break;
            default: mark_human_helpful(d, now()); break;
        }
        assert(d.confidence >= 0.0 && d.confidence <= 1.0);
        assert(d.confidence == recalculate_confidence(d));
    }

    // Failures only: tends to zero without dividing by zero
    Delta failing = make_delta("f", "any", 0, 7, 0);
    assert(failing.confidence == 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_human_weight() {
    std::cout << "Testing human feedback weight..." << std::endl;

    Delta base = make_delta("d", "any", 1, 4, 0);

    Delta automated = base;
    for (int i = 0; i < 3; ++i) mark_helpful(automated, now());

    Delta human = base;
    mark_human_helpful(human, now());

    // One human confirmation is worth exactly three automated ones
    assert(std::fabs(human.confidence - automated.confidence) < 1e-12);

    Delta human3 = base;
    for (int i = 0; i < 3; ++i) mark_human_helpful(human3, now());
    assert(human3.confidence >= automated.confidence);

    // Negative feedback is never multiplied
    Delta neg = make_delta("n", "any", 3, 0, 0);
    mark_not_helpful(neg);
    assert(neg.not_helpful_count == 1);
    assert(std::fabs(neg.confidence - 0.75) < 1e-12);

    std::cout << "  PASS" << std::endl;
}

void test_reset_counters() {
    std::cout << "Testing reset..." << std::endl;

    Delta d = make_delta("d", "any", 4, 2, 1);
    d.last_helpful = now();
    reset_counters(d);
    assert(d.helpful_count == 0 && d.not_helpful_count == 0 && d.human_feedback_count == 0);
    assert(!d.last_helpful.has_value());
    assert(d.confidence == NEUTRAL_CONFIDENCE);

    std::cout << "  PASS" << std::endl;
}

void test_delta_json() {
    std::cout << "Testing delta JSON boundary..." << std::endl;

    json j = json::parse(R"({
        "id": "d7",
        "condition": "when using /cook",
        "problem": "skipped tests",
        "solution": "run the suite first",
        "helpful_count": 3,
        "not_helpful_count": 1,
        "human_feedback_count": 1,
        "last_helpful": "2026-03-04T05:06:07.089Z",
        "confidence": 0.01,
        "source_event": "evt-42"
    })");

    Delta d = j.get<Delta>();
    assert(d.id == "d7");
    assert(d.helpful_count == 3 && d.not_helpful_count == 1 && d.human_feedback_count == 1);
    // Persisted confidence is never trusted
    assert(std::fabs(d.confidence - 6.0 / 7.0) < 1e-12);
    assert(d.last_helpful.has_value());
    assert(format_iso8601(*d.last_helpful) == "2026-03-04T05:06:07.089Z");

    json out = d;
    assert(out["source_event"] == "evt-42");
    assert(out["last_helpful"] == "2026-03-04T05:06:07.089Z");

    Delta fresh = make_delta("d8", "x");
    json fresh_json = fresh;
    assert(fresh_json["last_helpful"].is_null());

    // Negative counters are clamped, wrong types rejected
    Delta clamped = json::parse(R"({"id":"c","helpful_count":-4})").get<Delta>();
    assert(clamped.helpful_count == 0);

    bool threw = false;
    try {
        json::parse(R"({"id":"bad","helpful_count":"many"})").get<Delta>();
    } catch (const InvalidDelta&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        json::parse(R"({"condition":"no id"})").get<Delta>();
    } catch (const InvalidDelta&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Persisted store
// ═══════════════════════════════════════════════════════════════════════════

void test_playbook_init() {
    std::cout << "Testing playbook init..." << std::endl;

    TempDir dir;
    std::string path = dir.path + "/nested/memory/deltas.json";
    Playbook playbook(path);
    assert(playbook.init());
    assert(read_text(path) == "[]\n");
    assert(playbook.load().empty());

    // Existing content is never replaced
    write_text(path, R"([{"id":"keep","condition":"x"}])");
    assert(playbook.init());
    assert(playbook.load().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_playbook_corrupt() {
    std::cout << "Testing corrupt playbook..." << std::endl;

    TempDir dir;
    std::string path = dir.file("deltas.json");
    write_text(path, "[{\"id\": \"d1\", \"condi");

    Playbook playbook(path, fast_lock());
    assert(playbook.load().empty());
    assert(playbook.read().status == PlaybookSnapshot::Status::Corrupt);

    // Updates refuse to run and the file is left alone
    auto result = playbook.record_outcome({"d1"}, Reinforcement::Helpful);
    assert(!result.success);
    assert(!result.lock_failed);
    assert(read_text(path) == "[{\"id\": \"d1\", \"condi");

    write_text(path, R"({"not": "an array"})");
    assert(playbook.load().empty());
    assert(!playbook.add(make_delta("d2", "x")).success);

    std::cout << "  PASS" << std::endl;
}

void test_playbook_quarantine() {
    std::cout << "Testing quarantined entries..." << std::endl;

    TempDir dir;
    std::string path = dir.file("deltas.json");
    write_text(path, R"([
        {"id": "good", "condition": "x", "helpful_count": 1},
        {"id": "bad", "helpful_count": "lots"},
        {"id": "good", "condition": "duplicate"},
        42
    ])");

    Playbook playbook(path, fast_lock());
    auto snap = playbook.read();
    assert(snap.status == PlaybookSnapshot::Status::Ok);
    assert(snap.deltas.size() == 1);
    assert(snap.quarantined.size() == 3);

    auto result = playbook.record_outcome({"good"}, Reinforcement::Helpful);
    assert(result.success && result.changed == 1);

    json doc = json::parse(read_text(path));
    assert(doc.size() == 4);
    assert(doc[0]["helpful_count"] == 2);
    assert(doc[1]["helpful_count"] == "lots");
    assert(doc[3] == 42);

    // A quarantined id is still taken
    assert(!playbook.add(make_delta("bad", "x")).success);

    std::cout << "  PASS" << std::endl;
}

void test_human_negative_scenario() {
    std::cout << "Testing human negative feedback on d1..." << std::endl;

    TempDir dir;
    Playbook playbook = seeded_playbook(dir, {make_delta("d1", "when using /cook")});
    double prior = playbook.load()[0].confidence;
    assert(prior == 0.5);

    auto result = playbook.record_outcome({"d1"}, Reinforcement::NotHelpful);
    assert(result.success && result.changed == 1);

    auto d1 = playbook.load()[0];
    assert(d1.not_helpful_count == 1);
    assert(d1.helpful_count == 0 && d1.human_feedback_count == 0);
    assert(d1.confidence < prior);

    std::cout << "  PASS" << std::endl;
}

void test_playbook_operations() {
    std::cout << "Testing playbook add/reset/human gate..." << std::endl;

    TempDir dir;
    Playbook playbook = seeded_playbook(dir, {
        make_delta("ok", "x", 2, 1, 0),
        make_delta("failing", "y", 0, 3, 0),
    });

    // Ids are never reused
    auto dup = playbook.add(make_delta("ok", "again"));
    assert(!dup.success);

    // Human confirmation is only accepted where automation agrees
    auto result = playbook.record_outcome({"ok", "failing", "missing", "ok"}, Reinforcement::HumanHelpful);
    assert(result.success);
    assert(result.changed == 1);
    auto snap = playbook.read();
    assert(snap.find("ok")->human_feedback_count == 1);
    assert(snap.find("ok")->last_helpful.has_value());
    assert(snap.find("failing")->human_feedback_count == 0);

    auto reset = playbook.reset("ok");
    assert(reset.success && reset.changed == 1);
    snap = playbook.read();
    assert(snap.find("ok")->feedback_volume() == 0);
    assert(!snap.find("ok")->last_helpful.has_value());
    assert(snap.find("ok")->created.has_value());

    assert(playbook.reset("missing").changed == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Concurrency guard
// ═══════════════════════════════════════════════════════════════════════════

void test_lock_exclusive_and_timeout() {
    std::cout << "Testing lock exclusion and timeout..." << std::endl;

    TempDir dir;
    std::string target = dir.file("deltas.json");
    LockOptions quick;
    quick.max_attempts = 3;
    quick.retry_interval_ms = 5;

    {
        FileLock holder(target, quick);
        assert(holder.acquire());
        assert(fs::exists(holder.path()));

        FileLock waiter(target, quick);
        assert(!waiter.acquire());
        assert(!waiter.error().empty());

        bool ran = false;
        auto skipped = with_lock(target, quick, [&]() { ran = true; return 1; });
        assert(!skipped.has_value());
        assert(!ran);
    }

    // Released by RAII
    assert(!fs::exists(target + ".lock"));
    auto value = with_lock(target, quick, []() { return 7; });
    assert(value && *value == 7);
    assert(!fs::exists(target + ".lock"));

    std::cout << "  PASS" << std::endl;
}

void test_lock_stale_reclaim() {
    std::cout << "Testing stale lock reclaim..." << std::endl;

    TempDir dir;
    std::string target = dir.file("deltas.json");
    LockOptions quick;
    quick.max_attempts = 3;
    quick.retry_interval_ms = 5;
    quick.stale_after_ms = 60000;

    // Holder crashed: its pid is gone
    pid_t child = ::fork();
    assert(child >= 0);
    if (child == 0) ::_exit(0);
    int status = 0;
    ::waitpid(child, &status, 0);

    write_text(target + ".lock", std::to_string(child) + " " + std::to_string(now()) + " dead\n");
    {
        FileLock lock(target, quick);
        assert(lock.acquire());
    }

    // Holder alive but past the max hold time
    write_text(target + ".lock",
               std::to_string(::getpid()) + " " + std::to_string(now() - 120000) + " old\n");
    {
        FileLock lock(target, quick);
        assert(lock.acquire());
    }

    // Holder alive and fresh: not reclaimed
    write_text(target + ".lock", std::to_string(::getpid()) + " " + std::to_string(now()) + " live\n");
    {
        FileLock lock(target, quick);
        assert(!lock.acquire());
    }
    assert(fs::exists(target + ".lock"));

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_disjoint_updates() {
    std::cout << "Testing concurrent updates to disjoint records..." << std::endl;

    TempDir dir;
    const int workers = 8;
    std::vector<Delta> seed;
    for (int i = 0; i < workers; ++i) {
        seed.push_back(make_delta("d" + std::to_string(i), "any"));
    }
    Playbook playbook = seeded_playbook(dir, seed);

    std::vector<pid_t> children;
    for (int i = 0; i < workers; ++i) {
        pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0) {
            Playbook mine(dir.file("deltas.json"), fast_lock());
            auto result = mine.record_outcome({"d" + std::to_string(i)}, Reinforcement::Helpful);
            ::_exit(result.success && result.changed == 1 ? 0 : 1);
        }
        children.push_back(pid);
    }
    assert(wait_all(children));

    auto snap = playbook.read();
    assert(snap.deltas.size() == static_cast<size_t>(workers));
    for (const auto& d : snap.deltas) {
        assert(d.helpful_count == 1);
    }
    assert(!fs::exists(dir.file("deltas.json.lock")));

    std::cout << "  PASS" << std::endl;
}

void test_stale_lock_contention() {
    std::cout << "Testing contended reclaim of a stale lock..." << std::endl;

    TempDir dir;
    Playbook playbook = seeded_playbook(dir, {make_delta("shared", "any")});

    pid_t crashed = ::fork();
    assert(crashed >= 0);
    if (crashed == 0) ::_exit(0);
    int status = 0;
    ::waitpid(crashed, &status, 0);
    write_text(dir.file("deltas.json.lock"), std::to_string(crashed) + " " + std::to_string(now()) + " gone\n");

    // Every waiter sees the same stale marker at once; exactly one update
    // may run at a time or increments are lost
    const int workers = 6;
    const int rounds = 5;
    std::vector<pid_t> children;
    for (int w = 0; w < workers; ++w) {
        pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0) {
            Playbook mine(dir.file("deltas.json"), fast_lock());
            bool ok = true;
            for (int i = 0; i < rounds; ++i) {
                ok = mine.record_outcome({"shared"}, Reinforcement::Helpful).success && ok;
            }
            ::_exit(ok ? 0 : 1);
        }
        children.push_back(pid);
    }
    assert(wait_all(children));

    assert(playbook.load()[0].helpful_count == static_cast<uint32_t>(workers * rounds));
    assert(!fs::exists(dir.file("deltas.json.lock")));
    for (const auto& entry : fs::directory_iterator(dir.path)) {
        assert(entry.path().filename().string().find(".stale.") == std::string::npos);
    }

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_same_record() {
    std::cout << "Testing concurrent increments of one record..." << std::endl;

    TempDir dir;
    Playbook playbook = seeded_playbook(dir, {make_delta("shared", "any", 5, 0, 0)});
    const int rounds = 10;

    std::vector<pid_t> children;
    for (int w = 0; w < 2; ++w) {
        pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0) {
            Playbook mine(dir.file("deltas.json"), fast_lock());
            bool ok = true;
            for (int i = 0; i < rounds; ++i) {
                ok = mine.record_outcome({"shared"}, Reinforcement::Helpful).success && ok;
            }
            ::_exit(ok ? 0 : 1);
        }
        children.push_back(pid);
    }
    assert(wait_all(children));

    auto shared = playbook.load()[0];
    assert(shared.helpful_count == 5 + 2 * rounds);
    assert(shared.confidence == recalculate_confidence(shared));

    std::cout << "  PASS" << std::endl;
}

void test_reader_never_sees_partial_write() {
    std::cout << "Testing reader atomicity under a concurrent writer..." << std::endl;

    TempDir dir;
    std::vector<Delta> seed;
    for (int i = 0; i < 40; ++i) {
        Delta d = make_delta("d" + std::to_string(i), "condition " + std::to_string(i));
        d.solution = std::string(200, 'x');
        seed.push_back(d);
    }
    Playbook playbook = seeded_playbook(dir, seed);

    pid_t writer = ::fork();
    assert(writer >= 0);
    if (writer == 0) {
        Playbook mine(dir.file("deltas.json"), fast_lock());
        bool ok = true;
        for (int i = 0; i < 100; ++i) {
            ok = mine.record_outcome({"d" + std::to_string(i % 40)}, Reinforcement::Helpful).success && ok;
        }
        ::_exit(ok ? 0 : 1);
    }

    for (int i = 0; i < 400; ++i) {
        auto snap = playbook.read();
        assert(snap.status == PlaybookSnapshot::Status::Ok);
        assert(snap.deltas.size() == 40);
    }
    assert(wait_all({writer}));

    uint32_t total = 0;
    for (const auto& d : playbook.load()) total += d.helpful_count;
    assert(total == 100);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Selector
// ═══════════════════════════════════════════════════════════════════════════

void test_selector_top_three() {
    std::cout << "Testing selector budget with five candidates..." << std::endl;

    std::vector<Delta> deltas = {
        make_delta("c60", "when using /cook", 6, 4),
        make_delta("c90", "when using /cook", 9, 1),
        make_delta("c50", "when using /cook", 5, 5),
        make_delta("c80", "when using /cook", 8, 2),
        make_delta("c70", "when using /cook", 7, 3),
    };

    SelectionContext ctx;
    ctx.skill = "cook";

    size_t budget = std::char_traits<char>::length(INJECTION_HEADER);
    budget += format_entry(deltas[1]).size();
    budget += format_entry(deltas[3]).size();
    budget += format_entry(deltas[4]).size();

    Selection sel = select(deltas, ctx, budget, 10);
    assert(sel.ids.size() == 3);
    assert(sel.ids[0] == "c90" && sel.ids[1] == "c80" && sel.ids[2] == "c70");
    assert(embedded_ids(sel.text) == sel.ids);
    assert(sel.text.size() <= budget);

    // One byte less and the third entry no longer fits
    Selection tighter = select(deltas, ctx, budget - 1, 10);
    assert(tighter.ids.size() == 2);

    // The entry cap applies before the budget
    Selection capped = select(deltas, ctx, 100000, 4);
    assert(capped.ids.size() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_selector_budget_property() {
    std::cout << "Testing selector budget property..." << std::endl;

    std::vector<Delta> deltas;
    for (int i = 0; i < 30; ++i) {
        Delta d = make_delta("p" + std::to_string(i), "pattern " + std::to_string(i),
                             static_cast<uint32_t>(i % 7), static_cast<uint32_t>(i % 5),
                             static_cast<uint32_t>(i % 2));
        d.problem = std::string(static_cast<size_t>(i * 3), 'p');
        d.solution = std::string(static_cast<size_t>(90 - i * 2), 's');
        deltas.push_back(d);
    }

    SelectionContext ctx;
    for (size_t budget = 0; budget < 4000; budget += 37) {
        Selection sel = select(deltas, ctx, budget, 30);
        assert(sel.text.size() <= budget);
        assert(embedded_ids(sel.text) == sel.ids);
        if (sel.ids.empty()) assert(sel.text.empty());

        // Ranked order is preserved
        for (size_t i = 1; i < sel.ids.size(); ++i) {
            const Delta* prev = nullptr;
            const Delta* cur = nullptr;
            for (const auto& d : deltas) {
                if (d.id == sel.ids[i - 1]) prev = &d;
                if (d.id == sel.ids[i]) cur = &d;
            }
            assert(prev && cur && !ranks_before(*cur, *prev));
        }
    }

    // Header alone never goes out
    Delta one = make_delta("solo", "anything");
    size_t header = std::char_traits<char>::length(INJECTION_HEADER);
    Selection none = select({one}, ctx, header + format_entry(one).size() - 1, 10);
    assert(none.empty() && none.text.empty());

    std::cout << "  PASS" << std::endl;
}

void test_selector_ranking_ties() {
    std::cout << "Testing selector tie-breaking..." << std::endl;

    Delta fresh = make_delta("fresh", "x", 1, 1);
    fresh.last_helpful = now();
    Delta stale = make_delta("stale", "x", 1, 1);
    stale.last_helpful = now() - 86400000;
    Delta busy = make_delta("busy", "x", 5, 5);
    Delta quiet = make_delta("quiet", "x", 1, 1);

    std::vector<Delta> deltas = {quiet, stale, busy, fresh};
    Selection sel = select(deltas, SelectionContext{}, 100000, 10);
    assert(sel.ids.size() == 4);
    assert(sel.ids[0] == "fresh");
    assert(sel.ids[1] == "stale");
    assert(sel.ids[2] == "busy");
    assert(sel.ids[3] == "quiet");

    std::cout << "  PASS" << std::endl;
}

void test_selector_matching() {
    std::cout << "Testing condition matching..." << std::endl;

    SelectionContext empty;
    // No signal: everything matches
    assert(matches("when using /cook", empty));
    assert(matches("for files matching *.ts", empty));
    assert(matches("before Bash commands", empty));
    assert(matches("on branch main", empty));
    assert(matches("general advice", empty));

    SelectionContext cook;
    cook.tool_name = "Skill";
    cook.skill = "cook";
    assert(matches("when using /cook", cook));
    assert(matches("When using /COOK skill", cook));
    assert(!matches("when using /plan", cook));
    assert(matches("general advice", cook));
    assert(matches("edit src/app/module.ts carefully", cook));  // Paths are not skills

    SelectionContext editing;
    editing.tool_name = "Edit";
    editing.file_path = "/repo/src/app.component.ts";
    assert(matches("for files matching *.ts", editing));
    assert(matches("for **/*.component.ts files", editing));
    assert(!matches("for files matching *.cs", editing));
    assert(matches("before Edit or Write", editing));
    assert(!matches("before Bash commands", editing));

    SelectionContext dotnet;
    dotnet.project_type = "dotnet";
    assert(matches("for *.cs handlers", dotnet));
    assert(!matches("for *.py scripts", dotnet));

    SelectionContext prompt;
    prompt.prompt = "fix the failing tests in user.service.ts";
    assert(matches("for files matching *.ts", prompt));
    assert(!matches("for files matching *.cs", prompt));

    SelectionContext branch;
    branch.branch = "main";
    assert(matches("on branch main", branch));
    assert(!matches("on branch release/2.0", branch));
    assert(matches("when branching logic grows", branch));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Session tracker
// ═══════════════════════════════════════════════════════════════════════════

void test_session_tracker() {
    std::cout << "Testing session tracker retention..." << std::endl;

    TempDir dir;
    SessionTracker tracker(dir.file("sessions.json"), TrackerLimits{3, 2}, fast_lock());

    assert(!tracker.lookup_injection("s1").has_value());

    assert(tracker.record_injection("s1", {"a", "b", "c"}));
    auto s1 = tracker.lookup_injection("s1");
    assert(s1 && s1->size() == 2);  // Capped
    assert((*s1)[0] == "a" && (*s1)[1] == "b");

    assert(tracker.record_injection("s2", {"x"}));
    assert(tracker.record_injection("s3", {"y"}));
    assert(tracker.size() == 3);

    // Session 4 pushes out the oldest
    assert(tracker.record_injection("s4", {"z"}));
    assert(tracker.size() == 3);
    assert(!tracker.lookup_injection("s1").has_value());
    assert(tracker.lookup_injection("s2").has_value());
    assert(tracker.lookup_injection("s4").has_value());

    // Re-injection replaces the record and makes it the newest
    assert(tracker.record_injection("s2", {"x2"}));
    assert(tracker.record_injection("s5", {"w"}));
    assert(!tracker.lookup_injection("s3").has_value());
    auto s2 = tracker.lookup_injection("s2");
    assert(s2 && s2->size() == 1 && (*s2)[0] == "x2");

    // Corrupt tracker reads as empty and is rebuilt on the next write
    write_text(dir.file("sessions.json"), "{ broken");
    assert(!tracker.lookup_injection("s2").has_value());
    assert(tracker.record_injection("s6", {"v"}));
    assert(tracker.size() == 1);

    assert(!tracker.record_injection("", {"a"}));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Feedback classifier
// ═══════════════════════════════════════════════════════════════════════════

void test_classify_tool_outcome() {
    std::cout << "Testing tool outcome classification..." << std::endl;

    auto classify = [](const char* response) {
        return classify_tool_outcome(ToolResult::from_response(json::parse(response)));
    };

    assert(classify(R"({"stdout": "all good", "exit_code": 0})") == Outcome::Success);
    assert(classify(R"({"stdout": "", "exit_code": 2})") == Outcome::Failure);
    assert(classify(R"({"stdout": "done", "error": "permission denied"})") == Outcome::Failure);
    assert(classify(R"({"stdout": "done", "error": null})") == Outcome::Success);
    assert(classify(R"({"stdout": "3 tests FAILED"})") == Outcome::Failure);
    assert(classify(R"({"stderr": "Error: cannot find module"})") == Outcome::Failure);
    assert(classify(R"({"content": [{"type": "text", "text": "[BLOCKED] path outside project"}]})") == Outcome::Failure);
    assert(classify(R"("plain text result")") == Outcome::Success);
    assert(classify(R"({"is_error": true})") == Outcome::Failure);

    // Markers are case-sensitive
    assert(classify(R"({"stdout": "no errors were found, nothing failed"})") == Outcome::Success);
    assert(classify(R"({"stderr": "Traceback:\n  File \"app.py\""})") == Outcome::Failure);
    assert(classify(R"({"stdout": "Failed to resolve host"})") == Outcome::Failure);
    assert(classify(R"({"stdout": "traceback disabled; sh: foo: command not found"})") == Outcome::Success);
    for (const char* marker : FAILURE_MARKERS) {
        ToolResult marked;
        marked.text = std::string("prefix ") + marker + " suffix";
        assert(classify_tool_outcome(marked) == Outcome::Failure);
    }

    ToolResult empty;
    assert(classify_tool_outcome(empty) == Outcome::Success);

    std::cout << "  PASS" << std::endl;
}

void test_detect_negative_feedback() {
    std::cout << "Testing negative feedback detection..." << std::endl;

    assert(detect_negative_feedback("No, that's wrong. Use the repository."));
    assert(detect_negative_feedback("This DOESN'T WORK"));
    assert(detect_negative_feedback("that\xE2\x80\x99s not right"));
    assert(detect_negative_feedback("please revert that change"));
    assert(!detect_negative_feedback("great, now add the tests"));
    assert(!detect_negative_feedback(""));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Hook flow
// ═══════════════════════════════════════════════════════════════════════════

Config test_config(const TempDir& dir) {
    Config config;
    config.memory_dir = dir.path + "/memory";
    config.project_dir = dir.path + "/project";
    config.max_sessions = 2;
    config.lock = fast_lock();
    return config;
}

std::optional<HookEvent> event_from(const json& payload) {
    return HookEvent::parse(payload.dump(), 1024 * 1024);
}

void test_hook_flow() {
    std::cout << "Testing hook flow end to end..." << std::endl;

    ::unsetenv("ACE_BRANCH");
    ::unsetenv("GIT_BRANCH");
    ::unsetenv("ACE_PROJECT_TYPE");
    ::unsetenv("CLAUDE_SESSION_ID");

    TempDir dir;
    Config config = test_config(dir);
    Playbook playbook(config.deltas_path(), config.lock);
    assert(playbook.init());
    assert(playbook.add(make_delta("cook1", "when using /cook", 2, 0)).success);
    assert(playbook.add(make_delta("ts1", "for files matching *.ts", 1, 1)).success);
    assert(playbook.add(make_delta("plan1", "when using /plan", 4, 0)).success);

    HookRunner runner(config);

    // Skill invocation: only skill-compatible deltas are shown
    auto pre = event_from({
        {"hook_event_name", "PreToolUse"},
        {"session_id", "sess-1"},
        {"cwd", dir.path},
        {"tool_name", "Skill"},
        {"tool_input", {{"skill", "cook"}}},
    });
    assert(pre);
    std::string injected = runner.handle(*pre);
    assert(injected.find("## Learned Patterns") == 0);
    std::vector<std::string> shown = embedded_ids(injected);
    assert(!shown.empty());
    assert(std::find(shown.begin(), shown.end(), "plan1") == shown.end());

    SessionTracker tracker(config.sessions_path(), TrackerLimits{2, 10}, config.lock);
    auto tracked = tracker.lookup_injection("sess-1");
    assert(tracked && *tracked == shown);

    // Tool failure penalizes what was shown
    auto post = event_from({
        {"hook_event_name", "PostToolUse"},
        {"session_id", "sess-1"},
        {"tool_name", "Skill"},
        {"tool_response", {{"stdout", "Build FAILED"}, {"exit_code", 1}}},
    });
    assert(runner.handle(*post).empty());
    auto snap = playbook.read();
    assert(snap.find("cook1")->not_helpful_count == 1);
    assert(snap.find("plan1")->not_helpful_count == 0);

    // Success reinforces
    auto ok = event_from({
        {"hook_event_name", "PostToolUse"},
        {"session_id", "sess-1"},
        {"tool_name", "Skill"},
        {"tool_response", {{"stdout", "done"}}},
    });
    runner.handle(*ok);
    snap = playbook.read();
    assert(snap.find("cook1")->helpful_count == 3);
    assert(snap.find("cook1")->last_helpful.has_value());

    // Human correction
    auto neutral = event_from({
        {"hook_event_name", "UserPromptSubmit"},
        {"session_id", "sess-1"},
        {"prompt", "thanks, continue"},
    });
    runner.handle(*neutral);
    assert(playbook.read().find("cook1")->not_helpful_count == 1);

    auto negative = event_from({
        {"hook_event_name", "UserPromptSubmit"},
        {"session_id", "sess-1"},
        {"prompt", "No, that's wrong"},
    });
    runner.handle(*negative);
    assert(playbook.read().find("cook1")->not_helpful_count == 2);

    // Feedback for a session that never saw an injection is a no-op
    auto stranger = event_from({
        {"hook_event_name", "UserPromptSubmit"},
        {"session_id", "sess-unknown"},
        {"prompt", "that's wrong"},
    });
    runner.handle(*stranger);
    assert(playbook.read().find("cook1")->not_helpful_count == 2);

    // Evicted session: feedback is dropped
    for (const char* sid : {"sess-2", "sess-3"}) {
        auto start = event_from({{"hook_event_name", "SessionStart"}, {"session_id", sid}, {"cwd", dir.path}});
        assert(!runner.handle(*start).empty());
    }
    assert(!tracker.lookup_injection("sess-1").has_value());
    runner.handle(*negative);
    assert(playbook.read().find("cook1")->not_helpful_count == 2);

    // Unknown events are ignored
    auto unknown = event_from({{"hook_event_name", "Notification"}, {"session_id", "sess-2"}});
    assert(unknown && unknown->kind == HookKind::Unknown);
    assert(runner.handle(*unknown).empty());

    // Audit trail
    std::string audit = read_text(config.events_path());
    assert(audit.find(" inject ") != std::string::npos);
    assert(audit.find(" feedback ") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_hook_empty_injection_resets_attribution() {
    std::cout << "Testing attribution after an empty injection..." << std::endl;

    ::unsetenv("ACE_BRANCH");
    ::unsetenv("GIT_BRANCH");
    ::unsetenv("ACE_PROJECT_TYPE");

    TempDir dir;
    Config config = test_config(dir);
    Playbook playbook(config.deltas_path(), config.lock);
    assert(playbook.init());
    assert(playbook.add(make_delta("bash1", "when running Bash commands")).success);

    HookRunner runner(config);
    auto bash = event_from({
        {"hook_event_name", "PreToolUse"},
        {"session_id", "sess-tools"},
        {"cwd", dir.path},
        {"tool_name", "Bash"},
        {"tool_input", {{"command", "make"}}},
    });
    assert(embedded_ids(runner.handle(*bash)) == std::vector<std::string>{"bash1"});

    // Read shows nothing: the Bash delta must not be judged by its result
    auto read = event_from({
        {"hook_event_name", "PreToolUse"},
        {"session_id", "sess-tools"},
        {"cwd", dir.path},
        {"tool_name", "Read"},
        {"tool_input", {{"file_path", "/var/log/app.log"}}},
    });
    assert(runner.handle(*read).empty());

    SessionTracker tracker(config.sessions_path(), TrackerLimits{2, 10}, config.lock);
    auto tracked = tracker.lookup_injection("sess-tools");
    assert(tracked && tracked->empty());

    auto result = event_from({
        {"hook_event_name", "PostToolUse"},
        {"session_id", "sess-tools"},
        {"tool_name", "Read"},
        {"tool_response", {{"content", "ERROR connection refused"}}},
    });
    runner.handle(*result);
    auto bash1 = *playbook.read().find("bash1");
    assert(bash1.helpful_count == 0 && bash1.not_helpful_count == 0);

    // Sessions without a prior injection are not written
    auto fresh = event_from({
        {"hook_event_name", "PreToolUse"},
        {"session_id", "sess-quiet"},
        {"cwd", dir.path},
        {"tool_name", "Read"},
    });
    assert(runner.handle(*fresh).empty());
    assert(!tracker.lookup_injection("sess-quiet").has_value());

    std::cout << "  PASS" << std::endl;
}

void test_hook_payload_rejection() {
    std::cout << "Testing malformed hook payloads..." << std::endl;

    assert(!HookEvent::parse("", 1024).has_value());
    assert(!HookEvent::parse("{not json", 1024).has_value());
    assert(!HookEvent::parse("[1,2,3]", 1024).has_value());
    assert(!HookEvent::parse(std::string(2048, ' ') + "{}", 1024).has_value());

    auto minimal = HookEvent::parse(R"({"hook_event_name":"SessionStart","tool_input":"odd"})", 1024);
    assert(minimal && minimal->kind == HookKind::SessionStart);
    assert(minimal->tool_input.is_object());

    // Empty playbook: nothing to inject
    TempDir dir;
    HookRunner runner(test_config(dir));
    assert(runner.handle(*minimal).empty());

    std::cout << "  PASS" << std::endl;
}

void test_context_from_event() {
    std::cout << "Testing selection context extraction..." << std::endl;

    TempDir dir;
    fs::create_directories(dir.path + "/.git");
    write_text(dir.path + "/.git/HEAD", "ref: refs/heads/feature/login\n");
    ::unsetenv("ACE_BRANCH");
    ::unsetenv("GIT_BRANCH");
    ::setenv("ACE_PROJECT_TYPE", "node", 1);

    HookRunner runner(test_config(dir));
    auto event = event_from({
        {"hook_event_name", "PreToolUse"},
        {"cwd", dir.path},
        {"tool_name", "Edit"},
        {"tool_input", {{"file_path", "src/login.ts"}, {"description", "fix guard"}}},
    });
    SelectionContext ctx = runner.context_for(*event);
    assert(ctx.branch == "feature/login");
    assert(ctx.project_type == "node");
    assert(ctx.file_path == "src/login.ts");
    assert(ctx.tool_name == "Edit");
    assert(ctx.prompt.find("fix guard") != std::string::npos);

    ::setenv("ACE_BRANCH", "main", 1);
    assert(runner.context_for(*event).branch == "main");

    ::unsetenv("ACE_BRANCH");
    ::unsetenv("ACE_PROJECT_TYPE");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Report
// ═══════════════════════════════════════════════════════════════════════════

void test_report() {
    std::cout << "Testing playbook report..." << std::endl;

    TempDir dir;
    Config config = test_config(dir);
    Playbook playbook(config.deltas_path(), config.lock);
    assert(playbook.init());
    Delta a = make_delta("a", "when using /cook", 3, 1, 1);
    a.problem = std::string(80, 'p');
    assert(playbook.add(a).success);
    assert(playbook.add(make_delta("b", "when using /cook", 0, 2, 0)).success);
    assert(playbook.add(make_delta("c", "general", 1, 0, 0)).success);

    write_text(config.candidates_path(), R"([{"id":"cand1"},{"id":"cand2"}])");
    write_text(config.events_path(), "2026-01-01T00:00:00.000Z inject\n2026-01-01T00:00:01.000Z feedback\n");
    fs::create_directories(config.archive_dir());
    write_text(config.archive_dir() + "/2026-01.json", R"([{"id":"old1"},{"id":"old2"},{"id":"old3"}])");

    PlaybookReport report = generate_report(config);
    assert(report.active_deltas == 3);
    assert(report.max_deltas == 50);
    assert(report.capacity_percent() == 6);
    assert(report.pending_candidates == 2);
    assert(report.total_events == 2);
    assert(report.archived_deltas == 3);
    assert(report.total_helpful == 4);
    assert(report.total_not_helpful == 3);
    assert(report.human_feedback == 1);
    assert(report.top.size() == 3);
    assert(report.top[0].id == "c");
    assert(report.top.back().id == "b");
    assert(report.top[1].problem.size() == 53);
    assert(report.skills.front().first == "cook" && report.skills.front().second == 2);

    json j = report_to_json(report);
    assert(j["summary"]["capacity_used"] == "6%");
    assert(j["statistics"]["human_weight_applied"] == "3x");
    assert(j["skill_breakdown"]["unknown"] == 1);

    std::ostringstream text;
    print_report(report, text);
    assert(text.str().find("Active deltas:      3 / 50") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_report_multibyte_truncation() {
    std::cout << "Testing report truncation of non-ASCII text..." << std::endl;

    TempDir dir;
    Config config = test_config(dir);
    Playbook playbook(config.deltas_path(), config.lock);
    assert(playbook.init());
    Delta d = make_delta("utf8", "general");
    // Two-byte "é" straddles the 50-byte cut
    d.problem = std::string(49, 'a') + "\xC3\xA9\xE2\x80\xA6 and more";
    assert(playbook.add(d).success);

    PlaybookReport report = generate_report(config);
    assert(report.top.size() == 1);
    assert(report.top[0].problem == std::string(49, 'a') + "...");

    std::string dumped = report_to_json(report).dump(2);
    assert(dumped.find("\"utf8\"") != std::string::npos);

    assert(detail::truncate("\xC3\xA9\xC3\xA9", 3) == "\xC3\xA9...");
    assert(detail::truncate("short", 50) == "short");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Copilot sync
// ═══════════════════════════════════════════════════════════════════════════

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

void test_sync_to_copilot() {
    std::cout << "Testing Copilot sync..." << std::endl;

    TempDir dir;
    Config config = test_config(dir);
    Playbook playbook(config.deltas_path(), config.lock);
    assert(playbook.init());
    Delta cook = make_delta("cook1", "when using /cook", 9, 1);
    cook.problem = "skipped tests";
    cook.solution = "run the suite\nbefore committing";
    assert(playbook.add(cook).success);
    Delta ts = make_delta("ts1", "for files matching *.ts", 1, 1);
    ts.problem = "implicit any";
    assert(playbook.add(ts).success);
    assert(playbook.add(make_delta("bare", "general", 0, 1)).success);

    const std::string user_rules = "# Project rules\n\nUse tabs.\n";
    fs::create_directories(config.project_dir + "/.github");
    write_text(config.copilot_path(), user_rules);

    Timestamp day = *parse_iso8601("2026-05-10T12:00:00Z");

    // Dry run leaves the file alone
    SyncResult preview = sync_to_copilot(config, true, day);
    assert(preview.success && preview.changed);
    assert(preview.deltas_count == 3);
    assert(preview.content.find("*Last synced: 2026-05-10*") != std::string::npos);
    assert(read_text(config.copilot_path()) == user_rules);

    SyncResult synced = sync_to_copilot(config, false, day);
    assert(synced.success);
    std::string content = read_text(config.copilot_path());
    assert(content == synced.content);
    assert(content.compare(0, user_rules.size() + 1, user_rules + "\n") == 0);
    assert(content.find("- **when using /cook**: run the suite before committing [90%]\n") != std::string::npos);
    assert(content.find("- **for files matching *.ts**: implicit any [50%]\n") != std::string::npos);
    assert(content.find("- **general**: [0%]\n") != std::string::npos);
    // Highest confidence first
    assert(content.find("when using /cook") < content.find("for files matching"));
    assert(content.find("for files matching") < content.find("**general**"));

    SyncValidation fresh = validate_sync(config, day);
    assert(fresh.valid && !fresh.skipped);
    assert(fresh.claude_count == 3 && fresh.copilot_count == 3);
    assert(fresh.last_synced && *fresh.last_synced == "2026-05-10");
    assert(fresh.warnings.empty());

    // Old syncs only warn
    SyncValidation old = validate_sync(config, day + 8LL * 24 * 60 * 60 * 1000);
    assert(old.valid);
    assert(old.days_since_sync == 8);
    assert(old.warnings.size() == 1);

    // Same day, same playbook: nothing to write
    assert(!sync_to_copilot(config, false, day).changed);

    assert(playbook.add(make_delta("new1", "on branch main", 1, 0)).success);
    SyncValidation behind = validate_sync(config, day);
    assert(!behind.valid);
    assert(behind.errors.size() == 1);
    assert(behind.errors[0] == "Delta count mismatch: Claude=4, Copilot=3");
    assert(!sync_status(config).in_sync);

    // Re-sync replaces the section in place
    Timestamp later = day + 2LL * 24 * 60 * 60 * 1000;
    assert(sync_to_copilot(config, false, later).success);
    content = read_text(config.copilot_path());
    assert(count_occurrences(content, SYNC_SECTION_START) == 1);
    assert(count_occurrences(content, SYNC_SECTION_END) == 1);
    assert(count_occurrences(content, "Use tabs.") == 1);
    assert(content.find("*Last synced: 2026-05-12*") != std::string::npos);

    SyncStatus status = sync_status(config);
    assert(status.copilot_exists && status.in_sync);
    assert(status.claude_count == 4 && status.copilot_count == 4);

    SyncResult dry_remove = remove_sync_section(config, true);
    assert(dry_remove.success && dry_remove.changed);
    assert(read_text(config.copilot_path()) == content);

    SyncResult removed = remove_sync_section(config, false);
    assert(removed.success && removed.message.empty());
    assert(read_text(config.copilot_path()) == user_rules);

    SyncResult again = remove_sync_section(config, false);
    assert(again.success && !again.changed);
    assert(again.message == "No ACE section to remove");

    SyncValidation missing = validate_sync(config, later);
    assert(!missing.valid);
    assert(missing.errors[0].find("missing ACE section") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_sync_edge_cases() {
    std::cout << "Testing Copilot sync edge cases..." << std::endl;

    TempDir dir;
    Config config = test_config(dir);

    // No playbook at all: nothing to validate
    SyncValidation none = validate_sync(config);
    assert(none.valid && none.skipped);

    Playbook playbook(config.deltas_path(), config.lock);
    assert(playbook.init());
    SyncResult empty = sync_to_copilot(config, false);
    assert(empty.success && empty.message == "No deltas to sync");
    assert(!fs::exists(config.copilot_path()));
    assert(validate_sync(config).skipped);

    assert(playbook.add(make_delta("d1", "any", 1, 0)).success);
    SyncValidation absent = validate_sync(config);
    assert(!absent.valid);
    assert(absent.errors[0].find("file missing") != std::string::npos);
    assert(remove_sync_section(config, false).message == "No Copilot instructions file");

    // Creates .github/ and a file holding only the section
    SyncResult created = sync_to_copilot(config, false);
    assert(created.success);
    std::string content = read_text(config.copilot_path());
    assert(content.compare(0, std::char_traits<char>::length(SYNC_SECTION_START), SYNC_SECTION_START) == 0);
    assert(validate_sync(config).valid);

    // Only "- **...**: ... [NN%]" lines count as synced entries
    std::string section = std::string(SYNC_SECTION_START) +
        "\n- **bold note** without confidence\n- **real**: entry [75%]\n- **odd**: entry [x%]\n" +
        SYNC_SECTION_END + "\n";
    assert(detail::count_synced_entries(section) == 1);
    assert(!detail::last_synced_date("*Last synced: someday*").has_value());

    write_text(config.deltas_path(), "[{broken");
    assert(!sync_to_copilot(config, false).success);
    assert(!validate_sync(config).valid);
    assert(read_text(config.copilot_path()) == content);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== ACE Playbook Tests ===" << std::endl;
    std::cout << std::endl;

    test_confidence();
    test_human_weight();
    test_reset_counters();
    test_delta_json();

    test_playbook_init();
    test_playbook_corrupt();
    test_playbook_quarantine();
    test_human_negative_scenario();
    test_playbook_operations();

    std::cout << std::endl;
    std::cout << "=== Cross-process Tests ===" << std::endl;
    test_lock_exclusive_and_timeout();
    test_lock_stale_reclaim();
    test_concurrent_disjoint_updates();
    test_concurrent_same_record();
    test_stale_lock_contention();
    test_reader_never_sees_partial_write();

    std::cout << std::endl;
    std::cout << "=== Selection & Feedback Tests ===" << std::endl;
    test_selector_top_three();
    test_selector_budget_property();
    test_selector_ranking_ties();
    test_selector_matching();
    test_session_tracker();
    test_classify_tool_outcome();
    test_detect_negative_feedback();

    test_hook_flow();
    test_hook_empty_injection_resets_attribution();
    test_hook_payload_rejection();
    test_context_from_event();
    test_report();
    test_report_multibyte_truncation();
    test_sync_to_copilot();
    test_sync_edge_cases();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
