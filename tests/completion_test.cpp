#include "MuRuntime.h"
#include "test_support.h"

using namespace MuRuntime;

namespace {

// Fixed candidate list, independent of the input
class FixedProvider : public CompletionProvider {
public:
    explicit FixedProvider(std::vector<std::string> items) : items_(std::move(items)), calls(0) {}

    std::vector<std::string> complete(const std::string&, size_t) override {
        calls++;
        return items_;
    }

    std::vector<std::string> items_;
    int calls;
};

} // namespace

// ============================================================================
// Tokenizing and ranking
// ============================================================================

TEST(trailing_token_stops_at_space_and_dot) {
    CHECK_EQ(trailing_token("x = pri", 7), std::string("pri"));
    CHECK_EQ(trailing_token("board.LE", 8), std::string("LE"));
    CHECK_EQ(trailing_token("abc ", 4), std::string(""));
    CHECK_EQ(trailing_token("abcdef", 3), std::string("abc"));
    CHECK_EQ(trailing_token("short", 99), std::string("short"));
}

TEST(top_level_prefix_match) {
    ModuleCompletionProvider p;
    auto c = p.complete("ra", 2);
    CHECK_EQ(c.size(), static_cast<size_t>(2));
    CHECK_EQ(c[0], std::string("raise"));
    CHECK_EQ(c[1], std::string("range"));
}

TEST(exact_case_ranks_before_case_insensitive) {
    ModuleCompletionProvider p;
    auto c = p.complete("t", 1);
    CHECK(!c.empty());
    // lowercase names first, then True/TypeError
    size_t first_upper = c.size();
    for (size_t i = 0; i < c.size(); ++i) {
        if (std::isupper(static_cast<unsigned char>(c[i][0]))) {
            first_upper = i;
            break;
        }
    }
    for (size_t i = first_upper; i < c.size(); ++i) CHECK(std::isupper(static_cast<unsigned char>(c[i][0])));
    CHECK(std::find(c.begin(), c.end(), "True") != c.end());
    CHECK(std::find(c.begin(), c.end(), "try") < std::find(c.begin(), c.end(), "True"));
}

TEST(shorter_names_rank_first) {
    ModuleCompletionProvider p;
    auto c = p.complete("mi", 2);
    CHECK(!c.empty());
    CHECK_EQ(c[0], std::string("min"));
}

TEST(member_completion_after_dot) {
    ModuleCompletionProvider p;
    auto c = p.complete("led = board.L", 13);
    CHECK_EQ(c.size(), static_cast<size_t>(1));
    CHECK_EQ(c[0], std::string("LED"));

    auto all = p.complete("digitalio.", 10);
    CHECK_EQ(all.size(), static_cast<size_t>(3));
    CHECK_EQ(all[0], std::string("Pull"));

    auto dir = p.complete("digitalio.Direction.O", 21);
    CHECK_EQ(dir.size(), static_cast<size_t>(1));
    CHECK_EQ(dir[0], std::string("OUTPUT"));
}

TEST(unknown_owner_and_empty_token) {
    ModuleCompletionProvider p;
    CHECK(p.complete("wifi.co", 7).empty());
    CHECK(p.complete("x = ", 4).empty());
    CHECK(p.complete("zzzz", 4).empty());
}

TEST(session_names_are_offered) {
    ModuleCompletionProvider p;
    p.add_names({"sensor_value", "sensor_value"});
    auto c = p.complete("sens", 4);
    CHECK_EQ(c.size(), static_cast<size_t>(1));
    CHECK_EQ(c[0], std::string("sensor_value"));
}

// ============================================================================
// CompletionCycle
// ============================================================================

TEST(cycle_wraps_after_k_presses) {
    FixedProvider provider({"alpha", "beta", "gamma"});
    CompletionCycle cycle(provider);
    std::string line = "x = a";

    std::vector<std::string> seen;
    for (int i = 0; i < 7; ++i) {
        auto r = cycle.next(line, line.size());
        CHECK(r.has_value());
        seen.push_back(*r);
    }
    CHECK_EQ(seen[0], std::string("x = alpha"));
    CHECK_EQ(seen[1], std::string("x = beta"));
    CHECK_EQ(seen[2], std::string("x = gamma"));
    CHECK_EQ(seen[3], seen[0]);
    CHECK_EQ(seen[6], seen[0]);
    // candidates are computed once per cycle
    CHECK_EQ(provider.calls, 1);
}

TEST(cycle_reset_recomputes) {
    FixedProvider provider({"one", "two"});
    CompletionCycle cycle(provider);
    cycle.next("o", 1);
    cycle.next("o", 1);
    CHECK_EQ(cycle.index(), static_cast<size_t>(1));
    cycle.reset();
    CHECK(!cycle.active());
    auto r = cycle.next("o", 1);
    CHECK_EQ(*r, std::string("one"));
    CHECK_EQ(provider.calls, 2);
}

TEST(cycle_preserves_text_after_cursor) {
    ModuleCompletionProvider p;
    CompletionCycle cycle(p);
    std::string line = "prin(1)";
    size_t cursor = 0;
    auto r = cycle.next(line, 4, &cursor);
    CHECK(r.has_value());
    CHECK_EQ(*r, std::string("print(1)"));
    CHECK_EQ(cursor, static_cast<size_t>(5));
}

TEST(cycle_no_candidates) {
    FixedProvider provider({});
    CompletionCycle cycle(provider);
    CHECK(!cycle.next("q", 1));
    CHECK(!cycle.active());
}

// ============================================================================
// "mu" commands
// ============================================================================

TEST(cli_line_detection) {
    CHECK(is_cli_line("mu help"));
    CHECK(is_cli_line("  mu"));
    CHECK(!is_cli_line("music = 1"));
    CHECK(!is_cli_line("print('mu')"));

    auto bare = parse_cli_line("mu");
    CHECK(bare.has_value());
    CHECK_EQ(bare->name, std::string("help"));

    auto pin = parse_cli_line("mu pin 3 1 output");
    CHECK_EQ(pin->name, std::string("pin"));
    CHECK_EQ(pin->args.size(), static_cast<size_t>(3));
}

TEST(cli_local_commands) {
    auto help = plan_cli_command(*parse_cli_line("mu help"), "");
    CHECK(help.kind == CliActionKind::LOCAL);
    CHECK(help.text.find("mu pin") != std::string::npos);

    auto version = plan_cli_command(*parse_cli_line("mu version"), "");
    CHECK_EQ(version.text, std::string("MuRuntime " MURUNTIME_VERSION "\n"));

    auto which = plan_cli_command(*parse_cli_line("mu which"), "worker process");
    CHECK_EQ(which.text, std::string("worker process\n"));
}

TEST(cli_request_commands) {
    auto status = plan_cli_command(*parse_cli_line("mu status"), "");
    CHECK(status.kind == CliActionKind::REQUEST);
    CHECK(status.request == RequestType::QUERY);
    CHECK_EQ(status.payload["queryType"].as_string(), std::string("health"));

    auto hw = plan_cli_command(*parse_cli_line("mu hw pins"), "");
    CHECK(hw.request == RequestType::HARDWARE_QUERY);
    CHECK_EQ(hw.payload["queryType"].as_string(), std::string("pins"));

    auto pin = plan_cli_command(*parse_cli_line("mu pin 5 1 output"), "");
    CHECK(pin.request == RequestType::HARDWARE_SET);
    const Json& entry = pin.payload["pins"].as_array()[0];
    CHECK_EQ(entry["pin"].as_int(), 5);
    CHECK(entry["value"].as_bool());
    CHECK_EQ(entry["mode"].as_string(), std::string("output"));

    auto sensor = plan_cli_command(*parse_cli_line("mu sensor temp_sensor 30.5"), "");
    CHECK_EQ(sensor.payload["sensors"].as_array()[0]["value"].as_number(), 30.5);

    auto board = plan_cli_command(*parse_cli_line("mu board pico"), "");
    CHECK(board.request == RequestType::CONFIGURE);
    CHECK_EQ(board.payload["boardProfile"]["boardId"].as_string(), std::string("pico"));
}

TEST(cli_invalid_commands) {
    auto unknown = plan_cli_command(*parse_cli_line("mu launch"), "");
    CHECK(unknown.kind == CliActionKind::INVALID);
    CHECK_EQ(unknown.text, std::string("Unknown command: mu launch (try 'mu help')"));

    CHECK(plan_cli_command(*parse_cli_line("mu pin x 1"), "").kind == CliActionKind::INVALID);
    CHECK(plan_cli_command(*parse_cli_line("mu pin 1 2"), "").kind == CliActionKind::INVALID);
    CHECK(plan_cli_command(*parse_cli_line("mu sensor t abc"), "").kind == CliActionKind::INVALID);
    CHECK(plan_cli_command(*parse_cli_line("mu hw gpio"), "").kind == CliActionKind::INVALID);
}

TEST(cli_render_results) {
    Response resp;
    resp.success = true;
    Json r = Json::object();
    r["changesApplied"] = 2;
    resp.result = r;
    CHECK_EQ(render_cli_result(*parse_cli_line("mu pin 1 1"), resp), std::string("2 change(s) applied\n"));

    Json health = Json::object();
    health["status"] = "healthy";
    health["initialized"] = true;
    resp.result = health;
    CHECK_EQ(render_cli_result(*parse_cli_line("mu status"), resp),
             std::string("worker healthy, interpreter initialized\n"));
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Completion and Command Tests ===\n\n";

    RUN_TEST(trailing_token_stops_at_space_and_dot);
    RUN_TEST(top_level_prefix_match);
    RUN_TEST(exact_case_ranks_before_case_insensitive);
    RUN_TEST(shorter_names_rank_first);
    RUN_TEST(member_completion_after_dot);
    RUN_TEST(unknown_owner_and_empty_token);
    RUN_TEST(session_names_are_offered);

    RUN_TEST(cycle_wraps_after_k_presses);
    RUN_TEST(cycle_reset_recomputes);
    RUN_TEST(cycle_preserves_text_after_cursor);
    RUN_TEST(cycle_no_candidates);

    RUN_TEST(cli_line_detection);
    RUN_TEST(cli_local_commands);
    RUN_TEST(cli_request_commands);
    RUN_TEST(cli_invalid_commands);
    RUN_TEST(cli_render_results);

    return test_summary();
}
