#include "MuRuntime.h"
#include "test_support.h"

using namespace MuRuntime;

namespace {

// Records which side of a continuation fired
struct Outcome {
    int resolved = 0;
    int rejected = 0;
    std::optional<CommandError> error;
    std::optional<Response> response;

    Continuation continuation() {
        Continuation c;
        c.resolve = [this](const Response& r) { resolved++; response = r; };
        c.reject = [this](const CommandError& e) { rejected++; error = e; };
        return c;
    }

    int total() const { return resolved + rejected; }
};

Response reply(const std::string& id, bool success, const std::string& error = {}) {
    Response r;
    r.id = id;
    r.success = success;
    if (!success) r.error = error;
    return r;
}

} // namespace

// ============================================================================
// CorrelationIdGenerator
// ============================================================================

TEST(ids_are_uuid_v4_shaped) {
    CorrelationIdGenerator gen;
    for (int i = 0; i < 100; ++i) {
        std::string id = gen.next();
        CHECK_EQ(id.size(), static_cast<size_t>(36));
        CHECK(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
        CHECK(id[14] == '4');
        CHECK(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
        for (size_t k = 0; k < id.size(); ++k) {
            if (k == 8 || k == 13 || k == 18 || k == 23) continue;
            CHECK(std::isxdigit(static_cast<unsigned char>(id[k])) && !std::isupper(static_cast<unsigned char>(id[k])));
        }
    }
}

TEST(ten_thousand_ids_are_distinct) {
    CorrelationIdGenerator gen;
    std::set<std::string> seen;
    for (int i = 0; i < 10000; ++i) seen.insert(gen.next());
    CHECK_EQ(seen.size(), static_cast<size_t>(10000));
}

TEST(seeded_generators_are_reproducible) {
    CorrelationIdGenerator a(99);
    CorrelationIdGenerator b(99);
    CorrelationIdGenerator c(100);
    std::string first = a.next();
    CHECK_EQ(first, b.next());
    CHECK(first != c.next());
    CHECK(a.next() != first);
}

// ============================================================================
// PendingTable
// ============================================================================

TEST(deliver_success_resolves_once) {
    PendingTable table;
    Outcome o;
    table.add("a", CommandKind::EXECUTE, o.continuation());
    CHECK(table.contains("a"));
    CHECK(table.deliver(reply("a", true)));
    CHECK_EQ(o.resolved, 1);
    CHECK_EQ(o.rejected, 0);
    CHECK(table.empty());
    // a duplicate reply is ignored
    CHECK(!table.deliver(reply("a", true)));
    CHECK_EQ(o.total(), 1);
}

TEST(deliver_failure_rejects_with_execution_error) {
    PendingTable table;
    Outcome o;
    table.add("b", CommandKind::EXECUTE, o.continuation());
    CHECK(table.deliver(reply("b", false, "NameError: name 'x' isn't defined")));
    CHECK_EQ(o.rejected, 1);
    CHECK(o.error->kind == ErrorKind::EXECUTION);
    CHECK_EQ(o.error->message, std::string("NameError: name 'x' isn't defined"));
    CHECK(o.error->response.has_value());
    CHECK_EQ(o.error->response->id, std::string("b"));
}

TEST(unmatched_reply_is_noop) {
    PendingTable table;
    Outcome o;
    table.add("c", CommandKind::QUERY, o.continuation());
    CHECK(!table.deliver(reply("zzz", true)));
    CHECK_EQ(table.size(), static_cast<size_t>(1));
    CHECK_EQ(o.total(), 0);
}

TEST(duplicate_id_is_refused) {
    PendingTable table;
    Outcome first;
    Outcome second;
    CHECK(table.add("d", CommandKind::EXECUTE, first.continuation()));
    CHECK(!table.add("d", CommandKind::EXECUTE, second.continuation()));
    CHECK_EQ(table.size(), static_cast<size_t>(1));

    // the original entry still owns the id
    CHECK(table.deliver(reply("d", true)));
    CHECK_EQ(first.resolved, 1);
    CHECK_EQ(second.total(), 0);
}

TEST(sweep_rejects_expired_with_timeout) {
    PendingTable table(std::chrono::milliseconds(50));
    Outcome late;
    Outcome fresh;
    auto now = PendingTable::Clock::now();
    table.add("old", CommandKind::EXECUTE, late.continuation(), now - std::chrono::milliseconds(1));
    table.add("new", CommandKind::QUERY, fresh.continuation(), now + std::chrono::seconds(60));

    CHECK_EQ(table.sweep(now), static_cast<size_t>(1));
    CHECK_EQ(late.rejected, 1);
    CHECK(late.error->kind == ErrorKind::TIMEOUT);
    CHECK_EQ(late.error->message, std::string("Command execute timed out"));
    CHECK_EQ(fresh.total(), 0);
    CHECK(table.contains("new"));

    // the late reply for a swept entry is dropped
    CHECK(!table.deliver(reply("old", true)));
    CHECK_EQ(late.total(), 1);
}

TEST(sweep_uses_default_timeout) {
    PendingTable table(std::chrono::milliseconds(100));
    Outcome o;
    table.add("t", CommandKind::RESET, o.continuation());
    auto now = PendingTable::Clock::now();
    CHECK_EQ(table.sweep(now), static_cast<size_t>(0));
    CHECK_EQ(table.sweep(now + std::chrono::milliseconds(200)), static_cast<size_t>(1));
    CHECK_EQ(o.error->message, std::string("Command reset timed out"));
}

TEST(sweep_on_empty_table) {
    PendingTable table;
    CHECK_EQ(table.sweep(), static_cast<size_t>(0));
    CHECK(table.empty());
}

TEST(reject_all_clears_table) {
    PendingTable table;
    Outcome o1, o2, o3;
    table.add("1", CommandKind::EXECUTE, o1.continuation());
    table.add("2", CommandKind::QUERY, o2.continuation());
    table.add("3", CommandKind::HARDWARE, o3.continuation());

    CHECK_EQ(table.reject_all(ErrorKind::INTERRUPTED, "Interrupted"), static_cast<size_t>(3));
    CHECK(table.empty());
    CHECK(o1.error->kind == ErrorKind::INTERRUPTED);
    CHECK_EQ(o2.error->message, std::string("Interrupted"));
    CHECK_EQ(o1.total() + o2.total() + o3.total(), 3);
}

TEST(continuation_may_issue_new_command) {
    PendingTable table;
    Outcome follow;
    int chained = 0;
    Continuation first;
    first.resolve = [&](const Response&) {
        chained++;
        table.add("second", CommandKind::QUERY, follow.continuation());
    };
    table.add("first", CommandKind::EXECUTE, first);
    CHECK(table.deliver(reply("first", true)));
    CHECK_EQ(chained, 1);
    CHECK(table.contains("second"));
    CHECK(!table.contains("first"));
}

TEST(reject_all_during_rejection_is_safe) {
    PendingTable table;
    Outcome late;
    Continuation reissue;
    reissue.reject = [&](const CommandError&) {
        table.add("after", CommandKind::QUERY, late.continuation());
    };
    table.add("x", CommandKind::EXECUTE, reissue);
    CHECK_EQ(table.reject_all(ErrorKind::PROTOCOL, "Worker exited"), static_cast<size_t>(1));
    CHECK(table.contains("after"));
    CHECK_EQ(late.total(), 0);
}

TEST(every_command_settles_exactly_once) {
    PendingTable table(std::chrono::milliseconds(10));
    std::vector<std::unique_ptr<Outcome>> outcomes;
    auto now = PendingTable::Clock::now();
    for (int i = 0; i < 40; ++i) {
        outcomes.push_back(std::make_unique<Outcome>());
        auto deadline = (i % 4 == 0) ? now - std::chrono::milliseconds(1) : now + std::chrono::seconds(60);
        table.add(std::to_string(i), CommandKind::EXECUTE, outcomes.back()->continuation(), deadline);
    }
    for (int i = 1; i < 40; i += 4) table.deliver(reply(std::to_string(i), true));
    for (int i = 2; i < 40; i += 4) table.deliver(reply(std::to_string(i), false, "boom"));
    table.sweep(now);
    table.reject_all(ErrorKind::INTERRUPTED, "Interrupted");
    // stragglers after everything settled
    for (int i = 0; i < 40; ++i) table.deliver(reply(std::to_string(i), true));

    for (const auto& o : outcomes) CHECK_EQ(o->total(), 1);
    CHECK(table.empty());
}

TEST(error_kind_names) {
    CHECK_EQ(std::string(error_kind_to_string(ErrorKind::TIMEOUT)), std::string("TimeoutError"));
    CHECK_EQ(std::string(error_kind_to_string(ErrorKind::INITIALIZATION)), std::string("InitializationError"));
    CHECK_EQ(std::string(error_kind_to_string(ErrorKind::INTERRUPTED)), std::string("InterruptedError"));
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== Correlation Tests ===\n\n";

    RUN_TEST(ids_are_uuid_v4_shaped);
    RUN_TEST(ten_thousand_ids_are_distinct);
    RUN_TEST(seeded_generators_are_reproducible);

    RUN_TEST(deliver_success_resolves_once);
    RUN_TEST(deliver_failure_rejects_with_execution_error);
    RUN_TEST(unmatched_reply_is_noop);
    RUN_TEST(duplicate_id_is_refused);
    RUN_TEST(sweep_rejects_expired_with_timeout);
    RUN_TEST(sweep_uses_default_timeout);
    RUN_TEST(sweep_on_empty_table);
    RUN_TEST(reject_all_clears_table);
    RUN_TEST(continuation_may_issue_new_command);
    RUN_TEST(reject_all_during_rejection_is_safe);
    RUN_TEST(every_command_settles_exactly_once);
    RUN_TEST(error_kind_names);

    return test_summary();
}
