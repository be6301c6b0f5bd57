#include "test_util.h"

#include "dropway/transfer/chunk_window.h"

#include <set>
#include <stdexcept>

using dropway::transfer::AckTracker;
using dropway::transfer::SendWindow;

static bool test_cursor_never_passes_gap() {
    AckTracker t(6);
    TEST_ASSERT(t.cursor() == 0, "fresh cursor");
    TEST_ASSERT(t.confirm(1), "confirm 1");
    TEST_ASSERT(t.confirm(2), "confirm 2");
    TEST_ASSERT(t.cursor() == 0, "gap at 0 holds the cursor");
    TEST_ASSERT(t.confirm(0), "confirm 0");
    TEST_ASSERT(t.cursor() == 3, "cursor jumps over the filled run");
    TEST_ASSERT(!t.confirm(2), "second confirm reports nothing new");
    TEST_ASSERT(t.cursor() == 3, "duplicate does not move the cursor");
    TEST_ASSERT(t.confirmed_count() == 3, "count");

    t.confirm(5);
    t.confirm(4);
    TEST_ASSERT(t.cursor() == 3, "gap at 3");
    t.confirm(3);
    TEST_ASSERT(t.complete() && t.cursor() == 6, "complete");

    bool threw = false;
    try {
        t.confirm(6);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    TEST_ASSERT(threw, "index past the end throws");

    AckTracker empty(0);
    TEST_ASSERT(empty.complete(), "zero chunks is complete");
    return true;
}

static bool test_window_limit_and_order() {
    SendWindow w(20, 4, 3);
    std::vector<uint32_t> sent;
    while (auto idx = w.next()) sent.push_back(*idx);
    TEST_ASSERT((sent == std::vector<uint32_t>{0, 1, 2, 3}), "first window is 0..3 ascending");
    TEST_ASSERT(w.in_flight() == 4, "four in flight");
    TEST_ASSERT(!w.next(), "window full");

    TEST_ASSERT(w.on_ack(1), "ack in-flight chunk");
    TEST_ASSERT(!w.on_ack(1), "duplicate ack");
    auto n = w.next();
    TEST_ASSERT(n && *n == 4, "slides to 4");
    TEST_ASSERT(w.acked().cursor() == 0, "cursor waits for 0");
    return true;
}

static bool test_resume_never_resends_confirmed() {
    SendWindow w(40, 8, 3);
    std::vector<uint32_t> have;
    for (uint32_t i = 0; i < 20; i++) have.push_back(i);
    have.push_back(25);
    w.mark_confirmed(have);

    std::set<uint32_t> sent;
    while (!w.done()) {
        auto idx = w.next();
        TEST_ASSERT(idx.has_value(), "window produces work until done");
        TEST_ASSERT(sent.insert(*idx).second, "each chunk sent once");
        TEST_ASSERT(*idx >= 20 && *idx != 25, "confirmed chunk " << *idx << " re-sent");
        w.on_ack(*idx);
    }
    TEST_ASSERT(sent.size() == 19, "sent exactly the 19 missing chunks");
    return true;
}

static bool test_reset_in_flight_requeues() {
    SendWindow w(10, 3, 3);
    w.next();
    w.next();
    w.next();
    w.on_ack(0);
    w.reset_in_flight();
    TEST_ASSERT(w.in_flight() == 0, "nothing in flight after reset");

    auto a = w.next();
    auto b = w.next();
    auto c = w.next();
    TEST_ASSERT(a && *a == 1 && b && *b == 2, "lost chunks go first");
    TEST_ASSERT(c && *c == 3, "then fresh chunks");
    return true;
}

static bool test_nack_budget() {
    SendWindow w(4, 4, 2);
    while (w.next()) {
    }
    TEST_ASSERT(w.on_nack(2), "first nack");
    auto idx = w.next();
    TEST_ASSERT(idx && *idx == 2, "nacked chunk retransmitted");
    TEST_ASSERT(w.on_nack(2), "second nack within budget");
    w.next();
    TEST_ASSERT(!w.on_nack(2), "third nack exceeds budget of 2");
    return true;
}

int main() {
    std::cout << "--- Chunk window tests ---" << std::endl;
    RUN_TEST(test_cursor_never_passes_gap(), "ack tracker cursor");
    RUN_TEST(test_window_limit_and_order(), "window limit");
    RUN_TEST(test_resume_never_resends_confirmed(), "resume skips confirmed chunks");
    RUN_TEST(test_reset_in_flight_requeues(), "connection loss requeues in-flight chunks");
    RUN_TEST(test_nack_budget(), "nack budget");
    return finish_tests();
}
