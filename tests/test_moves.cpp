#include <cassert>
#include <print>
#include <stdexcept>
#include <vector>
#include "core/batch_game.h"
#include "test_helpers.h"

// Two 3x3 slots: hazard in the top-left corner / bottom-right corner.
static BatchGame two_corners() {
    return fixture({
        {"*..", "...", "..."},
        {"...", "...", "..*"},
    });
}

void test_safe_reveal_accepted() {
    std::println("[TEST] Safe reveal is merged...");
    BatchGame g = two_corners();
    auto res = g.reveal(cells(g, {{0, 2, 2}, {1, 0, 0}}));
    assert(res.size() == 2 && res[0] == 1 && res[1] == 1);
    assert(g.revealed().at(0, 2, 2) == 1 && g.revealed().at(1, 0, 0) == 1);
    assert(g.active()[0] == 1 && g.active()[1] == 1);
    std::println(" -> PASS");
}

void test_hazard_reveal_deactivates() {
    std::println("[TEST] Revealing a hazard ends the slot without applying...");
    BatchGame g = two_corners();
    auto res = g.reveal(cells(g, {{0, 0, 0}, {0, 1, 1}, {1, 1, 1}}));
    assert(res[0] == 0 && res[1] == 1);
    assert(g.active()[0] == 0 && g.won()[0] == 0);
    // nothing merged for the losing slot, but the attempt is kept
    assert(count_slot(g.revealed(), 0) == 0);
    assert(g.last_revealed().at(0, 0, 0) == 1 && g.last_revealed().at(0, 1, 1) == 1);
    assert(g.revealed().at(1, 1, 1) == 1);
    std::println(" -> PASS");
}

void test_wrong_mark_is_fatal() {
    std::println("[TEST] Marking a safe cell is a losing move...");
    BatchGame g = two_corners();
    auto res = g.mark(cells(g, {{0, 0, 0}, {1, 0, 0}}));
    assert(res[0] == 1 && res[1] == 0);
    assert(g.marked().at(0, 0, 0) == 1);
    assert(g.active()[1] == 0);
    assert(count_slot(g.marked(), 1) == 0);
    assert(g.last_marked().at(1, 0, 0) == 1);
    std::println(" -> PASS");
}

void test_reveal_and_mark_together() {
    std::println("[TEST] A slot needs both parts right...");
    BatchGame g = two_corners();
    Mask r = cells(g, {{0, 1, 1}, {1, 1, 1}});
    Mask m = cells(g, {{0, 0, 0}, {1, 0, 1}});
    auto res = g.move(r, m);
    assert(res[0] == 1 && res[1] == 0);
    // slot 1's correct reveal is dropped along with its wrong mark
    assert(g.revealed().at(1, 1, 1) == 0);
    std::println(" -> PASS");
}

void test_idempotent_merge() {
    std::println("[TEST] Repeating an applied move changes nothing...");
    BatchGame g = two_corners();
    Mask r = cells(g, {{0, 1, 1}, {1, 0, 0}});
    Mask m = cells(g, {{0, 0, 0}});
    g.move(r, m);
    const auto rev = g.revealed().data();
    const auto mrk = g.marked().data();
    auto res = g.move(r, m);
    assert(res[0] == 1 && res[1] == 1);
    assert(g.revealed().data() == rev);
    assert(g.marked().data() == mrk);
    std::println(" -> PASS");
}

void test_inactive_slots_ignored() {
    std::println("[TEST] Inactive slots are skipped and excluded from the result...");
    BatchGame g = fixture({
        {"*..", "...", "..."},
        {"...", "...", "..*"},
        {".*.", "...", "..."},
    });
    g.reveal(cells(g, {{1, 2, 2}}));        // slot 1 loses
    assert(g.active_count() == 2);
    const auto last1 = g.last_revealed().data();

    // garbage for slot 1 must be ignored
    auto res = g.reveal(cells(g, {{0, 2, 2}, {1, 2, 2}, {2, 2, 2}}));
    assert(res.size() == 2 && res[0] == 1 && res[1] == 1);
    assert(g.revealed().at(1, 2, 2) == 0);
    assert(g.last_revealed().data() != last1);
    assert(g.last_revealed().at(1, 2, 2) == 1);   // left from the losing move

    // active-only request: row k is the k-th active slot
    Mask act(2, 3, 3, 0);
    act.at(0, 1, 1) = 1;
    act.at(1, 0, 0) = 1;
    res = g.reveal(act);
    assert(res.size() == 2 && res[0] == 1 && res[1] == 1);
    assert(g.revealed().at(0, 1, 1) == 1 && g.revealed().at(2, 0, 0) == 1);
    std::println(" -> PASS");
}

void test_empty_move_passthrough() {
    std::println("[TEST] Empty move passes every active slot...");
    BatchGame g = two_corners();
    auto res = g.move(Mask{}, Mask{});
    assert(res.size() == 2 && res[0] == 1 && res[1] == 1);
    assert(g.active_count() == 2);
    std::println(" -> PASS");
}

void test_shape_mismatch_throws() {
    std::println("[TEST] Shape mismatches fail fast...");
    BatchGame g = two_corners();
    bool threw = false;
    try { g.reveal(Mask(2, 3, 4, 0)); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    threw = false;
    try { g.mark(Mask(5, 3, 3, 0)); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    // zero-sized but not default-constructed masks are still shapes
    threw = false;
    try { g.reveal(Mask(2, 3, 0, 0)); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    threw = false;
    try { g.mark(Mask(0, 5, 5, 0)); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    // state untouched by a rejected call
    assert(g.active_count() == 2 && count_slot(g.last_revealed(), 0) == 0);
    std::println(" -> PASS");
}

void test_win_detection() {
    std::println("[TEST] Win exactly when every safe cell is revealed...");
    BatchGame g = two_corners();
    Mask safe = all_safe(g);
    Mask partial = safe;
    partial.at(0, 2, 2) = 0;
    g.reveal(partial);
    assert(g.won()[0] == 0 && g.active()[0] == 1);
    assert(g.won()[1] == 1 && g.active()[1] == 0);
    g.reveal(Mask(1, 3, 3, 0));
    assert(g.won()[0] == 0);
    g.reveal(cells(g, {{0, 2, 2}}));
    assert(g.won()[0] == 1 && g.active()[0] == 0);
    std::println(" -> PASS");
}

void test_monotonic() {
    std::println("[TEST] Revealed / marked never shrink...");
    BatchGame g(8, 8, 10, 16, 77);
    Mask prev_r = g.revealed(), prev_m = g.marked();
    for (int step = 0; step < 10; ++step) {
        g.random_open(0.1);
        g.random_marks(0.2);
        for (size_t i = 0; i < prev_r.size(); ++i) {
            assert(g.revealed().data()[i] >= prev_r.data()[i]);
            assert(g.marked().data()[i] >= prev_m.data()[i]);
        }
        prev_r = g.revealed();
        prev_m = g.marked();
    }
    std::println(" -> PASS");
}

void test_random_helpers_never_lose() {
    std::println("[TEST] random_open / random_marks only touch the right cells...");
    BatchGame g(10, 10, 15, 32, 5);
    Mask opened = g.random_open(0.3);
    Mask flagged = g.random_marks(1.0);
    for (int s = 0; s < g.n(); ++s) {
        assert(g.won()[s] || g.active()[s]);
        for (int i = 0; i < g.size(); ++i) {
            if (opened.slot_data(s)[i]) assert(!g.hazards().slot_data(s)[i]);
            if (flagged.slot_data(s)[i]) assert(g.hazards().slot_data(s)[i]);
        }
    }
    bool threw = false;
    try { g.random_open(1.5); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::println(" -> PASS");
}

void test_select_is_deep_copy() {
    std::println("[TEST] select() copies, never aliases...");
    BatchGame g(6, 6, 5, 4, 11);
    BatchGame one = g.select(2);
    assert(one.n() == 1);
    assert(one.hazard_counts()[0] == g.hazard_counts()[2]);
    for (int i = 0; i < g.size(); ++i) assert(one.hazards().slot_data(0)[i] == g.hazards().slot_data(2)[i]);

    one.reveal(all_safe(one));
    assert(one.won()[0] == 1);
    assert(count_slot(g.revealed(), 2) == 0 && g.active()[2] == 1);

    BatchGame pair = g.select({3, 0});
    assert(pair.n() == 2 && pair.hazard_counts()[0] == g.hazard_counts()[3]);

    bool threw = false;
    try { g.select(4); } catch (const std::out_of_range&) { threw = true; }
    assert(threw);
    std::println(" -> PASS");
}

void test_reset_variants() {
    std::println("[TEST] reset keeps or redraws boards...");
    BatchGame g(8, 8, 10, 3, 21);
    const auto boards = g.hazards().data();
    g.reveal(all_safe(g));
    assert(g.active_count() == 0);

    g.reset();
    assert(g.active_count() == 3 && count_slot(g.revealed(), 0) == 0);
    assert(g.hazards().data() == boards);

    g.reset(true);
    assert(g.hazards().data() != boards);
    for (int s = 0; s < 3; ++s) assert(count_slot(g.hazards(), s) == 10);

    g.reset(5, std::vector<int>{0, 1, 2, 3, 64});
    assert(g.n() == 5 && g.revealed().n() == 5 && g.active().size() == 5);
    assert(g.won()[4] == 1);
    std::println(" -> PASS");
}

int main() {
    test_safe_reveal_accepted();
    test_hazard_reveal_deactivates();
    test_wrong_mark_is_fatal();
    test_reveal_and_mark_together();
    test_idempotent_merge();
    test_inactive_slots_ignored();
    test_empty_move_passthrough();
    test_shape_mismatch_throws();
    test_win_detection();
    test_monotonic();
    test_random_helpers_never_lose();
    test_select_is_deep_copy();
    test_reset_variants();
    std::println("All move tests passed.");
    return 0;
}
