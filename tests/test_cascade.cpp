#include <cassert>
#include <algorithm>
#include <print>
#include <random>
#include <stdexcept>
#include <vector>
#include "core/batch_game.h"
#include "engine/cascade.h"
#include "test_helpers.h"

static bool no_revealed_hazard(const BatchGame& g) {
    for (size_t i = 0; i < g.hazards().size(); ++i)
        if (g.hazards().data()[i] && g.revealed().data()[i]) return false;
    return true;
}

void test_opens_whole_region() {
    std::println("[TEST] Zero region plus its numbered ring...");
    BatchGame g = fixture({{".....", ".....", ".....", ".....", "....*"}});
    ZeroCascade cascade(g);
    CascadeReport rep = cascade.open_from({{0, 0, 0}});
    assert(count_slot(rep.opened, 0) == 24);
    assert(g.revealed().at(0, 3, 3) == 1);     // numbered border
    assert(g.revealed().at(0, 4, 4) == 0);
    assert(g.won()[0] == 1 && g.active()[0] == 0);
    std::println(" -> Layers: {}", rep.layers);
    std::println(" -> PASS");
}

void test_stops_at_numbers() {
    std::println("[TEST] Numbered cells are revealed but do not propagate...");
    BatchGame g = fixture({{"..*..", "..*..", "..*.."}});
    ZeroCascade cascade(g);
    cascade.open_from({{0, 1, 0}});
    for (int y = 0; y < 3; ++y) {
        assert(g.revealed().at(0, y, 0) == 1);
        assert(g.revealed().at(0, y, 1) == 1);
        assert(g.revealed().at(0, y, 2) == 0);
        assert(g.revealed().at(0, y, 3) == 0);
        assert(g.revealed().at(0, y, 4) == 0);
    }
    assert(g.active()[0] == 1);
    std::println(" -> PASS");
}

void test_number_start_opens_itself() {
    std::println("[TEST] Nonzero start opens one cell...");
    BatchGame g = fixture({{".....", ".....", ".....", ".....", "....*"}});
    ZeroCascade cascade(g);
    CascadeReport rep = cascade.open_from({{0, 3, 3}});
    assert(count_slot(rep.opened, 0) == 1 && g.revealed().at(0, 3, 3) == 1);
    assert(rep.layers == 0);
    std::println(" -> PASS");
}

void test_hazard_start_skipped() {
    std::println("[TEST] Hazard start leaves the slot untouched...");
    BatchGame g = fixture({{"*..", "...", "..."}});
    ZeroCascade cascade(g);
    CascadeReport rep = cascade.open_from({{0, 0, 0}});
    assert(rep.starts.empty());
    assert(count_slot(g.revealed(), 0) == 0 && g.active()[0] == 1);
    std::println(" -> PASS");
}

void test_inactive_slot_untouched() {
    std::println("[TEST] Inactive slots are skipped...");
    BatchGame g = fixture({
        {"*..", "...", "..."},
        {"*..", "...", "..."},
    });
    g.reveal(cells(g, {{1, 0, 0}}));
    assert(g.active()[1] == 0);
    const auto last = g.last_revealed().data();
    ZeroCascade cascade(g);
    cascade.open_from({{0, 2, 2}, {1, 2, 2}});
    assert(g.won()[0] == 1);
    assert(count_slot(g.revealed(), 1) == 0);
    // slot 1 keeps its losing move for diagnostics
    for (int i = 0; i < g.size(); ++i) assert(g.last_revealed().slot_data(1)[i] == last[g.size() + i]);
    std::println(" -> PASS");
}

void test_never_reveals_hazard() {
    std::println("[TEST] Safety over random boards and starts...");
    std::mt19937 rng(31337);
    for (uint64_t seed = 1; seed <= 25; ++seed) {
        BatchGame g(12, 14, 30, 6, seed);
        std::vector<CellRef> starts;
        for (int s = 0; s < g.n(); ++s) {
            std::uniform_int_distribution<int> dy(0, g.rows() - 1), dx(0, g.cols() - 1);
            starts.push_back({s, dy(rng), dx(rng)});
        }
        ZeroCascade cascade(g);
        cascade.open_from(starts);
        assert(no_revealed_hazard(g));
        for (int s = 0; s < g.n(); ++s) assert(!(g.won()[s] && g.active()[s]));
    }
    std::println(" -> PASS");
}

void test_open_zero_picks_minimum() {
    std::println("[TEST] Default start is a minimal safe cell...");
    for (uint64_t seed = 1; seed <= 10; ++seed) {
        BatchGame g(9, 9, 10, 8, seed);
        ZeroCascade cascade(g);
        CascadeReport rep = cascade.open_zero();
        assert(static_cast<int>(rep.starts.size()) == g.n());
        for (const auto& st : rep.starts) {
            int best = 100;
            for (int i = 0; i < g.size(); ++i)
                if (!g.hazards().slot_data(st.slot)[i]) best = std::min<int>(best, g.numbers().slot_data(st.slot)[i]);
            assert(g.numbers().at(st.slot, st.y, st.x) == best);
            assert(g.revealed().at(st.slot, st.y, st.x) == 1);
        }
        assert(no_revealed_hazard(g));
    }
    std::println(" -> PASS");
}

void test_full_board_has_no_start() {
    std::println("[TEST] Fully mined slot is never opened...");
    BatchGame g(3, 3, std::vector<int>{9, 0}, 4);
    ZeroCascade cascade(g);
    CascadeReport rep = cascade.open_zero();
    assert(rep.starts.size() == 1 && rep.starts[0].slot == 1);
    assert(g.won()[1] == 1);
    assert(no_revealed_hazard(g));
    std::println(" -> PASS");
}

void test_termination_64x64() {
    std::println("[TEST] Empty 64x64 board finishes within its diameter...");
    BatchGame g(64, 64, 0, 2, 8);
    ZeroCascade cascade(g);
    CascadeReport rep = cascade.open_from({{0, 0, 0}, {1, 31, 40}});
    std::println(" -> Layers: {}", rep.layers);
    assert(rep.layers <= 64);
    assert(g.won()[0] == 1 && g.won()[1] == 1);
    std::println(" -> PASS");
}

void test_batch_matches_single() {
    std::println("[TEST] Batched cascade equals per-slot cascades...");
    BatchGame g(16, 16, 25, 10, 555);
    std::vector<CellRef> starts;
    for (int s = 0; s < g.n(); ++s) starts.push_back({s, (s * 5) % 16, (s * 7) % 16});

    std::vector<BatchGame> singles;
    for (int s = 0; s < g.n(); ++s) singles.push_back(g.select(s));

    ZeroCascade(g).open_from(starts);
    for (int s = 0; s < g.n(); ++s) {
        ZeroCascade(singles[s]).open_from({{0, starts[s].y, starts[s].x}});
        for (int i = 0; i < g.size(); ++i)
            assert(singles[s].revealed().slot_data(0)[i] == g.revealed().slot_data(s)[i]);
        assert(singles[s].won()[0] == g.won()[s]);
    }
    std::println(" -> PASS");
}

void test_last_revealed_tracks_cascade() {
    std::println("[TEST] Cascade is recorded as the last reveal...");
    BatchGame g = fixture({{"..*..", "..*..", "..*.."}});
    g.mark(cells(g, {{0, 0, 2}}));
    ZeroCascade cascade(g);
    CascadeReport rep = cascade.open_from({{0, 0, 4}});
    assert(g.last_revealed().data() == rep.opened.data());
    assert(count_slot(g.last_marked(), 0) == 0);
    assert(g.marked().at(0, 0, 2) == 1);
    std::println(" -> PASS");
}

void test_bad_start_throws() {
    std::println("[TEST] Out-of-board starts are rejected...");
    BatchGame g(4, 4, 2, 2, 1);
    ZeroCascade cascade(g);
    bool threw = false;
    try { cascade.open_from({{0, 4, 0}}); } catch (const std::out_of_range&) { threw = true; }
    assert(threw);
    threw = false;
    try { cascade.open_from({{2, 0, 0}}); } catch (const std::out_of_range&) { threw = true; }
    assert(threw);
    std::println(" -> PASS");
}

int main() {
    test_opens_whole_region();
    test_stops_at_numbers();
    test_number_start_opens_itself();
    test_hazard_start_skipped();
    test_inactive_slot_untouched();
    test_never_reveals_hazard();
    test_open_zero_picks_minimum();
    test_full_board_has_no_start();
    test_termination_64x64();
    test_batch_matches_single();
    test_last_revealed_tracks_cascade();
    test_bad_start_throws();
    std::println("All cascade tests passed.");
    return 0;
}
