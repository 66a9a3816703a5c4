#include "engine/cascade.h"
#include <climits>
#include <format>
#include <random>
#include <stdexcept>
#include <utility>

// Added to hazard cells before the minimum search so they always lose to 0..8.
static constexpr int HAZARD_BIAS = 10;

ZeroCascade::ZeroCascade(BatchGame& game) : game(game) {}

CascadeReport ZeroCascade::open_zero() {
    return open_from(pick_minimal_cells());
}

std::vector<CellRef> ZeroCascade::pick_minimal_cells() {
    std::vector<CellRef> picks;
    const int cells = game.size();
    std::vector<int> ties;
    ties.reserve(cells);

    for (int s : game.active_slots()) {
        const int8_t* num = game.numbers_.slot_data(s);
        const uint8_t* hz = game.hazards_.slot_data(s);
        int best = INT_MAX;
        ties.clear();
        for (int i = 0; i < cells; ++i) {
            const int v = num[i] + (hz[i] ? HAZARD_BIAS : 0);
            if (v < best) { best = v; ties.clear(); }
            if (v == best) ties.push_back(i);
        }
        // One independent draw per slot among the tied cells.
        std::uniform_int_distribution<size_t> pick(0, ties.size() - 1);
        const int idx = ties[pick(game.gen_.engine())];
        picks.push_back({s, idx / game.cols_, idx % game.cols_});
    }
    return picks;
}

CascadeReport ZeroCascade::open_from(const std::vector<CellRef>& starts) {
    for (const auto& st : starts) {
        if (st.slot < 0 || st.slot >= game.n_) {
            throw std::out_of_range(std::format("cascade start slot {} is outside a batch of {}", st.slot, game.n_));
        }
        if (!game.hazards_.in_bounds(st.y, st.x)) {
            throw std::out_of_range(std::format(
                "cascade start ({}, {}) is outside the {}x{} board", st.y, st.x, game.rows_, game.cols_));
        }
    }

    CascadeReport report{Mask(game.n_, game.rows_, game.cols_, 0), {}, 0};
    Mask queued(game.n_, game.rows_, game.cols_, 0);
    std::vector<uint8_t> touched(game.n_, 0);
    std::vector<CellRef> frontier;

    for (const auto& st : starts) {
        if (!game.active_[st.slot]) continue;
        if (game.hazards_.at(st.slot, st.y, st.x)) continue;
        touched[st.slot] = 1;
        report.starts.push_back(st);
        if (game.reveal_cell(st.slot, st.y, st.x)) report.opened.at(st.slot, st.y, st.x) = 1;
        if (game.numbers_.at(st.slot, st.y, st.x) == 0 && !queued.at(st.slot, st.y, st.x)) {
            queued.at(st.slot, st.y, st.x) = 1;
            frontier.push_back(st);
        }
    }

    expand(std::move(frontier), queued, report);

    // The cascade counts as a reveal-only move for diagnostics.
    for (int s = 0; s < game.n_; ++s) {
        if (!touched[s]) continue;
        game.last_revealed_.copy_slot_from(s, report.opened, s);
        game.last_marked_.fill_slot(s, 0);
    }
    game.refresh_won();
    return report;
}

void ZeroCascade::expand(std::vector<CellRef> frontier, Mask& queued, CascadeReport& report) {
    std::vector<CellRef> next;
    while (!frontier.empty()) {
        ++report.layers;
        next.clear();
        for (const auto& c : frontier) {
            for (int k = 0; k < NEIGHBOR_COUNT; ++k) {
                const int ny = c.y + NEIGHBOR_DY[k];
                const int nx = c.x + NEIGHBOR_DX[k];
                if (!game.hazards_.in_bounds(ny, nx)) continue;
                if (game.hazards_.at(c.slot, ny, nx)) continue;
                if (!game.reveal_cell(c.slot, ny, nx)) continue;
                report.opened.at(c.slot, ny, nx) = 1;
                if (game.numbers_.at(c.slot, ny, nx) == 0 && !queued.at(c.slot, ny, nx)) {
                    queued.at(c.slot, ny, nx) = 1;
                    next.push_back({c.slot, ny, nx});
                }
            }
        }
        frontier.swap(next);
    }
}
