#include "engine/runner.h"
#include "engine/cascade.h"
#include "utils/globals.h"
#include <random>

BatchRunner::BatchRunner(BatchGame& game, bool open_zero, int max_steps)
    : game(game), open_zero(open_zero), max_steps(max_steps) {}

EpisodeResult BatchRunner::run_episode() {
    EpisodeResult result{};
    if (open_zero) {
        ZeroCascade cascade(game);
        result.cascade_layers = cascade.open_zero().layers;
    }
    while (game.active_count() > 0 && result.steps < max_steps && !g_terminate_all) {
        step();
        ++result.steps;
    }
    result.summary = summarize(game);
    return result;
}

int BatchRunner::step() {
    Mask to_reveal(game.n(), game.rows(), game.cols(), 0);
    Mask to_mark(game.n(), game.rows(), game.cols(), 0);
    int deduced = 0;
    for (int s : game.active_slots()) {
        if (plan_slot(s, to_reveal, to_mark)) ++deduced;
    }
    game.move(to_reveal, to_mark);
    return deduced;
}

bool BatchRunner::plan_slot(int s, Mask& to_reveal, Mask& to_mark) {
    const auto& rev = game.revealed();
    const auto& mrk = game.marked();
    const auto& num = game.numbers();
    const int rows = game.rows(), cols = game.cols();
    bool found = false;

    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            if (!rev.at(s, y, x)) continue;
            const int v = num.at(s, y, x);
            if (v <= 0) continue;

            int hidden = 0, marked = 0;
            for (int k = 0; k < NEIGHBOR_COUNT; ++k) {
                const int ny = y + NEIGHBOR_DY[k], nx = x + NEIGHBOR_DX[k];
                if (!rev.in_bounds(ny, nx) || rev.at(s, ny, nx)) continue;
                if (mrk.at(s, ny, nx)) ++marked;
                else ++hidden;
            }
            if (hidden == 0) continue;

            // marked == v: rest is safe. marked + hidden == v: rest are hazards.
            Mask* target = nullptr;
            if (marked == v) target = &to_reveal;
            else if (marked + hidden == v) target = &to_mark;
            if (!target) continue;

            for (int k = 0; k < NEIGHBOR_COUNT; ++k) {
                const int ny = y + NEIGHBOR_DY[k], nx = x + NEIGHBOR_DX[k];
                if (!rev.in_bounds(ny, nx) || rev.at(s, ny, nx) || mrk.at(s, ny, nx)) continue;
                target->at(s, ny, nx) = 1;
            }
            found = true;
        }
    }
    if (found) return true;

    // Guess
    std::vector<int> hidden_cells;
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            if (!rev.at(s, y, x) && !mrk.at(s, y, x)) hidden_cells.push_back(y * cols + x);
        }
    }
    if (hidden_cells.empty()) return false;
    std::uniform_int_distribution<size_t> pick(0, hidden_cells.size() - 1);
    const int idx = hidden_cells[pick(game.generator().engine())];
    to_reveal.at(s, idx / cols, idx % cols) = 1;
    return false;
}
