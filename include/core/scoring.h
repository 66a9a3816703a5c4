#pragma once
#include <cstdint>
#include <vector>
#include "core/board.h"
#include "core/batch_game.h"

// Player-visible status codes (game_state).
constexpr int8_t STATUS_HIDDEN = 9;
constexpr int8_t STATUS_MARKED = 10;

/**
 * @brief Export encoding (as_dataset), one int8 per cell:
 *   -1     hazard, not marked
 *   0..8   revealed safe cell, value = neighbouring hazards
 *   9      hidden safe cell
 *   10     marked hazard
 * Marks only ever land on hazards and reveals only on safe cells, so these
 * four cases cover every reachable cell.
 */
constexpr int8_t EXPORT_HAZARD = -1;
constexpr int8_t EXPORT_HIDDEN = 9;
constexpr int8_t EXPORT_MARKED = 10;

struct BatchSummary {
    int n;
    int active;
    int completed;
    int won;
    double win_rate;        // NaN if completed == 0
    double mean_progress;   // NaN if n == 0
};

enum class Highlight : uint8_t { None = 0, Losing = 1, LastMoves = 2, Custom = 3 };

// Snapshot of one slot for an external renderer. overlay/highlight are opaque here.
struct RenderView {
    int rows;
    int cols;
    std::vector<int8_t> state;
    std::vector<double> overlay;
    std::vector<int8_t> highlight;
};

// 0..8 revealed, STATUS_HIDDEN, STATUS_MARKED.
CountGrid game_state(const BatchGame& game, bool active_only = false);
CountGrid as_dataset(const BatchGame& game);

// Fraction of safe cells revealed; 1.0 for a slot without safe cells.
std::vector<double> scores(const BatchGame& game, bool final_only = false);

int completed_count(const BatchGame& game);
int won_count(const BatchGame& game);
// Wins over completed slots. NaN when nothing has completed; check completed_count() first.
double win_rate(const BatchGame& game);

// Cells that made the last move wrong.
Mask fatal_cells(const BatchGame& game);
// +1 wrong mark, -1 wrong reveal.
CountGrid losing_moves(const BatchGame& game);
// +1 last marked, -1 last revealed.
CountGrid last_moves(const BatchGame& game);

BatchSummary summarize(const BatchGame& game);

RenderView make_render_view(const BatchGame& game, int slot, bool full_grid = false,
                            Highlight mode = Highlight::None,
                            const std::vector<double>* overlay = nullptr,
                            const std::vector<int8_t>* custom_highlight = nullptr);
