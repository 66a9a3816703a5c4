#include "core/scoring.h"
#include <algorithm>
#include <format>
#include <limits>
#include <numeric>
#include <stdexcept>

CountGrid game_state(const BatchGame& game, bool active_only) {
    const auto& rev = game.revealed();
    const auto& mrk = game.marked();
    const auto& num = game.numbers();

    std::vector<int> slots;
    for (int s = 0; s < game.n(); ++s) {
        if (!active_only || game.active()[s]) slots.push_back(s);
    }

    CountGrid state(static_cast<int>(slots.size()), game.rows(), game.cols(), 0);
    for (size_t k = 0; k < slots.size(); ++k) {
        const int s = slots[k];
        for (int y = 0; y < game.rows(); ++y) {
            for (int x = 0; x < game.cols(); ++x) {
                int8_t v = STATUS_HIDDEN;
                if (rev.at(s, y, x)) v = num.at(s, y, x);
                else if (mrk.at(s, y, x)) v = STATUS_MARKED;
                state.at(static_cast<int>(k), y, x) = v;
            }
        }
    }
    return state;
}

CountGrid as_dataset(const BatchGame& game) {
    const auto& hz = game.hazards().data();
    const auto& rev = game.revealed().data();
    const auto& mrk = game.marked().data();
    const auto& num = game.numbers().data();

    CountGrid out(game.n(), game.rows(), game.cols(), 0);
    auto& dst = out.data();
    for (size_t i = 0; i < dst.size(); ++i) {
        if (hz[i]) dst[i] = mrk[i] ? EXPORT_MARKED : EXPORT_HAZARD;
        else dst[i] = rev[i] ? num[i] : EXPORT_HIDDEN;
    }
    return out;
}

std::vector<double> scores(const BatchGame& game, bool final_only) {
    std::vector<double> out;
    for (int s = 0; s < game.n(); ++s) {
        if (final_only && game.active()[s]) continue;
        const int to_open = game.size() - game.hazard_counts()[s];
        if (to_open == 0) {
            out.push_back(1.0);
            continue;
        }
        out.push_back(static_cast<double>(count_slot(game.revealed(), s)) / to_open);
    }
    return out;
}

int completed_count(const BatchGame& game) {
    return game.n() - game.active_count();
}

int won_count(const BatchGame& game) {
    const auto& won = game.won();
    return static_cast<int>(std::count(won.begin(), won.end(), uint8_t{1}));
}

double win_rate(const BatchGame& game) {
    const int completed = completed_count(game);
    if (completed == 0) return std::numeric_limits<double>::quiet_NaN();
    return static_cast<double>(won_count(game)) / completed;
}

Mask fatal_cells(const BatchGame& game) {
    const auto& hz = game.hazards().data();
    const auto& lr = game.last_revealed().data();
    const auto& lm = game.last_marked().data();
    Mask out(game.n(), game.rows(), game.cols(), 0);
    auto& dst = out.data();
    for (size_t i = 0; i < dst.size(); ++i) {
        dst[i] = ((lm[i] && !hz[i]) || (lr[i] && hz[i])) ? 1 : 0;
    }
    return out;
}

CountGrid losing_moves(const BatchGame& game) {
    const auto& hz = game.hazards().data();
    const auto& lr = game.last_revealed().data();
    const auto& lm = game.last_marked().data();
    CountGrid out(game.n(), game.rows(), game.cols(), 0);
    auto& dst = out.data();
    for (size_t i = 0; i < dst.size(); ++i) {
        dst[i] = static_cast<int8_t>((lm[i] && !hz[i] ? 1 : 0) - (lr[i] && hz[i] ? 1 : 0));
    }
    return out;
}

CountGrid last_moves(const BatchGame& game) {
    const auto& lr = game.last_revealed().data();
    const auto& lm = game.last_marked().data();
    CountGrid out(game.n(), game.rows(), game.cols(), 0);
    auto& dst = out.data();
    for (size_t i = 0; i < dst.size(); ++i) {
        dst[i] = static_cast<int8_t>((lm[i] ? 1 : 0) - (lr[i] ? 1 : 0));
    }
    return out;
}

BatchSummary summarize(const BatchGame& game) {
    BatchSummary sum{};
    sum.n = game.n();
    sum.active = game.active_count();
    sum.completed = completed_count(game);
    sum.won = won_count(game);
    sum.win_rate = win_rate(game);
    const auto progress = scores(game);
    sum.mean_progress = progress.empty()
        ? std::numeric_limits<double>::quiet_NaN()
        : std::accumulate(progress.begin(), progress.end(), 0.0) / progress.size();
    return sum;
}

RenderView make_render_view(const BatchGame& game, int slot, bool full_grid, Highlight mode,
                            const std::vector<double>* overlay,
                            const std::vector<int8_t>* custom_highlight) {
    if (slot < 0 || slot >= game.n()) {
        throw std::out_of_range(std::format("slot {} is outside a batch of {}", slot, game.n()));
    }
    const size_t cells = static_cast<size_t>(game.size());
    RenderView view{game.rows(), game.cols(), {}, {}, {}};

    const CountGrid state = full_grid ? game.numbers() : game_state(game);
    view.state.assign(state.slot_data(slot), state.slot_data(slot) + cells);

    if (overlay) {
        if (overlay->size() != cells) {
            throw std::invalid_argument(std::format("overlay has {} cells, board has {}", overlay->size(), cells));
        }
        view.overlay = *overlay;
    }

    switch (mode) {
        case Highlight::None:
            break;
        case Highlight::Losing: {
            const CountGrid h = losing_moves(game);
            view.highlight.assign(h.slot_data(slot), h.slot_data(slot) + cells);
            break;
        }
        case Highlight::LastMoves: {
            const CountGrid h = last_moves(game);
            view.highlight.assign(h.slot_data(slot), h.slot_data(slot) + cells);
            break;
        }
        case Highlight::Custom:
            if (!custom_highlight || custom_highlight->size() != cells) {
                throw std::invalid_argument("custom highlight must cover every cell of the board");
            }
            view.highlight = *custom_highlight;
            break;
    }
    return view;
}
