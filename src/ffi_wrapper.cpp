#include "ffi_api.h"
#include "core/batch_game.h"
#include "core/scoring.h"
#include "engine/cascade.h"
#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Per calling thread, like errno.
static thread_local std::string last_error;

static BatchGame* as_game(void* handle) {
    if (!handle) throw std::invalid_argument("null game handle");
    return static_cast<BatchGame*>(handle);
}

static Mask mask_from(const uint8_t* data, int n, int rows, int cols) {
    if (!data) return Mask{};
    Mask m(n, rows, cols, 0);
    std::memcpy(m.data().data(), data, m.size());
    return m;
}

template <typename T>
static void copy_out(const BatchGrid<T>& grid, T* out) {
    std::memcpy(out, grid.data().data(), grid.size() * sizeof(T));
}

// Exceptions never cross the C boundary: -1 / nullptr plus ms_last_error().
template <typename F>
static int guarded(F&& f) {
    try {
        return f();
    } catch (const std::exception& e) {
        last_error = e.what();
        return -1;
    }
}

extern "C" {
    // hazards: n per-slot counts. seed == 0 seeds from random_device.
    MB_EXPORT void* ms_create(int rows, int cols, const int* hazards, int n, uint64_t seed) {
        try {
            if (n < 0) {
                last_error = "batch size must be >= 0";
                return nullptr;
            }
            if (!hazards && n > 0) {
                last_error = "hazard counts missing";
                return nullptr;
            }
            std::vector<int> counts(hazards, hazards + n);
            std::optional<uint64_t> s;
            if (seed != 0) s = seed;
            return new BatchGame(rows, cols, counts, s);
        } catch (const std::exception& e) {
            last_error = e.what();
            return nullptr;
        }
    }

    // Null is a no-op.
    MB_EXPORT void ms_destroy(void* handle) {
        delete static_cast<BatchGame*>(handle);
    }

    MB_EXPORT const char* ms_last_error() {
        return last_error.c_str();
    }

    MB_EXPORT int ms_batch_size(void* handle) {
        return guarded([&] { return as_game(handle)->n(); });
    }

    MB_EXPORT int ms_active_count(void* handle) {
        return guarded([&] { return as_game(handle)->active_count(); });
    }

    // redraw != 0 draws new boards with the same counts.
    MB_EXPORT int ms_reset(void* handle, int redraw) {
        return guarded([&] { as_game(handle)->reset(redraw != 0); return 0; });
    }

    /**
     * reveal / mark: full-batch (n, rows, cols) uint8 masks, or null for none.
     * out_accepted receives one flag per slot that was active before the call.
     * Returns how many flags were written.
     */
    MB_EXPORT int ms_move(void* handle, const uint8_t* reveal, const uint8_t* mark, uint8_t* out_accepted) {
        return guarded([&] {
            BatchGame& g = *as_game(handle);
            auto result = g.move(mask_from(reveal, g.n(), g.rows(), g.cols()),
                                 mask_from(mark, g.n(), g.rows(), g.cols()));
            if (out_accepted && !result.empty()) std::memcpy(out_accepted, result.data(), result.size());
            return static_cast<int>(result.size());
        });
    }

    // out_opened: optional (n, rows, cols) mask of the cells the cascade revealed.
    MB_EXPORT int ms_open_zero(void* handle, uint8_t* out_opened) {
        return guarded([&] {
            ZeroCascade cascade(*as_game(handle));
            CascadeReport report = cascade.open_zero();
            if (out_opened) copy_out(report.opened, out_opened);
            return report.layers;
        });
    }

    MB_EXPORT int ms_game_state(void* handle, int8_t* out) {
        return guarded([&] { copy_out(game_state(*as_game(handle)), out); return 0; });
    }

    MB_EXPORT int ms_as_dataset(void* handle, int8_t* out) {
        return guarded([&] { copy_out(as_dataset(*as_game(handle)), out); return 0; });
    }

    MB_EXPORT int ms_numbers(void* handle, int8_t* out) {
        return guarded([&] { copy_out(as_game(handle)->numbers(), out); return 0; });
    }

    MB_EXPORT int ms_fatal_cells(void* handle, uint8_t* out) {
        return guarded([&] { copy_out(fatal_cells(*as_game(handle)), out); return 0; });
    }

    MB_EXPORT int ms_flags(void* handle, uint8_t* out_active, uint8_t* out_won) {
        return guarded([&] {
            BatchGame& g = *as_game(handle);
            if (out_active && g.n() > 0) std::memcpy(out_active, g.active().data(), g.n());
            if (out_won && g.n() > 0) std::memcpy(out_won, g.won().data(), g.n());
            return 0;
        });
    }

    MB_EXPORT int ms_scores(void* handle, double* out) {
        return guarded([&] {
            auto s = scores(*as_game(handle));
            if (!s.empty()) std::memcpy(out, s.data(), s.size() * sizeof(double));
            return static_cast<int>(s.size());
        });
    }

    // NaN when no slot has finished yet, or on a null handle.
    MB_EXPORT double ms_win_rate(void* handle) {
        try {
            return win_rate(*as_game(handle));
        } catch (const std::exception& e) {
            last_error = e.what();
            return std::numeric_limits<double>::quiet_NaN();
        }
    }
}
