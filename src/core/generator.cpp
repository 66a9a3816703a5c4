#include "core/generator.h"
#include <algorithm>
#include <climits>
#include <format>
#include <stdexcept>

BoardGenerator::BoardGenerator(std::optional<uint64_t> seed) {
    if (seed) rng.seed(*seed);
    else rng.seed((static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}());
}

Mask BoardGenerator::place_hazards(int n, int rows, int cols, const std::vector<int>& counts) {
    Mask hazards(n, rows, cols, 0);
    const int size = rows * cols;
    for (int s = 0; s < n; ++s) {
        // First counts[s] cells set, then a full shuffle of the slot.
        uint8_t* p = hazards.slot_data(s);
        std::fill(p, p + counts[s], uint8_t{1});
        std::shuffle(p, p + size, rng);
    }
    return hazards;
}

void check_board_size(int rows, int cols) {
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument(std::format("board must be at least 1x1 (got {}x{})", rows, cols));
    }
    if (rows > INT_MAX / cols) {
        throw std::invalid_argument(std::format("board {}x{} has more cells than an int can index", rows, cols));
    }
}

std::vector<int> normalize_hazard_counts(int n, int rows, int cols, int count) {
    return normalize_hazard_counts(n, rows, cols, std::vector<int>(std::max(n, 0), count));
}

std::vector<int> normalize_hazard_counts(int n, int rows, int cols, const std::vector<int>& counts) {
    if (n < 0) throw std::invalid_argument(std::format("batch size must be >= 0 (got {})", n));
    check_board_size(rows, cols);
    if (static_cast<int>(counts.size()) != n) {
        throw std::invalid_argument(std::format("expected {} hazard counts, got {}", n, counts.size()));
    }
    const int size = rows * cols;
    for (size_t s = 0; s < counts.size(); ++s) {
        if (counts[s] < 0 || counts[s] > size) {
            throw std::invalid_argument(std::format(
                "hazard count {} for slot {} is outside [0, {}] on a {}x{} board",
                counts[s], s, size, rows, cols));
        }
    }
    return counts;
}
