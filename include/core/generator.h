#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <vector>
#include "core/board.h"

/**
 * @brief Owns the random engine used for hazard placement and for the
 * cascade's tie-breaking. Inject a seed for reproducible batches.
 */
class BoardGenerator {
public:
    explicit BoardGenerator(std::optional<uint64_t> seed = std::nullopt);

    // Exactly counts[s] hazards in slot s, uniform without replacement.
    Mask place_hazards(int n, int rows, int cols, const std::vector<int>& counts);

    std::mt19937_64& engine() { return rng; }

private:
    std::mt19937_64 rng;
};

// Throws std::invalid_argument unless 1 <= rows*cols <= INT_MAX.
void check_board_size(int rows, int cols);

// Scalar count -> one entry per slot. Both overloads validate against the board size.
std::vector<int> normalize_hazard_counts(int n, int rows, int cols, int count);
std::vector<int> normalize_hazard_counts(int n, int rows, int cols, const std::vector<int>& counts);
