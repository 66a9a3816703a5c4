#include "core/board.h"
#include <algorithm>

CountGrid compute_neighbor_counts(const Mask& hazards) {
    const int n = hazards.n(), rows = hazards.rows(), cols = hazards.cols();
    CountGrid counts(n, rows, cols, 0);

    // Sum of the 8 shifted copies; shifted-in cells beyond the edge add nothing.
    for (int s = 0; s < n; ++s) {
        for (int k = 0; k < NEIGHBOR_COUNT; ++k) {
            const int dy = NEIGHBOR_DY[k], dx = NEIGHBOR_DX[k];
            const int y0 = std::max(0, -dy), y1 = std::min(rows, rows - dy);
            const int x0 = std::max(0, -dx), x1 = std::min(cols, cols - dx);
            for (int y = y0; y < y1; ++y) {
                for (int x = x0; x < x1; ++x) {
                    counts.at(s, y, x) += hazards.at(s, y + dy, x + dx);
                }
            }
        }
        for (int y = 0; y < rows; ++y) {
            for (int x = 0; x < cols; ++x) {
                if (hazards.at(s, y, x)) counts.at(s, y, x) = HAZARD_SENTINEL;
            }
        }
    }
    return counts;
}

int count_slot(const Mask& m, int slot) {
    const uint8_t* p = m.slot_data(slot);
    return static_cast<int>(std::count_if(p, p + m.cells_per_slot(), [](uint8_t v) { return v != 0; }));
}

std::string serialize_slot(const CountGrid& grid, int slot) {
    std::string s;
    s.reserve(grid.cells_per_slot());
    const int8_t* p = grid.slot_data(slot);
    for (int i = 0; i < grid.cells_per_slot(); ++i) {
        // -1 -> '*', 0..8 -> digit, 9 -> '.', 10 -> 'F'
        int v = p[i];
        if (v < 0) s += '*';
        else if (v <= 8) s += static_cast<char>('0' + v);
        else if (v == 9) s += '.';
        else s += 'F';
    }
    return s;
}
