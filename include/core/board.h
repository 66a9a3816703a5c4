#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Sentinel stored in the neighbour-count grid on hazard cells.
constexpr int8_t HAZARD_SENTINEL = -1;

// One cell of one slot in a batch.
struct CellRef { int slot; int y; int x; };

/**
 * @brief 8-way neighbour offsets, row-major around the centre cell.
 */
constexpr int NEIGHBOR_COUNT = 8;
constexpr std::array<int, NEIGHBOR_COUNT> NEIGHBOR_DY = {-1, -1, -1,  0,  0,  1, 1, 1};
constexpr std::array<int, NEIGHBOR_COUNT> NEIGHBOR_DX = {-1,  0,  1, -1,  1, -1, 0, 1};

/**
 * @brief Dense (n, rows, cols) array. Slot-major, then row-major.
 * Every slot of a batch shares the same board dimensions.
 */
template <typename T>
class BatchGrid {
public:
    BatchGrid() = default;
    BatchGrid(int n, int rows, int cols, T fill = T{})
        : n_(n), rows_(rows), cols_(cols),
          cells_(static_cast<size_t>(n) * rows * cols, fill) {}

    int n() const { return n_; }
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int cells_per_slot() const { return rows_ * cols_; }
    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    bool in_bounds(int y, int x) const { return y >= 0 && y < rows_ && x >= 0 && x < cols_; }

    T& at(int s, int y, int x) { return cells_[index(s, y, x)]; }
    const T& at(int s, int y, int x) const { return cells_[index(s, y, x)]; }

    T* slot_data(int s) { return cells_.data() + static_cast<size_t>(s) * cells_per_slot(); }
    const T* slot_data(int s) const { return cells_.data() + static_cast<size_t>(s) * cells_per_slot(); }

    std::vector<T>& data() { return cells_; }
    const std::vector<T>& data() const { return cells_; }

    void fill(T v) { std::fill(cells_.begin(), cells_.end(), v); }
    void fill_slot(int s, T v) { std::fill(slot_data(s), slot_data(s) + cells_per_slot(), v); }

    void copy_slot_from(int dst, const BatchGrid& src, int src_slot) {
        std::copy(src.slot_data(src_slot), src.slot_data(src_slot) + cells_per_slot(), slot_data(dst));
    }

    template <typename U>
    bool same_board(const BatchGrid<U>& other) const {
        return rows_ == other.rows() && cols_ == other.cols();
    }

    // Deep copy of the listed slots, in the listed order.
    BatchGrid select(const std::vector<int>& slots) const {
        BatchGrid out(static_cast<int>(slots.size()), rows_, cols_);
        for (size_t i = 0; i < slots.size(); ++i) out.copy_slot_from(static_cast<int>(i), *this, slots[i]);
        return out;
    }

private:
    int n_ = 0;
    int rows_ = 0;
    int cols_ = 0;
    std::vector<T> cells_;

    size_t index(int s, int y, int x) const {
        return (static_cast<size_t>(s) * rows_ + y) * cols_ + x;
    }
};

// uint8_t instead of bool so slots can be handed out as contiguous spans.
using Mask = BatchGrid<uint8_t>;
using CountGrid = BatchGrid<int8_t>;

// Neighbour-hazard counts with HAZARD_SENTINEL on hazard cells.
CountGrid compute_neighbor_counts(const Mask& hazards);

int count_slot(const Mask& m, int slot);

std::string serialize_slot(const CountGrid& grid, int slot);
