#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "core/board.h"
#include "core/generator.h"

class ZeroCascade;

/**
 * @brief n independent boards of identical size, advanced in lockstep.
 *
 * Holds the generated boards (hazards, neighbour counts) and the per-slot
 * episode state. Only move() and ZeroCascade mutate the episode state.
 */
class BatchGame {
public:
    BatchGame(int rows, int cols, int hazards, int n, std::optional<uint64_t> seed = std::nullopt);
    BatchGame(int rows, int cols, const std::vector<int>& hazards, std::optional<uint64_t> seed = std::nullopt);

    // Fixed layout; hazard counts are taken from the mask.
    static BatchGame from_hazards(const Mask& hazards, std::optional<uint64_t> seed = std::nullopt);

    // Clears the episode state. redraw=true also draws new boards with the same counts.
    void reset(bool redraw = false);
    void reset(int n, int hazards);
    void reset(int n, const std::vector<int>& hazards);

    // Independent copy restricted to the listed slots.
    BatchGame select(const std::vector<int>& slots) const;
    BatchGame select(int slot) const;

    /**
     * @brief Validates and applies one move per active slot.
     *
     * Each request holds either n slots (entries of inactive slots are ignored),
     * exactly active_count() slots, or nothing. A reveal touching a hazard or a
     * mark touching a safe cell deactivates the slot without applying anything.
     * @return One flag per slot that was active at call time, in slot order.
     */
    std::vector<uint8_t> move(const Mask& to_reveal, const Mask& to_mark);
    std::vector<uint8_t> reveal(const Mask& to_reveal) { return move(to_reveal, Mask{}); }
    std::vector<uint8_t> mark(const Mask& to_mark) { return move(Mask{}, to_mark); }

    // Start-of-game helpers. Never touch the wrong kind of cell.
    Mask random_open(double rate);
    Mask random_marks(double rate);

    int n() const { return n_; }
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int size() const { return rows_ * cols_; }
    int active_count() const;
    std::vector<int> active_slots() const;

    const std::vector<int>& hazard_counts() const { return hazard_counts_; }
    const Mask& hazards() const { return hazards_; }
    const CountGrid& numbers() const { return numbers_; }
    const Mask& revealed() const { return revealed_; }
    const Mask& marked() const { return marked_; }
    const std::vector<uint8_t>& active() const { return active_; }
    const std::vector<uint8_t>& won() const { return won_; }
    const Mask& last_revealed() const { return last_revealed_; }
    const Mask& last_marked() const { return last_marked_; }

    BoardGenerator& generator() { return gen_; }

private:
    friend class ZeroCascade;

    struct Blank {};
    BatchGame(Blank, int rows, int cols, BoardGenerator gen);

    int n_ = 0;
    int rows_ = 0;
    int cols_ = 0;
    BoardGenerator gen_;

    std::vector<int> hazard_counts_;
    Mask hazards_;
    CountGrid numbers_;

    Mask revealed_;
    Mask marked_;
    std::vector<uint8_t> active_;
    std::vector<uint8_t> won_;
    Mask last_revealed_;
    Mask last_marked_;

    void generate(int n, const std::vector<int>& counts);
    void clear_episode();
    int request_slot(const Mask& request, int slot, int active_rank, int active_total) const;

    // Shared with ZeroCascade.
    bool reveal_cell(int slot, int y, int x);
    void refresh_won();
};
