#include "core/batch_game.h"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace {

// Only a default-constructed mask means "nothing requested"; any other shape is checked.
bool no_request(const Mask& request) {
    return request.n() == 0 && request.rows() == 0 && request.cols() == 0;
}

// A request is empty, full-batch (n slots) or active-only (active_total slots).
void check_request(const Mask& request, const char* name, int n, int rows, int cols, int active_total) {
    if (no_request(request)) return;
    if (request.rows() != rows || request.cols() != cols) {
        throw std::invalid_argument(std::format(
            "{} is {}x{} but the board is {}x{}", name, request.rows(), request.cols(), rows, cols));
    }
    if (request.n() != n && request.n() != active_total) {
        throw std::invalid_argument(std::format(
            "{} holds {} slots, expected {} (batch) or {} (active)", name, request.n(), n, active_total));
    }
}

void check_rate(double rate) {
    if (!(rate >= 0.0 && rate <= 1.0)) {
        throw std::invalid_argument(std::format("rate must be within [0, 1] (got {})", rate));
    }
}

}

BatchGame::BatchGame(Blank, int rows, int cols, BoardGenerator gen)
    : rows_(rows), cols_(cols), gen_(std::move(gen)) {}

BatchGame::BatchGame(int rows, int cols, int hazards, int n, std::optional<uint64_t> seed)
    : rows_(rows), cols_(cols), gen_(seed) {
    generate(n, normalize_hazard_counts(n, rows, cols, hazards));
}

BatchGame::BatchGame(int rows, int cols, const std::vector<int>& hazards, std::optional<uint64_t> seed)
    : rows_(rows), cols_(cols), gen_(seed) {
    const int n = static_cast<int>(hazards.size());
    generate(n, normalize_hazard_counts(n, rows, cols, hazards));
}

BatchGame BatchGame::from_hazards(const Mask& hazards, std::optional<uint64_t> seed) {
    check_board_size(hazards.rows(), hazards.cols());
    BatchGame game(Blank{}, hazards.rows(), hazards.cols(), BoardGenerator(seed));
    game.n_ = hazards.n();
    game.hazard_counts_.resize(game.n_);
    for (int s = 0; s < game.n_; ++s) game.hazard_counts_[s] = count_slot(hazards, s);
    game.hazards_ = hazards;
    for (auto& v : game.hazards_.data()) v = v ? 1 : 0;
    game.numbers_ = compute_neighbor_counts(game.hazards_);
    game.clear_episode();
    return game;
}

void BatchGame::generate(int n, const std::vector<int>& counts) {
    n_ = n;
    hazard_counts_ = counts;
    hazards_ = gen_.place_hazards(n_, rows_, cols_, hazard_counts_);
    numbers_ = compute_neighbor_counts(hazards_);
    clear_episode();
}

void BatchGame::clear_episode() {
    revealed_ = Mask(n_, rows_, cols_, 0);
    marked_ = Mask(n_, rows_, cols_, 0);
    last_revealed_ = Mask(n_, rows_, cols_, 0);
    last_marked_ = Mask(n_, rows_, cols_, 0);
    active_.assign(n_, 1);
    won_.assign(n_, 0);
    // A fully mined slot has nothing left to reveal.
    refresh_won();
}

void BatchGame::reset(bool redraw) {
    if (redraw) generate(n_, hazard_counts_);
    else clear_episode();
}

void BatchGame::reset(int n, int hazards) {
    generate(n, normalize_hazard_counts(n, rows_, cols_, hazards));
}

void BatchGame::reset(int n, const std::vector<int>& hazards) {
    generate(n, normalize_hazard_counts(n, rows_, cols_, hazards));
}

BatchGame BatchGame::select(const std::vector<int>& slots) const {
    for (int s : slots) {
        if (s < 0 || s >= n_) {
            throw std::out_of_range(std::format("slot {} is outside a batch of {}", s, n_));
        }
    }
    BatchGame out(Blank{}, rows_, cols_, gen_);
    out.n_ = static_cast<int>(slots.size());
    for (int s : slots) {
        out.hazard_counts_.push_back(hazard_counts_[s]);
        out.active_.push_back(active_[s]);
        out.won_.push_back(won_[s]);
    }
    out.hazards_ = hazards_.select(slots);
    out.numbers_ = numbers_.select(slots);
    out.revealed_ = revealed_.select(slots);
    out.marked_ = marked_.select(slots);
    out.last_revealed_ = last_revealed_.select(slots);
    out.last_marked_ = last_marked_.select(slots);
    return out;
}

BatchGame BatchGame::select(int slot) const {
    return select(std::vector<int>{slot});
}

int BatchGame::active_count() const {
    return static_cast<int>(std::count(active_.begin(), active_.end(), uint8_t{1}));
}

std::vector<int> BatchGame::active_slots() const {
    std::vector<int> slots;
    for (int s = 0; s < n_; ++s) if (active_[s]) slots.push_back(s);
    return slots;
}

int BatchGame::request_slot(const Mask& request, int slot, int active_rank, int active_total) const {
    if (no_request(request)) return -1;
    // Full-batch wins when both readings are possible; they coincide then anyway.
    if (request.n() == n_) return slot;
    return active_rank < active_total ? active_rank : -1;
}

std::vector<uint8_t> BatchGame::move(const Mask& to_reveal, const Mask& to_mark) {
    const std::vector<int> slots = active_slots();
    const int active_total = static_cast<int>(slots.size());
    check_request(to_reveal, "to_reveal", n_, rows_, cols_, active_total);
    check_request(to_mark, "to_mark", n_, rows_, cols_, active_total);

    const int cells = size();
    std::vector<uint8_t> result(slots.size(), 0);

    for (int k = 0; k < active_total; ++k) {
        const int s = slots[k];
        const int ri = request_slot(to_reveal, s, k, active_total);
        const int mi = request_slot(to_mark, s, k, active_total);

        // Kept even if the move turns out wrong.
        uint8_t* last_r = last_revealed_.slot_data(s);
        uint8_t* last_m = last_marked_.slot_data(s);
        const uint8_t* req_r = ri >= 0 ? to_reveal.slot_data(ri) : nullptr;
        const uint8_t* req_m = mi >= 0 ? to_mark.slot_data(mi) : nullptr;
        for (int i = 0; i < cells; ++i) {
            last_r[i] = (req_r && req_r[i]) ? 1 : 0;
            last_m[i] = (req_m && req_m[i]) ? 1 : 0;
        }

        const uint8_t* hz = hazards_.slot_data(s);
        bool correct = true;
        for (int i = 0; i < cells; ++i) {
            if ((last_r[i] && hz[i]) || (last_m[i] && !hz[i])) { correct = false; break; }
        }
        result[k] = correct ? 1 : 0;
        if (!correct) {
            active_[s] = 0;
            continue;
        }

        uint8_t* rev = revealed_.slot_data(s);
        uint8_t* mrk = marked_.slot_data(s);
        for (int i = 0; i < cells; ++i) {
            rev[i] |= last_r[i];
            mrk[i] |= last_m[i];
        }
    }

    refresh_won();
    return result;
}

Mask BatchGame::random_open(double rate) {
    check_rate(rate);
    Mask to_open(n_, rows_, cols_, 0);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    auto& data = to_open.data();
    const auto& hz = hazards_.data();
    for (size_t i = 0; i < data.size(); ++i) {
        // Draw for every cell so the stream does not depend on the layout.
        const bool hit = dist(gen_.engine()) < rate;
        data[i] = (hit && !hz[i]) ? 1 : 0;
    }
    move(to_open, Mask{});
    return to_open;
}

Mask BatchGame::random_marks(double rate) {
    check_rate(rate);
    Mask to_mark(n_, rows_, cols_, 0);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    auto& data = to_mark.data();
    const auto& hz = hazards_.data();
    for (size_t i = 0; i < data.size(); ++i) {
        const bool hit = dist(gen_.engine()) < rate;
        data[i] = (hit && hz[i]) ? 1 : 0;
    }
    move(Mask{}, to_mark);
    return to_mark;
}

bool BatchGame::reveal_cell(int slot, int y, int x) {
    uint8_t& cell = revealed_.at(slot, y, x);
    if (cell) return false;
    cell = 1;
    return true;
}

void BatchGame::refresh_won() {
    const int cells = size();
    for (int s = 0; s < n_; ++s) {
        const uint8_t* rev = revealed_.slot_data(s);
        const uint8_t* hz = hazards_.slot_data(s);
        bool covered = true;
        for (int i = 0; i < cells; ++i) {
            if (!rev[i] && !hz[i]) { covered = false; break; }
        }
        won_[s] = covered ? 1 : 0;
        if (covered) active_[s] = 0;
    }
}
