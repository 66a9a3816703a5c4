#ifndef MINEBATCH_CASCADE_H
#define MINEBATCH_CASCADE_H

#include <vector>
#include "core/board.h"
#include "core/batch_game.h"

struct CascadeReport {
    Mask opened;                    // cells revealed by this call, per slot
    std::vector<CellRef> starts;    // start cells actually used
    int layers;                     // frontier layers expanded
};

/**
 * @brief Batched flood-open of zero regions.
 *
 * All slots advance together, one frontier layer at a time. A newly revealed
 * zero joins the next layer; numbered cells are revealed but stop the flood.
 * Hazards are never revealed. Inactive slots are left untouched.
 */
class ZeroCascade {
public:
    explicit ZeroCascade(BatchGame& game);

    // Starts from the lowest-valued cell of each active slot (random among ties).
    CascadeReport open_zero();
    CascadeReport open_from(const std::vector<CellRef>& starts);

private:
    BatchGame& game;

    std::vector<CellRef> pick_minimal_cells();
    void expand(std::vector<CellRef> frontier, Mask& queued, CascadeReport& report);
};

#endif
