#pragma once
#include <vector>
#include "core/batch_game.h"
#include "core/scoring.h"

struct EpisodeResult {
    BatchSummary summary;
    int steps;
    int cascade_layers;
};

/**
 * @brief Plays a BatchGame with a baseline policy until every slot is done.
 *
 * Per active slot and step: reveal the hidden neighbours of any number whose
 * marks are already complete, mark the hidden neighbours of any number that
 * needs all of them, otherwise reveal one random hidden cell. The policy only
 * looks at the player-visible state.
 */
class BatchRunner {
public:
    BatchRunner(BatchGame& game, bool open_zero, int max_steps);

    // Plays from the current state. Call game.reset(true) between episodes.
    EpisodeResult run_episode();

    // One batched move for every active slot. Returns the number of slots that deduced something.
    int step();

private:
    BatchGame& game;
    bool open_zero;
    int max_steps;

    bool plan_slot(int slot, Mask& to_reveal, Mask& to_mark);
};
