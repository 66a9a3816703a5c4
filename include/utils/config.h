#pragma once
#include <cstdint>
#include <string>

namespace ConfigSim {
    // Board (expert layout by default)
    inline int ROWS = 16;
    inline int COLS = 30;
    inline int HAZARDS = 99;

    // Batch & Episodes
    inline int BATCH_SIZE = 256;
    inline int EPISODES = 8;
    inline int THREADS = 0;            // 0: hardware_concurrency
    inline uint64_t SEED = 0;          // 0: seed from random_device
    inline bool OPEN_ZERO = true;      // seed every episode with a cascade opening

    // Baseline policy
    inline int MAX_STEPS = 100000;     // hard stop per episode
    inline int PROGRESS_PRINT_INTERVAL = 50;

    // Run log
    inline bool DB_ENABLED = true;
    inline std::string DB_PATH = "db/minebatch_runs.db";
    inline constexpr int DB_FLUSH_RECORDS = 64;
}
