#include "utils/globals.h"
#include <print>

// --- Global State Definitions ---

std::mutex console_mtx;
std::mutex db_mtx;

std::atomic<bool> g_terminate_all{false};
std::string g_run_log_table = "episode_logs_default";
const std::string SIM_VERSION = "1.2";

void print_slot(const CountGrid& grid, int slot) {
    const std::string s = serialize_slot(grid, slot);
    std::println("---- slot {} ({}x{}) ----", slot, grid.rows(), grid.cols());
    for (int y = 0; y < grid.rows(); ++y) {
        for (int x = 0; x < grid.cols(); ++x) std::print("{} ", s[y * grid.cols() + x]);
        std::println("");
    }
}
