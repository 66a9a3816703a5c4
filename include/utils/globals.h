#pragma once
#include <mutex>
#include <atomic>
#include <string>
#include "core/board.h"

// Global mutexes
extern std::mutex console_mtx;
extern std::mutex db_mtx;

extern std::atomic<bool> g_terminate_all;
extern std::string g_run_log_table;
extern const std::string SIM_VERSION;

// Text dump of one slot of a status / export grid
void print_slot(const CountGrid& grid, int slot);
