#include <iostream>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <print>
#include <csignal>
#include <iomanip>
#include <sstream>
#include <cmath>
#include <optional>
#include <ctime>

#include "core/batch_game.h"
#include "core/scoring.h"
#include "engine/runner.h"
#include "data/db_manager.h"
#include "utils/globals.h"
#include "utils/config.h"

void signal_handler(int signal) {
    if (signal == SIGINT) {
        std::println("\n[SYSTEM] Interrupt received. Finishing current step on every worker...");
        g_terminate_all = true;
    }
}

static void parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&](std::string_view key) { return std::string(arg.substr(key.size())); };
        if (arg.starts_with("--rows=")) ConfigSim::ROWS = std::stoi(value("--rows="));
        else if (arg.starts_with("--cols=")) ConfigSim::COLS = std::stoi(value("--cols="));
        else if (arg.starts_with("--mines=")) ConfigSim::HAZARDS = std::stoi(value("--mines="));
        else if (arg.starts_with("--n=")) ConfigSim::BATCH_SIZE = std::stoi(value("--n="));
        else if (arg.starts_with("--episodes=")) ConfigSim::EPISODES = std::stoi(value("--episodes="));
        else if (arg.starts_with("--threads=")) ConfigSim::THREADS = std::stoi(value("--threads="));
        else if (arg.starts_with("--seed=")) ConfigSim::SEED = std::stoull(value("--seed="));
        else if (arg.starts_with("--db=")) ConfigSim::DB_PATH = value("--db=");
        else if (arg == "--no-db") ConfigSim::DB_ENABLED = false;
        else if (arg.starts_with("--open-zero=")) ConfigSim::OPEN_ZERO = value("--open-zero=") != "0";
        else std::println(stderr, "[INIT] Ignoring unknown argument {}", arg);
    }
}

struct WorkerTotals {
    long long games = 0;
    long long wins = 0;
    long long completed = 0;
    double progress_sum = 0.0;
};

int main(int argc, char* argv[]) {
    try {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss_l;
        auto lt = std::localtime(&in_time_t);
        ss_l << "episode_logs_" << std::put_time(lt, "%Y%m%d_%H%M%S");
        g_run_log_table = ss_l.str();

        std::signal(SIGINT, signal_handler);
        parse_args(argc, argv);

        // Fail fast on a bad board before any thread starts.
        normalize_hazard_counts(ConfigSim::BATCH_SIZE, ConfigSim::ROWS, ConfigSim::COLS, ConfigSim::HAZARDS);

        if (ConfigSim::DB_ENABLED) {
            std::println("[INIT] Initializing run log at {}...", ConfigSim::DB_PATH);
            if (!init_db(ConfigSim::DB_PATH)) std::println(stderr, "[INIT] Continuing without run log.");
        }

        unsigned int hw_threads = std::thread::hardware_concurrency();
        const int num_threads = ConfigSim::THREADS > 0 ? ConfigSim::THREADS
                              : (hw_threads > 0 ? static_cast<int>(hw_threads) : 4);

        std::println("=== MineBatch Runner v{} ===", SIM_VERSION);
        std::println("Board {}x{} | Hazards {} | Batch {} | Episodes/worker {} | Open zero {}",
                     ConfigSim::ROWS, ConfigSim::COLS, ConfigSim::HAZARDS, ConfigSim::BATCH_SIZE,
                     ConfigSim::EPISODES, ConfigSim::OPEN_ZERO);

        std::vector<WorkerTotals> totals(num_threads);
        std::vector<std::thread> workers;
        const auto start = std::chrono::steady_clock::now();

        std::println("[INIT] Spawning {} threads...", num_threads);
        for (int i = 0; i < num_threads; ++i) {
            workers.emplace_back([i, &totals]() {
                try {
                    std::optional<uint64_t> seed;
                    if (ConfigSim::SEED != 0) seed = ConfigSim::SEED + static_cast<uint64_t>(i);
                    BatchGame game(ConfigSim::ROWS, ConfigSim::COLS, ConfigSim::HAZARDS, ConfigSim::BATCH_SIZE, seed);
                    BatchRunner runner(game, ConfigSim::OPEN_ZERO, ConfigSim::MAX_STEPS);
                    std::vector<EpisodeLogRecord> buffer;

                    for (int ep = 0; ep < ConfigSim::EPISODES && !g_terminate_all; ++ep) {
                        if (ep > 0) game.reset(true);
                        EpisodeResult r = runner.run_episode();

                        auto& t = totals[i];
                        t.games += r.summary.n;
                        t.wins += r.summary.won;
                        t.completed += r.summary.completed;
                        if (!std::isnan(r.summary.mean_progress)) t.progress_sum += r.summary.mean_progress * r.summary.n;

                        buffer.push_back({i, ep, r.summary.n, game.rows(), game.cols(),
                                          static_cast<double>(ConfigSim::HAZARDS), r.summary.won,
                                          r.summary.completed, r.summary.win_rate, r.summary.mean_progress,
                                          r.steps, r.cascade_layers});
                        if (static_cast<int>(buffer.size()) >= ConfigSim::DB_FLUSH_RECORDS) {
                            save_episode_log_batch(buffer);
                            buffer.clear();
                        }

                        if (ep % ConfigSim::PROGRESS_PRINT_INTERVAL == 0 || ep + 1 == ConfigSim::EPISODES) {
                            std::lock_guard<std::mutex> lock(console_mtx);
                            std::println("[Thread {}] Episode {} | Won {}/{} | WinRate {:.4f} | Progress {:.4f} | Steps {}",
                                         i, ep, r.summary.won, r.summary.completed, r.summary.win_rate,
                                         r.summary.mean_progress, r.steps);
                        }
                    }
                    save_episode_log_batch(buffer);
                } catch (const std::exception& e) {
                    std::println(stderr, "[Thread {} CRASH] Exception: {}", i, e.what());
                }
            });
        }

        for (auto& t : workers) t.join();

        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        RunSummary summary{g_run_log_table, num_threads, ConfigSim::EPISODES, 0, 0, 0.0, 0.0, elapsed};
        long long completed = 0;
        double progress_sum = 0.0;
        for (const auto& t : totals) {
            summary.games += t.games;
            summary.wins += t.wins;
            completed += t.completed;
            progress_sum += t.progress_sum;
        }
        summary.win_rate = completed > 0 ? static_cast<double>(summary.wins) / completed : std::nan("");
        summary.mean_progress = summary.games > 0 ? progress_sum / summary.games : std::nan("");

        std::println("[RUN] Games {} | Wins {} | WinRate {:.4f} | Progress {:.4f} | {:.2f}s",
                     summary.games, summary.wins, summary.win_rate, summary.mean_progress, elapsed);

        if (db_ready()) {
            save_run_summary(summary);
            std::println("[DB] {} episode records in {}", load_episode_logs().size(), g_run_log_table);
            for (const auto& r : load_recent_runs(5)) {
                std::println("[DB] {} | workers {} | games {} | win rate {:.4f}",
                             r.log_table, r.workers, r.games, r.win_rate);
            }
        }

        close_db();
        return 0;
    } catch (const std::exception& e) {
        std::println(stderr, "[MAIN CRASH] Uncaught Exception: {}", e.what());
        close_db();
        return 1;
    }
}
