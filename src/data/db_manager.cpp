#include "data/db_manager.h"
#include "utils/globals.h"
#include "sqlite3.h"
#include <cmath>
#include <format>
#include <print>
#include <string>

sqlite3* run_db = nullptr;

static void bind_real_or_null(sqlite3_stmt* stmt, int idx, double v) {
    if (std::isnan(v)) sqlite3_bind_null(stmt, idx);
    else sqlite3_bind_double(stmt, idx, v);
}

static double column_real_or_nan(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL ? std::nan("") : sqlite3_column_double(stmt, col);
}

static bool exec_logged(const std::string& sql, const char* what) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(run_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::println(stderr, "[DB] {} failed: {}", what, errMsg ? errMsg : sqlite3_errmsg(run_db));
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool init_db(const std::string& path) {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (run_db != nullptr) return true;

    int rc = sqlite3_open(path.c_str(), &run_db);
    if (rc != SQLITE_OK) {
        sqlite3_close(run_db);
        run_db = nullptr;
        const std::string fallback = "../" + path;
        rc = sqlite3_open(fallback.c_str(), &run_db);
    }
    if (rc != SQLITE_OK) {
        std::println(stderr, "[DB] Cannot open run log at {}: {}", path, run_db ? sqlite3_errmsg(run_db) : "out of memory");
        sqlite3_close(run_db);
        run_db = nullptr;
        return false;
    }

    sqlite3_exec(run_db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(run_db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    const char* runs_sql =
        "CREATE TABLE IF NOT EXISTS runs ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  log_table TEXT, "
        "  workers INTEGER, "
        "  episodes INTEGER, "
        "  games INTEGER, "
        "  wins INTEGER, "
        "  win_rate REAL, "
        "  mean_progress REAL, "
        "  elapsed_sec REAL, "
        "  sim_version TEXT, "
        "  created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
        ");";
    bool ok = exec_logged(runs_sql, "create runs");

    // One episode table per run
    std::string logs_sql = std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  worker_id INTEGER, "
        "  episode INTEGER, "
        "  n INTEGER, "
        "  rows INTEGER, "
        "  cols INTEGER, "
        "  mean_hazards REAL, "
        "  won INTEGER, "
        "  completed INTEGER, "
        "  win_rate REAL, "
        "  mean_progress REAL, "
        "  steps INTEGER, "
        "  cascade_layers INTEGER, "
        "  timestamp DATETIME DEFAULT CURRENT_TIMESTAMP"
        ");", g_run_log_table);
    ok = exec_logged(logs_sql, "create episode log") && ok;

    if (!ok) {
        sqlite3_close(run_db);
        run_db = nullptr;
        return false;
    }
    std::println("[DB] Initialized runs | Episode log table {}", g_run_log_table);
    return true;
}

void close_db() {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (!run_db) return;

    sqlite3_exec(run_db, "PRAGMA wal_checkpoint(TRUNCATE);", nullptr, nullptr, nullptr);
    sqlite3_close(run_db);
    run_db = nullptr;
    std::println("[DB] Database closed cleanly.");
}

bool db_ready() {
    std::lock_guard<std::mutex> lock(db_mtx);
    return run_db != nullptr;
}

void save_episode_log_batch(const std::vector<EpisodeLogRecord>& records) {
    if (records.empty()) return;

    std::lock_guard<std::mutex> lock(db_mtx);
    if (!run_db) return;

    const std::string sql = std::format(
        "INSERT INTO {} (worker_id, episode, n, rows, cols, mean_hazards, won, completed, "
        "win_rate, mean_progress, steps, cascade_layers) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);",
        g_run_log_table);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(run_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "[DB] prepare episode insert failed: {}", sqlite3_errmsg(run_db));
        return;
    }

    sqlite3_exec(run_db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);
    for (const auto& rec : records) {
        sqlite3_bind_int(stmt, 1, rec.worker_id);
        sqlite3_bind_int(stmt, 2, rec.episode);
        sqlite3_bind_int(stmt, 3, rec.n);
        sqlite3_bind_int(stmt, 4, rec.rows);
        sqlite3_bind_int(stmt, 5, rec.cols);
        sqlite3_bind_double(stmt, 6, rec.mean_hazards);
        sqlite3_bind_int(stmt, 7, rec.won);
        sqlite3_bind_int(stmt, 8, rec.completed);
        bind_real_or_null(stmt, 9, rec.win_rate);
        bind_real_or_null(stmt, 10, rec.mean_progress);
        sqlite3_bind_int(stmt, 11, rec.steps);
        sqlite3_bind_int(stmt, 12, rec.cascade_layers);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::println(stderr, "[DB] episode insert failed: {}", sqlite3_errmsg(run_db));
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_exec(run_db, "COMMIT;", nullptr, nullptr, nullptr);
    sqlite3_finalize(stmt);
}

std::vector<EpisodeLogRecord> load_episode_logs() {
    std::lock_guard<std::mutex> lock(db_mtx);
    std::vector<EpisodeLogRecord> results;
    if (!run_db) return results;

    const std::string sql = std::format(
        "SELECT worker_id, episode, n, rows, cols, mean_hazards, won, completed, "
        "win_rate, mean_progress, steps, cascade_layers FROM {} ORDER BY id;", g_run_log_table);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(run_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "[DB] prepare episode query failed: {}", sqlite3_errmsg(run_db));
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        EpisodeLogRecord r{};
        r.worker_id = sqlite3_column_int(stmt, 0);
        r.episode = sqlite3_column_int(stmt, 1);
        r.n = sqlite3_column_int(stmt, 2);
        r.rows = sqlite3_column_int(stmt, 3);
        r.cols = sqlite3_column_int(stmt, 4);
        r.mean_hazards = sqlite3_column_double(stmt, 5);
        r.won = sqlite3_column_int(stmt, 6);
        r.completed = sqlite3_column_int(stmt, 7);
        r.win_rate = column_real_or_nan(stmt, 8);
        r.mean_progress = column_real_or_nan(stmt, 9);
        r.steps = sqlite3_column_int(stmt, 10);
        r.cascade_layers = sqlite3_column_int(stmt, 11);
        results.push_back(r);
    }
    sqlite3_finalize(stmt);
    return results;
}

void save_run_summary(const RunSummary& summary) {
    std::lock_guard<std::mutex> lock(db_mtx);
    if (!run_db) return;

    const char* sql =
        "INSERT INTO runs (log_table, workers, episodes, games, wins, win_rate, mean_progress, elapsed_sec, sim_version) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(run_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "[DB] prepare run insert failed: {}", sqlite3_errmsg(run_db));
        return;
    }
    sqlite3_bind_text(stmt, 1, summary.log_table.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, summary.workers);
    sqlite3_bind_int(stmt, 3, summary.episodes);
    sqlite3_bind_int64(stmt, 4, summary.games);
    sqlite3_bind_int64(stmt, 5, summary.wins);
    bind_real_or_null(stmt, 6, summary.win_rate);
    bind_real_or_null(stmt, 7, summary.mean_progress);
    sqlite3_bind_double(stmt, 8, summary.elapsed_sec);
    sqlite3_bind_text(stmt, 9, SIM_VERSION.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        std::println(stderr, "[DB] run insert failed: {}", sqlite3_errmsg(run_db));
    }
    sqlite3_finalize(stmt);
}

std::vector<RunSummary> load_recent_runs(int limit) {
    std::lock_guard<std::mutex> lock(db_mtx);
    std::vector<RunSummary> results;
    if (!run_db) return results;

    const char* sql =
        "SELECT log_table, workers, episodes, games, wins, win_rate, mean_progress, elapsed_sec "
        "FROM runs ORDER BY id DESC LIMIT ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(run_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return results;
    sqlite3_bind_int(stmt, 1, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        RunSummary r{};
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        if (text) r.log_table = reinterpret_cast<const char*>(text);
        r.workers = sqlite3_column_int(stmt, 1);
        r.episodes = sqlite3_column_int(stmt, 2);
        r.games = sqlite3_column_int64(stmt, 3);
        r.wins = sqlite3_column_int64(stmt, 4);
        r.win_rate = column_real_or_nan(stmt, 5);
        r.mean_progress = column_real_or_nan(stmt, 6);
        r.elapsed_sec = sqlite3_column_double(stmt, 7);
        results.push_back(r);
    }
    sqlite3_finalize(stmt);
    return results;
}
