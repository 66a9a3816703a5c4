#pragma once
#include <string>
#include <vector>

// DB open/close. Returns false (and logs) when the run log is unavailable.
bool init_db(const std::string& path);
void close_db();
bool db_ready();

struct EpisodeLogRecord {
    int worker_id;
    int episode;
    int n;
    int rows;
    int cols;
    double mean_hazards;
    int won;
    int completed;
    double win_rate;       // NaN -> NULL
    double mean_progress;
    int steps;
    int cascade_layers;
};

void save_episode_log_batch(const std::vector<EpisodeLogRecord>& records);

// Episode records of the current run log table, in insertion order
std::vector<EpisodeLogRecord> load_episode_logs();

struct RunSummary {
    std::string log_table;
    int workers;
    int episodes;
    long long games;
    long long wins;
    double win_rate;
    double mean_progress;
    double elapsed_sec;
};

void save_run_summary(const RunSummary& summary);

// Most recent runs first
std::vector<RunSummary> load_recent_runs(int limit);
