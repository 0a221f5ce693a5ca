#pragma once

#include "allpair/core/cluster/NodeAliasMap.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace allpair::core::results {

struct ResultRecord {
    int round_index = 0;
    std::string node_a;
    std::string alias_a;
    std::string node_b;
    std::string alias_b;
    double avg_latency = 0.0;
    double avg_bandwidth = 0.0;
};

// Turns job logs under a log root into per-round CSV tables. Each log is
// recorded in a processed-set file once it has produced a row, so repeated
// scans of the same tree never duplicate rows. A zero row written for a log
// without the success marker is replaced in place if a resumed run later
// completes that job.
class ResultCollector {
public:
    using LogFn = std::function<void(const std::string&)>;

    static constexpr const char* kTrackerFile = ".processed_logs_tracker";
    static constexpr const char* kRoundHeader = "node_a,alias_a,node_b,alias_b,avg_latency,avg_busbw";
    static constexpr const char* kAggregateHeader =
        "round,node_a,alias_a,node_b,alias_b,avg_latency,avg_busbw";

    ResultCollector(std::string log_root, cluster::NodeAliasMap aliases, LogFn log_fn = {});

    // Returns the number of rows appended or replaced. With include_incomplete,
    // logs that never printed the success marker also produce a row (zero
    // metrics).
    int CollectOnce(bool include_incomplete, std::string* error = nullptr);

    // Merges every round table into allpair_<N>_nodes.csv (and .json), ordered
    // by numeric round.
    bool Aggregate(int node_count, std::string* output_path, std::string* error);

    std::string RoundTablePath(int round_index) const;
    std::string AggregatePath(int node_count) const;
    std::string TrackerPath() const;
    const std::string& log_root() const { return log_root_; }

    static std::string FormatRow(const ResultRecord& record);

private:
    std::vector<std::string> FindJobLogs() const;
    void Log(const std::string& line) const;

    std::string log_root_;
    cluster::NodeAliasMap aliases_;
    LogFn log_fn_;
};

// Runs CollectOnce(false) every interval on a worker thread until Stop().
class BackgroundCollector {
public:
    BackgroundCollector(ResultCollector& collector, int interval_seconds);
    ~BackgroundCollector();

    BackgroundCollector(const BackgroundCollector&) = delete;
    BackgroundCollector& operator=(const BackgroundCollector&) = delete;

    void Start();
    void Stop();
    bool running() const { return running_.load(); }

private:
    void Loop();

    ResultCollector& collector_;
    int interval_seconds_ = 30;
    std::atomic<bool> running_{false};
    std::thread worker_{};
    std::mutex mutex_{};
    std::condition_variable cv_{};
};

}  // namespace allpair::core::results
