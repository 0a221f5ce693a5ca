#pragma once

#include "allpair/core/api/RunConfig.h"
#include "allpair/core/cluster/NodeList.h"
#include "allpair/core/error/Error.h"
#include "allpair/core/schedule/ScheduleTypes.h"

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace allpair::core::runtime {

enum class JobStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
    TimedOut,
    SkippedCached
};

const char* JobStatusName(JobStatus status);

struct Job {
    int round_index = 0;
    int job_index = 0;
    schedule::Pair pair;
    std::string host_a;
    std::string host_b;
    int port = 0;
    std::string log_path;
    std::vector<std::string> command;
    JobStatus status = JobStatus::Pending;
    int exit_code = 0;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct RoundSummary {
    int round_index = 0;
    int total_jobs = 0;
    int succeeded = 0;
    int failed = 0;
    int timed_out = 0;
    int skipped_cached = 0;
    int launch_errors = 0;
    bool aborted = false;
    std::vector<std::string> log_paths;
    std::vector<Job> jobs;

    bool all_ok() const { return failed == 0 && timed_out == 0; }
};

class RoundExecutor {
public:
    using LogFn = std::function<void(const std::string&)>;

    RoundExecutor(const api::RunConfig& config,
                  const std::vector<cluster::Node>& nodes,
                  LogFn log_fn = {},
                  const std::atomic<bool>* stop = nullptr);

    // Launches every pair of the round concurrently and returns once all of them
    // are terminal. A failing job never cancels its siblings.
    RoundSummary Execute(const schedule::Round& round);

    std::string RoundDir(int round_index) const;
    std::string JobLogPath(int round_index,
                           int job_index,
                           const std::string& host_a,
                           const std::string& host_b) const;
    std::vector<std::string> BuildCommand(const Job& job) const;
    std::map<std::string, std::string> BuildEnvironment(const Job& job) const;

private:
    bool PrepareJob(const schedule::Round& round,
                    const schedule::Pair& pair,
                    int job_index,
                    Job& job,
                    Error* error) const;
    Job RunJob(Job job) const;
    void Log(const std::string& line) const;

    const api::RunConfig& config_;
    const std::vector<cluster::Node>& nodes_;
    LogFn log_fn_;
    const std::atomic<bool>* stop_ = nullptr;
};

}  // namespace allpair::core::runtime
