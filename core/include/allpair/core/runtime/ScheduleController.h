#pragma once

#include "allpair/core/api/RunConfig.h"
#include "allpair/core/cluster/NodeList.h"
#include "allpair/core/runtime/RoundExecutor.h"
#include "allpair/core/schedule/ScheduleTypes.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace allpair::core::runtime {

struct RunReport {
    int node_count = 0;
    int start_round = 0;
    int rounds_total = 0;
    int rounds_skipped = 0;
    int rounds_executed = 0;
    int rounds_with_failures = 0;
    int total_jobs = 0;
    int succeeded = 0;
    int failed = 0;
    int timed_out = 0;
    int skipped_cached = 0;
    int launch_errors = 0;
    bool aborted = false;
    std::vector<RoundSummary> rounds;
};

// Drives the schedule one round at a time. Rounds before the resume offset are
// consumed so round and port numbering match the earlier run, but nothing is
// launched for them.
class ScheduleController {
public:
    using LogFn = std::function<void(const std::string&)>;

    ScheduleController(api::RunConfig config,
                       std::vector<cluster::Node> nodes,
                       schedule::Schedule schedule,
                       LogFn log_fn = {});

    RunReport Run(const std::atomic<bool>* stop = nullptr);

    const schedule::Schedule& schedule() const { return schedule_; }
    const std::vector<cluster::Node>& nodes() const { return nodes_; }
    std::string ReportPath() const;

    static bool WriteReport(const std::string& path, const RunReport& report);

private:
    void Log(const std::string& line) const;

    const api::RunConfig config_;
    const std::vector<cluster::Node> nodes_;
    const schedule::Schedule schedule_;
    LogFn log_fn_;
};

}  // namespace allpair::core::runtime
