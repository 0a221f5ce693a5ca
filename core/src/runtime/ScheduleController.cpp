#include "allpair/core/runtime/ScheduleController.h"

#include "allpair/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>
#include <utility>

namespace allpair::core::runtime {

namespace {

nlohmann::json RoundToJson(const RoundSummary& summary) {
    nlohmann::json node;
    node["round"] = summary.round_index;
    node["total_jobs"] = summary.total_jobs;
    node["succeeded"] = summary.succeeded;
    node["failed"] = summary.failed;
    node["timed_out"] = summary.timed_out;
    node["skipped_cached"] = summary.skipped_cached;
    node["launch_errors"] = summary.launch_errors;
    node["aborted"] = summary.aborted;
    node["jobs"] = nlohmann::json::array();
    for (const auto& job : summary.jobs) {
        node["jobs"].push_back({
            {"job", job.job_index},
            {"node_a", job.host_a},
            {"node_b", job.host_b},
            {"port", job.port},
            {"status", JobStatusName(job.status)},
            {"exit_code", job.exit_code},
            {"log", job.log_path},
        });
    }
    return node;
}

}  // namespace

ScheduleController::ScheduleController(api::RunConfig config,
                                       std::vector<cluster::Node> nodes,
                                       schedule::Schedule schedule,
                                       LogFn log_fn)
    : config_(std::move(config)),
      nodes_(std::move(nodes)),
      schedule_(std::move(schedule)),
      log_fn_(std::move(log_fn)) {}

std::string ScheduleController::ReportPath() const {
    return (std::filesystem::path(config_.log_dir) / "run_report.json").string();
}

RunReport ScheduleController::Run(const std::atomic<bool>* stop) {
    RunReport report;
    report.node_count = static_cast<int>(nodes_.size());
    report.start_round = config_.start_round;
    report.rounds_total = static_cast<int>(schedule_.rounds.size());

    RoundExecutor executor(config_, nodes_, log_fn_, stop);

    for (const auto& round : schedule_.rounds) {
        if (round.index < config_.start_round) {
            report.rounds_skipped += 1;
            continue;
        }
        if (stop && stop->load()) {
            report.aborted = true;
            break;
        }

        Log("");
        Log("=== Round " + std::to_string(round.index) + " ===");
        RoundSummary summary = executor.Execute(round);

        std::ostringstream line;
        if (summary.all_ok()) {
            line << "Round " << round.index << ": all jobs completed successfully.";
        } else {
            line << "Round " << round.index << ": one or more jobs failed/timed-out (see logs in "
                 << config_.log_dir << ")";
            report.rounds_with_failures += 1;
        }
        Log(line.str());
        if (!summary.log_paths.empty()) {
            Log("Round " + std::to_string(round.index) + " logs:");
            for (const auto& path : summary.log_paths) {
                Log("  " + path);
            }
        }

        report.rounds_executed += 1;
        report.total_jobs += summary.total_jobs;
        report.succeeded += summary.succeeded;
        report.failed += summary.failed;
        report.timed_out += summary.timed_out;
        report.skipped_cached += summary.skipped_cached;
        report.launch_errors += summary.launch_errors;
        const bool aborted = summary.aborted;
        report.rounds.push_back(std::move(summary));
        if (aborted) {
            report.aborted = true;
            break;
        }
    }

    if (report.aborted) {
        Log("Run aborted by operator.");
    } else {
        Log("");
        Log("All rounds complete. Logs in: " + config_.log_dir);
    }

    if (!WriteReport(ReportPath(), report)) {
        Log("WARN: failed to write " + ReportPath());
    }
    return report;
}

bool ScheduleController::WriteReport(const std::string& path, const RunReport& report) {
    nlohmann::json root;
    root["node_count"] = report.node_count;
    root["start_round"] = report.start_round;
    root["rounds_total"] = report.rounds_total;
    root["rounds_skipped"] = report.rounds_skipped;
    root["rounds_executed"] = report.rounds_executed;
    root["rounds_with_failures"] = report.rounds_with_failures;
    root["total_jobs"] = report.total_jobs;
    root["succeeded"] = report.succeeded;
    root["failed"] = report.failed;
    root["timed_out"] = report.timed_out;
    root["skipped_cached"] = report.skipped_cached;
    root["launch_errors"] = report.launch_errors;
    root["aborted"] = report.aborted;
    root["rounds"] = nlohmann::json::array();
    for (const auto& summary : report.rounds) {
        root["rounds"].push_back(RoundToJson(summary));
    }
    return util::AtomicFileWriter::Write(path, root.dump(2));
}

void ScheduleController::Log(const std::string& line) const {
    if (log_fn_) {
        log_fn_(line);
    }
}

}  // namespace allpair::core::runtime
