#include "allpair/core/runtime/RoundExecutor.h"

#include "allpair/core/process/JobProcess.h"
#include "allpair/core/results/LogMetrics.h"

#include <filesystem>
#include <future>
#include <sstream>
#include <system_error>
#include <utility>

namespace allpair::core::runtime {

namespace {

constexpr int kMaxPort = 65535;

std::string JoinCommand(const std::vector<std::string>& command) {
    std::ostringstream out;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << command[i];
    }
    return out.str();
}

}  // namespace

const char* JobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Succeeded:
            return "succeeded";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::TimedOut:
            return "timed_out";
        case JobStatus::SkippedCached:
            return "skipped_cached";
    }
    return "unknown";
}

RoundExecutor::RoundExecutor(const api::RunConfig& config,
                             const std::vector<cluster::Node>& nodes,
                             LogFn log_fn,
                             const std::atomic<bool>* stop)
    : config_(config),
      nodes_(nodes),
      log_fn_(std::move(log_fn)),
      stop_(stop) {}

std::string RoundExecutor::RoundDir(int round_index) const {
    const std::filesystem::path dir =
        std::filesystem::path(config_.log_dir) / ("round" + std::to_string(round_index));
    return dir.string();
}

std::string RoundExecutor::JobLogPath(int round_index,
                                      int job_index,
                                      const std::string& host_a,
                                      const std::string& host_b) const {
    const std::filesystem::path path =
        std::filesystem::path(RoundDir(round_index)) /
        results::JobLogFileName(config_.log_prefix, round_index, job_index, host_a, host_b);
    return path.string();
}

std::vector<std::string> RoundExecutor::BuildCommand(const Job& job) const {
    if (config_.launcher == "direct") {
        return config_.workload_cmd;
    }

    const int ppn_a = nodes_[static_cast<size_t>(job.pair.first)].processes_per_node;
    const int ppn_b = nodes_[static_cast<size_t>(job.pair.second)].processes_per_node;

    std::vector<std::string> command = {
        "mpirun",
        "--tag-output",
        "--display-map",
        "--allow-run-as-root",
        "--bind-to",
        "none",
        "--mca",
        "btl_tcp_if_include",
        config_.net_iface,
        "--mca",
        "oob_tcp_if_include",
        config_.net_iface,
        "-np",
        std::to_string(ppn_a + ppn_b),
        "-H",
        job.host_a + ":" + std::to_string(ppn_a) + "," + job.host_b + ":" + std::to_string(ppn_b),
        "-x",
        "LOCAL_WORLD",
        "-x",
        "NCCL_DEBUG",
        "-x",
        "NCCL_SOCKET_IFNAME",
        "-x",
        "MASTER_ADDR=" + job.host_a,
        "-x",
        "MASTER_PORT=" + std::to_string(job.port),
    };
    command.insert(command.end(), config_.extra_launch_args.begin(), config_.extra_launch_args.end());
    command.insert(command.end(), config_.workload_cmd.begin(), config_.workload_cmd.end());
    return command;
}

std::map<std::string, std::string> RoundExecutor::BuildEnvironment(const Job& job) const {
    const int ppn_a = nodes_[static_cast<size_t>(job.pair.first)].processes_per_node;
    const int ppn_b = nodes_[static_cast<size_t>(job.pair.second)].processes_per_node;
    return {
        {"MASTER_ADDR", job.host_a},
        {"MASTER_PORT", std::to_string(job.port)},
        {"WORLD_SIZE", std::to_string(ppn_a + ppn_b)},
        {"LOCAL_WORLD", std::to_string(ppn_a)},
        {"NCCL_DEBUG", config_.nccl_debug},
        {"NCCL_SOCKET_IFNAME", config_.net_iface},
    };
}

bool RoundExecutor::PrepareJob(const schedule::Round& round,
                               const schedule::Pair& pair,
                               int job_index,
                               Job& job,
                               Error* error) const {
    const int node_count = static_cast<int>(nodes_.size());
    std::ostringstream label;
    label << pair.first << ' ' << pair.second;
    if (pair.first < 0 || pair.second < 0 || pair.first >= node_count || pair.second >= node_count) {
        return Fail(error, ErrorKind::JobLaunch, "index out of range in pair '" + label.str() + "'");
    }
    if (pair.first == pair.second) {
        return Fail(error, ErrorKind::JobLaunch, "pair repeats a node: '" + label.str() + "'");
    }

    if (static_cast<long long>(config_.master_port_base) + job_index > kMaxPort) {
        return Fail(error, ErrorKind::JobLaunch,
                    "master port " + std::to_string(static_cast<long long>(config_.master_port_base) + job_index) +
                        " out of range for pair '" + label.str() + "'");
    }

    job = Job{};
    job.round_index = round.index;
    job.job_index = job_index;
    job.pair = pair;
    job.host_a = nodes_[static_cast<size_t>(pair.first)].hostname;
    job.host_b = nodes_[static_cast<size_t>(pair.second)].hostname;
    job.port = config_.master_port_base + job_index;
    job.log_path = JobLogPath(round.index, job_index, job.host_a, job.host_b);
    return true;
}

RoundSummary RoundExecutor::Execute(const schedule::Round& round) {
    RoundSummary summary;
    summary.round_index = round.index;

    std::error_code ec;
    std::filesystem::create_directories(RoundDir(round.index), ec);
    if (ec) {
        Log("WARN: failed to create " + RoundDir(round.index) + ": " + ec.message());
    }

    for (const auto& raw : round.malformed_pairs) {
        Log("WARN: malformed pair: '" + raw + "' (skipping)");
        summary.launch_errors += 1;
    }

    std::vector<Job> jobs;
    std::vector<std::pair<size_t, std::future<Job>>> pending;
    jobs.reserve(round.pairs.size());

    int job_index = 0;
    for (const auto& pair : round.pairs) {
        if (stop_ && stop_->load()) {
            summary.aborted = true;
            break;
        }

        Job job;
        Error error;
        if (!PrepareJob(round, pair, job_index, job, &error)) {
            Log("WARN: " + error.message + " (skipping)");
            summary.launch_errors += 1;
            continue;
        }

        std::ostringstream pair_line;
        pair_line << "  Pair: " << pair.first << '(' << job.host_a << ") & " << pair.second << '('
                  << job.host_b << ")\n    Master port: " << job.port;
        Log(pair_line.str());

        if (results::LogHasSuccessMarker(job.log_path)) {
            job.status = JobStatus::SkippedCached;
            std::ostringstream skip_line;
            skip_line << "Skipping Round " << round.index << " Job " << job_index << " (" << job.host_a
                      << " & " << job.host_b << ") - already completed.";
            Log(skip_line.str());
            jobs.push_back(std::move(job));
            ++job_index;
            continue;
        }

        job.command = BuildCommand(job);
        std::ostringstream launch_line;
        launch_line << "Launching Job" << job_index << ": " << job.host_a << " & " << job.host_b
                    << "  -> " << job.log_path << "\n    Running: " << JoinCommand(job.command);
        Log(launch_line.str());

        const size_t slot = jobs.size();
        jobs.push_back(job);
        try {
            pending.emplace_back(slot, std::async(std::launch::async, [this, job]() { return RunJob(job); }));
        } catch (const std::system_error& ex) {
            jobs[slot].status = JobStatus::Failed;
            jobs[slot].error = ErrorKind::JobLaunch;
            jobs[slot].error_message = ex.what();
            Log("WARN: could not start supervisor for " + jobs[slot].log_path + ": " + ex.what());
        }
        ++job_index;
    }

    // Round barrier.
    for (auto& entry : pending) {
        jobs[entry.first] = entry.second.get();
    }

    for (const auto& job : jobs) {
        switch (job.status) {
            case JobStatus::Succeeded:
                summary.succeeded += 1;
                break;
            case JobStatus::TimedOut:
                summary.timed_out += 1;
                break;
            case JobStatus::SkippedCached:
                summary.skipped_cached += 1;
                break;
            default:
                summary.failed += 1;
                break;
        }
        if (job.status != JobStatus::SkippedCached) {
            summary.log_paths.push_back(job.log_path);
        }
    }
    summary.total_jobs = static_cast<int>(jobs.size());
    summary.jobs = std::move(jobs);
    if (stop_ && stop_->load()) {
        summary.aborted = true;
    }
    return summary;
}

Job RoundExecutor::RunJob(Job job) const {
    job.status = JobStatus::Running;

    process::LaunchSpec spec;
    spec.argv = job.command;
    spec.env = BuildEnvironment(job);
    spec.stdout_path = job.log_path;

    process::JobProcess process;
    std::string error;
    if (!process.Start(spec, &error)) {
        job.status = JobStatus::Failed;
        job.error = ErrorKind::JobLaunch;
        job.error_message = error;
        Log("WARN: launch failed for " + job.log_path + ": " + error);
        return job;
    }

    const int timeout_ms = config_.job_timeout_ms();
    if (!process.WaitForExit(timeout_ms > 0 ? timeout_ms : -1, stop_)) {
        if (stop_ && stop_->load()) {
            process.Kill();
            process.WaitForExit(-1);
            job.status = JobStatus::Failed;
            job.exit_code = process.ExitCode();
            job.error = ErrorKind::JobFailure;
            job.error_message = "aborted by operator";
            return job;
        }

        std::ostringstream line;
        line << "Round " << job.round_index << " Job " << job.job_index << " exceeded "
             << timeout_ms << " ms; sending SIGTERM";
        Log(line.str());
        if (!process.StopGroup(config_.kill_grace_ms())) {
            Log("Round " + std::to_string(job.round_index) + " Job " + std::to_string(job.job_index) +
                " ignored SIGTERM; sent SIGKILL");
        }
        job.status = JobStatus::TimedOut;
        job.exit_code = process.ExitCode();
        job.error = ErrorKind::JobTimeout;
        job.error_message = "timed out";
        return job;
    }

    job.exit_code = process.ExitCode();
    if (job.exit_code == 0) {
        job.status = JobStatus::Succeeded;
    } else {
        job.status = JobStatus::Failed;
        job.error = ErrorKind::JobFailure;
        job.error_message = "exit code " + std::to_string(job.exit_code);
    }
    return job;
}

void RoundExecutor::Log(const std::string& line) const {
    if (log_fn_) {
        log_fn_(line);
    }
}

}  // namespace allpair::core::runtime
