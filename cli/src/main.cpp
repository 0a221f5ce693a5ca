#include "allpair/core/api/RunConfig.h"
#include "allpair/core/cluster/NodeAliasMap.h"
#include "allpair/core/cluster/NodeList.h"
#include "allpair/core/error/Error.h"
#include "allpair/core/process/JobProcess.h"
#include "allpair/core/results/LogSummary.h"
#include "allpair/core/results/ResultCollector.h"
#include "allpair/core/runtime/ScheduleController.h"
#include "allpair/core/schedule/PairingGenerator.h"
#include "allpair/core/schedule/ScheduleFormat.h"
#include "allpair/core/util/AtomicFileWriter.h"
#include "allpair/core/util/StringUtil.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

using allpair::core::Error;
using allpair::core::ErrorKind;
using allpair::core::api::RunConfig;

constexpr int kExitUsage = 1;
constexpr int kExitConfiguration = 2;
constexpr int kExitSchedule = 3;
constexpr int kExitJobFailures = 4;
constexpr int kExitAborted = 130;

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int) {
    g_stop_requested.store(true);
}

void PrintUsage() {
    std::cerr << "Usage: allpair [--resume-from N] [--log-dir DIR] [--hostfile FILE] "
                 "[--collect-only] <config.json>"
              << '\n';
}

// Log sink shared by every component. Jobs report from their supervisor
// threads, so writes are serialized.
class RunLog {
public:
    void OpenFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!allpair::core::util::EnsureParentDir(path)) {
            return;
        }
        file_.open(path, std::ios::binary | std::ios::app);
        if (!file_) {
            std::cerr << "[allpair] Failed to open log: " << path << '\n';
        }
    }

    void Info(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[allpair] " << line << '\n';
        Mirror(line);
    }

    void Warn(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[allpair] " << line << '\n';
        Mirror(line);
    }

private:
    void Mirror(const std::string& line) {
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    std::mutex mutex_;
    std::ofstream file_;
};

// Runs `generator_cmd --nitems N --format text`, keeps its output next to the
// logs and parses it into a schedule.
bool RunExternalGenerator(const RunConfig& config,
                          int node_count,
                          allpair::core::schedule::Schedule& schedule,
                          Error* error) {
    const std::string output_path =
        (std::filesystem::path(config.log_dir) / "schedule.txt").string();
    if (!allpair::core::util::EnsureParentDir(output_path)) {
        return allpair::core::Fail(error, ErrorKind::Configuration,
                                   "Cannot create " + config.log_dir);
    }

    allpair::core::process::LaunchSpec spec;
    spec.argv = config.generator_cmd;
    spec.argv.push_back("--nitems");
    spec.argv.push_back(std::to_string(node_count));
    spec.argv.push_back("--format");
    spec.argv.push_back("text");
    spec.stdout_path = output_path;
    spec.stderr_path = output_path + ".err";

    allpair::core::process::JobProcess generator;
    std::string start_error;
    if (!generator.Start(spec, &start_error)) {
        return allpair::core::Fail(error, ErrorKind::Configuration,
                                   "Generator failed to start: " + start_error);
    }
    generator.WaitForExit(-1);
    if (generator.ExitCode() == 127) {
        return allpair::core::Fail(error, ErrorKind::Configuration,
                                   "Generator not found: " + config.generator_cmd.front());
    }
    if (generator.ExitCode() != 0) {
        return allpair::core::Fail(error, ErrorKind::Configuration,
                                   "Generator exited with code " +
                                       std::to_string(generator.ExitCode()) + " (see " +
                                       spec.stderr_path + ")");
    }

    std::string text;
    if (!allpair::core::util::ReadFile(output_path, text)) {
        return allpair::core::Fail(error, ErrorKind::Configuration,
                                   "Cannot read generator output " + output_path);
    }
    return allpair::core::schedule::ParseScheduleText(text, node_count, schedule, error);
}

void FinishCollection(allpair::core::results::ResultCollector& collector,
                      int node_count,
                      RunLog& log) {
    std::string error;
    collector.CollectOnce(true, &error);
    if (!error.empty()) {
        log.Warn("WARN: " + error);
    }
    std::string aggregate_path;
    if (!collector.Aggregate(node_count, &aggregate_path, &error)) {
        log.Warn("WARN: " + error);
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }

    std::string config_path;
    std::string log_dir_override;
    std::string hostfile_override;
    int resume_from = -1;
    bool collect_only = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--resume-from" || arg == "--log-dir" || arg == "--hostfile") {
            if (i + 1 >= argc) {
                std::cerr << "[allpair] " << arg << " requires a value." << '\n';
                return kExitUsage;
            }
            const std::string value = argv[++i];
            if (arg == "--resume-from") {
                if (!allpair::core::util::ParseInt(value, resume_from) || resume_from < 0) {
                    std::cerr << "[allpair] --resume-from expects a non-negative round index."
                              << '\n';
                    return kExitUsage;
                }
            } else if (arg == "--log-dir") {
                log_dir_override = value;
            } else {
                hostfile_override = value;
            }
        } else if (arg == "--collect-only") {
            collect_only = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        } else if (config_path.empty()) {
            config_path = arg;
        } else {
            std::cerr << "[allpair] Unexpected argument: " << arg << '\n';
            return kExitUsage;
        }
    }

    if (config_path.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    RunConfig config;
    Error error;
    if (!RunConfig::LoadFromFile(config_path, config, &error)) {
        std::cerr << "[allpair] " << error.message << '\n';
        return kExitConfiguration;
    }
    if (resume_from >= 0) {
        config.start_round = resume_from;
    }
    if (!log_dir_override.empty()) {
        config.log_dir = log_dir_override;
    }
    if (!hostfile_override.empty()) {
        config.hostfile = hostfile_override;
    }
    if (!config.Validate(&error)) {
        std::cerr << "[allpair] " << error.message << '\n';
        return kExitConfiguration;
    }

    RunLog log;
    log.OpenFile((std::filesystem::path(config.log_dir) / "allpair.log").string());
    log.Info("Runner config: " + config_path);
    log.Info("Effective config: " + RunConfig::ToJsonString(config));

    std::vector<allpair::core::cluster::Node> nodes;
    if (!allpair::core::cluster::NodeList::LoadFile(config.hostfile, config.processes_per_node,
                                                    nodes, &error)) {
        log.Warn(error.message);
        return kExitConfiguration;
    }
    const int node_count = static_cast<int>(nodes.size());
    log.Info("Loaded " + std::to_string(node_count) + " node(s) from " + config.hostfile);
    if (!config.ValidateForNodes(node_count, &error)) {
        log.Warn(error.message);
        return kExitConfiguration;
    }

    allpair::core::cluster::NodeAliasMap aliases;
    if (!config.node_map.empty()) {
        std::string alias_error;
        aliases = allpair::core::cluster::NodeAliasMap::LoadFile(config.node_map, &alias_error);
        if (!alias_error.empty()) {
            log.Warn("WARN: " + alias_error + " (aliases default to 'unknown')");
        } else {
            log.Info("Loaded " + std::to_string(aliases.size()) + " node alias(es)");
        }
    }

    allpair::core::results::ResultCollector collector(
        config.log_dir, aliases, [&log](const std::string& line) { log.Info(line); });

    if (collect_only) {
        FinishCollection(collector, node_count, log);
        std::cout << allpair::core::results::RenderLogSummary(config.log_dir,
                                                              config.summary_tail_lines);
        return 0;
    }

    allpair::core::schedule::Schedule schedule;
    if (config.generator_cmd.empty()) {
        if (!allpair::core::schedule::PairingGenerator::Generate(node_count, schedule, &error)) {
            log.Warn(error.message);
            return kExitSchedule;
        }
    } else {
        if (node_count < 2) {
            log.Warn("Need at least 2 nodes to generate pairs, got " + std::to_string(node_count));
            return kExitSchedule;
        }
        if (!RunExternalGenerator(config, node_count, schedule, &error)) {
            log.Warn(error.message);
            return error.kind == ErrorKind::ScheduleGeneration ? kExitSchedule
                                                               : kExitConfiguration;
        }
    }
    log.Info("Schedule: " + std::to_string(schedule.size()) + " round(s) for " +
             std::to_string(node_count) + " node(s)");
    if (config.start_round > 0) {
        log.Info("Resuming from round " + std::to_string(config.start_round));
    }

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    std::unique_ptr<allpair::core::results::BackgroundCollector> background;
    if (config.report_interval_seconds > 0) {
        background = std::make_unique<allpair::core::results::BackgroundCollector>(
            collector, config.report_interval_seconds);
        background->Start();
    }

    allpair::core::runtime::ScheduleController controller(
        config, nodes, std::move(schedule), [&log](const std::string& line) {
            if (line.rfind("WARN", 0) == 0) {
                log.Warn(line);
            } else {
                log.Info(line);
            }
        });
    const allpair::core::runtime::RunReport report = controller.Run(&g_stop_requested);

    if (background) {
        background->Stop();
    }
    FinishCollection(collector, node_count, log);

    log.Info("Jobs: " + std::to_string(report.total_jobs) + " total, " +
             std::to_string(report.succeeded) + " succeeded, " + std::to_string(report.failed) +
             " failed, " + std::to_string(report.timed_out) + " timed out, " +
             std::to_string(report.skipped_cached) + " cached, " +
             std::to_string(report.launch_errors) + " launch error(s)");
    std::cout << allpair::core::results::RenderLogSummary(config.log_dir,
                                                          config.summary_tail_lines);

    if (report.aborted) {
        return kExitAborted;
    }
    return report.rounds_with_failures > 0 || report.launch_errors > 0 ? kExitJobFailures : 0;
}
