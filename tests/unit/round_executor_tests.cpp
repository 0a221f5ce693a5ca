#include "allpair/core/api/RunConfig.h"
#include "allpair/core/cluster/NodeList.h"
#include "allpair/core/runtime/RoundExecutor.h"
#include "allpair/core/util/AtomicFileWriter.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>
#include <unistd.h>

namespace {

using allpair::core::ErrorKind;
using allpair::core::api::RunConfig;
using allpair::core::cluster::Node;
using allpair::core::cluster::NodeList;
using allpair::core::runtime::Job;
using allpair::core::runtime::JobStatus;
using allpair::core::runtime::RoundExecutor;
using allpair::core::runtime::RoundSummary;
using allpair::core::schedule::Pair;
using allpair::core::schedule::Round;

std::filesystem::path MakeTempDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("allpair_" + name + "_" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

RunConfig DirectConfig(const std::filesystem::path& log_dir, const std::string& script) {
    RunConfig config;
    config.launcher = "direct";
    config.log_dir = log_dir.string();
    config.processes_per_node = 2;
    config.workload_cmd = {"/bin/sh", "-c", script};
    config.job_timeout_seconds = 30;
    return config;
}

std::vector<Node> FourNodes() {
    return NodeList::FromHostnames({"h0", "h1", "h2", "h3"}, 2);
}

Round FirstRound() {
    Round round;
    round.index = 0;
    round.pairs = {Pair{0, 3}, Pair{1, 2}};
    return round;
}

std::string ReadText(const std::string& path) {
    std::string contents;
    allpair::core::util::ReadFile(path, contents);
    return contents;
}

// Zombies count as gone: they hold no port and no node.
bool ProcessAlive(int pid) {
    std::string stat;
    if (!allpair::core::util::ReadFile("/proc/" + std::to_string(pid) + "/stat", stat)) {
        return false;
    }
    const size_t close = stat.rfind(')');
    return close != std::string::npos && close + 2 < stat.size() && stat[close + 2] != 'Z';
}

bool test_success_and_environment() {
    const auto dir = MakeTempDir("exec_ok");
    const RunConfig config = DirectConfig(
        dir, "echo \"MASTER_ADDR=$MASTER_ADDR MASTER_PORT=$MASTER_PORT WORLD_SIZE=$WORLD_SIZE "
             "LOCAL_WORLD=$LOCAL_WORLD NCCL_SOCKET_IFNAME=$NCCL_SOCKET_IFNAME\"; "
             "echo 'latency: 0.5 busbw: 100.0'");
    const auto nodes = FourNodes();
    RoundExecutor executor(config, nodes);

    const RoundSummary summary = executor.Execute(FirstRound());
    if (summary.total_jobs != 2 || summary.succeeded != 2 || !summary.all_ok()) {
        std::cerr << "Expected two successful jobs, got " << summary.succeeded << '/'
                  << summary.total_jobs << '\n';
        return false;
    }
    const std::string expected_log = (dir / "round0" / "round0_job0_h0--h3.log").string();
    if (summary.log_paths.size() != 2 || summary.log_paths[0] != expected_log) {
        std::cerr << "Unexpected log paths\n";
        return false;
    }
    const std::string first = ReadText(expected_log);
    if (first.find("MASTER_ADDR=h0 MASTER_PORT=45566 WORLD_SIZE=4 LOCAL_WORLD=2 NCCL_SOCKET_IFNAME=eth0") ==
        std::string::npos) {
        std::cerr << "Environment contract not honoured:\n" << first;
        return false;
    }
    const std::string second = ReadText(summary.log_paths[1]);
    if (second.find("MASTER_ADDR=h1 MASTER_PORT=45567") == std::string::npos) {
        std::cerr << "Second job got the wrong address or port:\n" << second;
        return false;
    }

    // Every log now carries the marker: nothing is relaunched.
    const RoundSummary cached = executor.Execute(FirstRound());
    if (cached.skipped_cached != 2 || !cached.log_paths.empty() || cached.succeeded != 0) {
        std::cerr << "Expected both jobs to be skipped as cached\n";
        return false;
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_failure_does_not_stop_siblings() {
    const auto dir = MakeTempDir("exec_fail");
    const RunConfig config = DirectConfig(
        dir, "if [ \"$MASTER_ADDR\" = h0 ]; then exit 3; fi; echo 'busbw: 1'");
    const auto nodes = FourNodes();
    RoundExecutor executor(config, nodes);

    const RoundSummary summary = executor.Execute(FirstRound());
    if (summary.failed != 1 || summary.succeeded != 1 || summary.all_ok()) {
        std::cerr << "Expected one failure and one success\n";
        return false;
    }
    const Job& failed = summary.jobs[0];
    if (failed.status != JobStatus::Failed || failed.exit_code != 3 ||
        failed.error != ErrorKind::JobFailure) {
        std::cerr << "Failed job recorded as " << allpair::core::runtime::JobStatusName(failed.status)
                  << " exit " << failed.exit_code << '\n';
        return false;
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_timeout_escalates() {
    const auto dir = MakeTempDir("exec_timeout");
    RunConfig config = DirectConfig(dir, "trap '' TERM; sleep 5");
    config.job_timeout_ms_override = 200;
    config.kill_grace_ms_override = 200;
    const auto nodes = FourNodes();
    RoundExecutor executor(config, nodes);

    const auto start = std::chrono::steady_clock::now();
    const RoundSummary summary = executor.Execute(FirstRound());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    if (summary.timed_out != 2) {
        std::cerr << "Expected two timed out jobs, got " << summary.timed_out << '\n';
        return false;
    }
    if (elapsed > std::chrono::seconds(4)) {
        std::cerr << "Timeout escalation took too long\n";
        return false;
    }
    for (const auto& job : summary.jobs) {
        if (job.error != ErrorKind::JobTimeout) {
            std::cerr << "Timed out job has wrong error kind\n";
            return false;
        }
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_timeout_kills_group_members_that_outlive_leader() {
    const auto dir = MakeTempDir("exec_straggler");
    // The leader dies on SIGTERM; its background child ignores it.
    RunConfig config = DirectConfig(
        dir, "/bin/sh -c 'trap \"\" TERM; exec sleep 37' & echo $! > " + dir.string() +
                 "/straggler_$MASTER_PORT.pid; exec sleep 36");
    config.job_timeout_ms_override = 300;
    config.kill_grace_ms_override = 300;
    const auto nodes = FourNodes();
    RoundExecutor executor(config, nodes);

    const RoundSummary summary = executor.Execute(FirstRound());
    if (summary.timed_out != 2) {
        std::cerr << "Expected two timed out jobs, got " << summary.timed_out << '\n';
        return false;
    }
    for (int port : {config.master_port_base, config.master_port_base + 1}) {
        const std::string pid_text =
            ReadText((dir / ("straggler_" + std::to_string(port) + ".pid")).string());
        const int pid = std::atoi(pid_text.c_str());
        if (pid <= 0) {
            std::cerr << "Background member did not record its pid\n";
            return false;
        }
        if (ProcessAlive(pid)) {
            std::cerr << "Process " << pid << " survived timeout and grace window\n";
            kill(pid, SIGKILL);
            return false;
        }
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_malformed_pairs_are_local() {
    const auto dir = MakeTempDir("exec_malformed");
    const RunConfig config = DirectConfig(dir, "echo 'busbw: 1'");
    const auto nodes = FourNodes();
    RoundExecutor executor(config, nodes);

    Round round;
    round.index = 1;
    round.pairs = {Pair{0, 0}, Pair{1, 9}, Pair{1, 2}};
    round.malformed_pairs = {"1 2 3"};

    const RoundSummary summary = executor.Execute(round);
    if (summary.launch_errors != 3 || summary.total_jobs != 1 || summary.succeeded != 1) {
        std::cerr << "Expected 3 launch errors and 1 job, got " << summary.launch_errors << " and "
                  << summary.total_jobs << '\n';
        return false;
    }
    if (summary.jobs[0].job_index != 0 || summary.jobs[0].port != config.master_port_base) {
        std::cerr << "Skipped pairs must not consume job indices\n";
        return false;
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_ports_past_range_are_rejected() {
    const auto dir = MakeTempDir("exec_ports");
    RunConfig config = DirectConfig(dir, "echo 'busbw: 1'");
    config.master_port_base = 65535;
    const auto nodes = FourNodes();
    RoundExecutor executor(config, nodes);

    const RoundSummary summary = executor.Execute(FirstRound());
    if (summary.total_jobs != 1 || summary.launch_errors != 1 || summary.jobs[0].port != 65535) {
        std::cerr << "Expected the job on port 65536 to be rejected, got " << summary.total_jobs
                  << " job(s) and " << summary.launch_errors << " launch error(s)\n";
        return false;
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_abort_before_launch() {
    const auto dir = MakeTempDir("exec_abort");
    const RunConfig config = DirectConfig(dir, "sleep 5");
    const auto nodes = FourNodes();
    std::atomic<bool> stop{true};
    RoundExecutor executor(config, nodes, {}, &stop);

    const RoundSummary summary = executor.Execute(FirstRound());
    if (!summary.aborted || summary.total_jobs != 0) {
        std::cerr << "Raised stop flag should prevent launches\n";
        return false;
    }
    std::filesystem::remove_all(dir);
    return true;
}

bool test_mpirun_command_line() {
    RunConfig config;
    config.processes_per_node = 8;
    config.net_iface = "ib0";
    config.extra_launch_args = {"--mca", "pml", "ob1"};
    config.workload_cmd = {"python", "npairs.py"};
    const auto nodes = NodeList::FromHostnames({"a", "b"}, 8);
    RoundExecutor executor(config, nodes);

    Job job;
    job.pair = Pair{0, 1};
    job.host_a = "a";
    job.host_b = "b";
    job.port = 45570;
    const auto command = executor.BuildCommand(job);

    const auto has = [&command](const std::string& value) {
        return std::find(command.begin(), command.end(), value) != command.end();
    };
    if (command.empty() || command.front() != "mpirun" || !has("16") || !has("a:8,b:8") ||
        !has("MASTER_ADDR=a") || !has("MASTER_PORT=45570") || !has("ib0") || !has("ob1")) {
        std::cerr << "mpirun command line is missing expected arguments\n";
        return false;
    }
    if (command[command.size() - 2] != "python" || command.back() != "npairs.py") {
        std::cerr << "Workload must come last\n";
        return false;
    }

    const auto env = executor.BuildEnvironment(job);
    if (env.at("WORLD_SIZE") != "16" || env.at("LOCAL_WORLD") != "8" || env.at("NCCL_DEBUG") != "INFO") {
        std::cerr << "Unexpected environment\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_success_and_environment()) {
        return 1;
    }
    if (!test_failure_does_not_stop_siblings()) {
        return 1;
    }
    if (!test_timeout_escalates()) {
        return 1;
    }
    if (!test_timeout_kills_group_members_that_outlive_leader()) {
        return 1;
    }
    if (!test_malformed_pairs_are_local()) {
        return 1;
    }
    if (!test_ports_past_range_are_rejected()) {
        return 1;
    }
    if (!test_abort_before_launch()) {
        return 1;
    }
    if (!test_mpirun_command_line()) {
        return 1;
    }
    return 0;
}
