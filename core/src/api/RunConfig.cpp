#include "allpair/core/api/RunConfig.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace allpair::core::api {

namespace {

constexpr int kMaxPort = 65535;
constexpr int kMaxSeconds = std::numeric_limits<int>::max() / 1000;

// Accepts either a JSON array of strings or one whitespace-separated string.
std::vector<std::string> ReadArgList(const nlohmann::json& node) {
    if (node.is_string()) {
        return SplitArgs(node.get<std::string>());
    }
    std::vector<std::string> out;
    if (node.is_array()) {
        for (const auto& item : node) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void ParseRoot(const nlohmann::json& root, RunConfig& config) {
    config = RunConfig{};
    config.hostfile = root.value("hostfile", config.hostfile);
    config.processes_per_node = root.value("processes_per_node", config.processes_per_node);
    config.log_dir = root.value("log_dir", config.log_dir);
    config.log_prefix = root.value("log_prefix", config.log_prefix);
    config.master_port_base = root.value("master_port_base", config.master_port_base);
    config.job_timeout_seconds = root.value("job_timeout_seconds", config.job_timeout_seconds);
    config.kill_grace_seconds = root.value("kill_grace_seconds", config.kill_grace_seconds);
    config.start_round = root.value("start_round", config.start_round);
    config.launcher = root.value("launcher", config.launcher);
    config.net_iface = root.value("net_iface", config.net_iface);
    config.nccl_debug = root.value("nccl_debug", config.nccl_debug);
    config.node_map = root.value("node_map", config.node_map);
    config.report_interval_seconds = root.value("report_interval_seconds", config.report_interval_seconds);
    config.summary_tail_lines = root.value("summary_tail_lines", config.summary_tail_lines);

    if (root.contains("extra_launch_args")) {
        config.extra_launch_args = ReadArgList(root.at("extra_launch_args"));
    }
    if (root.contains("workload_cmd")) {
        config.workload_cmd = ReadArgList(root.at("workload_cmd"));
    }
    if (root.contains("generator_cmd")) {
        config.generator_cmd = ReadArgList(root.at("generator_cmd"));
    }
}

}  // namespace

std::vector<std::string> SplitArgs(const std::string& value) {
    std::istringstream iss(value);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

int RunConfig::job_timeout_ms() const {
    if (job_timeout_ms_override > 0) {
        return job_timeout_ms_override;
    }
    return static_cast<int>(std::min<long long>(job_timeout_seconds * 1000LL, std::numeric_limits<int>::max()));
}

int RunConfig::kill_grace_ms() const {
    if (kill_grace_ms_override > 0) {
        return kill_grace_ms_override;
    }
    return static_cast<int>(std::min<long long>(kill_grace_seconds * 1000LL, std::numeric_limits<int>::max()));
}

bool RunConfig::Validate(Error* error) const {
    if (processes_per_node < 1) {
        return Fail(error, ErrorKind::Configuration, "processes_per_node must be >= 1");
    }
    if (log_dir.empty()) {
        return Fail(error, ErrorKind::Configuration, "log_dir must not be empty");
    }
    if (master_port_base < 1 || master_port_base > kMaxPort) {
        return Fail(error, ErrorKind::Configuration, "master_port_base out of range");
    }
    if (job_timeout_seconds < 0 || kill_grace_seconds < 0) {
        return Fail(error, ErrorKind::Configuration, "timeouts must not be negative");
    }
    if (job_timeout_seconds > kMaxSeconds || kill_grace_seconds > kMaxSeconds) {
        return Fail(error, ErrorKind::Configuration,
                    "timeouts must not exceed " + std::to_string(kMaxSeconds) + " seconds");
    }
    if (start_round < 0) {
        return Fail(error, ErrorKind::Configuration, "start_round must not be negative");
    }
    if (launcher != "mpirun" && launcher != "direct") {
        return Fail(error, ErrorKind::Configuration,
                    "Unknown launcher '" + launcher + "' (expected mpirun or direct)");
    }
    if (workload_cmd.empty()) {
        return Fail(error, ErrorKind::Configuration, "workload_cmd must not be empty");
    }
    if (report_interval_seconds < 0) {
        return Fail(error, ErrorKind::Configuration, "report_interval_seconds must not be negative");
    }
    return true;
}

bool RunConfig::ValidateForNodes(int node_count, Error* error) const {
    const int jobs_per_round = node_count / 2;
    if (jobs_per_round > 0 &&
        static_cast<long long>(master_port_base) + jobs_per_round - 1 > kMaxPort) {
        return Fail(error, ErrorKind::Configuration,
                    "master_port_base " + std::to_string(master_port_base) + " leaves no room for " +
                        std::to_string(jobs_per_round) + " jobs per round (ports end at " +
                        std::to_string(kMaxPort) + ")");
    }
    return true;
}

bool RunConfig::LoadFromFile(const std::string& path, RunConfig& config, Error* error) {
    std::ifstream input(path);
    if (!input) {
        return Fail(error, ErrorKind::Configuration, "Failed to open config: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadFromString(buffer.str(), config, error);
}

bool RunConfig::LoadFromString(const std::string& text, RunConfig& config, Error* error) {
    try {
        const auto root = nlohmann::json::parse(text);
        if (!root.is_object()) {
            return Fail(error, ErrorKind::Configuration, "Config root must be a JSON object");
        }
        ParseRoot(root, config);
        return true;
    } catch (const std::exception& ex) {
        return Fail(error, ErrorKind::Configuration, std::string("Failed to parse JSON: ") + ex.what());
    }
}

std::string RunConfig::ToJsonString(const RunConfig& config) {
    nlohmann::json root;
    root["hostfile"] = config.hostfile;
    root["processes_per_node"] = config.processes_per_node;
    root["log_dir"] = config.log_dir;
    root["log_prefix"] = config.log_prefix;
    root["master_port_base"] = config.master_port_base;
    root["job_timeout_seconds"] = config.job_timeout_seconds;
    root["kill_grace_seconds"] = config.kill_grace_seconds;
    root["extra_launch_args"] = config.extra_launch_args;
    root["start_round"] = config.start_round;
    root["workload_cmd"] = config.workload_cmd;
    root["launcher"] = config.launcher;
    root["net_iface"] = config.net_iface;
    root["nccl_debug"] = config.nccl_debug;
    root["node_map"] = config.node_map;
    root["generator_cmd"] = config.generator_cmd;
    root["report_interval_seconds"] = config.report_interval_seconds;
    root["summary_tail_lines"] = config.summary_tail_lines;
    return root.dump();
}

}  // namespace allpair::core::api
