#pragma once

#include "allpair/core/error/Error.h"

#include <string>
#include <vector>

namespace allpair::core::api {

struct RunConfig {
    std::string hostfile = "hostfile";
    int processes_per_node = 8;
    std::string log_dir = "logs";
    std::string log_prefix;
    int master_port_base = 45566;
    int job_timeout_seconds = 600;
    int kill_grace_seconds = 10;
    std::vector<std::string> extra_launch_args;
    int start_round = 0;
    std::vector<std::string> workload_cmd = {"python", "npairs.py"};
    std::string launcher = "mpirun";
    std::string net_iface = "eth0";
    std::string nccl_debug = "INFO";
    std::string node_map;
    std::vector<std::string> generator_cmd;
    int report_interval_seconds = 30;
    int summary_tail_lines = 20;

    // Sub-second overrides used when the second-granularity fields are too coarse
    // (tests, dry runs). Zero means "use the seconds fields".
    int job_timeout_ms_override = 0;
    int kill_grace_ms_override = 0;

    int job_timeout_ms() const;
    int kill_grace_ms() const;

    bool Validate(Error* error) const;
    // Checks that one master port per job of the widest round fits below 65536.
    bool ValidateForNodes(int node_count, Error* error) const;

    static bool LoadFromFile(const std::string& path, RunConfig& config, Error* error);
    static bool LoadFromString(const std::string& text, RunConfig& config, Error* error);
    static std::string ToJsonString(const RunConfig& config);
};

// Splits on whitespace the way a shell word-splits an unquoted variable.
std::vector<std::string> SplitArgs(const std::string& value);

}  // namespace allpair::core::api
