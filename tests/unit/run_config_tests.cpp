#include "allpair/core/api/RunConfig.h"

#include <iostream>
#include <string>

namespace {

using allpair::core::Error;
using allpair::core::ErrorKind;
using allpair::core::api::RunConfig;

bool test_defaults_from_empty_object() {
    RunConfig config;
    Error error;
    if (!RunConfig::LoadFromString("{}", config, &error)) {
        std::cerr << "Empty object should load: " << error.message << '\n';
        return false;
    }
    if (config.processes_per_node != 8 || config.master_port_base != 45566 ||
        config.job_timeout_seconds != 600 || config.kill_grace_seconds != 10 ||
        config.launcher != "mpirun" || config.report_interval_seconds != 30) {
        std::cerr << "Defaults not applied\n";
        return false;
    }
    if (config.job_timeout_ms() != 600000 || config.kill_grace_ms() != 10000) {
        std::cerr << "Millisecond accessors disagree with seconds fields\n";
        return false;
    }
    if (!config.Validate(&error)) {
        std::cerr << "Defaults should validate: " << error.message << '\n';
        return false;
    }
    return true;
}

bool test_argument_lists_accept_string_or_array() {
    const std::string text = R"({
        "hostfile": "/etc/allpair/hosts",
        "processes_per_node": 4,
        "extra_launch_args": "--mca pml ob1",
        "workload_cmd": ["python3", "bench.py", "--iters", "20"],
        "launcher": "direct",
        "start_round": 5
    })";
    RunConfig config;
    Error error;
    if (!RunConfig::LoadFromString(text, config, &error)) {
        std::cerr << "Config failed to load: " << error.message << '\n';
        return false;
    }
    if (config.extra_launch_args.size() != 3 || config.extra_launch_args[2] != "ob1") {
        std::cerr << "extra_launch_args string was not split\n";
        return false;
    }
    if (config.workload_cmd.size() != 4 || config.workload_cmd[1] != "bench.py") {
        std::cerr << "workload_cmd array not read\n";
        return false;
    }
    if (config.processes_per_node != 4 || config.start_round != 5 || config.launcher != "direct") {
        std::cerr << "Scalar fields not read\n";
        return false;
    }
    const std::string echoed = RunConfig::ToJsonString(config);
    if (echoed.find("\"/etc/allpair/hosts\"") == std::string::npos) {
        std::cerr << "ToJsonString lost the hostfile: " << echoed << '\n';
        return false;
    }
    return true;
}

bool test_parse_errors_are_configuration_errors() {
    RunConfig config;
    Error error;
    if (RunConfig::LoadFromString("{ not json", config, &error) ||
        error.kind != ErrorKind::Configuration) {
        std::cerr << "Malformed JSON should be a configuration error\n";
        return false;
    }
    error = Error{};
    if (RunConfig::LoadFromString("[1, 2]", config, &error) || error.kind != ErrorKind::Configuration) {
        std::cerr << "Non-object root should be rejected\n";
        return false;
    }
    error = Error{};
    if (RunConfig::LoadFromString(R"({"processes_per_node": "eight"})", config, &error)) {
        std::cerr << "Wrongly typed field should be rejected\n";
        return false;
    }
    error = Error{};
    if (RunConfig::LoadFromFile("/nonexistent/allpair.json", config, &error) ||
        error.message.find("/nonexistent/allpair.json") == std::string::npos) {
        std::cerr << "Missing file should name the path\n";
        return false;
    }
    return true;
}

bool test_validate_rejects_bad_values() {
    RunConfig config;
    Error error;

    config.launcher = "ssh";
    if (config.Validate(&error) || error.kind != ErrorKind::Configuration) {
        std::cerr << "Unknown launcher accepted\n";
        return false;
    }

    config = RunConfig{};
    config.processes_per_node = 0;
    if (config.Validate(&error)) {
        std::cerr << "processes_per_node 0 accepted\n";
        return false;
    }

    config = RunConfig{};
    config.workload_cmd.clear();
    if (config.Validate(&error)) {
        std::cerr << "Empty workload accepted\n";
        return false;
    }

    config = RunConfig{};
    config.master_port_base = 70000;
    if (config.Validate(&error)) {
        std::cerr << "Port out of range accepted\n";
        return false;
    }
    return true;
}

bool test_large_timeouts_are_bounded() {
    RunConfig config;
    Error error;
    config.job_timeout_seconds = 3000000;
    if (config.Validate(&error) || error.kind != ErrorKind::Configuration) {
        std::cerr << "Timeout beyond the millisecond range accepted\n";
        return false;
    }
    if (config.job_timeout_ms() <= 0) {
        std::cerr << "Oversized timeout wrapped to " << config.job_timeout_ms() << '\n';
        return false;
    }

    config = RunConfig{};
    config.kill_grace_seconds = 3000000;
    if (config.Validate(&error)) {
        std::cerr << "Grace window beyond the millisecond range accepted\n";
        return false;
    }

    config = RunConfig{};
    config.job_timeout_seconds = 2147483;
    if (!config.Validate(&error) || config.job_timeout_ms() != 2147483000) {
        std::cerr << "Largest representable timeout rejected\n";
        return false;
    }
    return true;
}

bool test_port_range_covers_widest_round() {
    RunConfig config;
    Error error;
    config.master_port_base = 65530;
    if (!config.ValidateForNodes(12, &error)) {
        std::cerr << "Six ports from 65530 fit: " << error.message << '\n';
        return false;
    }
    if (config.ValidateForNodes(14, &error) || error.kind != ErrorKind::Configuration) {
        std::cerr << "Seven ports from 65530 do not fit\n";
        return false;
    }
    if (!config.ValidateForNodes(1, &error)) {
        std::cerr << "A single node needs no port\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_defaults_from_empty_object()) {
        return 1;
    }
    if (!test_argument_lists_accept_string_or_array()) {
        return 1;
    }
    if (!test_parse_errors_are_configuration_errors()) {
        return 1;
    }
    if (!test_validate_rejects_bad_values()) {
        return 1;
    }
    if (!test_large_timeouts_are_bounded()) {
        return 1;
    }
    if (!test_port_range_covers_widest_round()) {
        return 1;
    }
    return 0;
}
