#pragma once

#include <optional>
#include <string>

namespace allpair::core::results {

// Labels the workload prints, e.g. "latency: 0.0123 busbw: 187.4". The
// bandwidth label doubles as the success marker for checkpointing.
inline constexpr const char* kLatencyLabel = "latency:";
inline constexpr const char* kBandwidthLabel = "busbw:";

struct JobLogName {
    std::string prefix;
    int round_index = 0;
    int job_index = 0;
    std::string host_a;
    std::string host_b;
};

struct LogMetrics {
    double avg_latency = 0.0;
    double avg_bandwidth = 0.0;
    int latency_samples = 0;
    int bandwidth_samples = 0;
};

// <prefix>round<R>_job<J>_<hostA>--<hostB>.log
std::string JobLogFileName(const std::string& prefix,
                           int round_index,
                           int job_index,
                           const std::string& host_a,
                           const std::string& host_b);
std::optional<JobLogName> ParseJobLogFileName(const std::string& file_name);

bool ContainsSuccessMarker(const std::string& text);
bool LogHasSuccessMarker(const std::string& path);

// Averages every occurrence of each label independently.
LogMetrics ExtractMetrics(const std::string& text);

}  // namespace allpair::core::results
