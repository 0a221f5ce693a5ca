#include "allpair/core/results/LogMetrics.h"

#include "allpair/core/util/AtomicFileWriter.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <sstream>

namespace allpair::core::results {

namespace {

// Sum and count of the numbers that follow each occurrence of label.
void ScanLabel(const std::string& text, const char* label, double& sum, int& count) {
    const size_t label_len = std::strlen(label);
    size_t pos = text.find(label);
    while (pos != std::string::npos) {
        const char* start = text.c_str() + pos + label_len;
        errno = 0;
        char* end = nullptr;
        const double value = std::strtod(start, &end);
        if (end != start && errno == 0) {
            sum += value;
            count += 1;
        }
        pos = text.find(label, pos + label_len);
    }
}

}  // namespace

std::string JobLogFileName(const std::string& prefix,
                           int round_index,
                           int job_index,
                           const std::string& host_a,
                           const std::string& host_b) {
    std::ostringstream name;
    name << prefix << "round" << round_index << "_job" << job_index << '_' << host_a << "--"
         << host_b << ".log";
    return name.str();
}

std::optional<JobLogName> ParseJobLogFileName(const std::string& file_name) {
    static const std::regex pattern(R"(^(.*?)round([0-9]+)_job([0-9]+)_(.+)\.log$)");
    std::smatch match;
    if (!std::regex_match(file_name, match, pattern)) {
        return std::nullopt;
    }

    const std::string hosts = match[4].str();
    const size_t sep = hosts.rfind("--");
    if (sep == std::string::npos || sep == 0 || sep + 2 >= hosts.size()) {
        return std::nullopt;
    }

    JobLogName name;
    name.prefix = match[1].str();
    name.round_index = std::atoi(match[2].str().c_str());
    name.job_index = std::atoi(match[3].str().c_str());
    name.host_a = hosts.substr(0, sep);
    name.host_b = hosts.substr(sep + 2);
    return name;
}

bool ContainsSuccessMarker(const std::string& text) {
    return text.find(kBandwidthLabel) != std::string::npos;
}

bool LogHasSuccessMarker(const std::string& path) {
    std::string contents;
    if (!util::ReadFile(path, contents)) {
        return false;
    }
    return ContainsSuccessMarker(contents);
}

LogMetrics ExtractMetrics(const std::string& text) {
    LogMetrics metrics;
    double latency_sum = 0.0;
    double bandwidth_sum = 0.0;
    ScanLabel(text, kLatencyLabel, latency_sum, metrics.latency_samples);
    ScanLabel(text, kBandwidthLabel, bandwidth_sum, metrics.bandwidth_samples);
    if (metrics.latency_samples > 0) {
        metrics.avg_latency = latency_sum / metrics.latency_samples;
    }
    if (metrics.bandwidth_samples > 0) {
        metrics.avg_bandwidth = bandwidth_sum / metrics.bandwidth_samples;
    }
    return metrics;
}

}  // namespace allpair::core::results
