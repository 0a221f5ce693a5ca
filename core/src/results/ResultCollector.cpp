#include "allpair/core/results/ResultCollector.h"

#include "allpair/core/results/LogMetrics.h"
#include "allpair/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace allpair::core::results {

namespace {

std::vector<std::string> SplitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, ',')) {
        const auto start = field.find_first_not_of(' ');
        fields.push_back(start == std::string::npos ? std::string{} : field.substr(start));
    }
    return fields;
}

constexpr const char* kIncompleteTag = "\tincomplete";

// Tracker lines are "<log>" once a log produced its real row, or
// "<log>\tincomplete" for a zero row written by a final pass. Later lines win.
std::unordered_map<std::string, bool> LoadTracker(const std::string& path) {
    std::unordered_map<std::string, bool> processed;
    std::string contents;
    if (!util::ReadFile(path, contents)) {
        return processed;
    }
    const std::string tag = kIncompleteTag;
    std::istringstream input(contents);
    std::string line;
    while (std::getline(input, line)) {
        if (line.empty()) {
            continue;
        }
        if (line.size() > tag.size() && line.compare(line.size() - tag.size(), tag.size(), tag) == 0) {
            processed[line.substr(0, line.size() - tag.size())] = false;
        } else {
            processed[line] = true;
        }
    }
    return processed;
}

// Rewrites a round table with the row for record's host pair replaced. The
// row is appended when the table has none for that pair.
bool ReplaceRow(const std::string& path,
                const ResultRecord& record,
                const std::string& row,
                const std::string& header) {
    std::string contents;
    if (!util::ReadFile(path, contents)) {
        return util::AppendLine(path, row, header);
    }
    std::ostringstream out;
    std::istringstream input(contents);
    std::string line;
    bool replaced = false;
    bool first = true;
    while (std::getline(input, line)) {
        if (!first && !replaced) {
            const auto fields = SplitCsvLine(line);
            if (fields.size() == 6 && fields[0] == record.node_a && fields[2] == record.node_b) {
                line = row;
                replaced = true;
            }
        }
        first = false;
        out << line << '\n';
    }
    if (!replaced) {
        if (contents.empty()) {
            out << header << '\n';
        }
        out << row << '\n';
    }
    return util::AtomicFileWriter::Write(path, out.str());
}

}  // namespace

ResultCollector::ResultCollector(std::string log_root, cluster::NodeAliasMap aliases, LogFn log_fn)
    : log_root_(std::move(log_root)),
      aliases_(std::move(aliases)),
      log_fn_(std::move(log_fn)) {}

std::string ResultCollector::RoundTablePath(int round_index) const {
    return (std::filesystem::path(log_root_) /
            ("round_" + std::to_string(round_index) + "_results.csv"))
        .string();
}

std::string ResultCollector::AggregatePath(int node_count) const {
    return (std::filesystem::path(log_root_) /
            ("allpair_" + std::to_string(node_count) + "_nodes.csv"))
        .string();
}

std::string ResultCollector::TrackerPath() const {
    return (std::filesystem::path(log_root_) / kTrackerFile).string();
}

std::string ResultCollector::FormatRow(const ResultRecord& record) {
    std::ostringstream row;
    row << record.node_a << ',' << record.alias_a << ',' << record.node_b << ',' << record.alias_b
        << ',' << std::fixed << std::setprecision(8) << record.avg_latency << ','
        << record.avg_bandwidth;
    return row.str();
}

std::vector<std::string> ResultCollector::FindJobLogs() const {
    std::vector<std::string> logs;
    std::error_code ec;
    if (!std::filesystem::is_directory(log_root_, ec)) {
        return logs;
    }
    std::filesystem::recursive_directory_iterator it(
        log_root_, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (!ParseJobLogFileName(it->path().filename().string())) {
            continue;
        }
        logs.push_back(it->path().lexically_relative(log_root_).generic_string());
    }
    std::sort(logs.begin(), logs.end());
    return logs;
}

int ResultCollector::CollectOnce(bool include_incomplete, std::string* error) {
    auto processed = LoadTracker(TrackerPath());
    int appended = 0;

    for (const auto& relative : FindJobLogs()) {
        const auto tracked = processed.find(relative);
        if (tracked != processed.end() && tracked->second) {
            continue;
        }
        const bool replaces_zero_row = tracked != processed.end();

        const std::filesystem::path full_path = std::filesystem::path(log_root_) / relative;
        const auto name = ParseJobLogFileName(full_path.filename().string());
        if (!name) {
            continue;
        }

        std::string contents;
        if (!util::ReadFile(full_path.string(), contents)) {
            Log("[collector] Failed to read " + full_path.string());
            continue;
        }
        const bool complete = ContainsSuccessMarker(contents);
        if (!complete && (replaces_zero_row || !include_incomplete)) {
            continue;
        }

        const LogMetrics metrics = ExtractMetrics(contents);
        ResultRecord record;
        record.round_index = name->round_index;
        record.node_a = name->host_a;
        record.alias_a = aliases_.Lookup(name->host_a);
        record.node_b = name->host_b;
        record.alias_b = aliases_.Lookup(name->host_b);
        record.avg_latency = metrics.avg_latency;
        record.avg_bandwidth = metrics.avg_bandwidth;

        const std::string table = RoundTablePath(record.round_index);
        const bool written = replaces_zero_row
                                 ? ReplaceRow(table, record, FormatRow(record), kRoundHeader)
                                 : util::AppendLine(table, FormatRow(record), kRoundHeader);
        if (!written) {
            if (error) {
                *error = "Failed to update " + table;
            }
            continue;
        }
        if (!util::AppendLine(TrackerPath(), complete ? relative : relative + kIncompleteTag)) {
            if (error) {
                *error = "Failed to update " + TrackerPath();
            }
        }
        processed[relative] = complete;
        appended += 1;
    }

    if (appended > 0) {
        Log("[collector] Recorded " + std::to_string(appended) + " new result row(s)");
    }
    return appended;
}

bool ResultCollector::Aggregate(int node_count, std::string* output_path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::is_directory(log_root_, ec)) {
        if (error) {
            *error = "Log directory " + log_root_ + " does not exist.";
        }
        return false;
    }

    static const std::regex pattern(R"(^round_([0-9]+)_results\.csv$)");
    std::vector<std::pair<long, std::string>> tables;
    for (const auto& entry : std::filesystem::directory_iterator(log_root_, ec)) {
        const std::string file_name = entry.path().filename().string();
        std::smatch match;
        if (std::regex_match(file_name, match, pattern)) {
            tables.emplace_back(std::strtol(match[1].str().c_str(), nullptr, 10), entry.path().string());
        }
    }
    std::sort(tables.begin(), tables.end());

    std::ostringstream csv;
    csv << kAggregateHeader << '\n';
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& table : tables) {
        std::string contents;
        if (!util::ReadFile(table.second, contents)) {
            Log("[collector] Failed to read " + table.second);
            continue;
        }
        std::istringstream input(contents);
        std::string line;
        bool header = true;
        while (std::getline(input, line)) {
            if (header) {
                header = false;
                continue;
            }
            if (line.empty()) {
                continue;
            }
            csv << table.first << ',' << line << '\n';

            const auto fields = SplitCsvLine(line);
            if (fields.size() == 6) {
                rows.push_back({
                    {"round", table.first},
                    {"node_a", fields[0]},
                    {"alias_a", fields[1]},
                    {"node_b", fields[2]},
                    {"alias_b", fields[3]},
                    {"avg_latency", std::strtod(fields[4].c_str(), nullptr)},
                    {"avg_busbw", std::strtod(fields[5].c_str(), nullptr)},
                });
            }
        }
    }

    const std::string path = AggregatePath(node_count);
    if (!util::AtomicFileWriter::Write(path, csv.str())) {
        if (error) {
            *error = "Failed to write " + path;
        }
        return false;
    }
    const std::string json_path = std::filesystem::path(path).replace_extension(".json").string();
    if (!util::AtomicFileWriter::Write(json_path, rows.dump(2))) {
        if (error) {
            *error = "Failed to write " + json_path;
        }
        return false;
    }

    if (output_path) {
        *output_path = path;
    }
    Log("[collector] Aggregated results generated at " + path);
    return true;
}

void ResultCollector::Log(const std::string& line) const {
    if (log_fn_) {
        log_fn_(line);
    }
}

BackgroundCollector::BackgroundCollector(ResultCollector& collector, int interval_seconds)
    : collector_(collector),
      interval_seconds_(std::max(1, interval_seconds)) {}

BackgroundCollector::~BackgroundCollector() {
    Stop();
}

void BackgroundCollector::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { Loop(); });
}

void BackgroundCollector::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BackgroundCollector::Loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(interval_seconds_), [this]() {
                return !running_.load();
            });
            if (!running_.load()) {
                return;
            }
        }
        std::string error;
        collector_.CollectOnce(false, &error);
    }
}

}  // namespace allpair::core::results
