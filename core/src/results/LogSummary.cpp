#include "allpair/core/results/LogSummary.h"

#include "allpair/core/results/LogMetrics.h"
#include "allpair/core/util/AtomicFileWriter.h"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace allpair::core::results {

std::vector<std::string> FindJobLogFiles(const std::string& root) {
    std::vector<std::string> logs;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return logs;
    }
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && ParseJobLogFileName(it->path().filename().string())) {
            logs.push_back(it->path().string());
        }
    }
    std::sort(logs.begin(), logs.end());
    return logs;
}

std::vector<std::string> TailLines(const std::string& path, int count) {
    std::string contents;
    if (count <= 0 || !util::ReadFile(path, contents)) {
        return {};
    }
    std::deque<std::string> tail;
    std::istringstream input(contents);
    std::string line;
    while (std::getline(input, line)) {
        tail.push_back(line);
        if (static_cast<int>(tail.size()) > count) {
            tail.pop_front();
        }
    }
    return std::vector<std::string>(tail.begin(), tail.end());
}

std::string RenderLogSummary(const std::string& root, int tail_lines) {
    std::ostringstream out;
    const auto logs = FindJobLogFiles(root);
    if (logs.empty()) {
        out << "No job logs found in " << root << '\n';
        return out.str();
    }
    out << "Job logs in " << root << ":\n";
    for (const auto& path : logs) {
        out << "\n--- " << path << " ---\n";
        const auto lines = TailLines(path, tail_lines);
        if (lines.empty()) {
            out << "(empty log)\n";
            continue;
        }
        for (const auto& line : lines) {
            out << line << '\n';
        }
    }
    return out.str();
}

}  // namespace allpair::core::results
