#pragma once

#include <string>
#include <vector>

namespace allpair::core::results {

// Job logs below root (any depth), full paths, sorted.
std::vector<std::string> FindJobLogFiles(const std::string& root);

// Last `count` lines of a file. Empty when the file is missing or empty.
std::vector<std::string> TailLines(const std::string& path, int count);

// End-of-run listing: every job log followed by its tail.
std::string RenderLogSummary(const std::string& root, int tail_lines);

}  // namespace allpair::core::results
