#pragma once

#include <string>

namespace allpair::core::util {

class AtomicFileWriter {
public:
    // Writes to "<path>.tmp" and renames over <path>; readers never see a
    // half-written report.
    static bool Write(const std::string& path, const std::string& contents);
};

bool EnsureParentDir(const std::string& path);
bool AppendLine(const std::string& path, const std::string& line, const std::string& header = {});
bool ReadFile(const std::string& path, std::string& contents);

}  // namespace allpair::core::util
