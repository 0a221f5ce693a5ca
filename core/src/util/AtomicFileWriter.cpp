#include "allpair/core/util/AtomicFileWriter.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace allpair::core::util {

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents) {
    if (!EnsureParentDir(path)) {
        return false;
    }
    const std::string temp_path = path + ".tmp";

    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        std::cerr << "[atomic] Failed to open temp file: " << temp_path << '\n';
        return false;
    }
    output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    output.flush();
    if (!output) {
        std::cerr << "[atomic] Failed to write temp file: " << temp_path << '\n';
        return false;
    }
    output.close();

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::cerr << "[atomic] rename failed for " << path << '\n';
        return false;
    }
    return true;
}

bool EnsureParentDir(const std::string& path) {
    const std::filesystem::path fs_path(path);
    if (fs_path.parent_path().empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(fs_path.parent_path(), ec);
    if (ec) {
        std::cerr << "[atomic] Failed to create directory " << fs_path.parent_path().string()
                  << ": " << ec.message() << '\n';
        return false;
    }
    return true;
}

bool AppendLine(const std::string& path, const std::string& line, const std::string& header) {
    if (!EnsureParentDir(path)) {
        return false;
    }
    std::error_code ec;
    const bool needs_header = !header.empty() &&
                              (!std::filesystem::exists(path, ec) ||
                               std::filesystem::file_size(path, ec) == 0);
    std::ofstream output(path, std::ios::binary | std::ios::app);
    if (!output) {
        std::cerr << "[atomic] Failed to open for append: " << path << '\n';
        return false;
    }
    if (needs_header) {
        output << header << '\n';
    }
    output << line << '\n';
    return static_cast<bool>(output);
}

bool ReadFile(const std::string& path, std::string& contents) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    contents = buffer.str();
    return true;
}

}  // namespace allpair::core::util
