#include "allpair/core/cluster/NodeAliasMap.h"

#include <fstream>

namespace allpair::core::cluster {

namespace {

std::string Trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

}  // namespace

NodeAliasMap NodeAliasMap::LoadFile(const std::string& path, std::string* error) {
    NodeAliasMap map;
    if (path.empty()) {
        return map;
    }
    std::ifstream file(path);
    if (!file) {
        if (error) {
            *error = "Failed to open node map: " + path;
        }
        return map;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const size_t comma = line.find(',');
        if (comma == std::string::npos) {
            continue;
        }
        const std::string host = Trim(line.substr(0, comma));
        const std::string alias = Trim(line.substr(comma + 1));
        if (host.empty() || host == "pod_name" || host == "host") {
            continue;
        }
        map.Set(host, alias.empty() ? kUnknown : alias);
    }
    return map;
}

std::string NodeAliasMap::Lookup(const std::string& host) const {
    const auto it = aliases_.find(host);
    if (it == aliases_.end()) {
        return kUnknown;
    }
    return it->second;
}

}  // namespace allpair::core::cluster
