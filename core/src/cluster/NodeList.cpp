#include "allpair/core/cluster/NodeList.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace allpair::core::cluster {

namespace {

std::string FirstToken(const std::string& line) {
    std::istringstream iss(line);
    std::string token;
    iss >> token;
    return token;
}

}  // namespace

bool NodeList::LoadFile(const std::string& path,
                        int processes_per_node,
                        std::vector<Node>& nodes,
                        Error* error) {
    nodes.clear();
    std::ifstream file(path);
    if (!file) {
        return Fail(error, ErrorKind::Configuration, "Host file not found: " + path);
    }

    std::vector<std::string> hostnames;
    std::string line;
    while (std::getline(file, line)) {
        const std::string host = FirstToken(line);
        if (host.empty() || host[0] == '#') {
            continue;
        }
        hostnames.push_back(host);
    }

    nodes = FromHostnames(hostnames, processes_per_node);
    return true;
}

std::vector<Node> NodeList::FromHostnames(const std::vector<std::string>& hostnames,
                                          int processes_per_node) {
    std::vector<Node> nodes;
    nodes.reserve(hostnames.size());
    for (size_t i = 0; i < hostnames.size(); ++i) {
        Node node;
        node.index = static_cast<int>(i);
        node.hostname = hostnames[i];
        node.processes_per_node = processes_per_node;
        nodes.push_back(std::move(node));
    }
    return nodes;
}

}  // namespace allpair::core::cluster
