#pragma once

#include "allpair/core/error/Error.h"

#include <string>
#include <vector>

namespace allpair::core::cluster {

struct Node {
    int index = 0;
    std::string hostname;
    int processes_per_node = 1;
};

class NodeList {
public:
    // Host file format: first whitespace-delimited token of each non-blank line.
    // Trailing tokens (slot counts and the like) belong to the launcher.
    static bool LoadFile(const std::string& path,
                         int processes_per_node,
                         std::vector<Node>& nodes,
                         Error* error);
    static std::vector<Node> FromHostnames(const std::vector<std::string>& hostnames,
                                           int processes_per_node);
};

}  // namespace allpair::core::cluster
