#include "allpair/core/cluster/NodeList.h"
#include "allpair/core/error/Error.h"
#include "allpair/core/schedule/PairingGenerator.h"
#include "allpair/core/schedule/ScheduleFormat.h"
#include "allpair/core/util/StringUtil.h"

#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cerr << "Usage: allpair-pairs (--nitems N | --nodes-file FILE) [--format text|csv|jsonl] "
                 "[--verify]"
              << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    int node_count = -1;
    std::string nodes_file;
    std::string format_name = "text";
    bool verify = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--nitems" || arg == "--format" || arg == "--nodes-file") {
            if (i + 1 >= argc) {
                std::cerr << "[allpair-pairs] " << arg << " requires a value." << '\n';
                return 1;
            }
            const std::string value = argv[++i];
            if (arg == "--format") {
                format_name = value;
            } else if (arg == "--nodes-file") {
                nodes_file = value;
            } else if (!allpair::core::util::ParseInt(value, node_count)) {
                std::cerr << "[allpair-pairs] --nitems expects an integer, got '" << value << "'"
                          << '\n';
                return 1;
            }
        } else if (arg == "--verify") {
            verify = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        } else {
            std::cerr << "[allpair-pairs] Unexpected argument: " << arg << '\n';
            PrintUsage();
            return 1;
        }
    }

    allpair::core::Error error;
    std::vector<std::string> labels;
    if (!nodes_file.empty()) {
        // A node file wins over --nitems.
        std::vector<allpair::core::cluster::Node> nodes;
        if (!allpair::core::cluster::NodeList::LoadFile(nodes_file, 1, nodes, &error)) {
            std::cerr << "[allpair-pairs] " << error.message << '\n';
            return 2;
        }
        for (const auto& node : nodes) {
            labels.push_back(node.hostname);
        }
        node_count = static_cast<int>(labels.size());
    } else if (node_count < 0) {
        PrintUsage();
        return 1;
    }

    allpair::core::schedule::ScheduleFormat format;
    if (!allpair::core::schedule::ParseScheduleFormat(format_name, format)) {
        std::cerr << "[allpair-pairs] Unknown format: " << format_name << '\n';
        return 1;
    }

    allpair::core::schedule::Schedule schedule;
    if (!allpair::core::schedule::PairingGenerator::Generate(node_count, schedule, &error)) {
        std::cerr << "[allpair-pairs] " << error.message << '\n';
        return 3;
    }

    std::cout << allpair::core::schedule::RenderSchedule(schedule, format, labels);

    if (verify) {
        std::string report;
        const bool ok = allpair::core::schedule::PairingGenerator::Verify(schedule, node_count, &report);
        std::cerr << report;
        if (!ok) {
            return 1;
        }
    }
    return 0;
}
