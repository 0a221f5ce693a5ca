#pragma once

#include <string>
#include <vector>

namespace allpair::core::schedule {

struct Pair {
    int first = -1;
    int second = -1;
};

inline bool operator==(const Pair& a, const Pair& b) {
    return a.first == b.first && a.second == b.second;
}

struct Round {
    int index = 0;
    std::vector<Pair> pairs;
    // Raw text of pair entries that could not be parsed from an external schedule.
    std::vector<std::string> malformed_pairs;
};

struct Schedule {
    int node_count = 0;
    std::vector<Round> rounds;

    bool empty() const { return rounds.empty(); }
    size_t size() const { return rounds.size(); }
};

}  // namespace allpair::core::schedule
