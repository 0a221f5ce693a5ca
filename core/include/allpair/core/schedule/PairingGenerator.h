#pragma once

#include "allpair/core/error/Error.h"
#include "allpair/core/schedule/ScheduleTypes.h"

#include <string>

namespace allpair::core::schedule {

class PairingGenerator {
public:
    // Circle-method 1-factorization of K_n. Even n gives n-1 rounds of n/2 pairs,
    // odd n gives n rounds with one node idle per round.
    static bool Generate(int node_count, Schedule& schedule, Error* error);

    // Checks that no index repeats inside a round and that every unordered pair
    // of [0, node_count) appears exactly once. The report is human readable.
    static bool Verify(const Schedule& schedule, int node_count, std::string* report);
};

}  // namespace allpair::core::schedule
