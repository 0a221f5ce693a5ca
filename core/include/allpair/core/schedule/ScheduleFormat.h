#pragma once

#include "allpair/core/error/Error.h"
#include "allpair/core/schedule/ScheduleTypes.h"

#include <string>
#include <vector>

namespace allpair::core::schedule {

enum class ScheduleFormat {
    Text,
    Csv,
    Jsonl
};

bool ParseScheduleFormat(const std::string& name, ScheduleFormat& format);

// text:  "0 3 | 1 2" per round
// csv:   "round,a,b" header then one row per pair
// jsonl: {"round":0,"pairs":[[0,3],[1,2]]} per round
//
// With labels (one per node index), pairs are printed as labels instead of
// indices, e.g. hostnames from a node file.
std::string RenderSchedule(const Schedule& schedule,
                           ScheduleFormat format,
                           const std::vector<std::string>& labels = {});

// Reads the text form. Leading whitespace and surrounding quotes are tolerated.
// Entries that are not two integers are kept verbatim in Round::malformed_pairs.
bool ParseScheduleText(const std::string& text, int node_count, Schedule& schedule, Error* error);

}  // namespace allpair::core::schedule
