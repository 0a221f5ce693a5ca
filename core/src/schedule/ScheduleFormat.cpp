#include "allpair/core/schedule/ScheduleFormat.h"

#include "allpair/core/util/StringUtil.h"

#include <nlohmann/json.hpp>

#include <sstream>
#include <vector>

namespace allpair::core::schedule {

namespace {

std::string Trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string StripQuotes(std::string value) {
    if (!value.empty() && value.front() == '"') {
        value.erase(0, 1);
    }
    if (!value.empty() && value.back() == '"') {
        value.pop_back();
    }
    return value;
}

bool ParsePair(const std::string& entry, Pair& pair) {
    std::istringstream iss(entry);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() != 2) {
        return false;
    }
    return util::ParseInt(tokens[0], pair.first) && util::ParseInt(tokens[1], pair.second);
}

}  // namespace

bool ParseScheduleFormat(const std::string& name, ScheduleFormat& format) {
    if (name == "text") {
        format = ScheduleFormat::Text;
    } else if (name == "csv") {
        format = ScheduleFormat::Csv;
    } else if (name == "jsonl") {
        format = ScheduleFormat::Jsonl;
    } else {
        return false;
    }
    return true;
}

std::string RenderSchedule(const Schedule& schedule,
                           ScheduleFormat format,
                           const std::vector<std::string>& labels) {
    const auto label = [&labels](int index) {
        if (index >= 0 && static_cast<size_t>(index) < labels.size()) {
            return labels[static_cast<size_t>(index)];
        }
        return std::to_string(index);
    };

    std::ostringstream out;
    switch (format) {
        case ScheduleFormat::Text:
            for (const auto& round : schedule.rounds) {
                for (size_t i = 0; i < round.pairs.size(); ++i) {
                    if (i > 0) {
                        out << " | ";
                    }
                    out << label(round.pairs[i].first) << ' ' << label(round.pairs[i].second);
                }
                out << '\n';
            }
            break;
        case ScheduleFormat::Csv:
            out << "round,a,b\n";
            for (const auto& round : schedule.rounds) {
                for (const auto& pair : round.pairs) {
                    out << round.index << ',' << label(pair.first) << ',' << label(pair.second) << '\n';
                }
            }
            break;
        case ScheduleFormat::Jsonl:
            for (const auto& round : schedule.rounds) {
                nlohmann::json line;
                line["round"] = round.index;
                line["pairs"] = nlohmann::json::array();
                for (const auto& pair : round.pairs) {
                    if (labels.empty()) {
                        line["pairs"].push_back({pair.first, pair.second});
                    } else {
                        line["pairs"].push_back({label(pair.first), label(pair.second)});
                    }
                }
                out << line.dump() << '\n';
            }
            break;
    }
    return out.str();
}

bool ParseScheduleText(const std::string& text, int node_count, Schedule& schedule, Error* error) {
    schedule = Schedule{};
    schedule.node_count = node_count;

    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        line = Trim(StripQuotes(Trim(line)));
        if (line.empty()) {
            continue;
        }

        Round round;
        round.index = static_cast<int>(schedule.rounds.size());
        std::istringstream entries(line);
        std::string entry;
        while (std::getline(entries, entry, '|')) {
            entry = Trim(entry);
            if (entry.empty()) {
                continue;
            }
            Pair pair;
            if (ParsePair(entry, pair)) {
                round.pairs.push_back(pair);
            } else {
                round.malformed_pairs.push_back(entry);
            }
        }
        schedule.rounds.push_back(std::move(round));
    }

    if (schedule.rounds.empty()) {
        return Fail(error, ErrorKind::ScheduleGeneration, "No combinations produced by generator.");
    }
    return true;
}

}  // namespace allpair::core::schedule
