#include "allpair/core/schedule/PairingGenerator.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace allpair::core::schedule {

namespace {

constexpr int kBye = -1;
constexpr size_t kReportLimit = 10;

std::vector<int> BuildCircle(int node_count) {
    std::vector<int> circle;
    circle.reserve(static_cast<size_t>(node_count + 1));
    for (int i = 0; i < node_count; ++i) {
        circle.push_back(i);
    }
    if (node_count % 2 == 1) {
        circle.push_back(kBye);
    }
    return circle;
}

// [a0, a1, ..., a(n-2), a(n-1)] -> [a0, a(n-1), a1, ..., a(n-2)]
void RotateCircle(std::vector<int>& circle) {
    if (circle.size() <= 2) {
        return;
    }
    const int last = circle.back();
    for (size_t i = circle.size() - 1; i > 1; --i) {
        circle[i] = circle[i - 1];
    }
    circle[1] = last;
}

std::pair<int, int> Canonical(const Pair& pair) {
    return {std::min(pair.first, pair.second), std::max(pair.first, pair.second)};
}

void AppendPairList(std::ostringstream& out,
                    const char* label,
                    const std::set<std::pair<int, int>>& pairs) {
    out << label << ' ' << pairs.size() << " pairs (first " << kReportLimit << "):";
    size_t shown = 0;
    for (const auto& pair : pairs) {
        if (shown++ == kReportLimit) {
            break;
        }
        out << " (" << pair.first << ", " << pair.second << ')';
    }
    out << '\n';
}

}  // namespace

bool PairingGenerator::Generate(int node_count, Schedule& schedule, Error* error) {
    schedule = Schedule{};
    if (node_count < 2) {
        std::ostringstream message;
        message << "Need at least 2 nodes to build a schedule; got " << node_count;
        return Fail(error, ErrorKind::ScheduleGeneration, message.str());
    }

    auto circle = BuildCircle(node_count);
    const int slots = static_cast<int>(circle.size());
    const int rounds = slots - 1;

    schedule.node_count = node_count;
    schedule.rounds.reserve(static_cast<size_t>(rounds));
    for (int r = 0; r < rounds; ++r) {
        Round round;
        round.index = r;
        round.pairs.reserve(static_cast<size_t>(slots / 2));
        for (int k = 0; k < slots / 2; ++k) {
            const int a = circle[static_cast<size_t>(k)];
            const int b = circle[static_cast<size_t>(slots - 1 - k)];
            if (a == kBye || b == kBye) {
                continue;
            }
            round.pairs.push_back(Pair{a, b});
        }
        schedule.rounds.push_back(std::move(round));
        RotateCircle(circle);
    }
    return true;
}

bool PairingGenerator::Verify(const Schedule& schedule, int node_count, std::string* report) {
    std::ostringstream out;
    bool ok = true;

    std::set<std::pair<int, int>> seen;
    std::set<std::pair<int, int>> extra;
    for (const auto& round : schedule.rounds) {
        std::set<int> used;
        for (const auto& pair : round.pairs) {
            if (pair.first == pair.second || pair.first < 0 || pair.second < 0 ||
                pair.first >= node_count || pair.second >= node_count) {
                out << "Round " << round.index << " has invalid pair (" << pair.first << ", "
                    << pair.second << ")\n";
                ok = false;
                continue;
            }
            const bool first_free = used.insert(pair.first).second;
            const bool second_free = used.insert(pair.second).second;
            if (!first_free || !second_free) {
                out << "Round " << round.index << " repeats node in pair (" << pair.first << ", "
                    << pair.second << ")\n";
                ok = false;
            }
            if (!seen.insert(Canonical(pair)).second) {
                extra.insert(Canonical(pair));
            }
        }
    }

    std::set<std::pair<int, int>> missing;
    for (int a = 0; a < node_count; ++a) {
        for (int b = a + 1; b < node_count; ++b) {
            if (seen.count({a, b}) == 0) {
                missing.insert({a, b});
            }
        }
    }

    const size_t want = node_count < 2
                            ? 0
                            : static_cast<size_t>(node_count) * static_cast<size_t>(node_count - 1) / 2;
    if (!missing.empty() || !extra.empty()) {
        out << "Coverage mismatch: expected " << want << " pairs, got " << seen.size() << '\n';
        if (!missing.empty()) {
            AppendPairList(out, "Missing", missing);
        }
        if (!extra.empty()) {
            AppendPairList(out, "Duplicated", extra);
        }
        ok = false;
    } else {
        out << "Coverage: " << seen.size() << '/' << want << " unordered pairs -> OK\n";
    }

    if (report) {
        *report = out.str();
    }
    return ok;
}

}  // namespace allpair::core::schedule
