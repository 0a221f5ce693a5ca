#include "allpair/core/error/Error.h"
#include "allpair/core/schedule/PairingGenerator.h"
#include "allpair/core/schedule/ScheduleFormat.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using allpair::core::Error;
using allpair::core::ErrorKind;
using allpair::core::schedule::Pair;
using allpair::core::schedule::PairingGenerator;
using allpair::core::schedule::ParseScheduleFormat;
using allpair::core::schedule::ParseScheduleText;
using allpair::core::schedule::RenderSchedule;
using allpair::core::schedule::Schedule;
using allpair::core::schedule::ScheduleFormat;

std::string FirstLine(const std::string& text) {
    std::istringstream input(text);
    std::string line;
    std::getline(input, line);
    return line;
}

bool test_render_text() {
    Schedule schedule;
    PairingGenerator::Generate(4, schedule, nullptr);
    const std::string text = RenderSchedule(schedule, ScheduleFormat::Text);
    if (FirstLine(text) != "0 3 | 1 2") {
        std::cerr << "Unexpected text line: '" << FirstLine(text) << "'\n";
        return false;
    }
    int lines = 0;
    for (char c : text) {
        lines += c == '\n' ? 1 : 0;
    }
    if (lines != 3) {
        std::cerr << "Expected 3 text lines for N=4, got " << lines << '\n';
        return false;
    }
    return true;
}

bool test_render_csv_and_jsonl() {
    Schedule schedule;
    PairingGenerator::Generate(4, schedule, nullptr);

    const std::string csv = RenderSchedule(schedule, ScheduleFormat::Csv);
    if (FirstLine(csv) != "round,a,b" || csv.find("\n0,0,3\n") == std::string::npos) {
        std::cerr << "Unexpected csv rendering:\n" << csv;
        return false;
    }

    const std::string jsonl = RenderSchedule(schedule, ScheduleFormat::Jsonl);
    const std::string first = FirstLine(jsonl);
    if (first.find("\"round\":0") == std::string::npos ||
        first.find("[[0,3],[1,2]]") == std::string::npos) {
        std::cerr << "Unexpected jsonl line: " << first << '\n';
        return false;
    }
    return true;
}

bool test_parse_format_names() {
    ScheduleFormat format = ScheduleFormat::Text;
    if (!ParseScheduleFormat("jsonl", format) || format != ScheduleFormat::Jsonl) {
        std::cerr << "jsonl not recognised\n";
        return false;
    }
    if (ParseScheduleFormat("yaml", format)) {
        std::cerr << "yaml should be rejected\n";
        return false;
    }
    return true;
}

bool test_parse_text_tolerates_quotes_and_whitespace() {
    const std::string text = "  \"0 3 | 1 2\"\n\n\t2 3 |  0 1 \n";
    Schedule schedule;
    Error error;
    if (!ParseScheduleText(text, 4, schedule, &error)) {
        std::cerr << "ParseScheduleText failed: " << error.message << '\n';
        return false;
    }
    if (schedule.size() != 2 || schedule.rounds[1].index != 1) {
        std::cerr << "Expected 2 rounds, got " << schedule.size() << '\n';
        return false;
    }
    if (!(schedule.rounds[0].pairs[1] == Pair{1, 2}) || !(schedule.rounds[1].pairs[0] == Pair{2, 3})) {
        std::cerr << "Parsed pairs do not match input\n";
        return false;
    }
    return true;
}

bool test_parse_text_keeps_malformed_entries() {
    Schedule schedule;
    if (!ParseScheduleText("0 1 | 2 3 4 | x y | 5\n", 6, schedule, nullptr)) {
        std::cerr << "ParseScheduleText failed on malformed entries\n";
        return false;
    }
    const auto& round = schedule.rounds.front();
    if (round.pairs.size() != 1 || round.malformed_pairs.size() != 3) {
        std::cerr << "Expected 1 pair and 3 malformed entries, got " << round.pairs.size() << " and "
                  << round.malformed_pairs.size() << '\n';
        return false;
    }
    if (round.malformed_pairs[0] != "2 3 4") {
        std::cerr << "Malformed entry not kept verbatim: '" << round.malformed_pairs[0] << "'\n";
        return false;
    }
    return true;
}

bool test_parse_text_empty_is_schedule_error() {
    Schedule schedule;
    Error error;
    if (ParseScheduleText(" \n\n", 4, schedule, &error)) {
        std::cerr << "Empty generator output should fail\n";
        return false;
    }
    if (error.kind != ErrorKind::ScheduleGeneration) {
        std::cerr << "Empty generator output gave " << allpair::core::ErrorKindName(error.kind)
                  << '\n';
        return false;
    }
    return true;
}

bool test_text_reparses_to_same_schedule() {
    Schedule generated;
    PairingGenerator::Generate(9, generated, nullptr);
    Schedule parsed;
    if (!ParseScheduleText(RenderSchedule(generated, ScheduleFormat::Text), 9, parsed, nullptr)) {
        std::cerr << "Rendered text did not parse\n";
        return false;
    }
    std::string report;
    if (!PairingGenerator::Verify(parsed, 9, &report)) {
        std::cerr << "Parsed schedule failed verification:\n" << report;
        return false;
    }
    return true;
}

bool test_render_with_host_labels() {
    Schedule schedule;
    PairingGenerator::Generate(4, schedule, nullptr);
    const std::vector<std::string> hosts = {"gpu-a", "gpu-b", "gpu-c", "gpu-d"};
    const std::string text = RenderSchedule(schedule, ScheduleFormat::Text, hosts);
    if (FirstLine(text) != "gpu-a gpu-d | gpu-b gpu-c") {
        std::cerr << "Unexpected labelled text line: '" << FirstLine(text) << "'\n";
        return false;
    }
    const std::string jsonl = RenderSchedule(schedule, ScheduleFormat::Jsonl, hosts);
    if (FirstLine(jsonl).find("[\"gpu-a\",\"gpu-d\"]") == std::string::npos) {
        std::cerr << "Unexpected labelled jsonl line: " << FirstLine(jsonl) << '\n';
        return false;
    }
    return true;
}

bool test_out_of_range_indices_are_malformed() {
    Schedule schedule;
    if (!ParseScheduleText("0 1 | 99999999999 2 | 3 -4x\n", 4, schedule, nullptr)) {
        std::cerr << "ParseScheduleText failed\n";
        return false;
    }
    const auto& round = schedule.rounds.front();
    if (round.pairs.size() != 1 || round.malformed_pairs.size() != 2) {
        std::cerr << "Overflowing or trailing-junk indices must be kept as malformed\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_render_text()) {
        return 1;
    }
    if (!test_render_csv_and_jsonl()) {
        return 1;
    }
    if (!test_parse_format_names()) {
        return 1;
    }
    if (!test_parse_text_tolerates_quotes_and_whitespace()) {
        return 1;
    }
    if (!test_parse_text_keeps_malformed_entries()) {
        return 1;
    }
    if (!test_parse_text_empty_is_schedule_error()) {
        return 1;
    }
    if (!test_text_reparses_to_same_schedule()) {
        return 1;
    }
    if (!test_render_with_host_labels()) {
        return 1;
    }
    if (!test_out_of_range_indices_are_malformed()) {
        return 1;
    }
    return 0;
}
