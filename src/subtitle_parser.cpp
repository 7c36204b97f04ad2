#include "uldas/subtitle_parser.h"
#include "string_utils.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace uldas {

namespace {

std::vector<std::string> split_lines(const std::string& block) {
    std::vector<std::string> lines;
    std::istringstream iss(block);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

bool SubtitleParser::parse_srt_time(const std::string& text, double& seconds) {
    static const std::regex TIME_PATTERN(R"(^\s*(\d+):(\d{1,2}):(\d{1,2})[,.](\d{1,3})\s*$)");

    std::smatch match;
    if (!std::regex_match(text, match, TIME_PATTERN)) {
        return false;
    }

    int hours = std::stoi(match[1].str());
    int minutes = std::stoi(match[2].str());
    int secs = std::stoi(match[3].str());

    // "5" after the separator means 500 ms
    std::string frac = match[4].str();
    while (frac.size() < 3) frac += '0';
    int millis = std::stoi(frac);

    seconds = hours * 3600.0 + minutes * 60.0 + secs + millis / 1000.0;
    return true;
}

std::string SubtitleParser::format_srt_timestamp(double seconds) {
    if (seconds < 0.0) seconds = 0.0;

    long long total_ms = std::llround(seconds * 1000.0);
    long long hours = total_ms / 3600000;
    long long minutes = (total_ms / 60000) % 60;
    long long secs = (total_ms / 1000) % 60;
    long long millis = total_ms % 1000;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":"
        << std::setw(2) << secs << ","
        << std::setw(3) << millis;

    return oss.str();
}

std::vector<SubtitleEntry> SubtitleParser::parse_srt(const std::string& raw_content) {
    std::vector<SubtitleEntry> entries;

    // Normalize line endings (and drop a UTF-8 BOM)
    std::string content;
    content.reserve(raw_content.size());
    for (char c : raw_content) {
        if (c != '\r') content += c;
    }
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        content.erase(0, 3);
    }

    // Split into blocks on blank lines
    std::vector<std::string> blocks;
    std::string current;
    for (const auto& line : split_lines(content)) {
        if (trim(line).empty()) {
            if (!current.empty()) {
                blocks.push_back(current);
                current.clear();
            }
        } else {
            current += line;
            current += '\n';
        }
    }
    if (!current.empty()) blocks.push_back(current);

    for (const auto& block : blocks) {
        std::vector<std::string> lines = split_lines(block);
        if (lines.size() < 3) continue;

        std::string index_line = trim(lines[0]);
        if (index_line.empty() || index_line.size() > 9 ||
            index_line.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        std::string timing = trim(lines[1]);
        size_t arrow = timing.find("-->");
        if (arrow == std::string::npos) continue;

        double start = 0.0;
        double end = 0.0;
        // Position hints after the end time ("X1:..") are ignored
        std::string end_field = trim(timing.substr(arrow + 3));
        size_t space = end_field.find(' ');
        if (space != std::string::npos) end_field = end_field.substr(0, space);

        if (!parse_srt_time(timing.substr(0, arrow), start) ||
            !parse_srt_time(end_field, end)) {
            continue;
        }

        std::string text;
        for (size_t i = 2; i < lines.size(); ++i) {
            if (i > 2) text += "\n";
            text += lines[i];
        }

        entries.emplace_back(std::stoi(index_line), start, end, trim(text));
    }

    return entries;
}

std::vector<SubtitleEntry> SubtitleParser::parse_srt_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open subtitle file: " + path);
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return parse_srt(oss.str());
}

std::string SubtitleParser::to_srt(const std::vector<SubtitleEntry>& entries) {
    std::ostringstream oss;
    for (const auto& entry : entries) {
        oss << entry.index << "\n"
            << format_srt_timestamp(entry.start) << " --> "
            << format_srt_timestamp(entry.end) << "\n"
            << entry.text << "\n\n";
    }
    return oss.str();
}

std::string SubtitleParser::strip_markup(const std::string& text) {
    static const std::regex ANGLE_TAGS("<[^>]+>");
    static const std::regex BRACE_TAGS(R"(\{[^}]+\})");

    std::string result = std::regex_replace(text, ANGLE_TAGS, "");
    return std::regex_replace(result, BRACE_TAGS, "");
}

std::string SubtitleParser::subtitle_text_sample(const std::vector<SubtitleEntry>& entries,
                                                 size_t max_chars) {
    std::vector<size_t> anchors;
    if (!entries.empty()) anchors.push_back(0);
    if (entries.size() > 10) anchors.push_back(entries.size() / 2);
    if (entries.size() > 20) anchors.push_back(entries.size() - 1);

    std::string sample;
    size_t total_chars = 0;

    for (size_t anchor : anchors) {
        size_t first = anchor >= 5 ? anchor - 5 : 0;
        size_t last = std::min(entries.size(), anchor + 5);

        for (size_t i = first; i < last; ++i) {
            std::string text = strip_markup(entries[i].text);
            if (!sample.empty()) sample += " ";
            sample += text;
            total_chars += utf8_length(text);

            if (total_chars >= max_chars) return sample;
        }
    }

    return sample;
}

} // namespace uldas
