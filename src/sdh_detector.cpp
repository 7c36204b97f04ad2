#include "uldas/sdh_detector.h"
#include "string_utils.h"
#include <iostream>

namespace uldas {

namespace {

// Bracketed, parenthesized and asterisked spans of 3+ letters
const char* const SPAN_PATTERNS[] = {
    R"(\[[A-Za-z\s]{3,}\])",
    R"(\([A-Za-z\s]{3,}\))",
    R"(\*[A-Za-z\s]{3,}\*)",
};

const char* const MUSIC_NOTE = "\xE2\x99\xAA";  // U+266A

const char* const SDH_KEYWORDS[] = {
    "narrator", "narrating", "speaking", "whispering", "shouting", "yelling", "screaming",
    "music", "playing", "door", "closes", "opens", "phone", "ringing", "rings",
    "footsteps", "sighs", "sigh", "laughs", "laugh", "cries", "cry", "crying",
    "knocking", "knock", "barking", "bark", "meowing", "beeping", "beep",
    "gunshot", "explosion", "thunder", "applause", "cheering", "clapping",
    "breathing", "coughing", "snoring", "groaning", "grunting",
    "chatter", "chattering", "murmuring", "rustling", "creaking",
    "dramatic music", "tense music", "suspenseful music", "upbeat music",
    "in distance", "muffled", "echoing", "faintly",
};

const char* const PHRASE_PATTERNS[] = {
    R"(\bnarrator\b)", R"(\bspeaking\b)", R"(\bwhispering\b)", R"(\bshouting\b)",
    R"(\bmusic playing\b)", R"(\bdoor closes\b)", R"(\bphone ringing\b)",
    R"(\bfootsteps\b)", R"(\bsighs\b)", R"(\blaughs\b)", R"(\bcries\b)",
    R"(\bin the distance\b)", R"(\bmuffled\b)", R"(\bechoing\b)",
    R"(\bdramatic music\b)", R"(\btense music\b)",
};

std::string strip_delimiters(const std::string& span) {
    std::string content;
    for (char c : span) {
        if (c != '[' && c != ']' && c != '(' && c != ')' && c != '*') {
            content += c;
        }
    }
    return to_lower(trim(content));
}

} // anonymous namespace

SDHDetector::SDHDetector() {
    for (const char* pattern : SPAN_PATTERNS) {
        span_patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    }
    for (const char* pattern : PHRASE_PATTERNS) {
        phrase_patterns_.emplace_back(pattern, std::regex::ECMAScript);
    }
}

bool SDHDetector::contains_keyword(const std::string& span) const {
    std::string content = strip_delimiters(span);
    for (const char* keyword : SDH_KEYWORDS) {
        if (content.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool SDHDetector::has_sdh_indicator(const std::string& text) const {
    for (const auto& pattern : span_patterns_) {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
             it != std::sregex_iterator(); ++it) {
            if (contains_keyword(it->str())) {
                return true;
            }
        }
    }

    // ♪ lyrics ♪ spans: pair up consecutive notes
    const std::string note(MUSIC_NOTE);
    size_t open = text.find(note);
    while (open != std::string::npos) {
        size_t close = text.find(note, open + note.size());
        if (close == std::string::npos) break;

        if (close > open + note.size() &&
            contains_keyword(text.substr(open + note.size(), close - open - note.size()))) {
            return true;
        }
        open = text.find(note, close + note.size());
    }

    return false;
}

int SDHDetector::count_phrase_patterns(const std::string& text) const {
    int count = 0;
    for (const auto& pattern : phrase_patterns_) {
        if (std::regex_search(text, pattern)) {
            count++;
        }
    }
    return count;
}

bool SDHDetector::is_sdh(const std::vector<SubtitleEntry>& entries, bool show_details) const {
    if (entries.empty()) return false;

    int indicator_count = 0;
    std::string full_text;

    for (const auto& entry : entries) {
        if (has_sdh_indicator(entry.text)) {
            indicator_count++;
        }
        if (!full_text.empty()) full_text += " ";
        full_text += to_lower(entry.text);
    }

    double ratio = static_cast<double>(indicator_count) / static_cast<double>(entries.size());

    if (show_details) {
        std::cout << "[ULDAS]   SDH indicators found in " << indicator_count << "/"
                  << entries.size() << " subtitles (" << format_fixed(ratio * 100.0, 1) << "%)\n";
    }

    if (ratio > 0.10) {
        return true;
    }

    int phrase_count = count_phrase_patterns(full_text);
    if (phrase_count >= 3) {
        if (show_details) {
            std::cout << "[ULDAS]   Found " << phrase_count << " SDH phrase patterns\n";
        }
        return true;
    }

    return false;
}

} // namespace uldas
