#include "uldas/subtitle_parser.h"
#include "uldas/subtitle_language.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace uldas;
using uldas_test::check;
using uldas_test::near;

namespace {

const char* const SAMPLE_SRT =
    "\xEF\xBB\xBF" "1\r\n"
    "00:00:01,000 --> 00:00:03,500\r\n"
    "<i>Hello there.</i>\r\n"
    "\r\n"
    "2\r\n"
    "00:01:02.25 --> 00:01:04,000 X1:100 X2:200\r\n"
    "Two lines\r\n"
    "of text\r\n"
    "\r\n"
    "garbage block\r\n"
    "without timing\r\n"
    "\r\n"
    "3\r\n"
    "01:00:00,000 --> 01:00:02,000\r\n"
    "{\\an8}Top of screen\r\n";

class FixedDetector : public TextLanguageDetector {
public:
    LanguageCandidates detect(const std::string&) const override {
        return {{"fr", 0.97f}, {"en", 0.02f}};
    }
};

class EmptyDetector : public TextLanguageDetector {
public:
    LanguageCandidates detect(const std::string&) const override { return {}; }
};

std::vector<SubtitleEntry> repeated(const std::string& text, int count) {
    std::vector<SubtitleEntry> entries;
    for (int i = 0; i < count; ++i) {
        entries.emplace_back(i + 1, i * 3.0, i * 3.0 + 2.0, text);
    }
    return entries;
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Subtitle Parser Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    uldas_test::section("Timestamps");
    {
        double t = 0.0;
        check(SubtitleParser::parse_srt_time("00:01:02,345", t) && near(t, 62.345), "comma separator");
        check(SubtitleParser::parse_srt_time("00:01:02.5", t) && near(t, 62.5), "dot separator, short fraction");
        check(!SubtitleParser::parse_srt_time("1:02,345", t), "missing hours rejected");
        check(SubtitleParser::format_srt_timestamp(3723.456) == "01:02:03,456", "format HH:MM:SS,mmm");
        check(SubtitleParser::format_srt_timestamp(-1.0) == "00:00:00,000", "negative clamps to zero");
    }

    uldas_test::section("Parsing");
    {
        auto entries = SubtitleParser::parse_srt(SAMPLE_SRT);
        check(entries.size() == 3, "three valid blocks, garbage skipped");
        if (entries.size() == 3) {
            check(entries[0].index == 1 && near(entries[0].start, 1.0) && near(entries[0].end, 3.5),
                  "first entry timing");
            check(entries[0].text == "<i>Hello there.</i>", "text kept verbatim");
            check(near(entries[1].start, 62.25), "dot-separated start");
            check(entries[1].text == "Two lines\nof text", "multi-line text joined with newline");
            check(near(entries[2].start, 3600.0), "hour field");
        }
        check(SubtitleParser::parse_srt("").empty(), "empty input");
    }

    uldas_test::section("Markup and serialization");
    {
        check(SubtitleParser::strip_markup("<i>Hi</i> {\\an8}there") == "Hi there", "tags removed");

        std::vector<SubtitleEntry> entries = {{1, 1.0, 2.0, "One"}, {2, 3.0, 4.5, "Two"}};
        std::string srt = SubtitleParser::to_srt(entries);
        check(srt == "1\n00:00:01,000 --> 00:00:02,000\nOne\n\n2\n00:00:03,000 --> 00:00:04,500\nTwo\n\n",
              "SRT serialization");

        const std::string path = (std::filesystem::temp_directory_path() / "uldas_test_parser.srt").string();
        {
            std::ofstream out(path, std::ios::binary);
            out << SAMPLE_SRT;
        }
        check(SubtitleParser::parse_srt_file(path).size() == 3, "file parsing");
        std::filesystem::remove(path);

        bool threw = false;
        try {
            SubtitleParser::parse_srt_file("/nonexistent/uldas.srt");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        check(threw, "missing file throws");
    }

    uldas_test::section("Text sampling");
    {
        auto entries = repeated("abcdefghij", 50);
        std::string sample = SubtitleParser::subtitle_text_sample(entries, 1000);
        // Beginning (5), middle (10) and end (6) neighbourhoods
        check(sample.size() == 21 * 10 + 20, "entries around start, middle and end");

        std::string capped = SubtitleParser::subtitle_text_sample(entries, 25);
        check(capped.size() == 3 * 10 + 2, "stops once the character budget is reached");
    }

    uldas_test::section("Subtitle language");
    {
        auto latin = repeated("The quick brown fox jumps over the lazy dog again and again.", 30);
        SubtitleLanguageResult r = detect_subtitle_language(latin);
        check(r.method == "script" && r.code == "eng", "Latin script falls back to eng");
        check(r.confidence <= 0.65f, "Latin script confidence capped");

        // "Привет, как у тебя дела?"
        auto cyrillic = repeated("\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82, "
                                 "\xD0\xBA\xD0\xB0\xD0\xBA \xD1\x83 \xD1\x82\xD0\xB5\xD0\xB1\xD1\x8F "
                                 "\xD0\xB4\xD0\xB5\xD0\xBB\xD0\xB0?", 30);
        r = detect_subtitle_language(cyrillic);
        check(r.code == "rus", "Cyrillic -> rus");
        check(r.confidence >= 0.85f, "Cyrillic confident enough to commit");

        FixedDetector fixed;
        r = detect_subtitle_language(latin, &fixed);
        check(r.method == "detector" && r.code == "fre", "detector result converted to ISO 639-2");
        check(near(r.confidence, 0.97, 1e-5), "detector confidence kept");

        EmptyDetector empty;
        r = detect_subtitle_language(latin, &empty);
        check(r.method == "script", "empty detector output falls back to script analysis");

        r = detect_subtitle_language(repeated("Hi.", 3));
        check(r.code == "und" && r.confidence == 0.0f && r.method == "insufficient_text",
              "too little text -> und");
        check(r.subtitle_count == 3, "subtitle count reported");
    }

    return uldas_test::finish("Subtitle parser");
}
