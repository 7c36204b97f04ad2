#include "uldas/sdh_detector.h"
#include "test_common.h"

#include <sstream>

using namespace uldas;
using uldas_test::check;

namespace {

std::vector<SubtitleEntry> dialogue(int count) {
    std::vector<SubtitleEntry> entries;
    for (int i = 0; i < count; ++i) {
        entries.emplace_back(i + 1, i * 4.0, i * 4.0 + 3.0, "We need to talk about what happened yesterday.");
    }
    return entries;
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS SDH Detector Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    SDHDetector detector;

    uldas_test::section("Indicators");
    check(detector.has_sdh_indicator("[door closes]"), "bracketed sound cue");
    check(detector.has_sdh_indicator("(SIGHS) Fine, have it your way."), "parenthesized cue, any case");
    check(detector.has_sdh_indicator("*phone ringing*"), "asterisked cue");
    check(detector.has_sdh_indicator("\xE2\x99\xAA upbeat music \xE2\x99\xAA"), "music-note span with keyword");
    check(!detector.has_sdh_indicator("[Paris, 1944]"), "bracketed caption without a sound keyword");
    check(!detector.has_sdh_indicator("(ok)"), "span shorter than 3 letters");
    check(!detector.has_sdh_indicator("Close the door, please."), "keyword outside a span");

    uldas_test::section("Phrase patterns");
    check(detector.count_phrase_patterns("narrator: footsteps echoing in the distance") == 4,
          "four distinct phrase patterns");

    uldas_test::section("Track classification");
    {
        auto entries = dialogue(100);
        check(!detector.is_sdh(entries), "dialogue-only track is not SDH");

        for (int i = 0; i < 11; ++i) {
            entries[i * 9].text = "[door closes]";
        }
        check(detector.is_sdh(entries), "[door closes] in 11% of 100 entries -> SDH");
    }
    {
        auto entries = dialogue(100);
        for (int i = 0; i < 10; ++i) {
            entries[i * 10].text = "[door closes]";
        }
        check(!detector.is_sdh(entries), "exactly 10% is not enough");

        entries[1].text = "The narrator sighs.";
        entries[2].text = "Muffled voices.";
        check(detector.is_sdh(entries), "three phrase patterns in the full text -> SDH");
    }
    check(!detector.is_sdh({}), "empty track is not SDH");

    uldas_test::section("Detail output");
    {
        auto entries = dialogue(40);
        entries[3].text = "[door closes]";

        std::ostringstream captured;
        std::streambuf* previous = std::cout.rdbuf(captured.rdbuf());
        detector.is_sdh(entries, true);
        std::cout << 1080.0;
        std::cout.rdbuf(previous);

        const std::string text = captured.str();
        check(text.find("(2.5%)") != std::string::npos, "indicator ratio printed with one decimal");
        check(text.size() >= 4 && text.compare(text.size() - 4, 4, "1080") == 0,
              "later floating-point output keeps default formatting");
        check((std::cout.flags() & std::ios::floatfield) == 0, "stdout float format left untouched");
    }

    return uldas_test::finish("SDH detector");
}
