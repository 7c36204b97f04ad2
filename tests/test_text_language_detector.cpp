#include "uldas/cld2_language_detector.h"
#include "uldas/subtitle_language.h"
#include "test_common.h"
#include <string>
#include <vector>

using namespace uldas;
using uldas_test::check;

namespace {

const std::vector<std::string> ENGLISH_LINES = {
    "I told you we should have left the house before the storm started.",
    "Where were you last night when the lights went out downtown?",
    "She keeps every letter her grandmother ever wrote in a wooden box.",
    "We can't keep pretending that nothing happened between us.",
    "The train to Boston leaves at seven, so don't be late this time.",
    "Honestly, I think the whole plan was a mistake from the beginning.",
    "He said the money would be waiting for us at the old warehouse.",
    "Could you please turn down the music? I'm trying to sleep.",
};

const std::vector<std::string> FRENCH_LINES = {
    "Je t'avais dit qu'il fallait partir avant que l'orage commence.",
    "Où étais-tu hier soir quand toutes les lumières se sont éteintes ?",
    "Elle garde chaque lettre de sa grand-mère dans une boîte en bois.",
    "Nous ne pouvons pas continuer à faire comme si rien ne s'était passé.",
    "Le train pour Lyon part à sept heures, alors ne sois pas en retard.",
    "Franchement, je pense que tout ce projet était une erreur dès le début.",
    "Il a dit que l'argent nous attendrait dans le vieil entrepôt du port.",
    "Pourrais-tu baisser la musique, s'il te plaît ? J'essaie de dormir.",
};

std::vector<SubtitleEntry> track(const std::vector<std::string>& lines, int count) {
    std::vector<SubtitleEntry> entries;
    for (int i = 0; i < count; ++i) {
        const std::string& text = lines[static_cast<size_t>(i) % lines.size()];
        entries.emplace_back(i + 1, i * 4.0, i * 4.0 + 3.0, text);
    }
    return entries;
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Text Language Detector Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    Cld2LanguageDetector detector;

    uldas_test::section("Candidates");
    {
        std::string english;
        for (const auto& line : ENGLISH_LINES) english += line + " ";
        LanguageCandidates candidates = detector.detect(english);
        check(!candidates.empty() && candidates.front().first == "en", "English paragraph -> en");
        check(!candidates.empty() && candidates.front().second >= 0.85f, "English paragraph is confident");

        for (size_t i = 1; i < candidates.size(); ++i) {
            check(candidates[i - 1].second >= candidates[i].second, "candidates ordered best first");
        }
    }
    check(detector.detect("").empty(), "empty text has no candidates");

    uldas_test::section("Subtitle tracks");
    {
        SubtitleLanguageResult r = detect_subtitle_language(track(ENGLISH_LINES, 400), &detector);
        check(r.method == "detector", "English track decided by the text detector");
        check(r.code == "eng", "English track -> eng");
        check(r.confidence >= 0.85f, "English track clears the tagging threshold");
    }
    {
        SubtitleLanguageResult r = detect_subtitle_language(track(FRENCH_LINES, 400), &detector);
        check(r.method == "detector", "French track decided by the text detector");
        check(r.code == "fre", "French track -> fre");
        check(r.confidence >= 0.85f, "French track clears the tagging threshold");
    }
    {
        SubtitleLanguageResult r = detect_subtitle_language(track(ENGLISH_LINES, 400), nullptr);
        check(r.method == "script" && r.confidence < 0.85f,
              "without a text detector Latin script stays below the threshold");
    }

    return uldas_test::finish("Text language detector");
}
