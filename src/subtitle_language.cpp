#include "uldas/subtitle_language.h"
#include "uldas/language_codes.h"
#include "uldas/subtitle_parser.h"
#include "string_utils.h"
#include <algorithm>
#include <iostream>

namespace uldas {

namespace {

constexpr size_t MIN_SAMPLE_CHARS = 50;

} // anonymous namespace

LanguageCandidates ScriptLanguageDetector::detect(const std::string& text) const {
    std::u32string cps = utf8_to_codepoints(text);

    if (utf8_length(trim(text)) < 10) {
        return {{"und", 0.0f}};
    }

    size_t latin = 0, cyrillic = 0, arabic = 0, cjk = 0, total = 0;
    for (char32_t cp : cps) {
        if (cp < 0x0250) latin++;
        if (cp >= 0x0400 && cp <= 0x04FF) cyrillic++;
        if (cp >= 0x0600 && cp <= 0x06FF) arabic++;
        if (cp >= 0x4E00 && cp <= 0x9FFF) cjk++;
        if (cp != U' ' && cp != U'\n') total++;
    }

    if (total == 0) {
        return {{"und", 0.0f}};
    }

    double n = static_cast<double>(total);
    double cyrillic_ratio = cyrillic / n;
    double arabic_ratio = arabic / n;
    double cjk_ratio = cjk / n;
    double latin_ratio = latin / n;

    if (cyrillic_ratio > 0.3) {
        return {{"rus", static_cast<float>(std::min(0.9, 0.5 + cyrillic_ratio * 0.5))}};
    }
    if (arabic_ratio > 0.3) {
        return {{"ara", static_cast<float>(std::min(0.9, 0.5 + arabic_ratio * 0.5))}};
    }
    if (cjk_ratio > 0.3) {
        return {{"chi", static_cast<float>(std::min(0.85, 0.45 + cjk_ratio * 0.5))}};
    }
    if (latin_ratio > 0.7) {
        // Latin covers many languages; confidence stays low
        double length_bonus = std::min(0.2, static_cast<double>(cps.size()) / 5000.0);
        double confidence = std::min(0.65, 0.3 + (latin_ratio - 0.7) * 0.3 + length_bonus);
        return {{"eng", static_cast<float>(confidence)}};
    }

    return {{"und", 0.1f}};
}

SubtitleLanguageResult detect_subtitle_language(const std::vector<SubtitleEntry>& entries,
                                                const TextLanguageDetector* primary,
                                                bool show_details) {
    SubtitleLanguageResult result;
    result.subtitle_count = static_cast<int>(entries.size());

    std::string sample = SubtitleParser::subtitle_text_sample(entries);
    if (utf8_length(trim(sample)) < MIN_SAMPLE_CHARS) {
        if (show_details) {
            std::cout << "[ULDAS]   Insufficient subtitle text for language detection\n";
        }
        result.code = "und";
        result.confidence = 0.0f;
        result.method = "insufficient_text";
        return result;
    }

    if (primary) {
        try {
            LanguageCandidates candidates = primary->detect(sample);
            if (!candidates.empty()) {
                result.code = iso639_1_to_2(candidates.front().first);
                result.confidence = candidates.front().second;
                result.method = "detector";

                if (show_details) {
                    std::cout << "[ULDAS]   Detected subtitle language: " << result.code
                              << " (confidence: " << format_fixed(result.confidence, 2) << ")\n";
                }
                return result;
            }
            if (show_details) {
                std::cout << "[ULDAS]   Language detector returned no results\n";
            }
        } catch (const std::exception& e) {
            if (show_details) {
                std::cerr << "[ULDAS]   Language detection failed: " << e.what() << "\n";
            }
        }
    }

    ScriptLanguageDetector script;
    LanguageCandidates candidates = script.detect(sample);
    result.code = candidates.front().first;
    result.confidence = candidates.front().second;
    result.method = "script";

    if (show_details) {
        std::cout << "[ULDAS]   Character analysis: " << result.code << " (confidence: "
                  << format_fixed(result.confidence, 2) << ")\n";
    }
    return result;
}

} // namespace uldas
