#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <utility>
#include <vector>

namespace uldas {

/**
 * @brief (language code, probability), best first
 */
using LanguageCandidates = std::vector<std::pair<std::string, float>>;

/**
 * @brief Subtitle language decision
 */
struct SubtitleLanguageResult {
    std::string code;           // ISO 639-2/B ("eng", "rus", "und", ...)
    float confidence = 0.0f;
    int subtitle_count = 0;
    std::string method;         // "detector", "script" or "insufficient_text"
};

/**
 * @brief Text language identifier
 */
class ULDAS_API TextLanguageDetector {
public:
    virtual ~TextLanguageDetector() = default;

    /**
     * @brief Rank candidate languages for a text sample
     * @return Candidates, best first (empty when inconclusive)
     * @throws std::runtime_error on detector failure
     */
    virtual LanguageCandidates detect(const std::string& text) const = 0;
};

/**
 * @brief Character-script ratio detector
 *
 * Recognizes Cyrillic (rus), Arabic (ara), CJK (chi) and Latin (eng) text
 * from code point ranges. Latin text gets a capped confidence since the
 * script covers many languages.
 */
class ULDAS_API ScriptLanguageDetector : public TextLanguageDetector {
public:
    LanguageCandidates detect(const std::string& text) const override;
};

/**
 * @brief Detect the language of a subtitle track
 *
 * Samples the text, asks the primary detector (2-letter results are
 * converted to 3-letter), and falls back to the script detector when the
 * primary is missing, empty or throws. Fewer than 50 sampled characters
 * yield "und" at 0 confidence.
 *
 * @param entries Parsed subtitle entries
 * @param primary Optional primary detector (nullptr = script detector only)
 * @param show_details Print the decision path
 */
ULDAS_API SubtitleLanguageResult detect_subtitle_language(
    const std::vector<SubtitleEntry>& entries,
    const TextLanguageDetector* primary = nullptr,
    bool show_details = false
);

} // namespace uldas
