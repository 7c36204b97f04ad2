#pragma once

#include "export.h"
#include <regex>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief Classifies ASR transcript text as genuine speech or model artifact
 *
 * Whisper-family models produce fluent-looking text on silence, music and
 * noise. The filter flags a transcript when any of these hold:
 * - empty or shorter than 3 characters
 * - fewer than 4 distinct non-space characters while longer than 10
 * - fewer than 3 distinct characters while longer than 20
 * - a run of 5+ identical characters, or a 1-3 character block repeated 4+ times
 * - more than 70% Khmer/Thai/Myanmar/Bengali/Georgian characters
 * - fewer than 20% unique words (more than 3 words)
 * - 6+ tokens reducing to at most 2 unique tokens
 * - zlib compression ratio below 0.3
 * - a stock phrase, or a generic pattern on short text
 *
 * Precision over recall: short genuine utterances may be flagged.
 * Deterministic; safe to share between threads after construction.
 */
class ULDAS_API HallucinationFilter {
public:
    HallucinationFilter();

    /**
     * @brief Check whether text looks hallucinated
     * @param text Transcript (UTF-8)
     * @param reason Optional output: short description of the rule that fired
     * @return True if any rule fires
     */
    bool is_hallucination(const std::string& text, std::string* reason = nullptr) const;

    /**
     * @brief zlib-compressed size divided by UTF-8 size (1.0 for empty text)
     */
    static double compression_ratio(const std::string& text);

    /**
     * @brief Lower-case and drop everything that is not a word character or space
     */
    static std::string clean_for_matching(const std::string& text);

private:
    std::vector<std::string> stock_phrases_;    // Already cleaned
    std::vector<std::regex> generic_patterns_;  // Applied to cleaned text under 50 chars
};

} // namespace uldas
