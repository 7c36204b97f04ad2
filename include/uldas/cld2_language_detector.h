#pragma once

#include "export.h"
#include "subtitle_language.h"
#include <string>

namespace uldas {

/**
 * @brief CLD2 text language detector settings
 */
struct Cld2DetectorOptions {
    float unreliable_scale = 0.5f;  // Probability multiplier when CLD2 flags the result unreliable
    int min_percent = 1;            // Drop candidates covering less of the text than this
};

/**
 * @brief Text language identifier backed by Compact Language Detector 2
 *
 * Candidates are CLD2's top three languages with the share of text bytes
 * each one covers as probability. Codes are CLD2's ISO 639-1 forms ("en",
 * "zh-Hant", ...).
 */
class ULDAS_API Cld2LanguageDetector : public TextLanguageDetector {
public:
    Cld2LanguageDetector() = default;
    explicit Cld2LanguageDetector(const Cld2DetectorOptions& options) : options_(options) {}

    LanguageCandidates detect(const std::string& text) const override;

private:
    Cld2DetectorOptions options_;
};

} // namespace uldas
