#include "uldas/cld2_language_detector.h"
#include <cld2/public/compact_lang_det.h>
#include <algorithm>
#include <climits>
#include <stdexcept>

namespace uldas {

LanguageCandidates Cld2LanguageDetector::detect(const std::string& text) const {
    if (text.empty()) {
        return {};
    }
    if (text.size() > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("Text sample too large for CLD2");
    }

    CLD2::Language language3[3];
    int percent3[3] = {0, 0, 0};
    int text_bytes = 0;
    bool is_reliable = false;

    CLD2::DetectLanguageSummary(text.data(), static_cast<int>(text.size()), true,
                                language3, percent3, &text_bytes, &is_reliable);

    const float scale = is_reliable ? 1.0f : options_.unreliable_scale;

    LanguageCandidates candidates;
    for (int i = 0; i < 3; ++i) {
        if (language3[i] == CLD2::UNKNOWN_LANGUAGE || language3[i] == CLD2::TG_UNKNOWN_LANGUAGE) {
            continue;
        }
        if (percent3[i] < options_.min_percent) {
            continue;
        }
        const char* code = CLD2::LanguageCode(language3[i]);
        if (code == nullptr || *code == '\0') {
            continue;
        }
        float probability = std::min(1.0f, static_cast<float>(percent3[i]) / 100.0f) * scale;
        candidates.emplace_back(code, probability);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return candidates;
}

} // namespace uldas
