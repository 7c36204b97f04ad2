#pragma once

#include "export.h"
#include "types.h"
#include <regex>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief SDH (hearing-impaired) subtitle detection
 *
 * An entry counts as descriptive when it holds a [..], (..), *..* or ♪..♪
 * span of at least 3 letters containing a sound/speaker keyword. The track
 * is SDH when more than 10% of entries are descriptive, or when three or
 * more SDH phrase patterns occur anywhere in the lower-cased text.
 */
class ULDAS_API SDHDetector {
public:
    SDHDetector();

    /**
     * @brief Classify a subtitle track
     * @param entries Parsed subtitle entries
     * @param show_details Print indicator counts
     */
    bool is_sdh(const std::vector<SubtitleEntry>& entries, bool show_details = false) const;

    /**
     * @brief Whether one entry's text carries a descriptive span
     */
    bool has_sdh_indicator(const std::string& text) const;

    /**
     * @brief Number of distinct SDH phrase patterns present in text
     */
    int count_phrase_patterns(const std::string& text) const;

private:
    bool contains_keyword(const std::string& span) const;

    std::vector<std::regex> span_patterns_;
    std::vector<std::regex> phrase_patterns_;
};

} // namespace uldas
