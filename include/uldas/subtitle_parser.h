#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief SRT text handling
 *
 * Subtitle payloads arrive as SRT text or as entries decoded straight from
 * the container; both end up as SubtitleEntry lists.
 */
class ULDAS_API SubtitleParser {
public:
    /**
     * @brief Parse SRT content into entries
     *
     * Blocks are separated by blank lines (CRLF tolerated). A block needs an
     * index line, a timing line and at least one text line; malformed blocks
     * are skipped.
     */
    static std::vector<SubtitleEntry> parse_srt(const std::string& content);

    /**
     * @brief Parse an SRT file
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::vector<SubtitleEntry> parse_srt_file(const std::string& path);

    /**
     * @brief Parse "HH:MM:SS,mmm" (or "HH:MM:SS.mmm") into seconds
     * @param seconds Output
     * @return False if the string is not a timestamp
     */
    static bool parse_srt_time(const std::string& text, double& seconds);

    /**
     * @brief Format seconds as "HH:MM:SS,mmm"
     */
    static std::string format_srt_timestamp(double seconds);

    /**
     * @brief Render entries back to SRT text
     */
    static std::string to_srt(const std::vector<SubtitleEntry>& entries);

    /**
     * @brief Text sample for language detection
     *
     * Takes up to 10 entries around the first, middle (more than 10 entries)
     * and last (more than 20 entries) positions, strips <tag> and {tag}
     * markup and joins with spaces. Stops once max_chars is reached.
     */
    static std::string subtitle_text_sample(const std::vector<SubtitleEntry>& entries,
                                            size_t max_chars = 5000);

    /**
     * @brief Remove <...> and {...} markup
     */
    static std::string strip_markup(const std::string& text);
};

} // namespace uldas
