#pragma once

#include "export.h"
#include "media_source.h"
#include <memory>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief MediaSource backed by FFmpeg (libavformat / libavcodec / libswresample)
 *
 * Usage:
 * @code
 * MediaExtractor extractor;
 * MediaInfo info;
 * if (extractor.probe("movie.mkv", info)) {
 *     AudioRequest request;
 *     request.start = 600.0;
 *     request.length = 30.0;
 *     std::vector<float> samples;
 *     extractor.extract_audio(info.path, request, samples);
 * }
 * @endcode
 */
class ULDAS_API MediaExtractor : public MediaSource {
public:
    MediaExtractor();
    ~MediaExtractor() override;

    // Non-copyable, movable
    MediaExtractor(const MediaExtractor&) = delete;
    MediaExtractor& operator=(const MediaExtractor&) = delete;
    MediaExtractor(MediaExtractor&&) noexcept;
    MediaExtractor& operator=(MediaExtractor&&) noexcept;

    bool probe(const std::string& path, MediaInfo& info) override;

    /**
     * @brief Decode, downmix and resample to 16 kHz mono, then condition for speech
     *
     * A windowed request fails when the window is silent (mean volume at
     * or below -60 dBFS after conditioning) or too short to analyze.
     */
    ExtractStatus extract_audio(const std::string& path,
                                const AudioRequest& request,
                                std::vector<float>& samples) override;

    /**
     * @brief Decode a text subtitle track (SubRip, ASS/SSA, WebVTT, mov_text)
     *
     * ASS override tags and line breaks are converted to plain text.
     */
    bool extract_subtitles(const std::string& path,
                           const Track& track,
                           std::vector<SubtitleEntry>& entries) override;

    bool count_subtitle_packets(const std::string& path,
                                const Track& track,
                                int& packet_count) override;

    std::string get_last_error() const override { return last_error_; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string last_error_;
};

/**
 * @brief Strip ASS dialogue fields and override tags down to display text
 *
 * Accepts either a full "Dialogue:" line or FFmpeg's packet form
 * ("ReadOrder,Layer,Style,Name,MarginL,MarginR,MarginV,Effect,Text").
 */
ULDAS_API std::string ass_to_plain_text(const std::string& ass_line);

} // namespace uldas
