#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief How an audio stream is addressed inside the container
 *
 * Containers with unusual stream layouts sometimes reject one addressing
 * mode and accept the other, so extraction tries them in priority order.
 */
enum class StreamSelector {
    AudioTrackIndex,        // N-th audio stream
    ContainerStreamIndex    // Absolute stream index
};

ULDAS_API const char* stream_selector_name(StreamSelector selector);

/**
 * @brief Result of an extraction call
 */
enum class ExtractStatus {
    Success,
    Failed,
    TimedOut
};

/**
 * @brief Parameters for one audio extraction
 */
struct AudioRequest {
    int track_index = 0;            // Audio-relative index
    int stream_index = 0;           // Container stream index
    StreamSelector selector = StreamSelector::AudioTrackIndex;
    double start = 0.0;             // Seconds
    double length = 0.0;            // Seconds (<= 0 = to end of stream)
    double timeout_seconds = 0.0;   // Wall-clock bound (<= 0 = unbounded)
};

/**
 * @brief Media metadata reader and audio/subtitle extractor
 *
 * Audio comes back as 16 kHz mono float32 in [-1, 1], conditioned for
 * speech (gain, high-pass, normalization).
 */
class ULDAS_API MediaSource {
public:
    virtual ~MediaSource() = default;

    /**
     * @brief Read duration and the ordered track list
     * @return True if successful
     */
    virtual bool probe(const std::string& path, MediaInfo& info) = 0;

    /**
     * @brief Decode an audio window (or the full track) to 16 kHz mono
     */
    virtual ExtractStatus extract_audio(const std::string& path,
                                        const AudioRequest& request,
                                        std::vector<float>& samples) = 0;

    /**
     * @brief Decode a text subtitle track into timed entries
     * @return True if successful (an empty track is a success with no entries)
     */
    virtual bool extract_subtitles(const std::string& path,
                                   const Track& track,
                                   std::vector<SubtitleEntry>& entries) = 0;

    /**
     * @brief Count packets of an image subtitle track
     * @return True if successful
     */
    virtual bool count_subtitle_packets(const std::string& path,
                                        const Track& track,
                                        int& packet_count) = 0;

    /**
     * @brief Get last error message
     */
    virtual std::string get_last_error() const = 0;
};

} // namespace uldas
