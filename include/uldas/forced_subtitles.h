#pragma once

#include "export.h"
#include "types.h"
#include <functional>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief Compute timing statistics for a subtitle track
 *
 * Count and density use every entry; displayed time, average duration and
 * gaps use entries with positive duration only. Returns all-zero statistics
 * for an empty list or a non-positive duration.
 *
 * @param entries Parsed subtitle entries
 * @param duration Container duration in seconds
 */
ULDAS_API SubtitleStatistics compute_subtitle_statistics(
    const std::vector<SubtitleEntry>& entries,
    double duration
);

/**
 * @brief Speech timing results from a VAD-filtered transcription of the full track
 *
 * Returns false when the audio could not be extracted or transcribed.
 */
using SpeechProvider = std::function<bool(std::vector<SpeechSegment>& segments)>;

/**
 * @brief Forced vs. full subtitle classifier
 *
 * Tier 1: hard thresholds on density, coverage and count (confidence 3).
 * Tier 2: at least two forced indicators and no full indicator (or the
 * reverse) across density, coverage, count and gap variance (confidence 2).
 * Tier 3: ambiguous (confidence 1). Resolved against speech timing when
 * audio analysis is enabled, otherwise by a midpoint heuristic.
 */
class ULDAS_API ForcedSubtitleClassifier {
public:
    explicit ForcedSubtitleClassifier(const SubtitleOptions& options);

    /**
     * @brief Decide from statistics alone
     *
     * When audio analysis is enabled and the statistics are ambiguous the
     * verdict comes back with decided = false and confidence 1.
     */
    ForcedVerdict decide_from_statistics(const SubtitleStatistics& stats,
                                         double duration_minutes) const;

    /**
     * @brief Resolve an ambiguous track against detected speech
     * @param stats Track statistics (timings are used for overlap)
     * @param duration Container duration in seconds
     * @param speech Speech segments of the full audio track
     */
    ForcedVerdict classify_with_speech(const SubtitleStatistics& stats,
                                       double duration,
                                       const std::vector<SpeechSegment>& speech) const;

    /**
     * @brief Midpoint heuristic (density < 5.5 or coverage < 37.5%)
     */
    ForcedVerdict heuristic(const SubtitleStatistics& stats, const std::string& reason) const;

    /**
     * @brief Full pipeline for a text subtitle track
     *
     * The speech provider is only called for ambiguous tracks with audio
     * analysis enabled; its failure falls back to the heuristic.
     */
    ForcedVerdict classify(const std::vector<SubtitleEntry>& entries,
                           double duration,
                           const SpeechProvider& speech_provider) const;

    /**
     * @brief Packet-count proxy for image subtitle tracks
     * @param packet_count Subtitle packets in the track
     * @param duration Container duration in seconds
     */
    ForcedVerdict classify_image_track(int packet_count, double duration) const;

private:
    SubtitleOptions options_;
};

} // namespace uldas
