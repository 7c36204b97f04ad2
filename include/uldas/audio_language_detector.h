#pragma once

#include "export.h"
#include "types.h"
#include "media_source.h"
#include "transcription_evaluator.h"
#include <optional>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief Result of running the retry controller on one audio track
 */
struct DetectionOutcome {
    std::optional<LanguageVerdict> verdict;     // Empty = language left unchanged
    std::vector<TrackFailure> failures;         // Everything that went wrong on the way

    bool success() const { return verdict.has_value(); }
};

/**
 * @brief Retry/escalation controller for one audio track's language
 *
 * 1. Up to max_retries sampled-segment attempts, each on a different window
 *    set. A non-zxx result at or above the threshold returns immediately.
 * 2. The best result, if it clears the threshold and is not zxx.
 * 3. One pass over the full track (bounded by the operation timeout).
 *    A confident language is returned; zxx is accepted at any confidence.
 * 4. The most frequent real language across the retries, or zxx when every
 *    retry agreed on zxx.
 *
 * Extraction, inference and timeout failures are recorded and never abort
 * the search.
 */
class ULDAS_API AudioLanguageDetector {
public:
    /**
     * @param source Media source used for sampling (must outlive the detector)
     * @param evaluator Transcription evaluator (must outlive the detector)
     * @param options Threshold, retry budget, timeout
     */
    AudioLanguageDetector(MediaSource& source,
                          TranscriptionEvaluator& evaluator,
                          const DetectionOptions& options);

    /**
     * @brief Decide the language of one audio track
     * @param path Media file
     * @param track Audio track (index and container stream index are used)
     * @param duration Container duration in seconds (<= 0 if unknown)
     */
    DetectionOutcome detect(const std::string& path, const Track& track, double duration);

private:
    /**
     * @brief Try each window with each stream strategy; first usable sample wins
     * @return True if a sample was extracted
     */
    bool extract_sample(const std::string& path, const Track& track,
                        double duration, int retry, std::vector<float>& samples);

    /**
     * @brief Full-track extraction with the same strategy list
     */
    ExtractStatus extract_full_track(const std::string& path, const Track& track,
                                     std::vector<float>& samples);

    MediaSource& source_;
    TranscriptionEvaluator& evaluator_;
    DetectionOptions options_;
};

} // namespace uldas
