#pragma once

#include "export.h"
#include "media_source.h"
#include <vector>

namespace uldas {

/**
 * @brief One time window to sample from an audio track
 */
struct SampleWindow {
    double start = 0.0;     // Seconds (whole seconds)
    double length = 0.0;    // Seconds
};

/// Minimum samples in a usable clip (10 KB of 16-bit audio)
constexpr size_t MIN_SAMPLE_COUNT = 5000;

/// Mean volume at or below this is treated as silence
constexpr double SILENCE_FLOOR_DB = -60.0;

/**
 * @brief Plan the sample windows for one retry
 *
 * Positions shift per retry to dodge silence, credits and intros.
 * Longer files get longer windows and more positions.
 *
 * @param duration Container duration in seconds (<= 0 treated as 2 hours)
 * @param retry Retry number (0-based; retries past 2 reuse the last set)
 * @return Windows in the order they should be tried
 */
ULDAS_API std::vector<SampleWindow> plan_sample_windows(double duration, int retry);

/**
 * @brief Stream addressing strategies, highest priority first
 */
ULDAS_API const std::vector<StreamSelector>& default_stream_strategies();

/**
 * @brief Mean volume in dBFS (10 * log10(mean(x^2)))
 * @return -120 for empty or digitally silent input
 */
ULDAS_API double mean_volume_db(const std::vector<float>& samples);

/**
 * @brief 2x gain followed by an 80 Hz high-pass (in place)
 *
 * Output is clamped to [-1, 1].
 */
ULDAS_API void apply_speech_filter(std::vector<float>& samples);

/**
 * @brief Scale so the peak reaches 0.95, with gain bounded to 10x (in place)
 */
ULDAS_API void normalize_peak(std::vector<float>& samples);

/**
 * @brief Filter, measure, then normalize a decoded clip
 * @return Mean volume (dBFS) measured after filtering, before normalization
 */
ULDAS_API double condition_for_speech(std::vector<float>& samples);

/**
 * @brief Long enough and loud enough to be worth transcribing
 */
ULDAS_API bool is_usable_sample(const std::vector<float>& samples, double mean_db);

} // namespace uldas
