#pragma once

#include "export.h"
#include "types.h"
#include <vector>

namespace uldas {

/**
 * @brief Voice Activity Detection options
 */
struct VADOptions {
    float threshold = 0.02f;              // RMS energy threshold (0.0-1.0)
    int min_speech_duration_ms = 250;     // Minimum speech duration to keep
    int max_speech_duration_s = 30;       // Split segments longer than this
    int min_silence_duration_ms = 500;    // Minimum silence to split segments
    int speech_pad_ms = 100;              // Padding around speech segments
    bool adaptive_threshold = true;       // Auto-adjust threshold based on noise floor
    float noise_floor_percentile = 0.1f;  // Percentile for noise floor estimation
    bool verbose = false;                 // Print thresholds and segment counts
};

/**
 * @brief Speech/silence segmentation of 16 kHz mono audio
 */
class ULDAS_API VoiceActivityDetector {
public:
    virtual ~VoiceActivityDetector() = default;

    /**
     * @brief Detect speech segments in audio
     *
     * @param samples Audio samples (mono, float32, normalized [-1, 1])
     * @param sample_rate Sample rate (typically 16000)
     * @return Speech segments in ascending time order
     */
    virtual std::vector<SpeechSegment> detect_speech(
        const std::vector<float>& samples,
        int sample_rate = 16000
    ) = 0;

    /**
     * @brief Short name for log lines ("energy", "silero")
     */
    virtual const char* name() const = 0;
};

/**
 * @brief Energy-based Voice Activity Detector
 *
 * RMS energy over 32 ms frames with 50% overlap, compared against an
 * adaptive threshold placed a quarter of the way between the noise floor
 * and the speech level. Always available; no model file needed.
 */
class ULDAS_API EnergyVAD : public VoiceActivityDetector {
public:
    explicit EnergyVAD(const VADOptions& options = {});

    std::vector<SpeechSegment> detect_speech(
        const std::vector<float>& samples,
        int sample_rate = 16000
    ) override;

    const char* name() const override { return "energy"; }

private:
    VADOptions options_;

    // Calculate RMS energy for a window
    float calculate_rms(const float* samples, int count) const;

    // Threshold from the energy distribution
    float estimate_threshold(const std::vector<float>& energies) const;

    // Merge close segments, drop short ones, pad, split long ones
    std::vector<SpeechSegment> post_process_segments(
        const std::vector<SpeechSegment>& segments,
        double audio_duration
    ) const;
};

// ═══════════════════════════════════════════════════════════
// Segment Utilities
// ═══════════════════════════════════════════════════════════

/**
 * @brief Split segments longer than max_seconds into equal pieces
 */
ULDAS_API std::vector<SpeechSegment> split_long_segments(
    const std::vector<SpeechSegment>& segments,
    double max_seconds
);

/**
 * @brief Concatenate the samples covered by the segments
 */
ULDAS_API std::vector<float> collect_speech(
    const std::vector<float>& samples,
    int sample_rate,
    const std::vector<SpeechSegment>& segments
);

/**
 * @brief Map a time in the collected (speech-only) audio back to the original timeline
 */
ULDAS_API double restore_timestamp(double collected_time,
                                   const std::vector<SpeechSegment>& segments);

} // namespace uldas
