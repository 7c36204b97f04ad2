#pragma once

#include "export.h"
#include "vad.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief Silero VAD configuration
 */
struct SileroVADOptions {
    std::string model_path;             // Path to silero_vad.onnx
    float threshold = 0.5f;             // Speech probability threshold
    int min_speech_duration_ms = 250;   // Minimum speech duration
    int min_silence_duration_ms = 100;  // Minimum silence to end a segment
    int speech_pad_ms = 30;             // Padding around speech segments
    int max_speech_duration_s = 30;     // Force split segments longer than this
    bool use_gpu = false;               // CUDA execution provider
    int gpu_device_id = 0;
    int window_size_samples = 512;     // 512 for 16 kHz, 256 for 8 kHz
    int64_t sample_rate = 16000;
    bool verbose = false;
};

/**
 * @brief Neural Voice Activity Detector (Silero v5 ONNX model)
 *
 * Runs the model over 32 ms windows, carrying the recurrent state and a
 * 64-sample context between windows.
 */
class ULDAS_API SileroVAD : public VoiceActivityDetector {
public:
    /**
     * @brief Load the ONNX model
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit SileroVAD(const SileroVADOptions& options);
    ~SileroVAD() override;

    // Non-copyable, movable
    SileroVAD(const SileroVAD&) = delete;
    SileroVAD& operator=(const SileroVAD&) = delete;
    SileroVAD(SileroVAD&&) noexcept;
    SileroVAD& operator=(SileroVAD&&) noexcept;

    std::vector<SpeechSegment> detect_speech(
        const std::vector<float>& samples,
        int sample_rate = 16000
    ) override;

    const char* name() const override { return "silero"; }

    /**
     * @brief Reset recurrent state (call between unrelated streams)
     */
    void reset_state();

    /**
     * @brief Change the minimum and maximum segment lengths between calls
     */
    void set_speech_limits(int min_speech_duration_ms, int max_speech_duration_s);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace uldas
