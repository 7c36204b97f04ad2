#pragma once

#include "export.h"
#include "speech_recognizer.h"
#include "types.h"
#include <memory>
#include <string>

namespace uldas {

/**
 * @brief Whisper model loading options
 */
struct ModelOptions {
    std::string model_path;                // CTranslate2 model directory

    // Device configuration
    DeviceType device = DeviceType::Auto;
    ComputeType compute_type = ComputeType::Auto;

    // Threading (0 = auto-detect)
    int cpu_threads = 0;
    int device_index = 0;                  // GPU index for multi-GPU systems

    // Silero VAD model; empty selects the energy detector
    std::string silero_model_path;

    bool verbose = false;

    std::string device_string() const {
        switch (device) {
            case DeviceType::CUDA: return "cuda";
            case DeviceType::CPU: return "cpu";
            default: return "auto";
        }
    }

    std::string compute_type_string() const {
        switch (compute_type) {
            case ComputeType::Float32: return "float32";
            case ComputeType::Float16: return "float16";
            case ComputeType::Int8: return "int8";
            case ComputeType::Int8Float16: return "int8_float16";
            default: return "auto";
        }
    }
};

/**
 * @brief Parse "auto" / "cuda" / "cpu"
 * @throws std::invalid_argument for anything else
 */
ULDAS_API DeviceType parse_device_type(const std::string& value);

/**
 * @brief Parse "auto" / "float32" / "float16" / "int8" / "int8_float16"
 * @throws std::invalid_argument for anything else
 */
ULDAS_API ComputeType parse_compute_type(const std::string& value);

/**
 * @brief Faster-Whisper style recognizer on CTranslate2
 *
 * Detects the language on the first 30 seconds, then decodes the audio in
 * 30-second windows. With vad_filter set, silence is removed before
 * decoding and segment times are mapped back to the input timeline.
 */
class ULDAS_API WhisperRecognizer : public SpeechRecognizer {
public:
    /**
     * @brief Load a Whisper model
     *
     * Falls back to CPU with default precision if the preferred device fails.
     *
     * @throws std::runtime_error if the model cannot be loaded at all
     */
    explicit WhisperRecognizer(const ModelOptions& options);
    ~WhisperRecognizer() override;

    // Non-copyable, movable
    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;
    WhisperRecognizer(WhisperRecognizer&&) noexcept;
    WhisperRecognizer& operator=(WhisperRecognizer&&) noexcept;

    RecognitionResult recognize(const std::vector<float>& samples,
                                const RecognitionOptions& options) override;

    bool supports_vad() const override;

    /**
     * @brief Name of the VAD in use ("silero" or "energy")
     */
    const char* vad_name() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace uldas
