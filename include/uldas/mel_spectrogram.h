#pragma once

#include <cstddef>
#include <vector>

namespace uldas {

/**
 * @brief Whisper-compatible log-mel spectrogram
 *
 * Parameters match Whisper's front end:
 * - 80 mel bins (128 for large-v3 models)
 * - 16kHz sample rate
 * - 400-point FFT (25ms @ 16kHz), Hann window, centered frames
 * - 160-sample hop (10ms @ 16kHz), so N samples give N / 160 frames
 */
class MelSpectrogram {
public:
    /**
     * @param sample_rate Audio sample rate (default: 16000 Hz)
     * @param n_fft FFT window size (default: 400)
     * @param n_mels Number of mel bins (default: 80)
     * @param hop_length Hop size between frames (default: 160)
     */
    MelSpectrogram(int sample_rate = 16000,
                   int n_fft = 400,
                   int n_mels = 80,
                   int hop_length = 160);

    /**
     * @brief Convert audio samples to a normalized log-mel spectrogram
     *
     * @param samples Audio samples (mono, float32, normalized to [-1, 1])
     * @param mel_output Output (n_frames x n_mels)
     * @return Number of frames generated
     */
    int compute(const std::vector<float>& samples,
                std::vector<std::vector<float>>& mel_output) const;

    /**
     * @brief Flatten to the [n_mels, n_frames] row-major layout the model expects
     *
     * Frames past the end are padded with the spectrogram floor.
     */
    static std::vector<float> to_model_layout(const std::vector<std::vector<float>>& mel,
                                              int n_frames);

    int getMelBins() const { return n_mels_; }

private:
    // Windowed power spectrum of one frame
    void powerSpectrum(const std::vector<float>& padded, size_t offset,
                       std::vector<float>& power) const;

    std::vector<float> createHannWindow(int size) const;
    std::vector<std::vector<float>> createMelFilters(int sample_rate, int n_fft, int n_mels) const;

    // Slaney mel scale, as used by Whisper
    static float hzToMel(float hz);
    static float melToHz(float mel);

    int sample_rate_;
    int n_fft_;
    int n_mels_;
    int hop_length_;
    std::vector<float> hann_window_;
    std::vector<std::vector<float>> mel_filters_;
    std::vector<float> cos_table_;   // [k * n_fft + n]
    std::vector<float> sin_table_;
};

} // namespace uldas
