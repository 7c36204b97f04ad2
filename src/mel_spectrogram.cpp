#include "uldas/mel_spectrogram.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace uldas {

MelSpectrogram::MelSpectrogram(int sample_rate, int n_fft, int n_mels, int hop_length)
    : sample_rate_(sample_rate)
    , n_fft_(n_fft)
    , n_mels_(n_mels)
    , hop_length_(hop_length)
{
    hann_window_ = createHannWindow(n_fft);
    mel_filters_ = createMelFilters(sample_rate, n_fft, n_mels);

    // DFT twiddle factors
    int n_freqs = n_fft / 2 + 1;
    cos_table_.resize(static_cast<size_t>(n_freqs) * n_fft);
    sin_table_.resize(static_cast<size_t>(n_freqs) * n_fft);
    for (int k = 0; k < n_freqs; k++) {
        for (int n = 0; n < n_fft; n++) {
            double angle = -2.0 * M_PI * k * n / n_fft;
            cos_table_[static_cast<size_t>(k) * n_fft + n] = static_cast<float>(std::cos(angle));
            sin_table_[static_cast<size_t>(k) * n_fft + n] = static_cast<float>(std::sin(angle));
        }
    }
}

std::vector<float> MelSpectrogram::createHannWindow(int size) const
{
    // Periodic Hann window (torch.hann_window default)
    std::vector<float> window(size);
    for (int i = 0; i < size; i++) {
        window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * M_PI * i / size)));
    }
    return window;
}

float MelSpectrogram::hzToMel(float hz)
{
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (hz >= min_log_hz) {
        return min_log_mel + std::log(hz / min_log_hz) / logstep;
    }
    return hz / f_sp;
}

float MelSpectrogram::melToHz(float mel)
{
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (mel >= min_log_mel) {
        return min_log_hz * std::exp(logstep * (mel - min_log_mel));
    }
    return f_sp * mel;
}

std::vector<std::vector<float>> MelSpectrogram::createMelFilters(int sample_rate, int n_fft, int n_mels) const
{
    int n_freqs = n_fft / 2 + 1;
    std::vector<std::vector<float>> filters(n_mels, std::vector<float>(n_freqs, 0.0f));

    std::vector<float> fft_freqs(n_freqs);
    for (int i = 0; i < n_freqs; i++) {
        fft_freqs[i] = i * sample_rate / static_cast<float>(n_fft);
    }

    float max_mel = hzToMel(sample_rate / 2.0f);
    std::vector<float> mel_freqs(n_mels + 2);
    for (int i = 0; i < n_mels + 2; i++) {
        mel_freqs[i] = melToHz(max_mel * i / (n_mels + 1));
    }

    for (int m = 0; m < n_mels; m++) {
        float left = mel_freqs[m];
        float center = mel_freqs[m + 1];
        float right = mel_freqs[m + 2];
        // Slaney area normalization
        float enorm = 2.0f / (right - left);

        for (int f = 0; f < n_freqs; f++) {
            float freq = fft_freqs[f];
            float weight = 0.0f;
            if (freq >= left && freq <= center) {
                weight = (freq - left) / (center - left);
            } else if (freq > center && freq <= right) {
                weight = (right - freq) / (right - center);
            }
            filters[m][f] = weight * enorm;
        }
    }

    return filters;
}

void MelSpectrogram::powerSpectrum(const std::vector<float>& padded, size_t offset,
                                   std::vector<float>& power) const
{
    int n_freqs = n_fft_ / 2 + 1;
    power.assign(n_freqs, 0.0f);

    std::vector<float> frame(n_fft_);
    for (int n = 0; n < n_fft_; n++) {
        frame[n] = padded[offset + n] * hann_window_[n];
    }

    for (int k = 0; k < n_freqs; k++) {
        const float* c = &cos_table_[static_cast<size_t>(k) * n_fft_];
        const float* s = &sin_table_[static_cast<size_t>(k) * n_fft_];
        float re = 0.0f;
        float im = 0.0f;
        for (int n = 0; n < n_fft_; n++) {
            re += frame[n] * c[n];
            im += frame[n] * s[n];
        }
        power[k] = re * re + im * im;
    }
}

int MelSpectrogram::compute(const std::vector<float>& samples,
                            std::vector<std::vector<float>>& mel_output) const
{
    mel_output.clear();

    int n_frames = static_cast<int>(samples.size() / hop_length_);
    if (n_frames == 0) {
        return 0;
    }

    // Reflect-pad n_fft / 2 on both sides (centered STFT)
    const int pad = n_fft_ / 2;
    const int len = static_cast<int>(samples.size());
    std::vector<float> padded(static_cast<size_t>(len) + 2 * pad, 0.0f);
    for (int i = 0; i < len; i++) {
        padded[pad + i] = samples[i];
    }
    for (int i = 0; i < pad; i++) {
        int left = pad - i;
        int right = len - 2 - i;
        padded[i] = left < len ? samples[left] : 0.0f;
        padded[pad + len + i] = right >= 0 ? samples[right] : 0.0f;
    }

    mel_output.assign(n_frames, std::vector<float>(n_mels_));
    std::vector<float> power;
    float max_log = -1e30f;

    for (int frame = 0; frame < n_frames; frame++) {
        powerSpectrum(padded, static_cast<size_t>(frame) * hop_length_, power);

        for (int mel = 0; mel < n_mels_; mel++) {
            const std::vector<float>& filter = mel_filters_[mel];
            float value = 0.0f;
            for (size_t freq = 0; freq < power.size(); freq++) {
                value += filter[freq] * power[freq];
            }
            float log_mel = std::log10(std::max(value, 1e-10f));
            mel_output[frame][mel] = log_mel;
            max_log = std::max(max_log, log_mel);
        }
    }

    // Dynamic range compression (Whisper-style)
    for (auto& frame : mel_output) {
        for (auto& value : frame) {
            value = (std::max(value, max_log - 8.0f) + 4.0f) / 4.0f;
        }
    }

    return n_frames;
}

std::vector<float> MelSpectrogram::to_model_layout(const std::vector<std::vector<float>>& mel,
                                                   int n_frames)
{
    if (mel.empty() || n_frames <= 0) return {};

    const size_t n_mels = mel[0].size();
    float floor = mel[0][0];
    for (const auto& frame : mel) {
        for (float value : frame) floor = std::min(floor, value);
    }

    std::vector<float> flat(n_mels * static_cast<size_t>(n_frames), floor);
    const int available = std::min(n_frames, static_cast<int>(mel.size()));
    for (size_t m = 0; m < n_mels; m++) {
        for (int f = 0; f < available; f++) {
            flat[m * n_frames + f] = mel[f][m];
        }
    }
    return flat;
}

} // namespace uldas
