#include "uldas/audio_sampling.h"
#include "uldas/speech_recognizer.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace uldas {

namespace {

constexpr double DEFAULT_DURATION = 7200.0;
constexpr float FILTER_GAIN = 2.0f;
constexpr double HIGHPASS_HZ = 80.0;
constexpr float TARGET_PEAK = 0.95f;
constexpr float MAX_NORMALIZE_GAIN = 10.0f;

struct WindowPlan {
    double length;
    std::vector<std::vector<double>> position_sets;
};

const WindowPlan& plan_for_duration(double duration) {
    static const WindowPlan LONG_PLAN = {90.0, {
        {0.15, 0.25, 0.35, 0.50, 0.65},
        {0.08, 0.20, 0.45, 0.75, 0.88},
        {0.12, 0.40, 0.60, 0.80, 0.90},
    }};
    static const WindowPlan MEDIUM_PLAN = {75.0, {
        {0.15, 0.30, 0.50, 0.70},
        {0.08, 0.40, 0.65, 0.85},
        {0.25, 0.45, 0.75, 0.90},
    }};
    static const WindowPlan SHORT_PLAN = {60.0, {
        {0.2, 0.5, 0.8},
        {0.1, 0.35, 0.75},
        {0.3, 0.6, 0.9},
    }};

    if (duration > 3600.0) return LONG_PLAN;
    if (duration > 1800.0) return MEDIUM_PLAN;
    return SHORT_PLAN;
}

} // anonymous namespace

const char* stream_selector_name(StreamSelector selector) {
    switch (selector) {
        case StreamSelector::AudioTrackIndex:      return "audio_track_index";
        case StreamSelector::ContainerStreamIndex: return "container_stream_index";
    }
    return "unknown";
}

std::vector<SampleWindow> plan_sample_windows(double duration, int retry) {
    if (duration <= 0.0) {
        duration = DEFAULT_DURATION;
    }

    const WindowPlan& plan = plan_for_duration(duration);
    size_t set_index = static_cast<size_t>(std::min(std::max(retry, 0), 2));

    double min_start = std::max(60.0, duration * 0.05);
    double max_start = duration * 0.85;

    std::vector<SampleWindow> windows;
    for (double position : plan.position_sets[set_index]) {
        // Short files can push min_start past max_start; max_start wins
        double start = std::min(std::max(duration * position, min_start), max_start);

        SampleWindow window;
        window.start = std::floor(start);
        window.length = plan.length;
        windows.push_back(window);
    }
    return windows;
}

const std::vector<StreamSelector>& default_stream_strategies() {
    static const std::vector<StreamSelector> strategies = {
        StreamSelector::AudioTrackIndex,
        StreamSelector::ContainerStreamIndex,
    };
    return strategies;
}

double mean_volume_db(const std::vector<float>& samples) {
    if (samples.empty()) return -120.0;

    double sum_sq = 0.0;
    for (float s : samples) {
        sum_sq += static_cast<double>(s) * s;
    }
    double mean_sq = sum_sq / static_cast<double>(samples.size());
    if (mean_sq <= 1e-12) return -120.0;

    return 10.0 * std::log10(mean_sq);
}

void apply_speech_filter(std::vector<float>& samples) {
    if (samples.empty()) return;

    // One-pole high-pass: y[n] = a * (y[n-1] + x[n] - x[n-1])
    const double rc = 1.0 / (2.0 * M_PI * HIGHPASS_HZ);
    const double dt = 1.0 / SAMPLE_RATE;
    const double alpha = rc / (rc + dt);

    double prev_in = samples[0] * FILTER_GAIN;
    double prev_out = 0.0;
    samples[0] = 0.0f;

    for (size_t i = 1; i < samples.size(); ++i) {
        double in = samples[i] * FILTER_GAIN;
        double out = alpha * (prev_out + in - prev_in);
        prev_in = in;
        prev_out = out;
        samples[i] = std::max(-1.0f, std::min(1.0f, static_cast<float>(out)));
    }
}

void normalize_peak(std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::abs(s));
    }
    if (peak <= 0.0f) return;

    float gain = std::min(TARGET_PEAK / peak, MAX_NORMALIZE_GAIN);
    for (float& s : samples) {
        s *= gain;
    }
}

double condition_for_speech(std::vector<float>& samples) {
    apply_speech_filter(samples);
    double mean_db = mean_volume_db(samples);
    normalize_peak(samples);
    return mean_db;
}

bool is_usable_sample(const std::vector<float>& samples, double mean_db) {
    return samples.size() >= MIN_SAMPLE_COUNT && mean_db > SILENCE_FLOOR_DB;
}

} // namespace uldas
