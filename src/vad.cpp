#include "uldas/vad.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace uldas {

EnergyVAD::EnergyVAD(const VADOptions& options)
    : options_(options)
{
}

float EnergyVAD::calculate_rms(const float* samples, int count) const {
    if (count <= 0) return 0.0f;

    float sum_sq = 0.0f;
    for (int i = 0; i < count; ++i) {
        sum_sq += samples[i] * samples[i];
    }
    return std::sqrt(sum_sq / count);
}

float EnergyVAD::estimate_threshold(const std::vector<float>& energies) const {
    if (energies.empty()) return options_.threshold;

    std::vector<float> sorted = energies;
    std::sort(sorted.begin(), sorted.end());

    size_t noise_idx = static_cast<size_t>(sorted.size() * options_.noise_floor_percentile);
    float noise_floor = sorted[std::min(noise_idx, sorted.size() - 1)];

    size_t speech_idx = static_cast<size_t>(sorted.size() * 0.9);
    float speech_level = sorted[std::min(speech_idx, sorted.size() - 1)];

    float dynamic_range = speech_level - noise_floor;

    // Noise floor + quarter of the dynamic range, at least twice the floor
    float threshold = noise_floor + (dynamic_range * 0.25f);
    threshold = std::max(threshold, noise_floor * 2.0f);
    threshold = std::max(threshold, options_.threshold);

    // Never above halfway between noise and speech
    float max_threshold = noise_floor + (dynamic_range * 0.5f);
    threshold = std::min(threshold, max_threshold);

    if (options_.verbose) {
        std::cout << "[VAD] Noise floor: " << noise_floor
                  << ", Speech level: " << speech_level
                  << ", Threshold: " << threshold << "\n";
    }

    return threshold;
}

std::vector<SpeechSegment> EnergyVAD::detect_speech(
    const std::vector<float>& samples,
    int sample_rate
) {
    std::vector<SpeechSegment> segments;

    if (samples.empty() || sample_rate <= 0) return segments;

    // Frame size: 32ms (512 samples at 16kHz)
    int frame_size = sample_rate * 32 / 1000;
    int hop_size = frame_size / 2;

    std::vector<float> energies;
    std::vector<size_t> frame_starts;

    for (size_t i = 0; i + frame_size <= samples.size(); i += hop_size) {
        energies.push_back(calculate_rms(&samples[i], frame_size));
        frame_starts.push_back(i);
    }

    if (energies.empty()) return segments;

    float threshold = options_.adaptive_threshold ? estimate_threshold(energies) : options_.threshold;

    bool in_speech = false;
    size_t speech_start = 0;

    for (size_t i = 0; i < energies.size(); ++i) {
        bool is_speech = energies[i] > threshold;

        if (is_speech && !in_speech) {
            in_speech = true;
            speech_start = frame_starts[i];
        } else if (!is_speech && in_speech) {
            in_speech = false;
            size_t speech_end = frame_starts[i] + frame_size;
            segments.emplace_back(static_cast<double>(speech_start) / sample_rate,
                                  static_cast<double>(speech_end) / sample_rate);
        }
    }

    if (in_speech) {
        segments.emplace_back(static_cast<double>(speech_start) / sample_rate,
                              static_cast<double>(samples.size()) / sample_rate);
    }

    double audio_duration = static_cast<double>(samples.size()) / sample_rate;
    segments = post_process_segments(segments, audio_duration);

    if (options_.verbose) {
        std::cout << "[VAD] Detected " << segments.size() << " speech segment(s)\n";
    }
    return segments;
}

std::vector<SpeechSegment> EnergyVAD::post_process_segments(
    const std::vector<SpeechSegment>& segments,
    double audio_duration
) const {
    if (segments.empty()) return segments;

    double min_speech_sec = options_.min_speech_duration_ms / 1000.0;
    double min_silence_sec = options_.min_silence_duration_ms / 1000.0;
    double pad_sec = options_.speech_pad_ms / 1000.0;

    std::vector<SpeechSegment> merged;
    SpeechSegment current = segments[0];

    for (size_t i = 1; i < segments.size(); ++i) {
        if (segments[i].start - current.end < min_silence_sec) {
            current.end = segments[i].end;
        } else {
            merged.push_back(current);
            current = segments[i];
        }
    }
    merged.push_back(current);

    std::vector<SpeechSegment> result;
    for (auto seg : merged) {
        if (seg.end - seg.start >= min_speech_sec) {
            seg.start = std::max(0.0, seg.start - pad_sec);
            seg.end = std::min(audio_duration, seg.end + pad_sec);
            result.push_back(seg);
        }
    }

    // Padding can make neighbours touch
    std::vector<SpeechSegment> joined;
    for (const auto& seg : result) {
        if (!joined.empty() && seg.start <= joined.back().end) {
            joined.back().end = std::max(joined.back().end, seg.end);
        } else {
            joined.push_back(seg);
        }
    }

    return split_long_segments(joined, options_.max_speech_duration_s);
}

// ═══════════════════════════════════════════════════════════
// Segment Utilities
// ═══════════════════════════════════════════════════════════

std::vector<SpeechSegment> split_long_segments(const std::vector<SpeechSegment>& segments,
                                               double max_seconds) {
    if (max_seconds <= 0.0) return segments;

    std::vector<SpeechSegment> result;
    for (const auto& seg : segments) {
        double length = seg.end - seg.start;
        if (length <= max_seconds) {
            result.push_back(seg);
            continue;
        }

        int pieces = static_cast<int>(std::ceil(length / max_seconds));
        double piece = length / pieces;
        for (int k = 0; k < pieces; ++k) {
            double start = seg.start + k * piece;
            double end = (k == pieces - 1) ? seg.end : start + piece;
            result.emplace_back(start, end);
        }
    }
    return result;
}

std::vector<float> collect_speech(const std::vector<float>& samples,
                                  int sample_rate,
                                  const std::vector<SpeechSegment>& segments) {
    std::vector<float> collected;

    for (const auto& seg : segments) {
        long long start_sample = static_cast<long long>(seg.start * sample_rate);
        long long end_sample = static_cast<long long>(seg.end * sample_rate);

        start_sample = std::max(0LL, start_sample);
        end_sample = std::min(static_cast<long long>(samples.size()), end_sample);
        if (end_sample <= start_sample) continue;

        collected.insert(collected.end(),
                         samples.begin() + start_sample,
                         samples.begin() + end_sample);
    }
    return collected;
}

double restore_timestamp(double collected_time, const std::vector<SpeechSegment>& segments) {
    double offset = 0.0;
    for (const auto& seg : segments) {
        double length = seg.end - seg.start;
        if (collected_time <= offset + length) {
            return seg.start + (collected_time - offset);
        }
        offset += length;
    }
    // Past the end: anchor to the last segment
    if (segments.empty()) return collected_time;
    return segments.back().end + (collected_time - offset);
}

} // namespace uldas
