#include "uldas/audio_language_detector.h"
#include "uldas/audio_sampling.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace uldas {

namespace {

std::string format_confidence(float confidence) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << confidence;
    return oss.str();
}

} // anonymous namespace

AudioLanguageDetector::AudioLanguageDetector(MediaSource& source,
                                             TranscriptionEvaluator& evaluator,
                                             const DetectionOptions& options)
    : source_(source)
    , evaluator_(evaluator)
    , options_(options)
{
}

bool AudioLanguageDetector::extract_sample(const std::string& path, const Track& track,
                                           double duration, int retry,
                                           std::vector<float>& samples) {
    for (const auto& window : plan_sample_windows(duration, retry)) {
        for (StreamSelector selector : default_stream_strategies()) {
            AudioRequest request;
            request.track_index = track.index;
            request.stream_index = track.stream_index;
            request.selector = selector;
            request.start = window.start;
            request.length = window.length;

            samples.clear();
            ExtractStatus status = source_.extract_audio(path, request, samples);
            if (status == ExtractStatus::Success && samples.size() >= MIN_SAMPLE_COUNT) {
                if (options_.show_details) {
                    std::cout << "[ULDAS]   Sample at " << window.start << "s ("
                              << window.length << "s, " << stream_selector_name(selector)
                              << ")\n";
                }
                return true;
            }

            if (options_.show_details) {
                std::cout << "[ULDAS]   No usable sample at " << window.start << "s via "
                          << stream_selector_name(selector) << ": "
                          << source_.get_last_error() << "\n";
            }
        }
    }

    samples.clear();
    return false;
}

ExtractStatus AudioLanguageDetector::extract_full_track(const std::string& path,
                                                        const Track& track,
                                                        std::vector<float>& samples) {
    for (StreamSelector selector : default_stream_strategies()) {
        AudioRequest request;
        request.track_index = track.index;
        request.stream_index = track.stream_index;
        request.selector = selector;
        request.start = 0.0;
        request.length = 0.0;
        request.timeout_seconds = options_.operation_timeout_seconds;

        samples.clear();
        ExtractStatus status = source_.extract_audio(path, request, samples);
        if (status == ExtractStatus::Success && samples.size() >= MIN_SAMPLE_COUNT) {
            return ExtractStatus::Success;
        }
        if (status == ExtractStatus::TimedOut) {
            samples.clear();
            return ExtractStatus::TimedOut;
        }
    }

    samples.clear();
    return ExtractStatus::Failed;
}

DetectionOutcome AudioLanguageDetector::detect(const std::string& path,
                                               const Track& track,
                                               double duration) {
    DetectionOutcome outcome;
    const int idx = track.index;
    const float threshold = options_.confidence_threshold;

    // (code, confidence) of every retry that produced a verdict, in order
    std::vector<std::pair<std::string, float>> detections;
    float best_confidence = 0.0f;
    std::string best_code;

    // ═══════════════════════════════════════════════════════════
    // Sampled-segment retries
    // ═══════════════════════════════════════════════════════════
    for (int retry = 0; retry < options_.max_retries; ++retry) {
        if (options_.show_details && retry > 0) {
            std::cout << "[ULDAS] Retry attempt " << (retry + 1) << "/" << options_.max_retries
                      << " - trying different audio samples\n";
        }

        std::vector<float> samples;
        if (!extract_sample(path, track, duration, retry, samples)) {
            outcome.failures.emplace_back(FailureKind::Extraction, TrackType::Audio, idx,
                "retry " + std::to_string(retry + 1) + ": no usable audio sample");
            continue;
        }

        auto result = evaluator_.detect_with_confidence(samples);
        if (!result) {
            outcome.failures.emplace_back(FailureKind::Inference, TrackType::Audio, idx,
                "retry " + std::to_string(retry + 1) + ": all transcription attempts failed");
            continue;
        }

        if (result->confidence > best_confidence) {
            best_confidence = result->confidence;
            best_code = result->code;
        }

        if (result->code.empty()) continue;
        detections.emplace_back(result->code, result->confidence);

        if (result->code != "zxx" && result->confidence >= threshold) {
            if (options_.show_details) {
                std::cout << "[ULDAS] Detected '" << result->code << "' with confidence "
                          << format_confidence(result->confidence) << " on attempt "
                          << (retry + 1) << "\n";
            }
            outcome.verdict = LanguageVerdict{result->code, result->confidence,
                                              VerdictMethod::SampledSegment};
            return outcome;
        }
    }

    if (best_confidence >= threshold && !best_code.empty() && best_code != "zxx") {
        outcome.verdict = LanguageVerdict{best_code, best_confidence,
                                          VerdictMethod::SampledSegment};
        return outcome;
    }

    // ═══════════════════════════════════════════════════════════
    // Full-track fallback
    // ═══════════════════════════════════════════════════════════
    std::cout << "[ULDAS] Low confidence (" << format_confidence(best_confidence)
              << "), analyzing full audio track " << idx << "...\n";

    std::vector<float> full_samples;
    ExtractStatus status = extract_full_track(path, track, full_samples);

    if (status == ExtractStatus::TimedOut) {
        std::ostringstream msg;
        msg << "full-track extraction exceeded " << options_.operation_timeout_seconds << "s";
        outcome.failures.emplace_back(FailureKind::Timeout, TrackType::Audio, idx, msg.str());
    } else if (status == ExtractStatus::Failed) {
        outcome.failures.emplace_back(FailureKind::Extraction, TrackType::Audio, idx,
            "full-track extraction failed: " + source_.get_last_error());
    } else {
        auto result = evaluator_.detect_with_confidence(full_samples);
        if (!result) {
            outcome.failures.emplace_back(FailureKind::Inference, TrackType::Audio, idx,
                "full-track transcription failed");
        } else {
            if (options_.show_details) {
                std::cout << "[ULDAS] Full track analysis result: '" << result->code
                          << "' with confidence " << format_confidence(result->confidence) << "\n";
            }

            if (!result->code.empty() && result->code != "zxx" && result->confidence >= threshold) {
                outcome.verdict = LanguageVerdict{result->code, result->confidence,
                                                  VerdictMethod::FullTrack};
                return outcome;
            }
            if (result->code == "zxx") {
                // No speech on the whole track is trusted at any confidence
                outcome.verdict = LanguageVerdict{"zxx", result->confidence,
                                                  VerdictMethod::FullTrack};
                return outcome;
            }

            outcome.failures.emplace_back(FailureKind::LowConfidence, TrackType::Audio, idx,
                "full-track result '" + result->code + "' confidence " +
                format_confidence(result->confidence) + " below threshold");
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Aggregated majority
    // ═══════════════════════════════════════════════════════════
    if (!detections.empty()) {
        std::vector<std::string> order;
        std::map<std::string, int> counts;
        std::map<std::string, float> max_confidence;

        for (const auto& detection : detections) {
            const std::string& code = detection.first;
            if (code == "zxx") continue;
            if (counts.find(code) == counts.end()) order.push_back(code);
            counts[code]++;
            max_confidence[code] = std::max(max_confidence[code], detection.second);
        }

        if (!order.empty()) {
            // Ties go to the language seen first
            std::string winner = order.front();
            for (const auto& code : order) {
                if (counts[code] > counts[winner]) winner = code;
            }
            if (options_.show_details) {
                std::cout << "[ULDAS] Using most frequent language across attempts: "
                          << winner << " (" << counts[winner] << "/" << detections.size() << ")\n";
            }
            outcome.verdict = LanguageVerdict{winner, max_confidence[winner],
                                              VerdictMethod::AggregatedMajority};
            return outcome;
        }

        // Every verdict was zxx
        float zxx_confidence = 0.0f;
        for (const auto& detection : detections) {
            zxx_confidence = std::max(zxx_confidence, detection.second);
        }
        outcome.verdict = LanguageVerdict{"zxx", zxx_confidence,
                                          VerdictMethod::AggregatedMajority};
        return outcome;
    }

    std::cerr << "[ULDAS] All language detection attempts failed for track " << idx << "\n";
    outcome.failures.emplace_back(FailureKind::LowConfidence, TrackType::Audio, idx,
        "no attempt produced a language verdict");
    return outcome;
}

} // namespace uldas
