#include "uldas/transcription_evaluator.h"
#include "uldas/language_codes.h"
#include "string_utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace uldas {

namespace {

constexpr float WITH_VAD_TEMPERATURE = 0.0f;
constexpr float WITHOUT_VAD_TEMPERATURE = 0.2f;

} // anonymous namespace

TranscriptionEvaluator::TranscriptionEvaluator(SpeechRecognizer& recognizer,
                                               const DetectionOptions& options)
    : recognizer_(recognizer)
    , options_(options)
    , vad_enabled_(options.vad_filter && recognizer.supports_vad())
{
    if (options.vad_filter && !vad_enabled_) {
        std::cout << "[ULDAS] VAD requested but not supported by the recognizer, "
                  << "using unfiltered attempts only\n";
    }
}

float TranscriptionEvaluator::segment_confidence(float avg_logprob) {
    return std::min(1.0f, std::max(0.0f, avg_logprob + 1.0f));
}

float hypothesis_avg_logprob(float score, size_t length, float length_penalty) {
    const float cumulative = score * std::pow(static_cast<float>(length), length_penalty);
    return cumulative / static_cast<float>(length + 1);
}

std::string TranscriptionEvaluator::resolve_language(const std::string& detected) {
    std::string lowered = to_lower(trim(detected));

    if (lowered == "dutch" || lowered == "nl") {
        return normalize_language_code("dut");
    }

    std::string code = language_name_to_code(lowered);
    if (code.empty()) {
        code = detected;
    }
    return normalize_language_code(code);
}

std::optional<TranscriptionEvidence> TranscriptionEvaluator::attempt(
    const std::vector<float>& samples,
    bool use_vad
) {
    use_vad = use_vad && vad_enabled_;
    const char* attempt_name = use_vad ? "with_vad" : "without_vad";

    RecognitionOptions rec_options;
    rec_options.temperature = use_vad ? WITH_VAD_TEMPERATURE : WITHOUT_VAD_TEMPERATURE;
    rec_options.vad_filter = use_vad;
    rec_options.vad_min_speech_duration_ms = options_.vad_min_speech_duration_ms;
    rec_options.vad_max_speech_duration_s = options_.vad_max_speech_duration_s;

    RecognitionResult result;
    try {
        result = recognizer_.recognize(samples, rec_options);
    } catch (const std::exception& e) {
        if (options_.show_details) {
            std::cerr << "[ULDAS] Transcription attempt '" << attempt_name
                      << "' failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    TranscriptionEvidence evidence;
    evidence.language = result.language;
    evidence.attempt_name = attempt_name;
    evidence.segments_detected = static_cast<int>(result.segments.size());
    evidence.vad_removed_all = use_vad && result.segments.empty();

    std::string joined;
    for (size_t i = 0; i < result.segments.size(); ++i) {
        if (i > 0) joined += " ";
        joined += result.segments[i].text;
    }
    evidence.text = trim(joined);
    evidence.text_length = static_cast<int>(utf8_length(evidence.text));
    evidence.word_count = static_cast<int>(split_words(evidence.text).size());

    // Model probability, raised to the mean segment confidence when higher
    evidence.confidence = result.language_probability;
    if (!result.segments.empty()) {
        float sum = 0.0f;
        for (const auto& segment : result.segments) {
            sum += segment_confidence(segment.avg_logprob);
        }
        float mean = sum / static_cast<float>(result.segments.size());
        evidence.confidence = std::max(evidence.confidence, mean);
    }

    if (options_.show_details) {
        std::cout << "[ULDAS]   Detected language: " << evidence.language
                  << " (confidence: " << format_fixed(evidence.confidence, 2)
                  << ", method: " << attempt_name << ")\n";
        std::cout << "[ULDAS]   Sample text: '" << evidence.text.substr(0, 150) << "'\n";
        std::cout << "[ULDAS]   Segments found: " << evidence.segments_detected << "\n";
    }

    return evidence;
}

bool TranscriptionEvaluator::has_speech(const TranscriptionEvidence& e) const {
    return (e.confidence > 0.6f && e.text_length > 0) ||
           (e.confidence > 0.3f && e.text_length > 15 && e.word_count > 2) ||
           (e.confidence > 0.2f && e.text_length > 50 && e.word_count > 8) ||
           (e.text_length > 100 && e.word_count > 15);
}

bool TranscriptionEvaluator::has_speech_strict(const TranscriptionEvidence& e) const {
    return (e.confidence > 0.7f && e.text_length > 30 && e.word_count > 5) ||
           (e.confidence > 0.5f && e.text_length > 100 && e.word_count > 20);
}

std::string TranscriptionEvaluator::classify(const TranscriptionEvidence& evidence) const {
    // Very high confidence on substantial text overrides the heuristics
    if (evidence.confidence > 0.95f && evidence.text_length > 50) {
        return resolve_language(evidence.language);
    }

    std::string reason;
    if (!evidence.text.empty() && filter_.is_hallucination(evidence.text, &reason)) {
        if (options_.show_details) {
            std::cout << "[ULDAS]   Likely hallucination (" << reason << "), marking as zxx\n";
        }
        return "zxx";
    }

    bool speech;
    if (evidence.attempt_name == "without_vad" && evidence.vad_removed_all) {
        speech = has_speech_strict(evidence);
    } else {
        speech = has_speech(evidence);
    }

    if (!speech) {
        if (options_.show_details) {
            std::cout << "[ULDAS]   Insufficient evidence of speech (confidence="
                      << format_fixed(evidence.confidence, 3)
                      << ", text_length=" << evidence.text_length
                      << ", word_count=" << evidence.word_count << "), marking as zxx\n";
        }
        return "zxx";
    }

    return resolve_language(evidence.language);
}

std::optional<AttemptVerdict> TranscriptionEvaluator::detect_with_confidence(
    const std::vector<float>& samples
) {
    bool vad_removed_all = false;

    if (vad_enabled_) {
        auto filtered = attempt(samples, true);
        if (filtered && filtered->segments_detected > 0) {
            AttemptVerdict verdict;
            verdict.code = classify(*filtered);
            verdict.confidence = filtered->confidence;
            verdict.attempt_name = filtered->attempt_name;
            return verdict;
        }
        if (filtered) {
            vad_removed_all = true;
            if (options_.show_details) {
                std::cout << "[ULDAS]   VAD removed all audio, trying without VAD...\n";
            }
        }
    }

    auto unfiltered = attempt(samples, false);
    if (!unfiltered) {
        std::cerr << "[ULDAS] All transcription attempts failed\n";
        return std::nullopt;
    }

    unfiltered->vad_removed_all = vad_removed_all;

    AttemptVerdict verdict;
    verdict.code = classify(*unfiltered);
    verdict.confidence = unfiltered->confidence;
    verdict.attempt_name = unfiltered->attempt_name;
    return verdict;
}

} // namespace uldas
