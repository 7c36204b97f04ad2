#pragma once

#include "export.h"
#include "types.h"
#include "hallucination_filter.h"
#include "speech_recognizer.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief Language decision from one sample, with the attempt that produced it
 */
struct AttemptVerdict {
    std::string code;           // Normalized code or "zxx"
    float confidence = 0.0f;
    std::string attempt_name;   // "with_vad" or "without_vad"
};

/**
 * @brief Runs ASR attempts on a sample and turns them into language codes
 *
 * Whether a VAD-filtered attempt is possible is resolved once here, from the
 * options and the recognizer's capability flag, and never re-probed.
 */
class ULDAS_API TranscriptionEvaluator {
public:
    /**
     * @brief Bind to a recognizer
     * @param recognizer ASR engine (must outlive the evaluator)
     * @param options Detection settings (VAD durations, logging)
     */
    TranscriptionEvaluator(SpeechRecognizer& recognizer, const DetectionOptions& options);

    /**
     * @brief Run one ASR attempt
     *
     * with_vad runs at temperature 0.0, without_vad at 0.2.
     *
     * @param samples 16 kHz mono audio
     * @param use_vad Request VAD filtering (ignored when VAD is unavailable)
     * @return Evidence, or nullopt if the recognizer threw
     */
    std::optional<TranscriptionEvidence> attempt(const std::vector<float>& samples, bool use_vad);

    /**
     * @brief Reduce one piece of evidence to a language code or "zxx"
     */
    std::string classify(const TranscriptionEvidence& evidence) const;

    /**
     * @brief VAD attempt first, unfiltered attempt when VAD removed everything
     * @return Verdict, or nullopt when no attempt produced evidence
     */
    std::optional<AttemptVerdict> detect_with_confidence(const std::vector<float>& samples);

    /**
     * @brief Whether the VAD-filtered attempt is in use
     */
    bool vad_enabled() const { return vad_enabled_; }

    /**
     * @brief Resolve an engine-reported language (name or code) to a normalized code
     */
    static std::string resolve_language(const std::string& detected);

    /**
     * @brief Segment confidence derived from average log-probability, in [0, 1]
     */
    static float segment_confidence(float avg_logprob);

private:
    bool has_speech(const TranscriptionEvidence& evidence) const;
    bool has_speech_strict(const TranscriptionEvidence& evidence) const;

    SpeechRecognizer& recognizer_;
    DetectionOptions options_;
    HallucinationFilter filter_;
    bool vad_enabled_;
};

/**
 * @brief Average log-probability per token of a decoded hypothesis
 *
 * CTranslate2 reports the cumulative log-probability divided by
 * length^length_penalty. The cumulative value is recovered first, then
 * averaged over the tokens plus the end-of-text token.
 *
 * @param score Hypothesis score as returned by the decoder
 * @param length Generated token count
 * @param length_penalty Penalty the decoder ran with
 */
ULDAS_API float hypothesis_avg_logprob(float score, size_t length, float length_penalty);

} // namespace uldas
