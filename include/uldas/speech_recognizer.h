#pragma once

#include "export.h"
#include <string>
#include <vector>

namespace uldas {

/// Sample rate every recognizer and extractor works at
constexpr int SAMPLE_RATE = 16000;

/**
 * @brief One decoded stretch of speech
 */
struct RecognizedSegment {
    double start = 0.0;             // Seconds, original timeline
    double end = 0.0;
    std::string text;
    float avg_logprob = 0.0f;       // Average token log probability
    float no_speech_prob = 0.0f;
};

/**
 * @brief Output of one recognizer call
 */
struct RecognitionResult {
    std::string language;           // Engine-reported language (code or name)
    float language_probability = 0.0f;
    std::vector<RecognizedSegment> segments;
    double duration = 0.0;          // Seconds of input audio
};

/**
 * @brief Decoding parameters for one recognizer call
 *
 * Defaults are the anti-hallucination settings used for language detection.
 */
struct RecognitionOptions {
    // ═══════════════════════════════════════════════════════════
    // Decoding Parameters
    // ═══════════════════════════════════════════════════════════
    int beam_size = 3;                     // Beam search width
    int best_of = 2;                       // Candidates when sampling (temperature > 0)
    float temperature = 0.0f;              // Sampling temperature (0 = greedy/beam)
    float patience = 1.0f;                 // Beam search patience
    float length_penalty = 1.0f;
    float repetition_penalty = 1.2f;
    int no_repeat_ngram_size = 3;
    int max_length = 448;                  // Maximum tokens per window
    bool condition_on_previous = false;    // Feed previous window text as prompt

    // ═══════════════════════════════════════════════════════════
    // Quality Gates
    // ═══════════════════════════════════════════════════════════
    float compression_ratio_threshold = 2.0f;  // Text/zlib size; above is repetitive
    float log_prob_threshold = -0.8f;
    float no_speech_threshold = 0.6f;

    // ═══════════════════════════════════════════════════════════
    // Voice Activity Detection (VAD)
    // ═══════════════════════════════════════════════════════════
    bool vad_filter = false;
    int vad_min_speech_duration_ms = 250;
    int vad_max_speech_duration_s = 30;
};

/**
 * @brief ASR engine seen as a black box
 *
 * Implementations return the detected language, its probability and the
 * timed text segments. An implementation may throw on inference failure;
 * callers treat that as an inconclusive attempt.
 */
class ULDAS_API SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    /**
     * @brief Run recognition on 16 kHz mono float samples
     * @throws std::runtime_error on inference failure
     */
    virtual RecognitionResult recognize(const std::vector<float>& samples,
                                        const RecognitionOptions& options) = 0;

    /**
     * @brief Whether recognize() honours RecognitionOptions::vad_filter
     *
     * Resolved once when the engine is constructed.
     */
    virtual bool supports_vad() const = 0;
};

} // namespace uldas
