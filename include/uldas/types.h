#pragma once

#include "export.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace uldas {

/**
 * @brief Stream type inside a media container
 */
enum class TrackType {
    Audio,
    Subtitle,
    Video,
    Other
};

/**
 * @brief Compute precision type
 */
enum class ComputeType {
    Auto,           // float16 on CUDA, int8 on CPU
    Float32,        // Full precision (most accurate, slowest)
    Float16,        // Half precision (fast on GPU)
    Int8,           // 8-bit quantized (fastest, good quality)
    Int8Float16     // Mixed precision
};

/**
 * @brief Device type for inference
 */
enum class DeviceType {
    Auto,           // Auto-detect (prefer CUDA if available)
    CUDA,           // NVIDIA GPU
    CPU             // CPU only
};

/**
 * @brief Which stage of the retry controller produced a verdict
 */
enum class VerdictMethod {
    SampledSegment,      // One of the sampled-segment retries
    FullTrack,           // Full-track fallback pass
    AggregatedMajority   // Most frequent language across retries
};

/**
 * @brief Failure taxonomy used in per-track failure records
 */
enum class FailureKind {
    Extraction,     // Sample or subtitle payload could not be produced
    Inference,      // ASR call raised or returned nothing usable
    LowConfidence,  // No tier cleared the confidence threshold
    Timeout,        // External operation exceeded its bound
    Write           // Metadata commit failed
};

ULDAS_API const char* track_type_name(TrackType type);
ULDAS_API const char* verdict_method_name(VerdictMethod method);
ULDAS_API const char* failure_kind_name(FailureKind kind);

/**
 * @brief One audio or subtitle stream of a container (snapshot per pass)
 */
struct Track {
    TrackType type = TrackType::Other;
    int index = 0;                  // 0-based index within its type
    int stream_index = 0;           // Container stream index
    std::string codec;              // Codec identifier ("aac", "subrip", "hdmv_pgs_subtitle", ...)
    std::string language;           // Current language tag (may be empty)
    std::string title;              // Track name, if any
    bool forced = false;            // Container forced flag
    bool is_default = false;        // Container default flag
    bool image_based = false;       // Bitmap subtitle (PGS, VobSub, DVB)
};

/**
 * @brief Container metadata returned by a media source probe
 */
struct MediaInfo {
    std::string path;
    double duration = 0.0;          // Seconds (0 if unknown)
    std::vector<Track> tracks;

    std::vector<Track> audio_tracks() const { return tracks_of(TrackType::Audio); }
    std::vector<Track> subtitle_tracks() const { return tracks_of(TrackType::Subtitle); }

    std::vector<Track> tracks_of(TrackType type) const {
        std::vector<Track> result;
        for (const auto& track : tracks) {
            if (track.type == type) result.push_back(track);
        }
        return result;
    }
};

/**
 * @brief Speech segment with start/end times
 */
struct SpeechSegment {
    double start;   // Start time in seconds
    double end;     // End time in seconds

    SpeechSegment(double s = 0.0, double e = 0.0) : start(s), end(e) {}
};

/**
 * @brief Output of one ASR attempt, consumed within a single retry cycle
 */
struct TranscriptionEvidence {
    std::string language;           // Detected language (name or code, as reported by the engine)
    float confidence = 0.0f;        // [0, 1]
    std::string text;               // Concatenated transcript
    int text_length = 0;            // Characters (code points) after trimming
    int word_count = 0;             // Whitespace-delimited words
    int segments_detected = 0;      // Number of speech segments decoded
    bool vad_removed_all = false;   // VAD was requested and no segment survived
    std::string attempt_name;       // "with_vad" or "without_vad"
};

/**
 * @brief Final language decision for one audio track
 */
struct LanguageVerdict {
    std::string code;               // Normalized code ("fr", "und", "zxx", ...)
    float confidence = 0.0f;
    VerdictMethod method = VerdictMethod::SampledSegment;
};

/**
 * @brief A failure recorded while processing one track
 */
struct TrackFailure {
    FailureKind kind = FailureKind::Inference;
    TrackType track_type = TrackType::Audio;
    int track_index = -1;
    std::string message;

    TrackFailure() = default;
    TrackFailure(FailureKind k, TrackType t, int index, std::string msg)
        : kind(k), track_type(t), track_index(index), message(std::move(msg)) {}
};

/**
 * @brief One timed subtitle entry
 */
struct SubtitleEntry {
    int index = 0;                  // Subtitle number (1-based)
    double start = 0.0;             // Start time (seconds)
    double end = 0.0;               // End time (seconds)
    std::string text;               // Subtitle text (may span lines)

    SubtitleEntry() = default;
    SubtitleEntry(int i, double s, double e, std::string t)
        : index(i), start(s), end(e), text(std::move(t)) {}
};

/**
 * @brief Aggregate timing metrics for one subtitle track
 */
struct SubtitleStatistics {
    int count = 0;                  // All parsed entries
    double total_duration = 0.0;    // Seconds on screen (positive-duration entries only)
    double coverage_percent = 0.0;  // total_duration / container duration * 100
    double density = 0.0;           // Entries per minute
    double avg_duration = 0.0;      // Seconds per displayed entry
    double gap_variance = 0.0;      // Population variance of non-negative gaps
    std::vector<std::pair<double, double>> timings;  // (start, end) of displayed entries
};

/**
 * @brief Forced/full decision with its reason and confidence tier
 *
 * confidence_tier 3 = high, 2 = medium, 1 = low (ambiguous). When decided is false the
 * statistics alone could not settle it and the caller must run audio-overlap
 * analysis.
 */
struct ForcedVerdict {
    bool forced = false;
    bool decided = true;
    std::string reason;
    int confidence_tier = 3;
};

/**
 * @brief Persisted processing-cache record
 */
struct TrackingEntry {
    std::string path;               // Absolute file path (key)
    int64_t size = 0;               // Bytes
    double mtime = 0.0;             // Seconds since epoch
    bool audio_processed = false;
    bool subtitle_processed = false;
    std::string processed_date;     // ISO-8601 local time
};

/**
 * @brief Audio language detection settings
 */
struct DetectionOptions {
    // ═══════════════════════════════════════════════════════════
    // Verdict
    // ═══════════════════════════════════════════════════════════
    float confidence_threshold = 0.9f;     // Commit on confidence at or above this
    int max_retries = 3;                   // Sampled-segment retries before full-track fallback

    // ═══════════════════════════════════════════════════════════
    // Voice Activity Detection (VAD)
    // ═══════════════════════════════════════════════════════════
    bool vad_filter = true;                // Try a VAD-filtered attempt first
    int vad_min_speech_duration_ms = 250;  // Minimum speech duration to keep
    int vad_max_speech_duration_s = 30;    // Maximum speech duration before split

    // ═══════════════════════════════════════════════════════════
    // Limits and Reporting
    // ═══════════════════════════════════════════════════════════
    double operation_timeout_seconds = 600.0;  // Wall-clock bound for full-track extraction
    bool show_details = false;             // Verbose per-attempt logging
};

/**
 * @brief Subtitle analysis settings
 */
struct SubtitleOptions {
    // ═══════════════════════════════════════════════════════════
    // Language
    // ═══════════════════════════════════════════════════════════
    float confidence_threshold = 0.85f;    // Below this the track is skipped

    // ═══════════════════════════════════════════════════════════
    // Forced Detection Thresholds
    // ═══════════════════════════════════════════════════════════
    double low_coverage_threshold = 25.0;  // Percent
    double low_density_threshold = 3.0;    // Entries per minute
    double high_density_threshold = 8.0;   // Entries per minute
    int min_count_threshold = 50;
    int max_count_threshold = 300;
    bool audio_overlap_analysis = true;    // Resolve ambiguous tracks against speech timing

    bool show_details = false;
};

/**
 * @brief Tracker table summary
 */
struct TrackingStats {
    int total = 0;
    int audio_only = 0;
    int subtitle_only = 0;
    int both = 0;
};

} // namespace uldas
