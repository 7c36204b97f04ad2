#pragma once

#include "export.h"
#include "types.h"
#include "audio_language_detector.h"
#include "config.h"
#include "forced_subtitles.h"
#include "media_source.h"
#include "metadata_writer.h"
#include "processing_tracker.h"
#include "sdh_detector.h"
#include "speech_recognizer.h"
#include "subtitle_language.h"
#include "transcription_evaluator.h"
#include <optional>
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief An audio track whose language was committed
 */
struct AudioTrackResult {
    int track_index = 0;
    std::string previous_language;
    std::string detected_language;
    float confidence = 0.0f;
    VerdictMethod method = VerdictMethod::SampledSegment;
};

/**
 * @brief A subtitle track whose metadata was committed
 */
struct SubtitleTrackResult {
    int track_index = 0;
    std::string previous_language;
    std::string detected_language;
    float confidence = 0.0f;
    bool forced = false;
    bool sdh = false;
};

/**
 * @brief A subtitle track left unchanged
 */
struct SkippedSubtitleTrack {
    int track_index = 0;
    std::string detected_language;
    float confidence = 0.0f;
    std::string reason;             // "confidence_below_threshold" or "ocr_unavailable"
    std::optional<bool> forced;     // Packet-proxy verdict for image tracks, when analyzed
};

/**
 * @brief Subtitle pass outcome for one file
 */
struct SubtitleResults {
    int tracks_found = 0;
    std::vector<SubtitleTrackResult> processed;
    std::vector<SkippedSubtitleTrack> skipped;
    std::vector<int> failed;
    std::vector<std::string> errors;

    bool success() const { return failed.empty() && errors.empty(); }
};

/**
 * @brief Everything that happened to one file
 */
struct FileResult {
    std::string path;
    bool skipped_due_to_tracking = false;
    std::string skip_reason;                // "container_not_matroska" when the writer cannot edit the file

    int audio_tracks_considered = 0;
    std::vector<AudioTrackResult> processed_tracks;
    std::vector<int> failed_tracks;
    std::vector<TrackFailure> failures;     // All failure records, including those behind a verdict
    std::vector<std::string> errors;        // File-level and per-track error messages

    std::optional<SubtitleResults> subtitles;

    bool audio_success = false;
    bool subtitle_success = false;

    /**
     * @brief Whether anything in this file failed
     */
    bool has_error() const {
        return !failed_tracks.empty() || !errors.empty() ||
               (subtitles && !subtitles->success());
    }
};

/**
 * @brief Drives detection and metadata updates over files and directories
 *
 * Collaborators are borrowed and must outlive the processor. The tracker
 * may be null (tracking disabled).
 */
class ULDAS_API MediaProcessor {
public:
    MediaProcessor(const Config& config,
                   MediaSource& source,
                   SpeechRecognizer& recognizer,
                   MetadataWriter& writer,
                   ProcessingTracker* tracker = nullptr,
                   const TextLanguageDetector* text_detector = nullptr);

    /**
     * @brief Process one media file (audio tracks, then subtitle tracks)
     */
    FileResult process_file(const std::string& path);

    /**
     * @brief Process every video file under a directory (recursive, sorted)
     *
     * A failing file is recorded and the scan continues.
     */
    std::vector<FileResult> process_directory(const std::string& directory);

    /**
     * @brief Print per-file actions and totals
     */
    void print_summary(const std::vector<FileResult>& results, double runtime_seconds) const;

    /**
     * @brief Video files under a directory, sorted by path
     */
    static std::vector<std::string> find_video_files(const std::string& directory);

    /**
     * @brief Whether a path has one of the recognized video extensions
     */
    static bool is_video_file(const std::string& path);

    /**
     * @brief Whether a path names a Matroska or WebM file (editable in place)
     */
    static bool is_matroska_file(const std::string& path);

private:
    void process_audio(const std::string& path, const MediaInfo& info, FileResult& result);
    SubtitleResults process_subtitles(const std::string& path, const MediaInfo& info);

    // Speech of the file's first audio track, for forced-subtitle overlap analysis
    bool first_track_speech(const std::string& path, const MediaInfo& info,
                            std::vector<SpeechSegment>& segments);

    bool progress() const { return !config_.quiet; }

    Config config_;
    MediaSource& source_;
    SpeechRecognizer& recognizer_;
    MetadataWriter& writer_;
    ProcessingTracker* tracker_;
    const TextLanguageDetector* text_detector_;

    TranscriptionEvaluator evaluator_;
    AudioLanguageDetector audio_detector_;
    ForcedSubtitleClassifier forced_classifier_;
    SDHDetector sdh_detector_;

    // Per-file cache for first_track_speech
    std::string speech_cache_path_;
    bool speech_cache_ok_ = false;
    std::vector<SpeechSegment> speech_cache_;
};

/**
 * @brief Format seconds as HH:MM:SS
 */
ULDAS_API std::string format_runtime(double seconds);

} // namespace uldas
