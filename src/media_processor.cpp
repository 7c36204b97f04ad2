#include "uldas/media_processor.h"
#include "uldas/audio_sampling.h"
#include "uldas/language_codes.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace uldas {

namespace {

const char* const VIDEO_EXTENSIONS[] = {
    ".mkv", ".mp4", ".avi", ".mov", ".m4v", ".wmv", ".flv", ".webm", ".ts", ".m2ts"
};

const char* const MATROSKA_EXTENSIONS[] = {".mkv", ".mk3d", ".webm"};

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string file_name(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string previous_tag(const Track& track) {
    return track.language.empty() ? "und" : track.language;
}

std::string format_conf(float confidence) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << confidence;
    return oss.str();
}

} // anonymous namespace

std::string format_runtime(double seconds) {
    long long total = static_cast<long long>(std::max(0.0, seconds));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                  total / 3600, (total % 3600) / 60, total % 60);
    return buf;
}

MediaProcessor::MediaProcessor(const Config& config,
                               MediaSource& source,
                               SpeechRecognizer& recognizer,
                               MetadataWriter& writer,
                               ProcessingTracker* tracker,
                               const TextLanguageDetector* text_detector)
    : config_(config)
    , source_(source)
    , recognizer_(recognizer)
    , writer_(writer)
    , tracker_(tracker)
    , text_detector_(text_detector)
    , evaluator_(recognizer, config.detection_options())
    , audio_detector_(source, evaluator_, config.detection_options())
    , forced_classifier_(config.subtitle_options())
{
}

bool MediaProcessor::is_video_file(const std::string& path) {
    const std::string ext = lower_extension(path);
    for (const char* candidate : VIDEO_EXTENSIONS) {
        if (ext == candidate) return true;
    }
    return false;
}

bool MediaProcessor::is_matroska_file(const std::string& path) {
    const std::string ext = lower_extension(path);
    for (const char* candidate : MATROSKA_EXTENSIONS) {
        if (ext == candidate) return true;
    }
    return false;
}

std::vector<std::string> MediaProcessor::find_video_files(const std::string& directory) {
    std::vector<std::string> files;
    std::error_code ec;

    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[ULDAS] Cannot scan " << directory << ": " << ec.message() << "\n";
        return files;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[ULDAS] Scan error under " << directory << ": " << ec.message() << "\n";
            ec.clear();
            continue;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_video_file(it->path().string())) {
            files.push_back(it->path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ═══════════════════════════════════════════════════════════════════════════
// Per-file processing
// ═══════════════════════════════════════════════════════════════════════════

FileResult MediaProcessor::process_file(const std::string& path) {
    FileResult result;
    result.path = path;

    bool skip_audio = false;
    bool skip_subtitles = false;

    const bool bypass_tracking = config_.reprocess_all || config_.reprocess_all_subtitles ||
                                 config_.force_reprocess;

    if (tracker_ && !bypass_tracking && tracker_->is_processed(path)) {
        auto entry = tracker_->lookup(path);
        if (entry) {
            skip_audio = entry->audio_processed;
            skip_subtitles = entry->subtitle_processed;
        }

        if (skip_audio && (skip_subtitles || !config_.process_subtitles)) {
            if (progress()) {
                std::cout << "Skipping " << file_name(path) << " (already processed)\n";
            }
            result.skipped_due_to_tracking = true;
            return result;
        }
    }

    // mkvpropedit only rewrites Matroska headers; other containers are reported, not analyzed
    if (!is_matroska_file(path)) {
        if (progress()) {
            std::cout << "Skipping " << file_name(path) << " (not a Matroska container)\n";
        }
        result.skip_reason = "container_not_matroska";
        return result;
    }

    if (progress()) {
        std::cout << "Processing: " << file_name(path) << "\n";
    }

    MediaInfo info;
    if (!source_.probe(path, info)) {
        result.errors.push_back("Failed to read media info: " + source_.get_last_error());
        return result;
    }

    if (!skip_audio) {
        process_audio(path, info, result);
    } else {
        // Previously processed
        result.audio_success = true;
    }

    if (config_.process_subtitles && !skip_subtitles) {
        if (progress()) {
            std::cout << "\nProcessing subtitles for: " << file_name(path) << "\n";
        }
        result.subtitles = process_subtitles(path, info);
        result.subtitle_success = result.subtitles->success();
    } else if (skip_subtitles) {
        result.subtitle_success = true;
    }

    if (tracker_ && !config_.dry_run) {
        if (result.audio_success || result.subtitle_success) {
            if (!tracker_->mark_processed(path, result.audio_success, result.subtitle_success)) {
                std::cerr << "[ULDAS] Could not record " << file_name(path) << ": "
                          << tracker_->get_last_error() << "\n";
            }
        }
    }

    // Drop the cached speech timing for this file
    speech_cache_path_.clear();
    speech_cache_.clear();
    speech_cache_ok_ = false;

    return result;
}

void MediaProcessor::process_audio(const std::string& path, const MediaInfo& info, FileResult& result) {
    std::vector<Track> tracks;
    for (const auto& track : info.audio_tracks()) {
        if (config_.reprocess_all || is_undefined_language(track.language)) {
            tracks.push_back(track);
        }
    }

    result.audio_tracks_considered = static_cast<int>(tracks.size());

    if (tracks.empty()) {
        if (config_.show_details) {
            std::cout << "[ULDAS] No " << (config_.reprocess_all ? "all audio" : "undefined audio")
                      << " tracks found in " << file_name(path) << "\n";
        }
        result.audio_success = true;
        return;
    }

    bool had_failures = false;

    for (const auto& track : tracks) {
        try {
            DetectionOutcome outcome = audio_detector_.detect(path, track, info.duration);

            result.failures.insert(result.failures.end(), outcome.failures.begin(), outcome.failures.end());

            if (!outcome.success()) {
                result.failed_tracks.push_back(track.index);
                result.errors.push_back("Failed to detect language for track " + std::to_string(track.index));
                for (const auto& failure : outcome.failures) {
                    std::cerr << "[ULDAS]   " << failure_kind_name(failure.kind) << ": " << failure.message << "\n";
                }
                had_failures = true;
                continue;
            }

            if (config_.show_details) {
                for (const auto& failure : outcome.failures) {
                    std::cout << "[ULDAS]   Recovered from " << failure_kind_name(failure.kind)
                              << ": " << failure.message << "\n";
                }
            }

            const LanguageVerdict& verdict = *outcome.verdict;

            if (writer_.set_audio_language(path, track.index, verdict.code)) {
                AudioTrackResult processed;
                processed.track_index = track.index;
                processed.previous_language = previous_tag(track);
                processed.detected_language = verdict.code;
                processed.confidence = verdict.confidence;
                processed.method = verdict.method;
                result.processed_tracks.push_back(processed);

                if (config_.show_details) {
                    std::cout << "[ULDAS] Updated track " << track.index << " in " << file_name(path)
                              << " to language: " << verdict.code << " ("
                              << verdict_method_name(verdict.method) << ")\n";
                }
            } else {
                result.failures.emplace_back(FailureKind::Write, TrackType::Audio, track.index,
                                             writer_.get_last_error());
                result.failed_tracks.push_back(track.index);
                result.errors.push_back("Failed to update track " + std::to_string(track.index));
                had_failures = true;
            }
        } catch (const std::exception& e) {
            std::string message = "Error processing track " + std::to_string(track.index) + ": " + e.what();
            std::cerr << "[ULDAS] " << message << "\n";
            result.failed_tracks.push_back(track.index);
            result.errors.push_back(message);
            had_failures = true;
        }
    }

    result.audio_success = !had_failures;
}

bool MediaProcessor::first_track_speech(const std::string& path, const MediaInfo& info,
                                        std::vector<SpeechSegment>& segments) {
    if (speech_cache_path_ == path) {
        segments = speech_cache_;
        return speech_cache_ok_;
    }

    speech_cache_path_ = path;
    speech_cache_ok_ = false;
    speech_cache_.clear();

    std::vector<Track> audio = info.audio_tracks();
    if (audio.empty()) {
        std::cerr << "[ULDAS] No audio track for overlap analysis\n";
        return false;
    }

    const Track& track = audio.front();
    std::vector<float> samples;
    ExtractStatus status = ExtractStatus::Failed;

    for (StreamSelector selector : default_stream_strategies()) {
        AudioRequest request;
        request.track_index = track.index;
        request.stream_index = track.stream_index;
        request.selector = selector;
        request.timeout_seconds = config_.operation_timeout_seconds;

        status = source_.extract_audio(path, request, samples);
        if (status != ExtractStatus::Failed) break;
    }

    if (status != ExtractStatus::Success) {
        std::cerr << "[ULDAS] Could not extract audio for overlap analysis: "
                  << source_.get_last_error() << "\n";
        return false;
    }

    RecognitionOptions options;
    options.beam_size = 1;
    options.temperature = 0.0f;
    options.vad_filter = recognizer_.supports_vad();
    options.vad_min_speech_duration_ms = config_.vad_min_speech_duration_ms;
    options.vad_max_speech_duration_s = config_.vad_max_speech_duration_s;

    try {
        RecognitionResult recognized = recognizer_.recognize(samples, options);
        for (const auto& seg : recognized.segments) {
            speech_cache_.emplace_back(seg.start, seg.end);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ULDAS] Transcription for overlap analysis failed: " << e.what() << "\n";
        return false;
    }

    speech_cache_ok_ = true;
    segments = speech_cache_;
    return true;
}

SubtitleResults MediaProcessor::process_subtitles(const std::string& path, const MediaInfo& info) {
    SubtitleResults results;

    std::vector<Track> tracks;
    for (const auto& track : info.subtitle_tracks()) {
        if (config_.reprocess_all_subtitles || is_undefined_language(track.language)) {
            tracks.push_back(track);
        }
    }

    results.tracks_found = static_cast<int>(tracks.size());
    if (tracks.empty()) {
        if (config_.show_details) {
            std::cout << "[ULDAS] No " << (config_.reprocess_all_subtitles ? "all subtitle" : "undefined subtitle")
                      << " tracks found in " << file_name(path) << "\n";
        }
        return results;
    }

    if (config_.show_details) {
        std::cout << "Found " << tracks.size() << " subtitle track(s) to process\n";
    }

    const SubtitleOptions sub_options = config_.subtitle_options();

    for (const auto& track : tracks) {
        try {
            if (config_.show_details) {
                std::cout << "Processing subtitle track " << track.index << "...\n";
            }

            if (track.image_based) {
                SkippedSubtitleTrack skipped;
                skipped.track_index = track.index;
                skipped.detected_language = previous_tag(track);
                skipped.reason = "ocr_unavailable";

                if (config_.analyze_forced_subtitles) {
                    int packets = 0;
                    if (source_.count_subtitle_packets(path, track, packets)) {
                        ForcedVerdict forced = forced_classifier_.classify_image_track(packets, info.duration);
                        skipped.forced = forced.forced;
                        if (config_.show_details) {
                            std::cout << "[ULDAS]   " << packets << " packets: " << forced.reason << "\n";
                        }
                    }
                }
                results.skipped.push_back(skipped);
                continue;
            }

            // Extract once, reuse for language, forced and SDH analysis
            std::vector<SubtitleEntry> entries;
            if (!source_.extract_subtitles(path, track, entries)) {
                results.failed.push_back(track.index);
                results.errors.push_back("Failed to extract subtitle track " + std::to_string(track.index));
                continue;
            }

            SubtitleLanguageResult language = detect_subtitle_language(entries, text_detector_, config_.show_details);

            if (language.confidence < sub_options.confidence_threshold) {
                std::cerr << "[ULDAS] Subtitle track " << track.index << " confidence ("
                          << format_conf(language.confidence) << ") below threshold ("
                          << sub_options.confidence_threshold << ") - skipping\n";
                SkippedSubtitleTrack skipped;
                skipped.track_index = track.index;
                skipped.detected_language = language.code;
                skipped.confidence = language.confidence;
                skipped.reason = "confidence_below_threshold";
                results.skipped.push_back(skipped);
                continue;
            }

            bool forced = false;
            if (config_.analyze_forced_subtitles) {
                if (config_.show_details) {
                    std::cout << "Analyzing if subtitle track " << track.index << " is forced...\n";
                }
                ForcedVerdict verdict = forced_classifier_.classify(
                    entries, info.duration,
                    [&](std::vector<SpeechSegment>& speech) { return first_track_speech(path, info, speech); });
                forced = verdict.forced;
                if (config_.show_details) {
                    std::cout << "[ULDAS]   " << verdict.reason << " (tier " << verdict.confidence_tier << ")\n";
                }
            }

            bool sdh = false;
            if (config_.detect_sdh_subtitles) {
                if (config_.show_details) {
                    std::cout << "Analyzing if subtitle track " << track.index << " is SDH...\n";
                }
                sdh = sdh_detector_.is_sdh(entries, config_.show_details);
            }

            if (writer_.set_subtitle_metadata(path, track.index, language.code, forced, sdh)) {
                SubtitleTrackResult processed;
                processed.track_index = track.index;
                processed.previous_language = previous_tag(track);
                processed.detected_language = language.code;
                processed.confidence = language.confidence;
                processed.forced = forced;
                processed.sdh = sdh;
                results.processed.push_back(processed);
            } else {
                results.failed.push_back(track.index);
                results.errors.push_back("Failed to update subtitle track " + std::to_string(track.index) +
                                         ": " + writer_.get_last_error());
            }
        } catch (const std::exception& e) {
            std::string message = "Error processing subtitle track " + std::to_string(track.index) + ": " + e.what();
            std::cerr << "[ULDAS] " << message << "\n";
            results.failed.push_back(track.index);
            results.errors.push_back(message);
        }
    }

    return results;
}

std::vector<FileResult> MediaProcessor::process_directory(const std::string& directory) {
    std::vector<FileResult> results;

    std::vector<std::string> files = find_video_files(directory);
    if (progress()) {
        std::cout << "[ULDAS] Found " << files.size() << " video file(s) in " << directory << "\n";
    }

    for (const auto& file : files) {
        try {
            results.push_back(process_file(file));
        } catch (const std::exception& e) {
            std::cerr << "[ULDAS] Error processing " << file << ": " << e.what() << "\n";
            FileResult failed;
            failed.path = file;
            failed.errors.push_back(std::string("Processing failed: ") + e.what());
            results.push_back(failed);
        }
    }

    return results;
}

// ═══════════════════════════════════════════════════════════════════════════
// Summary
// ═══════════════════════════════════════════════════════════════════════════

void MediaProcessor::print_summary(const std::vector<FileResult>& results, double runtime_seconds) const {
    std::cout << "\n═══════════════════════════════════════════════════════════\n";
    std::cout << "PROCESSING SUMMARY\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    int files_skipped = 0;
    std::vector<std::string> unsupported_files;
    int files_with_actions = 0;
    int files_ok = 0;
    int files_failed = 0;
    std::vector<std::string> silent_files;

    for (const auto& result : results) {
        if (result.skipped_due_to_tracking) {
            ++files_skipped;
            continue;
        }
        if (!result.skip_reason.empty()) {
            unsupported_files.push_back(file_name(result.path));
            continue;
        }

        std::vector<AudioTrackResult> processed = result.processed_tracks;
        std::sort(processed.begin(), processed.end(),
                  [](const AudioTrackResult& a, const AudioTrackResult& b) { return a.track_index < b.track_index; });
        std::vector<int> failed = result.failed_tracks;
        std::sort(failed.begin(), failed.end());

        std::vector<std::string> actions;
        bool silent = false;
        for (const auto& track : processed) {
            std::string line = "track" + std::to_string(track.track_index) + ": " +
                               track.previous_language + " -> " + track.detected_language;
            if (track.detected_language == "zxx") {
                line += " (no speech)";
                silent = true;
            }
            actions.push_back(line);
        }
        for (int idx : failed) {
            actions.push_back("track" + std::to_string(idx) + ": failed");
        }

        const std::string name = file_name(result.path);
        if (!actions.empty()) {
            std::cout << name << ": ";
            for (size_t i = 0; i < actions.size(); ++i) {
                std::cout << (i ? ", " : "") << actions[i];
            }
            std::cout << "\n";
        } else if (!result.errors.empty()) {
            std::cout << name << ": error - " << result.errors.front() << "\n";
        } else {
            continue;
        }

        ++files_with_actions;
        if (silent) silent_files.push_back(name);
        if (result.has_error()) {
            ++files_failed;
        } else {
            ++files_ok;
        }
    }

    if (files_skipped > 0) {
        std::cout << "\nSkipped " << files_skipped << " already-processed file(s)\n";
    }
    if (!unsupported_files.empty()) {
        std::cout << "Skipped " << unsupported_files.size()
                  << " non-Matroska file(s) (metadata cannot be edited in place):\n";
        for (const auto& name : unsupported_files) {
            std::cout << "   - " << name << "\n";
        }
    }

    if (files_with_actions > 0) {
        std::cout << "\nShowing " << files_with_actions << " files that required action (out of "
                  << results.size() << " total files)\n";
        if (files_ok > 0) std::cout << "Successfully processed " << files_ok << " files\n";
        if (files_failed > 0) std::cout << files_failed << " files failed!\n";
    } else {
        std::cout << "No files required any action\n";
    }

    if (tracker_) {
        TrackingStats stats = tracker_->get_stats();
        if (stats.total > 0) {
            std::cout << "\nTracking Statistics:\n";
            std::cout << "  Total files tracked: " << stats.total << "\n";
            if (stats.audio_only > 0) std::cout << "  Audio-only processed: " << stats.audio_only << "\n";
            if (stats.subtitle_only > 0) std::cout << "  Subtitle-only processed: " << stats.subtitle_only << "\n";
            if (stats.both > 0) std::cout << "  Both audio & subtitles: " << stats.both << "\n";
        }
    }

    if (!silent_files.empty()) {
        std::cout << "\nWARNING: Silent content detected in " << silent_files.size() << " file(s)\n";
        std::cout << "   These tracks were marked as 'zxx' (no linguistic content). You may want to verify them.\n";
        size_t shown = silent_files.size() <= 5 ? silent_files.size() : 3;
        for (size_t i = 0; i < shown; ++i) {
            std::cout << "   - " << silent_files[i] << "\n";
        }
        if (shown < silent_files.size()) {
            std::cout << "   ... and " << (silent_files.size() - shown) << " more\n";
        }
    }

    if (config_.process_subtitles) {
        std::cout << "\n═══════════════════════════════════════════════════════════\n";
        std::cout << "SUBTITLE PROCESSING SUMMARY\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

        int found = 0, processed = 0, skipped = 0, failed = 0, forced = 0, sdh = 0;

        for (const auto& result : results) {
            if (!result.subtitles) continue;
            const SubtitleResults& subs = *result.subtitles;

            found += subs.tracks_found;
            processed += static_cast<int>(subs.processed.size());
            skipped += static_cast<int>(subs.skipped.size());
            failed += static_cast<int>(subs.failed.size());

            if (subs.processed.empty() && subs.skipped.empty() && subs.failed.empty()) continue;

            std::cout << "\n" << file_name(result.path) << ":\n";
            for (const auto& track : subs.processed) {
                if (track.forced) ++forced;
                if (track.sdh) ++sdh;

                std::cout << "  subtitle track" << track.track_index << ": " << track.previous_language
                          << " -> " << track.detected_language << " (conf: " << format_conf(track.confidence) << ")";
                if (track.forced && track.sdh) std::cout << " [Forced, SDH]";
                else if (track.forced) std::cout << " [Forced]";
                else if (track.sdh) std::cout << " [SDH]";
                std::cout << "\n";
            }
            for (const auto& track : subs.skipped) {
                std::string reason = track.reason;
                if (reason == "confidence_below_threshold") {
                    std::ostringstream oss;
                    oss << "confidence below threshold (" << config_.subtitle_confidence_threshold << ")";
                    reason = oss.str();
                } else if (reason == "ocr_unavailable") {
                    reason = "image-based, no OCR";
                    if (track.forced) reason += *track.forced ? "; looks forced" : "; looks full";
                }
                std::cout << "  subtitle track" << track.track_index << ": skipped (detected: "
                          << track.detected_language << ", conf: " << format_conf(track.confidence)
                          << ", reason: " << reason << ")\n";
            }
            for (int idx : subs.failed) {
                std::cout << "  subtitle track" << idx << ": failed\n";
            }
        }

        if (found > 0) {
            std::cout << "\nSubtitle tracks found: " << found << "\n";
            std::cout << "Successfully processed: " << processed << "\n";
            if (skipped > 0) std::cout << "Skipped: " << skipped << "\n";
            if (failed > 0) std::cout << "Failed: " << failed << "\n";
            if (forced > 0) std::cout << "Forced subtitles detected: " << forced << "\n";
            if (sdh > 0) std::cout << "SDH subtitles detected: " << sdh << "\n";
        } else {
            std::cout << "\nNo subtitle tracks found to process\n";
        }
    }

    std::cout << "\nTotal runtime: " << format_runtime(runtime_seconds) << "\n";
    if (config_.dry_run) {
        std::cout << "(Dry run - no files were actually modified)\n";
    }
    std::cout << std::endl;
}

} // namespace uldas
