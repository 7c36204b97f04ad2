#pragma once

#include "export.h"
#include "types.h"
#include <string>

namespace uldas {

/// Config file used when none is given on the command line
constexpr const char* DEFAULT_CONFIG_PATH = "config/config.yml";

/**
 * @brief Run configuration (YAML file, then command-line overrides)
 */
struct Config {
    // ═══════════════════════════════════════════════════════════
    // Model
    // ═══════════════════════════════════════════════════════════
    std::string whisper_model = "base";    // Model name (under model_directory) or path
    std::string model_directory = "models";
    std::string device = "auto";           // "auto", "cuda", "cpu"
    std::string compute_type = "auto";     // "auto", "float32", "float16", "int8", "int8_float16"
    int cpu_threads = 0;                   // 0 = auto

    // ═══════════════════════════════════════════════════════════
    // Voice Activity Detection (VAD)
    // ═══════════════════════════════════════════════════════════
    bool vad_filter = true;
    int vad_min_speech_duration_ms = 250;
    int vad_max_speech_duration_s = 30;
    std::string silero_model_path;         // Empty = energy-based VAD

    // ═══════════════════════════════════════════════════════════
    // Audio Language Detection
    // ═══════════════════════════════════════════════════════════
    float confidence_threshold = 0.9f;
    int max_retries = 3;
    double operation_timeout_seconds = 600.0;
    bool reprocess_all = false;            // Re-detect tracks that already have a language
    bool force_reprocess = false;          // Ignore the tracking cache

    // ═══════════════════════════════════════════════════════════
    // Tracking
    // ═══════════════════════════════════════════════════════════
    bool use_tracking = true;
    std::string tracking_database = "config/processed_files.db";

    // ═══════════════════════════════════════════════════════════
    // Subtitles
    // ═══════════════════════════════════════════════════════════
    bool process_subtitles = false;
    bool analyze_forced_subtitles = false;
    bool forced_audio_analysis = true;     // Resolve ambiguous tracks against speech timing
    bool detect_sdh_subtitles = true;
    float subtitle_confidence_threshold = 0.85f;
    bool reprocess_all_subtitles = false;

    double forced_subtitle_low_coverage_threshold = 25.0;
    double forced_subtitle_low_density_threshold = 3.0;
    double forced_subtitle_high_density_threshold = 8.0;
    int forced_subtitle_min_count_threshold = 50;
    int forced_subtitle_max_count_threshold = 300;

    // ═══════════════════════════════════════════════════════════
    // Run
    // ═══════════════════════════════════════════════════════════
    bool dry_run = false;
    bool show_details = false;
    bool quiet = false;
    std::string path;                      // Directory to scan

    /**
     * @brief Audio detection settings derived from this config
     */
    DetectionOptions detection_options() const;

    /**
     * @brief Subtitle analysis settings derived from this config
     */
    SubtitleOptions subtitle_options() const;
};

/**
 * @brief Load a YAML config file over the defaults
 *
 * Missing keys keep their defaults. A missing file is not an error.
 * A malformed file is reported and leaves every value at its default.
 *
 * @param path Config file
 * @param config Output
 * @return False if the file exists but could not be loaded
 */
ULDAS_API bool load_config(const std::string& path, Config& config);

/**
 * @brief Write a commented sample config with every key at its default
 * @return False if the file already exists or cannot be written
 */
ULDAS_API bool create_sample_config(const std::string& path);

} // namespace uldas
