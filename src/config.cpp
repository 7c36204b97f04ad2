#include "uldas/config.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace uldas {

namespace {

template <typename T>
void read_key(const YAML::Node& root, const char* key, T& value) {
    const YAML::Node node = root[key];
    if (node && !node.IsNull()) {
        value = node.as<T>();
    }
}

void apply_node(const YAML::Node& root, Config& c) {
    read_key(root, "whisper_model", c.whisper_model);
    read_key(root, "model_directory", c.model_directory);
    read_key(root, "device", c.device);
    read_key(root, "compute_type", c.compute_type);
    read_key(root, "cpu_threads", c.cpu_threads);

    read_key(root, "vad_filter", c.vad_filter);
    read_key(root, "vad_min_speech_duration_ms", c.vad_min_speech_duration_ms);
    read_key(root, "vad_max_speech_duration_s", c.vad_max_speech_duration_s);
    read_key(root, "silero_model_path", c.silero_model_path);

    read_key(root, "confidence_threshold", c.confidence_threshold);
    read_key(root, "max_retries", c.max_retries);
    read_key(root, "operation_timeout_seconds", c.operation_timeout_seconds);
    read_key(root, "reprocess_all", c.reprocess_all);
    read_key(root, "force_reprocess", c.force_reprocess);

    read_key(root, "use_tracking", c.use_tracking);
    read_key(root, "tracking_database", c.tracking_database);

    read_key(root, "process_subtitles", c.process_subtitles);
    read_key(root, "analyze_forced_subtitles", c.analyze_forced_subtitles);
    read_key(root, "forced_audio_analysis", c.forced_audio_analysis);
    read_key(root, "detect_sdh_subtitles", c.detect_sdh_subtitles);
    read_key(root, "subtitle_confidence_threshold", c.subtitle_confidence_threshold);
    read_key(root, "reprocess_all_subtitles", c.reprocess_all_subtitles);

    read_key(root, "forced_subtitle_low_coverage_threshold", c.forced_subtitle_low_coverage_threshold);
    read_key(root, "forced_subtitle_low_density_threshold", c.forced_subtitle_low_density_threshold);
    read_key(root, "forced_subtitle_high_density_threshold", c.forced_subtitle_high_density_threshold);
    read_key(root, "forced_subtitle_min_count_threshold", c.forced_subtitle_min_count_threshold);
    read_key(root, "forced_subtitle_max_count_threshold", c.forced_subtitle_max_count_threshold);

    read_key(root, "dry_run", c.dry_run);
    read_key(root, "show_details", c.show_details);
    read_key(root, "quiet", c.quiet);
    read_key(root, "path", c.path);
}

} // anonymous namespace

DetectionOptions Config::detection_options() const {
    DetectionOptions options;
    options.confidence_threshold = confidence_threshold;
    options.max_retries = max_retries;
    options.vad_filter = vad_filter;
    options.vad_min_speech_duration_ms = vad_min_speech_duration_ms;
    options.vad_max_speech_duration_s = vad_max_speech_duration_s;
    options.operation_timeout_seconds = operation_timeout_seconds;
    options.show_details = show_details;
    return options;
}

SubtitleOptions Config::subtitle_options() const {
    SubtitleOptions options;
    options.confidence_threshold = subtitle_confidence_threshold;
    options.low_coverage_threshold = forced_subtitle_low_coverage_threshold;
    options.low_density_threshold = forced_subtitle_low_density_threshold;
    options.high_density_threshold = forced_subtitle_high_density_threshold;
    options.min_count_threshold = forced_subtitle_min_count_threshold;
    options.max_count_threshold = forced_subtitle_max_count_threshold;
    options.audio_overlap_analysis = forced_audio_analysis;
    options.show_details = show_details;
    return options;
}

bool load_config(const std::string& path, Config& config) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return true;
    }

    // Parse into a copy so a bad value leaves the defaults untouched
    Config loaded = config;
    try {
        YAML::Node root = YAML::LoadFile(path);
        if (root.IsNull()) {
            return true;
        }
        if (!root.IsMap()) {
            std::cerr << "[ULDAS] Error loading config " << path << ": top level is not a mapping\n";
            return false;
        }
        apply_node(root, loaded);
    } catch (const YAML::Exception& e) {
        std::cerr << "[ULDAS] Error loading config " << path << ": " << e.what() << "\n";
        return false;
    }

    config = loaded;
    return true;
}

bool create_sample_config(const std::string& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::cerr << "[ULDAS] Config file already exists: " << path << "\n";
        return false;
    }

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    const Config d;
    std::ostringstream out;
    out << std::boolalpha
        << "# ULDAS configuration\n"
        << "\n"
        << "# Model\n"
        << "whisper_model: " << d.whisper_model << "            # Name under model_directory, or a path\n"
        << "model_directory: " << d.model_directory << "\n"
        << "device: " << d.device << "                   # auto, cuda, cpu\n"
        << "compute_type: " << d.compute_type << "             # auto, float32, float16, int8, int8_float16\n"
        << "cpu_threads: " << d.cpu_threads << "                 # 0 = auto\n"
        << "\n"
        << "# Voice activity detection\n"
        << "vad_filter: " << d.vad_filter << "\n"
        << "vad_min_speech_duration_ms: " << d.vad_min_speech_duration_ms << "\n"
        << "vad_max_speech_duration_s: " << d.vad_max_speech_duration_s << "\n"
        << "silero_model_path: \"\"          # Empty = energy VAD\n"
        << "\n"
        << "# Audio language detection\n"
        << "confidence_threshold: " << d.confidence_threshold << "\n"
        << "max_retries: " << d.max_retries << "\n"
        << "operation_timeout_seconds: " << d.operation_timeout_seconds << "\n"
        << "reprocess_all: " << d.reprocess_all << "\n"
        << "force_reprocess: " << d.force_reprocess << "\n"
        << "\n"
        << "# Tracking\n"
        << "use_tracking: " << d.use_tracking << "\n"
        << "tracking_database: " << d.tracking_database << "\n"
        << "\n"
        << "# Subtitles\n"
        << "process_subtitles: " << d.process_subtitles << "\n"
        << "analyze_forced_subtitles: " << d.analyze_forced_subtitles << "\n"
        << "forced_audio_analysis: " << d.forced_audio_analysis << "\n"
        << "detect_sdh_subtitles: " << d.detect_sdh_subtitles << "\n"
        << "subtitle_confidence_threshold: " << d.subtitle_confidence_threshold << "\n"
        << "reprocess_all_subtitles: " << d.reprocess_all_subtitles << "\n"
        << "forced_subtitle_low_coverage_threshold: " << d.forced_subtitle_low_coverage_threshold << "\n"
        << "forced_subtitle_low_density_threshold: " << d.forced_subtitle_low_density_threshold << "\n"
        << "forced_subtitle_high_density_threshold: " << d.forced_subtitle_high_density_threshold << "\n"
        << "forced_subtitle_min_count_threshold: " << d.forced_subtitle_min_count_threshold << "\n"
        << "forced_subtitle_max_count_threshold: " << d.forced_subtitle_max_count_threshold << "\n"
        << "\n"
        << "# Run\n"
        << "dry_run: " << d.dry_run << "\n"
        << "show_details: " << d.show_details << "\n"
        << "quiet: " << d.quiet << "\n"
        << "path: \"\"                       # Directory to scan\n";

    // The sample must load back cleanly
    try {
        Config check;
        apply_node(YAML::Load(out.str()), check);
    } catch (const YAML::Exception& e) {
        std::cerr << "[ULDAS] Sample config does not parse: " << e.what() << "\n";
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ULDAS] Cannot write config file: " << path << "\n";
        return false;
    }
    file << out.str();
    return file.good();
}

} // namespace uldas
