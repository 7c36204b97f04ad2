#include "uldas/cld2_language_detector.h"
#include "uldas/config.h"
#include "uldas/media_extractor.h"
#include "uldas/media_processor.h"
#include "uldas/metadata_writer.h"
#include "uldas/processing_tracker.h"
#include "uldas/whisper_recognizer.h"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FILE_ERRORS = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [directory]\n";
    std::cout << "\nDetects the spoken language of untagged audio tracks and writes it back.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config FILE               Configuration file (default: " << uldas::DEFAULT_CONFIG_PATH << ")\n";
    std::cout << "  --create-config             Write a sample configuration file and exit\n";
    std::cout << "  --directory DIR             Directory to scan (or give it as a positional argument)\n";
    std::cout << "  --model NAME                Whisper model name or path\n";
    std::cout << "  --device D                  auto, cuda, cpu\n";
    std::cout << "  --compute-type T            auto, float32, float16, int8, int8_float16\n";
    std::cout << "  --no-vad                    Disable voice activity detection\n";
    std::cout << "  --dry-run                   Report changes without modifying files\n";
    std::cout << "  --reprocess-all             Re-detect tracks that already have a language\n";
    std::cout << "  --process-subtitles         Also classify subtitle tracks\n";
    std::cout << "  --analyze-forced            Detect forced subtitle tracks\n";
    std::cout << "  --no-sdh-detection          Skip SDH detection\n";
    std::cout << "  --reprocess-all-subtitles   Re-detect subtitle tracks that already have a language\n";
    std::cout << "  --force-reprocess           Ignore the processing cache\n";
    std::cout << "  --clear-tracking            Clear the processing cache and exit\n";
    std::cout << "  --no-tracking               Do not read or write the processing cache\n";
    std::cout << "  --tracking-stats            Show processing cache statistics and exit\n";
    std::cout << "  -v, --verbose               Detailed per-track output\n";
    std::cout << "  -q, --quiet                 Only print the summary and errors\n";
    std::cout << "  -h, --help                  Show this help\n";
}

void print_tracking_stats(const uldas::TrackingStats& stats) {
    std::cout << "Tracking Statistics:\n";
    std::cout << "  Total files tracked:    " << stats.total << "\n";
    std::cout << "  Audio-only processed:   " << stats.audio_only << "\n";
    std::cout << "  Subtitle-only processed: " << stats.subtitle_only << "\n";
    std::cout << "  Both audio & subtitles: " << stats.both << "\n";
}

// Name under model_directory, unless it already names a directory
std::string resolve_model_path(const uldas::Config& config) {
    std::error_code ec;
    if (fs::is_directory(config.whisper_model, ec)) {
        return config.whisper_model;
    }
    return (fs::path(config.model_directory) / config.whisper_model).string();
}

struct CommandLine {
    std::string config_path = uldas::DEFAULT_CONFIG_PATH;
    std::string directory;
    std::string model;
    std::string device;
    std::string compute_type;

    bool create_config = false;
    bool clear_tracking = false;
    bool tracking_stats = false;
    bool help = false;

    bool dry_run = false;
    bool verbose = false;
    bool quiet = false;
    bool no_vad = false;
    bool reprocess_all = false;
    bool process_subtitles = false;
    bool analyze_forced = false;
    bool no_sdh_detection = false;
    bool reprocess_all_subtitles = false;
    bool force_reprocess = false;
    bool no_tracking = false;
};

bool parse_command_line(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto take_value = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "[ULDAS] Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") cmd.help = true;
        else if (arg == "--config") { if (!take_value(cmd.config_path)) return false; }
        else if (arg == "--directory") { if (!take_value(cmd.directory)) return false; }
        else if (arg == "--model") { if (!take_value(cmd.model)) return false; }
        else if (arg == "--device") { if (!take_value(cmd.device)) return false; }
        else if (arg == "--compute-type") { if (!take_value(cmd.compute_type)) return false; }
        else if (arg == "--create-config") cmd.create_config = true;
        else if (arg == "--dry-run") cmd.dry_run = true;
        else if (arg == "-v" || arg == "--verbose") cmd.verbose = true;
        else if (arg == "-q" || arg == "--quiet") cmd.quiet = true;
        else if (arg == "--no-vad") cmd.no_vad = true;
        else if (arg == "--reprocess-all") cmd.reprocess_all = true;
        else if (arg == "--process-subtitles") cmd.process_subtitles = true;
        else if (arg == "--analyze-forced") cmd.analyze_forced = true;
        else if (arg == "--no-sdh-detection") cmd.no_sdh_detection = true;
        else if (arg == "--reprocess-all-subtitles") cmd.reprocess_all_subtitles = true;
        else if (arg == "--force-reprocess") cmd.force_reprocess = true;
        else if (arg == "--clear-tracking") cmd.clear_tracking = true;
        else if (arg == "--no-tracking") cmd.no_tracking = true;
        else if (arg == "--tracking-stats") cmd.tracking_stats = true;
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[ULDAS] Unknown option: " << arg << "\n";
            return false;
        } else if (cmd.directory.empty()) {
            cmd.directory = arg;
        } else {
            std::cerr << "[ULDAS] Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Command-line flags win over the config file
void apply_overrides(const CommandLine& cmd, uldas::Config& config) {
    if (!cmd.directory.empty()) config.path = cmd.directory;
    if (!cmd.model.empty()) config.whisper_model = cmd.model;
    if (!cmd.device.empty()) config.device = cmd.device;
    if (!cmd.compute_type.empty()) config.compute_type = cmd.compute_type;
    if (cmd.dry_run) config.dry_run = true;
    if (cmd.verbose) config.show_details = true;
    if (cmd.quiet) config.quiet = true;
    if (cmd.no_vad) config.vad_filter = false;
    if (cmd.reprocess_all) config.reprocess_all = true;
    if (cmd.process_subtitles) config.process_subtitles = true;
    if (cmd.analyze_forced) config.analyze_forced_subtitles = true;
    if (cmd.no_sdh_detection) config.detect_sdh_subtitles = false;
    if (cmd.reprocess_all_subtitles) {
        config.reprocess_all_subtitles = true;
        config.process_subtitles = true;
    }
    if (cmd.force_reprocess) config.force_reprocess = true;
    if (cmd.no_tracking) config.use_tracking = false;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (cmd.help) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    if (cmd.create_config) {
        if (!uldas::create_sample_config(cmd.config_path)) {
            return EXIT_USAGE;
        }
        std::cout << "[ULDAS] Sample configuration written to " << cmd.config_path << "\n";
        return EXIT_OK;
    }

    uldas::Config config;
    if (!uldas::load_config(cmd.config_path, config)) {
        return EXIT_USAGE;
    }
    apply_overrides(cmd, config);

    // ═══════════════════════════════════════════════════════════
    // Tracking maintenance
    // ═══════════════════════════════════════════════════════════
    std::unique_ptr<uldas::ProcessingTracker> tracker;
    if (config.use_tracking || cmd.clear_tracking || cmd.tracking_stats) {
        try {
            tracker = std::make_unique<uldas::ProcessingTracker>(config.tracking_database);
        } catch (const std::exception& e) {
            std::cerr << "[ULDAS] " << e.what() << "\n";
            return EXIT_USAGE;
        }
    }

    if (cmd.clear_tracking || cmd.tracking_stats) {
        if (cmd.clear_tracking) {
            if (!tracker->clear_all()) {
                std::cerr << "[ULDAS] Failed to clear tracking: " << tracker->get_last_error() << "\n";
                return EXIT_USAGE;
            }
            std::cout << "[ULDAS] Tracking cache cleared\n";
        }
        if (cmd.tracking_stats) {
            print_tracking_stats(tracker->get_stats());
        }
        return EXIT_OK;
    }

    if (!config.use_tracking) {
        tracker.reset();
    }

    if (config.path.empty()) {
        std::cerr << "[ULDAS] No directory given\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    std::error_code ec;
    if (!fs::is_directory(config.path, ec)) {
        std::cerr << "[ULDAS] Not a directory: " << config.path << "\n";
        return EXIT_USAGE;
    }

    // ═══════════════════════════════════════════════════════════
    // Engines
    // ═══════════════════════════════════════════════════════════
    uldas::MkvPropEditWriter writer("mkvpropedit", config.dry_run);
    if (!config.dry_run && !writer.is_available()) {
        std::cerr << "[ULDAS] mkvpropedit not found in PATH (install MKVToolNix)\n";
        return EXIT_USAGE;
    }

    uldas::ModelOptions model_options;
    model_options.model_path = resolve_model_path(config);
    model_options.cpu_threads = config.cpu_threads;
    model_options.silero_model_path = config.silero_model_path;
    model_options.verbose = config.show_details;

    std::unique_ptr<uldas::WhisperRecognizer> recognizer;
    try {
        model_options.device = uldas::parse_device_type(config.device);
        model_options.compute_type = uldas::parse_compute_type(config.compute_type);
        recognizer = std::make_unique<uldas::WhisperRecognizer>(model_options);
    } catch (const std::exception& e) {
        std::cerr << "[ULDAS] Failed to load model " << model_options.model_path << ": " << e.what() << "\n";
        return EXIT_USAGE;
    }

    uldas::MediaExtractor extractor;
    uldas::Cld2LanguageDetector text_detector;

    uldas::MediaProcessor processor(config, extractor, *recognizer, writer, tracker.get(), &text_detector);

    auto start_time = std::chrono::steady_clock::now();
    std::vector<uldas::FileResult> results = processor.process_directory(config.path);
    double runtime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    processor.print_summary(results, runtime);

    for (const auto& result : results) {
        if (result.has_error()) {
            return EXIT_FILE_ERRORS;
        }
    }
    return EXIT_OK;
}
