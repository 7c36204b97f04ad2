#include "uldas/config.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace uldas;
using uldas_test::check;
using uldas_test::near;

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Config Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    const fs::path dir = fs::temp_directory_path() / "uldas_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    uldas_test::section("Defaults");
    {
        Config config;
        check(config.whisper_model == "base", "whisper_model base");
        check(near(config.confidence_threshold, 0.9, 1e-6), "confidence threshold 0.9");
        check(config.max_retries == 3, "3 retries");
        check(near(config.subtitle_confidence_threshold, 0.85, 1e-6), "subtitle threshold 0.85");
        check(config.use_tracking && !config.process_subtitles, "tracking on, subtitles off");

        check(load_config((dir / "absent.yml").string(), config), "missing file keeps defaults");
        check(config.max_retries == 3, "defaults untouched");
    }

    uldas_test::section("Loading");
    {
        const fs::path path = dir / "config.yml";
        {
            std::ofstream out(path);
            out << "whisper_model: large-v3\n"
                << "device: cpu\n"
                << "confidence_threshold: 0.8\n"
                << "max_retries: 5\n"
                << "vad_filter: false\n"
                << "process_subtitles: true\n"
                << "forced_subtitle_min_count_threshold: 40\n"
                << "forced_audio_analysis: false\n"
                << "show_details: true\n"
                << "unknown_key: ignored\n";
        }

        Config config;
        check(load_config(path.string(), config), "config loads");
        check(config.whisper_model == "large-v3", "string key");
        check(config.device == "cpu", "device key");
        check(near(config.confidence_threshold, 0.8, 1e-6), "float key");
        check(config.max_retries == 5, "int key");
        check(!config.vad_filter, "bool key");
        check(config.model_directory == "models", "absent key keeps default");

        DetectionOptions detection = config.detection_options();
        check(detection.max_retries == 5 && !detection.vad_filter && detection.show_details,
              "detection options mirror the config");

        SubtitleOptions subtitles = config.subtitle_options();
        check(subtitles.min_count_threshold == 40, "forced thresholds mapped");
        check(!subtitles.audio_overlap_analysis, "audio overlap switch mapped");
    }

    uldas_test::section("Invalid files");
    {
        const fs::path bad_value = dir / "bad_value.yml";
        {
            std::ofstream out(bad_value);
            out << "max_retries: many\n";
        }
        Config config;
        check(!load_config(bad_value.string(), config), "wrong value type rejected");
        check(config.max_retries == 3, "config untouched after a bad value");

        const fs::path bad_syntax = dir / "bad_syntax.yml";
        {
            std::ofstream out(bad_syntax);
            out << "whisper_model: [unterminated\n";
        }
        check(!load_config(bad_syntax.string(), config), "malformed YAML rejected");

        const fs::path not_map = dir / "list.yml";
        {
            std::ofstream out(not_map);
            out << "- one\n- two\n";
        }
        check(!load_config(not_map.string(), config), "top-level list rejected");
    }

    uldas_test::section("Sample config");
    {
        const fs::path sample = dir / "nested" / "config.yml";
        check(create_sample_config(sample.string()), "sample written (parent created)");

        Config loaded;
        loaded.max_retries = 99;
        check(load_config(sample.string(), loaded), "sample loads back");
        check(loaded.max_retries == 3, "sample carries the defaults");
        check(loaded.silero_model_path.empty() && loaded.path.empty(), "empty strings round-trip");

        check(!create_sample_config(sample.string()), "existing file not overwritten");
    }

    fs::remove_all(dir);
    return uldas_test::finish("Config");
}
