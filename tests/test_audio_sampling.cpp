#include "uldas/audio_sampling.h"
#include "uldas/speech_recognizer.h"
#include "test_common.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace uldas;
using uldas_test::check;
using uldas_test::near;

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Audio Sampling Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    uldas_test::section("Window planning");
    {
        auto windows = plan_sample_windows(7200.0, 0);
        check(windows.size() == 5, "2-hour file: 5 windows");
        check(near(windows[0].start, 1080.0), "first window at 15% (1080s)");
        check(near(windows[0].length, 90.0), "90s windows for long files");
        check(near(windows[4].start, 4680.0), "last window at 65% (4680s)");

        auto retry1 = plan_sample_windows(7200.0, 1);
        check(near(retry1[0].start, 576.0), "retry 1 shifts positions (8% = 576s)");

        auto retry5 = plan_sample_windows(7200.0, 5);
        auto retry2 = plan_sample_windows(7200.0, 2);
        check(near(retry5[0].start, retry2[0].start), "retries past 2 reuse the last set");
    }
    {
        auto windows = plan_sample_windows(2400.0, 0);
        check(windows.size() == 4, "40-minute file: 4 windows");
        check(near(windows[0].length, 75.0), "75s windows for medium files");
        check(near(windows[0].start, 360.0), "first window at 15% (360s)");
    }
    {
        auto windows = plan_sample_windows(600.0, 0);
        check(windows.size() == 3, "10-minute file: 3 windows");
        check(near(windows[0].length, 60.0), "60s windows for short files");
        check(near(windows[0].start, 120.0), "first window at 20% (120s)");
        check(near(windows[2].start, 480.0), "last window at 80% (480s)");
    }
    {
        auto windows = plan_sample_windows(50.0, 0);
        bool all_clamped = true;
        for (const auto& w : windows) {
            if (w.start > 50.0 * 0.85) all_clamped = false;
        }
        check(all_clamped, "very short file: starts clamped to 85% of duration");
        check(!windows.empty() && near(windows.front().start, 42.0) && near(windows.back().start, 42.0),
              "upper bound wins over the 60s minimum start");
    }
    {
        auto unknown = plan_sample_windows(0.0, 0);
        auto assumed = plan_sample_windows(7200.0, 0);
        check(unknown.size() == assumed.size() && near(unknown[0].start, assumed[0].start),
              "unknown duration treated as 2 hours");
    }

    uldas_test::section("Stream strategies");
    const auto& strategies = default_stream_strategies();
    check(strategies.size() == 2, "two selector strategies");
    check(strategies.front() == StreamSelector::AudioTrackIndex, "audio-relative index tried first");

    uldas_test::section("Volume and conditioning");
    {
        std::vector<float> silence(SAMPLE_RATE, 0.0f);
        check(mean_volume_db(silence) <= SILENCE_FLOOR_DB, "digital silence below the floor");
        check(!is_usable_sample(silence, mean_volume_db(silence)), "silence is not usable");

        std::vector<float> tone(SAMPLE_RATE);
        for (size_t i = 0; i < tone.size(); ++i) {
            tone[i] = 0.5f * std::sin(2.0 * M_PI * 440.0 * i / SAMPLE_RATE);
        }
        double db = mean_volume_db(tone);
        check(near(db, 10.0 * std::log10(0.125), 0.1), "sine RMS level (~-9 dB)");

        std::vector<float> conditioned = tone;
        double conditioned_db = condition_for_speech(conditioned);
        check(conditioned_db > SILENCE_FLOOR_DB, "conditioned tone above the floor");
        check(is_usable_sample(conditioned, conditioned_db), "conditioned tone is usable");

        float peak = 0.0f;
        for (float s : conditioned) peak = std::max(peak, std::abs(s));
        check(near(peak, 0.95, 0.01), "peak normalized to 0.95");

        std::vector<float> short_clip(MIN_SAMPLE_COUNT - 1, 0.3f);
        check(!is_usable_sample(short_clip, -10.0), "clip below minimum length is not usable");
    }
    {
        // A DC offset is removed by the high-pass stage
        std::vector<float> dc(SAMPLE_RATE, 0.4f);
        apply_speech_filter(dc);
        check(std::abs(dc.back()) < 0.01f, "high-pass removes DC");
    }

    return uldas_test::finish("Audio sampling");
}
