#include "uldas/forced_subtitles.h"
#include "test_common.h"

using namespace uldas;
using uldas_test::check;
using uldas_test::near;

namespace {

SubtitleStatistics stats_of(double density, double coverage, int count, double gap_variance = 75.0) {
    SubtitleStatistics stats;
    stats.density = density;
    stats.coverage_percent = coverage;
    stats.count = count;
    stats.gap_variance = gap_variance;
    return stats;
}

// count entries of `length` seconds, one every `spacing` seconds from `offset`
std::vector<SubtitleEntry> evenly_spaced(int count, double spacing, double length, double offset = 0.0) {
    std::vector<SubtitleEntry> entries;
    for (int i = 0; i < count; ++i) {
        double start = offset + i * spacing;
        entries.emplace_back(i + 1, start, start + length, "Line " + std::to_string(i + 1));
    }
    return entries;
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Forced Subtitle Classifier Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    SubtitleOptions options;
    ForcedSubtitleClassifier classifier(options);

    uldas_test::section("Statistics");
    {
        std::vector<SubtitleEntry> entries = {
            {1, 10.0, 12.0, "a"},
            {2, 20.0, 23.0, "b"},
            {3, 30.0, 30.0, "zero length"},
            {4, 40.0, 45.0, "c"},
        };
        SubtitleStatistics stats = compute_subtitle_statistics(entries, 600.0);
        check(stats.count == 4, "every parsed entry counted");
        check(stats.timings.size() == 3, "zero-length entry not displayed");
        check(near(stats.total_duration, 10.0), "10s on screen");
        check(near(stats.coverage_percent, 10.0 / 600.0 * 100.0), "coverage percent");
        check(near(stats.density, 0.4), "4 entries in 10 minutes");
        check(near(stats.gap_variance, 20.25), "population variance of the 8s and 17s gaps");

        SubtitleStatistics empty = compute_subtitle_statistics({}, 600.0);
        check(empty.count == 0 && empty.density == 0.0, "empty track has zero statistics");
    }

    uldas_test::section("Tier 1 decisions");
    {
        ForcedVerdict v = classifier.decide_from_statistics(stats_of(1.0, 10.0, 120), 120.0);
        check(v.decided && v.forced && v.confidence_tier == 3, "density 1 / coverage 10% -> forced");

        v = classifier.decide_from_statistics(stats_of(12.0, 60.0, 1440), 120.0);
        check(v.decided && !v.forced && v.confidence_tier == 3, "density 12 / coverage 60% -> full");

        v = classifier.decide_from_statistics(stats_of(4.0, 35.0, 30), 120.0);
        check(v.decided && v.forced && v.confidence_tier == 3, "fewer than 50 entries -> forced");

        v = classifier.decide_from_statistics(stats_of(6.0, 28.0, 400), 45.0);
        check(v.decided && !v.forced && v.confidence_tier == 3, "over 300 entries on a 45-minute file -> full");

        v = classifier.decide_from_statistics(stats_of(6.0, 28.0, 400), 20.0);
        check(!v.decided, "high count ignored on short files");
    }

    uldas_test::section("Tier 2 voting");
    {
        ForcedVerdict v = classifier.decide_from_statistics(stats_of(4.0, 28.0, 120, 150.0), 30.0);
        check(v.decided && v.forced && v.confidence_tier == 2, "forced indicators only -> forced");

        v = classifier.decide_from_statistics(stats_of(7.0, 45.0, 280, 20.0), 40.0);
        check(v.decided && !v.forced && v.confidence_tier == 2, "full indicators only -> full");
    }

    uldas_test::section("Tier 3 ambiguity");
    {
        ForcedVerdict v = classifier.decide_from_statistics(stats_of(5.5, 35.0, 200), 36.0);
        check(!v.decided && v.confidence_tier == 1, "density 5.5 / coverage 35% -> ambiguous");

        SubtitleOptions no_audio = options;
        no_audio.audio_overlap_analysis = false;
        ForcedSubtitleClassifier heuristic_only(no_audio);
        v = heuristic_only.decide_from_statistics(stats_of(5.5, 35.0, 200), 36.0);
        check(v.decided && v.forced, "audio analysis disabled: heuristic (coverage < 37.5%) -> forced");

        v = heuristic_only.heuristic(stats_of(5.6, 38.0, 200), "test");
        check(!v.forced, "heuristic: density 5.6 and coverage 38% -> full");
    }

    uldas_test::section("Speech overlap");
    {
        SubtitleStatistics stats = stats_of(5.5, 35.0, 200);
        stats.timings = {{10.0, 20.0}, {30.0, 40.0}};

        std::vector<SpeechSegment> covered = {{10.0, 20.0}, {30.0, 40.0}};
        ForcedVerdict v = classifier.classify_with_speech(stats, 100.0, covered);
        check(!v.forced, "subtitles cover all speech -> full");

        std::vector<SpeechSegment> mostly_bare = {{10.0, 12.0}, {50.0, 90.0}};
        v = classifier.classify_with_speech(stats, 100.0, mostly_bare);
        check(v.forced, "most speech without subtitles -> forced");

        v = classifier.classify_with_speech(stats, 100.0, {});
        check(v.forced, "no speech at all -> forced");
    }

    uldas_test::section("classify() with a speech provider");
    {
        // 216 entries over 36 minutes: density 6.0, 3.5s each -> coverage 35%
        std::vector<SubtitleEntry> entries = evenly_spaced(216, 10.0, 3.5);
        const double duration = 2160.0;

        int provider_calls = 0;
        ForcedVerdict v = classifier.classify(entries, duration, [&](std::vector<SpeechSegment>& speech) {
            provider_calls++;
            for (const auto& e : entries) speech.emplace_back(e.start, e.end);
            return true;
        });
        check(provider_calls == 1, "ambiguous track consults the speech provider");
        check(!v.forced, "speech matches subtitles -> full");

        provider_calls = 0;
        v = classifier.classify(entries, duration, [&](std::vector<SpeechSegment>&) {
            provider_calls++;
            return false;
        });
        check(provider_calls == 1 && v.forced, "failed provider falls back to the heuristic");

        auto sparse = evenly_spaced(20, 60.0, 2.0);
        provider_calls = 0;
        v = classifier.classify(sparse, 3600.0, [&](std::vector<SpeechSegment>&) {
            provider_calls++;
            return true;
        });
        check(provider_calls == 0 && v.forced, "clear-cut track never extracts audio");

        v = classifier.classify({}, 3600.0, nullptr);
        check(!v.forced, "no entries -> not forced");
        v = classifier.classify(sparse, 0.0, nullptr);
        check(!v.forced, "unknown duration -> not forced");
    }

    uldas_test::section("Image tracks");
    {
        check(classifier.classify_image_track(80, 5400.0).forced, "under 100 frames -> forced");
        check(classifier.classify_image_track(300, 5400.0).forced, "3.3 frames/min -> forced");
        check(!classifier.classify_image_track(3000, 5400.0).forced, "33 frames/min -> full");
        check(classifier.classify_image_track(900, 5400.0).forced, "10 frames/min -> forced");
        check(!classifier.classify_image_track(1800, 5400.0).forced, "20 frames/min -> full");
    }

    return uldas_test::finish("Forced subtitles");
}
