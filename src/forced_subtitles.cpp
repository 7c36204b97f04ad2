#include "uldas/forced_subtitles.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace uldas {

namespace {

std::string fmt(double value, int precision = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

ForcedVerdict make_verdict(bool forced, std::string reason, int tier) {
    ForcedVerdict verdict;
    verdict.forced = forced;
    verdict.decided = true;
    verdict.reason = std::move(reason);
    verdict.confidence_tier = tier;
    return verdict;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

SubtitleStatistics compute_subtitle_statistics(const std::vector<SubtitleEntry>& entries,
                                               double duration) {
    SubtitleStatistics stats;
    if (entries.empty() || duration <= 0.0) {
        return stats;
    }

    for (const auto& entry : entries) {
        double length = entry.end - entry.start;
        if (length > 0.0) {
            stats.total_duration += length;
            stats.timings.emplace_back(entry.start, entry.end);
        }
    }

    stats.count = static_cast<int>(entries.size());
    stats.coverage_percent = stats.total_duration / duration * 100.0;
    stats.density = static_cast<double>(entries.size()) / (duration / 60.0);
    stats.avg_duration = stats.timings.empty()
        ? 0.0
        : stats.total_duration / static_cast<double>(stats.timings.size());

    // Gaps between consecutive displayed entries; overlaps are ignored
    std::vector<double> gaps;
    for (size_t i = 0; i + 1 < stats.timings.size(); ++i) {
        double gap = stats.timings[i + 1].first - stats.timings[i].second;
        if (gap >= 0.0) gaps.push_back(gap);
    }

    if (gaps.size() > 1) {
        double mean = 0.0;
        for (double g : gaps) mean += g;
        mean /= static_cast<double>(gaps.size());

        double variance = 0.0;
        for (double g : gaps) variance += (g - mean) * (g - mean);
        stats.gap_variance = variance / static_cast<double>(gaps.size());
    }

    return stats;
}

ForcedSubtitleClassifier::ForcedSubtitleClassifier(const SubtitleOptions& options)
    : options_(options)
{
}

ForcedVerdict ForcedSubtitleClassifier::decide_from_statistics(const SubtitleStatistics& stats,
                                                               double duration_minutes) const {
    const double density = stats.density;
    const double coverage = stats.coverage_percent;
    const int count = stats.count;

    // ═══════════════════════════════════════════════════════════
    // Tier 1: hard thresholds (confidence 3)
    // ═══════════════════════════════════════════════════════════
    if (density < options_.low_density_threshold && coverage < options_.low_coverage_threshold) {
        return make_verdict(true, "Very low density (" + fmt(density) + " subs/min) and coverage (" +
                                  fmt(coverage) + "%)", 3);
    }
    if (count < options_.min_count_threshold) {
        return make_verdict(true, "Very low subtitle count (" + std::to_string(count) +
                                  " subtitles)", 3);
    }
    if (density < 2.0) {
        return make_verdict(true, "Extremely low density (" + fmt(density) + " subs/min)", 3);
    }
    if (density > options_.high_density_threshold && coverage > 30.0) {
        return make_verdict(false, "High density (" + fmt(density) + " subs/min) and coverage (" +
                                   fmt(coverage) + "%)", 3);
    }
    if (count > options_.max_count_threshold && duration_minutes > 30.0) {
        return make_verdict(false, "High subtitle count (" + std::to_string(count) +
                                   " subtitles for " + fmt(duration_minutes, 0) + " min video)", 3);
    }
    if (density > 10.0) {
        return make_verdict(false, "Very high density (" + fmt(density) + " subs/min)", 3);
    }

    // ═══════════════════════════════════════════════════════════
    // Tier 2: indicator voting (confidence 2)
    // ═══════════════════════════════════════════════════════════
    int forced_indicators = 0;
    int full_indicators = 0;

    if (density < 5.0) forced_indicators++;
    if (density > 6.0) full_indicators++;
    if (coverage < 30.0) forced_indicators++;
    if (coverage > 40.0) full_indicators++;
    if (count < 150) forced_indicators++;
    if (count > 250) full_indicators++;
    if (stats.gap_variance > 100.0) forced_indicators++;  // Clustered
    if (stats.gap_variance < 50.0) full_indicators++;     // Evenly spread

    if (forced_indicators >= 2 && full_indicators == 0) {
        std::vector<std::string> factors;
        if (density < 5.0) factors.push_back("density=" + fmt(density));
        if (coverage < 30.0) factors.push_back("coverage=" + fmt(coverage) + "%");
        if (count < 150) factors.push_back("count=" + std::to_string(count));
        return make_verdict(true, "Multiple forced indicators: " + join(factors), 2);
    }
    if (full_indicators >= 2 && forced_indicators == 0) {
        std::vector<std::string> factors;
        if (density > 6.0) factors.push_back("density=" + fmt(density));
        if (coverage > 40.0) factors.push_back("coverage=" + fmt(coverage) + "%");
        if (count > 250) factors.push_back("count=" + std::to_string(count));
        return make_verdict(false, "Multiple full indicators: " + join(factors), 2);
    }

    // ═══════════════════════════════════════════════════════════
    // Tier 3: ambiguous (confidence 1)
    // ═══════════════════════════════════════════════════════════
    std::string reason = "Ambiguous metrics: density=" + fmt(density) + " subs/min, coverage=" +
                         fmt(coverage) + "%, count=" + std::to_string(count);

    if (!options_.audio_overlap_analysis) {
        return heuristic(stats, reason + " (audio analysis disabled, using heuristic)");
    }

    ForcedVerdict pending;
    pending.decided = false;
    pending.reason = reason;
    pending.confidence_tier = 1;
    return pending;
}

ForcedVerdict ForcedSubtitleClassifier::heuristic(const SubtitleStatistics& stats,
                                                  const std::string& reason) const {
    bool forced = stats.density < 5.5 || stats.coverage_percent < 37.5;
    return make_verdict(forced, reason, 1);
}

ForcedVerdict ForcedSubtitleClassifier::classify_with_speech(
    const SubtitleStatistics& stats,
    double duration,
    const std::vector<SpeechSegment>& speech
) const {
    if (speech.empty()) {
        return make_verdict(true, "No speech detected in audio", 1);
    }

    double total_speech = 0.0;
    for (const auto& segment : speech) {
        total_speech += segment.end - segment.start;
    }
    double speech_coverage = duration > 0.0 ? total_speech / duration * 100.0 : 0.0;

    double overlap = 0.0;
    for (const auto& timing : stats.timings) {
        for (const auto& segment : speech) {
            double start = std::max(timing.first, segment.start);
            double end = std::min(timing.second, segment.end);
            if (start < end) overlap += end - start;
        }
    }

    double speech_with_subtitles = total_speech > 0.0 ? overlap / total_speech * 100.0 : 0.0;
    double coverage_ratio = speech_coverage > 0.0 ? stats.coverage_percent / speech_coverage : 0.0;

    if (options_.show_details) {
        std::cout << "[ULDAS]   Speech coverage: " << fmt(speech_coverage) << "% of total duration\n";
        std::cout << "[ULDAS]   Speech with subtitles: " << fmt(speech_with_subtitles) << "%\n";
        std::cout << "[ULDAS]   Coverage ratio (sub/speech): " << fmt(coverage_ratio, 2) << "\n";
    }

    bool forced = false;
    std::string reason;

    if (speech_with_subtitles < 50.0) {
        forced = true;
        reason = "Only " + fmt(speech_with_subtitles) + "% of speech has subtitles";
    }
    if (coverage_ratio < 0.4) {
        forced = true;
        reason = "Subtitle coverage much less than speech (" + fmt(coverage_ratio, 2) + ")";
    }
    if (stats.coverage_percent < 25.0 && stats.density < 5.0) {
        forced = true;
        reason = "Low coverage and density";
    }
    if (speech_with_subtitles > 80.0) {
        forced = false;
        reason = "Most speech has subtitles (" + fmt(speech_with_subtitles) + "%)";
    }
    if (reason.empty()) {
        reason = "Subtitles follow speech (" + fmt(speech_with_subtitles) + "% overlap)";
    }

    return make_verdict(forced, reason, 1);
}

ForcedVerdict ForcedSubtitleClassifier::classify(const std::vector<SubtitleEntry>& entries,
                                                 double duration,
                                                 const SpeechProvider& speech_provider) const {
    if (entries.empty()) {
        return make_verdict(false, "No subtitle entries", 1);
    }
    if (duration <= 0.0) {
        return make_verdict(false, "Unknown container duration", 1);
    }

    SubtitleStatistics stats = compute_subtitle_statistics(entries, duration);

    if (options_.show_details) {
        std::cout << "[ULDAS]   Count: " << stats.count << " subtitles\n";
        std::cout << "[ULDAS]   Density: " << fmt(stats.density) << " subs/min\n";
        std::cout << "[ULDAS]   Coverage: " << fmt(stats.coverage_percent) << "% of duration\n";
        std::cout << "[ULDAS]   Avg duration: " << fmt(stats.avg_duration) << "s per subtitle\n";
    }

    ForcedVerdict verdict = decide_from_statistics(stats, duration / 60.0);
    if (verdict.decided) {
        return verdict;
    }

    std::vector<SpeechSegment> speech;
    if (!speech_provider || !speech_provider(speech)) {
        std::cerr << "[ULDAS] Speech analysis unavailable, using heuristic fallback\n";
        return heuristic(stats, verdict.reason + " (audio analysis failed, using heuristic)");
    }

    return classify_with_speech(stats, duration, speech);
}

ForcedVerdict ForcedSubtitleClassifier::classify_image_track(int packet_count,
                                                             double duration) const {
    if (duration <= 0.0) {
        return make_verdict(false, "Unknown container duration", 1);
    }

    double per_minute = packet_count / (duration / 60.0);

    if (packet_count < 100) {
        return make_verdict(true, "Very low frame count (" + std::to_string(packet_count) + ")", 3);
    }
    if (per_minute < 5.0) {
        return make_verdict(true, "Very low frame density (" + fmt(per_minute) + "/min)", 3);
    }
    if (per_minute > 30.0) {
        return make_verdict(false, "High frame density (" + fmt(per_minute) + "/min)", 3);
    }
    if (per_minute < 15.0) {
        return make_verdict(true, "Low-to-moderate frame density (" + fmt(per_minute) + "/min)", 2);
    }
    return make_verdict(false, "Moderate frame density (" + fmt(per_minute) + "/min)", 2);
}

} // namespace uldas
