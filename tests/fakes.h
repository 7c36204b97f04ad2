#pragma once

// Scripted collaborators for exercising the decision engine without models or media

#include "uldas/media_source.h"
#include "uldas/metadata_writer.h"
#include "uldas/speech_recognizer.h"
#include <algorithm>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace uldas_test {

/**
 * @brief Recognizer that returns scripted results in call order
 *
 * The last script entry repeats once the list is exhausted.
 */
class FakeRecognizer : public uldas::SpeechRecognizer {
public:
    std::vector<uldas::RecognitionResult> script;
    std::vector<uldas::RecognitionOptions> calls;
    bool vad_supported = true;
    bool throw_on_call = false;

    uldas::RecognitionResult recognize(const std::vector<float>&,
                                       const uldas::RecognitionOptions& options) override {
        calls.push_back(options);
        if (throw_on_call) {
            throw std::runtime_error("inference failed");
        }
        if (script.empty()) {
            return {};
        }
        size_t i = std::min(calls.size() - 1, script.size() - 1);
        return script[i];
    }

    bool supports_vad() const override { return vad_supported; }
};

/**
 * @brief One-segment recognition result
 */
inline uldas::RecognitionResult speech_result(const std::string& language,
                                              float probability,
                                              const std::string& text,
                                              float avg_logprob = -1.0f,
                                              double start = 0.0,
                                              double end = 5.0) {
    uldas::RecognitionResult result;
    result.language = language;
    result.language_probability = probability;
    if (!text.empty()) {
        uldas::RecognizedSegment segment;
        segment.start = start;
        segment.end = end;
        segment.text = text;
        segment.avg_logprob = avg_logprob;
        result.segments.push_back(segment);
    }
    return result;
}

/**
 * @brief Media source backed by in-memory tracks
 */
class FakeMediaSource : public uldas::MediaSource {
public:
    uldas::MediaInfo info;
    bool probe_ok = true;

    // Default: every request yields a short clip of usable audio
    std::function<uldas::ExtractStatus(const uldas::AudioRequest&, std::vector<float>&)> audio_handler =
        [](const uldas::AudioRequest&, std::vector<float>& samples) {
            samples.assign(16000, 0.1f);
            return uldas::ExtractStatus::Success;
        };

    std::map<int, std::vector<uldas::SubtitleEntry>> subtitles;   // By subtitle index
    std::map<int, int> packet_counts;                              // By subtitle index

    std::vector<uldas::AudioRequest> audio_requests;
    int subtitle_extractions = 0;

    bool probe(const std::string& path, uldas::MediaInfo& out) override {
        if (!probe_ok) {
            last_error_ = "probe failed";
            return false;
        }
        out = info;
        out.path = path;
        return true;
    }

    uldas::ExtractStatus extract_audio(const std::string&,
                                       const uldas::AudioRequest& request,
                                       std::vector<float>& samples) override {
        audio_requests.push_back(request);
        uldas::ExtractStatus status = audio_handler(request, samples);
        if (status != uldas::ExtractStatus::Success) {
            last_error_ = "no audio";
        }
        return status;
    }

    bool extract_subtitles(const std::string&,
                           const uldas::Track& track,
                           std::vector<uldas::SubtitleEntry>& entries) override {
        subtitle_extractions++;
        auto it = subtitles.find(track.index);
        if (it == subtitles.end()) {
            last_error_ = "no subtitle stream";
            return false;
        }
        entries = it->second;
        return true;
    }

    bool count_subtitle_packets(const std::string&,
                                const uldas::Track& track,
                                int& packet_count) override {
        auto it = packet_counts.find(track.index);
        if (it == packet_counts.end()) {
            last_error_ = "no subtitle stream";
            return false;
        }
        packet_count = it->second;
        return true;
    }

    std::string get_last_error() const override { return last_error_; }

private:
    std::string last_error_;
};

/**
 * @brief Writer that records every change instead of touching files
 */
class FakeWriter : public uldas::MetadataWriter {
public:
    struct AudioWrite {
        std::string file;
        int index;
        std::string code;
    };
    struct SubtitleWrite {
        std::string file;
        int index;
        std::string code;
        bool forced;
        bool sdh;
    };

    std::vector<AudioWrite> audio_writes;
    std::vector<SubtitleWrite> subtitle_writes;
    bool fail = false;

    bool set_audio_language(const std::string& file, int index, const std::string& code) override {
        if (fail) {
            last_error_ = "write refused";
            return false;
        }
        audio_writes.push_back({file, index, code});
        return true;
    }

    bool set_subtitle_metadata(const std::string& file, int index, const std::string& code,
                               bool forced, bool sdh) override {
        if (fail) {
            last_error_ = "write refused";
            return false;
        }
        subtitle_writes.push_back({file, index, code, forced, sdh});
        return true;
    }

    std::string get_last_error() const override { return last_error_; }

private:
    std::string last_error_;
};

inline uldas::Track audio_track(int index, const std::string& language = "") {
    uldas::Track track;
    track.type = uldas::TrackType::Audio;
    track.index = index;
    track.stream_index = index + 1;
    track.codec = "aac";
    track.language = language;
    return track;
}

inline uldas::Track subtitle_track(int index, const std::string& language = "", bool image = false) {
    uldas::Track track;
    track.type = uldas::TrackType::Subtitle;
    track.index = index;
    track.stream_index = 10 + index;
    track.codec = image ? "hdmv_pgs_subtitle" : "subrip";
    track.language = language;
    track.image_based = image;
    return track;
}

} // namespace uldas_test
