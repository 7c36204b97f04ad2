#include "uldas/media_extractor.h"
#include "test_common.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

using namespace uldas;
using uldas_test::check;
using uldas_test::near;

namespace {

void put_u32(std::ofstream& out, uint32_t v) {
    const char bytes[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                           static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
    out.write(bytes, 4);
}

void put_u16(std::ofstream& out, uint16_t v) {
    const char bytes[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
    out.write(bytes, 2);
}

// 44.1 kHz stereo PCM: `tone_seconds` of 440 Hz followed by `silence_seconds` of silence
void write_wav(const fs::path& path, double tone_seconds, double silence_seconds) {
    const uint32_t rate = 44100;
    const uint16_t channels = 2;
    const uint32_t frames = static_cast<uint32_t>((tone_seconds + silence_seconds) * rate);
    const uint32_t tone_frames = static_cast<uint32_t>(tone_seconds * rate);
    const uint32_t data_bytes = frames * channels * 2;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write("RIFF", 4);
    put_u32(out, 36 + data_bytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, 1);                        // PCM
    put_u16(out, channels);
    put_u32(out, rate);
    put_u32(out, rate * channels * 2);      // Byte rate
    put_u16(out, channels * 2);             // Block align
    put_u16(out, 16);
    out.write("data", 4);
    put_u32(out, data_bytes);

    for (uint32_t i = 0; i < frames; ++i) {
        int16_t value = 0;
        if (i < tone_frames) {
            value = static_cast<int16_t>(16000.0 * std::sin(2.0 * 3.14159265358979 * 440.0 * i / rate));
        }
        for (uint16_t c = 0; c < channels; ++c) {
            put_u16(out, static_cast<uint16_t>(value));
        }
    }
}

// Inspect a user-supplied file
int describe(const std::string& path) {
    MediaExtractor extractor;
    MediaInfo info;
    if (!extractor.probe(path, info)) {
        std::cerr << "[ERROR] " << extractor.get_last_error() << "\n";
        return 1;
    }

    std::cout << "Duration: " << std::fixed << std::setprecision(2) << info.duration << "s\n";
    for (const auto& track : info.tracks) {
        const char* kind = track.type == TrackType::Audio ? "audio"
                         : track.type == TrackType::Subtitle ? "subtitle" : "other";
        std::cout << "  stream " << track.stream_index << ": " << kind << " #" << track.index
                  << " " << track.codec << " [" << (track.language.empty() ? "-" : track.language) << "]"
                  << (track.forced ? " forced" : "") << (track.image_based ? " image" : "") << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Media Extractor Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    if (argc > 1) {
        return describe(argv[1]);
    }

    const fs::path dir = fs::temp_directory_path() / "uldas_extractor_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const fs::path wav = dir / "tone.wav";
    write_wav(wav, 2.0, 2.0);

    MediaExtractor extractor;

    uldas_test::section("Probe");
    MediaInfo info;
    check(extractor.probe(wav.string(), info), "WAV file probed");
    check(near(info.duration, 4.0, 0.05), "duration 4 s");
    check(info.audio_tracks().size() == 1 && info.subtitle_tracks().empty(), "one audio track");
    if (!info.tracks.empty()) {
        check(info.tracks[0].codec == "pcm_s16le", "codec name from the container");
        check(info.tracks[0].language.empty(), "no language tag");
    }

    MediaInfo missing;
    check(!extractor.probe((dir / "missing.mkv").string(), missing), "missing file fails");
    check(!extractor.get_last_error().empty(), "error message set");

    uldas_test::section("Audio extraction");
    {
        AudioRequest request;
        std::vector<float> samples;
        check(extractor.extract_audio(wav.string(), request, samples) == ExtractStatus::Success,
              "full track decoded");
        check(samples.size() > 62000 && samples.size() < 66000, "about 4 s at 16 kHz mono");

        float peak = 0.0f;
        for (float s : samples) peak = std::max(peak, std::abs(s));
        check(peak <= 1.0f && peak > 0.5f, "normalized peak");

        request.start = 0.5;
        request.length = 1.0;
        check(extractor.extract_audio(wav.string(), request, samples) == ExtractStatus::Success,
              "tone window decoded");
        check(samples.size() == 16000, "window trimmed to its length");

        request.start = 2.5;
        check(extractor.extract_audio(wav.string(), request, samples) == ExtractStatus::Failed,
              "silent window rejected");
        check(samples.empty(), "rejected window returns no samples");

        request.start = 0.0;
        request.track_index = 1;
        check(extractor.extract_audio(wav.string(), request, samples) == ExtractStatus::Failed,
              "no second audio track");

        request.track_index = 0;
        request.selector = StreamSelector::ContainerStreamIndex;
        request.stream_index = 0;
        check(extractor.extract_audio(wav.string(), request, samples) == ExtractStatus::Success,
              "container stream addressing");
    }

    uldas_test::section("Subtitles");
    {
        Track track;
        track.type = TrackType::Subtitle;
        track.stream_index = 0;
        std::vector<SubtitleEntry> entries;
        check(!extractor.extract_subtitles(wav.string(), track, entries), "audio stream is not a subtitle track");

        check(ass_to_plain_text("Dialogue: 0,0:00:01.00,0:00:03.00,Default,,0,0,0,,{\\i1}Hello{\\i0}\\Nthere")
                  == "Hello\nthere", "Dialogue line");
        check(ass_to_plain_text("3,0,Default,,0,0,0,,Line one\\hand two") == "Line one and two",
              "FFmpeg packet form");
        check(ass_to_plain_text("no fields here") == "no fields here", "plain text kept");
    }

    fs::remove_all(dir);
    return uldas_test::finish("Media extractor");
}
