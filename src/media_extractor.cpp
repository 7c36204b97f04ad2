#include "uldas/media_extractor.h"
#include "uldas/audio_sampling.h"
#include "uldas/speech_recognizer.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <regex>

extern "C" {
    #include <libavcodec/avcodec.h>
    #include <libavformat/avformat.h>
    #include <libavutil/channel_layout.h>
    #include <libavutil/opt.h>
    #include <libswresample/swresample.h>
}

namespace uldas {

namespace {

using Clock = std::chrono::steady_clock;

/**
 * @brief Wall-clock deadline polled by FFmpeg's blocking I/O
 */
struct Deadline {
    bool enabled = false;
    Clock::time_point until;

    bool expired() const { return enabled && Clock::now() >= until; }
};

int interrupt_callback(void* opaque) {
    const auto* deadline = static_cast<const Deadline*>(opaque);
    return deadline && deadline->expired() ? 1 : 0;
}

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

std::string metadata_value(AVDictionary* metadata, const char* key) {
    AVDictionaryEntry* entry = av_dict_get(metadata, key, nullptr, 0);
    return entry && entry->value ? entry->value : "";
}

bool is_bitmap_codec(AVCodecID id) {
    const AVCodecDescriptor* desc = avcodec_descriptor_get(id);
    return desc && (desc->props & AV_CODEC_PROP_BITMAP_SUB);
}

/**
 * @brief Demuxer and one opened decoder, released together
 */
class DecodeSession {
public:
    ~DecodeSession() {
        if (swr_ctx) swr_free(&swr_ctx);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        if (format_ctx) avformat_close_input(&format_ctx);
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
    }

    bool open_input(const std::string& path, Deadline* deadline, std::string& error) {
        format_ctx = avformat_alloc_context();
        if (!format_ctx) {
            error = "Could not allocate format context";
            return false;
        }
        if (deadline) {
            format_ctx->interrupt_callback.callback = interrupt_callback;
            format_ctx->interrupt_callback.opaque = deadline;
        }

        int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            // avformat_open_input frees the context on failure
            format_ctx = nullptr;
            error = "Could not open file: " + av_error_string(ret);
            return false;
        }

        ret = avformat_find_stream_info(format_ctx, nullptr);
        if (ret < 0) {
            error = "Could not find stream info: " + av_error_string(ret);
            return false;
        }

        packet = av_packet_alloc();
        frame = av_frame_alloc();
        if (!packet || !frame) {
            error = "Could not allocate packet/frame";
            return false;
        }
        return true;
    }

    bool open_decoder(int index, std::string& error) {
        stream_index = index;
        AVStream* stream = format_ctx->streams[index];

        const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
        if (!codec) {
            error = std::string("No decoder for codec ") + avcodec_get_name(stream->codecpar->codec_id);
            return false;
        }

        codec_ctx = avcodec_alloc_context3(codec);
        if (!codec_ctx) {
            error = "Could not allocate codec context";
            return false;
        }

        if (avcodec_parameters_to_context(codec_ctx, stream->codecpar) < 0) {
            error = "Could not copy codec parameters";
            return false;
        }
        codec_ctx->pkt_timebase = stream->time_base;

        AVDictionary* codec_opts = nullptr;
        av_dict_set(&codec_opts, "threads", "auto", 0);
        int ret = avcodec_open2(codec_ctx, codec, &codec_opts);
        av_dict_free(&codec_opts);
        if (ret < 0) {
            error = "Could not open decoder: " + av_error_string(ret);
            return false;
        }
        return true;
    }

    bool open_resampler(std::string& error) {
        swr_ctx = swr_alloc();
        if (!swr_ctx) {
            error = "Could not allocate resampler";
            return false;
        }

        // Downmix to mono float at the recognizer rate
        AVChannelLayout mono_layout = AV_CHANNEL_LAYOUT_MONO;
        av_opt_set_chlayout(swr_ctx, "in_chlayout", &codec_ctx->ch_layout, 0);
        av_opt_set_chlayout(swr_ctx, "out_chlayout", &mono_layout, 0);
        av_opt_set_int(swr_ctx, "in_sample_rate", codec_ctx->sample_rate, 0);
        av_opt_set_int(swr_ctx, "out_sample_rate", SAMPLE_RATE, 0);
        av_opt_set_sample_fmt(swr_ctx, "in_sample_fmt", codec_ctx->sample_fmt, 0);
        av_opt_set_sample_fmt(swr_ctx, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);

        int ret = swr_init(swr_ctx);
        if (ret < 0) {
            error = "Could not initialize resampler: " + av_error_string(ret);
            return false;
        }
        return true;
    }

    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    SwrContext* swr_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int stream_index = -1;
};

// Resolve an audio request to a container stream index (-1 if none)
int resolve_audio_stream(AVFormatContext* format_ctx, const AudioRequest& request) {
    if (request.selector == StreamSelector::ContainerStreamIndex) {
        int idx = request.stream_index;
        if (idx < 0 || idx >= static_cast<int>(format_ctx->nb_streams)) return -1;
        if (format_ctx->streams[idx]->codecpar->codec_type != AVMEDIA_TYPE_AUDIO) return -1;
        return idx;
    }

    int audio_seen = 0;
    for (unsigned int i = 0; i < format_ctx->nb_streams; ++i) {
        if (format_ctx->streams[i]->codecpar->codec_type != AVMEDIA_TYPE_AUDIO) continue;
        if (audio_seen == request.track_index) return static_cast<int>(i);
        ++audio_seen;
    }
    return -1;
}

} // anonymous namespace

std::string ass_to_plain_text(const std::string& ass_line) {
    std::string text = ass_line;

    // Skip the dialogue fields before Text
    int fields = 8;
    const std::string prefix = "Dialogue:";
    if (text.compare(0, prefix.size(), prefix) == 0) {
        text = text.substr(prefix.size());
        fields = 9;
    }

    size_t pos = 0;
    int commas = 0;
    while (commas < fields) {
        size_t next = text.find(',', pos);
        if (next == std::string::npos) break;
        pos = next + 1;
        ++commas;
    }
    if (commas == fields) {
        text = text.substr(pos);
    }

    // Override blocks like {\i1} or {\pos(10,20)}
    static const std::regex override_tags(R"(\{[^}]*\})");
    text = std::regex_replace(text, override_tags, "");

    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            char next = text[i + 1];
            if (next == 'N' || next == 'n') {
                result += '\n';
                ++i;
                continue;
            }
            if (next == 'h') {
                result += ' ';
                ++i;
                continue;
            }
        }
        if (text[i] != '\r') result += text[i];
    }

    // Trim each end
    size_t first = result.find_first_not_of(" \t\n");
    if (first == std::string::npos) return "";
    size_t last = result.find_last_not_of(" \t\n");
    return result.substr(first, last - first + 1);
}

// =======================
// MediaExtractor::Impl
// =======================

class MediaExtractor::Impl {
public:
    Impl() {
        av_log_set_level(AV_LOG_ERROR);
    }

    bool probe(const std::string& path, MediaInfo& info, std::string& error) {
        DecodeSession session;
        if (!session.open_input(path, nullptr, error)) return false;

        AVFormatContext* fmt = session.format_ctx;
        info = MediaInfo{};
        info.path = path;
        if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0) {
            info.duration = static_cast<double>(fmt->duration) / AV_TIME_BASE;
        }

        int audio_index = 0;
        int subtitle_index = 0;
        for (unsigned int i = 0; i < fmt->nb_streams; ++i) {
            AVStream* stream = fmt->streams[i];
            Track track;
            track.stream_index = static_cast<int>(i);
            track.codec = avcodec_get_name(stream->codecpar->codec_id);
            track.language = metadata_value(stream->metadata, "language");
            track.title = metadata_value(stream->metadata, "title");
            track.forced = (stream->disposition & AV_DISPOSITION_FORCED) != 0;
            track.is_default = (stream->disposition & AV_DISPOSITION_DEFAULT) != 0;

            switch (stream->codecpar->codec_type) {
                case AVMEDIA_TYPE_AUDIO:
                    track.type = TrackType::Audio;
                    track.index = audio_index++;
                    break;
                case AVMEDIA_TYPE_SUBTITLE:
                    track.type = TrackType::Subtitle;
                    track.index = subtitle_index++;
                    track.image_based = is_bitmap_codec(stream->codecpar->codec_id);
                    break;
                default:
                    track.type = TrackType::Other;
                    break;
            }
            info.tracks.push_back(track);
        }
        return true;
    }

    ExtractStatus extract_audio(const std::string& path, const AudioRequest& request,
                                std::vector<float>& samples, std::string& error) {
        samples.clear();

        Deadline deadline;
        if (request.timeout_seconds > 0.0) {
            deadline.enabled = true;
            deadline.until = Clock::now() + std::chrono::milliseconds(
                static_cast<long long>(request.timeout_seconds * 1000.0));
        }

        DecodeSession session;
        if (!session.open_input(path, &deadline, error)) {
            return deadline.expired() ? ExtractStatus::TimedOut : ExtractStatus::Failed;
        }

        int stream_index = resolve_audio_stream(session.format_ctx, request);
        if (stream_index < 0) {
            error = std::string("No audio stream for ") + stream_selector_name(request.selector) +
                    " " + std::to_string(request.selector == StreamSelector::ContainerStreamIndex
                                             ? request.stream_index : request.track_index);
            return ExtractStatus::Failed;
        }

        if (!session.open_decoder(stream_index, error) || !session.open_resampler(error)) {
            return ExtractStatus::Failed;
        }

        AVStream* stream = session.format_ctx->streams[stream_index];
        const double time_base = av_q2d(stream->time_base);
        const double start = std::max(0.0, request.start);

        if (start > 0.0) {
            int64_t target = static_cast<int64_t>(start * AV_TIME_BASE);
            if (av_seek_frame(session.format_ctx, -1, target, AVSEEK_FLAG_BACKWARD) < 0) {
                error = "Seek failed";
                return ExtractStatus::Failed;
            }
            avcodec_flush_buffers(session.codec_ctx);
        }

        const size_t wanted = request.length > 0.0
            ? static_cast<size_t>(request.length * SAMPLE_RATE)
            : 0;
        bool done = false;
        bool timed_out = false;

        auto append_frame = [&](AVFrame* frame) {
            int out_samples = swr_get_out_samples(session.swr_ctx, frame ? frame->nb_samples : 0);
            if (out_samples <= 0) return;

            std::vector<float> buffer(static_cast<size_t>(out_samples));
            uint8_t* out = reinterpret_cast<uint8_t*>(buffer.data());
            int converted = swr_convert(session.swr_ctx, &out, out_samples,
                                        frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
                                        frame ? frame->nb_samples : 0);
            if (converted <= 0) return;

            size_t skip = 0;
            if (frame && start > 0.0 && frame->best_effort_timestamp != AV_NOPTS_VALUE) {
                // Drop audio decoded before the requested start (seek lands early)
                double frame_time = frame->best_effort_timestamp * time_base;
                if (frame_time < start) {
                    skip = std::min(static_cast<size_t>(converted),
                                    static_cast<size_t>((start - frame_time) * SAMPLE_RATE));
                }
            }
            samples.insert(samples.end(), buffer.begin() + skip, buffer.begin() + converted);

            if (wanted > 0 && samples.size() >= wanted) {
                samples.resize(wanted);
                done = true;
            }
        };

        while (!done) {
            if (deadline.expired()) {
                timed_out = true;
                break;
            }

            int ret = av_read_frame(session.format_ctx, session.packet);
            if (ret < 0) {
                if (deadline.expired()) timed_out = true;
                break;
            }

            if (session.packet->stream_index == stream_index &&
                avcodec_send_packet(session.codec_ctx, session.packet) >= 0) {
                while (!done && avcodec_receive_frame(session.codec_ctx, session.frame) >= 0) {
                    append_frame(session.frame);
                    av_frame_unref(session.frame);
                }
            }
            av_packet_unref(session.packet);
        }

        if (timed_out) {
            error = "Extraction timed out after " + std::to_string(static_cast<int>(request.timeout_seconds)) + "s";
            samples.clear();
            return ExtractStatus::TimedOut;
        }

        if (!done) {
            // Drain decoder and resampler
            avcodec_send_packet(session.codec_ctx, nullptr);
            while (!done && avcodec_receive_frame(session.codec_ctx, session.frame) >= 0) {
                append_frame(session.frame);
                av_frame_unref(session.frame);
            }
            if (!done) append_frame(nullptr);
        }

        if (samples.empty()) {
            error = "No audio decoded";
            return ExtractStatus::Failed;
        }

        double mean_db = condition_for_speech(samples);
        if (request.length > 0.0 && !is_usable_sample(samples, mean_db)) {
            error = "Sample unusable (" + std::to_string(samples.size()) + " samples, " +
                    std::to_string(mean_db) + " dB)";
            samples.clear();
            return ExtractStatus::Failed;
        }

        return ExtractStatus::Success;
    }

    bool extract_subtitles(const std::string& path, const Track& track,
                           std::vector<SubtitleEntry>& entries, std::string& error) {
        entries.clear();

        DecodeSession session;
        if (!session.open_input(path, nullptr, error)) return false;

        if (track.stream_index < 0 || track.stream_index >= static_cast<int>(session.format_ctx->nb_streams) ||
            session.format_ctx->streams[track.stream_index]->codecpar->codec_type != AVMEDIA_TYPE_SUBTITLE) {
            error = "Stream " + std::to_string(track.stream_index) + " is not a subtitle stream";
            return false;
        }
        if (is_bitmap_codec(session.format_ctx->streams[track.stream_index]->codecpar->codec_id)) {
            error = "Image-based subtitle track cannot be read as text";
            return false;
        }
        if (!session.open_decoder(track.stream_index, error)) return false;

        const double time_base = av_q2d(session.format_ctx->streams[track.stream_index]->time_base);

        while (av_read_frame(session.format_ctx, session.packet) >= 0) {
            if (session.packet->stream_index == track.stream_index) {
                AVSubtitle subtitle;
                int got = 0;
                int ret = avcodec_decode_subtitle2(session.codec_ctx, &subtitle, &got, session.packet);
                if (ret >= 0 && got) {
                    std::string text;
                    for (unsigned int r = 0; r < subtitle.num_rects; ++r) {
                        const AVSubtitleRect* rect = subtitle.rects[r];
                        std::string piece;
                        if (rect->type == SUBTITLE_ASS && rect->ass) {
                            piece = ass_to_plain_text(rect->ass);
                        } else if (rect->type == SUBTITLE_TEXT && rect->text) {
                            piece = rect->text;
                        }
                        if (piece.empty()) continue;
                        if (!text.empty()) text += "\n";
                        text += piece;
                    }

                    if (!text.empty() && session.packet->pts != AV_NOPTS_VALUE) {
                        double pts = session.packet->pts * time_base;
                        double start = pts + subtitle.start_display_time / 1000.0;
                        double end = session.packet->duration > 0
                            ? pts + session.packet->duration * time_base
                            : pts + subtitle.end_display_time / 1000.0;
                        entries.emplace_back(static_cast<int>(entries.size()) + 1, start, end, text);
                    }
                    avsubtitle_free(&subtitle);
                }
            }
            av_packet_unref(session.packet);
        }

        std::sort(entries.begin(), entries.end(),
                  [](const SubtitleEntry& a, const SubtitleEntry& b) { return a.start < b.start; });
        for (size_t i = 0; i < entries.size(); ++i) {
            entries[i].index = static_cast<int>(i) + 1;
        }
        return true;
    }

    bool count_subtitle_packets(const std::string& path, const Track& track,
                                int& packet_count, std::string& error) {
        packet_count = 0;

        DecodeSession session;
        if (!session.open_input(path, nullptr, error)) return false;

        if (track.stream_index < 0 || track.stream_index >= static_cast<int>(session.format_ctx->nb_streams)) {
            error = "Invalid stream index " + std::to_string(track.stream_index);
            return false;
        }

        // Only the counted stream needs demuxing
        for (unsigned int i = 0; i < session.format_ctx->nb_streams; ++i) {
            if (static_cast<int>(i) != track.stream_index) {
                session.format_ctx->streams[i]->discard = AVDISCARD_ALL;
            }
        }

        while (av_read_frame(session.format_ctx, session.packet) >= 0) {
            if (session.packet->stream_index == track.stream_index && session.packet->size > 0) {
                ++packet_count;
            }
            av_packet_unref(session.packet);
        }
        return true;
    }
};

// =======================
// MediaExtractor Public API
// =======================

MediaExtractor::MediaExtractor()
    : pimpl_(std::make_unique<Impl>())
{
}

MediaExtractor::~MediaExtractor() = default;

MediaExtractor::MediaExtractor(MediaExtractor&&) noexcept = default;
MediaExtractor& MediaExtractor::operator=(MediaExtractor&&) noexcept = default;

bool MediaExtractor::probe(const std::string& path, MediaInfo& info) {
    last_error_.clear();
    if (!pimpl_->probe(path, info, last_error_)) {
        std::cerr << "[ULDAS] Probe failed for " << path << ": " << last_error_ << "\n";
        return false;
    }
    return true;
}

ExtractStatus MediaExtractor::extract_audio(const std::string& path,
                                            const AudioRequest& request,
                                            std::vector<float>& samples) {
    last_error_.clear();
    return pimpl_->extract_audio(path, request, samples, last_error_);
}

bool MediaExtractor::extract_subtitles(const std::string& path,
                                       const Track& track,
                                       std::vector<SubtitleEntry>& entries) {
    last_error_.clear();
    if (!pimpl_->extract_subtitles(path, track, entries, last_error_)) {
        std::cerr << "[ULDAS] Subtitle extraction failed for track " << track.index
                  << ": " << last_error_ << "\n";
        return false;
    }
    return true;
}

bool MediaExtractor::count_subtitle_packets(const std::string& path,
                                            const Track& track,
                                            int& packet_count) {
    last_error_.clear();
    if (!pimpl_->count_subtitle_packets(path, track, packet_count, last_error_)) {
        std::cerr << "[ULDAS] Packet count failed for track " << track.index
                  << ": " << last_error_ << "\n";
        return false;
    }
    return true;
}

} // namespace uldas
