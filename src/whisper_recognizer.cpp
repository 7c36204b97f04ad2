#include "uldas/whisper_recognizer.h"
#include "uldas/hallucination_filter.h"
#include "uldas/mel_spectrogram.h"
#include "uldas/silero_vad.h"
#include "uldas/transcription_evaluator.h"
#include "uldas/vad.h"
#include <ctranslate2/devices.h>
#include <ctranslate2/models/whisper.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>

namespace uldas {

namespace {

constexpr int CHUNK_SECONDS = 30;
constexpr int CHUNK_SAMPLES = CHUNK_SECONDS * SAMPLE_RATE;
constexpr int CHUNK_FRAMES = 3000;

/**
 * @brief Reverse of GPT-2's byte-to-unicode table
 *
 * Byte-level BPE tokens spell every byte as a printable code point;
 * 0x20 becomes U+0120 ("\xC4\xA0"), and so on.
 */
const std::map<unsigned int, unsigned char>& unicode_to_byte() {
    static const std::map<unsigned int, unsigned char> table = [] {
        std::map<unsigned int, unsigned char> t;
        unsigned int extra = 0;
        for (unsigned int b = 0; b < 256; ++b) {
            bool printable = (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174);
            unsigned int cp = printable ? b : 256 + extra++;
            t[cp] = static_cast<unsigned char>(b);
        }
        return t;
    }();
    return table;
}

std::string decode_token(const std::string& token) {
    const auto& table = unicode_to_byte();
    std::string bytes;

    size_t i = 0;
    while (i < token.size()) {
        unsigned char c = static_cast<unsigned char>(token[i]);
        unsigned int cp = 0;
        size_t len = 1;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0 && i + 1 < token.size()) {
            cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(token[i + 1]) & 0x3Fu);
            len = 2;
        } else {
            // Outside the BPE alphabet: keep as-is
            bytes += token[i];
            ++i;
            continue;
        }

        auto it = table.find(cp);
        if (it != table.end()) {
            bytes += static_cast<char>(it->second);
        } else {
            bytes.append(token, i, len);
        }
        i += len;
    }
    return bytes;
}

bool is_bracketed(const std::string& token) {
    return token.size() >= 4 && token.compare(0, 2, "<|") == 0 &&
           token.compare(token.size() - 2, 2, "|>") == 0;
}

/**
 * @brief Parse "<|12.34|>" into seconds
 */
bool parse_timestamp_token(const std::string& token, double& seconds) {
    if (!is_bracketed(token)) return false;
    std::string inner = token.substr(2, token.size() - 4);
    if (inner.empty() || !std::isdigit(static_cast<unsigned char>(inner[0]))) return false;

    char* end = nullptr;
    seconds = std::strtod(inner.c_str(), &end);
    return end != nullptr && *end == '\0';
}

std::string trim_text(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

// Whisper's definition: text bytes over zlib bytes
float whisper_compression_ratio(const std::string& text) {
    if (text.empty()) return 0.0f;
    double ratio = HallucinationFilter::compression_ratio(text);
    return ratio > 0.0 ? static_cast<float>(1.0 / ratio) : 0.0f;
}

} // anonymous namespace

DeviceType parse_device_type(const std::string& value) {
    if (value == "auto") return DeviceType::Auto;
    if (value == "cuda") return DeviceType::CUDA;
    if (value == "cpu") return DeviceType::CPU;
    throw std::invalid_argument("Unknown device: " + value);
}

ComputeType parse_compute_type(const std::string& value) {
    if (value == "auto" || value == "default") return ComputeType::Auto;
    if (value == "float32") return ComputeType::Float32;
    if (value == "float16") return ComputeType::Float16;
    if (value == "int8") return ComputeType::Int8;
    if (value == "int8_float16") return ComputeType::Int8Float16;
    throw std::invalid_argument("Unknown compute type: " + value);
}

// ═══════════════════════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════════════════════

class WhisperRecognizer::Impl {
public:
    explicit Impl(const ModelOptions& options) : options_(options) {
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "ULDAS - LOADING WHISPER MODEL\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "Model: " << options.model_path << "\n";

        ctranslate2::Device device = resolve_device(options.device);
        ctranslate2::ComputeType compute_type = resolve_compute_type(options.compute_type, device);

        ctranslate2::ReplicaPoolConfig pool_config;
        pool_config.num_threads_per_replica = static_cast<size_t>(std::max(0, options.cpu_threads));

        try {
            model_ = std::make_unique<ctranslate2::models::Whisper>(
                options.model_path, device, compute_type,
                std::vector<int>{options.device_index}, false, pool_config);
        } catch (const std::exception& e) {
            std::cerr << "[Whisper] Failed to initialize with preferred settings: " << e.what() << "\n";
            std::cerr << "[Whisper] Fallback: CPU with default settings\n";
            try {
                model_ = std::make_unique<ctranslate2::models::Whisper>(
                    options.model_path, ctranslate2::Device::CPU);
            } catch (const std::exception& fallback_error) {
                throw std::runtime_error("Failed to load Whisper model " + options.model_path +
                                         ": " + fallback_error.what());
            }
        }

        multilingual_ = model_->is_multilingual();
        const size_t n_mels = model_->n_mels();
        mel_ = MelSpectrogram(SAMPLE_RATE, 400, static_cast<int>(n_mels), 160);

        std::cout << "Languages: " << (multilingual_ ? "Multilingual" : "English-only")
                  << " (" << model_->num_languages() << " languages)\n";
        std::cout << "Mel features: " << n_mels << "\n";

        // VAD capability is fixed here: Silero when its model loads, energy otherwise
        if (!options.silero_model_path.empty()) {
            try {
                SileroVADOptions silero_options;
                silero_options.model_path = options.silero_model_path;
                silero_options.use_gpu = device == ctranslate2::Device::CUDA;
                silero_options.gpu_device_id = options.device_index;
                silero_options.verbose = options.verbose;
                silero_ = std::make_unique<SileroVAD>(silero_options);
            } catch (const std::exception& e) {
                std::cerr << "[Whisper] Silero VAD unavailable, using energy VAD: " << e.what() << "\n";
            }
        }
        std::cout << "VAD: " << (silero_ ? "silero" : "energy") << "\n";

        std::cout << "✓ Model loaded successfully\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
    }

    RecognitionResult recognize(const std::vector<float>& samples, const RecognitionOptions& options) {
        RecognitionResult result;
        result.duration = static_cast<double>(samples.size()) / SAMPLE_RATE;

        std::vector<SpeechSegment> speech;
        const std::vector<float>* audio = &samples;
        std::vector<float> collected;

        if (options.vad_filter) {
            speech = run_vad(samples, options);
            collected = collect_speech(samples, SAMPLE_RATE, speech);
            if (options_.verbose) {
                std::cout << "[Whisper] VAD kept " << collected.size() / static_cast<double>(SAMPLE_RATE)
                          << "s of " << result.duration << "s\n";
            }
            if (collected.empty()) {
                // Everything was silence: no segments, no language
                return result;
            }
            audio = &collected;
        }

        if (audio->empty()) {
            return result;
        }

        // Language from the first window
        std::vector<float> first(audio->begin(),
                                 audio->begin() + std::min<size_t>(audio->size(), CHUNK_SAMPLES));
        std::vector<float> features = window_features(first);
        detect_language(features, result.language, result.language_probability);

        std::vector<std::string> previous_tokens;

        for (size_t offset = 0; offset < audio->size(); offset += CHUNK_SAMPLES) {
            size_t end = std::min(audio->size(), offset + CHUNK_SAMPLES);
            std::vector<float> chunk(audio->begin() + offset, audio->begin() + end);

            // Sub-second tails carry no usable speech
            if (chunk.size() < static_cast<size_t>(SAMPLE_RATE / 2) && offset > 0) break;

            if (offset > 0) features = window_features(chunk);

            double chunk_start = static_cast<double>(offset) / SAMPLE_RATE;
            double chunk_end = static_cast<double>(end) / SAMPLE_RATE;

            std::vector<RecognizedSegment> window = decode_window(
                features, chunk_start, chunk_end, result.language, options,
                options.condition_on_previous ? previous_tokens : std::vector<std::string>{},
                previous_tokens);

            for (auto& seg : window) {
                if (options.vad_filter) {
                    seg.start = restore_timestamp(seg.start, speech);
                    seg.end = restore_timestamp(seg.end, speech);
                }
                result.segments.push_back(std::move(seg));
            }
        }

        return result;
    }

    bool supports_vad() const { return true; }
    const char* vad_name() const { return silero_ ? "silero" : "energy"; }

private:
    static ctranslate2::Device resolve_device(DeviceType device) {
        switch (device) {
            case DeviceType::CUDA:
                std::cout << "Device: CUDA (GPU)\n";
                return ctranslate2::Device::CUDA;
            case DeviceType::CPU:
                std::cout << "Device: CPU\n";
                return ctranslate2::Device::CPU;
            default:
                break;
        }
        if (ctranslate2::get_device_count(ctranslate2::Device::CUDA) > 0) {
            std::cout << "Device: Auto (CUDA)\n";
            return ctranslate2::Device::CUDA;
        }
        std::cout << "Device: Auto (CPU)\n";
        return ctranslate2::Device::CPU;
    }

    static ctranslate2::ComputeType resolve_compute_type(ComputeType type, ctranslate2::Device device) {
        switch (type) {
            case ComputeType::Float32: return ctranslate2::ComputeType::FLOAT32;
            case ComputeType::Float16: return ctranslate2::ComputeType::FLOAT16;
            case ComputeType::Int8: return ctranslate2::ComputeType::INT8;
            case ComputeType::Int8Float16: return ctranslate2::ComputeType::INT8_FLOAT16;
            default:
                return device == ctranslate2::Device::CUDA ? ctranslate2::ComputeType::FLOAT16
                                                           : ctranslate2::ComputeType::INT8;
        }
    }

    std::vector<SpeechSegment> run_vad(const std::vector<float>& samples, const RecognitionOptions& options) {
        if (silero_) {
            silero_->set_speech_limits(options.vad_min_speech_duration_ms, options.vad_max_speech_duration_s);
            return silero_->detect_speech(samples, SAMPLE_RATE);
        }

        VADOptions vad_options;
        vad_options.min_speech_duration_ms = options.vad_min_speech_duration_ms;
        vad_options.max_speech_duration_s = options.vad_max_speech_duration_s;
        vad_options.verbose = options_.verbose;
        EnergyVAD vad(vad_options);
        return vad.detect_speech(samples, SAMPLE_RATE);
    }

    // Pad to 30 s and compute the [n_mels, 3000] feature block
    std::vector<float> window_features(const std::vector<float>& chunk) const {
        std::vector<float> padded(CHUNK_SAMPLES, 0.0f);
        std::copy(chunk.begin(), chunk.begin() + std::min<size_t>(chunk.size(), CHUNK_SAMPLES), padded.begin());

        std::vector<std::vector<float>> mel;
        if (mel_.compute(padded, mel) == 0) {
            throw std::runtime_error("Failed to compute mel-spectrogram");
        }
        return MelSpectrogram::to_model_layout(mel, CHUNK_FRAMES);
    }

    ctranslate2::StorageView to_storage(const std::vector<float>& features) const {
        return ctranslate2::StorageView(
            ctranslate2::Shape{1, static_cast<ctranslate2::dim_t>(mel_.getMelBins()),
                               static_cast<ctranslate2::dim_t>(CHUNK_FRAMES)},
            features);
    }

    void detect_language(const std::vector<float>& features, std::string& language, float& probability) {
        language = "en";
        probability = 0.0f;
        if (!multilingual_) {
            probability = 1.0f;
            return;
        }

        auto futures = model_->detect_language(to_storage(features));
        if (futures.empty()) {
            throw std::runtime_error("Language detection returned no result");
        }

        auto lang_probs = futures[0].get();
        if (lang_probs.empty()) {
            throw std::runtime_error("Language detection returned no candidates");
        }

        auto best = std::max_element(lang_probs.begin(), lang_probs.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });

        language = best->first;
        if (is_bracketed(language)) {
            language = language.substr(2, language.size() - 4);
        }
        probability = best->second;

        if (options_.verbose) {
            std::cout << "[Whisper] Detected language: " << language
                      << " (probability: " << probability << ")\n";
        }
    }

    std::vector<RecognizedSegment> decode_window(const std::vector<float>& features,
                                                 double chunk_start,
                                                 double chunk_end,
                                                 const std::string& language,
                                                 const RecognitionOptions& options,
                                                 const std::vector<std::string>& previous,
                                                 std::vector<std::string>& text_tokens_out) {
        std::vector<std::string> prompt;
        if (!previous.empty()) {
            prompt.push_back("<|startofprev|>");
            // Keep the prompt within half the context
            size_t keep = std::min<size_t>(previous.size(), 223);
            prompt.insert(prompt.end(), previous.end() - keep, previous.end());
        }
        prompt.push_back("<|startoftranscript|>");
        if (multilingual_) {
            prompt.push_back("<|" + language + "|>");
            prompt.push_back("<|transcribe|>");
        }

        const bool sampling = options.temperature > 0.0f;

        ctranslate2::models::WhisperOptions whisper_options;
        whisper_options.beam_size = sampling ? 1 : static_cast<size_t>(std::max(1, options.beam_size));
        whisper_options.patience = options.patience;
        whisper_options.length_penalty = options.length_penalty;
        whisper_options.repetition_penalty = options.repetition_penalty;
        whisper_options.no_repeat_ngram_size = static_cast<size_t>(std::max(0, options.no_repeat_ngram_size));
        whisper_options.max_length = static_cast<size_t>(std::max(1, options.max_length));
        whisper_options.sampling_topk = sampling ? 0 : 1;
        whisper_options.sampling_temperature = sampling ? options.temperature : 1.0f;
        whisper_options.num_hypotheses = sampling ? static_cast<size_t>(std::max(1, options.best_of)) : 1;
        whisper_options.return_scores = true;
        whisper_options.return_no_speech_prob = true;
        whisper_options.max_initial_timestamp_index = 50;
        whisper_options.suppress_blank = true;

        auto futures = model_->generate(to_storage(features),
                                        std::vector<std::vector<std::string>>{prompt},
                                        whisper_options);
        if (futures.empty()) {
            throw std::runtime_error("No results from Whisper inference");
        }
        ctranslate2::models::WhisperGenerationResult generation = futures[0].get();

        if (generation.sequences.empty()) {
            return {};
        }

        // Best hypothesis by average log probability
        size_t best = 0;
        float avg_logprob = -1e9f;
        for (size_t h = 0; h < generation.sequences.size(); ++h) {
            size_t length = h < generation.sequences_ids.size() ? generation.sequences_ids[h].size()
                                                                : generation.sequences[h].size();
            float score = h < generation.scores.size() ? generation.scores[h] : 0.0f;
            float candidate = hypothesis_avg_logprob(score, length, options.length_penalty);
            if (candidate > avg_logprob) {
                avg_logprob = candidate;
                best = h;
            }
        }
        if (generation.scores.empty()) avg_logprob = 0.0f;

        const float no_speech_prob = generation.no_speech_prob;
        const std::vector<std::string>& tokens = generation.sequences[best];

        // Silent window
        if (no_speech_prob > options.no_speech_threshold && avg_logprob < options.log_prob_threshold) {
            if (options_.verbose) {
                std::cout << "[Whisper] Skipping silent window at " << chunk_start << "s\n";
            }
            text_tokens_out.clear();
            return {};
        }

        std::vector<RecognizedSegment> segments;
        std::vector<std::string> text_tokens;
        std::string window_text;

        RecognizedSegment current;
        current.start = chunk_start;
        current.avg_logprob = avg_logprob;
        current.no_speech_prob = no_speech_prob;
        std::string current_text;

        auto flush = [&](double end_time) {
            std::string text = trim_text(current_text);
            if (!text.empty()) {
                current.end = std::max(current.start, std::min(end_time, chunk_end));
                current.text = text;
                segments.push_back(current);
            }
            current_text.clear();
        };

        for (const auto& token : tokens) {
            double ts = 0.0;
            if (parse_timestamp_token(token, ts)) {
                double absolute = chunk_start + ts;
                if (!trim_text(current_text).empty()) {
                    flush(absolute);
                }
                current.start = std::min(absolute, chunk_end);
                continue;
            }
            if (is_bracketed(token)) continue;

            std::string piece = decode_token(token);
            current_text += piece;
            window_text += piece;
            text_tokens.push_back(token);
        }
        flush(chunk_end);

        // Repetition loop
        float compression = whisper_compression_ratio(trim_text(window_text));
        if (compression > options.compression_ratio_threshold && avg_logprob < options.log_prob_threshold) {
            std::cerr << "[Whisper] Skipping high-compression window at " << chunk_start
                      << "s (ratio: " << compression << ", logprob: " << avg_logprob << ")\n";
            text_tokens_out.clear();
            return {};
        }

        text_tokens_out = std::move(text_tokens);
        return segments;
    }

    ModelOptions options_;
    std::unique_ptr<ctranslate2::models::Whisper> model_;
    MelSpectrogram mel_;
    bool multilingual_ = true;
    std::unique_ptr<SileroVAD> silero_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

WhisperRecognizer::WhisperRecognizer(const ModelOptions& options)
    : pimpl_(std::make_unique<Impl>(options))
{
}

WhisperRecognizer::~WhisperRecognizer() = default;

WhisperRecognizer::WhisperRecognizer(WhisperRecognizer&&) noexcept = default;
WhisperRecognizer& WhisperRecognizer::operator=(WhisperRecognizer&&) noexcept = default;

RecognitionResult WhisperRecognizer::recognize(const std::vector<float>& samples,
                                               const RecognitionOptions& options) {
    return pimpl_->recognize(samples, options);
}

bool WhisperRecognizer::supports_vad() const {
    return pimpl_->supports_vad();
}

const char* WhisperRecognizer::vad_name() const {
    return pimpl_->vad_name();
}

} // namespace uldas
