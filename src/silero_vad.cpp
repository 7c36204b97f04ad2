#include "uldas/silero_vad.h"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace uldas {

class SileroVAD::Impl {
public:
    explicit Impl(const SileroVADOptions& options)
        : options_(options)
        , env_(ORT_LOGGING_LEVEL_WARNING, "SileroVAD")
    {
        Ort::SessionOptions session_options;
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        bool using_gpu = false;
        if (options.use_gpu) {
            try {
                OrtCUDAProviderOptions cuda_options;
                cuda_options.device_id = options.gpu_device_id;
                session_options.AppendExecutionProvider_CUDA(cuda_options);
                using_gpu = true;
            } catch (const Ort::Exception& e) {
                std::cout << "[SileroVAD] CUDA not available: " << e.what() << "\n";
                std::cout << "[SileroVAD] Falling back to CPU\n";
            }
        }

        if (!using_gpu) {
            session_options.SetIntraOpNumThreads(1);
            session_options.SetInterOpNumThreads(1);
        }

        try {
#ifdef _WIN32
            std::wstring model_path_w(options.model_path.begin(), options.model_path.end());
            session_ = std::make_unique<Ort::Session>(env_, model_path_w.c_str(), session_options);
#else
            session_ = std::make_unique<Ort::Session>(env_, options.model_path.c_str(), session_options);
#endif
        } catch (const Ort::Exception& e) {
            throw std::runtime_error("Failed to load Silero VAD model " + options.model_path + ": " + e.what());
        }

        reset_state();

        std::cout << "[SileroVAD] Model loaded (" << (using_gpu ? "CUDA" : "CPU") << "): "
                  << options.model_path << std::endl;
    }

    void reset_state() {
        // State tensor [2, 1, 128]
        state_.assign(2 * 1 * 128, 0.0f);
        context_.assign(CONTEXT_SIZE, 0.0f);
    }

    float predict(const float* chunk, size_t count) {
        // Context (64 samples) + current chunk
        std::vector<float> input_data;
        input_data.reserve(CONTEXT_SIZE + count);
        input_data.insert(input_data.end(), context_.begin(), context_.end());
        input_data.insert(input_data.end(), chunk, chunk + count);

        std::copy(input_data.end() - CONTEXT_SIZE, input_data.end(), context_.begin());

        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(
            OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault);

        std::vector<Ort::Value> input_tensors;

        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(input_data.size())};
        input_tensors.push_back(Ort::Value::CreateTensor<float>(
            memory_info, input_data.data(), input_data.size(),
            input_shape.data(), input_shape.size()));

        std::vector<int64_t> state_shape = {2, 1, 128};
        input_tensors.push_back(Ort::Value::CreateTensor<float>(
            memory_info, state_.data(), state_.size(),
            state_shape.data(), state_shape.size()));

        std::vector<int64_t> sr_data = {options_.sample_rate};
        std::vector<int64_t> sr_shape = {1};
        input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memory_info, sr_data.data(), sr_data.size(),
            sr_shape.data(), sr_shape.size()));

        const char* input_names[] = {"input", "state", "sr"};
        const char* output_names[] = {"output", "stateN"};

        auto output_tensors = session_->Run(
            Ort::RunOptions{nullptr},
            input_names, input_tensors.data(), input_tensors.size(),
            output_names, 2);

        float speech_prob = output_tensors[0].GetTensorMutableData<float>()[0];

        const float* state_n = output_tensors[1].GetTensorMutableData<float>();
        std::copy(state_n, state_n + state_.size(), state_.begin());

        return speech_prob;
    }

    void set_speech_limits(int min_speech_ms, int max_speech_s) {
        options_.min_speech_duration_ms = min_speech_ms;
        options_.max_speech_duration_s = max_speech_s;
    }

    std::vector<SpeechSegment> detect_speech(const std::vector<float>& samples, int sample_rate) {
        std::vector<SpeechSegment> segments;
        if (samples.empty()) return segments;

        if (sample_rate != 8000 && sample_rate != 16000) {
            std::cerr << "[SileroVAD] Sample rate " << sample_rate
                      << " not supported, use 8000 or 16000\n";
            return segments;
        }

        reset_state();

        const long long window = options_.window_size_samples;
        const long long min_silence_samples = static_cast<long long>(options_.min_silence_duration_ms) * sample_rate / 1000;
        const long long min_speech_samples = static_cast<long long>(options_.min_speech_duration_ms) * sample_rate / 1000;
        const long long max_speech_samples = static_cast<long long>(options_.max_speech_duration_s) * sample_rate;

        long long speech_start = -1;
        long long silence_run = 0;

        for (long long pos = 0; pos + window <= static_cast<long long>(samples.size()); pos += window) {
            float speech_prob = predict(&samples[pos], static_cast<size_t>(window));

            if (speech_prob >= options_.threshold) {
                if (speech_start < 0) speech_start = pos;
                silence_run = 0;

                if (max_speech_samples > 0 && pos - speech_start > max_speech_samples) {
                    segments.emplace_back(static_cast<double>(speech_start) / sample_rate,
                                          static_cast<double>(pos) / sample_rate);
                    speech_start = pos;
                }
            } else if (speech_start >= 0) {
                silence_run += window;
                if (silence_run >= min_silence_samples) {
                    long long speech_end = pos - silence_run + window;
                    if (speech_end - speech_start >= min_speech_samples) {
                        segments.emplace_back(static_cast<double>(speech_start) / sample_rate,
                                              static_cast<double>(speech_end) / sample_rate);
                    }
                    speech_start = -1;
                    silence_run = 0;
                }
            }
        }

        if (speech_start >= 0) {
            long long speech_end = static_cast<long long>(samples.size());
            if (speech_end - speech_start >= min_speech_samples) {
                segments.emplace_back(static_cast<double>(speech_start) / sample_rate,
                                      static_cast<double>(speech_end) / sample_rate);
            }
        }

        double pad_sec = options_.speech_pad_ms / 1000.0;
        double audio_duration = static_cast<double>(samples.size()) / sample_rate;
        for (auto& seg : segments) {
            seg.start = std::max(0.0, seg.start - pad_sec);
            seg.end = std::min(audio_duration, seg.end + pad_sec);
        }

        std::vector<SpeechSegment> joined;
        for (const auto& seg : segments) {
            if (!joined.empty() && seg.start <= joined.back().end) {
                joined.back().end = std::max(joined.back().end, seg.end);
            } else {
                joined.push_back(seg);
            }
        }
        segments.swap(joined);

        if (options_.verbose) {
            std::cout << "[SileroVAD] Detected " << segments.size() << " speech segment(s)\n";
        }
        return segments;
    }

private:
    static constexpr size_t CONTEXT_SIZE = 64;

    SileroVADOptions options_;
    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<float> state_;
    std::vector<float> context_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

SileroVAD::SileroVAD(const SileroVADOptions& options)
    : pimpl_(std::make_unique<Impl>(options))
{
}

SileroVAD::~SileroVAD() = default;

SileroVAD::SileroVAD(SileroVAD&&) noexcept = default;
SileroVAD& SileroVAD::operator=(SileroVAD&&) noexcept = default;

void SileroVAD::reset_state() {
    if (pimpl_) pimpl_->reset_state();
}

void SileroVAD::set_speech_limits(int min_speech_duration_ms, int max_speech_duration_s) {
    if (pimpl_) pimpl_->set_speech_limits(min_speech_duration_ms, max_speech_duration_s);
}

std::vector<SpeechSegment> SileroVAD::detect_speech(const std::vector<float>& samples, int sample_rate) {
    if (!pimpl_) return {};
    return pimpl_->detect_speech(samples, sample_rate);
}

} // namespace uldas
