/**
 * STTEngine.cpp - Offline transcription of speech segments with whisper.cpp
 *
 * The model is loaded once and kept resident. Segments arrive already cut by
 * the VAD, so every call decodes a single short utterance.
 */

#include "vtc/asr/STTEngine.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "whisper.h"

namespace vtc::asr {

namespace {

// whisper refuses input shorter than one second
constexpr size_t MIN_INPUT_SAMPLES = WHISPER_SAMPLE_RATE + WHISPER_SAMPLE_RATE / 10;

// Nudges the decoder towards simplified Chinese with punctuation
constexpr const char* ZH_INITIAL_PROMPT = "以下是普通话的句子。";

// Whisper emits markers such as "[BLANK_AUDIO]" or "(music)" for non-speech
std::string stripAnnotations(const std::string& text) {
    std::string out;
    int depth = 0;
    for (char c : text) {
        if (c == '[' || c == '(') { ++depth; continue; }
        if ((c == ']' || c == ')') && depth > 0) { --depth; continue; }
        if (depth == 0) out += c;
    }

    size_t start = out.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = out.find_last_not_of(" \t\r\n");
    return out.substr(start, end - start + 1);
}

} // anonymous namespace

struct STTEngine::Impl {
    std::string model_path;
    std::string language;
    int threads = 4;

    whisper_context* ctx = nullptr;
    std::mutex ctx_mutex;  // whisper_full is not reentrant on one context

    ~Impl() {
        if (ctx) whisper_free(ctx);
    }

    whisper_full_params decodeParams() const {
        whisper_full_params p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        p.language = language.c_str();
        p.n_threads = threads;
        p.translate = false;
        p.no_context = true;
        p.single_segment = true;
        p.suppress_blank = true;
        p.print_progress = false;
        p.print_realtime = false;
        p.print_special = false;
        p.print_timestamps = false;
        if (language == "zh") p.initial_prompt = ZH_INITIAL_PROMPT;
        return p;
    }
};

STTEngine::STTEngine(const std::string& model_path, const std::string& language, int n_threads)
    : impl_(std::make_unique<Impl>()) {
    impl_->model_path = model_path;
    impl_->language = language;
    impl_->threads = n_threads > 0 ? n_threads : 1;

    whisper_context_params cparams = whisper_context_default_params();
    impl_->ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!impl_->ctx) {
        std::cerr << "[STTEngine] Cannot load whisper model " << model_path << std::endl;
        return;
    }

    std::cout << "[STTEngine] Loaded " << model_path << " (" << language << ", "
              << impl_->threads << " threads)" << std::endl;
}

STTEngine::~STTEngine() = default;

STTEngine::STTEngine(STTEngine&& other) noexcept = default;

std::string STTEngine::transcribe(const std::vector<float>& audio) {
    if (!isReady() || audio.empty()) return {};

    const std::vector<float>* input = &audio;
    std::vector<float> padded;
    if (audio.size() < MIN_INPUT_SAMPLES) {
        padded = audio;
        padded.resize(MIN_INPUT_SAMPLES, 0.0f);
        input = &padded;
    }

    std::lock_guard<std::mutex> lock(impl_->ctx_mutex);

    auto begin = std::chrono::steady_clock::now();
    whisper_full_params params = impl_->decodeParams();
    int rc = whisper_full(impl_->ctx, params, input->data(), static_cast<int>(input->size()));
    if (rc != 0) {
        std::cerr << "[STTEngine] whisper_full failed (" << rc << ")" << std::endl;
        return {};
    }

    std::string text;
    for (int i = 0, n = whisper_full_n_segments(impl_->ctx); i < n; ++i) {
        if (const char* piece = whisper_full_get_segment_text(impl_->ctx, i)) {
            text += piece;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);
    std::cout << "[STTEngine] " << audio.size() * 1000 / WHISPER_SAMPLE_RATE << " ms of audio in "
              << elapsed.count() << " ms" << std::endl;

    return stripAnnotations(text);
}

int STTEngine::getSampleRate() {
    return WHISPER_SAMPLE_RATE;
}

bool STTEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string STTEngine::getModelInfo() const {
    if (!isReady()) return "no model loaded";
    return "whisper " + impl_->model_path + " [" + impl_->language + "]";
}

} // namespace vtc::asr
