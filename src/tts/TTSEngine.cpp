/**
 * TTSEngine.cpp - HTTP synthesis server client
 *
 * The server keeps its model loaded and answers POST /synthesize with a
 * WAV body. Text is split into sentences so the first sentence can play
 * while the rest is still being synthesized.
 */

#include "vtc/tts/TTSEngine.hpp"
#include "vtc/audio/Wav.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vtc::tts {

struct TTSEngine::Impl {
    TTSOptions options;
    std::mutex client_mutex;
    std::unique_ptr<httplib::Client> client;

    void configure(httplib::Client& cli) const {
        auto timeout = std::chrono::milliseconds(options.timeout_ms);
        cli.set_connection_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout).count() / 3 + 1);
        cli.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
        cli.set_write_timeout(5);
    }

    std::optional<AudioFrame> synthesize(const std::string& sentence) {
        json body = {{"text", sentence}, {"voice", options.voice}};

        httplib::Result res;
        {
            std::lock_guard<std::mutex> lock(client_mutex);
            if (!client) return std::nullopt;
            res = client->Post("/synthesize", body.dump(), "application/json");
        }

        if (!res) {
            std::cerr << "[TTS] Request failed: " << httplib::to_string(res.error()) << std::endl;
            return std::nullopt;
        }
        if (res->status != 200) {
            std::cerr << "[TTS] Server returned HTTP " << res->status << std::endl;
            return std::nullopt;
        }

        std::vector<uint8_t> bytes(res->body.begin(), res->body.end());
        auto wav = audio::decodeWav(bytes);
        if (!wav) {
            std::cerr << "[TTS] Response is not a usable WAV (" << bytes.size() << " bytes)" << std::endl;
            return std::nullopt;
        }

        if (wav->sample_rate != options.sample_rate) {
            return audio::resample(wav->samples, wav->sample_rate, options.sample_rate);
        }
        return std::move(wav->samples);
    }
};

namespace {

/// Synthesizes the next sentence only when the previous one is used up.
class SentenceStream : public AudioStream {
public:
    SentenceStream(std::shared_ptr<TTSEngine::Impl> engine, std::vector<std::string> sentences,
                   size_t frame_samples)
        : engine_(std::move(engine)),
          sentences_(sentences.begin(), sentences.end()),
          frame_samples_(std::max<size_t>(frame_samples, 1)) {}

    bool next(AudioFrame& out) override {
        while (offset_ >= current_.size()) {
            if (error_ != ErrorKind::None || sentences_.empty()) return false;

            std::string sentence = std::move(sentences_.front());
            sentences_.pop_front();

            auto samples = engine_->synthesize(sentence);
            if (!samples) {
                error_ = ErrorKind::SynthesisFailed;
                return false;
            }
            current_ = std::move(*samples);
            offset_ = 0;
        }

        size_t n = std::min(frame_samples_, current_.size() - offset_);
        out.assign(current_.begin() + offset_, current_.begin() + offset_ + n);
        offset_ += n;
        return true;
    }

    ErrorKind error() const override { return error_; }

private:
    std::shared_ptr<TTSEngine::Impl> engine_;
    std::deque<std::string> sentences_;
    size_t frame_samples_;
    AudioFrame current_;
    size_t offset_ = 0;
    ErrorKind error_ = ErrorKind::None;
};

} // anonymous namespace

TTSEngine::TTSEngine(TTSOptions options)
    : impl_(std::make_shared<Impl>()) {
    impl_->options = std::move(options);

    std::cout << "[TTS] Server: " << impl_->options.server_url
              << " voice=" << impl_->options.voice << std::endl;

    impl_->client = std::make_unique<httplib::Client>(impl_->options.server_url);
    if (!impl_->client->is_valid()) {
        std::cerr << "[TTS] Invalid server URL: " << impl_->options.server_url << std::endl;
        impl_->client.reset();
        return;
    }
    impl_->configure(*impl_->client);
}

TTSEngine::~TTSEngine() = default;

bool TTSEngine::isHealthy() {
    std::lock_guard<std::mutex> lock(impl_->client_mutex);
    if (!impl_->client) return false;
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

std::unique_ptr<AudioStream> TTSEngine::synthesize(const std::string& text) {
    size_t frame_samples = static_cast<size_t>(impl_->options.sample_rate) *
                           impl_->options.frame_duration_ms / 1000;
    return std::make_unique<SentenceStream>(impl_, splitSentences(text), frame_samples);
}

int TTSEngine::sampleRate() const {
    return impl_->options.sample_rate;
}

} // namespace vtc::tts
