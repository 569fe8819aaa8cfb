/**
 * test_stt.cpp - STTEngine and WhisperRecognizer tests
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "vtc/asr/STTEngine.hpp"
#include "vtc/asr/WhisperRecognizer.hpp"

namespace {
const char* MODEL_PATH = "models/whisper/ggml-small-q5_1.bin";
}

void test_sample_rate() {
    int rate = vtc::asr::STTEngine::getSampleRate();
    assert(rate == 16000);
    std::cout << "[PASS] Sample rate is 16kHz" << std::endl;
}

void test_missing_model() {
    vtc::asr::STTEngine engine("models/whisper/does-not-exist.bin", "zh", 1);
    assert(!engine.isReady());
    assert(engine.transcribe(std::vector<float>(16000, 0.0f)).empty());

    vtc::asr::WhisperOptions options;
    options.model_path = "models/whisper/does-not-exist.bin";
    vtc::asr::WhisperRecognizer recognizer(options);
    assert(!recognizer.isReady());
    // Feeding a recognizer without a model is a no-op
    std::vector<float> samples(480, 0.0f);
    recognizer.feed(samples.data(), samples.size());

    std::cout << "[PASS] Missing model is reported, not fatal" << std::endl;
}

void test_transcription_with_silence() {
    vtc::asr::STTEngine engine(MODEL_PATH, "zh", 4);
    if (!engine.isReady()) {
        std::cout << "[SKIP] Model not available at " << MODEL_PATH << std::endl;
        return;
    }
    std::cout << "  Info: " << engine.getModelInfo() << std::endl;

    std::vector<float> silence(16000, 0.0f);
    std::string result = engine.transcribe(silence);

    std::cout << "  Result: \"" << result << "\"" << std::endl;
    std::cout << "[PASS] Transcription of silence works" << std::endl;
}

void test_recognizer_ignores_tone() {
    vtc::asr::WhisperOptions options;
    options.model_path = MODEL_PATH;
    vtc::asr::WhisperRecognizer recognizer(options);
    if (!recognizer.isReady()) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }

    int results = 0;
    recognizer.setResultCallback([&results](const std::string&) { ++results; });

    // 2 seconds of 440Hz tone, then silence to close any segment
    const int sample_rate = 16000;
    std::vector<float> tone(sample_rate * 2);
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = 0.3f * std::sin(2.0f * static_cast<float>(M_PI) * 440.0f * i / sample_rate);
    }
    std::vector<float> silence(sample_rate, 0.0f);
    recognizer.feed(tone.data(), tone.size());
    recognizer.feed(silence.data(), silence.size());
    recognizer.reset();

    std::cout << "  Results: " << results << std::endl;
    std::cout << "[PASS] Recognizer survives non-speech input" << std::endl;
}

int main() {
    std::cout << "=== STTEngine Tests ===" << std::endl;

    test_sample_rate();
    test_missing_model();
    test_transcription_with_silence();
    test_recognizer_ignores_tone();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
