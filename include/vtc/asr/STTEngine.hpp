#pragma once

/**
 * STTEngine.hpp - whisper.cpp transcription
 */

#include <memory>
#include <string>
#include <vector>

namespace vtc::asr {

class STTEngine {
public:
    STTEngine(const std::string& model_path, const std::string& language = "zh", int n_threads = 4);
    ~STTEngine();

    STTEngine(STTEngine&& other) noexcept;
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    /// Mono float32 at getSampleRate(). Empty string on failure or silence.
    std::string transcribe(const std::vector<float>& audio);

    bool isReady() const;
    std::string getModelInfo() const;

    static int getSampleRate();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::asr
