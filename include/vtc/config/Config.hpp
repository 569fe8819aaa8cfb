#pragma once

/**
 * Config.hpp - JSON configuration file
 *
 * Sections mirror the file layout (SYSTEM_OPTIONS, AUDIO, ASR, TTS, VISION).
 * Missing keys are filled from defaults; a missing file is created.
 */

#include "vtc/core/KeywordMatcher.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vtc::config {

struct SystemOptions {
    std::string websocket_url = "ws://127.0.0.1:8000/xiaozhi/v1/";
    std::string websocket_access_token = "test-token";
    std::string device_id;
    std::string client_id;
    int reconnect_max_attempts = 3;
    int reconnect_delay_ms = 2000;
    int hello_timeout_ms = 10000;
};

struct AudioOptions {
    int sample_rate = 16000;
    int frame_duration_ms = 60;
    int input_device = -1;   // -1 = default device
    int output_device = -1;
};

struct AsrOptions {
    std::string whisper_model = "models/whisper/ggml-small-q5_1.bin";
    std::string language = "zh";
    int threads = 4;
    int vad_mode = 2;
    int silence_timeout_ms = 800;
    int min_speech_ms = 300;
};

struct TtsOptions {
    std::string server_url = "http://127.0.0.1:5050";
    std::string voice = "default";
    bool upload_vision_audio = true;
};

struct VisionOptions {
    bool enabled = true;
    std::string api_key;
    std::string api_url = "https://open.bigmodel.cn/api/paas/v4/chat/completions";
    std::string model = "glm-4v-flash";
    int camera_index = 0;
    std::vector<std::string> keywords;
    std::vector<CameraKeywordGroup> camera_keywords;
    std::string default_prompt;
    int timeout_ms = 10000;
    int frame_width = 640;
    int frame_height = 480;
    int max_image_size = 800;
    int jpeg_quality = 80;
};

struct AppConfig {
    SystemOptions system;
    AudioOptions audio;
    AsrOptions asr;
    TtsOptions tts;
    VisionOptions vision;

    KeywordLists keywordLists() const;
};

/// Built-in defaults, including the keyword lists and prompt.
AppConfig defaults();

nlohmann::json toJson(const AppConfig& config);

/// Missing or mistyped keys keep their default value.
AppConfig fromJson(const nlohmann::json& json);

/**
 * Owns the config file on disk.
 * Thread-safe: updates may come from the camera worker.
 */
class ConfigManager {
public:
    explicit ConfigManager(std::string path);
    ~ConfigManager();

    /**
     * Read the file.
     * Missing file: defaults are written to it. Malformed file: defaults are
     * used, the file is left untouched and false is returned.
     */
    bool load();

    bool save() const;

    /// Copy of the current values.
    AppConfig snapshot() const;

    /// Replace a key of the VISION section and write the file back.
    bool updateVisionOption(const std::string& key, const nlohmann::json& value);

    const std::string& path() const;
    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vtc::config
