/**
 * Config.cpp - Config file load/save with nlohmann::json
 */

#include "vtc/config/Config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace vtc::config {

namespace {

const char* DEFAULT_PROMPT = "图中描绘的是什么景象,请详细描述，因为用户可能是盲人";

// Keep the default when the key is absent or has the wrong type
template <typename T>
void read(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const std::exception& e) {
        std::cerr << "[Config] Ignoring " << key << ": " << e.what() << std::endl;
    }
}

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) return empty;
    return *it;
}

json cameraKeywordsToJson(const std::vector<CameraKeywordGroup>& groups) {
    json out = json::array();
    for (const auto& g : groups) {
        out.push_back({
            {"action", g.action == CameraAction::Open ? "open" : "close"},
            {"keywords", g.keywords}
        });
    }
    return out;
}

std::vector<CameraKeywordGroup> cameraKeywordsFromJson(const json& value) {
    std::vector<CameraKeywordGroup> groups;
    for (const auto& entry : value) {
        if (!entry.is_object()) continue;
        std::string action = entry.value("action", "");
        if (action != "open" && action != "close") {
            std::cerr << "[Config] Unknown camera keyword action: " << action << std::endl;
            continue;
        }
        CameraKeywordGroup group;
        group.action = action == "open" ? CameraAction::Open : CameraAction::Close;
        read(entry, "keywords", group.keywords);
        groups.push_back(std::move(group));
    }
    return groups;
}

} // anonymous namespace

KeywordLists AppConfig::keywordLists() const {
    KeywordLists lists;
    lists.vision_enabled = vision.enabled;
    lists.vision = vision.keywords;
    lists.camera = vision.camera_keywords;
    return lists;
}

AppConfig defaults() {
    AppConfig config;
    config.vision.default_prompt = DEFAULT_PROMPT;
    config.vision.keywords = {
        "看看", "看一下", "这是什么", "画面", "图片", "看到", "看见", "照片", "屏幕", "摄像头"
    };
    config.vision.camera_keywords = {
        {CameraAction::Open,  {"打开摄像头", "开启摄像头", "打开相机"}},
        {CameraAction::Close, {"关闭摄像头", "关掉摄像头", "关闭相机"}},
    };
    return config;
}

json toJson(const AppConfig& c) {
    return {
        {"SYSTEM_OPTIONS", {
            {"WEBSOCKET_URL", c.system.websocket_url},
            {"WEBSOCKET_ACCESS_TOKEN", c.system.websocket_access_token},
            {"DEVICE_ID", c.system.device_id},
            {"CLIENT_ID", c.system.client_id},
            {"RECONNECT_MAX_ATTEMPTS", c.system.reconnect_max_attempts},
            {"RECONNECT_DELAY_MS", c.system.reconnect_delay_ms},
            {"HELLO_TIMEOUT_MS", c.system.hello_timeout_ms}
        }},
        {"AUDIO", {
            {"SAMPLE_RATE", c.audio.sample_rate},
            {"FRAME_DURATION_MS", c.audio.frame_duration_ms},
            {"INPUT_DEVICE", c.audio.input_device},
            {"OUTPUT_DEVICE", c.audio.output_device}
        }},
        {"ASR", {
            {"WHISPER_MODEL", c.asr.whisper_model},
            {"LANGUAGE", c.asr.language},
            {"THREADS", c.asr.threads},
            {"VAD_MODE", c.asr.vad_mode},
            {"SILENCE_TIMEOUT_MS", c.asr.silence_timeout_ms},
            {"MIN_SPEECH_MS", c.asr.min_speech_ms}
        }},
        {"TTS", {
            {"SERVER_URL", c.tts.server_url},
            {"VOICE", c.tts.voice},
            {"UPLOAD_VISION_AUDIO", c.tts.upload_vision_audio}
        }},
        {"VISION", {
            {"ENABLED", c.vision.enabled},
            {"API_KEY", c.vision.api_key},
            {"API_URL", c.vision.api_url},
            {"MODEL", c.vision.model},
            {"CAMERA_INDEX", c.vision.camera_index},
            {"KEYWORDS", c.vision.keywords},
            {"CAMERA_KEYWORDS", cameraKeywordsToJson(c.vision.camera_keywords)},
            {"DEFAULT_PROMPT", c.vision.default_prompt},
            {"TIMEOUT_MS", c.vision.timeout_ms},
            {"FRAME_WIDTH", c.vision.frame_width},
            {"FRAME_HEIGHT", c.vision.frame_height},
            {"MAX_IMAGE_SIZE", c.vision.max_image_size},
            {"JPEG_QUALITY", c.vision.jpeg_quality}
        }}
    };
}

AppConfig fromJson(const json& root) {
    AppConfig c = defaults();
    if (!root.is_object()) return c;

    const json& sys = section(root, "SYSTEM_OPTIONS");
    read(sys, "WEBSOCKET_URL", c.system.websocket_url);
    read(sys, "WEBSOCKET_ACCESS_TOKEN", c.system.websocket_access_token);
    read(sys, "DEVICE_ID", c.system.device_id);
    read(sys, "CLIENT_ID", c.system.client_id);
    read(sys, "RECONNECT_MAX_ATTEMPTS", c.system.reconnect_max_attempts);
    read(sys, "RECONNECT_DELAY_MS", c.system.reconnect_delay_ms);
    read(sys, "HELLO_TIMEOUT_MS", c.system.hello_timeout_ms);

    const json& audio = section(root, "AUDIO");
    read(audio, "SAMPLE_RATE", c.audio.sample_rate);
    read(audio, "FRAME_DURATION_MS", c.audio.frame_duration_ms);
    read(audio, "INPUT_DEVICE", c.audio.input_device);
    read(audio, "OUTPUT_DEVICE", c.audio.output_device);

    const json& asr = section(root, "ASR");
    read(asr, "WHISPER_MODEL", c.asr.whisper_model);
    read(asr, "LANGUAGE", c.asr.language);
    read(asr, "THREADS", c.asr.threads);
    read(asr, "VAD_MODE", c.asr.vad_mode);
    read(asr, "SILENCE_TIMEOUT_MS", c.asr.silence_timeout_ms);
    read(asr, "MIN_SPEECH_MS", c.asr.min_speech_ms);

    const json& tts = section(root, "TTS");
    read(tts, "SERVER_URL", c.tts.server_url);
    read(tts, "VOICE", c.tts.voice);
    read(tts, "UPLOAD_VISION_AUDIO", c.tts.upload_vision_audio);

    const json& vision = section(root, "VISION");
    read(vision, "ENABLED", c.vision.enabled);
    read(vision, "API_KEY", c.vision.api_key);
    read(vision, "API_URL", c.vision.api_url);
    read(vision, "MODEL", c.vision.model);
    read(vision, "CAMERA_INDEX", c.vision.camera_index);
    read(vision, "KEYWORDS", c.vision.keywords);
    if (auto it = vision.find("CAMERA_KEYWORDS"); it != vision.end() && it->is_array()) {
        c.vision.camera_keywords = cameraKeywordsFromJson(*it);
    }
    read(vision, "DEFAULT_PROMPT", c.vision.default_prompt);
    read(vision, "TIMEOUT_MS", c.vision.timeout_ms);
    read(vision, "FRAME_WIDTH", c.vision.frame_width);
    read(vision, "FRAME_HEIGHT", c.vision.frame_height);
    read(vision, "MAX_IMAGE_SIZE", c.vision.max_image_size);
    read(vision, "JPEG_QUALITY", c.vision.jpeg_quality);

    c.asr.vad_mode = std::clamp(c.asr.vad_mode, 0, 3);
    c.vision.jpeg_quality = std::clamp(c.vision.jpeg_quality, 1, 100);
    return c;
}

// ============================================================================
// ConfigManager
// ============================================================================

struct ConfigManager::Impl {
    std::string path;
    AppConfig config = defaults();
    std::string last_error;
    mutable std::mutex mutex;

    // Caller holds mutex
    bool write() const {
        try {
            std::filesystem::path p(path);
            if (p.has_parent_path()) {
                std::filesystem::create_directories(p.parent_path());
            }
            std::ofstream file(path);
            if (!file.good()) {
                std::cerr << "[Config] Cannot write " << path << std::endl;
                return false;
            }
            file << toJson(config).dump(4, ' ', false) << std::endl;
            return file.good();
        } catch (const std::exception& e) {
            std::cerr << "[Config] Save failed: " << e.what() << std::endl;
            return false;
        }
    }
};

ConfigManager::ConfigManager(std::string path) : impl_(std::make_unique<Impl>()) {
    impl_->path = std::move(path);
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->config = defaults();
    impl_->last_error.clear();

    std::ifstream file(impl_->path);
    if (!file.good()) {
        std::cout << "[Config] " << impl_->path << " not found, writing defaults" << std::endl;
        if (!impl_->write()) {
            impl_->last_error = "cannot create " + impl_->path;
        }
        return true;
    }

    try {
        json root = json::parse(file);
        impl_->config = fromJson(root);
    } catch (const std::exception& e) {
        impl_->last_error = e.what();
        std::cerr << "[Config] Malformed " << impl_->path << ": " << e.what()
                  << " (using defaults)" << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded " << impl_->path << std::endl;
    return true;
}

bool ConfigManager::save() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->write();
}

AppConfig ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->config;
}

bool ConfigManager::updateVisionOption(const std::string& key, const json& value) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    json root = toJson(impl_->config);
    json& vision = root["VISION"];
    if (!vision.contains(key)) {
        impl_->last_error = "unknown VISION option " + key;
        std::cerr << "[Config] " << impl_->last_error << std::endl;
        return false;
    }

    vision[key] = value;
    impl_->config = fromJson(root);

    std::cout << "[Config] VISION." << key << " updated" << std::endl;
    return impl_->write();
}

const std::string& ConfigManager::path() const { return impl_->path; }

std::string ConfigManager::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_error;
}

} // namespace vtc::config
