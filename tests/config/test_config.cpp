/**
 * test_config.cpp - Config file defaults, partial files, write-back
 */

#include "vtc/config/Config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace vtc;
using namespace vtc::config;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

fs::path tempDir() {
    fs::path dir = fs::temp_directory_path() / ("vtc_config_test_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    return dir;
}

void writeFile(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

json readFile(const fs::path& path) {
    std::ifstream file(path);
    return json::parse(file);
}

} // anonymous namespace

void test_defaults() {
    AppConfig c = defaults();
    assert(c.system.reconnect_max_attempts == 3);
    assert(c.system.reconnect_delay_ms == 2000);
    assert(c.audio.sample_rate == 16000);
    assert(c.vision.enabled);
    assert(c.vision.model == "glm-4v-flash");
    assert(c.vision.timeout_ms == 10000);
    assert(c.vision.max_image_size == 800);
    assert(!c.vision.keywords.empty());
    assert(!c.vision.default_prompt.empty());

    KeywordMatcher m(c.keywordLists());
    Utterance open("打开摄像头", UtteranceOrigin::UserSpeech, 1);
    assert(m.classify(open) == Intent::CameraOpen);

    std::cout << "[PASS] test_defaults" << std::endl;
}

void test_missing_file_written() {
    fs::path path = tempDir() / "sub" / "config.json";
    fs::remove(path);

    ConfigManager manager(path.string());
    assert(manager.load());
    assert(fs::exists(path));

    json written = readFile(path);
    assert(written["VISION"]["MODEL"] == "glm-4v-flash");
    assert(written["SYSTEM_OPTIONS"]["RECONNECT_MAX_ATTEMPTS"] == 3);

    std::cout << "[PASS] test_missing_file_written" << std::endl;
}

void test_partial_file() {
    fs::path path = tempDir() / "partial.json";
    writeFile(path, R"({
        "VISION": {
            "ENABLED": false,
            "CAMERA_INDEX": 2,
            "KEYWORDS": ["瞧瞧"],
            "CAMERA_KEYWORDS": [
                {"action": "open", "keywords": ["开灯看"]},
                {"action": "explode", "keywords": ["x"]}
            ],
            "TIMEOUT_MS": "not a number"
        },
        "ASR": {"VAD_MODE": 9}
    })");

    ConfigManager manager(path.string());
    assert(manager.load());
    AppConfig c = manager.snapshot();

    assert(!c.vision.enabled);
    assert(c.vision.camera_index == 2);
    assert(c.vision.keywords.size() == 1 && c.vision.keywords[0] == "瞧瞧");
    assert(c.vision.camera_keywords.size() == 1);
    assert(c.vision.camera_keywords[0].action == CameraAction::Open);
    assert(c.vision.timeout_ms == 10000);      // mistyped: default kept
    assert(c.asr.vad_mode == 3);               // clamped
    assert(c.system.websocket_url == defaults().system.websocket_url);

    std::cout << "[PASS] test_partial_file" << std::endl;
}

void test_malformed_file() {
    fs::path path = tempDir() / "broken.json";
    writeFile(path, "{ \"VISION\": ");

    ConfigManager manager(path.string());
    assert(!manager.load());
    assert(!manager.lastError().empty());
    assert(manager.snapshot().vision.model == "glm-4v-flash");

    // The broken file is left for the user to fix
    std::ifstream file(path);
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    assert(text == "{ \"VISION\": ");

    std::cout << "[PASS] test_malformed_file" << std::endl;
}

void test_update_vision_option() {
    fs::path path = tempDir() / "update.json";
    fs::remove(path);

    ConfigManager manager(path.string());
    assert(manager.load());

    assert(manager.updateVisionOption("CAMERA_INDEX", 1));
    assert(manager.snapshot().vision.camera_index == 1);
    assert(readFile(path)["VISION"]["CAMERA_INDEX"] == 1);

    assert(!manager.updateVisionOption("NO_SUCH_KEY", true));

    // A fresh manager sees the persisted value
    ConfigManager again(path.string());
    assert(again.load());
    assert(again.snapshot().vision.camera_index == 1);

    std::cout << "[PASS] test_update_vision_option" << std::endl;
}

int main() {
    std::cout << "=== Config Tests ===" << std::endl;

    test_defaults();
    test_missing_file_written();
    test_partial_file();
    test_malformed_file();
    test_update_vision_option();

    fs::remove_all(tempDir());

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
