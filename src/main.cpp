/**
 * VisionTalk Client (VTC) - Main Entry Point
 *
 * Voice client for a remote conversational service, with a local camera
 * and a vision model answering "what is this?" questions.
 */

#include "vtc/Session.hpp"
#include "vtc/asr/WhisperRecognizer.hpp"
#include "vtc/audio/AudioEngine.hpp"
#include "vtc/camera/CameraController.hpp"
#include "vtc/camera/OpenCvCamera.hpp"
#include "vtc/config/Config.hpp"
#include "vtc/protocol/WebsocketProtocol.hpp"
#include "vtc/tts/TTSEngine.hpp"
#include "vtc/vision/VisionApiClient.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <getopt.h>
#include <poll.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

struct CliOptions {
    std::string config_path = "config/config.json";
    int camera_index = -1;
    bool no_vision = false;
    bool text_only = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  -c, --config PATH   configuration file (default config/config.json)\n"
              << "  -C, --camera N      camera index, saved to the configuration\n"
              << "  -n, --no-vision     disable the camera and vision analysis\n"
              << "  -t, --text          typed input only (no microphone)\n"
              << "  -h, --help          show this help\n"
              << "\nCommands while running:\n"
              << "  <text>              send text as if spoken\n"
              << "  /i                  interrupt\n"
              << "  /v [prompt]         describe what the camera sees\n"
              << "  /q                  quit\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& cli) {
    static struct option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"camera", required_argument, nullptr, 'C'},
        {"no-vision", no_argument, nullptr, 'n'},
        {"text", no_argument, nullptr, 't'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:C:nth", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'c': cli.config_path = optarg; break;
            case 'C': {
                char* end = nullptr;
                long n = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || n < 0) {
                    std::cerr << "[VTC] Invalid camera index: " << optarg << std::endl;
                    return false;
                }
                cli.camera_index = static_cast<int>(n);
                break;
            }
            case 'n': cli.no_vision = true; break;
            case 't': cli.text_only = true; break;
            case 'h':
            default:
                printUsage(argv[0]);
                return false;
        }
    }
    return true;
}

/// Wait up to timeout_ms for a line on stdin. False on timeout or EOF.
bool readLine(std::string& line, int timeout_ms) {
    struct pollfd pfd {STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready <= 0) return false;
    if (!std::getline(std::cin, line)) {
        g_running = false;
        return false;
    }
    return true;
}

void handleCommand(vtc::Session& session, const std::string& line) {
    if (line.empty()) return;

    if (line == "/q") {
        g_running = false;
    } else if (line == "/i") {
        session.interrupt();
    } else if (line == "/v" || line.rfind("/v ", 0) == 0) {
        session.requestVision(line.size() > 3 ? line.substr(3) : std::string());
    } else if (line[0] == '/') {
        std::cout << "[VTC] Unknown command: " << line << std::endl;
    } else {
        session.submitText(line);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CliOptions cli;
    if (!parseArgs(argc, argv, cli)) {
        return 1;
    }

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║        VISIONTALK CLIENT (VTC) v0.1.0         ║
    ║     Voice conversation with a camera view     ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    // Configuration
    vtc::config::ConfigManager config_manager(cli.config_path);
    if (!config_manager.load()) {
        std::cerr << "[VTC] " << config_manager.lastError() << " (using defaults)" << std::endl;
    }
    if (cli.camera_index >= 0 && !config_manager.updateVisionOption("CAMERA_INDEX", cli.camera_index)) {
        std::cerr << "[VTC] Could not save camera index: " << config_manager.lastError() << std::endl;
    }
    vtc::config::AppConfig config = config_manager.snapshot();
    if (cli.no_vision) {
        config.vision.enabled = false;
    }

    std::cout << "[VTC] Initializing..." << std::endl;

    // Audio
    vtc::audio::AudioConfig audio_config;
    audio_config.sample_rate = config.audio.sample_rate;
    audio_config.input_device = config.audio.input_device;
    audio_config.output_device = config.audio.output_device;
    auto engine = std::make_shared<vtc::audio::AudioEngine>(audio_config);
    if (!engine->initialize()) {
        std::cerr << "[VTC] AudioEngine init failed: " << engine->lastError() << std::endl;
        return 1;
    }

    vtc::SessionComponents parts;
    parts.speaker = engine;

    // Speech recognition
    if (!cli.text_only) {
        vtc::asr::WhisperOptions whisper;
        whisper.model_path = config.asr.whisper_model;
        whisper.language = config.asr.language;
        whisper.threads = config.asr.threads;
        whisper.sample_rate = config.audio.sample_rate;
        whisper.vad_mode = config.asr.vad_mode;
        whisper.silence_timeout_ms = config.asr.silence_timeout_ms;
        whisper.min_speech_ms = config.asr.min_speech_ms;

        auto recognizer = std::make_unique<vtc::asr::WhisperRecognizer>(whisper);
        if (recognizer->isReady()) {
            parts.recognizer = std::move(recognizer);
            parts.microphone = engine;
        } else {
            std::cerr << "[VTC] Speech recognizer unavailable, continuing with typed input" << std::endl;
        }
    }

    // Speech synthesis
    vtc::tts::TTSOptions tts;
    tts.server_url = config.tts.server_url;
    tts.voice = config.tts.voice;
    tts.sample_rate = config.audio.sample_rate;
    tts.frame_duration_ms = config.audio.frame_duration_ms;
    auto synthesizer = std::make_unique<vtc::tts::TTSEngine>(tts);
    if (!synthesizer->isHealthy()) {
        std::cerr << "[VTC] Warning: TTS server not reachable at " << tts.server_url << std::endl;
    }
    parts.synthesizer = std::move(synthesizer);

    // Camera and vision
    if (config.vision.enabled) {
        vtc::camera::OpenCvCameraOptions cam;
        cam.frame_width = config.vision.frame_width;
        cam.frame_height = config.vision.frame_height;
        cam.max_image_size = config.vision.max_image_size;
        cam.jpeg_quality = config.vision.jpeg_quality;

        parts.camera = std::make_unique<vtc::camera::CameraController>(
            std::make_unique<vtc::camera::OpenCvCamera>(cam), config.vision.camera_index);
        parts.camera->setIndexChangedCallback([&config_manager](int index) {
            if (!config_manager.updateVisionOption("CAMERA_INDEX", index)) {
                std::cerr << "[VTC] Could not save camera index: " << config_manager.lastError() << std::endl;
            }
        });

        parts.analyzer = std::make_unique<vtc::vision::VisionApiClient>(vtc::vision::VisionApiOptions{
            config.vision.api_url, config.vision.api_key, config.vision.model});
    } else {
        std::cout << "[VTC] Vision disabled" << std::endl;
    }

    // Remote service
    vtc::protocol::WebsocketOptions ws;
    ws.url = config.system.websocket_url;
    ws.access_token = config.system.websocket_access_token;
    ws.device_id = config.system.device_id;
    ws.client_id = config.system.client_id;
    ws.audio.sample_rate = config.audio.sample_rate;
    ws.audio.frame_duration_ms = config.audio.frame_duration_ms;
    ws.hello_timeout_ms = config.system.hello_timeout_ms;
    parts.protocol = std::make_unique<vtc::protocol::WebsocketProtocol>(ws);

    auto session = vtc::Session::create(config, std::move(parts));
    if (!session) {
        std::cerr << "[VTC] Could not create session" << std::endl;
        return 1;
    }

    session->setCallbacks({
        nullptr,
        [](const std::string& text) { std::cout << "You: " << text << std::endl; },
        [](const std::string& text) { std::cout << "Assistant: " << text << std::endl; },
        [](const std::string& text) { std::cout << "(" << text << ")" << std::endl; },
    });

    if (!engine->start()) {
        std::cerr << "[VTC] Could not start audio: " << engine->lastError() << std::endl;
        return 1;
    }
    session->start();

    std::cout << "[VTC] Running. Type /q to quit." << std::endl;

    std::string line;
    while (g_running) {
        if (readLine(line, 100)) {
            handleCommand(*session, line);
        }
    }

    std::cout << "\n[VTC] Shutting down..." << std::endl;
    engine->stop();
    session->stop();

    std::cout << "[VTC] Goodbye!" << std::endl;
    return 0;
}
