/**
 * KeywordMatcher.cpp - Keyword list scanning
 */

#include "vtc/core/KeywordMatcher.hpp"

#include <algorithm>
#include <cctype>

namespace vtc {

const char* toString(Intent intent) {
    switch (intent) {
        case Intent::VisionTrigger: return "VisionTrigger";
        case Intent::CameraOpen:    return "CameraOpen";
        case Intent::CameraClose:   return "CameraClose";
        case Intent::Ordinary:      return "Ordinary";
    }
    return "Unknown";
}

KeywordMatcher::KeywordMatcher(KeywordLists lists)
    : lists_(std::move(lists)) {

    auto normalize_all = [](std::vector<std::string>& keywords) {
        for (auto& kw : keywords) {
            kw = normalize(kw);
        }
        // An empty keyword would match everything
        keywords.erase(std::remove(keywords.begin(), keywords.end(), std::string()),
                       keywords.end());
    };

    normalize_all(lists_.vision);
    for (auto& group : lists_.camera) {
        normalize_all(group.keywords);
    }
}

std::string KeywordMatcher::normalize(const std::string& text) {
    // ASCII folding only; multi-byte UTF-8 sequences pass through untouched
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        out += (c < 0x80) ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    }

    // Trim surrounding ASCII whitespace
    size_t start = out.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = out.find_last_not_of(" \t\r\n");
    return out.substr(start, end - start + 1);
}

Intent KeywordMatcher::classify(const Utterance& utterance) const {
    return match(utterance).intent;
}

KeywordMatch KeywordMatcher::match(const Utterance& utterance) const {
    if (utterance.isVisionAnswer()) {
        return {};
    }
    return scan(normalize(utterance.text()));
}

KeywordMatch KeywordMatcher::scan(const std::string& text) const {
    if (text.empty()) return {};

    for (const auto& group : lists_.camera) {
        for (const auto& kw : group.keywords) {
            if (text.find(kw) != std::string::npos) {
                return {group.action == CameraAction::Open ? Intent::CameraOpen
                                                           : Intent::CameraClose,
                        kw};
            }
        }
    }

    if (!lists_.vision_enabled) return {};

    for (const auto& kw : lists_.vision) {
        if (text.find(kw) != std::string::npos) {
            return {Intent::VisionTrigger, kw};
        }
    }

    return {};
}

} // namespace vtc
