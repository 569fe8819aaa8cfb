/**
 * Sentences.cpp - Sentence splitting for incremental synthesis
 */

#include "vtc/tts/SpeechSynthesizer.hpp"

#include <cstring>

namespace vtc::tts {

namespace {

// Multi-byte UTF-8 terminators first
const char* const TERMINATORS[] = {"。", "！", "？", "；", "…", "!", "?", ";", "\n"};

size_t terminatorAt(const std::string& text, size_t pos) {
    for (const char* t : TERMINATORS) {
        size_t len = std::strlen(t);
        if (text.compare(pos, len, t) == 0) return len;
    }
    // ASCII period only when it ends a word, not inside "3.5"
    if (text[pos] == '.' && (pos + 1 == text.size() || text[pos + 1] == ' ')) return 1;
    return 0;
}

void pushTrimmed(std::vector<std::string>& out, const std::string& sentence) {
    size_t start = sentence.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return;
    size_t end = sentence.find_last_not_of(" \t\r\n");
    out.push_back(sentence.substr(start, end - start + 1));
}

} // anonymous namespace

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = terminatorAt(text, pos);
        if (len > 0) {
            current.append(text, pos, len);
            pos += len;
            // Keep runs like "？！" or "..." together
            while (pos < text.size() && (len = terminatorAt(text, pos)) > 0) {
                current.append(text, pos, len);
                pos += len;
            }
            pushTrimmed(sentences, current);
            current.clear();
        } else {
            current += text[pos++];
        }
    }
    pushTrimmed(sentences, current);

    return sentences;
}

} // namespace vtc::tts
