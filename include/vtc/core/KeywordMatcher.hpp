#pragma once

/**
 * KeywordMatcher.hpp - Utterance intent classification by keyword lists
 */

#include "vtc/core/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vtc {

enum class Intent {
    VisionTrigger,
    CameraOpen,
    CameraClose,
    Ordinary
};

const char* toString(Intent intent);

enum class CameraAction {
    Open,
    Close
};

struct CameraKeywordGroup {
    CameraAction action = CameraAction::Open;
    std::vector<std::string> keywords;
};

struct KeywordLists {
    bool vision_enabled = true;
    std::vector<std::string> vision;          // KEYWORDS
    std::vector<CameraKeywordGroup> camera;   // CAMERA_KEYWORDS, checked first
};

struct KeywordMatch {
    Intent intent = Intent::Ordinary;
    std::string keyword;
};

/**
 * Pure, case-normalized substring classifier.
 *
 * Camera groups are scanned before the vision list so that "打开摄像头"
 * is a camera command even though "摄像头" may also be a vision keyword.
 * Within a list the first listed keyword that occurs wins.
 */
class KeywordMatcher {
public:
    explicit KeywordMatcher(KeywordLists lists);

    /// VisionAnswer utterances are always Ordinary, without scanning.
    Intent classify(const Utterance& utterance) const;

    /// Same as classify() but reports which keyword matched.
    KeywordMatch match(const Utterance& utterance) const;

    bool visionEnabled() const { return lists_.vision_enabled; }

    static std::string normalize(const std::string& text);

private:
    KeywordMatch scan(const std::string& normalized_text) const;

    KeywordLists lists_;  // keywords stored normalized
};

} // namespace vtc
