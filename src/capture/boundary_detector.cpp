#include "boundary_detector.hpp"
#include <core/utils.hpp>

PromptMarkerDetector::PromptMarkerDetector(std::string marker)
    : marker_(std::move(marker)) {
    if (marker_.empty()) marker_ = ">";
}

BoundarySignal PromptMarkerDetector::inspect(const std::string& sanitized_chunk) {
    return sanitized_chunk.find(marker_) != std::string::npos
        ? BoundarySignal::kBoundaryReached
        : BoundarySignal::kStillCapturing;
}

// "> " on its own, or "> " followed by whatever the operator is typing.
bool PromptMarkerDetector::is_prompt_line(const std::string& line) const {
    std::string t = trimmed(line);
    return t.compare(0, marker_.size(), marker_) == 0;
}
