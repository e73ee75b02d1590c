#pragma once

#include <string>

// Decides when the monitored program has finished answering.
enum class BoundarySignal {
    kStillCapturing,
    kBoundaryReached,
};

// Swappable end-of-response heuristic. The segmenter consults inspect()
// with every sanitized output chunk while a response is being captured,
// and is_prompt_line() to keep the prompt itself out of the response.
class BoundaryDetector {
public:
    virtual ~BoundaryDetector() = default;

    virtual BoundarySignal inspect(const std::string& sanitized_chunk) = 0;
    virtual bool is_prompt_line(const std::string& line) const = 0;
};

// Default heuristic: the prompt marker appearing anywhere in a chunk
// means the program is back at its prompt. Response text that happens
// to contain the marker ends the turn early; see DESIGN.md.
class PromptMarkerDetector : public BoundaryDetector {
public:
    explicit PromptMarkerDetector(std::string marker = ">");

    BoundarySignal inspect(const std::string& sanitized_chunk) override;
    bool is_prompt_line(const std::string& line) const override;

private:
    std::string marker_;
};
