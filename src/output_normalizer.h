#pragma once

#include <string>
#include "constants.h"

namespace coderun {

struct NormalizedOutput {
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

// Bounds stdout and stderr independently
class OutputNormalizer {
public:
    explicit OutputNormalizer(size_t max_length = DEFAULT_MAX_OUTPUT_LENGTH,
                              std::string marker = TRUNCATION_MARKER);

    NormalizedOutput normalize(std::string stdout_text, std::string stderr_text) const;

    // Keeps the first max_length UTF-8 characters and appends the marker.
    // Text of at most max_length characters is untouched. A string that is
    // exactly max_length characters plus the marker is returned unchanged,
    // flagged as truncated.
    std::string truncate(std::string text, bool& truncated) const;

    size_t max_length() const { return max_length_; }
    const std::string& marker() const { return marker_; }

private:
    size_t max_length_;
    std::string marker_;
};

} // namespace coderun
