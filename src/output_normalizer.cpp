#include "output_normalizer.h"

namespace coderun {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte offset just past the first max_chars UTF-8 characters, or npos if
// the text holds no more than max_chars characters
size_t char_boundary(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t pos = 0; pos < text.size(); ++pos) {
        if (is_continuation(text[pos])) {
            continue;
        }
        if (chars == max_chars) {
            return pos;
        }
        ++chars;
    }
    return std::string::npos;
}

} // namespace

OutputNormalizer::OutputNormalizer(size_t max_length, std::string marker)
    : max_length_(max_length), marker_(std::move(marker)) {}

std::string OutputNormalizer::truncate(std::string text, bool& truncated) const {
    truncated = false;
    const size_t cut = char_boundary(text, max_length_);
    if (cut == std::string::npos) {
        return text;
    }

    truncated = true;
    // Already normalized: exactly max_length characters followed by the marker
    if (text.size() - cut == marker_.size() && text.compare(cut, marker_.size(), marker_) == 0) {
        return text;
    }

    text.resize(cut);
    text += marker_;
    return text;
}

NormalizedOutput OutputNormalizer::normalize(std::string stdout_text, std::string stderr_text) const {
    NormalizedOutput out;
    out.stdout_text = truncate(std::move(stdout_text), out.stdout_truncated);
    out.stderr_text = truncate(std::move(stderr_text), out.stderr_truncated);
    return out;
}

} // namespace coderun
