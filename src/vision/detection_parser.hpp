#pragma once

#include "vision/detection.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vision {

/**
 * @brief Extracts bounding boxes from an incrementally delivered text stream
 *
 * Text arrives token by token, so a box like "cup [200, 300, 450, 500]" may be
 * split across several deltas. The parser keeps a bounded trailing buffer of
 * recent text and rescans all of it on every delta, so a box whose characters
 * straddle deltas is found once its last character arrives.
 *
 * Wire format: `label [ymin, xmin, ymax, xmax]`, each value an integer in
 * [0,1000]. Separators are commas and/or whitespace. Malformed groups are
 * skipped.
 *
 * The same box is reported again on every rescan while it stays in the
 * buffer; reconciling repeats is the tracker's job.
 *
 * Not thread-safe; owned by the session event loop.
 */
class DetectionParser {
public:
    explicit DetectionParser(size_t max_buffer_chars = 500);

    /// Append a delta and return every detection in the current buffer.
    std::vector<Detection> feed(const std::string& delta, int64_t now_ms);

    /// Scan a complete piece of text without touching the trailing buffer.
    static std::vector<Detection> scan(const std::string& text, int64_t now_ms);

    void reset() { buffer_.clear(); }

    const std::string& buffer() const { return buffer_; }
    size_t max_buffer_chars() const { return max_buffer_chars_; }

    /// Bracket groups rejected so far (non-numeric, missing fields, out of range).
    size_t malformed_count() const { return malformed_count_; }

private:
    static std::vector<Detection> scan_impl(const std::string& text, int64_t now_ms, size_t* malformed);

    std::string buffer_;
    size_t max_buffer_chars_;
    size_t malformed_count_ = 0;
};

} // namespace vision
