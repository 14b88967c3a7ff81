#include "vision/detection_parser.hpp"
#include "core/logging.hpp"

namespace vision {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Parse one non-negative integer in [0, kCoordinateMax] starting at `i`.
bool parse_coordinate(const std::string& s, size_t& i, int& out) {
    size_t start = i;
    long value = 0;
    while (i < s.size() && is_digit(s[i])) {
        value = value * 10 + (s[i] - '0');
        if (value > kCoordinateMax) {
            return false;
        }
        ++i;
    }
    if (i == start) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

// Separator between coordinates: commas and/or whitespace, non-empty, at most one comma.
bool parse_separator(const std::string& s, size_t& i) {
    size_t start = i;
    int commas = 0;
    while (i < s.size() && (s[i] == ',' || is_space(s[i]))) {
        if (s[i] == ',' && ++commas > 1) {
            return false;
        }
        ++i;
    }
    return i > start;
}

void skip_spaces(const std::string& s, size_t& i) {
    while (i < s.size() && is_space(s[i])) ++i;
}

// Parse "[a, b, c, d]" with the '[' at `open`. On success `close` is the index of ']'.
bool parse_box(const std::string& s, size_t open, int (&values)[4], size_t& close) {
    size_t i = open + 1;
    skip_spaces(s, i);
    for (int k = 0; k < 4; ++k) {
        if (!parse_coordinate(s, i, values[k])) {
            return false;
        }
        if (k < 3 && !parse_separator(s, i)) {
            return false;
        }
    }
    skip_spaces(s, i);
    if (i >= s.size() || s[i] != ']') {
        return false;
    }
    close = i;
    return true;
}

// Last word of the letters-and-spaces run directly before the bracket.
std::string extract_label(const std::string& s, size_t open) {
    size_t begin = open;
    while (begin > 0 && (is_alpha(s[begin - 1]) || is_space(s[begin - 1]))) {
        --begin;
    }
    size_t end = open;
    while (end > begin && is_space(s[end - 1])) {
        --end;
    }
    size_t word = end;
    while (word > begin && !is_space(s[word - 1])) {
        --word;
    }
    if (word == end) {
        return kDefaultLabel;
    }
    return s.substr(word, end - word);
}

} // namespace

DetectionParser::DetectionParser(size_t max_buffer_chars)
    : max_buffer_chars_(max_buffer_chars > 0 ? max_buffer_chars : 1) {}

std::vector<Detection> DetectionParser::feed(const std::string& delta, int64_t now_ms) {
    buffer_ += delta;
    if (buffer_.size() > max_buffer_chars_) {
        buffer_.erase(0, buffer_.size() - max_buffer_chars_);
    }
    return scan_impl(buffer_, now_ms, &malformed_count_);
}

std::vector<Detection> DetectionParser::scan(const std::string& text, int64_t now_ms) {
    return scan_impl(text, now_ms, nullptr);
}

std::vector<Detection> DetectionParser::scan_impl(const std::string& text, int64_t now_ms, size_t* malformed) {
    std::vector<Detection> found;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t open = text.find('[', pos);
        if (open == std::string::npos) {
            break;
        }

        int values[4] = {0, 0, 0, 0};
        size_t close = 0;
        if (!parse_box(text, open, values, close)) {
            // Malformed or still incomplete; keep scanning after this bracket.
            if (malformed && text.find(']', open) != std::string::npos) {
                ++*malformed;
            }
            pos = open + 1;
            continue;
        }

        Detection d;
        d.label = extract_label(text, open);
        d.ymin = values[0];
        d.xmin = values[1];
        d.ymax = values[2];
        d.xmax = values[3];
        d.observed_at_ms = now_ms;
        found.push_back(std::move(d));

        pos = close + 1;
    }

    if (!found.empty()) {
        core::log_debug("DetectionParser: " + std::to_string(found.size()) + " box(es) in buffer");
    }
    return found;
}

} // namespace vision
