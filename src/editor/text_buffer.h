#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace editor {

// Buffer position: zero-based row and column (in bytes).
struct Point {
    uint32_t row = 0;
    uint32_t column = 0;

    auto operator<=>(const Point&) const = default;
};

enum class Bias { Left, Right };

// Stable reference to a buffer position. The buffer is immutable here, so an
// anchor is its byte offset plus the side it sticks to.
struct Anchor {
    size_t offset = 0;
    Bias bias = Bias::Left;

    bool operator==(const Anchor&) const = default;
    bool operator<(const Anchor& other) const { return offset < other.offset; }
};

class TextBuffer {
public:
    explicit TextBuffer(std::string_view text = {});

    const std::string& text() const { return text_; }
    uint32_t line_count() const {
        return static_cast<uint32_t>(lineStarts_.size());
    }
    uint32_t line_len(uint32_t row) const;

    Point max_point() const;
    Point clip_point(Point point) const;

    size_t point_to_offset(Point point) const;
    Point offset_to_point(size_t offset) const;

    Anchor anchor_before(Point point) const;
    Anchor anchor_after(Point point) const;
    Point anchor_to_point(const Anchor& anchor) const;

private:
    std::string text_;
    std::vector<size_t> lineStarts_;
};

}  // namespace editor
