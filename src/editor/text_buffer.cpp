#include "text_buffer.h"

#include <algorithm>

namespace editor {

TextBuffer::TextBuffer(std::string_view text) : text_(text) {
    lineStarts_.push_back(0);
    for (size_t i = 0; i < text_.size(); ++i) {
        if (text_[i] == '\n') lineStarts_.push_back(i + 1);
    }
}

uint32_t TextBuffer::line_len(uint32_t row) const {
    if (row >= line_count()) return 0;
    size_t start = lineStarts_[row];
    size_t end = (row + 1 < line_count()) ? lineStarts_[row + 1] - 1
                                          : text_.size();
    return static_cast<uint32_t>(end - start);
}

Point TextBuffer::max_point() const {
    uint32_t last = line_count() - 1;
    return {last, line_len(last)};
}

Point TextBuffer::clip_point(Point point) const {
    if (point.row >= line_count()) return max_point();
    point.column = std::min(point.column, line_len(point.row));
    return point;
}

size_t TextBuffer::point_to_offset(Point point) const {
    point = clip_point(point);
    return lineStarts_[point.row] + point.column;
}

Point TextBuffer::offset_to_point(size_t offset) const {
    offset = std::min(offset, text_.size());
    // Last line start that is <= offset.
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    uint32_t row = static_cast<uint32_t>(std::distance(lineStarts_.begin(), it) - 1);
    return {row, static_cast<uint32_t>(offset - lineStarts_[row])};
}

Anchor TextBuffer::anchor_before(Point point) const {
    return {point_to_offset(point), Bias::Left};
}

Anchor TextBuffer::anchor_after(Point point) const {
    return {point_to_offset(point), Bias::Right};
}

Point TextBuffer::anchor_to_point(const Anchor& anchor) const {
    return offset_to_point(anchor.offset);
}

}  // namespace editor
