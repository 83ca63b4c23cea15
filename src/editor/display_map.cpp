#include "display_map.h"

#include <algorithm>

namespace editor {

DisplayMap::DisplayMap(const TextBuffer& buffer, uint32_t wrapColumn)
    : buffer_(buffer), wrapColumn_(wrapColumn) {
    rowStarts_.reserve(buffer_.line_count() + 1);
    uint32_t displayRow = 0;
    for (uint32_t row = 0; row < buffer_.line_count(); ++row) {
        rowStarts_.push_back(displayRow);
        displayRow += segments_in_row(row);
    }
    rowStarts_.push_back(displayRow);
}

uint32_t DisplayMap::segments_in_row(uint32_t row) const {
    uint32_t len = buffer_.line_len(row);
    if (wrapColumn_ == 0 || len == 0) return 1;
    return (len + wrapColumn_ - 1) / wrapColumn_;
}

uint32_t DisplayMap::display_row_count() const { return rowStarts_.back(); }

DisplayPoint DisplayMap::to_display_point(Point point) const {
    point = buffer_.clip_point(point);
    if (wrapColumn_ == 0) return {point.row, point.column};

    uint32_t segment = point.column / wrapColumn_;
    uint32_t column = point.column % wrapColumn_;
    // End of a line whose length is a multiple of the wrap column stays on
    // the last segment instead of opening an empty one.
    if (segment > 0 && segment >= segments_in_row(point.row)) {
        segment -= 1;
        column += wrapColumn_;
    }
    return {rowStarts_[point.row] + segment, column};
}

Point DisplayMap::to_point(DisplayPoint point) const {
    if (wrapColumn_ == 0) {
        return buffer_.clip_point({point.row, point.column});
    }
    if (point.row >= display_row_count()) return buffer_.max_point();

    auto rowsEnd = rowStarts_.end() - 1;
    auto it = std::upper_bound(rowStarts_.begin(), rowsEnd, point.row);
    uint32_t row = static_cast<uint32_t>(std::distance(rowStarts_.begin(), it) - 1);
    uint32_t segment = point.row - rowStarts_[row];
    // Past the end of a wrapped segment clamps to its last column; column
    // wrapColumn_ there already belongs to the next display row.
    bool lastSegment = segment + 1 >= segments_in_row(row);
    uint32_t maxColumn = lastSegment ? wrapColumn_ : wrapColumn_ - 1;
    uint32_t column = segment * wrapColumn_ + std::min(point.column, maxColumn);
    return buffer_.clip_point({row, column});
}

}  // namespace editor
