#pragma once

#include <compare>
#include <cstdint>
#include <vector>

#include "text_buffer.h"

namespace editor {

// Position in the visual (soft-wrapped) row/column space used for hit-testing.
struct DisplayPoint {
    uint32_t row = 0;
    uint32_t column = 0;

    auto operator<=>(const DisplayPoint&) const = default;
};

// Half-open range [start, end).
struct DisplayRange {
    DisplayPoint start;
    DisplayPoint end;

    bool contains(const DisplayPoint& point) const {
        return start <= point && point < end;
    }
    bool is_empty() const { return !(start < end); }
    bool operator==(const DisplayRange&) const = default;
};

// Snapshot of buffer <-> display coordinate mapping. A wrap column of 0 means
// no soft wrap, making the mapping the identity on clipped points.
class DisplayMap {
public:
    DisplayMap(const TextBuffer& buffer, uint32_t wrapColumn);

    uint32_t wrap_column() const { return wrapColumn_; }
    uint32_t display_row_count() const;

    DisplayPoint to_display_point(Point point) const;
    Point to_point(DisplayPoint point) const;

    DisplayPoint anchor_to_display_point(const Anchor& anchor) const {
        return to_display_point(buffer_.anchor_to_point(anchor));
    }

private:
    uint32_t segments_in_row(uint32_t row) const;

    const TextBuffer& buffer_;
    uint32_t wrapColumn_;
    // First display row of every buffer row, plus a trailing total.
    std::vector<uint32_t> rowStarts_;
};

}  // namespace editor
