// Unit tests for the editor's text model: TextBuffer, DisplayMap and
// SelectionsCollection.

#include "test_framework.h"
#include "../../src/editor/display_map.h"
#include "../../src/editor/selections.h"
#include "../../src/editor/text_buffer.h"

using editor::DisplayPoint;
using editor::Point;

// ===========================================================================
// TextBuffer
// ===========================================================================

TEST(buffer_splits_lines) {
    editor::TextBuffer buffer("ab\ncde\n");
    ASSERT_EQ(buffer.line_count(), 3u);
    ASSERT_EQ(buffer.line_len(0), 2u);
    ASSERT_EQ(buffer.line_len(1), 3u);
    ASSERT_EQ(buffer.line_len(2), 0u);
    ASSERT_TRUE(buffer.max_point() == (Point{2, 0}));
    ASSERT_STREQ(buffer.text(), "ab\ncde\n");
}

TEST(empty_buffer_has_one_line) {
    editor::TextBuffer buffer;
    ASSERT_EQ(buffer.line_count(), 1u);
    ASSERT_TRUE(buffer.max_point() == (Point{0, 0}));
}

TEST(point_offset_conversion) {
    editor::TextBuffer buffer("ab\ncde");
    ASSERT_EQ(buffer.point_to_offset({1, 2}), static_cast<size_t>(5));
    ASSERT_TRUE(buffer.offset_to_point(5) == (Point{1, 2}));
    ASSERT_TRUE(buffer.offset_to_point(3) == (Point{1, 0}));
    ASSERT_TRUE(buffer.offset_to_point(2) == (Point{0, 2}));
    ASSERT_TRUE(buffer.offset_to_point(100) == (Point{1, 3}));
}

TEST(clip_point_limits_row_and_column) {
    editor::TextBuffer buffer("ab\ncde");
    ASSERT_TRUE(buffer.clip_point({0, 9}) == (Point{0, 2}));
    ASSERT_TRUE(buffer.clip_point({7, 0}) == (Point{1, 3}));
}

TEST(anchor_bias) {
    editor::TextBuffer buffer("ab\ncde");
    auto before = buffer.anchor_before({1, 1});
    auto after = buffer.anchor_after({1, 1});
    ASSERT_EQ(before.offset, after.offset);
    ASSERT_TRUE(before.bias == editor::Bias::Left);
    ASSERT_TRUE(after.bias == editor::Bias::Right);
    ASSERT_TRUE(buffer.anchor_to_point(before) == (Point{1, 1}));
}

// ===========================================================================
// DisplayMap
// ===========================================================================

TEST(no_wrap_is_identity) {
    editor::TextBuffer buffer("hello\nworld");
    editor::DisplayMap map(buffer, 0);
    ASSERT_TRUE(map.to_display_point({1, 3}) == (DisplayPoint{1, 3}));
    ASSERT_TRUE(map.to_point({1, 3}) == (Point{1, 3}));
    ASSERT_EQ(map.display_row_count(), 2u);
}

TEST(soft_wrap_splits_long_rows) {
    editor::TextBuffer buffer("abcdefghij1234\nxy");
    editor::DisplayMap map(buffer, 5);
    // Row 0 has 14 bytes -> 3 display rows.
    ASSERT_EQ(map.display_row_count(), 4u);
    ASSERT_TRUE(map.to_display_point({0, 7}) == (DisplayPoint{1, 2}));
    ASSERT_TRUE(map.to_display_point({0, 14}) == (DisplayPoint{2, 4}));
    ASSERT_TRUE(map.to_display_point({1, 1}) == (DisplayPoint{3, 1}));
    ASSERT_TRUE(map.to_point({1, 2}) == (Point{0, 7}));
    ASSERT_TRUE(map.to_point({3, 1}) == (Point{1, 1}));
}

TEST(wrapped_line_end_stays_on_last_segment) {
    editor::TextBuffer buffer("abcdefghij\nz");
    editor::DisplayMap map(buffer, 5);
    ASSERT_TRUE(map.to_display_point({0, 10}) == (DisplayPoint{1, 5}));
    ASSERT_TRUE(map.to_point({1, 5}) == (Point{0, 10}));
    ASSERT_TRUE(map.to_display_point({1, 0}) == (DisplayPoint{2, 0}));
}

TEST(display_points_past_end_clip) {
    editor::TextBuffer buffer("abcdefgh\nz");
    editor::DisplayMap map(buffer, 4);
    ASSERT_TRUE(map.to_point({9, 9}) == (Point{1, 1}));
    ASSERT_TRUE(map.to_point({2, 9}) == (Point{1, 1}));
}

TEST(past_end_of_wrapped_segment_stays_on_its_row) {
    editor::TextBuffer buffer("abcdefghij\nz");
    editor::DisplayMap map(buffer, 5);
    ASSERT_TRUE(map.to_point({0, 7}) == (Point{0, 4}));
    ASSERT_TRUE(map.to_display_point(map.to_point({0, 7})) == (DisplayPoint{0, 4}));
    // The last segment may still reach the line end.
    ASSERT_TRUE(map.to_point({1, 7}) == (Point{0, 10}));
}

TEST(display_range_is_half_open) {
    editor::DisplayRange range{{1, 2}, {1, 5}};
    ASSERT_TRUE(range.contains({1, 2}));
    ASSERT_TRUE(range.contains({1, 4}));
    ASSERT_FALSE(range.contains({1, 5}));
    ASSERT_FALSE(range.contains({0, 9}));

    editor::DisplayRange empty{{1, 2}, {1, 2}};
    ASSERT_TRUE(empty.is_empty());
    ASSERT_FALSE(empty.contains({1, 2}));
}

TEST(multi_row_range_contains_middle_rows) {
    editor::DisplayRange range{{0, 8}, {2, 1}};
    ASSERT_TRUE(range.contains({1, 0}));
    ASSERT_TRUE(range.contains({1, 100}));
    ASSERT_FALSE(range.contains({0, 7}));
}

// ===========================================================================
// SelectionsCollection
// ===========================================================================

static editor::Anchor at(size_t offset) { return {offset, editor::Bias::Left}; }

TEST(select_ranges_sorts_and_merges_overlaps) {
    editor::SelectionsCollection s;
    s.select_anchor_ranges({{at(10), at(12)}, {at(0), at(4)}, {at(3), at(6)}});

    ASSERT_EQ(s.disjoint().size(), static_cast<size_t>(2));
    ASSERT_EQ(s.disjoint()[0].start.offset, static_cast<size_t>(0));
    ASSERT_EQ(s.disjoint()[0].end.offset, static_cast<size_t>(6));
    ASSERT_EQ(s.disjoint()[1].start.offset, static_cast<size_t>(10));
    ASSERT_FALSE(s.pending().has_value());
}

TEST(select_ranges_keeps_touching_ranges_separate) {
    editor::SelectionsCollection s;
    s.select_anchor_ranges({{at(0), at(4)}, {at(4), at(6)}});
    ASSERT_EQ(s.disjoint().size(), static_cast<size_t>(2));
}

TEST(select_ranges_dedupes_carets) {
    editor::SelectionsCollection s;
    s.select_anchor_ranges({{at(3), at(3)}, {at(3), at(3)}});
    ASSERT_EQ(s.disjoint().size(), static_cast<size_t>(1));
}

TEST(reversed_range_is_normalized) {
    editor::SelectionsCollection s;
    s.select_anchor_ranges({{at(8), at(2)}});
    ASSERT_EQ(s.disjoint()[0].start.offset, static_cast<size_t>(2));
    ASSERT_EQ(s.disjoint()[0].end.offset, static_cast<size_t>(8));
    ASSERT_TRUE(s.disjoint()[0].reversed);
}

TEST(pending_range_set_and_cleared) {
    editor::SelectionsCollection s;
    s.set_pending_anchor_range(at(5), at(5), editor::SelectMode::Character);
    ASSERT_TRUE(s.pending().has_value());
    ASSERT_TRUE(s.pending()->selection.is_empty());
    ASSERT_TRUE(s.pending()->mode == editor::SelectMode::Character);
    ASSERT_EQ(s.count(), static_cast<size_t>(1));

    s.clear_pending();
    ASSERT_EQ(s.count(), static_cast<size_t>(0));
}

TEST(clear_disjoint_keeps_pending) {
    editor::SelectionsCollection s;
    s.select_anchor_ranges({{at(0), at(1)}, {at(4), at(5)}});
    s.set_pending_anchor_range(at(7), at(9), editor::SelectMode::Line);
    s.clear_disjoint();
    ASSERT_TRUE(s.disjoint().empty());
    ASSERT_TRUE(s.pending().has_value());
}

TEST(selection_ids_are_unique) {
    editor::SelectionsCollection s;
    s.select_anchor_ranges({{at(0), at(1)}, {at(4), at(5)}});
    s.set_pending_anchor_range(at(7), at(9), editor::SelectMode::Character);
    ASSERT_NE(s.disjoint()[0].id, s.disjoint()[1].id);
    ASSERT_NE(s.disjoint()[1].id, s.pending()->selection.id);
}

// ===========================================================================

int main() {
    printf("=== selections tests ===\n");
    RUN_ALL_TESTS();
}
