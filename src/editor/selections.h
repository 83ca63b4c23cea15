#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "text_buffer.h"

namespace editor {

// Granularity a pending selection extends by while dragging.
enum class SelectMode { Character, Word, Line, All };

struct Selection {
    uint64_t id = 0;
    Anchor start;
    Anchor end;
    bool reversed = false;  // head is at start

    bool is_empty() const { return start.offset == end.offset; }
    bool operator==(const Selection&) const = default;
};

struct PendingSelection {
    Selection selection;
    SelectMode mode = SelectMode::Character;

    bool operator==(const PendingSelection&) const = default;
};

using AnchorRange = std::pair<Anchor, Anchor>;

// Committed, sorted, non-overlapping selections plus at most one selection
// still being made (a drag in progress or a freshly placed caret).
class SelectionsCollection {
public:
    const std::vector<Selection>& disjoint() const { return disjoint_; }
    const std::optional<PendingSelection>& pending() const { return pending_; }

    size_t count() const { return disjoint_.size() + (pending_ ? 1 : 0); }

    void clear_disjoint() { disjoint_.clear(); }
    void clear_pending() { pending_.reset(); }

    // Reversed ranges (start after end) are normalized and marked reversed.
    void set_pending_anchor_range(Anchor start, Anchor end, SelectMode mode);

    // Replaces every selection. Ranges are sorted and overlapping ones merged
    // so the disjoint set stays non-overlapping.
    void select_anchor_ranges(std::vector<AnchorRange> ranges);

    bool operator==(const SelectionsCollection& other) const {
        return disjoint_ == other.disjoint_ && pending_ == other.pending_;
    }

private:
    Selection make_selection(Anchor start, Anchor end);

    uint64_t nextSelectionId_ = 1;
    std::vector<Selection> disjoint_;
    std::optional<PendingSelection> pending_;
};

}  // namespace editor
