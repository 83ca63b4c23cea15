#include "selections.h"

#include <algorithm>

namespace editor {

Selection SelectionsCollection::make_selection(Anchor start, Anchor end) {
    Selection selection;
    selection.id = nextSelectionId_++;
    if (end < start) {
        selection.start = end;
        selection.end = start;
        selection.reversed = true;
    } else {
        selection.start = start;
        selection.end = end;
    }
    return selection;
}

void SelectionsCollection::set_pending_anchor_range(Anchor start, Anchor end,
                                                    SelectMode mode) {
    pending_ = PendingSelection{make_selection(start, end), mode};
}

void SelectionsCollection::select_anchor_ranges(std::vector<AnchorRange> ranges) {
    pending_.reset();
    disjoint_.clear();

    std::vector<Selection> selections;
    selections.reserve(ranges.size());
    for (const auto& [start, end] : ranges) {
        selections.push_back(make_selection(start, end));
    }
    std::sort(selections.begin(), selections.end(),
              [](const Selection& a, const Selection& b) {
                  return a.start < b.start;
              });

    for (auto& selection : selections) {
        if (!disjoint_.empty()) {
            Selection& last = disjoint_.back();
            bool overlaps = selection.start.offset < last.end.offset ||
                            selection.start.offset == last.start.offset;
            if (overlaps) {
                if (last.end < selection.end) last.end = selection.end;
                continue;
            }
        }
        disjoint_.push_back(selection);
    }
}

}  // namespace editor
