#pragma once

#include <memory>
#include <vector>

#include "../ui/context_menu.h"
#include "../ui/subscription.h"
#include "display_map.h"
#include "editor.h"
#include "selections.h"

namespace editor {

// The one context menu currently open on an editor. Owned by the editor's
// slot; dropping it drops the dismiss subscription with it.
class MouseContextMenu {
public:
    // Moves focus into the menu and subscribes to its dismissal.
    MouseContextMenu(ScreenPoint position,
                     std::shared_ptr<ui::ContextMenu> contextMenu,
                     Editor& editor);

    MouseContextMenu(const MouseContextMenu&) = delete;
    MouseContextMenu& operator=(const MouseContextMenu&) = delete;

    ScreenPoint position() const { return position_; }
    const std::shared_ptr<ui::ContextMenu>& context_menu() const {
        return contextMenu_;
    }

private:
    ScreenPoint position_;
    std::shared_ptr<ui::ContextMenu> contextMenu_;
    ui::Subscription subscription_;
};

// Every selection (disjoint, then pending) as a display-space range.
std::vector<DisplayRange> display_ranges(const DisplayMap& displayMap,
                                         const SelectionsCollection& selections);

// Default entries, in their fixed order, for the given platform.
void add_default_context_menu_entries(ui::ContextMenu& menu,
                                      platform::HostPlatform hostPlatform);

// Handles a secondary click at `position` resolving to `point`. Ineligible
// editors (not Full mode, no project on the default path, custom builder
// declining) get no menu and no selection change.
void deploy_context_menu(Editor& editor, ScreenPoint position,
                         DisplayPoint point);

}  // namespace editor
