#include "mouse_context_menu.h"

#include <algorithm>
#include <optional>

#include "../logging.h"
#include "actions.h"

namespace editor {

MouseContextMenu::MouseContextMenu(ScreenPoint position,
                                   std::shared_ptr<ui::ContextMenu> contextMenu,
                                   Editor& editor)
    : position_(position), contextMenu_(std::move(contextMenu)) {
    ui::FocusHandle menuFocus = contextMenu_->focus_handle();
    menuFocus.focus();

    Editor* owner = &editor;
    subscription_ = contextMenu_->on_dismiss(
        [owner, menuFocus](const ui::DismissEvent&) {
            LOG_DEBUG("context menu dismissed");
            // Destroys this MouseContextMenu, including the subscription
            // delivering the event.
            owner->mouseContextMenu_.reset();
            // Focus that already moved elsewhere (another panel opened by the
            // chosen action) is left alone.
            if (menuFocus.contains_focused()) {
                owner->focus();
            }
        });
}

std::vector<DisplayRange> display_ranges(const DisplayMap& displayMap,
                                         const SelectionsCollection& selections) {
    std::vector<DisplayRange> ranges;
    ranges.reserve(selections.count());
    auto push = [&](const Selection& s) {
        ranges.push_back({displayMap.anchor_to_display_point(s.start),
                          displayMap.anchor_to_display_point(s.end)});
    };
    for (const auto& selection : selections.disjoint()) push(selection);
    if (selections.pending()) push(selections.pending()->selection);
    return ranges;
}

void add_default_context_menu_entries(ui::ContextMenu& menu,
                                      platform::HostPlatform hostPlatform) {
    bool isMac = hostPlatform == platform::HostPlatform::MacOS;
    menu.action("Rename Symbol", actions::rename())
        .action("Go to Definition", actions::go_to_definition())
        .action("Go to Type Definition", actions::go_to_type_definition())
        .action("Go to Implementation", actions::go_to_implementation())
        .action("Find All References", actions::find_all_references())
        .action("Code Actions", actions::toggle_code_actions())
        .separator()
        .action("Cut", actions::cut())
        .action("Copy", actions::copy())
        .action("Paste", actions::paste())
        .separator()
        .when(isMac,
              [](ui::ContextMenu& m) {
                  m.action("Reveal in Finder", actions::reveal_in_file_manager());
              })
        .when(!isMac,
              [](ui::ContextMenu& m) {
                  m.action("Reveal in File Manager",
                           actions::reveal_in_file_manager());
              })
        .action("Open in Terminal", actions::open_in_terminal())
        .action("Copy Permalink", actions::copy_permalink_to_line())
        .action("Copy File:Line", actions::copy_file_line());
}

void deploy_context_menu(Editor& editor, ScreenPoint position,
                         DisplayPoint point) {
    // Actions dispatched from the menu must target this editor.
    if (!editor.is_focused()) {
        editor.focus();
    }

    // Inline and single-line editors never get a context menu.
    if (editor.mode() != EditorMode::Full) {
        return;
    }

    std::shared_ptr<ui::ContextMenu> contextMenu;
    if (editor.customContextMenu_) {
        // The slot stays empty while the builder runs.
        CustomContextMenuBuilder custom = std::move(editor.customContextMenu_);
        editor.customContextMenu_ = nullptr;
        try {
            contextMenu = custom(editor, point);
        } catch (...) {
            // Put the builder back before the error reaches the caller.
            editor.customContextMenu_ = std::move(custom);
            throw;
        }
        editor.customContextMenu_ = std::move(custom);
        if (!contextMenu) {
            return;
        }
    } else {
        // Without a project none of the default commands can run.
        if (!editor.project()) {
            return;
        }

        DisplayMap displayMap = editor.display_map();
        Anchor anchor = editor.buffer().anchor_before(displayMap.to_point(point));
        auto ranges = display_ranges(displayMap, editor.selections());
        bool clickedInsideSelection =
            std::any_of(ranges.begin(), ranges.end(),
                        [&](const DisplayRange& r) { return r.contains(point); });
        if (!clickedInsideSelection) {
            // Move the caret to the click so dispatched actions apply there.
            editor.change_selections([&](SelectionsCollection& s) {
                s.clear_disjoint();
                s.set_pending_anchor_range(anchor, anchor, SelectMode::Character);
            });
        }

        std::optional<ui::FocusHandle> focused = editor.focus_manager().focused();
        platform::HostPlatform hostPlatform = editor.host_platform();
        contextMenu = ui::ContextMenu::build(
            editor.focus_manager(), [&](ui::ContextMenu& menu) {
                add_default_context_menu_entries(menu, hostPlatform);
                if (focused) {
                    menu.context(*focused);
                }
            });
    }

    auto mouseContextMenu = std::make_unique<MouseContextMenu>(
        position, std::move(contextMenu), editor);
    // The previous menu (if any) unsubscribes before the new one is stored.
    editor.mouseContextMenu_.reset();
    editor.mouseContextMenu_ = std::move(mouseContextMenu);
    LOG_DEBUG("context menu deployed at (%.1f, %.1f), %zu entries", position.x,
              position.y, editor.mouseContextMenu_->context_menu()->items().size());
    editor.notify();
}

}  // namespace editor
