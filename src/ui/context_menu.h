#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../editor/actions.h"
#include "focus.h"
#include "subscription.h"

namespace ui {

struct ContextMenuItem {
    std::string label;
    std::optional<actions::Action> action;
    bool enabled = true;
    bool isSeparator = false;

    static ContextMenuItem separator() {
        return {"", std::nullopt, true, true};
    }

    static ContextMenuItem item(const std::string& label,
                                actions::Action action,
                                bool enabled = true) {
        return {label, std::move(action), enabled, false};
    }

    bool selectable() const { return !isSeparator && enabled; }
};

// Fired when the menu closes: an entry was confirmed, the menu was cancelled
// (escape), or the host closed it (click outside).
struct DismissEvent {};

// Popup menu built once through a fluent builder. Always held through a
// shared_ptr so dismissal can safely drop the last external owner.
class ContextMenu : public std::enable_shared_from_this<ContextMenu> {
public:
    using BuildFn = std::function<void(ContextMenu&)>;

    static std::shared_ptr<ContextMenu> build(FocusManager& focusManager,
                                              const BuildFn& fn);

    ContextMenu(const ContextMenu&) = delete;
    ContextMenu& operator=(const ContextMenu&) = delete;

    // --- Builder ---
    ContextMenu& action(const std::string& label, actions::Action action);
    ContextMenu& disabled_action(const std::string& label,
                                 actions::Action action);
    ContextMenu& separator();
    ContextMenu& when(bool condition, const BuildFn& fn);
    // Focus scope actions from this menu are dispatched against.
    ContextMenu& context(const FocusHandle& focus);

    // --- State ---
    const std::vector<ContextMenuItem>& items() const { return items_; }
    const std::optional<FocusHandle>& context_focus() const {
        return contextFocus_;
    }
    const FocusHandle& focus_handle() const { return focusHandle_; }
    int selected_index() const { return selectedIndex_; }
    bool is_dismissed() const { return dismissed_; }

    // --- Interaction ---
    void select_next();
    void select_prev();
    // Returns the selected entry's action (if any) and dismisses the menu.
    std::optional<actions::Action> confirm();
    void cancel();
    void dismiss();

    [[nodiscard]] Subscription on_dismiss(
        std::function<void(const DismissEvent&)> cb);

private:
    explicit ContextMenu(FocusHandle focusHandle);

    FocusHandle focusHandle_;
    std::optional<FocusHandle> contextFocus_;
    std::vector<ContextMenuItem> items_;
    int selectedIndex_ = -1;
    bool dismissed_ = false;
    EventEmitter<DismissEvent> dismissEmitter_;
};

}  // namespace ui
