#include "context_menu.h"

namespace ui {

std::shared_ptr<ContextMenu> ContextMenu::build(FocusManager& focusManager,
                                                const BuildFn& fn) {
    std::shared_ptr<ContextMenu> menu(
        new ContextMenu(focusManager.create_handle()));
    if (fn) fn(*menu);
    return menu;
}

ContextMenu::ContextMenu(FocusHandle focusHandle)
    : focusHandle_(std::move(focusHandle)) {}

ContextMenu& ContextMenu::action(const std::string& label,
                                 actions::Action action) {
    items_.push_back(ContextMenuItem::item(label, std::move(action)));
    return *this;
}

ContextMenu& ContextMenu::disabled_action(const std::string& label,
                                          actions::Action action) {
    items_.push_back(ContextMenuItem::item(label, std::move(action), false));
    return *this;
}

ContextMenu& ContextMenu::separator() {
    items_.push_back(ContextMenuItem::separator());
    return *this;
}

ContextMenu& ContextMenu::when(bool condition, const BuildFn& fn) {
    if (condition && fn) fn(*this);
    return *this;
}

ContextMenu& ContextMenu::context(const FocusHandle& focus) {
    contextFocus_ = focus;
    return *this;
}

void ContextMenu::select_next() {
    int count = static_cast<int>(items_.size());
    for (int step = 1; step <= count; ++step) {
        int index = (selectedIndex_ + step + count) % count;
        if (items_[index].selectable()) {
            selectedIndex_ = index;
            return;
        }
    }
}

void ContextMenu::select_prev() {
    int count = static_cast<int>(items_.size());
    int start = selectedIndex_ < 0 ? count : selectedIndex_;
    for (int step = 1; step <= count; ++step) {
        int index = ((start - step) % count + count) % count;
        if (items_[index].selectable()) {
            selectedIndex_ = index;
            return;
        }
    }
}

std::optional<actions::Action> ContextMenu::confirm() {
    std::optional<actions::Action> chosen;
    if (selectedIndex_ >= 0 &&
        selectedIndex_ < static_cast<int>(items_.size()) &&
        items_[selectedIndex_].selectable()) {
        chosen = items_[selectedIndex_].action;
    }
    dismiss();
    return chosen;
}

void ContextMenu::cancel() { dismiss(); }

void ContextMenu::dismiss() {
    // A subscriber may release the last owner of this menu.
    auto self = shared_from_this();
    dismissed_ = true;
    selectedIndex_ = -1;
    dismissEmitter_.emit(DismissEvent{});
}

Subscription ContextMenu::on_dismiss(
    std::function<void(const DismissEvent&)> cb) {
    return dismissEmitter_.subscribe(std::move(cb));
}

}  // namespace ui
