#include "focus.h"

namespace ui {

struct FocusHandle::State {
    FocusId nextId = 1;
    std::weak_ptr<Node> focused;
};

bool FocusHandle::is_focused() const {
    auto state = node_->manager.lock();
    if (!state) return false;
    return state->focused.lock() == node_;
}

bool FocusHandle::contains_focused() const {
    auto state = node_->manager.lock();
    if (!state) return false;
    for (auto node = state->focused.lock(); node; node = node->parent.lock()) {
        if (node == node_) return true;
    }
    return false;
}

void FocusHandle::focus() const {
    if (auto state = node_->manager.lock()) {
        state->focused = node_;
    }
}

FocusManager::FocusManager() : state_(std::make_shared<FocusHandle::State>()) {}

FocusHandle FocusManager::create_handle() {
    auto node = std::make_shared<FocusHandle::Node>();
    node->id = state_->nextId++;
    node->manager = state_;
    return FocusHandle(std::move(node));
}

FocusHandle FocusManager::create_child_handle(const FocusHandle& parent) {
    FocusHandle handle = create_handle();
    handle.node_->parent = parent.node_;
    return handle;
}

void FocusManager::focus(const FocusHandle& handle) { handle.focus(); }

void FocusManager::blur() { state_->focused.reset(); }

std::optional<FocusHandle> FocusManager::focused() const {
    if (auto node = state_->focused.lock()) {
        return FocusHandle(std::move(node));
    }
    return std::nullopt;
}

}  // namespace ui
