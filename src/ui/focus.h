#pragma once

#include <cstdint>
#include <memory>
#include <optional>

namespace ui {

class FocusManager;

using FocusId = uint64_t;

// Lightweight, copyable reference to a focusable element. Handles form a tree
// through their parent link so that focus inside a child (e.g. a submenu)
// counts as focus contained by the parent.
class FocusHandle {
public:
    FocusId id() const { return node_->id; }

    // True when this exact handle holds focus.
    bool is_focused() const;

    // True when this handle or any descendant holds focus.
    bool contains_focused() const;

    void focus() const;

    bool operator==(const FocusHandle& other) const {
        return node_ == other.node_;
    }
    bool operator!=(const FocusHandle& other) const {
        return !(*this == other);
    }

private:
    friend class FocusManager;

    struct State;
    struct Node {
        FocusId id = 0;
        std::weak_ptr<Node> parent;
        std::weak_ptr<State> manager;
    };

    explicit FocusHandle(std::shared_ptr<Node> node) : node_(std::move(node)) {}

    std::shared_ptr<Node> node_;
};

// One focus owner per window. All handles created here share its state; a
// handle outliving its manager reports no focus and ignores focus().
class FocusManager {
public:
    FocusManager();

    FocusManager(const FocusManager&) = delete;
    FocusManager& operator=(const FocusManager&) = delete;

    FocusHandle create_handle();
    FocusHandle create_child_handle(const FocusHandle& parent);

    void focus(const FocusHandle& handle);
    void blur();

    std::optional<FocusHandle> focused() const;

private:
    std::shared_ptr<FocusHandle::State> state_;
};

}  // namespace ui
