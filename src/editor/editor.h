#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "../platform/host_platform.h"
#include "../ui/context_menu.h"
#include "../ui/focus.h"
#include "display_map.h"
#include "selections.h"
#include "text_buffer.h"

namespace editor {

// Full is the primary editing view; the others are restricted embedded
// editors (single-line inputs, auto-growing inline editors).
enum class EditorMode { SingleLine, AutoHeight, Full };

// Window-space position in pixels.
struct ScreenPoint {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const ScreenPoint&) const = default;
};

// Workspace the editor belongs to. Project-level commands (reveal, open in
// terminal, permalinks) need one.
struct Project {
    std::string rootPath;
};

class Editor;
class MouseContextMenu;

// Optional per-editor replacement for the default context menu. Returning
// nullptr means "no menu for this point".
using CustomContextMenuBuilder =
    std::function<std::shared_ptr<ui::ContextMenu>(Editor&, DisplayPoint)>;

class Editor {
public:
    Editor(ui::FocusManager& focusManager, std::shared_ptr<TextBuffer> buffer,
           EditorMode mode = EditorMode::Full);
    ~Editor();

    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    EditorMode mode() const { return mode_; }

    const TextBuffer& buffer() const { return *buffer_; }
    // Snapshot of the coordinate mapping; valid while the editor lives.
    DisplayMap display_map() const { return DisplayMap(*buffer_, softWrapColumn_); }
    void set_soft_wrap_column(uint32_t column) { softWrapColumn_ = column; }

    const std::shared_ptr<Project>& project() const { return project_; }
    void set_project(std::shared_ptr<Project> project) {
        project_ = std::move(project);
    }

    platform::HostPlatform host_platform() const { return hostPlatform_; }
    void set_host_platform(platform::HostPlatform p) { hostPlatform_ = p; }

    // --- Focus ---
    ui::FocusManager& focus_manager() { return focusManager_; }
    const ui::FocusHandle& focus_handle() const { return focusHandle_; }
    bool is_focused() const { return focusHandle_.is_focused(); }
    void focus() { focusHandle_.focus(); }

    // --- Selections ---
    const SelectionsCollection& selections() const { return selections_; }
    void change_selections(const std::function<void(SelectionsCollection&)>& fn);

    // --- Context menu ---
    void set_custom_context_menu(CustomContextMenuBuilder builder) {
        customContextMenu_ = std::move(builder);
    }
    void clear_custom_context_menu() { customContextMenu_ = nullptr; }
    bool has_custom_context_menu() const {
        return static_cast<bool>(customContextMenu_);
    }
    const MouseContextMenu* mouse_context_menu() const {
        return mouseContextMenu_.get();
    }

    // Re-render request.
    void notify();
    uint64_t notify_count() const { return notifyCount_; }
    void set_on_notify(std::function<void()> cb) { onNotify_ = std::move(cb); }

private:
    friend class MouseContextMenu;
    friend void deploy_context_menu(Editor& editor, ScreenPoint position,
                                    DisplayPoint point);

    ui::FocusManager& focusManager_;
    ui::FocusHandle focusHandle_;
    std::shared_ptr<TextBuffer> buffer_;
    EditorMode mode_;
    uint32_t softWrapColumn_ = 0;
    std::shared_ptr<Project> project_;
    platform::HostPlatform hostPlatform_ = platform::current_host_platform();
    SelectionsCollection selections_;
    CustomContextMenuBuilder customContextMenu_;
    uint64_t notifyCount_ = 0;
    std::function<void()> onNotify_;
    // Declared last: torn down (unsubscribing) before anything it refers to.
    std::unique_ptr<MouseContextMenu> mouseContextMenu_;
};

}  // namespace editor
