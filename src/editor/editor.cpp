#include "editor.h"

#include "mouse_context_menu.h"

namespace editor {

Editor::Editor(ui::FocusManager& focusManager,
               std::shared_ptr<TextBuffer> buffer, EditorMode mode)
    : focusManager_(focusManager),
      focusHandle_(focusManager.create_handle()),
      buffer_(buffer ? std::move(buffer) : std::make_shared<TextBuffer>()),
      mode_(mode) {}

Editor::~Editor() = default;

void Editor::change_selections(
    const std::function<void(SelectionsCollection&)>& fn) {
    fn(selections_);
    notify();
}

void Editor::notify() {
    ++notifyCount_;
    if (onNotify_) onNotify_();
}

}  // namespace editor
