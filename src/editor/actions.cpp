#include "actions.h"

namespace actions {

void to_json(nlohmann::json& j, const Action& action) {
    j = nlohmann::json{{"name", action.name}};
    if (!action.data.is_null()) {
        j["data"] = action.data;
    }
}

// Accepts either a bare name ("editor::Copy") or {"name": ..., "data": ...}.
void from_json(const nlohmann::json& j, Action& action) {
    if (j.is_string()) {
        action.name = j.get<std::string>();
        action.data = nullptr;
        return;
    }
    action.name = j.at("name").get<std::string>();
    action.data = j.contains("data") ? j.at("data") : nlohmann::json(nullptr);
}

Action rename() { return {"editor::Rename"}; }
Action go_to_definition() { return {"editor::GoToDefinition"}; }
Action go_to_type_definition() { return {"editor::GoToTypeDefinition"}; }
Action go_to_implementation() { return {"editor::GoToImplementation"}; }
Action find_all_references() { return {"editor::FindAllReferences"}; }

Action toggle_code_actions() {
    return {"editor::ToggleCodeActions",
            nlohmann::json{{"deployed_from_indicator", nullptr}}};
}

Action cut() { return {"editor::Cut"}; }
Action copy() { return {"editor::Copy"}; }
Action paste() { return {"editor::Paste"}; }
Action reveal_in_file_manager() { return {"editor::RevealInFileManager"}; }
Action open_in_terminal() { return {"workspace::OpenInTerminal"}; }
Action copy_permalink_to_line() { return {"editor::CopyPermalinkToLine"}; }
Action copy_file_line() { return {"editor::CopyFileLine"}; }

}  // namespace actions
