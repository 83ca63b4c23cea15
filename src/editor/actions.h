#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace actions {

// Opaque command identifier handed to the dispatch layer unchanged. `data`
// carries the action's parameters in the same JSON shape a keymap uses.
struct Action {
    std::string name;
    nlohmann::json data = nullptr;

    bool operator==(const Action& other) const {
        return name == other.name && data == other.data;
    }
    bool operator!=(const Action& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const Action& action);
void from_json(const nlohmann::json& j, Action& action);

// Editor commands offered by the mouse context menu.
Action rename();
Action go_to_definition();
Action go_to_type_definition();
Action go_to_implementation();
Action find_all_references();
Action toggle_code_actions();
Action cut();
Action copy();
Action paste();
Action reveal_in_file_manager();
Action open_in_terminal();
Action copy_permalink_to_line();
Action copy_file_line();

}  // namespace actions
