#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../editor/editor.h"
#include "../platform/host_platform.h"
#include "../ui/context_menu.h"

// Scripted right-click sessions: an editor description plus a list of steps,
// replayed against the context menu core. Backs the quillpad CLI.
namespace scenario {

struct SelectionSpec {
    editor::Point start;
    editor::Point end;
};

// Stand-in for a caller-registered custom menu builder.
struct CustomMenuSpec {
    bool declines = false;
    std::vector<ui::ContextMenuItem> entries;
};

struct Step {
    enum class Kind { Deploy, Dismiss, Confirm, SelectNext, SelectPrev, FocusElsewhere };

    Kind kind = Kind::Deploy;
    editor::ScreenPoint position;  // Deploy only
    editor::DisplayPoint point;    // Deploy only
};

struct Scenario {
    std::string text;
    editor::EditorMode mode = editor::EditorMode::Full;
    std::optional<std::string> projectRoot;
    std::optional<uint32_t> softWrapColumn;
    std::optional<platform::HostPlatform> hostPlatform;
    std::vector<SelectionSpec> selections;
    std::optional<CustomMenuSpec> customMenu;
    std::vector<Step> steps;
};

struct ScenarioLoadResult {
    std::optional<Scenario> scenario;
    std::string error;
    bool success() const { return scenario.has_value(); }
};

// Defaults for values a scenario leaves unset (normally from Settings).
struct RunOptions {
    platform::HostPlatform hostPlatform = platform::current_host_platform();
    uint32_t softWrapColumn = 0;
};

ScenarioLoadResult parse_scenario(const nlohmann::json& j);
ScenarioLoadResult load_scenario_file(const std::string& path);

// Replays every step and reports the final editor/menu state as JSON.
nlohmann::json run_scenario(const Scenario& scenario, const RunOptions& options);

}  // namespace scenario
