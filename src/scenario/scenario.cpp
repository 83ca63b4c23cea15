#include "scenario.h"

#include <fstream>
#include <limits>
#include <stdexcept>

#include "../editor/mouse_context_menu.h"
#include "../logging.h"

namespace scenario {

namespace {

using nlohmann::json;

uint32_t parse_coordinate(const json& value, const char* what) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(std::string(what) +
                                    " must be an integer in [0, 4294967295]");
    }
    return static_cast<uint32_t>(value.get<int64_t>());
}

editor::Point parse_point(const json& j, const char* what) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument(std::string(what) + " must be [row, column]");
    }
    return {parse_coordinate(j[0], what), parse_coordinate(j[1], what)};
}

editor::ScreenPoint parse_screen_point(const json& j) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() ||
        !j[1].is_number()) {
        throw std::invalid_argument("position must be [x, y]");
    }
    return {j[0].get<float>(), j[1].get<float>()};
}

editor::EditorMode parse_mode(const std::string& name) {
    if (name == "full") return editor::EditorMode::Full;
    if (name == "single_line") return editor::EditorMode::SingleLine;
    if (name == "auto_height") return editor::EditorMode::AutoHeight;
    throw std::invalid_argument("unknown editor mode '" + name + "'");
}

CustomMenuSpec parse_custom_menu(const json& j) {
    CustomMenuSpec spec;
    if (j.is_string()) {
        if (j.get<std::string>() != "decline") {
            throw std::invalid_argument("custom_menu string must be \"decline\"");
        }
        spec.declines = true;
        return spec;
    }
    for (const auto& entry : j.at("entries")) {
        if (entry.value("separator", false)) {
            spec.entries.push_back(ui::ContextMenuItem::separator());
            continue;
        }
        spec.entries.push_back(ui::ContextMenuItem::item(
            entry.at("label").get<std::string>(),
            entry.at("action").get<actions::Action>(),
            entry.value("enabled", true)));
    }
    return spec;
}

Step parse_step(const json& j) {
    if (!j.is_object() || j.size() != 1) {
        throw std::invalid_argument("each step must be an object with one key");
    }
    const std::string& key = j.begin().key();
    Step step;
    if (key == "deploy") {
        const json& args = j.begin().value();
        step.kind = Step::Kind::Deploy;
        step.position = parse_screen_point(args.at("position"));
        editor::Point p = parse_point(args.at("point"), "point");
        step.point = {p.row, p.column};
    } else if (key == "dismiss") {
        step.kind = Step::Kind::Dismiss;
    } else if (key == "confirm") {
        step.kind = Step::Kind::Confirm;
    } else if (key == "select_next") {
        step.kind = Step::Kind::SelectNext;
    } else if (key == "select_prev") {
        step.kind = Step::Kind::SelectPrev;
    } else if (key == "focus_elsewhere") {
        step.kind = Step::Kind::FocusElsewhere;
    } else {
        throw std::invalid_argument("unknown step '" + key + "'");
    }
    return step;
}

json point_to_json(editor::Point p) { return json::array({p.row, p.column}); }

const char* select_mode_name(editor::SelectMode mode) {
    switch (mode) {
        case editor::SelectMode::Character: return "character";
        case editor::SelectMode::Word: return "word";
        case editor::SelectMode::Line: return "line";
        case editor::SelectMode::All: return "all";
    }
    return "character";
}

json selection_to_json(const editor::TextBuffer& buffer,
                       const editor::Selection& s) {
    return {{"start", point_to_json(buffer.anchor_to_point(s.start))},
            {"end", point_to_json(buffer.anchor_to_point(s.end))},
            {"reversed", s.reversed}};
}

json menu_to_json(const editor::MouseContextMenu& mouseMenu,
                  const editor::Editor& ed) {
    const auto& menu = *mouseMenu.context_menu();
    json entries = json::array();
    for (const auto& item : menu.items()) {
        if (item.isSeparator) {
            entries.push_back(json{{"separator", true}});
            continue;
        }
        json entry = {{"label", item.label}, {"enabled", item.enabled}};
        if (item.action) entry["action"] = *item.action;
        entries.push_back(std::move(entry));
    }

    json contextFocus = nullptr;
    if (menu.context_focus()) {
        contextFocus = *menu.context_focus() == ed.focus_handle() ? "editor"
                                                                  : "other";
    }
    return {{"position", json::array({mouseMenu.position().x,
                                      mouseMenu.position().y})},
            {"entries", std::move(entries)},
            {"context_focus", std::move(contextFocus)},
            {"selected_index", menu.selected_index()}};
}

}  // namespace

ScenarioLoadResult parse_scenario(const nlohmann::json& j) {
    ScenarioLoadResult result;
    try {
        if (!j.is_object()) {
            throw std::invalid_argument("scenario must be a JSON object");
        }
        Scenario s;
        s.text = j.value("text", std::string{});
        s.mode = parse_mode(j.value("mode", std::string{"full"}));

        if (j.contains("project") && !j.at("project").is_null()) {
            s.projectRoot = j.at("project").get<std::string>();
        }
        if (j.contains("soft_wrap_column")) {
            s.softWrapColumn =
                parse_coordinate(j.at("soft_wrap_column"), "soft_wrap_column");
        }
        if (j.contains("platform")) {
            auto name = j.at("platform").get<std::string>();
            s.hostPlatform = platform::parse_host_platform(name);
            if (!s.hostPlatform) {
                throw std::invalid_argument("unknown platform '" + name + "'");
            }
        }
        json selectionList = j.contains("selections") ? j.at("selections") : json::array();
        for (const auto& sel : selectionList) {
            s.selections.push_back({parse_point(sel.at("start"), "selection start"),
                                    parse_point(sel.at("end"), "selection end")});
        }
        if (j.contains("custom_menu") && !j.at("custom_menu").is_null()) {
            s.customMenu = parse_custom_menu(j.at("custom_menu"));
        }
        json stepList = j.contains("steps") ? j.at("steps") : json::array();
        for (const auto& step : stepList) {
            s.steps.push_back(parse_step(step));
        }
        result.scenario = std::move(s);
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

ScenarioLoadResult load_scenario_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        ScenarioLoadResult result;
        result.error = "cannot open scenario file: " + path;
        return result;
    }
    try {
        return parse_scenario(nlohmann::json::parse(f));
    } catch (const nlohmann::json::exception& e) {
        ScenarioLoadResult result;
        result.error = std::string("invalid JSON in ") + path + ": " + e.what();
        return result;
    }
}

nlohmann::json run_scenario(const Scenario& s, const RunOptions& options) {
    ui::FocusManager focusManager;
    auto buffer = std::make_shared<editor::TextBuffer>(s.text);
    editor::Editor ed(focusManager, buffer, s.mode);
    ed.set_host_platform(s.hostPlatform.value_or(options.hostPlatform));
    ed.set_soft_wrap_column(s.softWrapColumn.value_or(options.softWrapColumn));
    if (s.projectRoot) {
        ed.set_project(std::make_shared<editor::Project>(
            editor::Project{*s.projectRoot}));
    }

    if (!s.selections.empty()) {
        std::vector<editor::AnchorRange> ranges;
        for (const auto& sel : s.selections) {
            ranges.emplace_back(buffer->anchor_before(sel.start),
                                buffer->anchor_before(sel.end));
        }
        ed.change_selections(
            [&](editor::SelectionsCollection& c) { c.select_anchor_ranges(ranges); });
    }

    if (s.customMenu) {
        CustomMenuSpec spec = *s.customMenu;
        ed.set_custom_context_menu(
            [spec](editor::Editor& e, editor::DisplayPoint)
                -> std::shared_ptr<ui::ContextMenu> {
                if (spec.declines) return nullptr;
                return ui::ContextMenu::build(
                    e.focus_manager(), [&](ui::ContextMenu& menu) {
                        for (const auto& entry : spec.entries) {
                            if (entry.isSeparator) {
                                menu.separator();
                            } else if (!entry.enabled) {
                                menu.disabled_action(entry.label, *entry.action);
                            } else {
                                menu.action(entry.label, *entry.action);
                            }
                        }
                    });
            });
    }

    ui::FocusHandle elsewhere = focusManager.create_handle();
    json confirmed = json::array();
    // Notifications from setting up the initial state are not part of the run.
    uint64_t baseNotifyCount = ed.notify_count();

    for (const auto& step : s.steps) {
        const editor::MouseContextMenu* open = ed.mouse_context_menu();
        switch (step.kind) {
            case Step::Kind::Deploy:
                editor::deploy_context_menu(ed, step.position, step.point);
                break;
            case Step::Kind::Dismiss:
                if (open) open->context_menu()->dismiss();
                break;
            case Step::Kind::Confirm:
                if (open) {
                    if (auto action = open->context_menu()->confirm()) {
                        confirmed.push_back(*action);
                    }
                }
                break;
            case Step::Kind::SelectNext:
                if (open) open->context_menu()->select_next();
                break;
            case Step::Kind::SelectPrev:
                if (open) open->context_menu()->select_prev();
                break;
            case Step::Kind::FocusElsewhere:
                elsewhere.focus();
                break;
        }
    }

    json selections = json::array();
    for (const auto& sel : ed.selections().disjoint()) {
        selections.push_back(selection_to_json(ed.buffer(), sel));
    }
    json pending = nullptr;
    if (const auto& p = ed.selections().pending()) {
        pending = selection_to_json(ed.buffer(), p->selection);
        pending["mode"] = select_mode_name(p->mode);
    }

    json report;
    report["menu_open"] = ed.mouse_context_menu() != nullptr;
    report["menu"] = ed.mouse_context_menu()
                         ? menu_to_json(*ed.mouse_context_menu(), ed)
                         : json(nullptr);
    report["selections"] = json{{"disjoint", std::move(selections)},
                                {"pending", std::move(pending)}};
    report["editor_focused"] = ed.is_focused();
    report["custom_menu_registered"] = ed.has_custom_context_menu();
    report["notify_count"] = ed.notify_count() - baseNotifyCount;
    report["confirmed_actions"] = std::move(confirmed);
    LOG_DEBUG("scenario finished with %zu steps", s.steps.size());
    return report;
}

}  // namespace scenario
