#include <argh.h>

#include <cstdio>
#include <filesystem>
#include <string>

#include <afterhours/src/plugins/files.h>

#include "logging.h"
#include "platform/host_platform.h"
#include "scenario/scenario.h"
#include "settings.h"

static void print_usage() {
    fprintf(stderr,
            "usage: quillpad <scenario.json> [--platform=macos|linux|windows]\n"
            "                [--log-level=debug|info|warning|error]\n"
            "                [--soft-wrap=<column>] [--no-save]\n");
}

int main(int argc, char* argv[]) {
    argh::parser cmdl(argc, argv);

    // Scenario path is the first positional argument
    std::string scenarioPath;
    cmdl(1, "") >> scenarioPath;

    if (cmdl[{"-h", "--help"}]) {
        print_usage();
        return 0;
    }
    if (scenarioPath.empty()) {
        print_usage();
        return 1;
    }

    // stdout carries the JSON report
    logging::setSink(stderr);
    afterhours::files::init("quillpad", "resources");

    auto& settings = Settings::get();
    settings.auto_save_enabled = false;
    settings.load_save_file();
    logging::setLevel(settings.get_log_level());

    scenario::RunOptions options;
    options.hostPlatform = settings.get_host_platform();
    options.softWrapColumn = settings.get_soft_wrap_column();

    // Flags override settings for this run only
    for (auto& [name, value] : cmdl.params()) {
        if (name == "platform") {
            auto parsed = platform::parse_host_platform(value);
            if (!parsed) {
                fprintf(stderr, "Error: unknown platform '%s'\n", value.c_str());
                return 1;
            }
            options.hostPlatform = *parsed;
        } else if (name == "log-level") {
            auto parsed = logging::parse_level(value);
            if (!parsed) {
                fprintf(stderr, "Error: unknown log level '%s'\n", value.c_str());
                return 1;
            }
            logging::setLevel(*parsed);
        } else if (name == "soft-wrap") {
            int column = 0;
            if (!(cmdl("soft-wrap") >> column) || column < 0) {
                fprintf(stderr, "Error: --soft-wrap expects a non-negative integer\n");
                return 1;
            }
            options.softWrapColumn = static_cast<uint32_t>(column);
        }
    }

    auto loaded = scenario::load_scenario_file(scenarioPath);
    if (!loaded.success()) {
        fprintf(stderr, "Error: %s\n", loaded.error.c_str());
        return 1;
    }

    LOG_INFO("Running scenario %s (platform=%s)", scenarioPath.c_str(),
             platform::host_platform_name(options.hostPlatform));
    auto report = scenario::run_scenario(*loaded.scenario, options);
    printf("%s\n", report.dump(2).c_str());

    if (!cmdl["--no-save"]) {
        settings.add_recent_scenario(
            std::filesystem::absolute(scenarioPath).string());
        settings.write_save_file();
    }
    return 0;
}
