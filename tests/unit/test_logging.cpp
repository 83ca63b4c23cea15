// Unit tests for the logging system -- level filtering, formatting, level
// names and the output sink.
//
// Uses dup2() to capture stdout output for verification.

#include "test_framework.h"
#include "../../src/logging.h"

#include <cstdio>
#include <fstream>
#include <functional>
#include <unistd.h>

// Helper: redirect stdout to a temp file, run fn(), return captured output.
static std::string capture_stdout(std::function<void()> fn) {
    fflush(stdout);

    char tmpname[] = "/tmp/qp_log_test_XXXXXX";
    int tmpfd = mkstemp(tmpname);
    int saved = dup(STDOUT_FILENO);
    dup2(tmpfd, STDOUT_FILENO);
    close(tmpfd);

    fn();
    fflush(stdout);

    dup2(saved, STDOUT_FILENO);
    close(saved);

    std::ifstream f(tmpname);
    std::string result((std::istreambuf_iterator<char>(f)),
                       std::istreambuf_iterator<char>());
    std::remove(tmpname);
    return result;
}

// ===========================================================================
// Level enum and setLevel
// ===========================================================================

TEST(level_enum_ordering) {
    ASSERT_TRUE(logging::Level::Debug < logging::Level::Info);
    ASSERT_TRUE(logging::Level::Info < logging::Level::Warning);
    ASSERT_TRUE(logging::Level::Warning < logging::Level::Error);
}

TEST(set_level_changes_global) {
    logging::setLevel(logging::Level::Warning);
    ASSERT_TRUE(logging::g_level == logging::Level::Warning);
    logging::setLevel(logging::Level::Debug);
    ASSERT_TRUE(logging::g_level == logging::Level::Debug);
    // Reset
    logging::setLevel(logging::Level::Info);
}

TEST(default_level_is_info) {
    // The inline default is Level::Info.  Reset and verify.
    logging::g_level = logging::Level::Info;
    ASSERT_TRUE(logging::g_level == logging::Level::Info);
}

// ===========================================================================
// debug() filtering
// ===========================================================================

TEST(debug_prints_when_level_debug) {
    logging::setLevel(logging::Level::Debug);
    auto out = capture_stdout([] { logging::debug("test message"); });
    ASSERT_TRUE(out.find("[DEBUG]") != std::string::npos);
    ASSERT_TRUE(out.find("test message") != std::string::npos);
}

TEST(debug_suppressed_when_level_info) {
    logging::setLevel(logging::Level::Info);
    auto out = capture_stdout([] { logging::debug("should not appear"); });
    ASSERT_TRUE(out.empty());
}

// ===========================================================================
// info() filtering
// ===========================================================================

TEST(info_prints_when_level_info) {
    logging::setLevel(logging::Level::Info);
    auto out = capture_stdout([] { logging::info("info msg"); });
    ASSERT_TRUE(out.find("[INFO]") != std::string::npos);
    ASSERT_TRUE(out.find("info msg") != std::string::npos);
}

TEST(info_suppressed_when_level_warning) {
    logging::setLevel(logging::Level::Warning);
    auto out = capture_stdout([] { logging::info("should not appear"); });
    ASSERT_TRUE(out.empty());
}

// ===========================================================================
// warning() filtering
// ===========================================================================

TEST(warning_prints_when_level_warning) {
    logging::setLevel(logging::Level::Warning);
    auto out = capture_stdout([] { logging::warning("warn msg"); });
    ASSERT_TRUE(out.find("[WARNING]") != std::string::npos);
    ASSERT_TRUE(out.find("warn msg") != std::string::npos);
}

TEST(warning_suppressed_when_level_error) {
    logging::setLevel(logging::Level::Error);
    auto out = capture_stdout([] { logging::warning("should not appear"); });
    ASSERT_TRUE(out.empty());
}

// ===========================================================================
// error() -- always prints regardless of level
// ===========================================================================

TEST(error_always_prints_at_error_level) {
    logging::setLevel(logging::Level::Error);
    auto out = capture_stdout([] { logging::error("error msg"); });
    ASSERT_TRUE(out.find("[ERROR]") != std::string::npos);
    ASSERT_TRUE(out.find("error msg") != std::string::npos);
}

TEST(error_prints_at_debug_level) {
    logging::setLevel(logging::Level::Debug);
    auto out = capture_stdout([] { logging::error("still prints"); });
    ASSERT_TRUE(out.find("[ERROR]") != std::string::npos);
}

// ===========================================================================
// Format strings
// ===========================================================================

TEST(format_string_with_args) {
    logging::setLevel(logging::Level::Info);
    auto out = capture_stdout([] {
        logging::info("count=%d name=%s", 42, "test");
    });
    ASSERT_TRUE(out.find("count=42") != std::string::npos);
    ASSERT_TRUE(out.find("name=test") != std::string::npos);
}

TEST(output_ends_with_newline) {
    logging::setLevel(logging::Level::Info);
    auto out = capture_stdout([] { logging::info("newline check"); });
    ASSERT_TRUE(!out.empty());
    ASSERT_EQ(out.back(), '\n');
}

// ===========================================================================
// Level names
// ===========================================================================

TEST(parse_level_accepts_known_names) {
    ASSERT_TRUE(logging::parse_level("debug") == logging::Level::Debug);
    ASSERT_TRUE(logging::parse_level("info") == logging::Level::Info);
    ASSERT_TRUE(logging::parse_level("warning") == logging::Level::Warning);
    ASSERT_TRUE(logging::parse_level("warn") == logging::Level::Warning);
    ASSERT_TRUE(logging::parse_level("error") == logging::Level::Error);
}

TEST(parse_level_rejects_unknown_names) {
    ASSERT_FALSE(logging::parse_level("").has_value());
    ASSERT_FALSE(logging::parse_level("verbose").has_value());
    ASSERT_FALSE(logging::parse_level("INFO").has_value());
}

TEST(level_name_matches_prefix) {
    ASSERT_STREQ(std::string(logging::level_name(logging::Level::Debug)), "DEBUG");
    ASSERT_STREQ(std::string(logging::level_name(logging::Level::Warning)), "WARNING");
}

// ===========================================================================
// Sink
// ===========================================================================

TEST(sink_redirects_output_away_from_stdout) {
    logging::setLevel(logging::Level::Info);
    FILE* sink = std::tmpfile();
    ASSERT_TRUE(sink != nullptr);

    logging::setSink(sink);
    auto out = capture_stdout([] { logging::info("to the sink"); });
    logging::setSink(nullptr);

    ASSERT_TRUE(out.empty());

    std::rewind(sink);
    char line[128] = {};
    ASSERT_TRUE(std::fgets(line, sizeof(line), sink) != nullptr);
    std::fclose(sink);
    ASSERT_STREQ(std::string(line), "[INFO] to the sink\n");
}

TEST(log_macros_forward_to_functions) {
    logging::setLevel(logging::Level::Debug);
    auto out = capture_stdout([] {
        LOG_DEBUG("d%d", 1);
        LOG_WARNING("w%d", 2);
    });
    ASSERT_TRUE(out.find("[DEBUG] d1") != std::string::npos);
    ASSERT_TRUE(out.find("[WARNING] w2") != std::string::npos);
    logging::setLevel(logging::Level::Info);
}

// ===========================================================================

int main() {
    // Reset to default level for predictable test behavior.
    logging::setLevel(logging::Level::Info);

    printf("=== logging tests ===\n");
    RUN_ALL_TESTS();
}
