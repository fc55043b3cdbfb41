#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "CommandLine.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <vector>

namespace {
CommandLineOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "llmsort");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

std::string parse_error(std::vector<const char*> args) {
    try {
        parse(std::move(args));
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::VALIDATION_INVALID_INPUT);
        return ex.get_error_info().context;
    }
    FAIL("expected a usage error");
    return {};
}
}

TEST_CASE("no arguments leaves every override unset") {
    const auto options = parse({});
    CHECK_FALSE(options.target_dir.has_value());
    CHECK_FALSE(options.model.has_value());
    CHECK_FALSE(options.api_url.has_value());
    CHECK_FALSE(options.batch_size.has_value());
    CHECK_FALSE(options.dry_run);
    CHECK_FALSE(options.save_config);
    CHECK_FALSE(options.show_help);
}

TEST_CASE("short, long and inline forms are accepted") {
    const auto options = parse({"-t", "/data/inbox", "--model=llama3", "--api-url", "http://h:1/api/generate",
                                "-b", "4", "--max-attempts=5", "--retry-delay", "0", "--timeout", "30",
                                "--no-format-hint", "--dry-run", "--save-config"});
    CHECK(options.target_dir == "/data/inbox");
    CHECK(options.model == "llama3");
    CHECK(options.api_url == "http://h:1/api/generate");
    CHECK(options.batch_size == 4);
    CHECK(options.max_attempts == 5);
    CHECK(options.retry_delay_seconds == 0);
    CHECK(options.timeout_seconds == 30);
    CHECK(options.no_format_hint);
    CHECK(options.dry_run);
    CHECK(options.save_config);
}

TEST_CASE("help and version flags") {
    CHECK(parse({"-h"}).show_help);
    CHECK(parse({"--help"}).show_help);
    CHECK(parse({"-V"}).show_version);
    CHECK(parse({"--version"}).show_version);
}

TEST_CASE("bad arguments are usage errors") {
    CHECK(parse_error({"--frobnicate"}) == "unknown argument '--frobnicate'");
    CHECK(parse_error({"stray"}) == "unknown argument 'stray'");
    CHECK(parse_error({"--model"}) == "missing value for --model");
    CHECK(parse_error({"-b", "ten"}) == "-b expects an integer, got 'ten'");
    CHECK(parse_error({"--batch-size=3x"}) == "--batch-size expects an integer, got '3x'");
}

TEST_CASE("only given flags override settings") {
    TempDir temp_dir;
    EnvVarGuard config_dir("LLMSORT_CONFIG_DIR", temp_dir.path().string());

    Settings settings;
    settings.set_model("from-config");
    settings.set_batch_size(9);

    apply_command_line(parse({"-t", "/srv/files", "--no-format-hint"}), settings);

    CHECK(settings.get_target_dir() == "/srv/files");
    CHECK(settings.get_model() == "from-config");
    CHECK(settings.get_batch_size() == 9);
    CHECK_FALSE(settings.get_json_format_hint());
}

TEST_CASE("usage text names the defaults") {
    const std::string text = usage_text("llmsort");
    CHECK(text.find("Usage: llmsort [options]") != std::string::npos);
    CHECK(text.find("gpt-oss:20b-cloud") != std::string::npos);
    CHECK(text.find("http://localhost:11434/api/generate") != std::string::npos);
    CHECK(text.find("--dry-run") != std::string::npos);
}
