#include "AppException.hpp"
#include "BatchClassifier.hpp"
#include "CommandLine.hpp"
#include "Logger.hpp"
#include "OllamaClient.hpp"
#include "PlacementService.hpp"
#include "Settings.hpp"
#include "SortSession.hpp"

#include <curl/curl.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#ifndef LLMSORT_VERSION
#define LLMSORT_VERSION "0.0.0"
#endif


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

constexpr int kExitUsage = 2;

void print_line(const std::string& message)
{
    if (auto ui_logger = Logger::get_logger("ui_logger")) {
        ui_logger->info("{}", message);
    } else {
        std::cout << message << std::endl;
    }
}

void print_summary(const RunSummary& summary, bool dry_run)
{
    if (summary.files_found == 0) {
        return;
    }
    print_line(fmt::format("Files found: {}, batches: {} ({} skipped)",
                           summary.files_found, summary.batches, summary.batches_skipped));
    print_line(fmt::format("{}: {}, left unmapped: {}, failed: {}",
                           dry_run ? "Planned moves" : "Moved",
                           summary.files_moved, summary.files_unmapped, summary.files_failed));
}

int run_application(const CommandLineOptions& options)
{
    Settings settings;
    settings.load();
    apply_command_line(options, settings);
    settings.validate();

    if (options.save_config) {
        if (!settings.save()) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, settings.get_config_path());
        }
        print_line("Saved settings to " + settings.get_config_path());
    }

    auto core_logger = Logger::get_logger("core_logger");

    OllamaClient client(settings.get_api_url());
    client.set_timeout(settings.get_request_timeout_seconds());

    ClassifierOptions classifier_options;
    classifier_options.model = settings.get_model();
    classifier_options.max_attempts = settings.get_max_attempts();
    classifier_options.retry_delay = std::chrono::seconds(settings.get_retry_delay_seconds());
    classifier_options.json_format_hint = settings.get_json_format_hint();
    BatchClassifier classifier(client, classifier_options, core_logger);

    PlacementService placement(core_logger, options.dry_run);

    print_line(fmt::format("Sorting files in '{}' using model '{}' (Batch size: {})...",
                           settings.get_target_dir(), settings.get_model(), settings.get_batch_size()));

    SortSession session(settings.get_target_dir(),
                        static_cast<std::size_t>(settings.get_batch_size()),
                        classifier,
                        placement,
                        core_logger);
    const RunSummary summary = session.run(print_line);

    print_summary(summary, options.dry_run);
    if (summary.files_found > 0) {
        print_line("Done!");
    }
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char **argv) {
    const std::string program_name = argc > 0 ? argv[0] : "llmsort";

    CommandLineOptions options;
    try {
        options = parse_command_line(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        std::fprintf(stderr, "%s\n\n%s", ex.what(), usage_text(program_name).c_str());
        return kExitUsage;
    }

    if (options.show_help) {
        std::cout << usage_text(program_name);
        return EXIT_SUCCESS;
    }
    if (options.show_version) {
        std::cout << "llmsort " << LLMSORT_VERSION << std::endl;
        return EXIT_SUCCESS;
    }

    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }
    curl_global_init(CURL_GLOBAL_DEFAULT);
    struct CurlCleanup {
        ~CurlCleanup() { curl_global_cleanup(); }
    } curl_cleanup;

    try {
        return run_application(options);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("{}", ex.get_full_details());
        } else {
            std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        }
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
