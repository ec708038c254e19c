#include "app_constants.hpp"
#include "candidates/candidate_source.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "copy/copier_factory.hpp"
#include "storage/local_storage.hpp"
#include "storage/run_lock.hpp"
#include "transfer/run_coordinator.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace
{

void AttachFileSink(const std::filesystem::path &log_file)
{
    try {
        std::error_code ec;
        if (log_file.has_parent_path()) {
            std::filesystem::create_directories(log_file.parent_path(), ec);
            if (ec) {
                spdlog::warn(
                    "Cannot create log directory '{}': {}", log_file.parent_path().string(),
                    ec.message()
                );
            }
        }
        auto file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
        file_sink->set_pattern(std::string(WarmCache::Constants::DEFAULT_FILE_LOG_PATTERN));
        spdlog::default_logger()->sinks().push_back(file_sink);
        spdlog::info("Logging to file: {}", log_file.string());
    } catch (const spdlog::spdlog_ex &ex) {
        spdlog::error("Cannot open log file '{}': {}", log_file.string(), ex.what());
    }
}

}  // namespace

int main(int argc, char *argv[])
{
    namespace Constants = WarmCache::Constants;

    // Command Line argument parsing
    CLI::App app{std::string(Constants::APP_NAME)};

    std::string config_path_str;
    std::string log_level_str;
    bool force_dry_run = false;
    bool no_demote     = false;

    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_flag("--dry-run", force_dry_run, "Report what would be transferred without changes");
    app.add_option("--log-level", log_level_str, "Override the configured log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_flag("--no-demote", no_demote, "Skip the demote phase for this run");

    app.set_version_flag("-v,--version", std::string(Constants::APP_VERSION_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger (console) before config is parsed
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(std::string(Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger =
            std::make_shared<spdlog::logger>(std::string(Constants::APP_NAME), console_sink);
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return Constants::EXIT_STARTUP;
    }
    spdlog::info("{} {} starting...", Constants::APP_NAME, Constants::APP_VERSION_SHORT);

    // Load Configuration
    std::filesystem::path config_path(config_path_str);
    auto config_result = WarmCache::Config::loadConfigFromFileVerbose(config_path);
    if (!config_result) {
        spdlog::critical("Error loading configuration: {}", config_result.error());
        return Constants::EXIT_STARTUP;
    }
    WarmCache::Config::NodeConfig config = std::move(config_result.value());

    if (force_dry_run) {
        config.dry_run = true;
    }
    if (no_demote) {
        config.demote.enabled = false;
    }
    if (!log_level_str.empty()) {
        if (auto level = WarmCache::Config::StringToLogLevel(log_level_str)) {
            config.global_settings.log_level = *level;
        }
    }

    // Initialize Logging Level and Sinks from Config
    if (config.global_settings.log_file) {
        AttachFileSink(*config.global_settings.log_file);
    }
    spdlog::set_level(config.global_settings.log_level);
    spdlog::info(
        "Logging level set to: {}", spdlog::level::to_string_view(config.global_settings.log_level)
    );

    // One run at a time
    auto lock_res = WarmCache::Storage::RunLock::TryAcquire(config.global_settings.lock_file);
    if (!lock_res) {
        if (lock_res.error() == WarmCache::Storage::StorageErrc::LockHeld) {
            spdlog::warn(
                "Another run holds '{}', exiting", config.global_settings.lock_file.string()
            );
            return Constants::EXIT_ABORTED;
        }
        spdlog::critical(
            "Cannot open lock file '{}': {}", config.global_settings.lock_file.string(),
            lock_res.error().message()
        );
        return Constants::EXIT_STARTUP;
    }

    // Setup Core Components
    std::unique_ptr<WarmCache::Storage::LocalStorage> array_tier;
    std::unique_ptr<WarmCache::Storage::LocalStorage> cache_tier;
    std::unique_ptr<WarmCache::Copy::ICopier> copier;
    std::unique_ptr<WarmCache::Transfer::RunCoordinator> coordinator;
    try {
        array_tier = std::make_unique<WarmCache::Storage::LocalStorage>(config.array_root);
        cache_tier = std::make_unique<WarmCache::Storage::LocalStorage>(config.cache_root);

        auto copier_res = WarmCache::Copy::CopierFactory::Create(config);
        if (!copier_res) {
            spdlog::critical("Error creating copier: {}", copier_res.error().message());
            return Constants::EXIT_STARTUP;
        }
        copier = std::move(copier_res.value());

        coordinator = std::make_unique<WarmCache::Transfer::RunCoordinator>(
            config, *array_tier, *cache_tier, *copier
        );
    } catch (const std::exception &e) {
        spdlog::critical("Error initializing components: {}", e.what());
        return Constants::EXIT_STARTUP;
    }

    for (auto *tier : {array_tier.get(), cache_tier.get()}) {
        if (auto init_res = tier->Initialize(); !init_res) {
            spdlog::critical(
                "Error initializing tier '{}': {}", tier->GetPath().string(),
                init_res.error().message()
            );
            return Constants::EXIT_STARTUP;
        }
    }

    const auto &sources = config.sources;
    coordinator->SetWarmSource(
        WarmCache::Candidates::MakeCandidateSource(sources.warm_command, sources.warm_list)
    );
    coordinator->SetDemoteSource(
        WarmCache::Candidates::MakeCandidateSource(sources.demote_command, sources.demote_list)
    );
    coordinator->SetInUseSource(
        WarmCache::Candidates::MakeCandidateSource(sources.in_use_command, sources.in_use_list)
    );
    spdlog::info("Using copy method: {}", copier->GetName());

    const auto summary = coordinator->Run();

    spdlog::info("{} exiting...", Constants::APP_NAME);
    spdlog::shutdown();

    return WarmCache::Transfer::RunCoordinator::ExitCodeFor(summary);
}
