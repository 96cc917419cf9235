// coderun service
// Config-based code execution service with CLI argument parsing

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "coderun.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: coderun-service [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: coderun.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  " << coderun::runtime::kCloudApiKeyEnv << "  Cloud sandbox API key when not in config\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    // Install before any child process or socket exists
    coderun::runtime::SignalHandler::install();

    LOG_INFO("coderun service starting...");
    LOG_INFO("Loading config: " << config_path);

    coderun::runtime::RuntimeConfig config;
    std::string error;

    if (!coderun::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    coderun::logging::Logger::set_level(coderun::logging::string_to_level(config.logging.level));

    coderun::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Service Ready");
    LOG_INFO("  Providers: " << runtime.get_provider_registry().provider_count());
    LOG_INFO("  Languages: " << runtime.get_router().supported_languages().size());
    if (auto *server = runtime.get_http_server())
    {
        LOG_INFO("  HTTP: " << config.http.bind << ":" << server->get_port());
    }

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
