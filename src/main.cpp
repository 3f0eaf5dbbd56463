#include "core/generation_coordinator.hpp"
#include "core/logger_observer.hpp"
#include "core/report_json.hpp"
#include "core/server_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "web/generation_jobs.hpp"
#include "web/route_handlers.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <thread>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Report Document Generator" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>   Configuration file (default: config.yaml)" << std::endl;
        std::cout << "  --port, -p <port>     Override server_port" << std::endl;
        std::cout << "  --input, -i <file>    Generate one document from a JSON request and exit" << std::endl;
        std::cout << "  --output, -o <file>   Output path for --input (default: suggested file name)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    GenerationServices buildServices(const ServerConfigManager &config)
    {
        GenerationServices services;
        services.settings = config.getGenerationSettings();
        services.hint = EnvironmentCapacityHint::detect();
        if (auto memory_override = config.getMemoryOverrideGb())
        {
            services.hint.memory_gb = memory_override;
        }
        if (services.hint.memory_gb)
        {
            Logger::info("Environment memory hint: " + std::to_string(*services.hint.memory_gb) + " GB");
        }

        auto resolver = std::make_shared<HttpImageResolver>(config.getStorageSettings());

        std::shared_ptr<RemoteGenerationClient> remote;
        const RemoteGenerationSettings remote_settings = config.getRemoteGenerationSettings();
        if (!remote_settings.base_url.empty())
        {
            remote = std::make_shared<HttpRemoteGenerationClient>(remote_settings);
            Logger::info("Remote generation enabled: " + remote_settings.base_url + remote_settings.path);
        }

        std::shared_ptr<TextEnhancer> enhancer;
        const TextEnhancementSettings enhancement_settings = config.getTextEnhancementSettings();
        if (!enhancement_settings.base_url.empty())
        {
            enhancer = std::make_shared<HttpTextEnhancer>(enhancement_settings);
            Logger::info("Text enhancement enabled: " + enhancement_settings.base_url + enhancement_settings.path);
        }

        const GenerationSettings settings = services.settings;
        const EnvironmentCapacityHint hint = services.hint;
        services.make_coordinator = [resolver, remote, enhancer, settings, hint]()
        {
            return std::make_unique<GenerationCoordinator>(resolver, remote, enhancer, settings, hint);
        };
        return services;
    }

    int generateFromFile(GenerationServices &services, const std::string &input_path, std::string output_path)
    {
        std::ifstream input(input_path);
        if (!input.is_open())
        {
            Logger::error("Cannot open input file: " + input_path);
            return 1;
        }
        const std::string body((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

        RequestParseResult parsed = parseGenerationRequest(body);
        if (!parsed.success)
        {
            Logger::error("Invalid request in " + input_path + ": " + parsed.error_message);
            return 1;
        }

        auto coordinator = services.make_coordinator();
        CancellationToken cancel;
        ShutdownManager::getInstance().onShutdown([cancel]() mutable
                                                  { cancel.cancel(); });

        GenerationOutcome outcome = coordinator->generate(
            parsed.request,
            [](double percent, const std::string &message)
            {
                std::ostringstream line;
                line << "[" << static_cast<int>(percent) << "%] " << message;
                Logger::info(line.str());
            },
            cancel);

        if (!outcome.success)
        {
            Logger::error(std::string("Generation failed (") + toString(outcome.error) + "): " + outcome.error_message);
            return outcome.cancelled() ? 130 : 2;
        }

        if (output_path.empty())
        {
            output_path = outcome.suggested_filename;
        }
        std::ofstream output(output_path, std::ios::binary);
        if (!output.is_open())
        {
            Logger::error("Cannot open output file: " + output_path);
            return 1;
        }
        output.write(reinterpret_cast<const char *>(outcome.package_bytes.data()),
                     static_cast<std::streamsize>(outcome.package_bytes.size()));
        if (!output)
        {
            Logger::error("Failed to write " + output_path);
            return 1;
        }

        Logger::info("Wrote " + output_path + " (" + std::to_string(outcome.package_bytes.size()) + " bytes, " +
                     std::to_string(outcome.embedded_images) + " embedded images, " +
                     std::to_string(outcome.unavailable_images) + " unavailable)");
        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::string config_file = "config.yaml";
    std::string input_path;
    std::string output_path;
    int port_override = 0;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if ((arg == "--config" || arg == "-c") && has_value)
        {
            config_file = argv[++i];
        }
        else if ((arg == "--port" || arg == "-p") && has_value)
        {
            try
            {
                port_override = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cout << "Error: invalid port: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if ((arg == "--input" || arg == "-i") && has_value)
        {
            input_path = argv[++i];
        }
        else if ((arg == "--output" || arg == "-o") && has_value)
        {
            output_path = argv[++i];
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cout << "Error: unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    Logger::init("INFO");
    ShutdownManager::getInstance().installSignalHandlers();

    auto &config_manager = ServerConfigManager::getInstance();
    LoggerObserver logger_observer;
    config_manager.subscribe(&logger_observer);

    std::ifstream file_check(config_file);
    if (!file_check.good())
    {
        Logger::info("Configuration file not found, creating default " + config_file);
        if (!config_manager.saveConfig(config_file))
        {
            Logger::error("Failed to save default configuration to: " + config_file);
        }
    }
    file_check.close();

    if (!config_manager.loadConfig(config_file))
    {
        Logger::error("Failed to load configuration from file, using built-in defaults");
    }
    if (port_override > 0)
    {
        config_manager.setServerPort(port_override, false);
    }

    GenerationServices services = buildServices(config_manager);

    if (!input_path.empty())
    {
        const int rc = generateFromFile(services, input_path, output_path);
        config_manager.unsubscribe(&logger_observer);
        return rc;
    }

    GenerationJobRegistry jobs(services.make_coordinator);
    httplib::Server server;
    RouteHandlers::setupRoutes(server, services, jobs);

    ShutdownManager::getInstance().onShutdown([&server]()
                                              { server.stop(); });

    const std::string host = config_manager.getServerHost();
    const int port = config_manager.getServerPort();
    std::thread server_thread([&]()
                              {
        Logger::info("Report document server listening on " + host + ":" + std::to_string(port));
        if (!server.listen(host, port))
        {
            Logger::error("HTTP server failed to listen on " + host + ":" + std::to_string(port));
            ShutdownManager::getInstance().requestShutdown("HTTP server failed");
        } });

    ShutdownManager::getInstance().waitForShutdown();
    Logger::info("Shutdown requested, cleaning up...");

    server.stop();
    if (server_thread.joinable())
    {
        server_thread.join();
    }
    jobs.shutdown();
    config_manager.unsubscribe(&logger_observer);

    Logger::info("Server shutdown complete");
    return 0;
}
