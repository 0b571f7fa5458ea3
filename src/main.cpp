#include "core/artifact_store.hpp"
#include "core/dataset_processing_orchestrator.hpp"
#include "core/http_server_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "poco_config_manager.hpp"
#include "web/route_handlers.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    const char *DEFAULT_CONFIG_PATH = "config/config.json";
    constexpr auto WORKER_DRAIN_TIMEOUT = std::chrono::seconds(30);

    void printUsage(const char *program)
    {
        std::cout << "Inference Blackbox - image/mask blending service" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>   Configuration file (default: " << DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --batch, -b <file>    Process one request file, print the report and exit" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    int runBatch(const DatasetProcessingOrchestrator &orchestrator, const std::string &request_path)
    {
        std::ifstream in(request_path);
        if (!in)
        {
            Logger::error("Cannot open request file: " + request_path);
            return 1;
        }

        json body = json::parse(in, nullptr, false);
        if (body.is_discarded())
        {
            std::cout << DatasetCodec::toJson(BatchReport::fatal(DatasetCodec::NO_JSON_DATA)).dump(2) << std::endl;
            return 1;
        }

        auto request = DatasetCodec::parseDatasetRequest(body);
        if (!request)
        {
            Logger::error("Rejected request file " + request_path + ": " + request.error_message);
            std::cout << DatasetCodec::toJson(BatchReport::fatal(request.error_message)).dump(2) << std::endl;
            return 1;
        }

        BatchReport report = orchestrator.processDataset(request.value.user_id, request.value.data);
        std::cout << DatasetCodec::toJson(report).dump(2) << std::endl;
        return report.success ? 0 : 1;
    }

    // Timed-out item workers may still be logging or writing files; they must not
    // outlive static destruction. If they do not drain in time, exit without it.
    int finish(const DatasetProcessingOrchestrator &orchestrator, int exit_code)
    {
        if (!orchestrator.waitForWorkers(WORKER_DRAIN_TIMEOUT))
        {
            Logger::error("Exiting with item workers still running");
            std::cout.flush();
            std::quick_exit(exit_code);
        }
        return exit_code;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = DEFAULT_CONFIG_PATH;
    std::string batch_path;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--batch" || arg == "-b") && i + 1 < argc)
        {
            batch_path = argv[++i];
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    PocoConfigManager config_manager;
    if (!config_manager.load(config_path))
    {
        Logger::warn("Using built-in configuration defaults; could not load " + config_path);
    }
    config_manager.applyEnvironmentOverrides();

    Logger::init(config_manager.getLogLevel());

    std::vector<std::string> config_errors;
    if (!config_manager.validateConfig(config_errors))
    {
        for (const auto &error : config_errors)
        {
            Logger::error("Invalid configuration: " + error);
        }
        return 1;
    }

    std::shared_ptr<const ArtifactStore> store;
    try
    {
        store = std::make_shared<const ArtifactStore>(config_manager.getUploadDir());
    }
    catch (const std::exception &e)
    {
        Logger::error("Cannot open upload directory " + config_manager.getUploadDir() + ": " + e.what());
        return 1;
    }

    OrchestratorOptions options;
    options.max_threads = config_manager.getMaxProcessingThreads();
    options.item_timeout = std::chrono::seconds(config_manager.getItemTimeoutSeconds());
    options.max_abandoned_workers = static_cast<size_t>(config_manager.getMaxAbandonedWorkers());
    DatasetProcessingOrchestrator orchestrator(store, options);

    Logger::info("Upload root: " + store->uploadRoot().string() + ", processing threads: " +
                 std::to_string(options.max_threads));

    if (!batch_path.empty())
    {
        return finish(orchestrator, runBatch(orchestrator, batch_path));
    }

    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.installSignalHandlers();

    HttpServerManager server_manager([&orchestrator](httplib::Server &server)
                                     { RouteHandlers::setupRoutes(server, orchestrator); });
    if (!server_manager.start(config_manager.getServerHost(), config_manager.getServerPort()))
    {
        return 1;
    }

    shutdown_manager.waitForShutdown();

    Logger::info("Shutting down: " + shutdown_manager.getReason());
    server_manager.stop();
    Logger::info("Inference blackbox stopped");
    return finish(orchestrator, 0);
}
