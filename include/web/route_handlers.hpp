#pragma once

#include "core/dataset_processing_orchestrator.hpp"
#include "core/dataset_types.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

class RouteHandlers
{
public:
    static constexpr const char *SERVICE_NAME = "inference-blackbox";

    static void setupRoutes(httplib::Server &svr, const DatasetProcessingOrchestrator &orchestrator)
    {
        svr.Post("/process-dataset", [&orchestrator](const httplib::Request &req, httplib::Response &res)
                 { handleProcessDataset(req, res, orchestrator); });

        svr.Get("/health", [](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res); });
    }

    static void handleProcessDataset(const httplib::Request &req, httplib::Response &res,
                                     const DatasetProcessingOrchestrator &orchestrator)
    {
        try
        {
            json body = json::parse(req.body, nullptr, false);
            if (body.is_discarded() || !body.is_object())
            {
                sendError(res, 400, DatasetCodec::NO_JSON_DATA);
                return;
            }

            auto request = DatasetCodec::parseDatasetRequest(body);
            if (!request)
            {
                Logger::warn("Rejected dataset request: " + request.error_message);
                sendError(res, 400, request.error_message);
                return;
            }

            BatchReport report = orchestrator.processDataset(request.value.user_id, request.value.data);
            sendJson(res, 200, DatasetCodec::toJson(report));
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in process-dataset endpoint: " + std::string(e.what()));
            sendError(res, 500, e.what());
        }
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res)
    {
        sendJson(res, 200, json{{"status", "healthy"}, {"service", SERVICE_NAME}});
    }

private:
    static void sendJson(httplib::Response &res, int status, const json &payload)
    {
        res.status = status;
        res.set_content(payload.dump(), "application/json");
    }

    static void sendError(httplib::Response &res, int status, const std::string &message)
    {
        sendJson(res, status, json{{"success", false}, {"error", message}});
    }
};
