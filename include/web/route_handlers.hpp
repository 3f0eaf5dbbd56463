#pragma once

#include "core/feasibility_selector.hpp"
#include "core/generation_coordinator.hpp"
#include "core/report_json.hpp"
#include "logging/logger.hpp"
#include "web/generation_jobs.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

static const char *DOCX_CONTENT_TYPE = "application/vnd.openxmlformats-officedocument.wordprocessingml.document";

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, GenerationServices &services, GenerationJobRegistry &jobs)
    {
        // Synchronous generation, replies with the document
        svr.Post("/api/reports/generate-word", [&](const httplib::Request &req, httplib::Response &res)
                 { handleGenerateWord(req, res, services); });

        // Local vs. server-side decision for a prospective request
        svr.Post("/api/reports/check-word-generation", [&](const httplib::Request &req, httplib::Response &res)
                 { handleCheckWordGeneration(req, res, services); });

        // Asynchronous generation jobs
        svr.Post("/api/generations", [&](const httplib::Request &req, httplib::Response &res)
                 { handleStartGeneration(req, res, jobs); });

        svr.Get(R"(/api/generations/([0-9a-f]+))", [&](const httplib::Request &req, httplib::Response &res)
                { handleGetGeneration(req, res, jobs); });

        svr.Get(R"(/api/generations/([0-9a-f]+)/result)", [&](const httplib::Request &req, httplib::Response &res)
                { handleGetGenerationResult(req, res, jobs); });

        svr.Delete(R"(/api/generations/([0-9a-f]+))", [&](const httplib::Request &req, httplib::Response &res)
                   { handleCancelGeneration(req, res, jobs); });

        // Server status endpoint
        svr.Get("/api/status", [&](const httplib::Request &req, httplib::Response &res)
                { handleServerStatus(req, res, jobs); });
    }

    static int httpStatusFor(GenerationErrorKind kind)
    {
        switch (kind)
        {
        case GenerationErrorKind::NONE:
            return 200;
        case GenerationErrorKind::INVALID_REQUEST:
            return 400;
        case GenerationErrorKind::PAYLOAD_TOO_LARGE:
            return 413;
        case GenerationErrorKind::DELEGATION:
            return 502;
        case GenerationErrorKind::CANCELLED:
            return 409;
        case GenerationErrorKind::PACKAGING:
        case GenerationErrorKind::INTERNAL:
            break;
        }
        return 500;
    }

    static void sendDocument(httplib::Response &res, const GenerationOutcome &outcome)
    {
        res.set_header("Content-Disposition", "attachment; filename=\"" + outcome.suggested_filename + "\"");
        res.set_header("X-Generation-Strategy", toString(outcome.strategy));
        if (outcome.fallback_used)
        {
            res.set_header("X-Generation-Fallback", "true");
        }
        res.set_content(std::string(outcome.package_bytes.begin(), outcome.package_bytes.end()), DOCX_CONTENT_TYPE);
    }

    static void sendFailure(httplib::Response &res, const GenerationOutcome &outcome)
    {
        res.status = httpStatusFor(outcome.error);
        res.set_content(json{{"error", toString(outcome.error)}, {"details", outcome.error_message}}.dump(), "application/json");
    }

private:
    static bool parseRequest(const httplib::Request &req, httplib::Response &res, GenerationRequest &request)
    {
        RequestParseResult parsed = parseGenerationRequest(req.body);
        if (!parsed.success)
        {
            res.status = 400;
            res.set_content(json{{"error", "Invalid request data"}, {"details", parsed.error_message}}.dump(), "application/json");
            return false;
        }
        request = std::move(parsed.request);
        return true;
    }

    static void handleGenerateWord(const httplib::Request &req, httplib::Response &res, GenerationServices &services)
    {
        Logger::trace("Received generate-word request");
        try
        {
            GenerationRequest request;
            if (!parseRequest(req, res, request))
                return;

            auto coordinator = services.make_coordinator();
            CancellationToken cancel;
            GenerationOutcome outcome = coordinator->generate(request, nullptr, cancel);
            if (!outcome.success)
            {
                sendFailure(res, outcome);
                return;
            }
            sendDocument(res, outcome);
        }
        catch (const std::exception &e)
        {
            Logger::error("Word generation error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"error", "Failed to generate Word document"}, {"details", e.what()}}.dump(), "application/json");
        }
    }

    static void handleCheckWordGeneration(const httplib::Request &req, httplib::Response &res, GenerationServices &services)
    {
        Logger::trace("Received check-word-generation request");
        try
        {
            GenerationRequest request;
            if (!parseRequest(req, res, request))
                return;

            static const std::vector<ImageAsset> no_assets;
            const auto &assets = request.options.embed_images_inline ? request.assets : no_assets;
            FeasibilityDecision decision = FeasibilitySelector(services.settings).decide(assets, services.hint);

            json response = {
                {"useServerSide", !decision.local},
                {"reason", decision.reason},
                {"estimatedPayloadBytes", decision.estimated_payload_bytes},
                {"imageCount", request.assets.size()}};
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Check word generation error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"error", "Internal server error"}}.dump(), "application/json");
        }
    }

    static void handleStartGeneration(const httplib::Request &req, httplib::Response &res, GenerationJobRegistry &jobs)
    {
        Logger::trace("Received start generation request");
        try
        {
            GenerationRequest request;
            if (!parseRequest(req, res, request))
                return;

            std::string id = jobs.start(std::move(request));
            res.status = 202;
            res.set_content(json{{"jobId", id}}.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Start generation error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"error", "Internal server error"}}.dump(), "application/json");
        }
    }

    static void handleGetGeneration(const httplib::Request &req, httplib::Response &res, GenerationJobRegistry &jobs)
    {
        const std::string id = req.matches[1];
        auto snapshot = jobs.status(id);
        if (!snapshot)
        {
            res.status = 404;
            res.set_content(json{{"error", "Unknown generation job"}}.dump(), "application/json");
            return;
        }

        json response = {
            {"jobId", snapshot->id},
            {"state", toString(snapshot->state)},
            {"percent", snapshot->percent},
            {"message", snapshot->message},
            {"finished", snapshot->finished},
            {"error", nullptr}};
        if (snapshot->finished)
        {
            if (snapshot->error != GenerationErrorKind::NONE)
            {
                response["error"] = {{"kind", toString(snapshot->error)}, {"message", snapshot->error_message}};
            }
            else
            {
                response["strategy"] = toString(snapshot->strategy);
                response["fallbackUsed"] = snapshot->fallback_used;
            }
        }
        res.set_content(response.dump(), "application/json");
    }

    static void handleGetGenerationResult(const httplib::Request &req, httplib::Response &res, GenerationJobRegistry &jobs)
    {
        const std::string id = req.matches[1];
        if (!jobs.status(id))
        {
            res.status = 404;
            res.set_content(json{{"error", "Unknown generation job"}}.dump(), "application/json");
            return;
        }

        auto outcome = jobs.result(id);
        if (!outcome)
        {
            res.status = 409;
            res.set_content(json{{"error", "Generation still running"}}.dump(), "application/json");
            return;
        }
        if (!outcome->success)
        {
            sendFailure(res, *outcome);
            return;
        }
        sendDocument(res, *outcome);
    }

    static void handleCancelGeneration(const httplib::Request &req, httplib::Response &res, GenerationJobRegistry &jobs)
    {
        const std::string id = req.matches[1];
        if (!jobs.cancel(id))
        {
            res.status = 404;
            res.set_content(json{{"error", "Unknown generation job"}}.dump(), "application/json");
            return;
        }
        res.status = 202;
        res.set_content(json{{"jobId", id}, {"cancelRequested", true}}.dump(), "application/json");
    }

    static void handleServerStatus(const httplib::Request &, httplib::Response &res, GenerationJobRegistry &jobs)
    {
        Logger::trace("Received server status request");
        json response = {
            {"status", "ok"},
            {"activeGenerations", jobs.activeCount()}};
        res.set_content(response.dump(), "application/json");
    }
};
