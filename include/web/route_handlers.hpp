#pragma once

#include "core/error_types.hpp"
#include "core/file_utils.hpp"
#include "core/lifecycle_coordinator.hpp"
#include "core/movie_records.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, LifecycleCoordinator &coordinator)
    {
        svr.Get("/api/health", [&](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res, coordinator); });

        svr.Get("/api/stats", [&](const httplib::Request &req, httplib::Response &res)
                { handleStats(req, res, coordinator); });

        svr.Get("/api/movies/pending", [&](const httplib::Request &req, httplib::Response &res)
                { handleListPending(req, res, coordinator); });

        svr.Get("/api/movies/history", [&](const httplib::Request &req, httplib::Response &res)
                { handleListHistory(req, res, coordinator); });

        svr.Post(R"(/api/movies/(\d+)/approve)", [&](const httplib::Request &req, httplib::Response &res)
                 { handleApprove(req, res, coordinator); });

        svr.Post(R"(/api/movies/(\d+)/reject)", [&](const httplib::Request &req, httplib::Response &res)
                 { handleReject(req, res, coordinator); });
    }

    static json pendingToJson(const PendingEntry &entry)
    {
        json j = {
            {"id", entry.id},
            {"original_path", entry.original_path},
            {"original_filename", entry.original_filename},
            {"file_size_bytes", entry.file_size_bytes},
            {"file_size", FileUtils::formatFileSize(entry.file_size_bytes)},
            {"detected_at", entry.detected_at},
            {"status", MovieStatus::toString(entry.status)},
            {"retry_count", entry.retry_count},
            {"updated_at", entry.updated_at}};
        j["error_message"] = entry.error_message.empty() ? json(nullptr) : json(entry.error_message);
        j["file_metadata"] = json::parse(entry.file_metadata, nullptr, false);
        if (j["file_metadata"].is_discarded())
            j["file_metadata"] = nullptr;
        return j;
    }

    static json processedToJson(const ProcessedEntry &entry)
    {
        json j = {
            {"id", entry.id},
            {"source_entry_id", entry.source_entry_id},
            {"original_path", entry.original_path},
            {"original_filename", entry.original_filename},
            {"file_size_bytes", entry.file_size_bytes},
            {"detected_at", entry.detected_at},
            {"processed_at", entry.processed_at},
            {"action", MovieStatus::toString(entry.action)},
            {"version_number", entry.version_number}};
        if (entry.action == ProcessedAction::APPROVED)
        {
            j["final_filename"] = entry.final_filename;
            j["destination_path"] = entry.destination_path;
        }
        else
        {
            j["final_filename"] = nullptr;
            j["destination_path"] = nullptr;
        }
        j["notes"] = entry.notes.empty() ? json(nullptr) : json(entry.notes);
        return j;
    }

    static json statsToJson(const MovieStats &stats)
    {
        return json{
            {"pending_count", stats.pending_count},
            {"processing_count", stats.processing_count},
            {"completed_count", stats.completed_count},
            {"failed_count", stats.failed_count},
            {"rejected_count", stats.rejected_count}};
    }

    static int httpStatusFor(CoordinatorError error)
    {
        switch (error)
        {
        case CoordinatorError::NONE:
            return 200;
        case CoordinatorError::NOT_FOUND:
            return 404;
        case CoordinatorError::ALREADY_IN_PROGRESS:
        case CoordinatorError::INVALID_STATE:
            return 409;
        case CoordinatorError::INTERNAL_ERROR:
        default:
            return 500;
        }
    }

private:
    static void sendError(httplib::Response &res, int status, const std::string &error, const std::string &message)
    {
        res.status = status;
        res.set_content(json{{"status", "error"}, {"error", error}, {"message", message}}.dump(), "application/json");
    }

    static void sendCoordinatorError(httplib::Response &res, const CoordinatorResult &result)
    {
        sendError(res, httpStatusFor(result.error), ErrorNames::toString(result.error), result.message);
    }

    static void sendQueryError(httplib::Response &res, CoordinatorError error, const std::string &message)
    {
        sendError(res, httpStatusFor(error), ErrorNames::toString(error), message);
    }

    /**
     * @brief Optional JSON object body; reads "delete_source" when it is present
     * @return False (with a 400 already sent) if the body or the field is malformed
     */
    static bool parseActionBody(const httplib::Request &req, httplib::Response &res, json &body,
                                std::optional<bool> &delete_source)
    {
        body = json::object();
        if (req.body.empty())
            return true;
        body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object())
        {
            sendError(res, 400, "ValidationError", "Request body must be a JSON object");
            return false;
        }
        if (body.contains("delete_source") && !body["delete_source"].is_null())
        {
            if (!body["delete_source"].is_boolean())
            {
                sendError(res, 400, "ValidationError", "delete_source must be a boolean");
                return false;
            }
            delete_source = body["delete_source"].get<bool>();
        }
        return true;
    }

    static bool parseId(const httplib::Request &req, httplib::Response &res, int64_t &id)
    {
        try
        {
            id = std::stoll(req.matches[1].str());
            return true;
        }
        catch (const std::exception &)
        {
            sendError(res, 400, "ValidationError", "Invalid movie id");
            return false;
        }
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res, LifecycleCoordinator &coordinator)
    {
        json response = {
            {"status", "healthy"},
            {"destination", coordinator.destinationDirectory()},
            {"destination_accessible", FileUtils::isMountAccessible(coordinator.destinationDirectory())},
            {"active_transfers", coordinator.activeCount()}};
        res.set_content(response.dump(), "application/json");
    }

    static void handleStats(const httplib::Request &, httplib::Response &res, LifecycleCoordinator &coordinator)
    {
        Logger::trace("Received stats request");
        try
        {
            auto stats = coordinator.stats();
            if (!stats.ok())
            {
                sendQueryError(res, stats.error, stats.message);
                return;
            }
            json response = {{"status", "success"}, {"data", statsToJson(stats.value)}};
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Stats error: " + std::string(e.what()));
            sendError(res, 500, "InternalError", "Internal server error");
        }
    }

    static void handleListPending(const httplib::Request &, httplib::Response &res, LifecycleCoordinator &coordinator)
    {
        Logger::trace("Received pending list request");
        try
        {
            auto pending = coordinator.listPending();
            if (!pending.ok())
            {
                sendQueryError(res, pending.error, pending.message);
                return;
            }
            json movies = json::array();
            for (const auto &entry : pending.value)
            {
                movies.push_back(pendingToJson(entry));
            }
            json response = {{"status", "success"}, {"count", movies.size()}, {"data", movies}};
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Pending list error: " + std::string(e.what()));
            sendError(res, 500, "InternalError", "Internal server error");
        }
    }

    static void handleListHistory(const httplib::Request &req, httplib::Response &res, LifecycleCoordinator &coordinator)
    {
        Logger::trace("Received history request");
        int limit = 50;
        if (req.has_param("limit"))
        {
            try
            {
                limit = std::stoi(req.get_param_value("limit"));
            }
            catch (const std::exception &)
            {
                sendError(res, 400, "ValidationError", "limit must be an integer");
                return;
            }
            if (limit < 1)
            {
                sendError(res, 400, "ValidationError", "limit must be positive");
                return;
            }
        }

        try
        {
            auto history = coordinator.listProcessed(limit);
            if (!history.ok())
            {
                sendQueryError(res, history.error, history.message);
                return;
            }
            json movies = json::array();
            for (const auto &entry : history.value)
            {
                movies.push_back(processedToJson(entry));
            }
            json response = {{"status", "success"}, {"count", movies.size()}, {"data", movies}};
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("History error: " + std::string(e.what()));
            sendError(res, 500, "InternalError", "Internal server error");
        }
    }

    static void handleApprove(const httplib::Request &req, httplib::Response &res, LifecycleCoordinator &coordinator)
    {
        int64_t id = 0;
        if (!parseId(req, res, id))
            return;

        json body;
        std::optional<bool> delete_source;
        if (!parseActionBody(req, res, body, delete_source))
            return;

        CoordinatorResult result = coordinator.submitApproval(id, delete_source);
        if (!result.ok())
        {
            sendCoordinatorError(res, result);
            return;
        }

        res.status = 202;
        json response = {{"status", "accepted"}, {"id", id}, {"message", result.message}};
        res.set_content(response.dump(), "application/json");
    }

    static void handleReject(const httplib::Request &req, httplib::Response &res, LifecycleCoordinator &coordinator)
    {
        int64_t id = 0;
        if (!parseId(req, res, id))
            return;

        json body;
        std::optional<bool> delete_source;
        if (!parseActionBody(req, res, body, delete_source))
            return;

        std::string notes = "Rejected by user";
        if (body.contains("notes") && body["notes"].is_string())
        {
            notes = body["notes"].get<std::string>();
        }

        CoordinatorResult result = coordinator.reject(id, notes, delete_source);
        if (!result.ok())
        {
            sendCoordinatorError(res, result);
            return;
        }

        json response = {{"status", "success"}, {"id", id}, {"message", result.message}};
        res.set_content(response.dump(), "application/json");
    }
};
