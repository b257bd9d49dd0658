#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Lifecycle status of a pending movie entry
 */
enum class PendingStatus
{
    PENDING,    // Stable file waiting for an operator decision
    PROCESSING, // Approval accepted, rename/copy in flight
    COMPLETED,  // Copy committed, entry is being migrated to history
    FAILED      // Last attempt failed, eligible for manual re-approval
};

/**
 * @brief Terminal outcome recorded in the processed history
 */
enum class ProcessedAction
{
    APPROVED,
    REJECTED
};

class MovieStatus
{
public:
    static std::string toString(PendingStatus status)
    {
        switch (status)
        {
        case PendingStatus::PENDING:
            return "pending";
        case PendingStatus::PROCESSING:
            return "processing";
        case PendingStatus::COMPLETED:
            return "completed";
        case PendingStatus::FAILED:
            return "failed";
        default:
            return "unknown";
        }
    }

    static std::optional<PendingStatus> statusFromString(const std::string &status_str)
    {
        if (status_str == "pending")
            return PendingStatus::PENDING;
        if (status_str == "processing")
            return PendingStatus::PROCESSING;
        if (status_str == "completed")
            return PendingStatus::COMPLETED;
        if (status_str == "failed")
            return PendingStatus::FAILED;
        return std::nullopt;
    }

    static std::string toString(ProcessedAction action)
    {
        switch (action)
        {
        case ProcessedAction::APPROVED:
            return "approved";
        case ProcessedAction::REJECTED:
            return "rejected";
        default:
            return "unknown";
        }
    }

    static std::optional<ProcessedAction> actionFromString(const std::string &action_str)
    {
        if (action_str == "approved")
            return ProcessedAction::APPROVED;
        if (action_str == "rejected")
            return ProcessedAction::REJECTED;
        return std::nullopt;
    }

    static std::vector<PendingStatus> allStatuses()
    {
        return {PendingStatus::PENDING, PendingStatus::PROCESSING, PendingStatus::COMPLETED, PendingStatus::FAILED};
    }
};

/**
 * @brief Single source of truth for legal status transitions
 *
 * pending    -> processing  (approval requested)
 * failed     -> processing  (manual retry)
 * processing -> completed   (transfer committed)
 * processing -> failed      (resolver/transfer failure, stale recovery)
 *
 * Rejection removes the entry instead of transitioning it; canReject() names
 * the statuses it may be applied to.
 */
class StatusTransitions
{
public:
    static bool isLegal(PendingStatus from, PendingStatus to)
    {
        switch (to)
        {
        case PendingStatus::PROCESSING:
            return from == PendingStatus::PENDING || from == PendingStatus::FAILED;
        case PendingStatus::COMPLETED:
            return from == PendingStatus::PROCESSING;
        case PendingStatus::FAILED:
            return from == PendingStatus::PROCESSING;
        case PendingStatus::PENDING:
            return false;
        default:
            return false;
        }
    }

    static bool canReject(PendingStatus from)
    {
        return from == PendingStatus::PENDING || from == PendingStatus::FAILED;
    }

    /**
     * @brief Statuses from which a transition to the target is legal
     */
    static std::vector<PendingStatus> sourcesFor(PendingStatus to)
    {
        std::vector<PendingStatus> sources;
        for (auto from : MovieStatus::allStatuses())
        {
            if (isLegal(from, to))
                sources.push_back(from);
        }
        return sources;
    }

    /**
     * @brief SQL list literal of source statuses, e.g. "('pending','failed')"
     */
    static std::string sqlSourceList(const std::vector<PendingStatus> &sources)
    {
        std::string list = "(";
        for (size_t i = 0; i < sources.size(); ++i)
        {
            if (i > 0)
                list += ",";
            list += "'" + MovieStatus::toString(sources[i]) + "'";
        }
        list += ")";
        return list;
    }

    static std::vector<PendingStatus> rejectableStatuses()
    {
        std::vector<PendingStatus> sources;
        for (auto from : MovieStatus::allStatuses())
        {
            if (canReject(from))
                sources.push_back(from);
        }
        return sources;
    }
};
