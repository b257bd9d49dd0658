#pragma once

#include <string>

/**
 * @brief Classification of pipeline failures
 */
enum class ErrorCategory
{
    NONE,
    VALIDATION,       // Disallowed input file, never recorded
    TRANSIENT_IO,     // Share hiccup or read failure, retried with backoff
    STRUCTURAL,       // Conflict or unusable resolver result, not retried
    CONCURRENCY,      // Approval already in progress, no state change
    STALE_PROCESSING  // Orphaned processing entry found on restart
};

/**
 * @brief Errors surfaced by the coordinator to its callers
 */
enum class CoordinatorError
{
    NONE,
    NOT_FOUND,
    ALREADY_IN_PROGRESS,
    INVALID_STATE,
    INTERNAL_ERROR
};

class ErrorNames
{
public:
    static std::string toString(ErrorCategory category)
    {
        switch (category)
        {
        case ErrorCategory::NONE:
            return "None";
        case ErrorCategory::VALIDATION:
            return "ValidationError";
        case ErrorCategory::TRANSIENT_IO:
            return "TransientIOError";
        case ErrorCategory::STRUCTURAL:
            return "StructuralError";
        case ErrorCategory::CONCURRENCY:
            return "ConcurrencyError";
        case ErrorCategory::STALE_PROCESSING:
            return "StaleProcessingError";
        default:
            return "Unknown";
        }
    }

    static std::string toString(CoordinatorError error)
    {
        switch (error)
        {
        case CoordinatorError::NONE:
            return "None";
        case CoordinatorError::NOT_FOUND:
            return "NotFound";
        case CoordinatorError::ALREADY_IN_PROGRESS:
            return "AlreadyInProgress";
        case CoordinatorError::INVALID_STATE:
            return "InvalidState";
        case CoordinatorError::INTERNAL_ERROR:
            return "InternalError";
        default:
            return "Unknown";
        }
    }
};
