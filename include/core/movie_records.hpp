#pragma once

#include "core/movie_status.hpp"
#include <cstdint>
#include <string>

/**
 * @brief A stable file awaiting or undergoing processing
 */
struct PendingEntry
{
    int64_t id = 0;
    std::string original_path;
    std::string original_filename;
    uint64_t file_size_bytes = 0;
    std::string detected_at; // UTC, "YYYY-MM-DD HH:MM:SS"
    PendingStatus status = PendingStatus::PENDING;
    std::string error_message;
    int retry_count = 0;
    std::string file_metadata; // JSON: extension, modified_time
    int worker_pid = 0;        // Owner of a processing attempt, 0 otherwise
    std::string worker_identity;
    std::string updated_at;
};

/**
 * @brief Immutable history record, one per terminal outcome
 */
struct ProcessedEntry
{
    int64_t id = 0;
    int64_t source_entry_id = 0;
    std::string original_path;
    std::string original_filename;
    uint64_t file_size_bytes = 0;
    std::string detected_at;
    std::string processed_at;
    ProcessedAction action = ProcessedAction::APPROVED;
    std::string final_filename;   // approved only
    std::string destination_path; // approved only
    int version_number = 1;
    std::string resolver_output;
    std::string notes;
};

struct MovieStats
{
    size_t pending_count = 0;
    size_t processing_count = 0;
    size_t completed_count = 0;
    size_t failed_count = 0;
    size_t rejected_count = 0;
};
