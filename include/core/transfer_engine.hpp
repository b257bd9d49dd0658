#pragma once

#include "core/error_recovery.hpp"
#include "core/settings.hpp"
#include <cstdint>
#include <functional>
#include <string>

enum class TransferErrorCode
{
    NONE,
    SOURCE_UNAVAILABLE,
    DESTINATION_UNAVAILABLE,
    IO_ERROR,
    COPY_VERIFICATION_FAILED,
    DESTINATION_CONFLICT
};

/**
 * @brief Result of a transfer, successful or not
 */
struct TransferResult
{
    bool success = false;
    TransferErrorCode error = TransferErrorCode::NONE;
    std::string error_message;
    uint64_t bytes_copied = 0;
    std::string destination_path;
    int attempts = 0;
};

/**
 * @brief Chunked copy into a destination directory with atomic, non-replacing commit
 *
 * Each attempt writes ".<final_filename>.<entry_id>.tmp" beside the target,
 * verifies it, then renames it into place. The source is never modified and
 * a failed attempt never leaves its temporary file behind.
 */
class TransferEngine
{
public:
    /**
     * @brief Test hook consulted after each chunk is written
     * @return true to fail the current attempt with an injected I/O error
     */
    using FaultInjector = std::function<bool(int attempt, uint64_t chunk_index)>;

    /**
     * @param settings Chunk size, retry and checksum options
     * @param mount_root Share root checked before each attempt (empty to skip)
     * @param verify_mount Whether mount_root must be accessible
     */
    TransferEngine(const TransferSettings &settings, const std::string &mount_root, bool verify_mount,
                   ErrorRecovery::Sleeper sleeper = ErrorRecovery::defaultSleeper());

    /**
     * @brief Copy source_path to destination_dir/final_filename, retrying transient failures
     */
    TransferResult copy(int64_t entry_id, const std::string &source_path,
                        const std::string &destination_dir, const std::string &final_filename);

    void setFaultInjector(FaultInjector injector);

    /**
     * @brief Remove a source file after it has been archived or rejected
     * @return true if the file was deleted
     */
    static bool deleteSource(const std::string &source_path);

    static bool isRetryable(TransferErrorCode code);
    static std::string errorName(TransferErrorCode code);

private:
    TransferResult attemptCopy(int attempt, int64_t entry_id, const std::string &source_path,
                               const std::string &destination_dir, const std::string &final_filename);
    TransferResult streamToTemp(int attempt, const std::string &source_path, const std::string &temp_path,
                                uint64_t expected_size);
    bool commitNoReplace(const std::string &temp_path, const std::string &final_path, TransferResult &result);

    TransferSettings settings_;
    std::string mount_root_;
    bool verify_mount_;
    ErrorRecovery::Sleeper sleeper_;
    FaultInjector fault_injector_;
};
