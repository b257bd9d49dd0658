#pragma once

#include "core/bounded_task_pool.hpp"
#include "core/error_types.hpp"
#include "core/movie_records.hpp"
#include "core/rename_resolver.hpp"
#include "core/settings.hpp"
#include "core/transfer_engine.hpp"
#include "core/version_resolver.hpp"
#include "database/state_store.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Outcome of an approve or reject request
 *
 * error describes the request itself (unknown id, already running, ...).
 * For a synchronous approval that was accepted but whose rename or copy
 * failed, error stays NONE, completed is false and failure_category says why.
 */
struct CoordinatorResult
{
    CoordinatorError error = CoordinatorError::NONE;
    std::string message; // Safe for callers; raw exception text is only logged
    int64_t entry_id = 0;

    bool completed = false;
    ErrorCategory failure_category = ErrorCategory::NONE;
    std::string final_filename;
    std::string destination_path;
    int version_number = 1;

    bool ok() const { return error == CoordinatorError::NONE; }
};

/**
 * @brief Outcome of a listing or stats request; value is empty unless error is NONE
 */
template <typename T>
struct CoordinatorQuery
{
    CoordinatorError error = CoordinatorError::NONE;
    std::string message;
    T value{};

    bool ok() const { return error == CoordinatorError::NONE; }
};

/**
 * @brief Owns the per-file state machine in the coordinator process
 *
 * Stale processing entries are demoted during construction, so recovery is
 * complete before the first approval is accepted.
 */
class LifecycleCoordinator
{
public:
    LifecycleCoordinator(StateStore &store, RenameResolver &renamer, const VersionResolver &versions,
                         TransferEngine &engine, const NetworkShareSettings &share,
                         const CoordinatorSettings &settings, int max_concurrent_transfers);
    ~LifecycleCoordinator();

    LifecycleCoordinator(const LifecycleCoordinator &) = delete;
    LifecycleCoordinator &operator=(const LifecycleCoordinator &) = delete;

    CoordinatorQuery<std::vector<PendingEntry>> listPending();
    CoordinatorQuery<std::vector<ProcessedEntry>> listProcessed(int limit = 50);
    CoordinatorQuery<MovieStats> stats();

    /**
     * @brief Claim the entry and run rename, version resolution and transfer before returning
     * @param delete_source Overrides coordinator.delete_source_on_approve when set
     */
    CoordinatorResult approve(int64_t id, std::optional<bool> delete_source = std::nullopt);

    /**
     * @brief Claim the entry now and run the rest on the transfer pool
     *
     * NotFound, AlreadyInProgress and InvalidState are reported immediately.
     */
    CoordinatorResult submitApproval(int64_t id, std::optional<bool> delete_source = std::nullopt);

    /**
     * @brief Record the entry as rejected and optionally delete its source file
     * @param delete_source Overrides coordinator.delete_source_on_reject when set
     */
    CoordinatorResult reject(int64_t id, const std::string &notes = "Rejected by user",
                             std::optional<bool> delete_source = std::nullopt);

    /**
     * @brief Demote processing entries no live worker owns
     * @return Number of entries demoted, or -1 if the store could not be updated
     */
    int recoverStale();

    // Block until all submitted approvals have finished
    void waitForIdle();

    size_t activeCount() const;
    std::string destinationDirectory() const;

private:
    CoordinatorResult claim(int64_t id);
    bool reclaimIfStale(int64_t id);
    void runPipeline(const PendingEntry &entry, bool delete_source, CoordinatorResult &result);
    void failEntry(const PendingEntry &entry, ErrorCategory category, const std::string &message,
                   CoordinatorResult &result);
    void release(int64_t id);
    static CoordinatorResult fromOutcome(int64_t id, TransitionOutcome outcome, const std::string &verb, const PendingEntry &entry);

    StateStore &store_;
    RenameResolver &renamer_;
    const VersionResolver &versions_;
    TransferEngine &engine_;
    NetworkShareSettings share_;
    CoordinatorSettings settings_;
    int own_pid_;

    mutable std::mutex active_mutex_;
    std::set<int64_t> active_ids_;

    BoundedTaskPool transfer_pool_;
};
