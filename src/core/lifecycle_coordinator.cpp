#include "core/lifecycle_coordinator.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <unistd.h>

namespace
{
    template <typename T>
    CoordinatorQuery<T> fromQuery(QueryResult<T> read)
    {
        CoordinatorQuery<T> query;
        if (!read.ok())
        {
            query.error = CoordinatorError::INTERNAL_ERROR;
            query.message = "Internal error";
            return query;
        }
        query.value = std::move(read.value);
        return query;
    }
}

LifecycleCoordinator::LifecycleCoordinator(StateStore &store, RenameResolver &renamer, const VersionResolver &versions,
                                           TransferEngine &engine, const NetworkShareSettings &share,
                                           const CoordinatorSettings &settings, int max_concurrent_transfers)
    : store_(store), renamer_(renamer), versions_(versions), engine_(engine), share_(share), settings_(settings),
      own_pid_(static_cast<int>(::getpid())), transfer_pool_("transfers", max_concurrent_transfers)
{
    int demoted = recoverStale();
    if (demoted > 0)
    {
        Logger::warn("Recovered " + std::to_string(demoted) + " stale processing entr" + (demoted == 1 ? "y" : "ies"));
    }
}

LifecycleCoordinator::~LifecycleCoordinator()
{
    transfer_pool_.waitForIdle();
}

CoordinatorQuery<std::vector<PendingEntry>> LifecycleCoordinator::listPending()
{
    return fromQuery(store_.listPending());
}

CoordinatorQuery<std::vector<ProcessedEntry>> LifecycleCoordinator::listProcessed(int limit)
{
    return fromQuery(store_.listProcessed(limit));
}

CoordinatorQuery<MovieStats> LifecycleCoordinator::stats()
{
    return fromQuery(store_.getStats());
}

std::string LifecycleCoordinator::destinationDirectory() const
{
    return (fs::path(share_.mount_path) / share_.target_folder).string();
}

size_t LifecycleCoordinator::activeCount() const
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_ids_.size();
}

void LifecycleCoordinator::waitForIdle()
{
    transfer_pool_.waitForIdle();
}

int LifecycleCoordinator::recoverStale()
{
    std::set<int64_t> active;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active = active_ids_;
    }
    auto [result, demoted] = store_.demoteStaleProcessing(own_pid_, active);
    if (!result.success)
    {
        Logger::error("Stale processing recovery failed: " + result.error_message);
        return -1;
    }
    return demoted;
}

CoordinatorResult LifecycleCoordinator::fromOutcome(int64_t id, TransitionOutcome outcome, const std::string &verb,
                                                    const PendingEntry &entry)
{
    CoordinatorResult result;
    result.entry_id = id;
    switch (outcome)
    {
    case TransitionOutcome::OK:
        break;
    case TransitionOutcome::NOT_FOUND:
        result.error = CoordinatorError::NOT_FOUND;
        result.message = "Movie " + std::to_string(id) + " not found";
        break;
    case TransitionOutcome::ALREADY_IN_PROGRESS:
        result.error = CoordinatorError::ALREADY_IN_PROGRESS;
        result.message = "Movie " + std::to_string(id) + " is already being processed";
        break;
    case TransitionOutcome::INVALID_STATE:
        result.error = CoordinatorError::INVALID_STATE;
        result.message = "Movie " + std::to_string(id) + " cannot be " + verb + " while " +
                         MovieStatus::toString(entry.status);
        break;
    case TransitionOutcome::DB_ERROR:
    default:
        result.error = CoordinatorError::INTERNAL_ERROR;
        result.message = "Internal error";
        break;
    }
    return result;
}

CoordinatorResult LifecycleCoordinator::claim(int64_t id)
{
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (active_ids_.count(id) > 0)
        {
            CoordinatorResult result;
            result.entry_id = id;
            result.error = CoordinatorError::ALREADY_IN_PROGRESS;
            result.message = "Movie " + std::to_string(id) + " is already being processed";
            return result;
        }
        active_ids_.insert(id);
    }

    TransitionResult transition = store_.claimForProcessing(id, own_pid_);
    if (transition.outcome == TransitionOutcome::ALREADY_IN_PROGRESS && reclaimIfStale(id))
    {
        transition = store_.claimForProcessing(id, own_pid_);
    }
    if (!transition.ok())
    {
        release(id);
        if (transition.outcome == TransitionOutcome::ALREADY_IN_PROGRESS)
        {
            Logger::warn("Approval rejected for movie " + std::to_string(id) + ": already processing (pid " +
                         std::to_string(transition.entry.worker_pid) + ")");
        }
        return fromOutcome(id, transition.outcome, "approved", transition.entry);
    }

    Logger::info("Approved movie " + std::to_string(id) + ": " + transition.entry.original_filename);
    CoordinatorResult result;
    result.entry_id = id;
    result.message = "Movie approved and processing started";
    return result;
}

// The row says processing but its worker may be gone since this coordinator started
bool LifecycleCoordinator::reclaimIfStale(int64_t id)
{
    std::set<int64_t> active;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active = active_ids_;
    }
    // claim() reserved id before reaching the store; nothing here is working on it yet
    active.erase(id);

    auto [result, demoted] = store_.demoteStaleProcessing(own_pid_, active);
    if (!result.success)
    {
        Logger::error("Stale processing check failed for movie " + std::to_string(id) + ": " + result.error_message);
        return false;
    }
    if (demoted == 0)
        return false;

    auto entry = store_.getPending(id);
    return entry && entry->status == PendingStatus::FAILED;
}

void LifecycleCoordinator::release(int64_t id)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ids_.erase(id);
}

CoordinatorResult LifecycleCoordinator::approve(int64_t id, std::optional<bool> delete_source)
{
    CoordinatorResult result = claim(id);
    if (!result.ok())
        return result;

    auto entry = store_.getPending(id);
    if (!entry)
    {
        release(id);
        result.error = CoordinatorError::INTERNAL_ERROR;
        result.message = "Internal error";
        Logger::error("Claimed movie " + std::to_string(id) + " disappeared before processing");
        return result;
    }

    runPipeline(*entry, delete_source.value_or(settings_.delete_source_on_approve), result);
    release(id);
    return result;
}

CoordinatorResult LifecycleCoordinator::submitApproval(int64_t id, std::optional<bool> delete_source)
{
    CoordinatorResult result = claim(id);
    if (!result.ok())
        return result;

    const bool remove_source = delete_source.value_or(settings_.delete_source_on_approve);
    transfer_pool_.submit([this, id, remove_source]()
                          {
        auto entry = store_.getPending(id);
        if (!entry)
        {
            Logger::error("Claimed movie " + std::to_string(id) + " disappeared before processing");
            release(id);
            return;
        }
        CoordinatorResult outcome;
        outcome.entry_id = id;
        runPipeline(*entry, remove_source, outcome);
        release(id); });
    return result;
}

void LifecycleCoordinator::failEntry(const PendingEntry &entry, ErrorCategory category, const std::string &message,
                                     CoordinatorResult &result)
{
    result.completed = false;
    result.failure_category = category;
    result.message = message;

    DBOpResult marked = store_.markFailed(entry.id, message);
    if (!marked.success)
    {
        Logger::error("Could not mark movie " + std::to_string(entry.id) + " failed: " + marked.error_message);
    }
    Logger::error("Processing failed for " + entry.original_filename + " [" + ErrorNames::toString(category) +
                  "]: " + message);
}

void LifecycleCoordinator::runPipeline(const PendingEntry &entry, bool delete_source, CoordinatorResult &result)
{
    try
    {
        NameProposal proposal = renamer_.proposeName(entry.original_path);
        if (!proposal.success)
        {
            failEntry(entry, ErrorCategory::STRUCTURAL, "Rename failed: " + proposal.error_message, result);
            return;
        }

        const std::string destination_dir = destinationDirectory();
        VersionDecision decision = versions_.resolve(proposal.filename, FileUtils::listDestinationFiles(destination_dir));

        TransferResult transfer = engine_.copy(entry.id, entry.original_path, destination_dir, decision.output_filename);
        if (!transfer.success)
        {
            ErrorCategory category = TransferEngine::isRetryable(transfer.error) ? ErrorCategory::TRANSIENT_IO
                                                                                  : ErrorCategory::STRUCTURAL;
            failEntry(entry, category,
                      TransferEngine::errorName(transfer.error) + ": " + transfer.error_message +
                          " (after " + std::to_string(transfer.attempts) + " attempt(s))",
                      result);
            return;
        }

        ProcessedEntry record;
        record.final_filename = decision.output_filename;
        record.destination_path = transfer.destination_path;
        record.version_number = decision.version_number;
        record.resolver_output = proposal.output;
        if (decision.is_duplicate)
        {
            record.notes = "Duplicate of " + decision.matched_files.front();
        }

        DBOpResult completed = store_.completeApproval(entry.id, record);
        if (!completed.success)
        {
            // Every file in the destination has a history record
            std::error_code ec;
            fs::remove(transfer.destination_path, ec);
            if (ec)
            {
                Logger::error("Could not remove unrecorded copy " + transfer.destination_path + ": " + ec.message());
                failEntry(entry, ErrorCategory::STRUCTURAL,
                          "History update failed and the copy at " + transfer.destination_path + " could not be removed",
                          result);
                return;
            }
            failEntry(entry, ErrorCategory::STRUCTURAL, "History update failed; the copied file was removed", result);
            return;
        }

        result.completed = true;
        result.final_filename = decision.output_filename;
        result.destination_path = transfer.destination_path;
        result.version_number = decision.version_number;
        result.message = "Movie copied to " + transfer.destination_path;
        Logger::info("Successfully processed movie " + std::to_string(entry.id) + ": " + entry.original_filename +
                     " -> " + decision.output_filename);

        if (delete_source)
        {
            TransferEngine::deleteSource(entry.original_path);
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected error processing movie " + std::to_string(entry.id) + ": " + e.what());
        failEntry(entry, ErrorCategory::STRUCTURAL, "Internal error during processing", result);
    }
}

CoordinatorResult LifecycleCoordinator::reject(int64_t id, const std::string &notes, std::optional<bool> delete_source)
{
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (active_ids_.count(id) > 0)
        {
            CoordinatorResult result;
            result.entry_id = id;
            result.error = CoordinatorError::INVALID_STATE;
            result.message = "Movie " + std::to_string(id) + " cannot be rejected while processing";
            return result;
        }
    }

    TransitionResult transition = store_.rejectPending(id, notes);
    if (!transition.ok())
    {
        return fromOutcome(id, transition.outcome, "rejected", transition.entry);
    }

    Logger::info("Rejected movie " + std::to_string(id) + ": " + transition.entry.original_filename);
    if (delete_source.value_or(settings_.delete_source_on_reject) &&
        !TransferEngine::deleteSource(transition.entry.original_path))
    {
        Logger::warn("Movie " + std::to_string(id) + " rejected but its source file could not be deleted");
    }

    CoordinatorResult result;
    result.entry_id = id;
    result.completed = true;
    result.message = "Movie rejected";
    return result;
}
