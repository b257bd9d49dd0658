#pragma once

#include "database/database_access_queue.hpp"
#include "core/movie_records.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief A read from the store together with the outcome of the read
 *
 * value is default-constructed when status reports a failure, so an empty
 * listing and a failed one are told apart by status alone.
 */
template <typename T>
struct QueryResult
{
    DBOpResult status;
    T value{};

    bool ok() const { return status.success; }
};

enum class TransitionOutcome
{
    OK,
    NOT_FOUND,
    ALREADY_IN_PROGRESS,
    INVALID_STATE,
    DB_ERROR
};

/**
 * @brief Outcome of a guarded status change, with the row as it was read inside the transaction
 */
struct TransitionResult
{
    TransitionOutcome outcome = TransitionOutcome::DB_ERROR;
    PendingEntry entry;
    std::string error_message;

    bool ok() const { return outcome == TransitionOutcome::OK; }
};

/**
 * @brief SQLite store shared by the watcher and the coordinator processes
 *
 * One instance per process, bound to one database file. Every statement runs
 * on the DatabaseAccessQueue thread. Cross-process safety comes from WAL mode,
 * a busy timeout and BEGIN IMMEDIATE transactions; every status change is a
 * compare-and-swap whose guard is derived from StatusTransitions.
 */
class StateStore
{
public:
    explicit StateStore(const std::string &db_path, int busy_timeout_ms = 30000);
    ~StateStore();
    StateStore(const StateStore &) = delete;
    StateStore &operator=(const StateStore &) = delete;

    bool isOpen() const;
    const std::string &path() const { return db_path_; }

    /**
     * @brief Record a stable file as pending
     *
     * A path that already has a pending row or a history record is left alone.
     * @param entry Path, filename, size and metadata; id is honoured when non-zero
     * @return DBOpResult plus true if a row was inserted, false if the path was already known
     */
    std::pair<DBOpResult, bool> insertPending(const PendingEntry &entry);

    std::optional<PendingEntry> getPending(int64_t id);
    std::optional<PendingEntry> getPendingByPath(const std::string &original_path);

    /**
     * @brief All pending-table rows, oldest detection first
     */
    QueryResult<std::vector<PendingEntry>> listPending();

    /**
     * @brief History, newest first
     * @param limit Maximum rows; zero or negative returns everything
     */
    QueryResult<std::vector<ProcessedEntry>> listProcessed(int limit = 50);

    /**
     * @brief Atomically move pending|failed to processing, recording the worker pid
     *
     * The worker's identity (boot id and process start time) is stored with the
     * pid so a recycled pid is not mistaken for the owner. Clears error_message. Fails with NOT_FOUND, ALREADY_IN_PROGRESS or
     * INVALID_STATE without changing anything.
     */
    TransitionResult claimForProcessing(int64_t id, int worker_pid);

    /**
     * @brief processing -> failed, storing the error and bumping retry_count
     */
    DBOpResult markFailed(int64_t id, const std::string &error_message);

    /**
     * @brief In one transaction: insert the approved history record and delete the processing row
     */
    DBOpResult completeApproval(int64_t id, const ProcessedEntry &record);

    /**
     * @brief In one transaction: record a rejection and delete the pending row
     *
     * Allowed from the statuses StatusTransitions::canReject accepts.
     */
    TransitionResult rejectPending(int64_t id, const std::string &notes);

    /**
     * @brief Demote processing rows whose owner is gone to failed
     * @param own_pid Pid of the calling process
     * @param own_active_ids Entries the calling process is actively working on
     * @return DBOpResult plus the number of rows demoted
     */
    std::pair<DBOpResult, int> demoteStaleProcessing(int own_pid, const std::set<int64_t> &own_active_ids);

    QueryResult<MovieStats> getStats();

    // source_entry_id of every history row
    QueryResult<std::vector<int64_t>> allSourceEntryIds();

    void waitForWrites();

    /**
     * @brief "<boot id>:<start time>" of a running process, empty if it cannot be read
     */
    static std::string processIdentity(int pid);

    /**
     * @brief True if pid is running and, when identity is known, is still the same process
     */
    static bool isWorkerAlive(int pid, const std::string &identity);

private:
    friend class DatabaseAccessQueue;

    DBOpResult initialize();
    DBOpResult ensureColumn(const std::string &table, const std::string &column, const std::string &definition);
    DBOpResult executeStatement(const std::string &sql);
    bool beginImmediate(std::string &error);
    void rollback();
    bool commit(std::string &error);
    std::optional<PendingEntry> selectPendingRow(int64_t id, std::string &error);
    static PendingEntry readPendingRow(sqlite3_stmt *stmt);
    static ProcessedEntry readProcessedRow(sqlite3_stmt *stmt);
    DBOpResult insertProcessedRow(const ProcessedEntry &record);

    sqlite3 *db_;
    std::string db_path_;
    int busy_timeout_ms_;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
