#include "database/state_store.hpp"
#include "core/movie_status.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <csignal>
#include <fstream>
#include <sstream>
#include <sys/types.h>

namespace
{
    const char *PENDING_COLUMNS =
        "id, original_path, original_filename, file_size_bytes, detected_at, status, "
        "error_message, retry_count, file_metadata, worker_pid, updated_at, worker_identity";

    const char *PROCESSED_COLUMNS =
        "id, source_entry_id, original_path, original_filename, file_size_bytes, detected_at, "
        "processed_at, action, final_filename, destination_path, version_number, resolver_output, notes";

    std::string columnText(sqlite3_stmt *stmt, int col)
    {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
            return "";
        return reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
    }

    void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
    {
        if (value.empty())
            sqlite3_bind_null(stmt, index);
        else
            sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    template <typename T>
    QueryResult<T> awaitQuery(std::future<std::any> &future, const std::string &what)
    {
        QueryResult<T> query;
        try
        {
            query = std::any_cast<QueryResult<T>>(future.get());
        }
        catch (const std::exception &e)
        {
            query.status = DBOpResult(false, e.what());
        }
        if (!query.ok())
        {
            Logger::error("Failed to " + what + ": " + query.status.error_message);
            query.value = T{};
        }
        return query;
    }

    std::string readBootId()
    {
        std::ifstream in("/proc/sys/kernel/random/boot_id");
        std::string boot_id;
        std::getline(in, boot_id);
        return boot_id;
    }
}

StateStore::StateStore(const std::string &db_path, int busy_timeout_ms)
    : db_(nullptr), db_path_(db_path), busy_timeout_ms_(busy_timeout_ms)
{
    Logger::info("StateStore opening database: " + db_path);
    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    auto open_future = access_queue_->enqueueRead([](StateStore &store)
                                                  {
        int rc = sqlite3_open(store.db_path_.c_str(), &store.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(store.db_)));
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            return false;
        }
        sqlite3_busy_timeout(store.db_, store.busy_timeout_ms_);

        // WAL lets the watcher insert while the coordinator reads
        rc = sqlite3_exec(store.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(store.db_)));
        }
        else
        {
            Logger::debug("WAL mode enabled for database: " + store.db_path_);
        }
        sqlite3_exec(store.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_exec(store.db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
        return true; });

    bool open_success = false;
    try
    {
        open_success = std::any_cast<bool>(open_future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Database open failed in access queue: " + std::string(e.what()));
    }
    if (!open_success)
    {
        return;
    }

    DBOpResult init = initialize();
    if (!init.success)
    {
        Logger::error("Database schema initialization failed: " + init.error_message);
    }
}

StateStore::~StateStore()
{
    if (access_queue_)
    {
        auto close_future = access_queue_->enqueueRead([](StateStore &store)
                                                       {
            if (store.db_)
            {
                sqlite3_close(store.db_);
                store.db_ = nullptr;
                Logger::debug("Database connection closed");
            }
            return true; });
        try
        {
            close_future.get();
        }
        catch (const std::exception &e)
        {
            Logger::warn("Database close failed: " + std::string(e.what()));
        }
        access_queue_->stop();
    }
}

bool StateStore::isOpen() const
{
    return db_ != nullptr;
}

void StateStore::waitForWrites()
{
    if (access_queue_)
    {
        access_queue_->wait_for_completion();
    }
}

DBOpResult StateStore::initialize()
{
    const std::string schema = R"(
        CREATE TABLE IF NOT EXISTS pending_entries (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            original_path TEXT NOT NULL UNIQUE,
            original_filename TEXT NOT NULL,
            file_size_bytes INTEGER NOT NULL,
            detected_at TEXT NOT NULL DEFAULT (datetime('now')),
            status TEXT NOT NULL DEFAULT 'pending'
                CHECK (status IN ('pending', 'processing', 'completed', 'failed')),
            error_message TEXT,
            retry_count INTEGER NOT NULL DEFAULT 0,
            file_metadata TEXT,
            worker_pid INTEGER NOT NULL DEFAULT 0,
            updated_at TEXT NOT NULL DEFAULT (datetime('now')),
            worker_identity TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_pending_status ON pending_entries(status);
        CREATE TABLE IF NOT EXISTS processed_entries (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source_entry_id INTEGER NOT NULL UNIQUE,
            original_path TEXT NOT NULL,
            original_filename TEXT NOT NULL,
            file_size_bytes INTEGER NOT NULL,
            detected_at TEXT NOT NULL,
            processed_at TEXT NOT NULL DEFAULT (datetime('now')),
            action TEXT NOT NULL CHECK (action IN ('approved', 'rejected')),
            final_filename TEXT,
            destination_path TEXT,
            version_number INTEGER NOT NULL DEFAULT 1,
            resolver_output TEXT,
            notes TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_processed_at ON processed_entries(processed_at);
        CREATE INDEX IF NOT EXISTS idx_processed_path ON processed_entries(original_path);
    )";

    WriteOperationResult result = access_queue_->executeWrite([&schema](StateStore &store)
                                                              {
        DBOpResult r = store.executeStatement(schema);
        return WriteOperationResult(r.success, r.error_message); });
    if (!result.success)
        return DBOpResult(false, result.error_message);

    // Databases created before worker identities were recorded
    return ensureColumn("pending_entries", "worker_identity", "TEXT");
}

DBOpResult StateStore::ensureColumn(const std::string &table, const std::string &column, const std::string &definition)
{
    WriteOperationResult result = access_queue_->executeWrite([&](StateStore &store)
                                                              {
        const std::string info_sql = "PRAGMA table_info(" + table + ")";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, info_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            return WriteOperationResult::Failure("Failed to read columns of " + table + ": " + sqlite3_errmsg(store.db_));
        bool present = false;
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            if (columnText(stmt, 1) == column)
                present = true;
        }
        sqlite3_finalize(stmt);
        if (present)
            return WriteOperationResult();

        Logger::info("Adding column " + table + "." + column);
        DBOpResult r = store.executeStatement("ALTER TABLE " + table + " ADD COLUMN " + column + " " + definition);
        return WriteOperationResult(r.success, r.error_message); });
    return DBOpResult(result.success, result.error_message);
}

// Access thread only
DBOpResult StateStore::executeStatement(const std::string &sql)
{
    if (!db_)
        return DBOpResult(false, "Database not initialized");
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        return DBOpResult(false, error);
    }
    return DBOpResult(true);
}

bool StateStore::beginImmediate(std::string &error)
{
    DBOpResult r = executeStatement("BEGIN IMMEDIATE;");
    if (!r.success)
        error = "Failed to begin transaction: " + r.error_message;
    return r.success;
}

void StateStore::rollback()
{
    DBOpResult r = executeStatement("ROLLBACK;");
    if (!r.success)
        Logger::warn("Rollback failed: " + r.error_message);
}

bool StateStore::commit(std::string &error)
{
    DBOpResult r = executeStatement("COMMIT;");
    if (!r.success)
    {
        error = "Failed to commit transaction: " + r.error_message;
        rollback();
    }
    return r.success;
}

PendingEntry StateStore::readPendingRow(sqlite3_stmt *stmt)
{
    PendingEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.original_path = columnText(stmt, 1);
    entry.original_filename = columnText(stmt, 2);
    entry.file_size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    entry.detected_at = columnText(stmt, 4);
    entry.status = MovieStatus::statusFromString(columnText(stmt, 5)).value_or(PendingStatus::PENDING);
    entry.error_message = columnText(stmt, 6);
    entry.retry_count = sqlite3_column_int(stmt, 7);
    entry.file_metadata = columnText(stmt, 8);
    entry.worker_pid = sqlite3_column_int(stmt, 9);
    entry.updated_at = columnText(stmt, 10);
    entry.worker_identity = columnText(stmt, 11);
    return entry;
}

ProcessedEntry StateStore::readProcessedRow(sqlite3_stmt *stmt)
{
    ProcessedEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.source_entry_id = sqlite3_column_int64(stmt, 1);
    entry.original_path = columnText(stmt, 2);
    entry.original_filename = columnText(stmt, 3);
    entry.file_size_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    entry.detected_at = columnText(stmt, 5);
    entry.processed_at = columnText(stmt, 6);
    entry.action = MovieStatus::actionFromString(columnText(stmt, 7)).value_or(ProcessedAction::APPROVED);
    entry.final_filename = columnText(stmt, 8);
    entry.destination_path = columnText(stmt, 9);
    entry.version_number = sqlite3_column_int(stmt, 10);
    entry.resolver_output = columnText(stmt, 11);
    entry.notes = columnText(stmt, 12);
    return entry;
}

// Access thread only
std::optional<PendingEntry> StateStore::selectPendingRow(int64_t id, std::string &error)
{
    const std::string sql = std::string("SELECT ") + PENDING_COLUMNS + " FROM pending_entries WHERE id = ?";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        error = "Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);
    std::optional<PendingEntry> entry;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        entry = readPendingRow(stmt);
    }
    else if (rc != SQLITE_DONE)
    {
        error = "Failed to read pending entry: " + std::string(sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return entry;
}

// Access thread only
DBOpResult StateStore::insertProcessedRow(const ProcessedEntry &record)
{
    const std::string sql = R"(
        INSERT INTO processed_entries (source_entry_id, original_path, original_filename, file_size_bytes,
                                       detected_at, action, final_filename, destination_path,
                                       version_number, resolver_output, notes)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return DBOpResult(false, "Failed to prepare history insert: " + std::string(sqlite3_errmsg(db_)));
    }
    std::string action = MovieStatus::toString(record.action);
    sqlite3_bind_int64(stmt, 1, record.source_entry_id);
    sqlite3_bind_text(stmt, 2, record.original_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.original_filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.file_size_bytes));
    sqlite3_bind_text(stmt, 5, record.detected_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, action.c_str(), -1, SQLITE_TRANSIENT);
    bindOptionalText(stmt, 7, record.final_filename);
    bindOptionalText(stmt, 8, record.destination_path);
    sqlite3_bind_int(stmt, 9, record.version_number);
    bindOptionalText(stmt, 10, record.resolver_output);
    bindOptionalText(stmt, 11, record.notes);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return DBOpResult(false, "Failed to insert history record: " + std::string(sqlite3_errmsg(db_)));
    }
    return DBOpResult(true);
}

std::pair<DBOpResult, bool> StateStore::insertPending(const PendingEntry &entry)
{
    bool inserted = false;
    WriteOperationResult result = access_queue_->executeWrite([&entry, &inserted](StateStore &store)
                                                              {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");

        // A path with a history record was already handled; it never becomes pending again
        const std::string sql = R"(
            INSERT INTO pending_entries (id, original_path, original_filename, file_size_bytes,
                                         detected_at, status, file_metadata)
            SELECT ?1, ?2, ?3, ?4, COALESCE(?5, datetime('now')), 'pending', ?6
            WHERE NOT EXISTS (SELECT 1 FROM processed_entries WHERE original_path = ?2)
            ON CONFLICT(original_path) DO NOTHING
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(store.db_)));
        }
        if (entry.id > 0)
            sqlite3_bind_int64(stmt, 1, entry.id);
        else
            sqlite3_bind_null(stmt, 1);
        sqlite3_bind_text(stmt, 2, entry.original_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, entry.original_filename.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(entry.file_size_bytes));
        bindOptionalText(stmt, 5, entry.detected_at);
        bindOptionalText(stmt, 6, entry.file_metadata);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure("Failed to insert pending entry: " + std::string(sqlite3_errmsg(store.db_)));
        }
        inserted = sqlite3_changes(store.db_) == 1;
        return WriteOperationResult(); });

    if (!result.success)
    {
        Logger::error("insertPending failed for " + entry.original_path + ": " + result.error_message);
    }
    return {DBOpResult(result.success, result.error_message), inserted};
}

std::optional<PendingEntry> StateStore::getPending(int64_t id)
{
    auto future = access_queue_->enqueueRead([id](StateStore &store)
                                             {
        if (!store.db_)
            return std::any(std::optional<PendingEntry>());
        std::string error;
        auto entry = store.selectPendingRow(id, error);
        if (!error.empty())
            Logger::error(error);
        return std::any(entry); });
    try
    {
        return std::any_cast<std::optional<PendingEntry>>(future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to get pending entry: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<PendingEntry> StateStore::getPendingByPath(const std::string &original_path)
{
    auto future = access_queue_->enqueueRead([original_path](StateStore &store)
                                             {
        std::optional<PendingEntry> entry;
        if (!store.db_)
            return std::any(entry);
        const std::string sql = std::string("SELECT ") + PENDING_COLUMNS + " FROM pending_entries WHERE original_path = ?";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(entry);
        }
        sqlite3_bind_text(stmt, 1, original_path.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) == SQLITE_ROW)
            entry = readPendingRow(stmt);
        sqlite3_finalize(stmt);
        return std::any(entry); });
    try
    {
        return std::any_cast<std::optional<PendingEntry>>(future.get());
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to get pending entry by path: " + std::string(e.what()));
        return std::nullopt;
    }
}

QueryResult<std::vector<PendingEntry>> StateStore::listPending()
{
    auto future = access_queue_->enqueueRead([](StateStore &store)
                                             {
        QueryResult<std::vector<PendingEntry>> query;
        if (!store.db_)
        {
            query.status = DBOpResult(false, "Database not initialized");
            return std::any(query);
        }
        const std::string sql = std::string("SELECT ") + PENDING_COLUMNS +
                                " FROM pending_entries ORDER BY detected_at ASC, id ASC";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            query.status = DBOpResult(false, "Failed to prepare select statement: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(query);
        }
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
            query.value.push_back(readPendingRow(stmt));
        if (rc != SQLITE_DONE)
            query.status = DBOpResult(false, "Failed to read pending entries: " + std::string(sqlite3_errmsg(store.db_)));
        sqlite3_finalize(stmt);
        return std::any(query); });
    return awaitQuery<std::vector<PendingEntry>>(future, "list pending entries");
}

QueryResult<std::vector<ProcessedEntry>> StateStore::listProcessed(int limit)
{
    auto future = access_queue_->enqueueRead([limit](StateStore &store)
                                             {
        QueryResult<std::vector<ProcessedEntry>> query;
        if (!store.db_)
        {
            query.status = DBOpResult(false, "Database not initialized");
            return std::any(query);
        }
        const std::string sql = std::string("SELECT ") + PROCESSED_COLUMNS +
                                " FROM processed_entries ORDER BY processed_at DESC, id DESC LIMIT ?";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            query.status = DBOpResult(false, "Failed to prepare select statement: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(query);
        }
        sqlite3_bind_int(stmt, 1, limit > 0 ? limit : -1);
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
            query.value.push_back(readProcessedRow(stmt));
        if (rc != SQLITE_DONE)
            query.status = DBOpResult(false, "Failed to read history: " + std::string(sqlite3_errmsg(store.db_)));
        sqlite3_finalize(stmt);
        return std::any(query); });
    return awaitQuery<std::vector<ProcessedEntry>>(future, "list processed entries");
}

TransitionResult StateStore::claimForProcessing(int64_t id, int worker_pid)
{
    TransitionResult outcome;
    const std::string identity = processIdentity(worker_pid);
    WriteOperationResult result = access_queue_->executeWrite([id, worker_pid, &identity, &outcome](StateStore &store)
                                                              {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");

        std::string error;
        if (!store.beginImmediate(error))
            return WriteOperationResult::Failure(error);

        const std::string sql =
            "UPDATE pending_entries SET status = 'processing', error_message = NULL, worker_pid = ?, "
            "worker_identity = ?, updated_at = datetime('now') WHERE id = ? AND status IN " +
            StatusTransitions::sqlSourceList(StatusTransitions::sourcesFor(PendingStatus::PROCESSING));
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            error = "Failed to prepare claim statement: " + std::string(sqlite3_errmsg(store.db_));
            store.rollback();
            return WriteOperationResult::Failure(error);
        }
        sqlite3_bind_int(stmt, 1, worker_pid);
        bindOptionalText(stmt, 2, identity);
        sqlite3_bind_int64(stmt, 3, id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            error = "Failed to claim entry: " + std::string(sqlite3_errmsg(store.db_));
            store.rollback();
            return WriteOperationResult::Failure(error);
        }
        bool claimed = sqlite3_changes(store.db_) == 1;

        auto row = store.selectPendingRow(id, error);
        if (!error.empty())
        {
            store.rollback();
            return WriteOperationResult::Failure(error);
        }

        if (!claimed)
        {
            store.rollback();
            if (!row)
                outcome.outcome = TransitionOutcome::NOT_FOUND;
            else if (row->status == PendingStatus::PROCESSING)
                outcome.outcome = TransitionOutcome::ALREADY_IN_PROGRESS;
            else
                outcome.outcome = TransitionOutcome::INVALID_STATE;
            if (row)
                outcome.entry = *row;
            return WriteOperationResult();
        }

        if (!store.commit(error))
            return WriteOperationResult::Failure(error);
        outcome.outcome = TransitionOutcome::OK;
        outcome.entry = *row;
        return WriteOperationResult(); });

    if (!result.success)
    {
        outcome.outcome = TransitionOutcome::DB_ERROR;
        outcome.error_message = result.error_message;
        Logger::error("claimForProcessing failed for entry " + std::to_string(id) + ": " + result.error_message);
    }
    return outcome;
}

DBOpResult StateStore::markFailed(int64_t id, const std::string &error_message)
{
    WriteOperationResult result = access_queue_->executeWrite([id, &error_message](StateStore &store)
                                                              {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");
        const std::string sql =
            "UPDATE pending_entries SET status = 'failed', error_message = ?, retry_count = retry_count + 1, "
            "worker_pid = 0, worker_identity = NULL, updated_at = datetime('now') WHERE id = ? AND status IN " +
            StatusTransitions::sqlSourceList(StatusTransitions::sourcesFor(PendingStatus::FAILED));
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure("Failed to prepare update statement: " + std::string(sqlite3_errmsg(store.db_)));
        }
        sqlite3_bind_text(stmt, 1, error_message.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
            return WriteOperationResult::Failure("Failed to mark entry failed: " + std::string(sqlite3_errmsg(store.db_)));
        if (sqlite3_changes(store.db_) != 1)
            return WriteOperationResult::Failure("Entry " + std::to_string(id) + " is not processing");
        return WriteOperationResult(); });

    return DBOpResult(result.success, result.error_message);
}

DBOpResult StateStore::completeApproval(int64_t id, const ProcessedEntry &record)
{
    WriteOperationResult result = access_queue_->executeWrite([id, &record](StateStore &store)
                                                              {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");

        std::string error;
        if (!store.beginImmediate(error))
            return WriteOperationResult::Failure(error);

        auto row = store.selectPendingRow(id, error);
        if (!row || !StatusTransitions::isLegal(row->status, PendingStatus::COMPLETED))
        {
            store.rollback();
            if (error.empty())
                error = row ? "Entry " + std::to_string(id) + " is " + MovieStatus::toString(row->status) + ", not processing"
                            : "Entry " + std::to_string(id) + " not found";
            return WriteOperationResult::Failure(error);
        }

        ProcessedEntry history = record;
        history.source_entry_id = row->id;
        history.original_path = row->original_path;
        history.original_filename = row->original_filename;
        history.file_size_bytes = row->file_size_bytes;
        history.detected_at = row->detected_at;
        history.action = ProcessedAction::APPROVED;
        DBOpResult inserted = store.insertProcessedRow(history);
        if (!inserted.success)
        {
            store.rollback();
            return WriteOperationResult::Failure(inserted.error_message);
        }

        const std::string delete_sql = "DELETE FROM pending_entries WHERE id = ? AND status IN " +
                                       StatusTransitions::sqlSourceList(StatusTransitions::sourcesFor(PendingStatus::COMPLETED));
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, delete_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            error = "Failed to prepare delete statement: " + std::string(sqlite3_errmsg(store.db_));
            store.rollback();
            return WriteOperationResult::Failure(error);
        }
        sqlite3_bind_int64(stmt, 1, id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE || sqlite3_changes(store.db_) != 1)
        {
            error = "Failed to remove pending entry " + std::to_string(id) + ": " + sqlite3_errmsg(store.db_);
            store.rollback();
            return WriteOperationResult::Failure(error);
        }

        if (!store.commit(error))
            return WriteOperationResult::Failure(error);
        return WriteOperationResult(); });

    if (!result.success)
    {
        Logger::error("completeApproval failed for entry " + std::to_string(id) + ": " + result.error_message);
    }
    return DBOpResult(result.success, result.error_message);
}

TransitionResult StateStore::rejectPending(int64_t id, const std::string &notes)
{
    TransitionResult outcome;
    WriteOperationResult result = access_queue_->executeWrite([id, &notes, &outcome](StateStore &store)
                                                              {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");

        std::string error;
        if (!store.beginImmediate(error))
            return WriteOperationResult::Failure(error);

        auto row = store.selectPendingRow(id, error);
        if (!error.empty())
        {
            store.rollback();
            return WriteOperationResult::Failure(error);
        }
        if (!row)
        {
            store.rollback();
            outcome.outcome = TransitionOutcome::NOT_FOUND;
            return WriteOperationResult();
        }
        outcome.entry = *row;
        if (!StatusTransitions::canReject(row->status))
        {
            store.rollback();
            outcome.outcome = TransitionOutcome::INVALID_STATE;
            return WriteOperationResult();
        }

        ProcessedEntry history;
        history.source_entry_id = row->id;
        history.original_path = row->original_path;
        history.original_filename = row->original_filename;
        history.file_size_bytes = row->file_size_bytes;
        history.detected_at = row->detected_at;
        history.action = ProcessedAction::REJECTED;
        history.notes = notes;
        DBOpResult inserted = store.insertProcessedRow(history);
        if (!inserted.success)
        {
            store.rollback();
            return WriteOperationResult::Failure(inserted.error_message);
        }

        const std::string delete_sql = "DELETE FROM pending_entries WHERE id = ? AND status IN " +
                                       StatusTransitions::sqlSourceList(StatusTransitions::rejectableStatuses());
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, delete_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            error = "Failed to prepare delete statement: " + std::string(sqlite3_errmsg(store.db_));
            store.rollback();
            return WriteOperationResult::Failure(error);
        }
        sqlite3_bind_int64(stmt, 1, id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE || sqlite3_changes(store.db_) != 1)
        {
            error = "Failed to remove pending entry " + std::to_string(id) + ": " + sqlite3_errmsg(store.db_);
            store.rollback();
            return WriteOperationResult::Failure(error);
        }

        if (!store.commit(error))
            return WriteOperationResult::Failure(error);
        outcome.outcome = TransitionOutcome::OK;
        return WriteOperationResult(); });

    if (!result.success)
    {
        outcome.outcome = TransitionOutcome::DB_ERROR;
        outcome.error_message = result.error_message;
        Logger::error("rejectPending failed for entry " + std::to_string(id) + ": " + result.error_message);
    }
    return outcome;
}

std::pair<DBOpResult, int> StateStore::demoteStaleProcessing(int own_pid, const std::set<int64_t> &own_active_ids)
{
    int demoted = 0;
    WriteOperationResult result = access_queue_->executeWrite([own_pid, &own_active_ids, &demoted](StateStore &store)
                                                              {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");

        std::string error;
        if (!store.beginImmediate(error))
            return WriteOperationResult::Failure(error);

        std::vector<std::pair<int64_t, int>> stale;
        sqlite3_stmt *stmt = nullptr;
        const char *select_sql = "SELECT id, worker_pid, worker_identity FROM pending_entries WHERE status = 'processing'";
        if (sqlite3_prepare_v2(store.db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            error = "Failed to prepare select statement: " + std::string(sqlite3_errmsg(store.db_));
            store.rollback();
            return WriteOperationResult::Failure(error);
        }
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            int64_t id = sqlite3_column_int64(stmt, 0);
            int pid = sqlite3_column_int(stmt, 1);
            std::string identity = columnText(stmt, 2);
            bool owner_gone = (pid == own_pid) ? own_active_ids.count(id) == 0 : !isWorkerAlive(pid, identity);
            if (owner_gone)
                stale.emplace_back(id, pid);
        }
        sqlite3_finalize(stmt);

        const std::string update_sql =
            "UPDATE pending_entries SET status = 'failed', error_message = ?, retry_count = retry_count + 1, "
            "worker_pid = 0, worker_identity = NULL, updated_at = datetime('now') WHERE id = ? AND worker_pid = ? AND status IN " +
            StatusTransitions::sqlSourceList(StatusTransitions::sourcesFor(PendingStatus::FAILED));
        for (const auto &[id, pid] : stale)
        {
            if (sqlite3_prepare_v2(store.db_, update_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            {
                error = "Failed to prepare update statement: " + std::string(sqlite3_errmsg(store.db_));
                store.rollback();
                return WriteOperationResult::Failure(error);
            }
            std::string message = "Stale processing: worker process " + std::to_string(pid) +
                                  " is no longer running";
            sqlite3_bind_text(stmt, 1, message.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, id);
            sqlite3_bind_int(stmt, 3, pid);
            int rc = sqlite3_step(stmt);
            sqlite3_finalize(stmt);
            if (rc != SQLITE_DONE)
            {
                error = "Failed to demote entry " + std::to_string(id) + ": " + sqlite3_errmsg(store.db_);
                store.rollback();
                return WriteOperationResult::Failure(error);
            }
            demoted += sqlite3_changes(store.db_);
            Logger::warn("Demoted stale processing entry " + std::to_string(id) + " (worker pid " + std::to_string(pid) + ")");
        }

        if (!store.commit(error))
            return WriteOperationResult::Failure(error);
        return WriteOperationResult(); });

    if (!result.success)
    {
        demoted = 0;
    }
    return {DBOpResult(result.success, result.error_message), demoted};
}

QueryResult<MovieStats> StateStore::getStats()
{
    auto future = access_queue_->enqueueRead([](StateStore &store)
                                             {
        QueryResult<MovieStats> query;
        if (!store.db_)
        {
            query.status = DBOpResult(false, "Database not initialized");
            return std::any(query);
        }
        const char *sql = R"(
            SELECT status, COUNT(*) FROM pending_entries GROUP BY status
            UNION ALL
            SELECT action, COUNT(*) FROM processed_entries GROUP BY action
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            query.status = DBOpResult(false, "Failed to prepare stats statement: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(query);
        }
        MovieStats &stats = query.value;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            std::string key = columnText(stmt, 0);
            size_t count = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
            if (key == "pending")
                stats.pending_count += count;
            else if (key == "processing")
                stats.processing_count += count;
            else if (key == "completed" || key == "approved")
                stats.completed_count += count;
            else if (key == "failed")
                stats.failed_count += count;
            else if (key == "rejected")
                stats.rejected_count += count;
        }
        if (rc != SQLITE_DONE)
            query.status = DBOpResult(false, "Failed to count entries: " + std::string(sqlite3_errmsg(store.db_)));
        sqlite3_finalize(stmt);
        return std::any(query); });
    return awaitQuery<MovieStats>(future, "compute stats");
}

QueryResult<std::vector<int64_t>> StateStore::allSourceEntryIds()
{
    auto future = access_queue_->enqueueRead([](StateStore &store)
                                             {
        QueryResult<std::vector<int64_t>> query;
        if (!store.db_)
        {
            query.status = DBOpResult(false, "Database not initialized");
            return std::any(query);
        }
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, "SELECT source_entry_id FROM processed_entries ORDER BY source_entry_id",
                               -1, &stmt, nullptr) != SQLITE_OK)
        {
            query.status = DBOpResult(false, "Failed to prepare select statement: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(query);
        }
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
            query.value.push_back(sqlite3_column_int64(stmt, 0));
        if (rc != SQLITE_DONE)
            query.status = DBOpResult(false, "Failed to read history ids: " + std::string(sqlite3_errmsg(store.db_)));
        sqlite3_finalize(stmt);
        return std::any(query); });
    return awaitQuery<std::vector<int64_t>>(future, "list history ids");
}

std::string StateStore::processIdentity(int pid)
{
    if (pid <= 0)
        return "";
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(in, line))
        return "";

    // comm may contain spaces and parentheses; fields resume after the last ')'
    size_t close = line.rfind(')');
    if (close == std::string::npos)
        return "";
    std::istringstream fields(line.substr(close + 1));
    std::string field;
    // state is field 3, starttime is field 22
    for (int index = 3; index <= 22; ++index)
    {
        if (!(fields >> field))
            return "";
    }

    std::string boot_id = readBootId();
    if (boot_id.empty())
        return "";
    return boot_id + ":" + field;
}

bool StateStore::isWorkerAlive(int pid, const std::string &identity)
{
    if (pid <= 0)
        return false;
    if (!identity.empty())
    {
        std::string current = processIdentity(pid);
        if (!current.empty())
            return current == identity;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno == EPERM;
}
