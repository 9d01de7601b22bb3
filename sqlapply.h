// Copyright 2026 The sqlapply Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace sqlapply {

/// Arrival sequence number assigned by the upstream reader.
using Seq = std::int64_t;

/// Column value. Uses std::variant to represent SQL types.
/// std::monostate is NULL, and also "absent" for old values.
using Value = std::variant<
    std::monostate,            // NULL
    std::int64_t,              // INTEGER
    double,                    // REAL
    std::string,               // TEXT
    std::vector<std::uint8_t>  // BLOB
>;

/// The type of row operation.
enum class OpType : std::uint8_t {
    Insert = 1,
    Update = 2,
    Delete = 3,
};

const char* op_name(OpType op);

/// One column of a captured row change.
struct Column {
    std::string name;
    Value       old_value;           // populated for UPDATE, DELETE
    Value       value;               // populated for INSERT, UPDATE
    bool        updated    = false;  // value changed by this UPDATE
    bool        unique_key = false;  // part of the row identity
};

/// A single row-level change.
struct DataRecord {
    std::string         table;
    OpType              op = OpType::Insert;
    std::vector<Column> columns;
    Seq                 seq = 0;
};

/// Channel entry with no row data (reader position markers and the like).
/// Acknowledged with its window, never applied.
struct PlaceholderRecord {
    Seq seq = 0;
};

/// End-of-stream marker. The importer exits after the window holding it.
struct FinishedRecord {
    Seq seq = 0;
};

using Record = std::variant<DataRecord, PlaceholderRecord, FinishedRecord>;

std::string to_string(const Value& v);
std::string to_string(const DataRecord& r);

} // namespace sqlapply

// ── error.h ─────────────────────────────────────────────────────
namespace sqlapply {

/// Error codes carried by sqlapply::Error.
enum class ErrorCode : int {
    Ok = 0,
    StorageError,   ///< The target store failed; retried by RetryController.
    WriteFailed,    ///< Retries exhausted, or a sequential record failed.
    InvalidRecord,  ///< A record or bucket violates an engine invariant.
    InvalidState,   ///< Operation not valid in the current lifecycle state.
    Cancelled,      ///< Work abandoned because of a stop request.
};

/// Exception thrown by sqlapply operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace sqlapply

// ── merger.h ────────────────────────────────────────────────────
namespace sqlapply {

/// The compacted records of one window for one table.
///
/// Replaying batch_delete, batch_insert, batch_update and then non_batch
/// produces the same rows as replaying the window in arrival order.
struct GroupedRecords {
    std::string             table;
    std::vector<DataRecord> batch_insert;
    std::vector<DataRecord> batch_update;
    std::vector<DataRecord> batch_delete;
    std::vector<DataRecord> non_batch;  ///< Applied one at a time, in order.

    std::size_t size() const {
        return batch_insert.size() + batch_update.size() +
               batch_delete.size() + non_batch.size();
    }
};

/// Fold the records of one window per unique key and partition the
/// survivors into batchable buckets, one GroupedRecords per table in
/// first-seen order.
std::vector<GroupedRecords> group(const std::vector<DataRecord>& records);

/// Unique-key columns plus the given sharding columns, in column order.
std::vector<Column> extract_condition_columns(
    const DataRecord& record, const std::set<std::string>& sharding_columns);

} // namespace sqlapply

// ── datasource.h ────────────────────────────────────────────────
namespace sqlapply {

/// A prepared statement. Parameter indexes are 1-based.
class Statement {
public:
    virtual ~Statement() = default;

    virtual void bind(int index, const Value& value) = 0;

    /// Queue the currently bound parameters as one batch entry.
    virtual void add_batch() = 0;

    /// Execute every queued entry. Returns the affected row count per entry.
    virtual std::vector<int> execute_batch() = 0;

    /// Execute once with the currently bound parameters.
    virtual int execute_update() = 0;

    /// Zero disables the timeout.
    virtual void set_query_timeout(std::chrono::seconds timeout) = 0;

    /// Abort a running execution. May be called from any thread.
    virtual void cancel() = 0;
};

class Connection {
public:
    virtual ~Connection() = default;

    /// Turning auto-commit off opens a transaction that lasts until
    /// commit() or rollback(). A transaction still open when the
    /// connection is destroyed is rolled back.
    virtual void set_auto_commit(bool auto_commit) = 0;

    virtual std::shared_ptr<Statement> prepare(const std::string& sql) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/// Yields one (usually pooled) connection per call. Must be safe to call
/// from several importers at once.
class DataSource {
public:
    virtual ~DataSource() = default;
    virtual std::unique_ptr<Connection> connect() = 0;
};

} // namespace sqlapply

// ── sql_builder.h ───────────────────────────────────────────────
namespace sqlapply {

/// Dialect-specific compatibility switches.
struct DialectPolicy {
    /// Bind a sharding column's new value in an UPDATE predicate when the
    /// record carries no old value for it.
    bool null_old_sharding_value_uses_new_value = true;
};

/// Dialect-specific statement text. Implementations must be safe for
/// concurrent use.
class SqlBuilder {
public:
    virtual ~SqlBuilder() = default;

    /// Parameters: every column value, in column order.
    virtual std::string build_insert_sql(const std::string& schema,
                                         const DataRecord& record) const = 0;

    /// Parameters: extract_updated_columns(record), then the conditions.
    virtual std::string build_update_sql(
        const std::string& schema, const DataRecord& record,
        const std::vector<Column>& conditions) const = 0;

    /// Parameters: the conditions.
    virtual std::string build_delete_sql(
        const std::string& schema, const DataRecord& record,
        const std::vector<Column>& conditions) const = 0;

    virtual std::vector<Column> extract_updated_columns(
        const DataRecord& record) const = 0;

    virtual const DialectPolicy& policy() const = 0;
};

} // namespace sqlapply

// ── sqlite.h ────────────────────────────────────────────────────
namespace sqlapply {

/// DataSource over SQLite. Opens connections from a filename or URI
/// (SQLITE_OPEN_URI is set, so "file:x?mode=memory&cache=shared" works)
/// and keeps up to max_idle released connections for reuse.
class SqliteDataSource final : public DataSource {
public:
    explicit SqliteDataSource(std::string uri, std::size_t max_idle = 4);
    ~SqliteDataSource() override;

    SqliteDataSource(const SqliteDataSource&) = delete;
    SqliteDataSource& operator=(const SqliteDataSource&) = delete;

    std::unique_ptr<Connection> connect() override;

    std::size_t idle_count() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

/// SqlBuilder for SQLite. The schema is an attached database name;
/// an empty schema leaves table names unqualified.
class SqliteSqlBuilder final : public SqlBuilder {
public:
    explicit SqliteSqlBuilder(DialectPolicy policy = {});
    ~SqliteSqlBuilder() override;

    std::string build_insert_sql(const std::string& schema,
                                 const DataRecord& record) const override;
    std::string build_update_sql(
        const std::string& schema, const DataRecord& record,
        const std::vector<Column>& conditions) const override;
    std::string build_delete_sql(
        const std::string& schema, const DataRecord& record,
        const std::vector<Column>& conditions) const override;
    std::vector<Column> extract_updated_columns(
        const DataRecord& record) const override;
    const DialectPolicy& policy() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlapply

// ── channel.h ───────────────────────────────────────────────────
namespace sqlapply {

/// Source of change records. Records acknowledged through ack() are never
/// delivered again; unacknowledged ones may be.
class Channel {
public:
    virtual ~Channel() = default;

    /// Wait at most `timeout` and return up to `max_count` records,
    /// possibly none.
    virtual std::vector<Record> fetch(std::size_t max_count,
                                      std::chrono::milliseconds timeout) = 0;

    virtual void ack(const std::vector<Record>& records) = 0;
};

/// Bounded in-memory channel.
class MemoryChannel final : public Channel {
public:
    using AckCallback = std::function<void(const std::vector<Record>&)>;

    explicit MemoryChannel(std::size_t capacity = 10000,
                           AckCallback on_ack = nullptr);
    ~MemoryChannel() override;

    /// Blocks while the channel is full.
    void push(Record record);

    /// Returns once max_count records are queued, a FinishedRecord is
    /// queued, or the timeout elapses.
    std::vector<Record> fetch(std::size_t max_count,
                              std::chrono::milliseconds timeout) override;

    void ack(const std::vector<Record>& records) override;

    std::size_t fetch_calls() const;
    std::size_t acked() const;
    std::size_t pending() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlapply

// ── rate_limiter.h ──────────────────────────────────────────────
namespace sqlapply {

/// Write throttle. intercept() may block the calling thread.
class RateLimiter {
public:
    virtual ~RateLimiter() = default;
    virtual void intercept(OpType op, int weight) = 0;

    /// Called when a writer using this limiter is stopped. An intercept()
    /// blocked at that moment must return soon after; the writer then
    /// abandons its flush. May be called from any thread.
    virtual void interrupt() {}
};

} // namespace sqlapply

// ── flush.h ─────────────────────────────────────────────────────
namespace sqlapply {

/// Called after each acknowledged window with the number of INSERT
/// records it contained.
using ProgressCallback = std::function<void(std::size_t inserted)>;

struct ImporterConfig {
    /// Maximum records fetched per window.
    std::size_t batch_size = 1000;

    /// Retries per bucket after the first failed attempt.
    int retry_times = 3;

    /// Longest wait for one channel fetch.
    std::chrono::milliseconds fetch_timeout{3000};

    /// Server-side limit for batched INSERT and DELETE statements.
    std::chrono::seconds query_timeout{30};

    /// Logical table name to target schema. Unlisted tables use "".
    std::map<std::string, std::string> schema_names;

    /// Logical table name to sharding columns, added to update and
    /// delete predicates.
    std::map<std::string, std::set<std::string>> sharding_columns;

    /// Optional throttle. nullptr = unlimited.
    std::shared_ptr<RateLimiter> rate_limiter = nullptr;

    ProgressCallback on_progress = nullptr;

    std::string schema_name(const std::string& table) const;
    const std::set<std::string>& sharding_columns_of(
        const std::string& table) const;
};

/// Capped exponential backoff: min(300000ms, 1000ms << attempt).
std::chrono::milliseconds backoff_delay(int attempt);

/// Retries an attempt on StorageError with backoff_delay() between tries.
class RetryController {
public:
    /// Sleeps for the given delay. Returns false if woken by a stop request.
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    RetryController(int max_retries, Sleeper sleeper);

    /// Throws Error(WriteFailed) once max_retries retries have failed,
    /// Error(Cancelled) if a backoff sleep was interrupted. Any other
    /// error from the attempt propagates unchanged.
    void run(const std::function<void()>& attempt,
             const std::string& what) const;

    int max_retries() const { return max_retries_; }

private:
    int     max_retries_;
    Sleeper sleeper_;
};

/// Applies buckets of records to a DataSource.
///
/// Does NOT own the DataSource or SqlBuilder; both must outlive it.
class FlushExecutor {
public:
    FlushExecutor(DataSource& data_source, const SqlBuilder& builder,
                  ImporterConfig config);
    ~FlushExecutor();

    FlushExecutor(const FlushExecutor&) = delete;
    FlushExecutor& operator=(const FlushExecutor&) = delete;

    /// Apply one non-empty bucket of same-table, same-type records in a
    /// single transaction. Storage failures throw Error(StorageError).
    void flush(const std::vector<DataRecord>& bucket);

    /// Apply records one at a time, in order, on one auto-commit
    /// connection. The first failure throws Error(WriteFailed).
    void flush_sequential(const std::vector<DataRecord>& records);

    /// Cancel in-flight statements, interrupt the rate limiter and refuse
    /// further work.
    void cancel();

    bool cancelled() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlapply

// ── importer.h ──────────────────────────────────────────────────
namespace sqlapply {

/// Pulls windows from a channel, merges them and applies them.
///
/// Does NOT own the DataSource, SqlBuilder or Channel. Caller must keep
/// them alive for the Importer's lifetime.
class Importer {
public:
    Importer(ImporterConfig config, DataSource& data_source,
             const SqlBuilder& builder, Channel& channel);

    /// Stops and joins the worker, if any.
    ~Importer();

    Importer(const Importer&) = delete;
    Importer& operator=(const Importer&) = delete;

    /// Run the fetch-merge-flush loop on the calling thread until a
    /// FinishedRecord window is applied, stop() is called, or a write
    /// fails (the error is rethrown).
    void run();

    /// Run the loop on a dedicated worker thread.
    void start();

    /// Request the loop to stop. Safe from any thread, any number of times.
    void stop();

    /// Wait for the worker started by start(). Rethrows its failure.
    void join();

    /// Importer lifecycle state.
    enum class State : std::uint8_t {
        Idle,      ///< Constructed, loop not started.
        Running,   ///< Fetching and applying windows.
        Stopping,  ///< stop() requested; loop winding down.
        Stopped,   ///< Loop exited. Terminal.
    };

    State state() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlapply
