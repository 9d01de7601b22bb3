// Copyright 2026 The sqlapply Authors
// SPDX-License-Identifier: Apache-2.0
#include "sqlapply.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <span>
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace sqlapply::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::StorageError,
                    msg + " (sql: " + sql + ")");
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::StorageError,
                    std::string(sqlite3_errmsg(db)) + " (sql: " + sql + ")");
    }
    return StmtGuard(stmt);
}

inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

} // namespace sqlapply::detail

// ── types.cpp ───────────────────────────────────────────────────
namespace sqlapply {

const char* op_name(OpType op) {
    switch (op) {
    case OpType::Insert: return "INSERT";
    case OpType::Update: return "UPDATE";
    case OpType::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

std::string to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(x);
        }
        else if constexpr (std::is_same_v<T, double>) {
            return std::to_string(x);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + x + "'";
        }
        else {
            static constexpr char kHex[] = "0123456789abcdef";
            std::string s = "x'";
            for (auto b : x) {
                s.push_back(kHex[b >> 4]);
                s.push_back(kHex[b & 0x0f]);
            }
            return s + "'";
        }
    }, v);
}

std::string to_string(const DataRecord& r) {
    std::string s = "DataRecord{table=" + r.table +
                    ", op=" + op_name(r.op) +
                    ", seq=" + std::to_string(r.seq) + ", columns=[";
    for (std::size_t i = 0; i < r.columns.size(); ++i) {
        const auto& c = r.columns[i];
        if (i > 0) s += ", ";
        s += c.name;
        if (c.unique_key) s += "*";
        s += "=";
        if (r.op != OpType::Insert) s += to_string(c.old_value) + "->";
        s += to_string(c.value);
    }
    return s + "]}";
}

} // namespace sqlapply

// ── merger.cpp ──────────────────────────────────────────────────
namespace sqlapply {

namespace {

/// Table name plus unique-key values.
using RecordKey = std::pair<std::string, std::vector<Value>>;

bool has_unique_key(const DataRecord& r) {
    return std::any_of(r.columns.begin(), r.columns.end(),
                       [](const Column& c) { return c.unique_key; });
}

// Identity of the row as it was before the change. An absent old value
// means the key column did not change.
RecordKey before_key(const DataRecord& r) {
    RecordKey key{r.table, {}};
    for (const auto& c : r.columns) {
        if (!c.unique_key) continue;
        switch (r.op) {
        case OpType::Insert:
            key.second.push_back(c.value);
            break;
        case OpType::Update:
        case OpType::Delete:
            key.second.push_back(detail::is_null(c.old_value) ? c.value
                                                              : c.old_value);
            break;
        }
    }
    return key;
}

RecordKey after_key(const DataRecord& r) {
    RecordKey key{r.table, {}};
    for (const auto& c : r.columns) {
        if (c.unique_key) key.second.push_back(c.value);
    }
    return key;
}

// Same column names, order and key flags: one statement text fits both.
bool same_shape(const DataRecord& a, const DataRecord& b) {
    if (a.columns.size() != b.columns.size()) return false;
    for (std::size_t i = 0; i < a.columns.size(); ++i) {
        if (a.columns[i].name != b.columns[i].name ||
            a.columns[i].unique_key != b.columns[i].unique_key) {
            return false;
        }
    }
    return true;
}

Column* find_column(DataRecord& r, const std::string& name) {
    for (auto& c : r.columns) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

bool fold_into_insert(DataRecord& insert, const DataRecord& update) {
    for (const auto& c : update.columns) {
        if (!find_column(insert, c.name)) return false;
    }
    for (const auto& c : update.columns) {
        find_column(insert, c.name)->value = c.value;
    }
    return true;
}

// Keeps the first update's old values; they are the predicate.
bool fold_into_update(DataRecord& first, const DataRecord& latest) {
    if (!same_shape(first, latest)) return false;
    for (std::size_t i = 0; i < first.columns.size(); ++i) {
        auto& c = first.columns[i];
        c.value = latest.columns[i].value;
        c.updated = c.updated || latest.columns[i].updated;
    }
    return true;
}

enum class MergeAction {
    Fold,      // incoming folds into the prior record
    Cancel,    // prior and incoming annihilate
    Append,    // both kept; bucket order runs them in sequence
    Conflict,  // key must be applied sequentially from here on
};

MergeAction merge_action(OpType prior, OpType incoming) {
    switch (prior) {
    case OpType::Insert:
        switch (incoming) {
        case OpType::Insert: return MergeAction::Conflict;
        case OpType::Update: return MergeAction::Fold;
        case OpType::Delete: return MergeAction::Cancel;
        }
        break;
    case OpType::Update:
        switch (incoming) {
        case OpType::Insert: return MergeAction::Conflict;
        case OpType::Update: return MergeAction::Fold;
        case OpType::Delete: return MergeAction::Conflict;
        }
        break;
    case OpType::Delete:
        switch (incoming) {
        case OpType::Insert: return MergeAction::Append;
        case OpType::Update: return MergeAction::Conflict;
        case OpType::Delete: return MergeAction::Conflict;
        }
        break;
    }
    return MergeAction::Conflict;
}

// Merge state for one window.
//
// Every untainted key owns a chain of surviving batchable slots in arrival
// order. A tainted key has no chain: all of its records, past and future,
// sit in non_batch.
class Merger {
public:
    void add(const DataRecord& record);
    std::vector<GroupedRecords> finish();

private:
    struct Slot {
        DataRecord record;
        RecordKey  key;
        bool       alive     = true;
        bool       batchable = true;
    };

    void append(const DataRecord& record, RecordKey key, bool batchable);
    void demote(const RecordKey& key);
    void taint(const RecordKey& key);

    std::vector<Slot>                               slots_;
    std::map<RecordKey, std::vector<std::size_t>>   chains_;
    std::set<RecordKey>                             tainted_;
};

void Merger::add(const DataRecord& record) {
    if (!has_unique_key(record)) {
        append(record, RecordKey{record.table, {}}, false);
        return;
    }

    auto key = before_key(record);
    if (record.op == OpType::Update) {
        auto moved_to = after_key(record);
        if (moved_to != key) {
            taint(key);
            taint(moved_to);
            append(record, std::move(key), false);
            return;
        }
    }

    if (tainted_.count(key)) {
        append(record, std::move(key), false);
        return;
    }

    auto it = chains_.find(key);
    if (it == chains_.end() || it->second.empty()) {
        append(record, std::move(key), true);
        return;
    }

    auto& prior = slots_[it->second.back()];
    switch (merge_action(prior.record.op, record.op)) {
    case MergeAction::Fold: {
        bool folded = prior.record.op == OpType::Insert
            ? fold_into_insert(prior.record, record)
            : fold_into_update(prior.record, record);
        if (folded) return;
        break;
    }
    case MergeAction::Cancel:
        prior.alive = false;
        it->second.pop_back();
        return;
    case MergeAction::Append:
        append(record, std::move(key), true);
        return;
    case MergeAction::Conflict:
        break;
    }

    taint(key);
    append(record, std::move(key), false);
}

void Merger::append(const DataRecord& record, RecordKey key, bool batchable) {
    slots_.push_back(Slot{record, std::move(key), true, batchable});
    if (batchable) {
        chains_[slots_.back().key].push_back(slots_.size() - 1);
    }
}

void Merger::demote(const RecordKey& key) {
    auto it = chains_.find(key);
    if (it == chains_.end()) return;
    for (auto idx : it->second) {
        slots_[idx].batchable = false;
    }
    chains_.erase(it);
}

void Merger::taint(const RecordKey& key) {
    demote(key);
    tainted_.insert(key);
}

std::vector<GroupedRecords> Merger::finish() {
    // The first batchable survivor of each (table, type) fixes the shape
    // its bucket's statement is built from.
    std::map<std::pair<std::string, OpType>, std::size_t> reference;
    std::vector<RecordKey> misfits;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        const auto& s = slots_[i];
        if (!s.alive || !s.batchable) continue;
        auto [it, inserted] =
            reference.emplace(std::make_pair(s.record.table, s.record.op), i);
        if (!inserted && !same_shape(slots_[it->second].record, s.record)) {
            misfits.push_back(s.key);
        }
    }
    for (const auto& key : misfits) {
        demote(key);
    }

    std::vector<GroupedRecords> groups;
    std::map<std::string, std::size_t> by_table;
    for (auto& s : slots_) {
        if (!s.alive) continue;
        auto [it, inserted] = by_table.emplace(s.record.table, groups.size());
        if (inserted) {
            groups.emplace_back();
            groups.back().table = s.record.table;
        }
        auto& g = groups[it->second];

        if (!s.batchable) {
            g.non_batch.push_back(std::move(s.record));
            continue;
        }
        switch (s.record.op) {
        case OpType::Insert: g.batch_insert.push_back(std::move(s.record)); break;
        case OpType::Update: g.batch_update.push_back(std::move(s.record)); break;
        case OpType::Delete: g.batch_delete.push_back(std::move(s.record)); break;
        }
    }
    return groups;
}

} // namespace

std::vector<GroupedRecords> group(const std::vector<DataRecord>& records) {
    Merger merger;
    for (const auto& r : records) {
        merger.add(r);
    }
    auto groups = merger.finish();

    std::size_t merged = 0, sequential = 0;
    for (const auto& g : groups) {
        merged += g.size();
        sequential += g.non_batch.size();
    }
    SPDLOG_DEBUG("grouped {} records into {} ({} non-batch) across {} tables",
                 records.size(), merged, sequential, groups.size());
    return groups;
}

std::vector<Column> extract_condition_columns(
    const DataRecord& record, const std::set<std::string>& sharding_columns) {
    std::vector<Column> result;
    for (const auto& c : record.columns) {
        if (c.unique_key || sharding_columns.count(c.name)) {
            result.push_back(c);
        }
    }
    return result;
}

} // namespace sqlapply

// ── sqlite.cpp ──────────────────────────────────────────────────
namespace sqlapply {

namespace {

class SqliteStatement final : public Statement {
public:
    SqliteStatement(sqlite3* db, std::string sql)
        : db_(db), sql_(std::move(sql)), stmt_(detail::prepare(db, sql_)) {}

    void bind(int index, const Value& value) override {
        if (index < 1) {
            throw Error(ErrorCode::InvalidRecord,
                        "parameter index must be 1-based: " +
                        std::to_string(index));
        }
        auto i = static_cast<std::size_t>(index - 1);
        if (params_.size() <= i) params_.resize(i + 1);
        params_[i] = value;
    }

    void add_batch() override {
        batch_.push_back(std::move(params_));
        params_.clear();
    }

    std::vector<int> execute_batch() override {
        auto entries = std::move(batch_);
        batch_.clear();

        TimeoutScope scope(*this);
        std::vector<int> counts;
        counts.reserve(entries.size());
        for (const auto& e : entries) {
            counts.push_back(step(e));
        }
        return counts;
    }

    int execute_update() override {
        TimeoutScope scope(*this);
        return step(params_);
    }

    void set_query_timeout(std::chrono::seconds timeout) override {
        timeout_ = timeout;
    }

    void cancel() override { sqlite3_interrupt(db_); }

private:
    // Arms a progress-handler deadline for the duration of one execution.
    class TimeoutScope {
    public:
        explicit TimeoutScope(SqliteStatement& s) : s_(s) {
            s_.timed_out_ = false;
            if (s_.timeout_.count() <= 0) return;
            s_.deadline_ = std::chrono::steady_clock::now() + s_.timeout_;
            sqlite3_progress_handler(s_.db_, 1000, &SqliteStatement::on_progress, &s_);
            armed_ = true;
        }
        ~TimeoutScope() {
            if (armed_) sqlite3_progress_handler(s_.db_, 0, nullptr, nullptr);
        }

        TimeoutScope(const TimeoutScope&) = delete;
        TimeoutScope& operator=(const TimeoutScope&) = delete;

    private:
        SqliteStatement& s_;
        bool armed_ = false;
    };

    static int on_progress(void* ctx) {
        auto* self = static_cast<SqliteStatement*>(ctx);
        if (std::chrono::steady_clock::now() < self->deadline_) return 0;
        self->timed_out_ = true;
        return 1;
    }

    void bind_value(int index, const Value& v) {
        sqlite3_stmt* stmt = stmt_.get();
        int rc = std::visit([&](const auto& x) -> int {
            using T = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return sqlite3_bind_null(stmt, index);
            }
            else if constexpr (std::is_same_v<T, std::int64_t>) {
                return sqlite3_bind_int64(stmt, index, x);
            }
            else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt, index, x);
            }
            else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt, index, x.data(),
                                         static_cast<int>(x.size()),
                                         SQLITE_TRANSIENT);
            }
            else {
                return sqlite3_bind_blob(stmt, index, x.data(),
                                         static_cast<int>(x.size()),
                                         SQLITE_TRANSIENT);
            }
        }, v);
        if (rc != SQLITE_OK) {
            throw Error(ErrorCode::StorageError,
                        "bind parameter " + std::to_string(index) + ": " +
                        sqlite3_errmsg(db_) + " (sql: " + sql_ + ")");
        }
    }

    // Run the statement once with the given parameters.
    // Returns the number of rows changed.
    int step(const std::vector<Value>& params) {
        sqlite3_reset(stmt_.get());
        sqlite3_clear_bindings(stmt_.get());
        for (std::size_t i = 0; i < params.size(); ++i) {
            bind_value(static_cast<int>(i + 1), params[i]);
        }

        int rc = sqlite3_step(stmt_.get());
        if (rc != SQLITE_DONE) {
            std::string msg = timed_out_
                ? "query timeout after " + std::to_string(timeout_.count()) + "s"
                : std::string(sqlite3_errmsg(db_));
            sqlite3_reset(stmt_.get());
            throw Error(ErrorCode::StorageError, msg + " (sql: " + sql_ + ")");
        }
        return sqlite3_changes(db_);
    }

    sqlite3*                                 db_;
    std::string                              sql_;
    detail::StmtGuard                        stmt_;
    std::vector<Value>                       params_;
    std::vector<std::vector<Value>>          batch_;
    std::chrono::seconds                     timeout_{0};
    std::chrono::steady_clock::time_point    deadline_{};
    bool                                     timed_out_ = false;
};

class SqliteConnection final : public Connection {
public:
    using Release = std::function<void(sqlite3*)>;

    SqliteConnection(sqlite3* db, Release release)
        : db_(db), release_(std::move(release)) {}

    ~SqliteConnection() override {
        if (in_transaction_ && !sqlite3_get_autocommit(db_)) {
            char* err = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
                SPDLOG_WARN("rollback on connection release failed: {}",
                            err ? err : "unknown error");
            }
            sqlite3_free(err);
        }
        release_(db_);
    }

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    void set_auto_commit(bool auto_commit) override {
        if (!auto_commit && !in_transaction_) {
            detail::exec(db_, "BEGIN");
            in_transaction_ = true;
        } else if (auto_commit && in_transaction_) {
            commit();
        }
    }

    std::shared_ptr<Statement> prepare(const std::string& sql) override {
        return std::make_shared<SqliteStatement>(db_, sql);
    }

    void commit() override {
        if (!in_transaction_) return;
        detail::exec(db_, "COMMIT");
        in_transaction_ = false;
    }

    void rollback() override {
        if (!in_transaction_) return;
        // An interrupted or failed statement may have ended it already.
        if (!sqlite3_get_autocommit(db_)) detail::exec(db_, "ROLLBACK");
        in_transaction_ = false;
    }

private:
    sqlite3* db_;
    Release  release_;
    bool     in_transaction_ = false;
};

std::string quote(const std::string& identifier) {
    std::string s = "\"";
    for (char c : identifier) {
        if (c == '"') s.push_back('"');
        s.push_back(c);
    }
    return s + "\"";
}

std::string qualified_table(const std::string& schema, const std::string& table) {
    return schema.empty() ? quote(table) : quote(schema) + "." + quote(table);
}

std::string where_clause(const std::vector<Column>& conditions) {
    std::string s = " WHERE ";
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) s += " AND ";
        s += quote(conditions[i].name) + "=?";
    }
    return s;
}

void require_conditions(const DataRecord& record,
                        const std::vector<Column>& conditions) {
    if (conditions.empty()) {
        throw Error(ErrorCode::InvalidRecord,
                    "no unique key or sharding column to match on: " +
                    to_string(record));
    }
}

} // namespace

// ── SqliteDataSource ────────────────────────────────────────────────

struct SqliteDataSource::Impl {
    std::string            uri;
    std::size_t            max_idle;
    mutable std::mutex     mu;
    std::vector<sqlite3*>  idle;

    ~Impl() {
        for (auto* db : idle) sqlite3_close_v2(db);
    }

    sqlite3* acquire() {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (!idle.empty()) {
                auto* db = idle.back();
                idle.pop_back();
                return db;
            }
        }

        sqlite3* db = nullptr;
        int rc = sqlite3_open_v2(uri.c_str(), &db,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
            SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close_v2(db);
            throw Error(ErrorCode::StorageError,
                        "open '" + uri + "': " + msg);
        }
        sqlite3_busy_timeout(db, 5000);
        SPDLOG_DEBUG("opened connection to '{}'", uri);
        return db;
    }

    void release(sqlite3* db) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (idle.size() < max_idle) {
                idle.push_back(db);
                return;
            }
        }
        sqlite3_close_v2(db);
    }
};

SqliteDataSource::SqliteDataSource(std::string uri, std::size_t max_idle)
    : impl_(std::make_shared<Impl>()) {
    impl_->uri = std::move(uri);
    impl_->max_idle = max_idle;
}

SqliteDataSource::~SqliteDataSource() = default;

std::unique_ptr<Connection> SqliteDataSource::connect() {
    auto* db = impl_->acquire();
    // The release hook keeps the pool alive until the last connection
    // comes back.
    return std::make_unique<SqliteConnection>(
        db, [impl = impl_](sqlite3* h) { impl->release(h); });
}

std::size_t SqliteDataSource::idle_count() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->idle.size();
}

// ── SqliteSqlBuilder ────────────────────────────────────────────────

struct SqliteSqlBuilder::Impl {
    DialectPolicy                      policy;
    mutable std::mutex                 mu;
    std::map<std::string, std::string> insert_cache;
};

SqliteSqlBuilder::SqliteSqlBuilder(DialectPolicy policy)
    : impl_(std::make_unique<Impl>()) {
    impl_->policy = policy;
}

SqliteSqlBuilder::~SqliteSqlBuilder() = default;

std::string SqliteSqlBuilder::build_insert_sql(const std::string& schema,
                                               const DataRecord& record) const {
    std::string cache_key = schema + '\0' + record.table;
    for (const auto& c : record.columns) {
        cache_key += '\0' + c.name;
    }

    std::lock_guard<std::mutex> lk(impl_->mu);
    auto it = impl_->insert_cache.find(cache_key);
    if (it != impl_->insert_cache.end()) return it->second;

    std::string names, params;
    for (std::size_t i = 0; i < record.columns.size(); ++i) {
        if (i > 0) {
            names += ",";
            params += ",";
        }
        names += quote(record.columns[i].name);
        params += "?";
    }
    std::string sql = "INSERT INTO " + qualified_table(schema, record.table) +
                      "(" + names + ") VALUES(" + params + ")";
    impl_->insert_cache.emplace(std::move(cache_key), sql);
    return sql;
}

std::string SqliteSqlBuilder::build_update_sql(
    const std::string& schema, const DataRecord& record,
    const std::vector<Column>& conditions) const {
    require_conditions(record, conditions);
    auto updated = extract_updated_columns(record);
    std::string sql = "UPDATE " + qualified_table(schema, record.table) + " SET ";
    for (std::size_t i = 0; i < updated.size(); ++i) {
        if (i > 0) sql += ",";
        sql += quote(updated[i].name) + "=?";
    }
    return sql + where_clause(conditions);
}

std::string SqliteSqlBuilder::build_delete_sql(
    const std::string& schema, const DataRecord& record,
    const std::vector<Column>& conditions) const {
    require_conditions(record, conditions);
    return "DELETE FROM " + qualified_table(schema, record.table) +
           where_clause(conditions);
}

std::vector<Column> SqliteSqlBuilder::extract_updated_columns(
    const DataRecord& record) const {
    std::vector<Column> result;
    for (const auto& c : record.columns) {
        if (c.updated) result.push_back(c);
    }
    return result;
}

const DialectPolicy& SqliteSqlBuilder::policy() const {
    return impl_->policy;
}

} // namespace sqlapply

// ── channel.cpp ─────────────────────────────────────────────────
namespace sqlapply {

struct MemoryChannel::Impl {
    std::size_t             capacity;
    AckCallback             on_ack;
    mutable std::mutex      mu;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<Record>      queue;
    std::size_t             finished_queued = 0;
    std::size_t             fetch_calls = 0;
    std::size_t             acked = 0;
};

MemoryChannel::MemoryChannel(std::size_t capacity, AckCallback on_ack)
    : impl_(std::make_unique<Impl>()) {
    impl_->capacity = capacity == 0 ? 1 : capacity;
    impl_->on_ack = std::move(on_ack);
}

MemoryChannel::~MemoryChannel() = default;

void MemoryChannel::push(Record record) {
    {
        std::unique_lock<std::mutex> lk(impl_->mu);
        impl_->not_full.wait(lk, [this] {
            return impl_->queue.size() < impl_->capacity;
        });
        if (std::holds_alternative<FinishedRecord>(record)) {
            ++impl_->finished_queued;
        }
        impl_->queue.push_back(std::move(record));
    }
    impl_->not_empty.notify_all();
}

std::vector<Record> MemoryChannel::fetch(std::size_t max_count,
                                         std::chrono::milliseconds timeout) {
    std::vector<Record> out;
    {
        std::unique_lock<std::mutex> lk(impl_->mu);
        ++impl_->fetch_calls;
        impl_->not_empty.wait_for(lk, timeout, [&] {
            return impl_->queue.size() >= max_count ||
                   impl_->finished_queued > 0;
        });

        auto n = std::min(max_count, impl_->queue.size());
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            if (std::holds_alternative<FinishedRecord>(impl_->queue.front())) {
                --impl_->finished_queued;
            }
            out.push_back(std::move(impl_->queue.front()));
            impl_->queue.pop_front();
        }
    }
    if (!out.empty()) impl_->not_full.notify_all();
    return out;
}

void MemoryChannel::ack(const std::vector<Record>& records) {
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->acked += records.size();
    }
    if (impl_->on_ack) impl_->on_ack(records);
}

std::size_t MemoryChannel::fetch_calls() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->fetch_calls;
}

std::size_t MemoryChannel::acked() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->acked;
}

std::size_t MemoryChannel::pending() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->queue.size();
}

} // namespace sqlapply

// ── flush.cpp ───────────────────────────────────────────────────
namespace sqlapply {

std::string ImporterConfig::schema_name(const std::string& table) const {
    auto it = schema_names.find(table);
    return it == schema_names.end() ? std::string{} : it->second;
}

const std::set<std::string>& ImporterConfig::sharding_columns_of(
    const std::string& table) const {
    static const std::set<std::string> kNone;
    auto it = sharding_columns.find(table);
    return it == sharding_columns.end() ? kNone : it->second;
}

std::chrono::milliseconds backoff_delay(int attempt) {
    constexpr std::int64_t kBaseMs = 1000;
    constexpr std::int64_t kCapMs = 5 * 60 * 1000;
    if (attempt < 0) attempt = 0;
    if (attempt >= 20) return std::chrono::milliseconds(kCapMs);
    return std::chrono::milliseconds(std::min(kCapMs, kBaseMs << attempt));
}

RetryController::RetryController(int max_retries, Sleeper sleeper)
    : max_retries_(max_retries < 0 ? 0 : max_retries),
      sleeper_(std::move(sleeper)) {}

void RetryController::run(const std::function<void()>& attempt,
                          const std::string& what) const {
    for (int i = 0;; ++i) {
        try {
            attempt();
            return;
        } catch (const Error& e) {
            if (e.code() != ErrorCode::StorageError) throw;
            SPDLOG_ERROR("flush {} failed {}/{} times: {}",
                         what, i, max_retries_, e.what());
            if (i >= max_retries_) {
                throw Error(ErrorCode::WriteFailed,
                            "write failed after " + std::to_string(max_retries_) +
                            " retries, " + what + ": " + e.what());
            }
        }
        if (!sleeper_(backoff_delay(i))) {
            throw Error(ErrorCode::Cancelled,
                        "retry of " + what + " interrupted by stop request");
        }
    }
}

namespace {

// Holds the live statement of one operation type so cancel() can reach it.
class StatementSlot {
public:
    class Guard {
    public:
        Guard(StatementSlot& slot, std::shared_ptr<Statement> stmt)
            : slot_(slot) { slot_.set(std::move(stmt)); }
        ~Guard() { slot_.set(nullptr); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        StatementSlot& slot_;
    };

    void cancel() {
        std::lock_guard<std::mutex> lk(mu_);
        if (stmt_) stmt_->cancel();
    }

private:
    void set(std::shared_ptr<Statement> stmt) {
        std::lock_guard<std::mutex> lk(mu_);
        stmt_ = std::move(stmt);
    }

    std::mutex                 mu_;
    std::shared_ptr<Statement> stmt_;
};

std::string join_counts(const std::vector<int>& counts) {
    std::string s = "[";
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) s += ",";
        s += std::to_string(counts[i]);
    }
    return s + "]";
}

} // namespace

struct FlushExecutor::Impl {
    DataSource&       data_source;
    const SqlBuilder& builder;
    ImporterConfig    config;
    std::atomic<bool> cancelled{false};
    StatementSlot     insert_slot;
    StatementSlot     update_slot;
    StatementSlot     delete_slot;

    Impl(DataSource& ds, const SqlBuilder& b, ImporterConfig cfg)
        : data_source(ds), builder(b), config(std::move(cfg)) {}

    void ensure_running() const {
        if (cancelled) {
            throw Error(ErrorCode::Cancelled, "flush executor was cancelled");
        }
    }

    // A failure caused by cancel() interrupting a statement is not a
    // storage fault.
    template <typename Fn>
    void guarded(Fn&& fn) {
        try {
            fn();
        } catch (const Error& e) {
            if (e.code() == ErrorCode::StorageError && cancelled) {
                throw Error(ErrorCode::Cancelled,
                            std::string("cancelled: ") + e.what());
            }
            throw;
        }
    }

    // The bucket's own failure is the one reported.
    static void rollback(Connection& conn) {
        try {
            conn.rollback();
        } catch (const Error& e) {
            SPDLOG_WARN("rollback of failed bucket failed: {}", e.what());
        }
    }

    void intercept(OpType op) {
        if (config.rate_limiter) config.rate_limiter->intercept(op, 1);
        ensure_running();
    }

    static void validate(const std::vector<DataRecord>& bucket) {
        if (bucket.empty()) {
            throw Error(ErrorCode::InvalidRecord, "empty bucket");
        }
        const auto& first = bucket.front();
        for (const auto& r : bucket) {
            if (r.table != first.table || r.op != first.op ||
                r.columns.size() != first.columns.size()) {
                throw Error(ErrorCode::InvalidRecord,
                            "bucket mixes shapes: " + to_string(first) +
                            " and " + to_string(r));
            }
        }
    }

    void execute_batch_insert(Connection& conn,
                              std::span<const DataRecord> records) {
        const auto& first = records.front();
        auto sql = builder.build_insert_sql(config.schema_name(first.table), first);
        auto stmt = conn.prepare(sql);
        StatementSlot::Guard guard(insert_slot, stmt);
        // cancel() may have run before the slot held this statement.
        ensure_running();
        stmt->set_query_timeout(config.query_timeout);
        for (const auto& r : records) {
            for (std::size_t i = 0; i < r.columns.size(); ++i) {
                stmt->bind(static_cast<int>(i + 1), r.columns[i].value);
            }
            stmt->add_batch();
        }
        stmt->execute_batch();
    }

    Value update_condition_value(const Column& c,
                                 const std::set<std::string>& sharding) const {
        if (!detail::is_null(c.old_value)) return c.old_value;
        if (c.unique_key) return c.value;
        if (sharding.count(c.name) &&
            builder.policy().null_old_sharding_value_uses_new_value) {
            return c.value;
        }
        return c.old_value;
    }

    void execute_update(Connection& conn, const DataRecord& record) {
        const auto& sharding = config.sharding_columns_of(record.table);
        auto conditions = extract_condition_columns(record, sharding);
        auto updated = builder.extract_updated_columns(record);
        if (updated.empty()) {
            SPDLOG_DEBUG("update changes no column, skipped: {}", to_string(record));
            return;
        }

        auto sql = builder.build_update_sql(config.schema_name(record.table),
                                            record, conditions);
        auto stmt = conn.prepare(sql);
        StatementSlot::Guard guard(update_slot, stmt);
        ensure_running();
        int index = 1;
        for (const auto& c : updated) {
            stmt->bind(index++, c.value);
        }
        for (const auto& c : conditions) {
            stmt->bind(index++, update_condition_value(c, sharding));
        }
        int count = stmt->execute_update();
        if (count != 1) {
            SPDLOG_WARN("update affected {} rows, sql={}, record={}",
                        count, sql, to_string(record));
        }
    }

    void execute_batch_delete(Connection& conn,
                              std::span<const DataRecord> records) {
        const auto& first = records.front();
        const auto& sharding = config.sharding_columns_of(first.table);
        auto conditions = extract_condition_columns(first, sharding);
        auto sql = builder.build_delete_sql(config.schema_name(first.table),
                                            first, conditions);
        auto stmt = conn.prepare(sql);
        StatementSlot::Guard guard(delete_slot, stmt);
        ensure_running();
        stmt->set_query_timeout(config.query_timeout);
        for (const auto& r : records) {
            auto values = extract_condition_columns(r, sharding);
            if (values.size() != conditions.size()) {
                throw Error(ErrorCode::InvalidRecord,
                            "delete predicate shape differs: " + to_string(r));
            }
            for (std::size_t i = 0; i < values.size(); ++i) {
                const auto& c = values[i];
                const auto& v = detail::is_null(c.old_value) ? c.value : c.old_value;
                if (detail::is_null(v)) {
                    SPDLOG_WARN("delete condition '{}' has no value, record={}",
                                c.name, to_string(r));
                }
                stmt->bind(static_cast<int>(i + 1), v);
            }
            stmt->add_batch();
        }
        auto counts = stmt->execute_batch();
        if (std::any_of(counts.begin(), counts.end(),
                        [](int n) { return n != 1; })) {
            SPDLOG_WARN("batch delete affected rows {}, sql={}",
                        join_counts(counts), sql);
        }
    }

    void execute(Connection& conn, std::span<const DataRecord> records) {
        const auto& first = records.front();
        intercept(first.op);
        switch (first.op) {
        case OpType::Insert:
            execute_batch_insert(conn, records);
            break;
        case OpType::Update:
            for (const auto& r : records) execute_update(conn, r);
            break;
        case OpType::Delete:
            execute_batch_delete(conn, records);
            break;
        }
    }
};

FlushExecutor::FlushExecutor(DataSource& data_source, const SqlBuilder& builder,
                             ImporterConfig config)
    : impl_(std::make_unique<Impl>(data_source, builder, std::move(config))) {}

FlushExecutor::~FlushExecutor() = default;

void FlushExecutor::flush(const std::vector<DataRecord>& bucket) {
    Impl::validate(bucket);
    impl_->ensure_running();

    auto started = std::chrono::steady_clock::now();
    impl_->guarded([&] {
        auto conn = impl_->data_source.connect();
        conn->set_auto_commit(false);
        try {
            impl_->execute(*conn, bucket);
            conn->commit();
        } catch (const Error&) {
            impl_->rollback(*conn);
            throw;
        }
    });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    SPDLOG_DEBUG("flushed {} {} records into '{}' in {}ms",
                 bucket.size(), op_name(bucket.front().op),
                 bucket.front().table, elapsed.count());
}

void FlushExecutor::flush_sequential(const std::vector<DataRecord>& records) {
    if (records.empty()) return;
    impl_->ensure_running();

    std::unique_ptr<Connection> conn;
    try {
        impl_->guarded([&] { conn = impl_->data_source.connect(); });
    } catch (const Error& e) {
        if (e.code() == ErrorCode::Cancelled) throw;
        throw Error(ErrorCode::WriteFailed,
                    std::string("write failed, no connection: ") + e.what());
    }

    for (const auto& r : records) {
        try {
            impl_->guarded([&] {
                impl_->execute(*conn, std::span<const DataRecord>(&r, 1));
            });
        } catch (const Error& e) {
            if (e.code() == ErrorCode::Cancelled) throw;
            throw Error(ErrorCode::WriteFailed,
                        "write failed, record=" + to_string(r) + ": " + e.what());
        }
    }
    SPDLOG_DEBUG("applied {} non-batch records into '{}'",
                 records.size(), records.front().table);
}

void FlushExecutor::cancel() {
    impl_->cancelled = true;
    if (impl_->config.rate_limiter) impl_->config.rate_limiter->interrupt();
    impl_->insert_slot.cancel();
    impl_->update_slot.cancel();
    impl_->delete_slot.cancel();
}

bool FlushExecutor::cancelled() const { return impl_->cancelled; }

} // namespace sqlapply

// ── importer.cpp ────────────────────────────────────────────────
namespace sqlapply {

struct Importer::Impl {
    ImporterConfig           config;
    Channel&                 channel;
    FlushExecutor            executor;
    std::atomic<State>       state{State::Idle};
    std::mutex               mu;
    std::condition_variable  wake;
    std::thread              worker;
    std::exception_ptr       failure;

    Impl(ImporterConfig cfg, DataSource& ds, const SqlBuilder& builder,
         Channel& ch)
        : config(std::move(cfg)), channel(ch), executor(ds, builder, config) {}

    bool running() const { return state.load() == State::Running; }

    // Backoff sleep, cut short by stop().
    bool sleep_for(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lk(mu);
        return !wake.wait_for(lk, delay, [this] { return !running(); });
    }

    void run() {
        State expected = State::Idle;
        if (!state.compare_exchange_strong(expected, State::Running)) {
            if (expected == State::Stopped) return;
            throw Error(ErrorCode::InvalidState, "importer already started");
        }
        SPDLOG_INFO("importer started, batch_size={}, retry_times={}",
                    config.batch_size, config.retry_times);

        try {
            loop();
        } catch (const std::exception& e) {
            state = State::Stopped;
            SPDLOG_ERROR("importer failed: {}", e.what());
            throw;
        }
        state = State::Stopped;
        SPDLOG_INFO("importer stopped");
    }

    void loop() {
        RetryController retry(config.retry_times,
            [this](std::chrono::milliseconds d) { return sleep_for(d); });

        while (running()) {
            auto records = channel.fetch(config.batch_size, config.fetch_timeout);
            if (records.empty()) continue;
            if (!running()) {
                SPDLOG_INFO("stop requested, {} fetched records left unacknowledged",
                            records.size());
                break;
            }

            std::size_t inserted = 0;
            try {
                inserted = flush(retry, records);
            } catch (const Error& e) {
                if (e.code() != ErrorCode::Cancelled) throw;
                SPDLOG_INFO("flush interrupted by stop request, {} records left "
                            "unacknowledged: {}", records.size(), e.what());
                break;
            }

            channel.ack(records);
            if (config.on_progress) config.on_progress(inserted);

            if (std::holds_alternative<FinishedRecord>(records.back())) {
                SPDLOG_INFO("finished record received, importer exiting");
                break;
            }
        }
    }

    std::size_t flush(const RetryController& retry,
                      const std::vector<Record>& records) {
        std::vector<DataRecord> data;
        std::size_t inserted = 0;
        for (const auto& r : records) {
            if (const auto* d = std::get_if<DataRecord>(&r)) {
                if (d->op == OpType::Insert) ++inserted;
                data.push_back(*d);
            }
        }
        if (data.empty()) return 0;

        for (const auto& g : group(data)) {
            flush_bucket(retry, g.batch_delete);
            flush_bucket(retry, g.batch_insert);
            flush_bucket(retry, g.batch_update);
            executor.flush_sequential(g.non_batch);
        }
        SPDLOG_DEBUG("applied window of {} records", records.size());
        return inserted;
    }

    void flush_bucket(const RetryController& retry,
                      const std::vector<DataRecord>& bucket) {
        if (bucket.empty()) return;
        std::string what = std::string(op_name(bucket.front().op)) +
                           " bucket of " + std::to_string(bucket.size()) +
                           " records on '" + bucket.front().table + "'";
        retry.run([&] { executor.flush(bucket); }, what);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(mu);
            State s = state.load();
            for (;;) {
                State next;
                if (s == State::Idle) {
                    next = State::Stopped;
                } else if (s == State::Running) {
                    next = State::Stopping;
                } else {
                    return;
                }
                if (state.compare_exchange_weak(s, next)) break;
            }
        }
        wake.notify_all();
        executor.cancel();
        SPDLOG_INFO("importer stop requested");
    }
};

Importer::Importer(ImporterConfig config, DataSource& data_source,
                   const SqlBuilder& builder, Channel& channel)
    : impl_(std::make_unique<Impl>(std::move(config), data_source, builder,
                                   channel)) {}

Importer::~Importer() {
    impl_->stop();
    if (impl_->worker.joinable()) impl_->worker.join();
    if (impl_->failure) {
        SPDLOG_WARN("importer worker failed and was never joined");
    }
}

void Importer::run() { impl_->run(); }

void Importer::start() {
    if (impl_->worker.joinable()) {
        throw Error(ErrorCode::InvalidState, "importer worker already started");
    }
    impl_->worker = std::thread([impl = impl_.get()] {
        try {
            impl->run();
        } catch (...) {
            impl->failure = std::current_exception();
        }
    });
}

void Importer::stop() { impl_->stop(); }

void Importer::join() {
    if (impl_->worker.joinable()) impl_->worker.join();
    if (impl_->failure) {
        auto failure = std::exchange(impl_->failure, nullptr);
        std::rethrow_exception(failure);
    }
}

Importer::State Importer::state() const { return impl_->state.load(); }

} // namespace sqlapply
