// Copyright 2026 The sqlapply Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <sqlapply.h>

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sqlapply;

namespace {

struct DB {
    sqlite3* db = nullptr;
    std::string uri;

    DB() {
        static int counter = 0;
        uri = "file:importer_test_" + std::to_string(++counter) +
              "?mode=memory&cache=shared";
        sqlite3_open_v2(uri.c_str(), &db,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                        SQLITE_OPEN_URI, nullptr);
        exec("CREATE TABLE t (id INTEGER PRIMARY KEY, val TEXT)");
    }
    ~DB() { if (db) sqlite3_close(db); }
    void exec(const char* sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "error";
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }
    // Get all rows from a table as "id:val" strings, sorted by id.
    std::vector<std::string> rows(const char* table) {
        std::string sql = std::string("SELECT id, val FROM ") +
                          table + " ORDER BY id";
        sqlite3_stmt* stmt = nullptr;
        sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
        std::vector<std::string> result;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            int id = sqlite3_column_int(stmt, 0);
            auto* text = reinterpret_cast<const char*>(
                sqlite3_column_text(stmt, 1));
            result.push_back(std::to_string(id) + ":" +
                             (text ? text : "NULL"));
        }
        sqlite3_finalize(stmt);
        return result;
    }
};

Seq next_seq = 0;

DataRecord insert(std::int64_t id, const std::string& val) {
    DataRecord r;
    r.table = "t";
    r.op = OpType::Insert;
    r.seq = ++next_seq;
    r.columns = {
        {"id", {}, id, false, true},
        {"val", {}, val, false, false},
    };
    return r;
}

DataRecord update(std::int64_t id, const std::string& from,
                  const std::string& to) {
    DataRecord r;
    r.table = "t";
    r.op = OpType::Update;
    r.seq = ++next_seq;
    r.columns = {
        {"id", id, id, false, true},
        {"val", from, to, true, false},
    };
    return r;
}

DataRecord delete_row(std::int64_t id, const std::string& val) {
    DataRecord r;
    r.table = "t";
    r.op = OpType::Delete;
    r.seq = ++next_seq;
    r.columns = {
        {"id", id, {}, false, true},
        {"val", val, {}, false, false},
    };
    return r;
}

ImporterConfig quick_config() {
    ImporterConfig config;
    config.fetch_timeout = std::chrono::milliseconds(50);
    return config;
}

// Every connection attempt fails like an unreachable server.
class UnreachableDataSource : public DataSource {
public:
    std::unique_ptr<Connection> connect() override {
        ++attempts;
        throw Error(ErrorCode::StorageError, "connection refused");
    }

    std::atomic<int> attempts{0};
};

// Holds every write until interrupted.
class GateLimiter : public RateLimiter {
public:
    void intercept(OpType, int) override {
        std::unique_lock<std::mutex> lk(mu_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lk, [&] { return interrupted_; });
    }

    void interrupt() override {
        std::lock_guard<std::mutex> lk(mu_);
        interrupted_ = true;
        cv_.notify_all();
    }

    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return entered_; });
    }

private:
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    entered_ = false;
    bool                    interrupted_ = false;
};

} // namespace

TEST_CASE("importer: applies a merged window and exits on the finished record") {
    DB db;
    db.exec("INSERT INTO t VALUES (2, 'X')");
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    std::vector<std::size_t> progress;
    auto config = quick_config();
    config.on_progress = [&](std::size_t inserted) { progress.push_back(inserted); };

    channel.push(insert(1, "A"));
    channel.push(update(1, "A", "B"));
    channel.push(delete_row(2, "X"));
    channel.push(insert(2, "C"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    importer.run();

    std::vector<std::string> expected = {"1:B", "2:C"};
    CHECK(db.rows("t") == expected);
    std::vector<std::size_t> expected_progress = {2};
    CHECK(progress == expected_progress);
    CHECK(channel.fetch_calls() == 1);
    CHECK(channel.acked() == 5);
    CHECK(importer.state() == Importer::State::Stopped);
}

TEST_CASE("importer: no fetch after the finished window") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    auto config = quick_config();
    config.batch_size = 2;

    channel.push(insert(1, "A"));
    channel.push(FinishedRecord{++next_seq});
    channel.push(insert(2, "B"));

    Importer importer(config, ds, builder, channel);
    importer.run();

    std::vector<std::string> expected = {"1:A"};
    CHECK(db.rows("t") == expected);
    CHECK(channel.fetch_calls() == 1);
    CHECK(channel.acked() == 2);
    CHECK(channel.pending() == 1);
}

TEST_CASE("importer: windows are applied one after another") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;

    std::vector<std::size_t> acked_sizes;
    MemoryChannel channel(100, [&](const std::vector<Record>& records) {
        acked_sizes.push_back(records.size());
    });

    auto config = quick_config();
    config.batch_size = 2;

    channel.push(insert(1, "A"));
    channel.push(insert(2, "B"));
    channel.push(update(1, "A", "AA"));
    channel.push(delete_row(2, "B"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    importer.run();

    std::vector<std::string> expected = {"1:AA"};
    CHECK(db.rows("t") == expected);
    std::vector<std::size_t> expected_acks = {2, 2, 1};
    CHECK(acked_sizes == expected_acks);
}

TEST_CASE("importer: placeholders are acknowledged but not applied") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    std::size_t inserted_total = 0;
    auto config = quick_config();
    config.on_progress = [&](std::size_t inserted) { inserted_total += inserted; };

    channel.push(PlaceholderRecord{++next_seq});
    channel.push(insert(1, "A"));
    channel.push(PlaceholderRecord{++next_seq});
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    importer.run();

    std::vector<std::string> expected = {"1:A"};
    CHECK(db.rows("t") == expected);
    CHECK(channel.acked() == 4);
    CHECK(inserted_total == 1);
}

TEST_CASE("importer: progress counts inserts before merging") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    std::size_t inserted_total = 0;
    auto config = quick_config();
    config.on_progress = [&](std::size_t inserted) { inserted_total += inserted; };

    channel.push(insert(1, "A"));
    channel.push(delete_row(1, "A"));
    channel.push(insert(2, "B"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    importer.run();

    std::vector<std::string> expected = {"2:B"};
    CHECK(db.rows("t") == expected);
    CHECK(inserted_total == 2);
}

TEST_CASE("importer: stop interrupts the retry backoff") {
    UnreachableDataSource ds;
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    auto config = quick_config();
    config.retry_times = 5;

    channel.push(insert(1, "A"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    importer.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (ds.attempts.load() == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(ds.attempts.load() == 1);

    auto stop_requested = std::chrono::steady_clock::now();
    importer.stop();
    importer.join();
    auto waited = std::chrono::steady_clock::now() - stop_requested;

    // The first backoff is a full second; stop must cut it short.
    CHECK(waited < std::chrono::milliseconds(900));
    CHECK(ds.attempts.load() == 1);
    CHECK(channel.acked() == 0);
    CHECK(importer.state() == Importer::State::Stopped);
}

TEST_CASE("importer: stop cancels a running statement") {
    DB db;
    // Every insert into t fires a cross join that runs far longer than
    // the test is willing to wait.
    db.exec("CREATE TABLE ballast (n INTEGER)");
    db.exec("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c "
            "WHERE x < 2000) INSERT INTO ballast SELECT x FROM c");
    db.exec("CREATE TABLE sink (n INTEGER)");
    db.exec("CREATE TRIGGER slow AFTER INSERT ON t BEGIN "
            "INSERT INTO sink SELECT count(*) FROM ballast a, ballast b, ballast c; "
            "END");

    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    channel.push(insert(1, "A"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(quick_config(), ds, builder, channel);
    importer.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto stop_requested = std::chrono::steady_clock::now();
    importer.stop();
    CHECK_NOTHROW(importer.join());
    auto waited = std::chrono::steady_clock::now() - stop_requested;

    CHECK(waited < std::chrono::seconds(5));
    CHECK(channel.acked() == 0);
    CHECK(importer.state() == Importer::State::Stopped);
    CHECK(db.rows("t").empty());
}

TEST_CASE("importer: stop releases a blocked rate limiter") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    auto limiter = std::make_shared<GateLimiter>();
    auto config = quick_config();
    config.rate_limiter = limiter;

    channel.push(insert(1, "A"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    importer.start();
    REQUIRE(limiter->wait_entered(std::chrono::seconds(5)));

    auto stop_requested = std::chrono::steady_clock::now();
    importer.stop();
    CHECK_NOTHROW(importer.join());
    auto waited = std::chrono::steady_clock::now() - stop_requested;

    CHECK(waited < std::chrono::seconds(5));
    CHECK(channel.acked() == 0);
    CHECK(importer.state() == Importer::State::Stopped);
    CHECK(db.rows("t").empty());
}

TEST_CASE("importer: exhausted retries fail the run") {
    UnreachableDataSource ds;
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    auto config = quick_config();
    config.retry_times = 0;

    channel.push(insert(1, "A"));
    channel.push(FinishedRecord{++next_seq});

    Importer importer(config, ds, builder, channel);
    try {
        importer.run();
        FAIL("expected WriteFailed");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::WriteFailed);
    }
    CHECK(ds.attempts.load() == 1);
    CHECK(channel.acked() == 0);
    CHECK(importer.state() == Importer::State::Stopped);
}

TEST_CASE("importer: worker failure is rethrown by join") {
    UnreachableDataSource ds;
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    auto config = quick_config();
    config.retry_times = 0;

    channel.push(insert(1, "A"));

    Importer importer(config, ds, builder, channel);
    importer.start();
    CHECK_THROWS_AS(importer.join(), Error);
    CHECK(importer.state() == Importer::State::Stopped);
}

TEST_CASE("importer: stop before start") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;
    channel.push(insert(1, "A"));

    Importer importer(quick_config(), ds, builder, channel);
    CHECK(importer.state() == Importer::State::Idle);
    importer.stop();
    CHECK(importer.state() == Importer::State::Stopped);

    importer.run();
    CHECK(channel.fetch_calls() == 0);
    CHECK(db.rows("t").empty());
}

TEST_CASE("importer: stop while waiting on an empty channel") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;

    Importer importer(quick_config(), ds, builder, channel);
    importer.start();
    CHECK_THROWS_AS(importer.start(), Error);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    importer.stop();
    importer.stop();
    importer.join();

    CHECK(importer.state() == Importer::State::Stopped);
    CHECK(channel.fetch_calls() >= 1);
    CHECK(channel.acked() == 0);
}

TEST_CASE("importer: destructor stops a running worker") {
    DB db;
    SqliteDataSource ds(db.uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel;
    {
        Importer importer(quick_config(), ds, builder, channel);
        importer.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    channel.push(insert(1, "A"));
    CHECK(channel.pending() == 1);
}
