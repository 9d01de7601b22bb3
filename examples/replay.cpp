// Copyright 2026 The sqlapply Authors
// SPDX-License-Identifier: Apache-2.0
#include <sqlapply.h>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <atomic>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace sqlapply;

// Counts throttled operations per type.
class CountingLimiter : public RateLimiter {
public:
    void intercept(OpType op, int weight) override {
        counts_[static_cast<int>(op)] += weight;
    }
    int count(OpType op) const { return counts_[static_cast<int>(op)].load(); }

private:
    std::atomic<int> counts_[4] = {};
};

static DataRecord user_insert(Seq seq, std::int64_t id, const std::string& name) {
    DataRecord r;
    r.table = "users";
    r.op = OpType::Insert;
    r.seq = seq;
    r.columns = {
        {"id", {}, id, false, true},
        {"name", {}, name, false, false},
    };
    return r;
}

static DataRecord user_rename(Seq seq, std::int64_t id, const std::string& from,
                              const std::string& to) {
    DataRecord r;
    r.table = "users";
    r.op = OpType::Update;
    r.seq = seq;
    r.columns = {
        {"id", id, id, false, true},
        {"name", from, to, true, false},
    };
    return r;
}

static DataRecord user_delete(Seq seq, std::int64_t id, const std::string& name) {
    DataRecord r;
    r.table = "users";
    r.op = OpType::Delete;
    r.seq = seq;
    r.columns = {
        {"id", id, {}, false, true},
        {"name", name, {}, false, false},
    };
    return r;
}

static void print_groups(const std::vector<DataRecord>& window) {
    for (const auto& g : group(window)) {
        std::printf("  table %s: delete=%zu insert=%zu update=%zu sequential=%zu\n",
                    g.table.c_str(), g.batch_delete.size(), g.batch_insert.size(),
                    g.batch_update.size(), g.non_batch.size());
    }
}

static void print_rows(sqlite3* db) {
    sqlite3_stmt* stmt = nullptr;
    sqlite3_prepare_v2(db, "SELECT id, name FROM users ORDER BY id",
                       -1, &stmt, nullptr);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::printf("  %lld: %s\n",
                    static_cast<long long>(sqlite3_column_int64(stmt, 0)),
                    reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
    }
    sqlite3_finalize(stmt);
}

int main() {
    spdlog::set_level(spdlog::level::info);

    // The target database. This handle keeps the shared in-memory
    // database alive while the importer's pooled connections use it.
    const char* uri = "file:replay?mode=memory&cache=shared";
    sqlite3* db = nullptr;
    sqlite3_open_v2(uri, &db,
                    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI,
                    nullptr);
    sqlite3_exec(db,
        "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT);"
        "INSERT INTO users VALUES (2, 'Bob');",
        nullptr, nullptr, nullptr);

    std::vector<DataRecord> window = {
        user_insert(1, 1, "Alice"),
        user_rename(2, 1, "Alice", "Alicia"),
        user_delete(3, 2, "Bob"),
        user_insert(4, 2, "Carol"),
        user_insert(5, 3, "Dave"),
        user_rename(6, 3, "Dave", "David"),
        user_delete(7, 3, "David"),
    };

    std::printf("=== Merge plan ===\n");
    print_groups(window);

    SqliteDataSource data_source(uri);
    SqliteSqlBuilder builder;
    MemoryChannel channel(100, [](const std::vector<Record>& records) {
        std::printf("  [ack] %zu records\n", records.size());
    });

    auto limiter = std::make_shared<CountingLimiter>();
    ImporterConfig config;
    config.batch_size = 16;
    config.rate_limiter = limiter;
    config.on_progress = [](std::size_t inserted) {
        std::printf("  [progress] %zu inserts\n", inserted);
    };

    std::printf("\n=== Replay ===\n");
    Importer importer(config, data_source, builder, channel);
    importer.start();

    // The reader side: feed the window, then end the stream.
    std::thread reader([&] {
        channel.push(PlaceholderRecord{0});
        for (const auto& r : window) channel.push(r);
        channel.push(FinishedRecord{8});
    });
    reader.join();
    importer.join();

    std::printf("\n=== Throttled operations ===\n");
    std::printf("  insert=%d update=%d delete=%d\n",
                limiter->count(OpType::Insert), limiter->count(OpType::Update),
                limiter->count(OpType::Delete));

    std::printf("\n=== Final rows ===\n");
    print_rows(db);

    sqlite3_close(db);
    return 0;
}
