#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO runs (audio_path, model, language, task, device, "
        "device_fallback, segment_count, output_dir, formats) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, audio_path, model, language, task, device, "
        "device_fallback, segment_count, output_dir, formats "
        "FROM runs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const RunRecord& run) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, run.audio_path.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, run.model);
    bind_nullable(3, run.language);
    bind_nullable(4, run.task);
    bind_nullable(5, run.device);
    sqlite3_bind_int(insert_stmt_, 6, run.device_fallback ? 1 : 0);
    sqlite3_bind_int64(insert_stmt_, 7, run.segment_count);
    bind_nullable(8, run.output_dir);
    bind_nullable(9, run.formats);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.run.audio_path = get_text(recent_stmt_, 2);
        e.run.model = get_text(recent_stmt_, 3);
        e.run.language = get_text(recent_stmt_, 4);
        e.run.task = get_text(recent_stmt_, 5);
        e.run.device = get_text(recent_stmt_, 6);
        e.run.device_fallback = sqlite3_column_int(recent_stmt_, 7) != 0;
        e.run.segment_count = sqlite3_column_int64(recent_stmt_, 8);
        e.run.output_dir = get_text(recent_stmt_, 9);
        e.run.formats = get_text(recent_stmt_, 10);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            audio_path TEXT NOT NULL,
            model TEXT,
            language TEXT,
            task TEXT,
            device TEXT,
            device_fallback INTEGER NOT NULL DEFAULT 0,
            segment_count INTEGER NOT NULL DEFAULT 0,
            output_dir TEXT,
            formats TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
