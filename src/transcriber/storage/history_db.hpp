#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RunRecord {
    std::string audio_path;
    std::string model;
    std::string language;
    std::string task;
    std::string device;
    bool device_fallback = false;
    int64_t segment_count = 0;
    std::string output_dir;
    std::string formats; // comma separated
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    RunRecord run;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const RunRecord& run);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
