#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    std::string text;
    std::string language;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    std::string backend;
};

// Transcription history in SQLite. Keeps the newest max_entries rows.
class HistoryDb {
public:
    static constexpr size_t max_text_length = 10000;

    explicit HistoryDb(int max_entries = 50);
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Returns the new row id. Blank text is rejected.
    std::optional<int64_t> insert(const std::string& text, const std::string& language,
                                  double audio_duration, double processing_time,
                                  const std::string& backend);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);
    std::optional<HistoryEntry> get(int64_t id);
    int64_t count();
    bool clear();

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    bool evict();
    static HistoryEntry read_row(sqlite3_stmt* stmt);

    int max_entries_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* count_stmt_ = nullptr;
    sqlite3_stmt* evict_stmt_ = nullptr;
};
