#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* select_columns =
    "SELECT id, timestamp, text, language, audio_duration, processing_time, backend "
    "FROM transcriptions ";

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

HistoryDb::HistoryDb(int max_entries) : max_entries_(max_entries > 0 ? max_entries : 1) {}

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
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

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    std::string recent_sql = std::string(select_columns) + "ORDER BY id DESC LIMIT ?";
    std::string get_sql = std::string(select_columns) + "WHERE id = ?";

    bool ok =
        prepare("INSERT INTO transcriptions (text, language, audio_duration, "
                "processing_time, backend) VALUES (?, ?, ?, ?, ?)", &insert_stmt_) &&
        prepare(recent_sql.c_str(), &recent_stmt_) &&
        prepare(get_sql.c_str(), &get_stmt_) &&
        prepare("SELECT COUNT(*) FROM transcriptions", &count_stmt_) &&
        prepare("DELETE FROM transcriptions WHERE id NOT IN "
                "(SELECT id FROM transcriptions ORDER BY id DESC LIMIT ?)", &evict_stmt_);
    if (!ok) {
        close();
        return false;
    }

    return true;
}

void HistoryDb::close() {
    for (auto* stmt : {&insert_stmt_, &recent_stmt_, &get_stmt_, &count_stmt_, &evict_stmt_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::optional<int64_t> HistoryDb::insert(const std::string& text, const std::string& language,
                                         double audio_duration, double processing_time,
                                         const std::string& backend) {
    if (!insert_stmt_) return std::nullopt;

    auto trimmed = trim(text);
    if (trimmed.empty()) {
        std::println(stderr, "db: refusing to store empty transcription");
        return std::nullopt;
    }
    if (trimmed.size() > max_text_length) trimmed.resize(max_text_length);

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, trimmed.c_str(), -1, SQLITE_TRANSIENT);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    bind_nullable(2, language);
    sqlite3_bind_double(insert_stmt_, 3, audio_duration);
    sqlite3_bind_double(insert_stmt_, 4, processing_time);
    bind_nullable(5, backend);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    int64_t id = sqlite3_last_insert_rowid(db_);
    evict();
    return id;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(read_row(recent_stmt_));
    }

    return entries;
}

std::optional<HistoryEntry> HistoryDb::get(int64_t id) {
    if (!get_stmt_) return std::nullopt;

    sqlite3_reset(get_stmt_);
    sqlite3_bind_int64(get_stmt_, 1, id);
    if (sqlite3_step(get_stmt_) != SQLITE_ROW) return std::nullopt;
    return read_row(get_stmt_);
}

int64_t HistoryDb::count() {
    if (!count_stmt_) return 0;

    sqlite3_reset(count_stmt_);
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(count_stmt_, 0);
}

bool HistoryDb::clear() {
    if (!db_) return false;

    char* err = nullptr;
    int rc = sqlite3_exec(db_, "DELETE FROM transcriptions;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: clear failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool HistoryDb::evict() {
    sqlite3_reset(evict_stmt_);
    sqlite3_bind_int(evict_stmt_, 1, max_entries_);
    if (sqlite3_step(evict_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: eviction failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool HistoryDb::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

HistoryEntry HistoryDb::read_row(sqlite3_stmt* stmt) {
    auto get_text = [stmt](int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    HistoryEntry e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.timestamp = get_text(1);
    e.text = get_text(2);
    e.language = get_text(3);
    e.audio_duration = sqlite3_column_double(stmt, 4);
    e.processing_time = sqlite3_column_double(stmt, 5);
    e.backend = get_text(6);
    return e;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            language TEXT,
            audio_duration REAL,
            processing_time REAL,
            backend TEXT
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
