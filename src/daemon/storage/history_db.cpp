#include "history_db.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* kColumns =
    "id, session_id, timestamp, text, audio_duration, confidence, "
    "chunk_count, word_count, status, backend";

// LIKE wildcards in user queries are matched literally.
std::string like_pattern(const std::string& query) {
    std::string out = "%";
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    out += '%';
    return out;
}

// Rows of the last ?1 days, or all rows when ?1 <= 0.
constexpr const char* kPeriod =
    " WHERE (?1 <= 0 OR timestamp >= strftime('%Y-%m-%dT%H:%M:%f', 'now', '-' || ?1 || ' days'))";

std::string column_text(sqlite3_stmt* s, int col) {
    auto* p = sqlite3_column_text(s, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    std::lock_guard lock(mu_);

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

    if (!create_tables()) return false;

    std::string insert_sql =
        "INSERT INTO transcriptions (session_id, text, audio_duration, confidence, "
        "chunk_count, word_count, status, backend) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";
    std::string recent_sql = std::string("SELECT ") + kColumns +
        " FROM transcriptions ORDER BY id DESC LIMIT ?";
    std::string search_sql = std::string("SELECT ") + kColumns +
        " FROM transcriptions WHERE text LIKE ? ESCAPE '\\' ORDER BY id DESC LIMIT ?";
    std::string cleanup_sql =
        "DELETE FROM transcriptions WHERE timestamp < strftime('%Y-%m-%dT%H:%M:%f', 'now', ?)";
    std::string stats_sql = std::string(
        "SELECT COUNT(*), SUM(status = 'completed'), SUM(status = 'incomplete'), "
        "SUM(status = 'recovered'), SUM(audio_duration), SUM(word_count), AVG(confidence), "
        "MAX(timestamp) FROM transcriptions") + kPeriod;
    std::string busiest_day_sql = std::string(
        "SELECT substr(timestamp, 1, 10) AS day, COUNT(*) AS n FROM transcriptions") + kPeriod +
        " GROUP BY day ORDER BY n DESC, day DESC LIMIT 1";
    std::string export_sql = std::string("SELECT ") + kColumns + " FROM transcriptions" +
        kPeriod + " ORDER BY id ASC";
    std::string delete_sql = "DELETE FROM transcriptions WHERE session_id = ?";

    struct { const std::string& sql; sqlite3_stmt** stmt; const char* name; } prepared[] = {
        {insert_sql, &insert_stmt_, "insert"},
        {recent_sql, &recent_stmt_, "recent"},
        {search_sql, &search_stmt_, "search"},
        {cleanup_sql, &cleanup_stmt_, "cleanup"},
        {stats_sql, &stats_stmt_, "stats"},
        {busiest_day_sql, &busiest_day_stmt_, "busiest day"},
        {export_sql, &export_stmt_, "export"},
        {delete_sql, &delete_stmt_, "delete"},
    };
    for (auto& q : prepared) {
        if (sqlite3_prepare_v2(db_, q.sql.c_str(), -1, q.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", q.name, sqlite3_errmsg(db_));
            return false;
        }
    }

    return true;
}

void HistoryDb::close() {
    std::lock_guard lock(mu_);
    for (auto* stmt : {&insert_stmt_, &recent_stmt_, &search_stmt_, &cleanup_stmt_,
                       &stats_stmt_, &busiest_day_stmt_, &export_stmt_, &delete_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const HistoryEntry& e) {
    std::lock_guard lock(mu_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, e.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, e.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 3, e.audio_duration);
    sqlite3_bind_double(insert_stmt_, 4, e.confidence);
    sqlite3_bind_int64(insert_stmt_, 5, e.chunk_count);
    sqlite3_bind_int64(insert_stmt_, 6, e.word_count);
    sqlite3_bind_text(insert_stmt_, 7, e.status.c_str(), -1, SQLITE_TRANSIENT);

    if (e.backend.empty()) sqlite3_bind_null(insert_stmt_, 8);
    else sqlite3_bind_text(insert_stmt_, 8, e.backend.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::lock_guard lock(mu_);
    if (!recent_stmt_) return {};

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    return collect(recent_stmt_);
}

std::vector<HistoryEntry> HistoryDb::search(const std::string& query, int limit) {
    std::lock_guard lock(mu_);
    if (!search_stmt_) return {};

    auto pattern = like_pattern(query);
    sqlite3_reset(search_stmt_);
    sqlite3_bind_text(search_stmt_, 1, pattern.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(search_stmt_, 2, limit);
    return collect(search_stmt_);
}

std::expected<int, std::string> HistoryDb::remove_older_than(int days) {
    std::lock_guard lock(mu_);
    if (!cleanup_stmt_) return std::unexpected("database not open");

    auto modifier = std::format("-{} days", days);
    sqlite3_reset(cleanup_stmt_);
    sqlite3_bind_text(cleanup_stmt_, 1, modifier.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(cleanup_stmt_) != SQLITE_DONE) {
        return std::unexpected(std::string("cleanup failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_);
}

std::expected<HistoryStats, std::string> HistoryDb::stats(int days) {
    std::lock_guard lock(mu_);
    if (!stats_stmt_) return std::unexpected("database not open");

    HistoryStats st;
    sqlite3_reset(stats_stmt_);
    sqlite3_bind_int(stats_stmt_, 1, days);
    if (sqlite3_step(stats_stmt_) != SQLITE_ROW) {
        return std::unexpected(std::string("stats failed: ") + sqlite3_errmsg(db_));
    }
    // SUM and AVG over no rows are NULL, which reads back as 0.
    st.sessions = sqlite3_column_int64(stats_stmt_, 0);
    st.completed = sqlite3_column_int64(stats_stmt_, 1);
    st.incomplete = sqlite3_column_int64(stats_stmt_, 2);
    st.recovered = sqlite3_column_int64(stats_stmt_, 3);
    st.total_duration = sqlite3_column_double(stats_stmt_, 4);
    st.total_words = sqlite3_column_int64(stats_stmt_, 5);
    if (sqlite3_column_type(stats_stmt_, 6) != SQLITE_NULL) {
        st.average_confidence = sqlite3_column_double(stats_stmt_, 6);
    }
    st.most_recent = column_text(stats_stmt_, 7);
    sqlite3_reset(stats_stmt_);

    sqlite3_reset(busiest_day_stmt_);
    sqlite3_bind_int(busiest_day_stmt_, 1, days);
    if (sqlite3_step(busiest_day_stmt_) == SQLITE_ROW) {
        st.most_active_day = column_text(busiest_day_stmt_, 0);
    }
    sqlite3_reset(busiest_day_stmt_);
    return st;
}

std::expected<std::vector<HistoryEntry>, std::string> HistoryDb::entries_since(int days) {
    std::lock_guard lock(mu_);
    if (!export_stmt_) return std::unexpected("database not open");

    sqlite3_reset(export_stmt_);
    sqlite3_bind_int(export_stmt_, 1, days);
    return collect(export_stmt_);
}

std::expected<int, std::string> HistoryDb::remove_session(const std::string& session_id) {
    std::lock_guard lock(mu_);
    if (!delete_stmt_) return std::unexpected("database not open");

    sqlite3_reset(delete_stmt_);
    sqlite3_bind_text(delete_stmt_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        return std::unexpected(std::string("delete failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_);
}

std::vector<HistoryEntry> HistoryDb::collect(sqlite3_stmt* stmt) {
    std::vector<HistoryEntry> entries;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(stmt, 0);
        e.session_id = column_text(stmt, 1);
        e.timestamp = column_text(stmt, 2);
        e.text = column_text(stmt, 3);
        e.audio_duration = sqlite3_column_double(stmt, 4);
        e.confidence = sqlite3_column_double(stmt, 5);
        e.chunk_count = sqlite3_column_int64(stmt, 6);
        e.word_count = sqlite3_column_int64(stmt, 7);
        e.status = column_text(stmt, 8);
        e.backend = column_text(stmt, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            audio_duration REAL,
            confidence REAL,
            chunk_count INTEGER,
            word_count INTEGER,
            status TEXT NOT NULL,
            backend TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_transcriptions_timestamp ON transcriptions(timestamp);
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
