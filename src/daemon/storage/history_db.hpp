#pragma once

#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string session_id;
    std::string timestamp;
    std::string text;
    double audio_duration = 0.0;
    double confidence = 0.0;
    int64_t chunk_count = 0;
    int64_t word_count = 0;
    std::string status; // "completed", "incomplete" or "recovered"
    std::string backend;
};

// Aggregates over the entries of a period.
struct HistoryStats {
    int64_t sessions = 0;
    int64_t completed = 0;
    int64_t incomplete = 0;
    int64_t recovered = 0;
    double total_duration = 0.0;
    int64_t total_words = 0;
    std::optional<double> average_confidence; // unset when there are no entries
    std::string most_recent;                  // timestamp, empty when there are no entries
    std::string most_active_day;              // YYYY-MM-DD with the most entries
};

// Delivered transcripts. Safe to use from several threads.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();

    // id and timestamp are assigned by the database.
    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int limit = 10);
    // Case-insensitive substring match on the text, newest first.
    std::vector<HistoryEntry> search(const std::string& query, int limit = 10);

    // Covers the last `days` days; 0 or less covers everything.
    std::expected<HistoryStats, std::string> stats(int days);
    // Oldest first, same period rule as stats().
    std::expected<std::vector<HistoryEntry>, std::string> entries_since(int days);

    // Both return the number of rows deleted.
    std::expected<int, std::string> remove_session(const std::string& session_id);
    std::expected<int, std::string> remove_older_than(int days);

private:
    bool create_tables();
    std::vector<HistoryEntry> collect(sqlite3_stmt* stmt);

    std::mutex mu_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* search_stmt_ = nullptr;
    sqlite3_stmt* cleanup_stmt_ = nullptr;
    sqlite3_stmt* stats_stmt_ = nullptr;
    sqlite3_stmt* busiest_day_stmt_ = nullptr;
    sqlite3_stmt* export_stmt_ = nullptr;
    sqlite3_stmt* delete_stmt_ = nullptr;
};
