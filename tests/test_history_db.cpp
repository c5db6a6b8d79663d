#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <sqlite3.h>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("hs_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

HistoryEntry entry(const std::string& text, const std::string& status = "completed") {
    return HistoryEntry{
        .session_id = "20261019_120000_abcdef",
        .text = text,
        .audio_duration = 2.5,
        .confidence = 0.75,
        .chunk_count = 1,
        .word_count = 2,
        .status = status,
        .backend = "command",
    };
}

// Rewrites the timestamp of every row through a second connection.
void age_all_rows(const std::string& path, const char* modifier) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    std::string sql = std::string("UPDATE transcriptions SET timestamp = "
                                  "strftime('%Y-%m-%dT%H:%M:%f', 'now', '") + modifier + "')";
    REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("hello world", "incomplete")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].session_id == "20261019_120000_abcdef");
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].audio_duration == 2.5);
        REQUIRE(entries[0].confidence == 0.75);
        REQUIRE(entries[0].chunk_count == 1);
        REQUIRE(entries[0].word_count == 2);
        REQUIRE(entries[0].status == "incomplete");
        REQUIRE(entries[0].backend == "command");
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(entry("entry " + std::to_string(i))));
        }

        REQUIRE(db.recent(2).size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("first")));
        REQUIRE(db.insert(entry("second")));
        REQUIRE(db.insert(entry("third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("EmptyBackendStoredAsNull") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        auto e = entry("test");
        e.backend.clear();
        REQUIRE(db.insert(e));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].backend.empty());
    }

    SECTION("SearchMatchesSubstring") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("Meeting notes for Monday")));
        REQUIRE(db.insert(entry("grocery list")));
        REQUIRE(db.insert(entry("monday standup")));

        auto hits = db.search("monday", 10);
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].text == "monday standup");
        REQUIRE(hits[1].text == "Meeting notes for Monday");

        REQUIRE(db.search("tuesday", 10).empty());
        REQUIRE(db.search("monday", 1).size() == 1);
    }

    SECTION("SearchTreatsWildcardsLiterally") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("100% sure")));
        REQUIRE(db.insert(entry("1000 sure")));

        auto hits = db.search("0%", 10);
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].text == "100% sure");
    }

    SECTION("RemoveOlderThan") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("old one")));
        REQUIRE(db.insert(entry("old two")));
        age_all_rows(tmp.path, "-100 days");
        REQUIRE(db.insert(entry("fresh")));

        auto removed = db.remove_older_than(90);
        REQUIRE(removed.has_value());
        REQUIRE(*removed == 2);

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "fresh");
    }

    SECTION("StatsOverPeriod") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("last quarter")));
        age_all_rows(tmp.path, "-60 days");
        auto partial = entry("cut off", "incomplete");
        partial.confidence = 0.25;
        partial.audio_duration = 7.5;
        partial.word_count = 5;
        REQUIRE(db.insert(partial));
        REQUIRE(db.insert(entry("restored", "recovered")));

        auto month = db.stats(30);
        REQUIRE(month.has_value());
        REQUIRE(month->sessions == 2);
        REQUIRE(month->completed == 0);
        REQUIRE(month->incomplete == 1);
        REQUIRE(month->recovered == 1);
        REQUIRE(month->total_duration == 10.0);
        REQUIRE(month->total_words == 7);
        REQUIRE(month->average_confidence.has_value());
        REQUIRE(*month->average_confidence == 0.5);
        REQUIRE(month->most_active_day.size() == 10);
        REQUIRE(month->most_recent.starts_with(month->most_active_day));

        auto all = db.stats(0);
        REQUIRE(all.has_value());
        REQUIRE(all->sessions == 3);
        REQUIRE(all->completed == 1);
    }

    SECTION("StatsOfEmptyPeriod") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        auto st = db.stats(7);
        REQUIRE(st.has_value());
        REQUIRE(st->sessions == 0);
        REQUIRE(st->total_duration == 0.0);
        REQUIRE_FALSE(st->average_confidence.has_value());
        REQUIRE(st->most_recent.empty());
        REQUIRE(st->most_active_day.empty());
    }

    SECTION("EntriesSinceOldestFirst") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(entry("ancient")));
        age_all_rows(tmp.path, "-400 days");
        REQUIRE(db.insert(entry("first")));
        REQUIRE(db.insert(entry("second")));

        auto recent = db.entries_since(30);
        REQUIRE(recent.has_value());
        REQUIRE(recent->size() == 2);
        REQUIRE((*recent)[0].text == "first");
        REQUIRE((*recent)[1].text == "second");

        auto everything = db.entries_since(0);
        REQUIRE(everything.has_value());
        REQUIRE(everything->size() == 3);
        REQUIRE(everything->front().text == "ancient");
    }

    SECTION("RemoveSession") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        auto other = entry("keep me");
        other.session_id = "20261019_130000_123456";
        REQUIRE(db.insert(entry("drop me")));
        REQUIRE(db.insert(other));

        auto removed = db.remove_session("20261019_120000_abcdef");
        REQUIRE(removed.has_value());
        REQUIRE(*removed == 1);

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "keep me");

        auto again = db.remove_session("20261019_120000_abcdef");
        REQUIRE(again.has_value());
        REQUIRE(*again == 0);
    }

    SECTION("ClosedDbFailsQuietly") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert(entry("nothing")));
        REQUIRE(db.recent(5).empty());
        REQUIRE_FALSE(db.remove_older_than(1).has_value());
        REQUIRE_FALSE(db.stats(30).has_value());
        REQUIRE_FALSE(db.entries_since(0).has_value());
        REQUIRE_FALSE(db.remove_session("x").has_value());
    }
}
