#include "EventJournal.hpp"

#include <iostream>

namespace netwatch::monitor
{
    EventJournal::EventJournal() : db_(nullptr), stmt_insert_event_(nullptr) {}

    EventJournal::~EventJournal()
    {
        Shutdown();
    }

    bool EventJournal::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[Journal] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS events ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "instance TEXT NOT NULL, "
            "event_type TEXT NOT NULL, "
            "identifier TEXT NOT NULL, "
            "ip_address TEXT NOT NULL, "
            "display_name TEXT NOT NULL, "
            "hostname TEXT, "
            "occurred_at TEXT NOT NULL"
            ");"

            "CREATE INDEX IF NOT EXISTS events_identifier ON events(identifier);";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[Journal] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            return false;
        }

        const char *insert_sql = "INSERT INTO events (instance, event_type, identifier, ip_address, display_name, hostname, occurred_at) "
                                 "VALUES (?, ?, ?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt_insert_event_, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Journal] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }
        return true;
    }

    void EventJournal::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (stmt_insert_event_)
        {
            sqlite3_finalize(stmt_insert_event_);
            stmt_insert_event_ = nullptr;
        }
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool EventJournal::Record(const std::string &instance, const common::DeviceEvent &event)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!stmt_insert_event_)
            return false;

        std::string occurred_at = common::FormatTimestamp(event.timestamp);

        sqlite3_reset(stmt_insert_event_);
        sqlite3_clear_bindings(stmt_insert_event_);
        sqlite3_bind_text(stmt_insert_event_, 1, instance.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_event_, 2, common::EventTypeName(event.type), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt_insert_event_, 3, event.identifier.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_event_, 4, event.ip.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_event_, 5, event.display_name.c_str(), -1, SQLITE_TRANSIENT);
        if (event.hostname)
            sqlite3_bind_text(stmt_insert_event_, 6, event.hostname->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt_insert_event_, 6);
        sqlite3_bind_text(stmt_insert_event_, 7, occurred_at.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt_insert_event_) != SQLITE_DONE)
        {
            std::cerr << "[Journal] Insert failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }
        return true;
    }

    static std::string ColumnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    std::vector<JournalEntry> EventJournal::RecentEvents(const std::string &identifier, int limit)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<JournalEntry> entries;
        if (!db_)
            return entries;

        const char *sql = "SELECT instance, event_type, identifier, ip_address, display_name, hostname, occurred_at "
                          "FROM events WHERE (?1 = '' OR identifier = ?1) ORDER BY id DESC LIMIT ?2;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return entries;
        sqlite3_bind_text(stmt, 1, identifier.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 2, limit);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            JournalEntry entry;
            entry.instance = ColumnText(stmt, 0);
            entry.event_type = ColumnText(stmt, 1);
            entry.identifier = ColumnText(stmt, 2);
            entry.ip = ColumnText(stmt, 3);
            entry.display_name = ColumnText(stmt, 4);
            if (sqlite3_column_type(stmt, 5) != SQLITE_NULL)
                entry.hostname = ColumnText(stmt, 5);
            entry.occurred_at = ColumnText(stmt, 6);
            entries.push_back(std::move(entry));
        }
        sqlite3_finalize(stmt);
        return entries;
    }
}
