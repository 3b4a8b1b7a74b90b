#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "../common/DeviceRecord.hpp"

namespace netwatch::monitor
{
    struct JournalEntry
    {
        std::string instance;
        std::string event_type;
        std::string identifier;
        std::string ip;
        std::string display_name;
        std::optional<std::string> hostname;
        std::string occurred_at;
    };

    // Append-only SQLite log of device events, shared by every instance of the daemon.
    class EventJournal
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;
        sqlite3_stmt *stmt_insert_event_;

    public:
        EventJournal();
        ~EventJournal();

        EventJournal(const EventJournal &) = delete;
        EventJournal &operator=(const EventJournal &) = delete;

        // ":memory:" is accepted.
        bool Initialize(const std::string &db_path);
        void Shutdown();

        bool Record(const std::string &instance, const common::DeviceEvent &event);

        // Newest first. An empty identifier returns events of every device.
        std::vector<JournalEntry> RecentEvents(const std::string &identifier, int limit = 50);
    };
}
