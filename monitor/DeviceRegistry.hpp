#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../common/DeviceRecord.hpp"
#include "../scanner/NetworkScanner.hpp"

namespace netwatch::monitor
{
    class DeviceNotFound : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    using EventCallback = std::function<void(const common::DeviceEvent &)>;

    // Device map of one coordinator instance plus the online/offline state machine.
    //
    // Every public method takes the registry lock for its whole duration, so an update to a
    // device (identity migration included) is never observed half applied. Events produced by
    // an update are delivered after the lock is released, in the order they were produced.
    class DeviceRegistry
    {
    public:
        DeviceRegistry(std::string name, int offline_threshold);

        void SetEventCallback(EventCallback callback);

        // Replaces the whole map, used when restoring persisted state. No events.
        void Restore(std::map<std::string, common::DeviceRecord> devices);

        // Merges the result of a full scan. Known devices missing from the result count as one
        // failed check each.
        void ApplyFullScan(const std::vector<scanner::ScannedHost> &found, common::Timestamp now);

        void ApplyQuickCheck(const std::vector<scanner::CheckResult> &results, common::Timestamp now);

        std::vector<scanner::CheckTarget> CheckTargets() const;

        // Throw DeviceNotFound for an unknown identifier.
        common::DeviceRecord SetWatched(const std::string &identifier, bool watched);
        common::DeviceRecord SetNickname(const std::string &identifier, const std::string &nickname);
        common::DeviceRecord Remove(const std::string &identifier);

        // Maps a user supplied id (identifier, MAC in any notation, or IP) to the identifier of a
        // record in this registry: exact identifier first, then MAC attribute, then IP attribute.
        std::optional<std::string> Resolve(const std::string &raw_id) const;

        std::optional<common::DeviceRecord> Get(const std::string &identifier) const;
        std::map<std::string, common::DeviceRecord> Devices() const;
        size_t Size() const;
        size_t OnlineCount() const;
        int OfflineThreshold() const { return m_offline_threshold; }

    private:
        using EventList = std::vector<common::DeviceEvent>;

        common::DeviceRecord *FindForScan(const scanner::ScannedHost &host);
        common::DeviceRecord &MigrateToMac(const std::string &ip_key, const std::string &mac);
        void RecordSuccess(common::DeviceRecord &device, double rtt_ms, common::Timestamp now, EventList &events);
        void RecordFailure(common::DeviceRecord &device, common::Timestamp now, EventList &events);
        void Deliver(const EventList &events);

        static common::DeviceEvent MakeEvent(common::DeviceEventType type, const common::DeviceRecord &device, common::Timestamp now);

        std::string m_name;
        int m_offline_threshold;

        mutable std::mutex m_mutex;
        std::map<std::string, common::DeviceRecord> m_devices;

        std::mutex m_callback_mutex;
        EventCallback m_callback;
    };
}
