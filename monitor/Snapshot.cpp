#include "Snapshot.hpp"

namespace netwatch::monitor
{
    using nlohmann::json;

    namespace
    {
        json OrNull(const std::optional<std::string> &value)
        {
            return value ? json(*value) : json(nullptr);
        }
    }

    Snapshot MakeSnapshot(std::string instance,
                          std::map<std::string, common::DeviceRecord> devices,
                          std::optional<common::Timestamp> last_full_scan)
    {
        Snapshot snapshot;
        snapshot.instance = std::move(instance);
        snapshot.total_count = devices.size();
        for (const auto &entry : devices)
        {
            if (entry.second.IsOnline())
                ++snapshot.online_count;
        }
        snapshot.devices = std::move(devices);
        snapshot.last_full_scan = last_full_scan;
        return snapshot;
    }

    json DeviceAttributes(const common::DeviceRecord &device)
    {
        return json{
            {"identifier", device.identifier},
            {"ip_address", device.ip},
            {"mac_address", OrNull(device.mac)},
            {"hostname", OrNull(device.hostname)},
            {"vendor", OrNull(device.vendor)},
            {"nickname", OrNull(device.nickname)},
            {"display_name", device.DisplayName()},
            {"first_seen", common::FormatTimestamp(device.first_seen)},
            {"last_seen", common::FormatTimestamp(device.last_seen)},
            {"failed_checks", device.failed_checks},
            {"latency_ms", device.latency_ms ? json(*device.latency_ms) : json(nullptr)},
            {"watched", device.watched},
            {"online", device.IsOnline()}};
    }

    json SnapshotToJson(const Snapshot &snapshot)
    {
        json devices = json::array();
        for (const auto &entry : snapshot.devices)
            devices.push_back(DeviceAttributes(entry.second));

        return json{
            {"instance", snapshot.instance},
            {"online_count", snapshot.online_count},
            {"total_count", snapshot.total_count},
            {"last_full_scan", snapshot.last_full_scan ? json(common::FormatTimestamp(*snapshot.last_full_scan)) : json(nullptr)},
            {"devices", std::move(devices)}};
    }

    std::vector<std::string> AddedIdentifiers(const Snapshot &previous, const Snapshot &current)
    {
        std::vector<std::string> added;
        for (const auto &entry : current.devices)
        {
            if (previous.devices.count(entry.first) == 0)
                added.push_back(entry.first);
        }
        return added;
    }
}
