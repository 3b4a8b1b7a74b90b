#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../common/DeviceRecord.hpp"

namespace netwatch::monitor
{
    // Read-only view of one instance, published after every tick.
    struct Snapshot
    {
        std::string instance;
        std::map<std::string, common::DeviceRecord> devices;
        size_t online_count = 0;
        size_t total_count = 0;
        std::optional<common::Timestamp> last_full_scan;
    };

    Snapshot MakeSnapshot(std::string instance,
                          std::map<std::string, common::DeviceRecord> devices,
                          std::optional<common::Timestamp> last_full_scan);

    // Attribute bag of a device as presented to readers, with the derived online flag.
    nlohmann::json DeviceAttributes(const common::DeviceRecord &device);

    nlohmann::json SnapshotToJson(const Snapshot &snapshot);

    // Identifiers present in current but not in previous, in key order.
    std::vector<std::string> AddedIdentifiers(const Snapshot &previous, const Snapshot &current);
}
