#pragma once

#include <optional>
#include <string>
#include "TimeUtil.hpp"

namespace netwatch::common
{
    struct DeviceRecord
    {
        std::string identifier; // mac when known, otherwise ip
        std::string ip;
        std::optional<std::string> mac;
        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<std::string> nickname;
        Timestamp first_seen;
        Timestamp last_seen;
        int failed_checks = 0;
        std::optional<double> latency_ms; // set exactly while the device is online
        bool watched = false;

        bool IsOnline() const { return latency_ms.has_value(); }

        // nickname, hostname, mac without separators, ip with '.' replaced by '_'
        std::string DisplayName() const;

        bool operator==(const DeviceRecord &other) const;
        bool operator!=(const DeviceRecord &other) const { return !(*this == other); }
    };

    enum class DeviceEventType
    {
        DeviceOnline,
        DeviceOffline,
        WatchedDeviceOffline
    };

    struct DeviceEvent
    {
        DeviceEventType type;
        std::string identifier;
        std::string ip;
        std::optional<std::string> hostname;
        std::string display_name;
        Timestamp timestamp;
    };

    // "device_online", "device_offline", "watched_device_offline"
    const char *EventTypeName(DeviceEventType type);
}
