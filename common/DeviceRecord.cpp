#include "DeviceRecord.hpp"
#include "MacAddress.hpp"

#include <algorithm>

namespace netwatch::common
{
    std::string DeviceRecord::DisplayName() const
    {
        if (nickname.has_value() && !nickname->empty())
            return nickname.value();
        if (hostname.has_value() && !hostname->empty())
            return hostname.value();
        if (mac.has_value())
            return MacDigits(mac.value());

        std::string name = ip;
        std::replace(name.begin(), name.end(), '.', '_');
        return name;
    }

    bool DeviceRecord::operator==(const DeviceRecord &other) const
    {
        return identifier == other.identifier &&
               ip == other.ip &&
               mac == other.mac &&
               hostname == other.hostname &&
               vendor == other.vendor &&
               nickname == other.nickname &&
               first_seen == other.first_seen &&
               last_seen == other.last_seen &&
               failed_checks == other.failed_checks &&
               latency_ms == other.latency_ms &&
               watched == other.watched;
    }

    const char *EventTypeName(DeviceEventType type)
    {
        switch (type)
        {
        case DeviceEventType::DeviceOnline:
            return "device_online";
        case DeviceEventType::DeviceOffline:
            return "device_offline";
        case DeviceEventType::WatchedDeviceOffline:
            return "watched_device_offline";
        }
        return "unknown";
    }
}
