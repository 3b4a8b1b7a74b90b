#include "DeviceRegistry.hpp"
#include "../common/AddressRange.hpp"
#include "../common/MacAddress.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace netwatch::monitor
{
    using common::DeviceEvent;
    using common::DeviceEventType;
    using common::DeviceRecord;
    using common::Timestamp;

    DeviceRegistry::DeviceRegistry(std::string name, int offline_threshold)
        : m_name(std::move(name)), m_offline_threshold(std::max(1, offline_threshold))
    {
    }

    void DeviceRegistry::SetEventCallback(EventCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        m_callback = std::move(callback);
    }

    void DeviceRegistry::Restore(std::map<std::string, DeviceRecord> devices)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_devices = std::move(devices);
    }

    DeviceEvent DeviceRegistry::MakeEvent(DeviceEventType type, const DeviceRecord &device, Timestamp now)
    {
        DeviceEvent event;
        event.type = type;
        event.identifier = device.identifier;
        event.ip = device.ip;
        event.hostname = device.hostname;
        event.display_name = device.DisplayName();
        event.timestamp = now;
        return event;
    }

    void DeviceRegistry::RecordSuccess(DeviceRecord &device, double rtt_ms, Timestamp now, EventList &events)
    {
        bool was_offline = !device.IsOnline();

        device.failed_checks = 0;
        device.last_seen = now;
        device.latency_ms = rtt_ms;

        if (was_offline)
        {
            std::cout << "[Registry " << m_name << "] Device came back online: "
                      << device.DisplayName() << " (" << device.ip << ")\n";
            events.push_back(MakeEvent(DeviceEventType::DeviceOnline, device, now));
        }
    }

    void DeviceRegistry::RecordFailure(DeviceRecord &device, Timestamp now, EventList &events)
    {
        device.failed_checks += 1;

        if (!device.IsOnline())
            return;

        if (device.failed_checks >= m_offline_threshold)
        {
            device.latency_ms.reset();
            std::cout << "[Registry " << m_name << "] Device went offline: "
                      << device.DisplayName() << " (" << device.ip << ")\n";

            events.push_back(MakeEvent(DeviceEventType::DeviceOffline, device, now));
            if (device.watched)
                events.push_back(MakeEvent(DeviceEventType::WatchedDeviceOffline, device, now));
        }
        else
        {
            std::cout << "[Registry " << m_name << "] Device " << device.DisplayName() << " not responding ("
                      << device.failed_checks << "/" << m_offline_threshold << ")\n";
        }
    }

    DeviceRecord &DeviceRegistry::MigrateToMac(const std::string &ip_key, const std::string &mac)
    {
        auto node = m_devices.extract(ip_key);
        DeviceRecord moved = std::move(node.mapped());
        moved.mac = mac;
        moved.identifier = mac;

        auto existing = m_devices.find(mac);
        if (existing != m_devices.end())
        {
            // The same device was already known by its MAC under another address.
            DeviceRecord &target = existing->second;
            target.first_seen = std::min(target.first_seen, moved.first_seen);
            target.watched = target.watched || moved.watched;
            if (!target.nickname.has_value())
                target.nickname = moved.nickname;
            if (!target.hostname.has_value())
                target.hostname = moved.hostname;
            std::cout << "[Registry " << m_name << "] Merged " << ip_key << " into " << mac << "\n";
            return target;
        }

        std::cout << "[Registry " << m_name << "] Device " << ip_key << " now has MAC address: " << mac << "\n";
        auto inserted = m_devices.emplace(mac, std::move(moved));
        return inserted.first->second;
    }

    DeviceRecord *DeviceRegistry::FindForScan(const scanner::ScannedHost &host)
    {
        if (host.mac.has_value())
        {
            const std::string &mac = host.mac.value();
            auto by_ip = m_devices.find(host.ip);
            bool ip_record_without_mac = by_ip != m_devices.end() && !by_ip->second.mac.has_value();

            if (ip_record_without_mac)
                return &MigrateToMac(host.ip, mac);

            auto by_mac = m_devices.find(mac);
            if (by_mac != m_devices.end())
                return &by_mac->second;
            return nullptr;
        }

        auto by_ip = m_devices.find(host.ip);
        if (by_ip != m_devices.end())
            return &by_ip->second;

        // No neighbor entry this time, but the address belongs to a device known by MAC.
        for (auto &entry : m_devices)
        {
            if (entry.second.ip == host.ip)
                return &entry.second;
        }
        return nullptr;
    }

    void DeviceRegistry::ApplyFullScan(const std::vector<scanner::ScannedHost> &found, Timestamp now)
    {
        EventList events;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::set<std::string> responded;

            for (const auto &host : found)
            {
                DeviceRecord *device = FindForScan(host);
                if (device != nullptr)
                {
                    device->ip = host.ip;
                    if (host.mac.has_value())
                        device->mac = host.mac;
                    if (host.hostname.has_value())
                        device->hostname = host.hostname;
                    if (host.vendor.has_value())
                        device->vendor = host.vendor;
                    RecordSuccess(*device, host.rtt_ms, now, events);
                    responded.insert(device->identifier);
                    continue;
                }

                DeviceRecord created;
                created.identifier = host.mac.value_or(host.ip);
                created.ip = host.ip;
                created.mac = host.mac;
                created.hostname = host.hostname;
                created.vendor = host.vendor;
                created.first_seen = now;
                created.last_seen = now;
                created.failed_checks = 0;
                created.latency_ms = host.rtt_ms;

                std::cout << "[Registry " << m_name << "] Discovered new device: "
                          << created.DisplayName() << " (" << created.ip << ")\n";
                responded.insert(created.identifier);
                m_devices.emplace(created.identifier, std::move(created));
            }

            for (auto &entry : m_devices)
            {
                if (responded.count(entry.first) == 0)
                    RecordFailure(entry.second, now, events);
            }
        }
        Deliver(events);
    }

    void DeviceRegistry::ApplyQuickCheck(const std::vector<scanner::CheckResult> &results, Timestamp now)
    {
        EventList events;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            // Successes first: one may merge an IP record into a MAC record whose own result,
            // for its old address, is a failure in the same batch. Each device is updated once.
            std::set<std::string> updated;

            for (const auto &result : results)
            {
                if (!result.reachable)
                    continue;

                auto it = m_devices.find(result.identifier);
                if (it == m_devices.end())
                    continue; // forgotten while the check was running

                std::string answered_ip = result.ip.empty() ? it->second.ip : result.ip;
                DeviceRecord *device = &it->second;
                if (result.mac.has_value() && !device->mac.has_value())
                    device = &MigrateToMac(result.identifier, result.mac.value());

                if (updated.count(device->identifier) != 0)
                    continue;

                device->ip = answered_ip;
                RecordSuccess(*device, result.rtt_ms.value_or(0.0), now, events);
                updated.insert(device->identifier);
            }

            for (const auto &result : results)
            {
                if (result.reachable || updated.count(result.identifier) != 0)
                    continue;

                auto it = m_devices.find(result.identifier);
                if (it == m_devices.end())
                    continue;

                RecordFailure(it->second, now, events);
                updated.insert(result.identifier);
            }
        }
        Deliver(events);
    }

    std::vector<scanner::CheckTarget> DeviceRegistry::CheckTargets() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<scanner::CheckTarget> targets;
        targets.reserve(m_devices.size());
        for (const auto &entry : m_devices)
        {
            scanner::CheckTarget target;
            target.identifier = entry.first;
            target.ip = entry.second.ip;
            target.needs_mac = !entry.second.mac.has_value();
            targets.push_back(std::move(target));
        }
        return targets;
    }

    DeviceRecord DeviceRegistry::SetWatched(const std::string &identifier, bool watched)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(identifier);
        if (it == m_devices.end())
            throw DeviceNotFound("No device with identifier " + identifier);

        it->second.watched = watched;
        std::cout << "[Registry " << m_name << "] " << it->second.DisplayName()
                  << (watched ? " is now watched\n" : " is no longer watched\n");
        return it->second;
    }

    DeviceRecord DeviceRegistry::SetNickname(const std::string &identifier, const std::string &nickname)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(identifier);
        if (it == m_devices.end())
            throw DeviceNotFound("No device with identifier " + identifier);

        if (nickname.empty())
            it->second.nickname.reset();
        else
            it->second.nickname = nickname;
        return it->second;
    }

    DeviceRecord DeviceRegistry::Remove(const std::string &identifier)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(identifier);
        if (it == m_devices.end())
            throw DeviceNotFound("No device with identifier " + identifier);

        DeviceRecord removed = std::move(it->second);
        m_devices.erase(it);
        std::cout << "[Registry " << m_name << "] Forgot device: " << removed.DisplayName() << "\n";
        return removed;
    }

    std::optional<std::string> DeviceRegistry::Resolve(const std::string &raw_id) const
    {
        std::string id;
        for (char c : raw_id)
        {
            if (!std::isspace(static_cast<unsigned char>(c)))
                id.push_back(c);
        }
        if (id.empty())
            return std::nullopt;

        std::optional<std::string> mac;
        if (!common::IsIPv4Address(id))
            mac = common::CanonicalMac(id);

        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_devices.count(id) != 0)
            return id;
        if (mac.has_value() && m_devices.count(mac.value()) != 0)
            return mac;

        if (mac.has_value())
        {
            for (const auto &entry : m_devices)
            {
                if (entry.second.mac == mac)
                    return entry.first;
            }
        }

        for (const auto &entry : m_devices)
        {
            if (entry.second.ip == id)
                return entry.first;
        }
        return std::nullopt;
    }

    std::optional<DeviceRecord> DeviceRegistry::Get(const std::string &identifier) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(identifier);
        if (it == m_devices.end())
            return std::nullopt;
        return it->second;
    }

    std::map<std::string, DeviceRecord> DeviceRegistry::Devices() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices;
    }

    size_t DeviceRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    size_t DeviceRegistry::OnlineCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_devices.begin(), m_devices.end(), [](const auto &entry)
                                                 { return entry.second.IsOnline(); }));
    }

    void DeviceRegistry::Deliver(const EventList &events)
    {
        if (events.empty())
            return;

        std::lock_guard<std::mutex> lock(m_callback_mutex);
        if (!m_callback)
            return;
        for (const auto &event : events)
            m_callback(event);
    }
}
