#include "DeviceStore.hpp"
#include "../common/MacAddress.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace netwatch::monitor
{
    using common::DeviceRecord;
    using nlohmann::json;

    namespace
    {
        common::Timestamp RequireTimestamp(const json &value, const char *field)
        {
            if (!value.is_string())
                throw CorruptState(std::string("Field ") + field + " is not a timestamp");

            auto parsed = common::ParseTimestamp(value.get<std::string>());
            if (!parsed)
                throw CorruptState(std::string("Field ") + field + " has a malformed timestamp");
            return *parsed;
        }

        std::optional<std::string> OptionalString(const json &object, const char *field)
        {
            auto it = object.find(field);
            if (it == object.end() || it->is_null())
                return std::nullopt;
            if (!it->is_string())
                throw CorruptState(std::string("Field ") + field + " is not a string");
            std::string value = it->get<std::string>();
            if (value.empty())
                return std::nullopt;
            return value;
        }

        void WriteAll(int fd, const std::string &data)
        {
            size_t written = 0;
            while (written < data.size())
            {
                ssize_t n = ::write(fd, data.data() + written, data.size() - written);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    throw std::runtime_error(std::string("write failed: ") + std::strerror(errno));
                }
                written += static_cast<size_t>(n);
            }
        }
    }

    DeviceStore::DeviceStore(std::string path) : m_path(std::move(path)) {}

    std::optional<StoredState> DeviceStore::Load() const
    {
        std::ifstream in(m_path);
        if (!in.is_open())
            return std::nullopt;

        std::stringstream content;
        content << in.rdbuf();

        json doc = json::parse(content.str(), nullptr, false);
        if (doc.is_discarded())
            throw CorruptState("State file " + m_path + " is not valid JSON");
        if (!doc.is_object())
            throw CorruptState("State file " + m_path + " does not hold an object");

        int version = 1;
        auto version_it = doc.find("version");
        if (version_it != doc.end())
        {
            if (!version_it->is_number_integer())
                throw CorruptState("State file " + m_path + " has a non-integer version");
            version = version_it->get<int>();
        }

        if (version > CURRENT_VERSION || version < 1)
            throw CorruptState("State file " + m_path + " has unsupported version " + std::to_string(version));

        try
        {
            if (version == 1)
            {
                std::cout << "[Store] Migrating " << m_path << " from version 1\n";
                doc = MigrateFromV1(doc);
            }
            return Decode(doc);
        }
        catch (const json::exception &e)
        {
            throw CorruptState("State file " + m_path + ": " + e.what());
        }
    }

    void DeviceStore::Save(const StoredState &state) const
    {
        std::string data = Encode(state).dump(2);
        std::string tmp_path = m_path + ".tmp";

        int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0)
            throw std::runtime_error("Cannot open " + tmp_path + ": " + std::strerror(errno));

        try
        {
            WriteAll(fd, data);
            if (::fsync(fd) != 0)
                throw std::runtime_error(std::string("fsync failed: ") + std::strerror(errno));
        }
        catch (const std::exception &)
        {
            ::close(fd);
            ::unlink(tmp_path.c_str());
            throw;
        }
        ::close(fd);

        if (::rename(tmp_path.c_str(), m_path.c_str()) != 0)
        {
            int err = errno;
            ::unlink(tmp_path.c_str());
            throw std::runtime_error("Cannot replace " + m_path + ": " + std::strerror(err));
        }
    }

    json DeviceStore::Encode(const StoredState &state)
    {
        json devices = json::object();
        for (const auto &[identifier, device] : state.devices)
        {
            json entry;
            entry["ip"] = device.ip;
            if (device.mac)
                entry["mac"] = *device.mac;
            if (device.hostname)
                entry["hostname"] = *device.hostname;
            if (device.vendor)
                entry["vendor"] = *device.vendor;
            if (device.nickname)
                entry["nickname"] = *device.nickname;
            entry["first_seen"] = common::FormatTimestamp(device.first_seen);
            entry["last_seen"] = common::FormatTimestamp(device.last_seen);
            entry["failed_checks"] = device.failed_checks;
            if (device.latency_ms)
                entry["latency_ms"] = *device.latency_ms;
            entry["watched"] = device.watched;
            devices[identifier] = std::move(entry);
        }

        json doc;
        doc["version"] = CURRENT_VERSION;
        doc["last_full_scan"] = state.last_full_scan ? json(common::FormatTimestamp(*state.last_full_scan)) : json(nullptr);
        doc["devices"] = std::move(devices);
        return doc;
    }

    StoredState DeviceStore::Decode(const json &doc)
    {
        StoredState state;

        auto scan_it = doc.find("last_full_scan");
        if (scan_it != doc.end() && !scan_it->is_null())
            state.last_full_scan = RequireTimestamp(*scan_it, "last_full_scan");

        auto devices_it = doc.find("devices");
        if (devices_it == doc.end())
            return state;
        if (!devices_it->is_object())
            throw CorruptState("Field devices is not an object");

        for (const auto &[identifier, entry] : devices_it->items())
        {
            if (!entry.is_object())
                throw CorruptState("Device " + identifier + " is not an object");

            DeviceRecord device;
            device.identifier = identifier;

            auto ip = OptionalString(entry, "ip");
            if (!ip)
                throw CorruptState("Device " + identifier + " has no ip");
            device.ip = *ip;

            device.mac = OptionalString(entry, "mac");
            device.hostname = OptionalString(entry, "hostname");
            device.vendor = OptionalString(entry, "vendor");
            device.nickname = OptionalString(entry, "nickname");
            device.first_seen = RequireTimestamp(entry.value("first_seen", json()), "first_seen");
            device.last_seen = RequireTimestamp(entry.value("last_seen", json()), "last_seen");

            auto failed = entry.find("failed_checks");
            if (failed != entry.end())
            {
                if (!failed->is_number_integer() || failed->get<int>() < 0)
                    throw CorruptState("Device " + identifier + " has a bad failed_checks value");
                device.failed_checks = failed->get<int>();
            }

            auto latency = entry.find("latency_ms");
            if (latency != entry.end() && !latency->is_null())
            {
                if (!latency->is_number())
                    throw CorruptState("Device " + identifier + " has a bad latency_ms value");
                device.latency_ms = latency->get<double>();
            }

            auto watched = entry.find("watched");
            if (watched != entry.end())
            {
                if (!watched->is_boolean())
                    throw CorruptState("Device " + identifier + " has a bad watched value");
                device.watched = watched->get<bool>();
            }

            state.devices.emplace(identifier, std::move(device));
        }
        return state;
    }

    json DeviceStore::MigrateFromV1(const json &doc)
    {
        json migrated;
        migrated["version"] = CURRENT_VERSION;
        migrated["last_full_scan"] = doc.value("last_full_scan", json());
        migrated["devices"] = json::object();

        auto devices_it = doc.find("devices");
        if (devices_it == doc.end() || devices_it->is_null())
            return migrated;
        if (!devices_it->is_array())
            throw CorruptState("Version 1 devices field is not a list");

        for (const auto &old : *devices_it)
        {
            if (!old.is_object())
                throw CorruptState("Version 1 device entry is not an object");

            auto ip = OptionalString(old, "ip_address");
            if (!ip)
                throw CorruptState("Version 1 device entry has no ip_address");

            std::optional<std::string> mac;
            if (auto raw_mac = OptionalString(old, "mac_address"))
                mac = common::CanonicalMac(*raw_mac);

            std::string identifier = mac.value_or(*ip);
            if (migrated["devices"].contains(identifier))
                continue;

            // Online state is not carried over: a record becomes online again with its first
            // successful probe.
            json entry;
            entry["ip"] = *ip;
            if (mac)
                entry["mac"] = *mac;
            if (auto hostname = OptionalString(old, "hostname"))
                entry["hostname"] = *hostname;
            if (auto vendor = OptionalString(old, "vendor"))
                entry["vendor"] = *vendor;
            entry["first_seen"] = old.value("first_seen", json());
            entry["last_seen"] = old.value("last_seen", json());
            entry["failed_checks"] = old.value("failed_checks", 0);
            entry["watched"] = false;
            migrated["devices"][identifier] = std::move(entry);
        }
        return migrated;
    }
}
