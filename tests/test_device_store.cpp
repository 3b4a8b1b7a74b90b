#include <filesystem>
#include <fstream>
#include <string>

#include "../monitor/DeviceStore.hpp"

using namespace netwatch;
using monitor::CorruptState;
using monitor::DeviceStore;
using monitor::StoredState;

static void WriteFile(const std::string &path, const std::string &content)
{
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

static bool LoadThrowsCorrupt(const DeviceStore &store)
{
    try
    {
        store.Load();
    }
    catch (const CorruptState &)
    {
        return true;
    }
    return false;
}

int main()
{
    std::string dir = "/tmp/netwatch_store_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    DeviceStore store(dir + "/lan.json");
    if (store.Load().has_value()) return 1;

    StoredState state;
    state.last_full_scan = common::Now();

    common::DeviceRecord online;
    online.identifier = "aa:bb:cc:dd:ee:01";
    online.ip = "192.168.1.10";
    online.mac = "aa:bb:cc:dd:ee:01";
    online.hostname = "nas";
    online.vendor = "Synology Incorporated";
    online.nickname = "backup box";
    online.first_seen = common::Now() - std::chrono::hours(48);
    online.last_seen = common::Now();
    online.latency_ms = 0.42;
    online.watched = true;
    state.devices[online.identifier] = online;

    common::DeviceRecord offline;
    offline.identifier = "192.168.1.50";
    offline.ip = "192.168.1.50";
    offline.first_seen = common::Now() - std::chrono::hours(1);
    offline.last_seen = offline.first_seen;
    offline.failed_checks = 7;
    state.devices[offline.identifier] = offline;

    store.Save(state);
    if (std::filesystem::exists(dir + "/lan.json.tmp")) return 2;

    auto loaded = store.Load();
    if (!loaded) return 3;
    if (loaded->devices.size() != 2) return 4;
    if (loaded->devices.at(online.identifier) != online) return 5;
    if (loaded->devices.at(offline.identifier) != offline) return 6;
    if (loaded->last_full_scan != state.last_full_scan) return 7;

    // version 1 layout: a list of devices, online flag not carried over
    WriteFile(store.Path(),
              "{\"devices\": ["
              "{\"ip_address\": \"192.168.1.10\", \"mac_address\": \"AA:BB:CC:DD:EE:01\", \"hostname\": \"nas\","
              " \"vendor\": null, \"is_online\": true, \"first_seen\": \"2024-01-01T10:00:00+00:00\","
              " \"last_seen\": \"2024-01-02T10:00:00\", \"failed_checks\": 0},"
              "{\"ip_address\": \"192.168.1.20\", \"mac_address\": null, \"hostname\": null, \"vendor\": null,"
              " \"is_online\": false, \"first_seen\": \"2024-01-01T10:00:00+00:00\","
              " \"last_seen\": \"2024-01-01T11:00:00+00:00\", \"failed_checks\": 4}],"
              " \"last_full_scan\": \"2024-01-02T10:00:00+00:00\"}");
    auto migrated = store.Load();
    if (!migrated) return 10;
    if (migrated->devices.size() != 2) return 11;
    const auto &nas = migrated->devices.at("aa:bb:cc:dd:ee:01");
    if (nas.ip != "192.168.1.10" || nas.hostname != std::optional<std::string>("nas")) return 12;
    if (nas.IsOnline() || nas.watched || nas.vendor.has_value()) return 13;
    const auto &plain = migrated->devices.at("192.168.1.20");
    if (plain.mac.has_value() || plain.failed_checks != 4) return 14;
    if (!migrated->last_full_scan) return 15;

    // unreadable or unsupported content
    WriteFile(store.Path(), "{ not json");
    if (!LoadThrowsCorrupt(store)) return 20;
    WriteFile(store.Path(), "{\"version\": 99, \"devices\": {}}");
    if (!LoadThrowsCorrupt(store)) return 21;
    WriteFile(store.Path(), "{\"version\": 2, \"devices\": {\"10.0.0.1\": {\"ip\": \"10.0.0.1\"}}}");
    if (!LoadThrowsCorrupt(store)) return 22;
    WriteFile(store.Path(), "{\"version\": 2, \"devices\": {\"10.0.0.1\": {\"ip\": \"10.0.0.1\","
                            " \"first_seen\": \"2024-01-01T00:00:00Z\", \"last_seen\": \"2024-01-01T00:00:00Z\","
                            " \"failed_checks\": \"three\"}}}");
    if (!LoadThrowsCorrupt(store)) return 23;

    std::filesystem::remove_all(dir);
    return 0;
}
