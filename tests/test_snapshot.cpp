#include <string>

#include "../monitor/Snapshot.hpp"

using namespace netwatch;

int main()
{
    common::DeviceRecord online;
    online.identifier = "aa:bb:cc:dd:ee:01";
    online.ip = "192.168.1.10";
    online.mac = "aa:bb:cc:dd:ee:01";
    online.first_seen = common::Now();
    online.last_seen = online.first_seen;
    online.latency_ms = 1.5;

    common::DeviceRecord offline;
    offline.identifier = "192.168.1.11";
    offline.ip = "192.168.1.11";
    offline.first_seen = online.first_seen;
    offline.last_seen = online.first_seen;
    offline.failed_checks = 3;

    auto attributes = monitor::DeviceAttributes(online);
    if (attributes["online"] != true || attributes["latency_ms"] != 1.5) return 1;
    if (attributes["display_name"] != "aabbccddee01" || !attributes["hostname"].is_null()) return 2;

    attributes = monitor::DeviceAttributes(offline);
    if (attributes["online"] != false || !attributes["latency_ms"].is_null()) return 3;
    if (attributes["display_name"] != "192_168_1_11") return 4;

    offline.hostname = "printer";
    if (offline.DisplayName() != "printer") return 5;
    offline.nickname = "office printer";
    if (offline.DisplayName() != "office printer") return 6;

    auto previous = monitor::MakeSnapshot("lan", {{online.identifier, online}}, std::nullopt);
    auto current = monitor::MakeSnapshot("lan", {{online.identifier, online}, {offline.identifier, offline}}, common::Now());
    if (current.total_count != 2 || current.online_count != 1) return 7;

    auto added = monitor::AddedIdentifiers(previous, current);
    if (added.size() != 1 || added[0] != "192.168.1.11") return 8;
    if (!monitor::AddedIdentifiers(current, previous).empty()) return 9;

    auto doc = monitor::SnapshotToJson(current);
    if (doc["online_count"] != 1 || doc["total_count"] != 2 || doc["devices"].size() != 2) return 10;
    if (!doc["last_full_scan"].is_string()) return 11;
    if (!monitor::SnapshotToJson(previous)["last_full_scan"].is_null()) return 12;
    return 0;
}
