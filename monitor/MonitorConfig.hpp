#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../common/AddressRange.hpp"

namespace netwatch::monitor
{
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct InstanceConfig
    {
        std::string name;
        std::vector<common::AddressRange> ranges;
        std::chrono::minutes full_scan_interval{60};
        std::chrono::minutes quick_check_interval{1};
        std::chrono::milliseconds probe_timeout{1000};
        int offline_threshold = 3;
        int ping_count = 1;
    };

    struct DaemonConfig
    {
        std::string state_dir = "/var/lib/netwatch";
        std::string control_socket = "/run/netwatch.sock";
        std::string journal; // defaults to <state_dir>/events.db
        std::string oui_database = "/usr/share/ieee-data/oui.txt";
        std::optional<std::string> nameserver;
        size_t max_in_flight = 50;
        std::chrono::milliseconds hostname_timeout{1000};
        std::vector<InstanceConfig> instances;
    };

    // Throw ConfigError, or InvalidRange for a malformed range.
    InstanceConfig ParseInstanceConfig(const nlohmann::json &doc);
    DaemonConfig ParseDaemonConfig(const nlohmann::json &doc);
    DaemonConfig LoadDaemonConfig(const std::string &path);

    // <state_dir>/<name>.json
    std::string StateFilePath(const DaemonConfig &config, const InstanceConfig &instance);
}
