#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "../common/DeviceRecord.hpp"

namespace netwatch::monitor
{
    class CorruptState : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct StoredState
    {
        std::map<std::string, common::DeviceRecord> devices;
        std::optional<common::Timestamp> last_full_scan;
    };

    // Versioned JSON state file of one coordinator instance.
    class DeviceStore
    {
    public:
        static constexpr int CURRENT_VERSION = 2;

        explicit DeviceStore(std::string path);

        // std::nullopt when no state has been written yet. Throws CorruptState.
        std::optional<StoredState> Load() const;

        // Writes a sibling temporary file, syncs it and renames it over the state file.
        // Throws std::runtime_error on I/O failure.
        void Save(const StoredState &state) const;

        const std::string &Path() const { return m_path; }

        static nlohmann::json Encode(const StoredState &state);
        static StoredState Decode(const nlohmann::json &doc);

        // Version 1 kept devices as a list of {ip_address, mac_address, hostname, vendor,
        // is_online, first_seen, last_seen, failed_checks}.
        static nlohmann::json MigrateFromV1(const nlohmann::json &doc);

    private:
        std::string m_path;
    };
}
