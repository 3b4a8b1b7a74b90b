#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace netwatch::scanner
{
    // Offline MAC prefix -> manufacturer lookup backed by the IEEE registry text file
    // ("00-00-0C   (hex)		Cisco Systems, Inc"). Loaded on first use.
    class VendorDatabase
    {
    public:
        explicit VendorDatabase(std::string path);

        std::optional<std::string> Lookup(const std::string &mac);

        // Loads immediately; returns the number of prefixes read.
        size_t Load();

    private:
        void EnsureLoaded();

        std::string m_path;
        std::once_flag m_load_once;
        std::unordered_map<std::string, std::string> m_vendors;
    };
}
