#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace netwatch::scanner
{
    // IPv4 -> MAC view of the kernel neighbor (ARP) cache. Only hosts on the same segment as
    // this machine ever show up here.
    class NeighborTable
    {
    public:
        explicit NeighborTable(std::string arp_path = "/proc/net/arp", bool include_local_interfaces = true);

        // Re-reads the cache. Returns false if the file could not be opened; the previous
        // contents are dropped either way.
        bool Refresh();

        std::optional<std::string> Lookup(const std::string &ip) const;
        size_t Size() const;

    private:
        void AddLocalInterfaces(std::unordered_map<std::string, std::string> &entries) const;

        std::string m_arp_path;
        bool m_include_local_interfaces;

        mutable std::mutex m_mutex;
        std::unordered_map<std::string, std::string> m_entries;
    };
}
