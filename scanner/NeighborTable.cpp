#include "NeighborTable.hpp"
#include "../common/MacAddress.hpp"

#include <tins/network_interface.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace netwatch::scanner
{
    // ATF_COM in the flags column: the entry is resolved.
    static constexpr unsigned long ARP_FLAG_COMPLETE = 0x2;

    NeighborTable::NeighborTable(std::string arp_path, bool include_local_interfaces)
        : m_arp_path(std::move(arp_path)), m_include_local_interfaces(include_local_interfaces)
    {
    }

    bool NeighborTable::Refresh()
    {
        std::unordered_map<std::string, std::string> entries;
        bool opened = false;

        std::ifstream arpFile(m_arp_path);
        if (arpFile.is_open())
        {
            opened = true;
            std::string line;
            std::getline(arpFile, line); // header
            while (std::getline(arpFile, line))
            {
                std::stringstream ss(line);
                std::string ip, hw_type, flags, mac, mask, dev;
                if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                    continue;

                unsigned long flag_bits = std::strtoul(flags.c_str(), nullptr, 16);
                if ((flag_bits & ARP_FLAG_COMPLETE) == 0)
                    continue;
                if (!common::IsUsableMac(mac))
                    continue;

                entries[ip] = common::CanonicalMac(mac).value();
            }
        }
        else
        {
            std::cerr << "[Neighbors] Could not open " << m_arp_path << "\n";
        }

        if (m_include_local_interfaces)
            AddLocalInterfaces(entries);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries = std::move(entries);
        return opened;
    }

    void NeighborTable::AddLocalInterfaces(std::unordered_map<std::string, std::string> &entries) const
    {
        try
        {
            for (const auto &iface : Tins::NetworkInterface::all())
            {
                if (iface.is_loopback())
                    continue;

                Tins::NetworkInterface::Info info = iface.info();
                std::string ip = info.ip_addr.to_string();
                std::string mac = info.hw_addr.to_string();
                if (ip == "0.0.0.0" || !common::IsUsableMac(mac))
                    continue;

                entries.emplace(ip, common::CanonicalMac(mac).value());
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Neighbors] Could not enumerate local interfaces: " << e.what() << "\n";
        }
    }

    std::optional<std::string> NeighborTable::Lookup(const std::string &ip) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(ip);
        if (it == m_entries.end())
            return std::nullopt;
        return it->second;
    }

    size_t NeighborTable::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }
}
