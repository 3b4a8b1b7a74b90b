#include "VendorDatabase.hpp"
#include "../common/MacAddress.hpp"

#include <cctype>
#include <fstream>
#include <iostream>

namespace netwatch::scanner
{
    VendorDatabase::VendorDatabase(std::string path) : m_path(std::move(path))
    {
    }

    static std::string Trim(const std::string &s)
    {
        size_t begin = 0;
        while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])))
            ++begin;
        size_t end = s.size();
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
            --end;
        return s.substr(begin, end - begin);
    }

    size_t VendorDatabase::Load()
    {
        EnsureLoaded();
        return m_vendors.size();
    }

    void VendorDatabase::EnsureLoaded()
    {
        std::call_once(m_load_once, [this]()
        {
            std::ifstream in(m_path);
            if (!in.is_open())
            {
                std::cerr << "[Vendors] OUI database " << m_path << " not readable, vendor names will be empty.\n";
                return;
            }

            std::string line;
            while (std::getline(in, line))
            {
                auto marker = line.find("(hex)");
                if (marker == std::string::npos)
                    continue;

                std::string prefix = common::OuiPrefix(Trim(line.substr(0, marker)));
                std::string vendor = Trim(line.substr(marker + 5));
                if (prefix.size() != 6 || vendor.empty())
                    continue;

                m_vendors.emplace(prefix, vendor);
            }

            std::cout << "[Vendors] Loaded " << m_vendors.size() << " OUI prefixes from " << m_path << "\n";
        });
    }

    std::optional<std::string> VendorDatabase::Lookup(const std::string &mac)
    {
        EnsureLoaded();

        auto canonical = common::CanonicalMac(mac);
        if (!canonical.has_value())
            return std::nullopt;

        auto it = m_vendors.find(common::OuiPrefix(canonical.value()));
        if (it == m_vendors.end())
            return std::nullopt;
        return it->second;
    }
}
