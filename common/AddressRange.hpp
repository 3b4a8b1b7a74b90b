#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace netwatch::common
{
    class InvalidRange : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // An IPv4 network in CIDR form. A bare address is a /32.
    class AddressRange
    {
    public:
        // Host bits below the prefix are masked off ("10.0.0.7/24" is 10.0.0.0/24).
        // Throws InvalidRange.
        static AddressRange Parse(const std::string &text);

        // Usable host addresses in ascending order. Network and broadcast addresses are
        // left out for /30 and wider; /31 and /32 yield every address.
        std::vector<std::string> Hosts() const;

        size_t HostCount() const;
        bool Contains(const std::string &ip) const;
        std::string ToString() const;
        int PrefixLength() const { return m_prefix_length; }

    private:
        AddressRange(uint32_t network, int prefix_length);

        uint32_t m_network; // host byte order
        int m_prefix_length;
    };

    // Hosts of every range, first occurrence wins when ranges overlap.
    std::vector<std::string> ExpandRanges(const std::vector<AddressRange> &ranges);

    bool IsIPv4Address(const std::string &text);
}
