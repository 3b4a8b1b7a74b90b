#include "AddressRange.hpp"

#include <tins/ip_address.h>
#include <arpa/inet.h>

#include <cctype>
#include <unordered_set>

namespace netwatch::common
{
    // Anything wider would turn a full scan into hundreds of thousands of probes.
    static constexpr int MIN_PREFIX_LENGTH = 16;

    static uint32_t MaskFor(int prefix_length)
    {
        if (prefix_length == 0)
            return 0;
        return 0xFFFFFFFFu << (32 - prefix_length);
    }

    static std::string FormatHostOrder(uint32_t value)
    {
        return Tins::IPv4Address(htonl(value)).to_string();
    }

    bool IsIPv4Address(const std::string &text)
    {
        in_addr addr{};
        return inet_pton(AF_INET, text.c_str(), &addr) == 1;
    }

    AddressRange::AddressRange(uint32_t network, int prefix_length)
        : m_network(network), m_prefix_length(prefix_length)
    {
    }

    AddressRange AddressRange::Parse(const std::string &text)
    {
        std::string trimmed;
        for (char c : text)
        {
            if (!std::isspace(static_cast<unsigned char>(c)))
                trimmed.push_back(c);
        }

        if (trimmed.empty())
            throw InvalidRange("Empty range");

        if (trimmed.find(':') != std::string::npos)
            throw InvalidRange("IPv6 ranges are not supported: " + text);

        std::string address_part = trimmed;
        int prefix_length = 32;

        auto slash = trimmed.find('/');
        if (slash != std::string::npos)
        {
            address_part = trimmed.substr(0, slash);
            std::string prefix_part = trimmed.substr(slash + 1);
            if (prefix_part.empty() || prefix_part.size() > 2)
                throw InvalidRange("Invalid prefix length in range: " + text);
            for (char c : prefix_part)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    throw InvalidRange("Invalid prefix length in range: " + text);
            }
            prefix_length = std::stoi(prefix_part);
            if (prefix_length > 32)
                throw InvalidRange("Invalid prefix length in range: " + text);
        }

        if (!IsIPv4Address(address_part))
            throw InvalidRange("Invalid network address in range: " + text);

        if (prefix_length < MIN_PREFIX_LENGTH)
            throw InvalidRange("Range too large (minimum prefix is /" + std::to_string(MIN_PREFIX_LENGTH) + "): " + text);

        Tins::IPv4Address address(address_part);
        uint32_t host_order = ntohl(static_cast<uint32_t>(address));
        return AddressRange(host_order & MaskFor(prefix_length), prefix_length);
    }

    std::vector<std::string> AddressRange::Hosts() const
    {
        std::vector<std::string> hosts;
        uint32_t size = 1u << (32 - m_prefix_length);

        uint32_t first = m_network;
        uint32_t last = m_network + (size - 1);
        if (m_prefix_length <= 30)
        {
            first += 1;
            last -= 1;
        }

        hosts.reserve(last - first + 1);
        for (uint32_t value = first;; ++value)
        {
            hosts.push_back(FormatHostOrder(value));
            if (value == last)
                break;
        }
        return hosts;
    }

    size_t AddressRange::HostCount() const
    {
        size_t size = static_cast<size_t>(1) << (32 - m_prefix_length);
        return m_prefix_length <= 30 ? size - 2 : size;
    }

    bool AddressRange::Contains(const std::string &ip) const
    {
        if (!IsIPv4Address(ip))
            return false;
        uint32_t value = ntohl(static_cast<uint32_t>(Tins::IPv4Address(ip)));
        return (value & MaskFor(m_prefix_length)) == m_network;
    }

    std::string AddressRange::ToString() const
    {
        return FormatHostOrder(m_network) + "/" + std::to_string(m_prefix_length);
    }

    std::vector<std::string> ExpandRanges(const std::vector<AddressRange> &ranges)
    {
        std::vector<std::string> all;
        std::unordered_set<std::string> seen;
        for (const auto &range : ranges)
        {
            for (auto &host : range.Hosts())
            {
                if (seen.insert(host).second)
                    all.push_back(std::move(host));
            }
        }
        return all;
    }
}
