#include "HostnameResolver.hpp"
#include "../common/AddressRange.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <random>
#include <sstream>

namespace netwatch::scanner
{
    static constexpr uint16_t DNS_TYPE_PTR = 12;
    static constexpr uint16_t DNS_CLASS_IN = 1;

    static uint16_t ReadU16(const std::vector<uint8_t> &buf, size_t offset)
    {
        return static_cast<uint16_t>((buf[offset] << 8) | buf[offset + 1]);
    }

    // Decodes a possibly compressed name starting at offset. Advances offset past the name as
    // it appears at that position (a pointer counts as two bytes).
    static bool ReadName(const std::vector<uint8_t> &buf, size_t &offset, std::string &out)
    {
        size_t pos = offset;
        bool jumped = false;
        int hops = 0;
        out.clear();

        while (true)
        {
            if (pos >= buf.size())
                return false;

            uint8_t len = buf[pos];
            if ((len & 0xC0) == 0xC0)
            {
                if (pos + 1 >= buf.size() || ++hops > 16)
                    return false;
                if (!jumped)
                    offset = pos + 2;
                pos = static_cast<size_t>(((len & 0x3F) << 8) | buf[pos + 1]);
                jumped = true;
                continue;
            }

            if (len == 0)
            {
                if (!jumped)
                    offset = pos + 1;
                return true;
            }

            if (pos + 1 + len > buf.size())
                return false;
            if (!out.empty())
                out.push_back('.');
            out.append(reinterpret_cast<const char *>(&buf[pos + 1]), len);
            pos += 1 + len;
        }
    }

    DnsReverseResolver::DnsReverseResolver(std::string nameserver, std::chrono::milliseconds timeout, uint16_t port)
        : m_nameserver(std::move(nameserver)), m_timeout(timeout), m_port(port)
    {
    }

    std::string DnsReverseResolver::SystemNameserver(const std::string &resolv_conf)
    {
        std::ifstream in(resolv_conf);
        std::string line;
        while (std::getline(in, line))
        {
            if (line.rfind("nameserver", 0) == 0)
            {
                std::istringstream iss(line);
                std::string tag, ip;
                iss >> tag >> ip;
                if (common::IsIPv4Address(ip))
                    return ip;
            }
        }
        return "127.0.0.53";
    }

    std::vector<uint8_t> DnsReverseResolver::BuildPtrQuery(uint16_t id, const std::string &ip)
    {
        std::vector<std::string> octets;
        std::stringstream ss(ip);
        std::string octet;
        while (std::getline(ss, octet, '.'))
            octets.push_back(octet);
        std::reverse(octets.begin(), octets.end());
        octets.push_back("in-addr");
        octets.push_back("arpa");

        std::vector<uint8_t> buf(12, 0);
        buf[0] = static_cast<uint8_t>(id >> 8);
        buf[1] = static_cast<uint8_t>(id & 0xFF);
        buf[2] = 0x01; // recursion desired
        buf[5] = 0x01; // QDCOUNT=1

        for (const auto &label : octets)
        {
            buf.push_back(static_cast<uint8_t>(label.size()));
            buf.insert(buf.end(), label.begin(), label.end());
        }
        buf.push_back(0);
        buf.push_back(0);
        buf.push_back(DNS_TYPE_PTR);
        buf.push_back(0);
        buf.push_back(DNS_CLASS_IN);
        return buf;
    }

    std::optional<std::string> DnsReverseResolver::ParsePtrAnswer(const std::vector<uint8_t> &response, uint16_t id)
    {
        if (response.size() < 12)
            return std::nullopt;
        if (ReadU16(response, 0) != id)
            return std::nullopt;
        if ((response[2] & 0x80) == 0) // not a response
            return std::nullopt;
        if ((response[3] & 0x0F) != 0) // rcode
            return std::nullopt;

        uint16_t qdcount = ReadU16(response, 4);
        uint16_t ancount = ReadU16(response, 6);

        size_t offset = 12;
        std::string name;
        for (uint16_t i = 0; i < qdcount; ++i)
        {
            if (!ReadName(response, offset, name) || offset + 4 > response.size())
                return std::nullopt;
            offset += 4;
        }

        for (uint16_t i = 0; i < ancount; ++i)
        {
            if (!ReadName(response, offset, name) || offset + 10 > response.size())
                return std::nullopt;

            uint16_t type = ReadU16(response, offset);
            uint16_t rdlength = ReadU16(response, offset + 8);
            offset += 10;
            if (offset + rdlength > response.size())
                return std::nullopt;

            if (type == DNS_TYPE_PTR)
            {
                size_t rdata = offset;
                std::string target;
                if (!ReadName(response, rdata, target) || target.empty())
                    return std::nullopt;
                return target;
            }
            offset += rdlength;
        }
        return std::nullopt;
    }

    std::optional<std::string> DnsReverseResolver::Resolve(const std::string &ip)
    {
        if (!common::IsIPv4Address(ip))
            return std::nullopt;

        sockaddr_in servaddr{};
        servaddr.sin_family = AF_INET;
        servaddr.sin_port = htons(m_port);
        if (inet_pton(AF_INET, m_nameserver.c_str(), &servaddr.sin_addr) != 1)
            return std::nullopt;

        int sockfd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (sockfd < 0)
            return std::nullopt;

        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(m_timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((m_timeout.count() % 1000) * 1000);
        setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        static thread_local std::mt19937 rng{std::random_device{}()};
        uint16_t id = static_cast<uint16_t>(rng());

        std::vector<uint8_t> query = BuildPtrQuery(id, ip);
        std::optional<std::string> answer;

        // Connected, so the kernel drops datagrams from anyone but the nameserver.
        if (connect(sockfd, reinterpret_cast<sockaddr *>(&servaddr), sizeof(servaddr)) == 0 &&
            send(sockfd, query.data(), query.size(), 0) >= 0)
        {
            std::vector<uint8_t> response(1500);
            ssize_t n = recv(sockfd, response.data(), response.size(), 0);
            if (n > 0)
            {
                response.resize(static_cast<size_t>(n));
                answer = ParsePtrAnswer(response, id);
            }
        }

        close(sockfd);

        if (!answer.has_value())
            return std::nullopt;
        return ShortHostname(answer.value());
    }

    std::string ShortHostname(const std::string &name)
    {
        std::string trimmed = name;
        if (!trimmed.empty() && trimmed.back() == '.')
            trimmed.pop_back();

        auto dot = trimmed.find('.');
        if (dot == std::string::npos)
            return trimmed;

        bool numeric = true;
        std::stringstream ss(trimmed);
        std::string label;
        while (std::getline(ss, label, '.'))
        {
            if (label.empty() || !std::all_of(label.begin(), label.end(), [](unsigned char c)
                                              { return std::isdigit(c) != 0; }))
            {
                numeric = false;
                break;
            }
        }

        return numeric ? trimmed : trimmed.substr(0, dot);
    }
}
