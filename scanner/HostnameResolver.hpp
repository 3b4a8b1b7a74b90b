#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netwatch::scanner
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;

        // Reverse name for an IPv4 address, or std::nullopt when there is none or the lookup
        // failed. Must not block longer than the resolver's own timeout.
        virtual std::optional<std::string> Resolve(const std::string &ip) = 0;
    };

    // PTR lookup over UDP against one nameserver, bounded by SO_RCVTIMEO.
    class DnsReverseResolver : public HostnameResolver
    {
    public:
        DnsReverseResolver(std::string nameserver, std::chrono::milliseconds timeout, uint16_t port = 53);

        std::optional<std::string> Resolve(const std::string &ip) override;

        // First "nameserver" line of the given resolv.conf, 127.0.0.53 if there is none.
        static std::string SystemNameserver(const std::string &resolv_conf = "/etc/resolv.conf");

        static std::vector<uint8_t> BuildPtrQuery(uint16_t id, const std::string &ip);
        static std::optional<std::string> ParsePtrAnswer(const std::vector<uint8_t> &response, uint16_t id);

    private:
        std::string m_nameserver;
        std::chrono::milliseconds m_timeout;
        uint16_t m_port;
    };

    // "nas.home.lan" -> "nas". Names made only of digits are returned untouched.
    std::string ShortHostname(const std::string &name);
}
