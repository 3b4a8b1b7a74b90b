#pragma once

#include <atomic>
#include <cstdint>
#include "Prober.hpp"

namespace netwatch::scanner
{
    // Echo probe over SOCK_DGRAM/IPPROTO_ICMP. The kernel owns the echo identifier and checksum,
    // so no privileges are needed as long as the group is inside net.ipv4.ping_group_range.
    class DatagramPingProber : public Prober
    {
    public:
        static bool IsSupported();

        ProbeResult Probe(const std::string &ip, std::chrono::milliseconds timeout) override;
        ProbeMode Mode() const override { return ProbeMode::Unprivileged; }

    private:
        std::atomic<uint16_t> m_sequence{1};
    };
}
