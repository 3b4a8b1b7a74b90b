#include "Prober.hpp"
#include "DatagramPingProber.hpp"
#include "RawPingProber.hpp"

#include <cmath>
#include <iostream>

namespace netwatch::scanner
{
    const char *ProbeModeName(ProbeMode mode)
    {
        switch (mode)
        {
        case ProbeMode::Unprivileged:
            return "unprivileged";
        case ProbeMode::Privileged:
            return "privileged";
        case ProbeMode::Unavailable:
            return "unavailable";
        }
        return "unknown";
    }

    ProbeResult UnavailableProber::Probe(const std::string &, std::chrono::milliseconds)
    {
        return ProbeResult{};
    }

    std::shared_ptr<Prober> CreateProber()
    {
        if (DatagramPingProber::IsSupported())
        {
            std::cout << "[Prober] Using unprivileged ICMP datagram sockets.\n";
            return std::make_shared<DatagramPingProber>();
        }

        if (RawPingProber::IsSupported())
        {
            std::cout << "[Prober] Unprivileged ICMP unavailable, using raw sockets.\n";
            return std::make_shared<RawPingProber>();
        }

        std::cerr << "[Prober] WARNING: Neither unprivileged ICMP sockets nor raw sockets are usable. "
                  << "Every probe will report the target as unreachable. "
                  << "Allow ping sockets (sysctl net.ipv4.ping_group_range) or grant CAP_NET_RAW.\n";
        return std::make_shared<UnavailableProber>();
    }

    double RoundLatency(double ms)
    {
        return std::round(ms * 100.0) / 100.0;
    }
}
