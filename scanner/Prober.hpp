#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace netwatch::scanner
{
    struct ProbeResult
    {
        bool reachable = false;
        std::optional<double> rtt_ms;
    };

    enum class ProbeMode
    {
        Unprivileged, // ICMP datagram socket (net.ipv4.ping_group_range)
        Privileged,   // raw ICMP through libtins, needs CAP_NET_RAW
        Unavailable
    };

    const char *ProbeModeName(ProbeMode mode);

    // One echo probe against one IPv4 address. Implementations never throw for network level
    // failures; those come back as reachable == false. Probe() is called from many scanner
    // threads at once.
    class Prober
    {
    public:
        virtual ~Prober() = default;
        virtual ProbeResult Probe(const std::string &ip, std::chrono::milliseconds timeout) = 0;
        virtual ProbeMode Mode() const = 0;
    };

    // Used when neither probing mode works on this host. Every probe is unreachable.
    class UnavailableProber : public Prober
    {
    public:
        ProbeResult Probe(const std::string &ip, std::chrono::milliseconds timeout) override;
        ProbeMode Mode() const override { return ProbeMode::Unavailable; }
    };

    // Decides once which mode this process can use. Logs a single capability warning if
    // neither works.
    std::shared_ptr<Prober> CreateProber();

    double RoundLatency(double ms);
}
