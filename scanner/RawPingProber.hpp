#pragma once

#include <atomic>
#include <cstdint>
#include "Prober.hpp"

namespace netwatch::scanner
{
    // Echo probe built and matched with libtins over a raw socket. Needs root or CAP_NET_RAW.
    class RawPingProber : public Prober
    {
    public:
        RawPingProber();

        static bool IsSupported();

        ProbeResult Probe(const std::string &ip, std::chrono::milliseconds timeout) override;
        ProbeMode Mode() const override { return ProbeMode::Privileged; }

    private:
        uint16_t m_identifier;
        std::atomic<uint16_t> m_sequence{1};
    };
}
