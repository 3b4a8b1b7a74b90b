#include "RawPingProber.hpp"

#include <tins/tins.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <iostream>
#include <memory>

namespace netwatch::scanner
{
    RawPingProber::RawPingProber()
        : m_identifier(static_cast<uint16_t>(getpid() & 0xFFFF))
    {
    }

    bool RawPingProber::IsSupported()
    {
        int fd = socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
        if (fd < 0)
            return false;
        close(fd);
        return true;
    }

    ProbeResult RawPingProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        ProbeResult result;

        try
        {
            auto seconds = static_cast<uint32_t>(timeout.count() / 1000);
            auto micros = static_cast<uint32_t>((timeout.count() % 1000) * 1000);

            // send_recv() blocks on the sender's own socket, so each probe gets its own sender.
            Tins::PacketSender sender(Tins::NetworkInterface(), seconds, micros);

            Tins::IP packet = Tins::IP(ip) / Tins::ICMP();
            Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_identifier);
            icmp.sequence(m_sequence.fetch_add(1));

            auto start = std::chrono::steady_clock::now();
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(packet));
            auto end = std::chrono::steady_clock::now();

            if (!reply)
                return result;

            const Tins::ICMP *reply_icmp = reply->find_pdu<Tins::ICMP>();
            if (!reply_icmp || reply_icmp->type() != Tins::ICMP::ECHO_REPLY)
                return result;

            std::chrono::duration<double, std::milli> elapsed = end - start;
            result.reachable = true;
            result.rtt_ms = RoundLatency(elapsed.count());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Prober] Raw probe to " << ip << " failed: " << e.what() << "\n";
        }

        return result;
    }
}
