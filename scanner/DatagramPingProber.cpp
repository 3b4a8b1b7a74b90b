#include "DatagramPingProber.hpp"

#include <arpa/inet.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace netwatch::scanner
{
    namespace
    {
        struct SocketGuard
        {
            int fd;
            explicit SocketGuard(int f) : fd(f) {}
            ~SocketGuard()
            {
                if (fd >= 0)
                    close(fd);
            }
            SocketGuard(const SocketGuard &) = delete;
            SocketGuard &operator=(const SocketGuard &) = delete;
        };
    }

    bool DatagramPingProber::IsSupported()
    {
        int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
        if (fd < 0)
            return false;
        close(fd);
        return true;
    }

    ProbeResult DatagramPingProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        ProbeResult result;

        sockaddr_in target{};
        target.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &target.sin_addr) != 1)
            return result;

        SocketGuard sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
        if (sock.fd < 0)
            return result;

        uint16_t sequence = m_sequence.fetch_add(1);

        icmphdr request{};
        request.type = ICMP_ECHO;
        request.code = 0;
        request.un.echo.sequence = htons(sequence);

        auto start = std::chrono::steady_clock::now();
        if (sendto(sock.fd, &request, sizeof(request), 0, reinterpret_cast<sockaddr *>(&target), sizeof(target)) < 0)
            return result;

        auto deadline = start + timeout;
        uint8_t buffer[1500];

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return result;

            pollfd pfd{};
            pfd.fd = sock.fd;
            pfd.events = POLLIN;
            int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready <= 0)
                return result;

            sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            ssize_t n = recvfrom(sock.fd, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr *>(&from), &from_len);
            if (n < static_cast<ssize_t>(sizeof(icmphdr)))
                continue;

            icmphdr reply;
            std::memcpy(&reply, buffer, sizeof(reply));
            if (reply.type != ICMP_ECHOREPLY || ntohs(reply.un.echo.sequence) != sequence)
                continue;
            if (from.sin_addr.s_addr != target.sin_addr.s_addr)
                continue;

            std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
            result.reachable = true;
            result.rtt_ms = RoundLatency(elapsed.count());
            return result;
        }
    }
}
