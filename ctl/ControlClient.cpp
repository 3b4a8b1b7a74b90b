#include "ControlClient.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace netwatch::ctl
{
    static bool wait_fd(int fd, short events, int timeout_ms)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r = poll(&pfd, 1, timeout_ms);
        return r > 0;
    }

    ControlClient::ControlClient(std::string socket_path, int timeout_ms)
        : m_socket_path(std::move(socket_path)), m_socket_fd(-1), m_timeout_ms(timeout_ms)
    {
    }

    ControlClient::~ControlClient()
    {
        Disconnect();
    }

    bool ControlClient::Connect()
    {
        struct sockaddr_un serv_addr;
        std::memset(&serv_addr, 0, sizeof(serv_addr));
        serv_addr.sun_family = AF_UNIX;
        if (m_socket_path.size() >= sizeof(serv_addr.sun_path))
        {
            std::cerr << "[Client] Socket path too long: " << m_socket_path << std::endl;
            return false;
        }
        std::strncpy(serv_addr.sun_path, m_socket_path.c_str(), sizeof(serv_addr.sun_path) - 1);

        m_socket_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (m_socket_fd < 0)
        {
            perror("Socket creation failed");
            return false;
        }

        if (connect(m_socket_fd, reinterpret_cast<struct sockaddr *>(&serv_addr), sizeof(serv_addr)) < 0)
        {
            std::cerr << "[Client] Cannot connect to " << m_socket_path << ": " << std::strerror(errno) << std::endl;
            Disconnect();
            return false;
        }
        return true;
    }

    void ControlClient::Disconnect()
    {
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_rx_frames.Reset();
    }

    bool ControlClient::WriteAll(const std::vector<uint8_t> &frame)
    {
        size_t off = 0;
        while (off < frame.size())
        {
            ssize_t n = send(m_socket_fd, frame.data() + off, frame.size() - off, MSG_NOSIGNAL);
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            return false;
        }
        return true;
    }

    std::optional<ControlResponse> ControlClient::Request(netwatch::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        if (!IsConnected())
            return std::nullopt;

        if (!WriteAll(netwatch::protocol::BuildFrame(type, payload)))
        {
            std::cerr << "[Client] Failed to send request.\n";
            Disconnect();
            return std::nullopt;
        }

        uint8_t tmp[4096];
        while (true)
        {
            netwatch::common::Frame frame;
            auto status = m_rx_frames.Next(frame);
            if (status == netwatch::common::FrameStatus::Malformed)
            {
                std::cerr << "[Client] Malformed reply.\n";
                Disconnect();
                return std::nullopt;
            }
            if (status == netwatch::common::FrameStatus::Ready)
                return ControlResponse{frame.type, std::string(frame.payload.begin(), frame.payload.end())};

            if (!wait_fd(m_socket_fd, POLLIN, m_timeout_ms))
            {
                std::cerr << "[Client] Timed out waiting for the daemon.\n";
                return std::nullopt;
            }

            ssize_t n = recv(m_socket_fd, tmp, sizeof(tmp), 0);
            if (n > 0)
            {
                m_rx_frames.Feed(tmp, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;

            std::cerr << "[Client] Daemon closed connection.\n";
            Disconnect();
            return std::nullopt;
        }
    }
}
