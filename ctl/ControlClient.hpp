#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../common/FrameAssembler.hpp"
#include "../common/protocol.hpp"

namespace netwatch::ctl
{
    struct ControlResponse
    {
        netwatch::protocol::MessageType type;
        std::string text;
    };

    // Blocking request/response client for the daemon's control socket.
    class ControlClient
    {
    private:
        std::string m_socket_path;
        int m_socket_fd;
        int m_timeout_ms;

        netwatch::common::FrameAssembler m_rx_frames;

        bool WriteAll(const std::vector<uint8_t> &frame);

    public:
        ControlClient(std::string socket_path, int timeout_ms);
        ~ControlClient();

        ControlClient(const ControlClient &) = delete;
        ControlClient &operator=(const ControlClient &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1; }

        // Sends one request and waits for its reply. std::nullopt on I/O failure or timeout.
        std::optional<ControlResponse> Request(netwatch::protocol::MessageType type, const std::vector<uint8_t> &payload);
    };
}
