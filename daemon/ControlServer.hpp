#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "../common/FrameAssembler.hpp"
#include "../common/protocol.hpp"

namespace netwatch::daemon
{
    class CommandWorker;

    struct ClientContext
    {
        int socketfd;
        uint64_t connection_id;
        netwatch::common::FrameAssembler frames;
        std::vector<uint8_t> outgoing;
    };

    // epoll loop on the local control socket. Requests are handed to the CommandWorker; replies
    // come back through QueueResponse from the worker thread and are written by the loop.
    class ControlServer
    {
    private:
        std::string m_socket_path;
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        std::atomic<bool> m_running;
        uint64_t m_next_connection_id;

        std::map<int, ClientContext> registry;

        struct PendingResponse
        {
            uint64_t connection_id;
            std::vector<uint8_t> frame;
        };
        std::mutex m_outbox_mutex;
        std::vector<PendingResponse> m_outbox;

        CommandWorker *m_worker;

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd, uint32_t events);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void HandleWritable(int fd);
        void DrainOutbox();
        void FlushClient(ClientContext &ctx);

        void ProcessMessage(ClientContext &ctx, netwatch::protocol::MessageType type, std::vector<uint8_t> payload);
        void SendDirect(ClientContext &ctx, netwatch::protocol::MessageType type, const std::string &text);

    public:
        explicit ControlServer(std::string socket_path);
        ~ControlServer();

        ControlServer(const ControlServer &) = delete;
        ControlServer &operator=(const ControlServer &) = delete;

        void SetWorker(CommandWorker *worker) { m_worker = worker; }

        void Init();
        void Run();

        // Safe to call from a signal handler.
        void Stop();

        // Thread safe. Responses for connections that closed meanwhile are dropped.
        void QueueResponse(uint64_t connection_id, netwatch::protocol::MessageType type, const std::string &text);
    };
}
