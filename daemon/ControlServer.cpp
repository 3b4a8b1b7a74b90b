#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "ControlServer.hpp"
#include "CommandWorker.hpp"
#include "../common/Commands.hpp"

namespace netwatch::daemon
{
    using namespace netwatch::protocol;

    ControlServer::ControlServer(std::string socket_path)
        : m_socket_path(std::move(socket_path)),
          m_server_fd(-1),
          m_epoll_fd(-1),
          m_wake_fd(-1),
          m_running(false),
          m_next_connection_id(1),
          m_worker(nullptr)
    {
    }

    ControlServer::~ControlServer()
    {
        for (auto &it : registry)
        {
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
        {
            close(m_server_fd);
            unlink(m_socket_path.c_str());
        }
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
    }

    void ControlServer::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    void ControlServer::EpollControlAdd(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void ControlServer::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            std::cerr << "[Control] Warning: Failed to modify FD in epoll" << std::endl;
        }
    }

    void ControlServer::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Control] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void ControlServer::DisconnectClient(int fd)
    {
        EpollControlRemove(fd);
        close(fd);
        registry.erase(fd);
    }

    void ControlServer::HandleNewConnection()
    {
        while (true)
        {
            int client_fd = accept4(m_server_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (client_fd == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    return;
                std::cerr << "[Control] accept failed: " << std::strerror(errno) << std::endl;
                return;
            }

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.connection_id = m_next_connection_id++;
            EpollControlAdd(client_fd, EPOLLIN);
        }
    }

    void ControlServer::HandleClientData(int fd)
    {
        auto found = registry.find(fd);
        if (found == registry.end())
            return;
        ClientContext &ctx = found->second;

        uint8_t temp_buffer[4096];

        while (true)
        {
            ssize_t count = recv(fd, temp_buffer, sizeof(temp_buffer), 0);
            if (count > 0)
            {
                ctx.frames.Feed(temp_buffer, static_cast<size_t>(count));
                continue;
            }
            if (count == 0)
            {
                DisconnectClient(fd);
                return;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            if (errno == EINTR)
                continue;
            DisconnectClient(fd);
            return;
        }

        netwatch::common::Frame frame;
        while (true)
        {
            auto status = ctx.frames.Next(frame);
            if (status == netwatch::common::FrameStatus::NeedMore)
                break;
            if (status == netwatch::common::FrameStatus::Malformed)
            {
                std::cerr << "[Control] Malformed frame on connection " << ctx.connection_id << ", closing" << std::endl;
                DisconnectClient(fd);
                return;
            }

            ProcessMessage(ctx, frame.type, std::move(frame.payload));
            if (registry.count(fd) == 0)
                return;
        }
    }

    void ControlServer::ProcessMessage(ClientContext &ctx, MessageType type, std::vector<uint8_t> payload)
    {
        std::cout << "[Control] Connection " << ctx.connection_id << " sent " << MessageTypeName(type)
                  << " (" << payload.size() << " bytes)" << std::endl;

        if (!common::IsRequest(type))
        {
            SendDirect(ctx, MessageType::ErrorResp, "BAD_REQUEST: unexpected message type");
            return;
        }

        if (!m_worker)
        {
            SendDirect(ctx, MessageType::ErrorResp, "BAD_REQUEST: server is shutting down");
            return;
        }

        m_worker->AddJob(ctx.connection_id, type, std::move(payload));
    }

    void ControlServer::SendDirect(ClientContext &ctx, MessageType type, const std::string &text)
    {
        std::vector<uint8_t> frame = BuildFrame(type, text);
        ctx.outgoing.insert(ctx.outgoing.end(), frame.begin(), frame.end());
        FlushClient(ctx);
    }

    void ControlServer::FlushClient(ClientContext &ctx)
    {
        size_t sent_total = 0;
        while (sent_total < ctx.outgoing.size())
        {
            ssize_t sent = send(ctx.socketfd, ctx.outgoing.data() + sent_total, ctx.outgoing.size() - sent_total, MSG_NOSIGNAL);
            if (sent > 0)
            {
                sent_total += static_cast<size_t>(sent);
                continue;
            }
            if (sent < 0 && errno == EINTR)
                continue;
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
                break;

            DisconnectClient(ctx.socketfd);
            return;
        }

        ctx.outgoing.erase(ctx.outgoing.begin(), ctx.outgoing.begin() + static_cast<std::ptrdiff_t>(sent_total));
        EpollControlModify(ctx.socketfd, ctx.outgoing.empty() ? EPOLLIN : (EPOLLIN | EPOLLOUT));
    }

    void ControlServer::HandleWritable(int fd)
    {
        auto found = registry.find(fd);
        if (found == registry.end())
            return;
        FlushClient(found->second);
    }

    void ControlServer::QueueResponse(uint64_t connection_id, MessageType type, const std::string &text)
    {
        {
            std::lock_guard<std::mutex> lock(m_outbox_mutex);
            m_outbox.push_back({connection_id, BuildFrame(type, text)});
        }

        uint64_t one = 1;
        if (write(m_wake_fd, &one, sizeof(one)) != sizeof(one))
        {
            std::cerr << "[Control] Warning: failed to wake event loop" << std::endl;
        }
    }

    void ControlServer::DrainOutbox()
    {
        uint64_t counter = 0;
        while (read(m_wake_fd, &counter, sizeof(counter)) > 0)
        {
        }

        std::vector<PendingResponse> pending;
        {
            std::lock_guard<std::mutex> lock(m_outbox_mutex);
            pending.swap(m_outbox);
        }

        for (auto &response : pending)
        {
            for (auto &it : registry)
            {
                ClientContext &ctx = it.second;
                if (ctx.connection_id != response.connection_id)
                    continue;
                ctx.outgoing.insert(ctx.outgoing.end(), response.frame.begin(), response.frame.end());
                FlushClient(ctx);
                break;
            }
        }
    }

    void ControlServer::Init()
    {
        struct sockaddr_un serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sun_family = AF_UNIX;
        if (m_socket_path.empty() || m_socket_path.size() >= sizeof(serverAddress.sun_path))
        {
            throw std::runtime_error("Control socket path is empty or too long: " + m_socket_path);
        }
        std::strncpy(serverAddress.sun_path, m_socket_path.c_str(), sizeof(serverAddress.sun_path) - 1);

        m_server_fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create control socket.");
        }

        // A stale socket file from a previous run would make bind fail.
        unlink(m_socket_path.c_str());

        if (bind(m_server_fd, reinterpret_cast<struct sockaddr *>(&serverAddress), sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind control socket " + m_socket_path + ": " + std::strerror(errno));
        }
        chmod(m_socket_path.c_str(), 0660);

        if (listen(m_server_fd, SOMAXCONN) != 0)
        {
            throw std::runtime_error("Failed to listen on control socket.");
        }
        NonBlockingMode(m_server_fd);

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        m_epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        EpollControlAdd(m_server_fd, EPOLLIN);
        EpollControlAdd(m_wake_fd, EPOLLIN);
    }

    void ControlServer::Run()
    {
        m_running = true;

        std::cout << "[Control] Listening on " << m_socket_path << std::endl;

        struct epoll_event ev[64];
        while (m_running)
        {
            int count = epoll_wait(m_epoll_fd, ev, 64, 500);
            if (count == -1)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error(std::string("epoll_wait failed: ") + std::strerror(errno));
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_server_fd)
                {
                    HandleNewConnection();
                    continue;
                }
                if (current_fd == m_wake_fd)
                {
                    DrainOutbox();
                    continue;
                }

                if (ev[i].events & (EPOLLHUP | EPOLLERR))
                {
                    if (registry.count(current_fd))
                        DisconnectClient(current_fd);
                    continue;
                }
                if (ev[i].events & EPOLLOUT)
                    HandleWritable(current_fd);
                if (ev[i].events & EPOLLIN)
                    HandleClientData(current_fd);
            }
        }

        std::cout << "[Control] Stopped" << std::endl;
    }

    void ControlServer::Stop()
    {
        m_running = false;
    }
}
