#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "../common/Commands.hpp"
#include "../common/protocol.hpp"
#include "../monitor/ServiceDispatcher.hpp"

namespace netwatch::daemon { class ControlServer; }

namespace netwatch::daemon {

    struct Job {
        uint64_t connection_id;
        netwatch::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    struct CommandReply {
        netwatch::protocol::MessageType type;
        std::string text;
    };

    // Runs control requests one at a time off the socket loop, so a full scan never stalls it.
    class CommandWorker {
    private:
        std::thread worker_thread_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<Job> job_queue_;
        std::atomic<bool> running_;

        monitor::ServiceDispatcher& dispatcher_;
        ControlServer* control_server_;

        void ProcessLoop();

        nlohmann::json HandleFullScan();
        nlohmann::json HandleForget(const common::DeviceCommand& command);
        nlohmann::json HandleWatch(const common::DeviceCommand& command);
        nlohmann::json HandleName(const common::DeviceCommand& command);
        nlohmann::json HandleSnapshot();
        nlohmann::json HandleHistory(const common::DeviceCommand& command);

    public:
        explicit CommandWorker(monitor::ServiceDispatcher& dispatcher);
        ~CommandWorker();

        void Start();
        void Stop();

        void SetControlServer(ControlServer* server) { control_server_ = server; }

        void AddJob(uint64_t connection_id, netwatch::protocol::MessageType type, std::vector<uint8_t> payload);

        // Decodes and executes one request. Errors become an ErrorResp starting with
        // NOT_FOUND or BAD_REQUEST.
        CommandReply Execute(netwatch::protocol::MessageType type, const std::vector<uint8_t>& payload);
    };
}
