#include "CommandWorker.hpp"
#include "ControlServer.hpp"
#include "../common/Commands.hpp"

#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <nlohmann/json.hpp>

namespace netwatch::daemon
{
    using netwatch::protocol::MessageType;
    using nlohmann::json;

    static CommandReply Error(const std::string& text)
    {
        return {MessageType::ErrorResp, text};
    }

    CommandWorker::CommandWorker(monitor::ServiceDispatcher& dispatcher)
        : running_(false), dispatcher_(dispatcher), control_server_(nullptr) {}

    CommandWorker::~CommandWorker()
    {
        Stop();
    }

    void CommandWorker::Start()
    {
        running_ = true;
        worker_thread_ = std::thread(&CommandWorker::ProcessLoop, this);
    }

    void CommandWorker::Stop()
    {
        if (!running_)
            return;

        running_ = false;
        queue_cv_.notify_all();

        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
    }

    void CommandWorker::AddJob(uint64_t connection_id, MessageType type, std::vector<uint8_t> payload)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            job_queue_.push({connection_id, type, std::move(payload)});
        }
        queue_cv_.notify_one();
    }

    void CommandWorker::ProcessLoop()
    {
        while (running_)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_)
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            CommandReply reply = Execute(current_job.type, current_job.payload);
            if (control_server_)
            {
                control_server_->QueueResponse(current_job.connection_id, reply.type, reply.text);
            }
        }
    }

    CommandReply CommandWorker::Execute(MessageType type, const std::vector<uint8_t>& payload)
    {
        auto command = common::DecodeCommand(type, payload);
        if (!command)
        {
            return Error("BAD_REQUEST: malformed " + std::string(netwatch::protocol::MessageTypeName(type)));
        }

        try
        {
            json body;
            switch (type)
            {
            case MessageType::FullScanReq:
                body = HandleFullScan();
                break;
            case MessageType::ForgetDeviceReq:
                body = HandleForget(*command);
                break;
            case MessageType::WatchDeviceReq:
                body = HandleWatch(*command);
                break;
            case MessageType::NameDeviceReq:
                body = HandleName(*command);
                break;
            case MessageType::SnapshotReq:
                body = HandleSnapshot();
                break;
            case MessageType::EventHistoryReq:
                body = HandleHistory(*command);
                break;
            default:
                return Error("BAD_REQUEST: unexpected message type");
            }
            return {netwatch::protocol::ResponseTypeFor(type), body.dump()};
        }
        catch (const monitor::DeviceNotFound& e)
        {
            return Error(std::string("NOT_FOUND: ") + e.what());
        }
        catch (const std::exception& e)
        {
            std::cerr << "[Worker] Error processing " << netwatch::protocol::MessageTypeName(type) << ": " << e.what() << "\n";
            return Error(std::string("BAD_REQUEST: ") + e.what());
        }
    }

    json CommandWorker::HandleFullScan()
    {
        std::cout << "[Worker] Running full scan on every instance\n";
        dispatcher_.FullScan();
        return HandleSnapshot();
    }

    json CommandWorker::HandleForget(const common::DeviceCommand& command)
    {
        return monitor::DeviceAttributes(dispatcher_.ForgetDevice(command.device_id));
    }

    json CommandWorker::HandleWatch(const common::DeviceCommand& command)
    {
        return monitor::DeviceAttributes(dispatcher_.WatchDevice(command.device_id, command.watched));
    }

    json CommandWorker::HandleName(const common::DeviceCommand& command)
    {
        if (command.nickname.size() > 64)
            throw std::invalid_argument("nickname longer than 64 characters");
        return monitor::DeviceAttributes(dispatcher_.NameDevice(command.device_id, command.nickname));
    }

    json CommandWorker::HandleSnapshot()
    {
        json instances = json::array();
        for (const auto& snapshot : dispatcher_.Snapshots())
            instances.push_back(monitor::SnapshotToJson(snapshot));
        return json{{"instances", std::move(instances)}};
    }

    json CommandWorker::HandleHistory(const common::DeviceCommand& command)
    {
        int limit = static_cast<int>(std::min<uint32_t>(command.limit, 1000));
        json events = json::array();
        for (const auto& entry : dispatcher_.History(command.device_id, limit))
        {
            events.push_back(json{
                {"instance", entry.instance},
                {"event_type", entry.event_type},
                {"identifier", entry.identifier},
                {"ip_address", entry.ip},
                {"display_name", entry.display_name},
                {"hostname", entry.hostname ? json(*entry.hostname) : json(nullptr)},
                {"occurred_at", entry.occurred_at}});
        }
        return json{{"events", std::move(events)}};
    }
}
