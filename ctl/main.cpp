#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "ControlClient.hpp"
#include "../common/Commands.hpp"

using netwatch::protocol::MessageType;
using nlohmann::json;

namespace
{
    void PrintUsage()
    {
        std::cout << "Usage: netwatchctl [--socket PATH] <command>\n"
                  << "  status                      devices of every instance\n"
                  << "  full-scan                   scan every instance now\n"
                  << "  forget <device>             remove a device\n"
                  << "  watch <device> on|off       flag a device as watched\n"
                  << "  name <device> [nickname]    set or clear a nickname\n"
                  << "  history [device] [limit]    recent online/offline events\n"
                  << "<device> is an identifier, a MAC address or an IP address.\n";
    }

    std::string Text(const json &value)
    {
        if (value.is_null())
            return "-";
        if (value.is_string())
            return value.get<std::string>();
        return value.dump();
    }

    void PrintStatus(const json &body)
    {
        for (const auto &instance : body.at("instances"))
        {
            std::cout << instance.at("instance").get<std::string>() << ": "
                      << instance.at("online_count").get<size_t>() << "/" << instance.at("total_count").get<size_t>()
                      << " online, last full scan " << Text(instance.at("last_full_scan")) << "\n";

            for (const auto &device : instance.at("devices"))
            {
                std::cout << "  " << std::left << std::setw(8) << (device.at("online").get<bool>() ? "online" : "offline")
                          << std::setw(19) << Text(device.at("identifier"))
                          << std::setw(16) << Text(device.at("ip_address"))
                          << std::setw(24) << Text(device.at("display_name"))
                          << (device.at("watched").get<bool>() ? " watched" : "")
                          << "\n";
            }
        }
    }
}

int main(int argc, char *argv[])
{
    std::string socket_path = "/run/netwatch.sock";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--socket" && i + 1 < argc)
            socket_path = argv[++i];
        else if (arg == "-h" || arg == "--help")
        {
            PrintUsage();
            return 0;
        }
        else
            args.push_back(arg);
    }

    if (args.empty())
    {
        PrintUsage();
        return 1;
    }

    const std::string &command_name = args[0];
    MessageType type;
    netwatch::common::DeviceCommand command;
    int timeout_ms = 10000;

    if (command_name == "status" && args.size() == 1)
        type = MessageType::SnapshotReq;
    else if (command_name == "full-scan" && args.size() == 1)
    {
        type = MessageType::FullScanReq;
        timeout_ms = 15 * 60 * 1000;
    }
    else if (command_name == "forget" && args.size() == 2)
    {
        type = MessageType::ForgetDeviceReq;
        command.device_id = args[1];
    }
    else if (command_name == "watch" && args.size() == 3 && (args[2] == "on" || args[2] == "off"))
    {
        type = MessageType::WatchDeviceReq;
        command.device_id = args[1];
        command.watched = args[2] == "on";
    }
    else if (command_name == "name" && (args.size() == 2 || args.size() == 3))
    {
        type = MessageType::NameDeviceReq;
        command.device_id = args[1];
        command.nickname = args.size() == 3 ? args[2] : "";
    }
    else if (command_name == "history" && args.size() <= 3)
    {
        type = MessageType::EventHistoryReq;
        if (args.size() > 1)
            command.device_id = args[1];
        if (args.size() > 2)
        {
            try
            {
                command.limit = static_cast<uint32_t>(std::stoul(args[2]));
            }
            catch (const std::exception &)
            {
                std::cerr << "Invalid limit: " << args[2] << "\n";
                return 1;
            }
        }
    }
    else
    {
        PrintUsage();
        return 1;
    }

    netwatch::ctl::ControlClient client(socket_path, timeout_ms);
    if (!client.Connect())
        return 3;

    auto response = client.Request(type, netwatch::common::EncodeCommand(type, command));
    if (!response)
        return 3;

    if (response->type == MessageType::ErrorResp)
    {
        std::cerr << response->text << "\n";
        return 2;
    }

    json body = json::parse(response->text, nullptr, false);
    if (body.is_discarded())
    {
        std::cerr << "Daemon sent an unreadable reply\n";
        return 3;
    }

    try
    {
        if (type == MessageType::SnapshotReq || type == MessageType::FullScanReq)
            PrintStatus(body);
        else
            std::cout << body.dump(2) << "\n";
    }
    catch (const json::exception &e)
    {
        std::cerr << "Unexpected reply layout: " << e.what() << "\n";
        return 3;
    }
    return 0;
}
