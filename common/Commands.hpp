#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace netwatch::common
{
    // Arguments of a control request. Which fields travel depends on the message type:
    //   ForgetDeviceReq  device_id
    //   WatchDeviceReq   device_id, watched
    //   NameDeviceReq    device_id, nickname
    //   EventHistoryReq  device_id, limit
    //   FullScanReq, SnapshotReq carry no payload.
    struct DeviceCommand
    {
        std::string device_id;
        bool watched = false;
        std::string nickname;
        uint32_t limit = 50;
    };

    std::vector<uint8_t> EncodeCommand(protocol::MessageType type, const DeviceCommand &command);

    // std::nullopt for a truncated payload or a message type that is not a request.
    std::optional<DeviceCommand> DecodeCommand(protocol::MessageType type, const std::vector<uint8_t> &payload);

    bool IsRequest(protocol::MessageType type);
}
