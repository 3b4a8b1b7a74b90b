#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <cstddef>

namespace netwatch::protocol
{

    inline constexpr uint16_t EXPECTED_MAGIC = 0x4E57;
    inline constexpr uint32_t MAX_PAYLOAD_LENGTH = 4 * 1024 * 1024; // 4MB
    inline constexpr size_t HEADER_SIZE = 8;

    struct Header
    {
        uint16_t magic;
        uint8_t msg_type;
        uint32_t payload_length;
        uint8_t reserved;
    };

    enum class MessageType : std::uint8_t
    {
        FullScanReq = 0x01,
        FullScanResp = 0x02,

        ForgetDeviceReq = 0x03,
        ForgetDeviceResp = 0x04,

        WatchDeviceReq = 0x05,
        WatchDeviceResp = 0x06,

        NameDeviceReq = 0x07,
        NameDeviceResp = 0x08,

        SnapshotReq = 0x10,
        SnapshotResp = 0x11,

        EventHistoryReq = 0x12,
        EventHistoryResp = 0x13,

        ErrorResp = 0xFF
    };

    // Wire layout, big-endian: magic(2) type(1) payload_length(4) reserved(1).
    void SerializeHeader(const Header& hdr, std::uint8_t* buffer);
    Header DeserializeHeader(const std::uint8_t* buffer);

    // Header followed by payload, ready to be written to a socket.
    std::vector<uint8_t> BuildFrame(MessageType type, const std::vector<uint8_t>& payload);
    std::vector<uint8_t> BuildFrame(MessageType type, const std::string& text);

    MessageType ResponseTypeFor(MessageType request);
    const char* MessageTypeName(MessageType type);

}
