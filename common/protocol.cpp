#include "protocol.hpp"

namespace netwatch::protocol
{
    namespace
    {
        template <typename T>
        void PutBigEndian(std::uint8_t* out, T value)
        {
            for (size_t i = 0; i < sizeof(T); ++i)
                out[i] = static_cast<std::uint8_t>(value >> (8 * (sizeof(T) - 1 - i)));
        }

        template <typename T>
        T GetBigEndian(const std::uint8_t* in)
        {
            T value = 0;
            for (size_t i = 0; i < sizeof(T); ++i)
                value = static_cast<T>((value << 8) | in[i]);
            return value;
        }
    }

    void SerializeHeader(const Header& hdr, std::uint8_t* buffer)
    {
        PutBigEndian<uint16_t>(buffer, hdr.magic);
        buffer[2] = hdr.msg_type;
        PutBigEndian<uint32_t>(buffer + 3, hdr.payload_length);
        buffer[7] = hdr.reserved;
    }

    Header DeserializeHeader(const std::uint8_t* buffer)
    {
        Header hdr;
        hdr.magic = GetBigEndian<uint16_t>(buffer);
        hdr.msg_type = buffer[2];
        hdr.payload_length = GetBigEndian<uint32_t>(buffer + 3);
        hdr.reserved = buffer[7];
        return hdr;
    }

    std::vector<uint8_t> BuildFrame(MessageType type, const std::vector<uint8_t>& payload)
    {
        Header hdr;
        hdr.magic = EXPECTED_MAGIC;
        hdr.msg_type = static_cast<uint8_t>(type);
        hdr.payload_length = static_cast<uint32_t>(payload.size());
        hdr.reserved = 0;

        std::vector<uint8_t> frame(HEADER_SIZE);
        SerializeHeader(hdr, frame.data());
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    std::vector<uint8_t> BuildFrame(MessageType type, const std::string& text)
    {
        return BuildFrame(type, std::vector<uint8_t>(text.begin(), text.end()));
    }

    MessageType ResponseTypeFor(MessageType request)
    {
        switch (request)
        {
        case MessageType::FullScanReq:
            return MessageType::FullScanResp;
        case MessageType::ForgetDeviceReq:
            return MessageType::ForgetDeviceResp;
        case MessageType::WatchDeviceReq:
            return MessageType::WatchDeviceResp;
        case MessageType::NameDeviceReq:
            return MessageType::NameDeviceResp;
        case MessageType::SnapshotReq:
            return MessageType::SnapshotResp;
        case MessageType::EventHistoryReq:
            return MessageType::EventHistoryResp;
        default:
            return MessageType::ErrorResp;
        }
    }

    const char* MessageTypeName(MessageType type)
    {
        switch (type)
        {
        case MessageType::FullScanReq: return "FullScanReq";
        case MessageType::FullScanResp: return "FullScanResp";
        case MessageType::ForgetDeviceReq: return "ForgetDeviceReq";
        case MessageType::ForgetDeviceResp: return "ForgetDeviceResp";
        case MessageType::WatchDeviceReq: return "WatchDeviceReq";
        case MessageType::WatchDeviceResp: return "WatchDeviceResp";
        case MessageType::NameDeviceReq: return "NameDeviceReq";
        case MessageType::NameDeviceResp: return "NameDeviceResp";
        case MessageType::SnapshotReq: return "SnapshotReq";
        case MessageType::SnapshotResp: return "SnapshotResp";
        case MessageType::EventHistoryReq: return "EventHistoryReq";
        case MessageType::EventHistoryResp: return "EventHistoryResp";
        case MessageType::ErrorResp: return "ErrorResp";
        }
        return "Unknown";
    }

}
