#include "Commands.hpp"

#include <arpa/inet.h>
#include <cstring>

namespace netwatch::common
{
    using protocol::MessageType;

    namespace
    {
        // Big-endian fields: u32 integers, one-byte bools, u32 length-prefixed strings.
        class PayloadWriter
        {
        public:
            explicit PayloadWriter(std::vector<uint8_t> &out) : m_out(out) {}

            void U32(uint32_t value)
            {
                uint32_t be = htonl(value);
                const auto *p = reinterpret_cast<const uint8_t *>(&be);
                m_out.insert(m_out.end(), p, p + 4);
            }

            void Bool(bool value) { m_out.push_back(value ? 1 : 0); }

            void String(const std::string &value)
            {
                U32(static_cast<uint32_t>(value.size()));
                m_out.insert(m_out.end(), value.begin(), value.end());
            }

        private:
            std::vector<uint8_t> &m_out;
        };

        class PayloadReader
        {
        public:
            explicit PayloadReader(const std::vector<uint8_t> &in) : m_in(in) {}

            bool U32(uint32_t &value)
            {
                if (m_offset + 4 > m_in.size())
                    return false;
                uint32_t be = 0;
                std::memcpy(&be, m_in.data() + m_offset, 4);
                value = ntohl(be);
                m_offset += 4;
                return true;
            }

            bool Bool(bool &value)
            {
                if (m_offset >= m_in.size())
                    return false;
                value = m_in[m_offset++] != 0;
                return true;
            }

            bool String(std::string &value)
            {
                uint32_t len = 0;
                size_t rollback = m_offset;
                if (!U32(len) || m_offset + len > m_in.size())
                {
                    m_offset = rollback;
                    return false;
                }
                value.assign(reinterpret_cast<const char *>(m_in.data() + m_offset), len);
                m_offset += len;
                return true;
            }

            bool AtEnd() const { return m_offset == m_in.size(); }

        private:
            const std::vector<uint8_t> &m_in;
            size_t m_offset = 0;
        };
    }

    bool IsRequest(MessageType type)
    {
        switch (type)
        {
        case MessageType::FullScanReq:
        case MessageType::ForgetDeviceReq:
        case MessageType::WatchDeviceReq:
        case MessageType::NameDeviceReq:
        case MessageType::SnapshotReq:
        case MessageType::EventHistoryReq:
            return true;
        default:
            return false;
        }
    }

    std::vector<uint8_t> EncodeCommand(MessageType type, const DeviceCommand &command)
    {
        std::vector<uint8_t> payload;
        PayloadWriter writer(payload);
        switch (type)
        {
        case MessageType::ForgetDeviceReq:
            writer.String(command.device_id);
            break;
        case MessageType::WatchDeviceReq:
            writer.String(command.device_id);
            writer.Bool(command.watched);
            break;
        case MessageType::NameDeviceReq:
            writer.String(command.device_id);
            writer.String(command.nickname);
            break;
        case MessageType::EventHistoryReq:
            writer.String(command.device_id);
            writer.U32(command.limit);
            break;
        default:
            break;
        }
        return payload;
    }

    std::optional<DeviceCommand> DecodeCommand(MessageType type, const std::vector<uint8_t> &payload)
    {
        if (!IsRequest(type))
            return std::nullopt;

        DeviceCommand command;
        PayloadReader reader(payload);
        bool ok = true;

        switch (type)
        {
        case MessageType::ForgetDeviceReq:
            ok = reader.String(command.device_id);
            break;
        case MessageType::WatchDeviceReq:
            ok = reader.String(command.device_id) &&
                 reader.Bool(command.watched);
            break;
        case MessageType::NameDeviceReq:
            ok = reader.String(command.device_id) &&
                 reader.String(command.nickname);
            break;
        case MessageType::EventHistoryReq:
            ok = reader.String(command.device_id) &&
                 reader.U32(command.limit);
            break;
        default:
            break;
        }

        if (!ok || !reader.AtEnd())
            return std::nullopt;
        return command;
    }
}
