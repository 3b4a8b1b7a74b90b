#include "FrameAssembler.hpp"

namespace netwatch::common
{
    using netwatch::protocol::HEADER_SIZE;

    void FrameAssembler::Feed(const uint8_t *data, size_t size)
    {
        if (m_poisoned)
            return;
        m_pending.insert(m_pending.end(), data, data + size);
    }

    FrameStatus FrameAssembler::Next(Frame &out)
    {
        if (m_poisoned)
            return FrameStatus::Malformed;
        if (m_pending.size() < HEADER_SIZE)
            return FrameStatus::NeedMore;

        auto header = netwatch::protocol::DeserializeHeader(m_pending.data());
        if (header.magic != netwatch::protocol::EXPECTED_MAGIC ||
            header.payload_length > netwatch::protocol::MAX_PAYLOAD_LENGTH)
        {
            m_poisoned = true;
            m_pending.clear();
            return FrameStatus::Malformed;
        }

        size_t total = HEADER_SIZE + header.payload_length;
        if (m_pending.size() < total)
            return FrameStatus::NeedMore;

        out.type = static_cast<netwatch::protocol::MessageType>(header.msg_type);
        out.payload.assign(m_pending.begin() + HEADER_SIZE, m_pending.begin() + total);
        m_pending.erase(m_pending.begin(), m_pending.begin() + total);
        return FrameStatus::Ready;
    }

    void FrameAssembler::Reset()
    {
        m_pending.clear();
        m_poisoned = false;
    }
}
