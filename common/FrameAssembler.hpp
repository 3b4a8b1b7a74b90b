#pragma once

#include <cstdint>
#include <vector>
#include "protocol.hpp"

namespace netwatch::common
{
    struct Frame
    {
        netwatch::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    enum class FrameStatus
    {
        NeedMore,
        Ready,
        Malformed
    };

    // Reassembles frames from a byte stream. Once Malformed is reported the stream is unusable
    // and the connection should be dropped.
    class FrameAssembler
    {
    private:
        std::vector<uint8_t> m_pending;
        bool m_poisoned = false;

    public:
        void Feed(const uint8_t *data, size_t size);
        FrameStatus Next(Frame &out);
        size_t Buffered() const { return m_pending.size(); }
        void Reset();
    };
}
