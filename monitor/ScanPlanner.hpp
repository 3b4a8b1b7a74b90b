#pragma once

#include <chrono>

namespace netwatch::monitor
{
    enum class TickKind
    {
        FullScan,
        QuickCheck
    };

    // Decides for each quick tick whether it runs a full scan or a quick check.
    // The first tick after start is always a full scan, then every ratio-th tick.
    class ScanPlanner
    {
    public:
        ScanPlanner(std::chrono::seconds full_interval, std::chrono::seconds quick_interval);

        TickKind NextTick();

        int Ratio() const { return m_ratio; }
        int Counter() const { return m_counter; }

    private:
        int m_ratio;
        int m_counter = 0;
        bool m_started = false;
    };
}
