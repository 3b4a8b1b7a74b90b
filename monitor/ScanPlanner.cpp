#include "ScanPlanner.hpp"

#include <algorithm>
#include <cmath>

namespace netwatch::monitor
{
    ScanPlanner::ScanPlanner(std::chrono::seconds full_interval, std::chrono::seconds quick_interval)
    {
        double quick = static_cast<double>(std::max<long long>(1, quick_interval.count()));
        double full = static_cast<double>(full_interval.count());
        m_ratio = std::max(1, static_cast<int>(std::lround(full / quick)));
    }

    TickKind ScanPlanner::NextTick()
    {
        if (!m_started)
        {
            m_started = true;
            m_counter = 0;
            return TickKind::FullScan;
        }

        ++m_counter;
        if (m_counter >= m_ratio)
        {
            m_counter = 0;
            return TickKind::FullScan;
        }
        return TickKind::QuickCheck;
    }
}
