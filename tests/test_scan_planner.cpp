#include <chrono>

#include "../monitor/ScanPlanner.hpp"

using netwatch::monitor::ScanPlanner;
using netwatch::monitor::TickKind;

int main()
{
    // quick every minute, full every hour: tick 1 and every 60th tick after it are full scans
    ScanPlanner planner(std::chrono::minutes(60), std::chrono::minutes(1));
    if (planner.Ratio() != 60) return 1;

    for (int tick = 1; tick <= 181; ++tick)
    {
        bool expect_full = (tick - 1) % 60 == 0;
        bool full = planner.NextTick() == TickKind::FullScan;
        if (full != expect_full) return 2;
    }

    // ratio is rounded and never below one
    if (ScanPlanner(std::chrono::minutes(10), std::chrono::minutes(4)).Ratio() != 3) return 3;
    ScanPlanner every(std::chrono::minutes(1), std::chrono::minutes(5));
    if (every.Ratio() != 1) return 4;
    for (int tick = 0; tick < 5; ++tick)
    {
        if (every.NextTick() != TickKind::FullScan) return 5;
    }
    return 0;
}
