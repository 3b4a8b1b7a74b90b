#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "FakeScanner.hpp"
#include "../monitor/Coordinator.hpp"

using namespace netwatch;
using monitor::Coordinator;
using monitor::TickOutcome;

static monitor::InstanceConfig MakeConfig()
{
    monitor::InstanceConfig config;
    config.name = "lan";
    config.ranges = {common::AddressRange::Parse("10.9.0.0/29")};
    config.full_scan_interval = std::chrono::minutes(3);
    config.quick_check_interval = std::chrono::minutes(1);
    config.offline_threshold = 2;
    return config;
}

int main()
{
    std::string dir = "/tmp/netwatch_coordinator_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::string state_path = dir + "/lan.json";

    auto network = std::make_shared<FakeScanner>();
    network->SetAlive("10.9.0.1", true);
    network->SetAlive("10.9.0.2", true);
    network->macs["10.9.0.1"] = "aa:bb:cc:00:00:01";

    {
        Coordinator coordinator(MakeConfig(), network, std::make_unique<monitor::DeviceStore>(state_path));

        std::vector<common::DeviceEvent> events;
        std::vector<std::string> added;
        coordinator.SetEventCallback([&events](const std::string &instance, const common::DeviceEvent &event)
                                     {
            if (instance == "lan")
                events.push_back(event); });
        coordinator.SetAddedCallback([&added](const std::string &, const std::vector<std::string> &ids)
                                     { added.insert(added.end(), ids.begin(), ids.end()); });

        coordinator.LoadState();

        // ratio 3: full, quick, quick, full
        if (coordinator.Tick() != TickOutcome::FullScan) return 1;
        if (coordinator.Tick() != TickOutcome::QuickCheck) return 2;
        if (coordinator.Tick() != TickOutcome::QuickCheck) return 3;
        if (coordinator.Tick() != TickOutcome::FullScan) return 4;
        if (network->full_scans != 2 || network->quick_checks != 2) return 5;

        auto snapshot = coordinator.GetSnapshot();
        if (snapshot.total_count != 2 || snapshot.online_count != 2) return 6;
        if (!snapshot.last_full_scan) return 7;
        if (added.size() != 2) return 8;
        if (!std::filesystem::exists(state_path)) return 9;

        network->SetAlive("10.9.0.2", false);
        coordinator.Tick();
        if (!events.empty()) return 10;
        coordinator.Tick();
        if (events.size() != 1 || events[0].type != common::DeviceEventType::DeviceOffline) return 11;
        if (coordinator.GetSnapshot().online_count != 1) return 12;

        auto watched = coordinator.SetWatched("aa:bb:cc:00:00:01", true);
        if (!watched.watched) return 13;

        // an out-of-band full scan does not move the cadence
        int before = network->full_scans;
        coordinator.TriggerFullScan();
        if (network->full_scans != before + 1) return 14;

        bool thrown = false;
        try
        {
            coordinator.ForgetDevice("10.9.0.7");
        }
        catch (const monitor::DeviceNotFound &)
        {
            thrown = true;
        }
        if (!thrown) return 15;

        coordinator.ForgetDevice("10.9.0.2");
        if (coordinator.GetSnapshot().total_count != 1) return 16;
    }

    // state survives a restart
    {
        Coordinator restarted(MakeConfig(), network, std::make_unique<monitor::DeviceStore>(state_path));
        restarted.LoadState();
        auto snapshot = restarted.GetSnapshot();
        if (snapshot.total_count != 1) return 20;
        auto device = restarted.Registry().Get("aa:bb:cc:00:00:01");
        if (!device || !device->watched) return 21;
        if (!snapshot.last_full_scan) return 22;
    }

    // unreadable state is replaced by an empty map
    {
        std::ofstream(state_path, std::ios::trunc) << "garbage";
        Coordinator recovered(MakeConfig(), network, std::make_unique<monitor::DeviceStore>(state_path));
        recovered.LoadState();
        if (recovered.GetSnapshot().total_count != 0) return 30;
        if (recovered.Tick() != TickOutcome::FullScan) return 31;
        if (recovered.GetSnapshot().total_count != 1) return 32;
    }

    // the scheduler thread runs the first tick right away
    {
        auto quiet = std::make_shared<FakeScanner>();
        Coordinator threaded(MakeConfig(), quiet, nullptr);
        threaded.Start();
        for (int i = 0; i < 50 && quiet->full_scans == 0; ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        threaded.Stop();
        if (quiet->full_scans != 1) return 40;
    }

    // a tick arriving while a scan is in flight is skipped; a requested full scan waits for it
    {
        auto slow = std::make_shared<FakeScanner>();
        slow->SetAlive("10.9.0.3", true);
        slow->Hold();
        Coordinator busy(MakeConfig(), slow, nullptr);

        TickOutcome first = TickOutcome::Skipped;
        std::thread scanning([&busy, &first]()
                             { first = busy.Tick(); });
        if (!slow->WaitUntilHeld(std::chrono::seconds(5)))
        {
            slow->Release();
            scanning.join();
            return 50;
        }

        if (busy.Tick() != TickOutcome::Skipped) return 51;
        if (slow->full_scans != 0 || slow->quick_checks != 0) return 52;

        std::atomic<bool> requested_done{false};
        std::thread requesting([&busy, &requested_done]()
                               {
            busy.TriggerFullScan();
            requested_done = true; });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        bool finished_early = requested_done;

        slow->Release();
        scanning.join();
        requesting.join();

        if (finished_early) return 53;
        if (first != TickOutcome::FullScan) return 54;
        if (slow->full_scans != 2 || slow->quick_checks != 0) return 55;
        // the skipped tick did not advance the cadence
        if (busy.Tick() != TickOutcome::QuickCheck) return 56;
    }

    std::filesystem::remove_all(dir);
    return 0;
}
