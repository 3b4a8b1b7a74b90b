#include <string>

#include "FakeScanner.hpp"
#include "../monitor/ServiceDispatcher.hpp"

using namespace netwatch;

static monitor::InstanceConfig MakeConfig(const std::string &name, const std::string &range)
{
    monitor::InstanceConfig config;
    config.name = name;
    config.ranges = {common::AddressRange::Parse(range)};
    config.offline_threshold = 1;
    return config;
}

template <typename Fn>
static bool ThrowsNotFound(Fn fn)
{
    try
    {
        fn();
    }
    catch (const monitor::DeviceNotFound &)
    {
        return true;
    }
    return false;
}

int main()
{
    auto network = std::make_shared<FakeScanner>();
    network->SetAlive("10.1.0.1", true);
    network->SetAlive("10.2.0.1", true);
    network->SetAlive("10.2.0.2", true);
    network->macs["10.2.0.2"] = "aa:bb:cc:00:00:22";

    auto home = std::make_shared<monitor::Coordinator>(MakeConfig("home", "10.1.0.0/24"), network, nullptr);
    auto lab = std::make_shared<monitor::Coordinator>(MakeConfig("lab", "10.2.0.0/24"), network, nullptr);

    monitor::CoordinatorRegistry registry;
    if (!registry.Register(home)) return 1;
    if (!registry.Register(lab)) return 2;
    if (registry.Register(std::make_shared<monitor::Coordinator>(MakeConfig("lab", "10.3.0.0/24"), network, nullptr))) return 3;

    auto journal = std::make_shared<monitor::EventJournal>();
    if (!journal->Initialize(":memory:")) return 4;
    for (const auto &coordinator : registry.All())
    {
        coordinator->SetEventCallback([journal](const std::string &instance, const common::DeviceEvent &event)
                                      { journal->Record(instance, event); });
    }

    monitor::ServiceDispatcher dispatcher(registry, journal);
    dispatcher.FullScan();
    if (network->full_scans != 2) return 5;

    auto snapshots = dispatcher.Snapshots();
    if (snapshots.size() != 2 || snapshots[0].instance != "home" || snapshots[1].instance != "lab") return 6;
    if (snapshots[0].total_count != 1 || snapshots[1].total_count != 2) return 7;

    // ids resolve to the owning instance only
    auto resolved = dispatcher.Resolve("AA:BB:CC:00:00:22");
    if (!resolved || resolved->owner != lab || resolved->identifier != "aa:bb:cc:00:00:22") return 8;
    resolved = dispatcher.Resolve("10.1.0.1");
    if (!resolved || resolved->owner != home) return 9;
    if (dispatcher.Resolve("10.9.9.9")) return 10;

    if (!ThrowsNotFound([&]
                        { dispatcher.ForgetDevice("10.9.9.9"); })) return 11;
    if (!ThrowsNotFound([&]
                        { dispatcher.WatchDevice("bb:bb:bb:bb:bb:bb", true); })) return 12;
    if (lab->GetSnapshot().total_count != 2 || home->GetSnapshot().total_count != 1) return 13;

    // watch on: offline also raises the priority event
    auto watched = dispatcher.WatchDevice("10.2.0.2", true);
    if (!watched.watched || watched.identifier != "aa:bb:cc:00:00:22") return 14;

    network->SetAlive("10.2.0.2", false);
    lab->Tick(); // first scheduled tick is a full scan
    auto history = dispatcher.History("aa-bb-cc-00-00-22", 10);
    if (history.size() != 2) return 15;
    if (history[0].event_type != "watched_device_offline" || history[1].event_type != "device_offline") return 16;
    if (history[0].instance != "lab") return 17;

    // watch off: no priority event
    dispatcher.WatchDevice("aa:bb:cc:00:00:22", false);
    network->SetAlive("10.2.0.2", true);
    lab->Tick();
    network->SetAlive("10.2.0.2", false);
    lab->Tick();
    history = dispatcher.History("aa:bb:cc:00:00:22", 10);
    if (history.size() != 4) return 18;
    if (history[0].event_type != "device_offline" || history[1].event_type != "device_online") return 19;

    auto named = dispatcher.NameDevice("10.1.0.1", "router");
    if (named.DisplayName() != "router") return 20;
    named = dispatcher.NameDevice("10.1.0.1", "");
    if (named.nickname.has_value()) return 21;

    // forget removes from the owning instance only
    auto removed = dispatcher.ForgetDevice("aa:bb:cc:00:00:22");
    if (removed.ip != "10.2.0.2") return 22;
    if (lab->GetSnapshot().total_count != 1 || home->GetSnapshot().total_count != 1) return 23;
    if (!ThrowsNotFound([&]
                        { dispatcher.ForgetDevice("aa:bb:cc:00:00:22"); })) return 24;

    // history of a forgotten device is still available
    if (dispatcher.History("aa:bb:cc:00:00:22", 10).size() != 4) return 25;
    if (dispatcher.History("", 2).size() != 2) return 26;
    return 0;
}
