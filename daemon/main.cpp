#include <cerrno>
#include <csignal>
#include <iostream>
#include <memory>
#include <sys/stat.h>

#include "ControlServer.hpp"
#include "CommandWorker.hpp"
#include "../monitor/CoordinatorRegistry.hpp"
#include "../monitor/EventJournal.hpp"
#include "../monitor/MonitorConfig.hpp"
#include "../monitor/ServiceDispatcher.hpp"
#include "../scanner/HostnameResolver.hpp"
#include "../scanner/NeighborTable.hpp"
#include "../scanner/NetworkScanner.hpp"
#include "../scanner/Prober.hpp"
#include "../scanner/VendorDatabase.hpp"

namespace
{
    netwatch::daemon::ControlServer *g_server = nullptr;

    void HandleSignal(int)
    {
        if (g_server)
            g_server->Stop();
    }
}

int main(int argc, char *argv[])
{
    using namespace netwatch;

    if (argc < 2)
    {
        std::cout << "Usage: netwatchd <config.json>\n";
        return 1;
    }

    monitor::DaemonConfig config;
    try
    {
        config = monitor::LoadDaemonConfig(argv[1]);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Daemon] Invalid configuration: " << e.what() << '\n';
        return 2;
    }

    if (mkdir(config.state_dir.c_str(), 0755) != 0 && errno != EEXIST)
    {
        std::cerr << "[Daemon] Cannot create state directory " << config.state_dir << '\n';
        return 1;
    }

    auto journal = std::make_shared<monitor::EventJournal>();
    if (!journal->Initialize(config.journal))
    {
        std::cerr << "[Daemon] Event journal disabled\n";
        journal.reset();
    }

    auto prober = scanner::CreateProber();
    std::cout << "[Daemon] Probe mode: " << scanner::ProbeModeName(prober->Mode()) << '\n';

    auto neighbors = std::make_shared<scanner::NeighborTable>();
    auto vendors = std::make_shared<scanner::VendorDatabase>(config.oui_database);
    auto resolver = std::make_shared<scanner::DnsReverseResolver>(
        config.nameserver.value_or(scanner::DnsReverseResolver::SystemNameserver()), config.hostname_timeout);

    monitor::CoordinatorRegistry registry;
    for (const auto &instance : config.instances)
    {
        scanner::ScannerOptions options;
        options.probe_timeout = instance.probe_timeout;
        options.ping_count = instance.ping_count;
        options.max_in_flight = config.max_in_flight;

        auto network_scanner = std::make_shared<scanner::NetworkScanner>(options, prober, neighbors, resolver, vendors);
        auto store = std::make_unique<monitor::DeviceStore>(monitor::StateFilePath(config, instance));
        auto coordinator = std::make_shared<monitor::Coordinator>(instance, network_scanner, std::move(store));

        coordinator->SetEventCallback([journal](const std::string &name, const common::DeviceEvent &event)
                                      {
            std::cout << "[Event " << name << "] " << common::EventTypeName(event.type) << " "
                      << event.display_name << " (" << event.ip << ")\n";
            if (journal)
                journal->Record(name, event); });

        coordinator->SetAddedCallback([](const std::string &name, const std::vector<std::string> &identifiers)
                                      {
            for (const auto &identifier : identifiers)
                std::cout << "[Event " << name << "] device_added " << identifier << "\n"; });

        registry.Register(coordinator);
    }

    monitor::ServiceDispatcher dispatcher(registry, journal);
    daemon::CommandWorker worker(dispatcher);
    daemon::ControlServer server(config.control_socket);

    worker.SetControlServer(&server);
    server.SetWorker(&worker);

    g_server = &server;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int exit_code = 0;
    try
    {
        server.Init();
        registry.LoadAll();
        worker.Start();
        registry.StartAll();
        server.Run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Daemon] Fatal error: " << e.what() << '\n';
        exit_code = 1;
    }

    g_server = nullptr;
    registry.StopAll();
    worker.Stop();
    server.SetWorker(nullptr);
    std::cout << "[Daemon] Shut down\n";
    return exit_code;
}
