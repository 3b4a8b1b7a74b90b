#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "DeviceRegistry.hpp"
#include "DeviceStore.hpp"
#include "MonitorConfig.hpp"
#include "ScanPlanner.hpp"
#include "Snapshot.hpp"
#include "../scanner/NetworkScanner.hpp"

namespace netwatch::monitor
{
    enum class TickOutcome
    {
        Skipped,
        FullScan,
        QuickCheck
    };

    using InstanceEventCallback = std::function<void(const std::string &instance, const common::DeviceEvent &event)>;
    using AddedCallback = std::function<void(const std::string &instance, const std::vector<std::string> &identifiers)>;

    // One monitoring instance: owns its registry and state file and drives the scanner from its
    // own scheduler thread. At most one scan per instance is in flight at any time.
    class Coordinator
    {
    public:
        // store may be null, in which case nothing is persisted.
        Coordinator(InstanceConfig config,
                    std::shared_ptr<scanner::DeviceScanner> scanner,
                    std::unique_ptr<DeviceStore> store);
        ~Coordinator();

        Coordinator(const Coordinator &) = delete;
        Coordinator &operator=(const Coordinator &) = delete;

        const std::string &Name() const { return m_config.name; }
        const InstanceConfig &Config() const { return m_config; }

        void SetEventCallback(InstanceEventCallback callback);
        void SetAddedCallback(AddedCallback callback);

        // Restores persisted devices. Corrupt state is reported once and replaced by an empty map.
        void LoadState();

        void Start();
        void Stop();

        // One scheduler tick. Skipped when a scan of this instance is already running.
        TickOutcome Tick();

        // Out-of-band full scan; waits for a running scan to finish instead of skipping.
        void TriggerFullScan();

        // Throw DeviceNotFound.
        common::DeviceRecord ForgetDevice(const std::string &identifier);
        common::DeviceRecord SetWatched(const std::string &identifier, bool watched);
        common::DeviceRecord SetNickname(const std::string &identifier, const std::string &nickname);

        std::optional<std::string> ResolveDevice(const std::string &raw_id) const;

        Snapshot GetSnapshot() const;
        const DeviceRegistry &Registry() const { return m_registry; }

    private:
        void SchedulerLoop();
        void RunFullScan();
        void RunQuickCheck();
        void Persist();
        void Publish();

        InstanceConfig m_config;
        std::shared_ptr<scanner::DeviceScanner> m_scanner;
        std::unique_ptr<DeviceStore> m_store;
        DeviceRegistry m_registry;

        std::mutex m_scan_mutex; // held for the duration of a scan
        ScanPlanner m_planner;   // guarded by m_scan_mutex

        mutable std::mutex m_state_mutex;
        std::optional<common::Timestamp> m_last_full_scan;
        Snapshot m_snapshot;

        std::mutex m_persist_mutex;

        std::mutex m_callback_mutex;
        InstanceEventCallback m_event_callback;
        AddedCallback m_added_callback;

        std::atomic<bool> m_running;
        std::thread m_thread;
    };
}
