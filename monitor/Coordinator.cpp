#include "Coordinator.hpp"

#include <iostream>

namespace netwatch::monitor
{
    Coordinator::Coordinator(InstanceConfig config,
                             std::shared_ptr<scanner::DeviceScanner> scanner,
                             std::unique_ptr<DeviceStore> store)
        : m_config(std::move(config)),
          m_scanner(std::move(scanner)),
          m_store(std::move(store)),
          m_registry(m_config.name, m_config.offline_threshold),
          m_planner(m_config.full_scan_interval, m_config.quick_check_interval),
          m_running(false)
    {
        m_snapshot = MakeSnapshot(m_config.name, {}, std::nullopt);

        m_registry.SetEventCallback([this](const common::DeviceEvent &event)
                                    {
            std::lock_guard<std::mutex> lock(m_callback_mutex);
            if (m_event_callback)
                m_event_callback(m_config.name, event); });
    }

    Coordinator::~Coordinator()
    {
        Stop();
    }

    void Coordinator::SetEventCallback(InstanceEventCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        m_event_callback = std::move(callback);
    }

    void Coordinator::SetAddedCallback(AddedCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        m_added_callback = std::move(callback);
    }

    void Coordinator::LoadState()
    {
        if (!m_store)
            return;

        std::optional<StoredState> state;
        try
        {
            state = m_store->Load();
        }
        catch (const CorruptState &e)
        {
            std::cerr << "[Coordinator " << m_config.name << "] Ignoring unreadable state: " << e.what() << std::endl;
            return;
        }

        if (!state)
        {
            std::cout << "[Coordinator " << m_config.name << "] No stored state at " << m_store->Path() << "\n";
            return;
        }

        size_t count = state->devices.size();
        m_registry.Restore(std::move(state->devices));
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            m_last_full_scan = state->last_full_scan;
            m_snapshot = MakeSnapshot(m_config.name, m_registry.Devices(), m_last_full_scan);
        }
        std::cout << "[Coordinator " << m_config.name << "] Loaded " << count << " devices from storage\n";
    }

    void Coordinator::Start()
    {
        if (m_running)
            return;
        m_running = true;
        m_thread = std::thread(&Coordinator::SchedulerLoop, this);
    }

    void Coordinator::Stop()
    {
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    void Coordinator::SchedulerLoop()
    {
        const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(m_config.quick_check_interval);
        auto next_tick = std::chrono::steady_clock::now();

        while (m_running)
        {
            if (std::chrono::steady_clock::now() >= next_tick)
            {
                try
                {
                    Tick();
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Coordinator " << m_config.name << "] Tick failed: " << e.what() << std::endl;
                }

                // Ticks missed while a scan was running are dropped, not caught up.
                next_tick += interval;
                auto now = std::chrono::steady_clock::now();
                if (next_tick <= now)
                    next_tick = now + interval;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    TickOutcome Coordinator::Tick()
    {
        std::unique_lock<std::mutex> scan_lock(m_scan_mutex, std::try_to_lock);
        if (!scan_lock.owns_lock())
        {
            std::cout << "[Coordinator " << m_config.name << "] Previous scan still running, skipping tick\n";
            return TickOutcome::Skipped;
        }

        TickOutcome outcome = TickOutcome::QuickCheck;
        try
        {
            if (m_planner.NextTick() == TickKind::FullScan)
            {
                outcome = TickOutcome::FullScan;
                RunFullScan();
            }
            else
            {
                RunQuickCheck();
            }
        }
        catch (const std::exception &)
        {
            Persist();
            Publish();
            throw;
        }

        Persist();
        Publish();
        return outcome;
    }

    void Coordinator::TriggerFullScan()
    {
        {
            std::lock_guard<std::mutex> scan_lock(m_scan_mutex);
            std::cout << "[Coordinator " << m_config.name << "] Full scan requested\n";
            RunFullScan();
        }
        Persist();
        Publish();
    }

    void Coordinator::RunFullScan()
    {
        auto found = m_scanner->FullScan(m_config.ranges);
        auto now = common::Now();
        m_registry.ApplyFullScan(found, now);

        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            m_last_full_scan = now;
        }

        std::cout << "[Coordinator " << m_config.name << "] Full scan complete: " << found.size()
                  << " responding, " << m_registry.Size() << " known\n";
    }

    void Coordinator::RunQuickCheck()
    {
        auto targets = m_registry.CheckTargets();
        if (targets.empty())
            return;

        auto results = m_scanner->CheckDevices(targets);
        m_registry.ApplyQuickCheck(results, common::Now());
    }

    common::DeviceRecord Coordinator::ForgetDevice(const std::string &identifier)
    {
        common::DeviceRecord removed = m_registry.Remove(identifier);
        Persist();
        Publish();
        return removed;
    }

    common::DeviceRecord Coordinator::SetWatched(const std::string &identifier, bool watched)
    {
        common::DeviceRecord updated = m_registry.SetWatched(identifier, watched);
        Persist();
        Publish();
        return updated;
    }

    common::DeviceRecord Coordinator::SetNickname(const std::string &identifier, const std::string &nickname)
    {
        common::DeviceRecord updated = m_registry.SetNickname(identifier, nickname);
        Persist();
        Publish();
        return updated;
    }

    std::optional<std::string> Coordinator::ResolveDevice(const std::string &raw_id) const
    {
        return m_registry.Resolve(raw_id);
    }

    Snapshot Coordinator::GetSnapshot() const
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        return m_snapshot;
    }

    void Coordinator::Persist()
    {
        if (!m_store)
            return;

        std::lock_guard<std::mutex> persist_lock(m_persist_mutex);
        StoredState state;
        state.devices = m_registry.Devices();
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            state.last_full_scan = m_last_full_scan;
        }

        try
        {
            m_store->Save(state);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Coordinator " << m_config.name << "] Failed to save state: " << e.what() << std::endl;
        }
    }

    void Coordinator::Publish()
    {
        std::vector<std::string> added;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            Snapshot next = MakeSnapshot(m_config.name, m_registry.Devices(), m_last_full_scan);
            added = AddedIdentifiers(m_snapshot, next);
            m_snapshot = std::move(next);
        }

        if (added.empty())
            return;

        std::lock_guard<std::mutex> lock(m_callback_mutex);
        if (m_added_callback)
            m_added_callback(m_config.name, added);
    }
}
