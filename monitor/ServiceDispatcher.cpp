#include "ServiceDispatcher.hpp"
#include "../common/MacAddress.hpp"

#include <iostream>

namespace netwatch::monitor
{
    ServiceDispatcher::ServiceDispatcher(const CoordinatorRegistry &registry, std::shared_ptr<EventJournal> journal)
        : m_registry(registry), m_journal(std::move(journal))
    {
    }

    void ServiceDispatcher::FullScan()
    {
        for (const auto &coordinator : m_registry.All())
        {
            try
            {
                coordinator->TriggerFullScan();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Dispatcher] Full scan of " << coordinator->Name() << " failed: " << e.what() << std::endl;
            }
        }
    }

    std::optional<ResolvedDevice> ServiceDispatcher::Resolve(const std::string &device_id) const
    {
        for (const auto &coordinator : m_registry.All())
        {
            auto identifier = coordinator->ResolveDevice(device_id);
            if (identifier)
                return ResolvedDevice{coordinator, *identifier};
        }
        return std::nullopt;
    }

    ResolvedDevice ServiceDispatcher::ResolveOrThrow(const std::string &device_id) const
    {
        auto resolved = Resolve(device_id);
        if (!resolved)
            throw DeviceNotFound("Device " + device_id + " not found in any instance");
        return *resolved;
    }

    common::DeviceRecord ServiceDispatcher::ForgetDevice(const std::string &device_id)
    {
        ResolvedDevice target = ResolveOrThrow(device_id);
        return target.owner->ForgetDevice(target.identifier);
    }

    common::DeviceRecord ServiceDispatcher::WatchDevice(const std::string &device_id, bool watched)
    {
        ResolvedDevice target = ResolveOrThrow(device_id);
        return target.owner->SetWatched(target.identifier, watched);
    }

    common::DeviceRecord ServiceDispatcher::NameDevice(const std::string &device_id, const std::string &nickname)
    {
        ResolvedDevice target = ResolveOrThrow(device_id);
        return target.owner->SetNickname(target.identifier, nickname);
    }

    std::vector<Snapshot> ServiceDispatcher::Snapshots() const
    {
        std::vector<Snapshot> snapshots;
        snapshots.reserve(m_registry.Size());
        for (const auto &coordinator : m_registry.All())
            snapshots.push_back(coordinator->GetSnapshot());
        return snapshots;
    }

    std::vector<JournalEntry> ServiceDispatcher::History(const std::string &device_id, int limit) const
    {
        if (!m_journal)
            return {};

        std::string identifier = device_id;
        if (!device_id.empty())
        {
            if (auto resolved = Resolve(device_id))
                identifier = resolved->identifier;
            else if (auto mac = common::CanonicalMac(device_id))
                identifier = *mac;
        }
        return m_journal->RecentEvents(identifier, limit);
    }
}
