#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CoordinatorRegistry.hpp"
#include "EventJournal.hpp"

namespace netwatch::monitor
{
    struct ResolvedDevice
    {
        std::shared_ptr<Coordinator> owner;
        std::string identifier;
    };

    // Entry points for external commands. Reads across instances only to find the owner of a
    // device id, then calls that instance's own mutation methods.
    class ServiceDispatcher
    {
    public:
        // journal may be null, History then returns nothing.
        ServiceDispatcher(const CoordinatorRegistry &registry, std::shared_ptr<EventJournal> journal);

        // Full scan of every instance in registration order, each persisted afterwards.
        void FullScan();

        // Throw DeviceNotFound when no instance knows the id.
        common::DeviceRecord ForgetDevice(const std::string &device_id);
        common::DeviceRecord WatchDevice(const std::string &device_id, bool watched);
        common::DeviceRecord NameDevice(const std::string &device_id, const std::string &nickname);

        std::vector<Snapshot> Snapshots() const;

        // Events of one device, or of all devices for an empty id. Works for forgotten devices too.
        std::vector<JournalEntry> History(const std::string &device_id, int limit) const;

        // First instance, in registration order, whose registry resolves the id.
        std::optional<ResolvedDevice> Resolve(const std::string &device_id) const;

    private:
        ResolvedDevice ResolveOrThrow(const std::string &device_id) const;

        const CoordinatorRegistry &m_registry;
        std::shared_ptr<EventJournal> m_journal;
    };
}
