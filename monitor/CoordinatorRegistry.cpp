#include "CoordinatorRegistry.hpp"

namespace netwatch::monitor
{
    bool CoordinatorRegistry::Register(std::shared_ptr<Coordinator> coordinator)
    {
        if (!coordinator)
            return false;
        if (Get(coordinator->Name()))
            return false;
        m_coordinators.push_back(std::move(coordinator));
        return true;
    }

    std::shared_ptr<Coordinator> CoordinatorRegistry::Get(const std::string &name) const
    {
        for (const auto &coordinator : m_coordinators)
        {
            if (coordinator->Name() == name)
                return coordinator;
        }
        return nullptr;
    }

    void CoordinatorRegistry::LoadAll()
    {
        for (const auto &coordinator : m_coordinators)
            coordinator->LoadState();
    }

    void CoordinatorRegistry::StartAll()
    {
        for (const auto &coordinator : m_coordinators)
            coordinator->Start();
    }

    void CoordinatorRegistry::StopAll()
    {
        for (const auto &coordinator : m_coordinators)
            coordinator->Stop();
    }
}
