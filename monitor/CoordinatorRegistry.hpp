#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Coordinator.hpp"

namespace netwatch::monitor
{
    // Instances in registration order. Registration order is the order in which device ids are
    // resolved across instances.
    class CoordinatorRegistry
    {
    public:
        // Returns false if an instance with the same name is already registered.
        bool Register(std::shared_ptr<Coordinator> coordinator);
        std::shared_ptr<Coordinator> Get(const std::string &name) const;

        const std::vector<std::shared_ptr<Coordinator>> &All() const { return m_coordinators; }
        size_t Size() const { return m_coordinators.size(); }

        void LoadAll();
        void StartAll();
        void StopAll();

    private:
        std::vector<std::shared_ptr<Coordinator>> m_coordinators;
    };
}
