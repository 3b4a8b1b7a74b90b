#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "../scanner/NetworkScanner.hpp"

// Scripted network: an address answers while it is marked alive, with the MAC from macs if any.
class FakeScanner : public netwatch::scanner::DeviceScanner
{
public:
    std::vector<netwatch::scanner::ScannedHost> FullScan(const std::vector<netwatch::common::AddressRange> &ranges) override
    {
        {
            std::unique_lock<std::mutex> gate(m_gate_mutex);
            if (m_hold)
            {
                m_held = true;
                m_gate_cv.notify_all();
                m_gate_cv.wait(gate, [this]
                               { return !m_hold; });
                m_held = false;
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        ++full_scans;
        std::vector<netwatch::scanner::ScannedHost> found;
        for (const auto &ip : netwatch::common::ExpandRanges(ranges))
        {
            if (m_alive.count(ip) == 0)
                continue;
            netwatch::scanner::ScannedHost host;
            host.ip = ip;
            host.rtt_ms = 1.25;
            auto mac = macs.find(ip);
            if (mac != macs.end())
                host.mac = mac->second;
            found.push_back(host);
        }
        return found;
    }

    std::vector<netwatch::scanner::CheckResult> CheckDevices(const std::vector<netwatch::scanner::CheckTarget> &targets) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++quick_checks;
        std::vector<netwatch::scanner::CheckResult> results;
        for (const auto &target : targets)
        {
            netwatch::scanner::CheckResult result;
            result.identifier = target.identifier;
            result.ip = target.ip;
            result.reachable = m_alive.count(target.ip) != 0;
            if (result.reachable)
                result.rtt_ms = 0.75;
            auto mac = macs.find(target.ip);
            if (result.reachable && target.needs_mac && mac != macs.end())
                result.mac = mac->second;
            results.push_back(result);
        }
        return results;
    }

    void SetAlive(const std::string &ip, bool up)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (up)
            m_alive.insert(ip);
        else
            m_alive.erase(ip);
    }

    // While held, FullScan blocks before touching the network until Release().
    void Hold()
    {
        std::lock_guard<std::mutex> gate(m_gate_mutex);
        m_hold = true;
    }

    void Release()
    {
        std::lock_guard<std::mutex> gate(m_gate_mutex);
        m_hold = false;
        m_gate_cv.notify_all();
    }

    bool WaitUntilHeld(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> gate(m_gate_mutex);
        return m_gate_cv.wait_for(gate, timeout, [this]
                                  { return m_held; });
    }

    std::map<std::string, std::string> macs;
    std::atomic<int> full_scans{0};
    std::atomic<int> quick_checks{0};

private:
    std::mutex m_mutex;
    std::set<std::string> m_alive;

    std::mutex m_gate_mutex;
    std::condition_variable m_gate_cv;
    bool m_hold = false;
    bool m_held = false;
};
