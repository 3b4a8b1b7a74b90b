#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "../scanner/HostnameResolver.hpp"
#include "../scanner/NeighborTable.hpp"
#include "../scanner/NetworkScanner.hpp"
#include "../scanner/VendorDatabase.hpp"
#include "../monitor/DeviceRegistry.hpp"

using namespace netwatch;
using namespace netwatch::scanner;

class FakeProber : public Prober
{
public:
    explicit FakeProber(std::set<std::string> alive) : m_alive(std::move(alive)) {}

    ProbeResult Probe(const std::string &ip, std::chrono::milliseconds) override
    {
        int now = ++m_in_flight;
        int seen = m_max_in_flight.load();
        while (now > seen && !m_max_in_flight.compare_exchange_weak(seen, now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --m_in_flight;
        ++m_calls;

        ProbeResult result;
        if (m_alive.count(ip))
        {
            result.reachable = true;
            result.rtt_ms = 1.0 + static_cast<double>(m_calls.load() % 2);
        }
        return result;
    }

    ProbeMode Mode() const override { return ProbeMode::Unprivileged; }

    std::atomic<int> m_in_flight{0};
    std::atomic<int> m_max_in_flight{0};
    std::atomic<int> m_calls{0};

private:
    std::set<std::string> m_alive;
};

class FakeResolver : public HostnameResolver
{
public:
    std::optional<std::string> Resolve(const std::string &ip) override
    {
        if (ip == "192.168.7.10")
            return std::string("nas");
        return std::nullopt;
    }
};

int main()
{
    std::string dir = "/tmp/netwatch_scanner_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream arp(dir + "/arp");
        arp << "IP address       HW type     Flags       HW address            Mask     Device\n"
            << "192.168.7.10     0x1         0x2         00:11:32:aa:bb:cc     *        eth0\n"
            << "192.168.7.20     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
            << "192.168.7.30     0x1         0x2         3C:22:FB:01:02:03     *        eth0\n";
    }
    {
        std::ofstream oui(dir + "/oui.txt");
        oui << "00-11-32   (hex)\t\tSynology Incorporated\n"
            << "001132     (base 16)\t\tSynology Incorporated\n"
            << "3C-22-FB   (hex)\t\tApple, Inc.\n";
    }

    auto prober = std::make_shared<FakeProber>(std::set<std::string>{"192.168.7.10", "192.168.7.20", "192.168.7.30"});
    auto neighbors = std::make_shared<NeighborTable>(dir + "/arp", false);
    auto vendors = std::make_shared<VendorDatabase>(dir + "/oui.txt");

    ScannerOptions options;
    options.max_in_flight = 8;
    NetworkScanner scanner(options, prober, neighbors, std::make_shared<FakeResolver>(), vendors);

    auto found = scanner.FullScan({common::AddressRange::Parse("192.168.7.0/24")});
    if (prober->m_calls != 254) return 1;
    if (prober->m_max_in_flight > 8) return 2;
    if (found.size() != 3) return 3;

    std::sort(found.begin(), found.end(), [](const ScannedHost &a, const ScannedHost &b)
              { return a.ip < b.ip; });
    if (found[0].mac != std::optional<std::string>("00:11:32:aa:bb:cc")) return 4;
    if (found[0].hostname != std::optional<std::string>("nas")) return 5;
    if (found[0].vendor != std::optional<std::string>("Synology Incorporated")) return 6;
    if (found[1].mac.has_value() || found[1].vendor.has_value()) return 7;
    if (found[2].mac != std::optional<std::string>("3c:22:fb:01:02:03")) return 8;
    if (found[2].hostname.has_value()) return 9;
    if (found[2].vendor != std::optional<std::string>("Apple, Inc.")) return 10;

    // quick checks only probe the given targets and only fill MACs that were asked for
    prober->m_calls = 0;
    std::vector<CheckTarget> targets{{"00:11:32:aa:bb:cc", "192.168.7.10", false},
                                     {"192.168.7.30", "192.168.7.30", true},
                                     {"192.168.7.99", "192.168.7.99", true}};
    auto results = scanner.CheckDevices(targets);
    if (prober->m_calls != 3) return 11;
    if (results.size() != 3) return 12;
    if (results[0].identifier != "00:11:32:aa:bb:cc" || !results[0].reachable || results[0].mac.has_value()) return 13;
    if (!results[1].reachable || results[1].mac != std::optional<std::string>("3c:22:fb:01:02:03")) return 14;
    if (results[2].reachable || results[2].rtt_ms.has_value() || results[2].mac.has_value()) return 15;

    // several echo requests are averaged
    ScannerOptions triple;
    triple.ping_count = 3;
    NetworkScanner averaging(triple, prober, nullptr, nullptr, nullptr);
    auto probe = averaging.ProbeHost("192.168.7.10");
    if (!probe.reachable || !probe.rtt_ms) return 16;
    if (*probe.rtt_ms < 1.0 || *probe.rtt_ms > 2.0) return 17;
    if (averaging.ProbeHost("192.168.7.11").reachable) return 18;

    if (RoundLatency(1.23456) != 1.23) return 19;
    if (results[1].ip != "192.168.7.30") return 20;

    // no usable probing mode: nothing is found and known devices pile up failures
    auto unavailable = std::make_shared<UnavailableProber>();
    if (unavailable->Mode() != ProbeMode::Unavailable) return 21;
    NetworkScanner blind(options, unavailable, neighbors, std::make_shared<FakeResolver>(), vendors);
    if (!blind.FullScan({common::AddressRange::Parse("192.168.7.0/28")}).empty()) return 22;

    auto blind_results = blind.CheckDevices(targets);
    if (blind_results.size() != targets.size()) return 23;
    for (const auto &result : blind_results)
    {
        if (result.reachable || result.rtt_ms.has_value() || result.mac.has_value()) return 24;
    }

    monitor::DeviceRegistry known("lan", 2);
    ScannedHost nas;
    nas.ip = "192.168.7.10";
    nas.mac = "00:11:32:aa:bb:cc";
    nas.rtt_ms = 1.0;
    known.ApplyFullScan({nas}, common::Now());
    for (int i = 0; i < 2; ++i)
        known.ApplyQuickCheck(blind.CheckDevices(known.CheckTargets()), common::Now());
    auto stale = known.Get("00:11:32:aa:bb:cc");
    if (!stale || stale->IsOnline() || stale->failed_checks != 2) return 25;

    std::filesystem::remove_all(dir);
    return 0;
}
