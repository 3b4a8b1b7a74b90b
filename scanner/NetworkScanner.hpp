#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../common/AddressRange.hpp"
#include "Prober.hpp"

namespace netwatch::scanner
{
    class NeighborTable;
    class HostnameResolver;
    class VendorDatabase;

    struct ScannedHost
    {
        std::string ip;
        std::optional<std::string> mac;
        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        double rtt_ms = 0.0;
    };

    struct CheckTarget
    {
        std::string identifier;
        std::string ip;
        bool needs_mac = false;
    };

    struct CheckResult
    {
        std::string identifier;
        std::string ip; // address that was probed
        bool reachable = false;
        std::optional<double> rtt_ms;
        std::optional<std::string> mac; // only filled for targets that asked for it
    };

    // What a coordinator needs from the network.
    class DeviceScanner
    {
    public:
        virtual ~DeviceScanner() = default;

        // Every responding host of the ranges, enriched with MAC, hostname and vendor where
        // they can be found.
        virtual std::vector<ScannedHost> FullScan(const std::vector<common::AddressRange> &ranges) = 0;

        // One result per target, in target order.
        virtual std::vector<CheckResult> CheckDevices(const std::vector<CheckTarget> &targets) = 0;
    };

    struct ScannerOptions
    {
        std::chrono::milliseconds probe_timeout{1000};
        int ping_count = 1;
        size_t max_in_flight = 50;
    };

    class NetworkScanner : public DeviceScanner
    {
    public:
        // resolver and vendors may be null, in which case that enrichment is skipped.
        NetworkScanner(ScannerOptions options,
                       std::shared_ptr<Prober> prober,
                       std::shared_ptr<NeighborTable> neighbors,
                       std::shared_ptr<HostnameResolver> resolver,
                       std::shared_ptr<VendorDatabase> vendors);

        std::vector<ScannedHost> FullScan(const std::vector<common::AddressRange> &ranges) override;
        std::vector<CheckResult> CheckDevices(const std::vector<CheckTarget> &targets) override;

        // ping_count probes; reachable if any answered, rtt is the mean of the answers.
        ProbeResult ProbeHost(const std::string &ip);

        // Runs task(0..count-1) on at most max_in_flight threads and returns once all have finished.
        void RunBounded(size_t count, const std::function<void(size_t)> &task) const;

    private:
        ScannerOptions m_options;
        std::shared_ptr<Prober> m_prober;
        std::shared_ptr<NeighborTable> m_neighbors;
        std::shared_ptr<HostnameResolver> m_resolver;
        std::shared_ptr<VendorDatabase> m_vendors;
    };
}
