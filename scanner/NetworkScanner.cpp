#include "NetworkScanner.hpp"
#include "HostnameResolver.hpp"
#include "NeighborTable.hpp"
#include "VendorDatabase.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>

namespace netwatch::scanner
{
    NetworkScanner::NetworkScanner(ScannerOptions options,
                                   std::shared_ptr<Prober> prober,
                                   std::shared_ptr<NeighborTable> neighbors,
                                   std::shared_ptr<HostnameResolver> resolver,
                                   std::shared_ptr<VendorDatabase> vendors)
        : m_options(options),
          m_prober(std::move(prober)),
          m_neighbors(std::move(neighbors)),
          m_resolver(std::move(resolver)),
          m_vendors(std::move(vendors))
    {
        if (m_options.max_in_flight == 0)
            m_options.max_in_flight = 1;
        if (m_options.ping_count < 1)
            m_options.ping_count = 1;
    }

    void NetworkScanner::RunBounded(size_t count, const std::function<void(size_t)> &task) const
    {
        if (count == 0)
            return;

        std::atomic<size_t> cursor{0};
        size_t worker_count = std::min(count, m_options.max_in_flight);
        std::vector<std::thread> workers;
        workers.reserve(worker_count);

        for (size_t w = 0; w < worker_count; ++w)
        {
            workers.emplace_back([&cursor, &task, count]()
            {
                for (size_t index = cursor++; index < count; index = cursor++)
                {
                    try
                    {
                        task(index);
                    }
                    catch (const std::exception &e)
                    {
                        std::cerr << "[Scanner] Task " << index << " failed: " << e.what() << "\n";
                    }
                }
            });
        }

        for (auto &worker : workers)
            worker.join();
    }

    ProbeResult NetworkScanner::ProbeHost(const std::string &ip)
    {
        ProbeResult combined;
        double total_ms = 0.0;
        int replies = 0;

        for (int i = 0; i < m_options.ping_count; ++i)
        {
            ProbeResult single = m_prober->Probe(ip, m_options.probe_timeout);
            if (single.reachable)
            {
                total_ms += single.rtt_ms.value_or(0.0);
                ++replies;
            }
        }

        if (replies > 0)
        {
            combined.reachable = true;
            combined.rtt_ms = RoundLatency(total_ms / replies);
        }
        return combined;
    }

    std::vector<ScannedHost> NetworkScanner::FullScan(const std::vector<common::AddressRange> &ranges)
    {
        std::vector<std::string> targets = common::ExpandRanges(ranges);
        std::cout << "[Scanner] Full scan of " << targets.size() << " addresses ("
                  << ProbeModeName(m_prober->Mode()) << " probing)\n";

        std::vector<ProbeResult> probes(targets.size());
        RunBounded(targets.size(), [&](size_t i)
                   { probes[i] = ProbeHost(targets[i]); });

        std::vector<ScannedHost> found;
        for (size_t i = 0; i < targets.size(); ++i)
        {
            if (!probes[i].reachable)
                continue;

            ScannedHost host;
            host.ip = targets[i];
            host.rtt_ms = probes[i].rtt_ms.value_or(0.0);
            found.push_back(std::move(host));
        }

        // Probing is what fills the kernel cache, so it is read afterwards.
        if (m_neighbors)
            m_neighbors->Refresh();

        RunBounded(found.size(), [&](size_t i)
        {
            ScannedHost &host = found[i];
            if (m_neighbors)
                host.mac = m_neighbors->Lookup(host.ip);
            if (m_resolver)
                host.hostname = m_resolver->Resolve(host.ip);
            if (m_vendors && host.mac.has_value())
                host.vendor = m_vendors->Lookup(host.mac.value());
        });

        std::cout << "[Scanner] Full scan complete: found " << found.size() << " online hosts\n";
        return found;
    }

    std::vector<CheckResult> NetworkScanner::CheckDevices(const std::vector<CheckTarget> &targets)
    {
        std::vector<CheckResult> results(targets.size());
        if (targets.empty())
            return results;

        for (size_t i = 0; i < targets.size(); ++i)
        {
            results[i].identifier = targets[i].identifier;
            results[i].ip = targets[i].ip;
        }

        RunBounded(targets.size(), [&](size_t i)
        {
            ProbeResult probe = ProbeHost(targets[i].ip);
            results[i].reachable = probe.reachable;
            results[i].rtt_ms = probe.rtt_ms;
        });

        bool wants_mac = std::any_of(targets.begin(), targets.end(), [](const CheckTarget &t)
                                     { return t.needs_mac; });
        if (wants_mac && m_neighbors)
        {
            m_neighbors->Refresh();
            for (size_t i = 0; i < targets.size(); ++i)
            {
                if (targets[i].needs_mac && results[i].reachable)
                    results[i].mac = m_neighbors->Lookup(targets[i].ip);
            }
        }

        size_t online = std::count_if(results.begin(), results.end(), [](const CheckResult &r)
                                      { return r.reachable; });
        std::cout << "[Scanner] Quick check complete: " << online << "/" << targets.size() << " online\n";
        return results;
    }
}
