#include <string>
#include <vector>

#include "../common/AddressRange.hpp"

using netwatch::common::AddressRange;
using netwatch::common::InvalidRange;

static bool Rejects(const std::string &text)
{
    try
    {
        AddressRange::Parse(text);
    }
    catch (const InvalidRange &)
    {
        return true;
    }
    return false;
}

int main()
{
    auto lan = AddressRange::Parse("192.168.1.0/24");
    auto hosts = lan.Hosts();
    if (hosts.size() != 254) return 1;
    if (hosts.front() != "192.168.1.1") return 2;
    if (hosts.back() != "192.168.1.254") return 3;
    if (lan.HostCount() != 254) return 4;

    auto p2p = AddressRange::Parse("10.0.0.0/31").Hosts();
    if (p2p.size() != 2 || p2p[0] != "10.0.0.0" || p2p[1] != "10.0.0.1") return 5;

    auto single = AddressRange::Parse(" 10.1.2.3 ").Hosts();
    if (single.size() != 1 || single[0] != "10.1.2.3") return 6;

    auto small = AddressRange::Parse("10.0.0.4/30").Hosts();
    if (small.size() != 2 || small[0] != "10.0.0.5" || small[1] != "10.0.0.6") return 7;

    // host bits are masked off
    auto masked = AddressRange::Parse("172.16.5.77/24");
    if (masked.ToString() != "172.16.5.0/24") return 8;
    if (!masked.Contains("172.16.5.200")) return 9;
    if (masked.Contains("172.16.6.1")) return 10;

    if (!Rejects("")) return 11;
    if (!Rejects("192.168.1.0/33")) return 12;
    if (!Rejects("192.168.1.0/")) return 13;
    if (!Rejects("192.168.300.0/24")) return 14;
    if (!Rejects("fe80::/64")) return 15;
    if (!Rejects("10.0.0.0/8")) return 16;
    if (!Rejects("not-a-range")) return 17;

    // overlapping ranges keep the first occurrence only
    std::vector<AddressRange> ranges{AddressRange::Parse("10.0.0.0/30"), AddressRange::Parse("10.0.0.2/32"),
                                     AddressRange::Parse("10.0.0.9")};
    auto all = netwatch::common::ExpandRanges(ranges);
    std::vector<std::string> expected{"10.0.0.1", "10.0.0.2", "10.0.0.9"};
    if (all != expected) return 18;

    return 0;
}
