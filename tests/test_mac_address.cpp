#include <string>

#include "../common/MacAddress.hpp"

using namespace netwatch::common;

int main()
{
    if (CanonicalMac("AA:BB:CC:DD:EE:FF") != std::optional<std::string>("aa:bb:cc:dd:ee:ff")) return 1;
    if (CanonicalMac("aa-bb-cc-dd-ee-ff") != std::optional<std::string>("aa:bb:cc:dd:ee:ff")) return 2;
    if (CanonicalMac("aabb.ccdd.eeff") != std::optional<std::string>("aa:bb:cc:dd:ee:ff")) return 3;
    if (CanonicalMac("AABBCCDDEEFF") != std::optional<std::string>("aa:bb:cc:dd:ee:ff")) return 4;

    if (CanonicalMac("192.168.1.10").has_value()) return 5;
    if (CanonicalMac("aa:bb:cc:dd:ee").has_value()) return 6;
    if (CanonicalMac("zz:bb:cc:dd:ee:ff").has_value()) return 7;

    if (MacDigits("aa:bb:cc:dd:ee:ff") != "aabbccddeeff") return 8;
    if (OuiPrefix("00:1a:2b:cc:dd:ee") != "001A2B") return 9;

    if (IsUsableMac("00:00:00:00:00:00")) return 10;
    if (IsUsableMac("ff:ff:ff:ff:ff:ff")) return 11;
    if (!IsUsableMac("00:1a:2b:cc:dd:ee")) return 12;
    return 0;
}
