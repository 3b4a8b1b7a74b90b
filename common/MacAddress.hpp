#pragma once

#include <optional>
#include <string>

namespace netwatch::common
{
    // Lowercase colon-separated form ("aa:bb:cc:dd:ee:ff") of a MAC written with ':', '-', '.'
    // or no separators at all. std::nullopt if the text is not a MAC address.
    std::optional<std::string> CanonicalMac(const std::string &raw);

    // "aabbccddeeff"
    std::string MacDigits(const std::string &mac);

    // First three octets as six uppercase hex digits, the key used by OUI registries.
    std::string OuiPrefix(const std::string &mac);

    bool IsUsableMac(const std::string &mac);
}
