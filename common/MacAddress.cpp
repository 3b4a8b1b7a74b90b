#include "MacAddress.hpp"

#include <tins/hw_address.h>

#include <algorithm>
#include <cctype>

namespace netwatch::common
{
    static std::string StripSeparators(const std::string &raw)
    {
        std::string digits;
        digits.reserve(raw.size());
        for (char c : raw)
        {
            if (c == ':' || c == '-' || c == '.')
                continue;
            digits.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return digits;
    }

    std::optional<std::string> CanonicalMac(const std::string &raw)
    {
        std::string digits = StripSeparators(raw);
        if (digits.size() != 12)
            return std::nullopt;

        bool all_hex = std::all_of(digits.begin(), digits.end(), [](char c)
                                   { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
        if (!all_hex)
            return std::nullopt;

        std::string colon_form;
        for (size_t i = 0; i < digits.size(); i += 2)
        {
            if (i > 0)
                colon_form.push_back(':');
            colon_form.append(digits, i, 2);
        }

        Tins::HWAddress<6> hw(colon_form);
        return hw.to_string();
    }

    std::string MacDigits(const std::string &mac)
    {
        return StripSeparators(mac);
    }

    std::string OuiPrefix(const std::string &mac)
    {
        std::string digits = StripSeparators(mac).substr(0, 6);
        std::transform(digits.begin(), digits.end(), digits.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return digits;
    }

    bool IsUsableMac(const std::string &mac)
    {
        auto canonical = CanonicalMac(mac);
        if (!canonical.has_value())
            return false;

        Tins::HWAddress<6> hw(canonical.value());
        return hw != Tins::HWAddress<6>() && !hw.is_broadcast();
    }
}
