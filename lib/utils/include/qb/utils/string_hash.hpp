/*
Module Name:
- string_hash.hpp

Abstract:
- Transparent hash and equality for std::string keyed maps.
- Lets registries keyed by channel name look up with std::string_view without a temporary string.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace qb
{

    struct StringHash
    {
        using is_transparent = void; // opts in to heterogeneous lookup

        std::size_t operator()(std::string_view s) const noexcept
        {
            return std::hash<std::string_view>{}(s);
        }
    };

    struct StringEq
    {
        using is_transparent = void;

        bool operator()(std::string_view a, std::string_view b) const noexcept
        {
            return a == b;
        }
    };

    // Map keyed by channel name with string_view lookups.
    template<class V>
    using StringMap = std::unordered_map<std::string, V, StringHash, StringEq>;

} // namespace qb
