/* Copyright (c) V-Nova International Limited 2025-2026. All rights reserved.
 * This software is licensed under the BSD-3-Clause-Clear License by V-Nova Limited.
 * No patent licenses are granted under this license. For enquiries about patent licenses,
 * please contact legal@v-nova.com.
 * The VPXdec software is a stand-alone project and is NOT A CONTRIBUTION to any other project.
 * If the software is incorporated into another project, THE TERMS OF THE BSD-3-CLAUSE-CLEAR LICENSE
 * AND THE ADDITIONAL LICENSING INFORMATION CONTAINED IN THIS FILE MUST BE MAINTAINED, AND THE
 * SOFTWARE DOES NOT AND MUST NOT ADOPT THE LICENSE OF THE INCORPORATING PROJECT. However, the
 * software may be incorporated into a project under a compatible license provided the requirements
 * of the BSD-3-Clause-Clear license are respected, and V-Nova Limited remains
 * licensor of the software ONLY UNDER the BSD-3-Clause-Clear license (not the compatible license).
 * ANY ONWARD DISTRIBUTION, WHETHER STAND-ALONE OR AS PART OF ANY OTHER PROJECT, REMAINS SUBJECT TO
 * THE EXCLUSION OF PATENT LICENSES PROVISION OF THE BSD-3-CLAUSE-CLEAR LICENSE. */

#ifndef VD_VPXDEC_COMMON_ENUM_MAP_H
#define VD_VPXDEC_COMMON_ENUM_MAP_H

#include <array>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vpxdec {

// Fixed-size table of enum-name pairs. Size it with the enum's "Count" value so that a missing
// entry can be caught at compile time:
//
// static constexpr EnumMapArr<Fruit, static_cast<size_t>(Fruit::Count)> kFruitMap{{{
//      {Fruit::Apple, "apple"},
//      {Fruit::Pear, "pear"},
// }}};
// static_assert(!kFruitMap.isMissingEnums(), "kFruitMap is missing an entry");
//
// Synonyms are allowed by giving a Len larger than NumEnums. The first entry for a value is the
// one returned by enumToString.
template <typename E, size_t NumEnums, size_t Len = NumEnums>
struct EnumMapArr
{
    static_assert(std::is_enum_v<E>);
    using EPair = std::pair<E, const char*>;

    std::array<EPair, Len> pairs;

    constexpr bool isMissingEnums() const
    {
        for (size_t value = 0; value < NumEnums; ++value) {
            bool found = false;
            for (const EPair& entry : pairs) {
                if (static_cast<size_t>(entry.first) == value && entry.second != nullptr) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                return true;
            }
        }
        return false;
    }

    const EPair& operator[](size_t idx) const { return pairs[idx]; }
    constexpr size_t size() const { return Len; }
};

namespace detail {
    inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            char a = lhs[i];
            char b = rhs[i];
            if (a >= 'A' && a <= 'Z') {
                a = static_cast<char>(a - 'A' + 'a');
            }
            if (b >= 'A' && b <= 'Z') {
                b = static_cast<char>(b - 'A' + 'a');
            }
            if (a != b) {
                return false;
            }
        }
        return true;
    }
} // namespace detail

// Returns an empty view if the value has no entry.
template <typename E, size_t NumEnums, size_t Len>
inline std::string_view enumToString(const EnumMapArr<E, NumEnums, Len>& map, E enm)
{
    for (size_t i = 0; i < Len; ++i) {
        if (map[i].first == enm && map[i].second != nullptr) {
            return map[i].second;
        }
    }
    return {};
}

// Case-insensitive lookup. On failure, out is set to defaultValue.
template <typename E, size_t NumEnums, size_t Len>
inline bool enumFromString(const EnumMapArr<E, NumEnums, Len>& map, std::string_view str,
                           E defaultValue, E& out)
{
    for (size_t i = 0; i < Len; ++i) {
        if (map[i].second != nullptr && detail::equalsIgnoreCase(map[i].second, str)) {
            out = map[i].first;
            return true;
        }
    }
    out = defaultValue;
    return false;
}

} // namespace vpxdec

#endif // VD_VPXDEC_COMMON_ENUM_MAP_H
