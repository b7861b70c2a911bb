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

#include <VPXdec/common/enum_map.h>
//
#include <gtest/gtest.h>

using namespace vpxdec;

namespace {

enum class Fruit
{
    Apple,
    Pear,
    Plum,

    Count
};

constexpr EnumMapArr<Fruit, static_cast<size_t>(Fruit::Count), 4> kFruitMap{{{
    {Fruit::Apple, "apple"},
    {Fruit::Pear, "pear"},
    {Fruit::Plum, "plum"},
    {Fruit::Pear, "conference"},
}}};
static_assert(!kFruitMap.isMissingEnums(), "kFruitMap is missing an entry");

constexpr EnumMapArr<Fruit, static_cast<size_t>(Fruit::Count)> kPartialMap{{{
    {Fruit::Apple, "apple"},
    {Fruit::Pear, "pear"},
}}};
static_assert(kPartialMap.isMissingEnums(), "kPartialMap should be missing Plum");

} // namespace

TEST(EnumMap, ToStringReturnsFirstName)
{
    EXPECT_EQ(enumToString(kFruitMap, Fruit::Apple), "apple");
    EXPECT_EQ(enumToString(kFruitMap, Fruit::Pear), "pear");
    EXPECT_TRUE(enumToString(kPartialMap, Fruit::Plum).empty());
}

TEST(EnumMap, FromStringIgnoresCaseAndAcceptsSynonyms)
{
    Fruit out = Fruit::Count;
    EXPECT_TRUE(enumFromString(kFruitMap, "PLUM", Fruit::Count, out));
    EXPECT_EQ(out, Fruit::Plum);
    EXPECT_TRUE(enumFromString(kFruitMap, "Conference", Fruit::Count, out));
    EXPECT_EQ(out, Fruit::Pear);
}

TEST(EnumMap, FromStringFallsBackToDefault)
{
    Fruit out = Fruit::Apple;
    EXPECT_FALSE(enumFromString(kFruitMap, "banana", Fruit::Count, out));
    EXPECT_EQ(out, Fruit::Count);
    EXPECT_FALSE(enumFromString(kFruitMap, "app", Fruit::Count, out));
}
