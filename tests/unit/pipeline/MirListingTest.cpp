#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "mir_listing.hpp"
#include "canonical.hpp"

namespace
{
    std::string hashLine(const sceneasm::mir::Unit& unit)
    {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), " 0x%016llx\n",
            static_cast<unsigned long long>(sceneasm::mir::canonicalHash(unit)));
        return "hash " + unit.name + buffer;
    }
}

namespace sceneasm::pipeline
{
namespace
{
    TEST(MirListingTest, PrintsEachUnitWithItsHash)
    {
        const MirListing listing = lowerToMir("START:\n    mov $v0, 3\n    j START\n");
        ASSERT_TRUE(listing.succeeded());
        ASSERT_EQ(listing.units.size(), 1u);

        const std::string expected =
            "script START\n"
            "  START:\n"
            "    mov $v0, 3\n"
            "    j START\n"
            + hashLine(listing.units.front());
        EXPECT_EQ(formatMirListing(listing), expected);
    }

    TEST(MirListingTest, ShowsFunctionEpilogue)
    {
        const std::string source =
            "function GCD($a, $b)\n"
            "    jc $b != 0, _RECUR\n"
            "    mov $v1, $a\n"
            "    return\n"
            "_RECUR:\n"
            "    exp $a, $a mod $b\n"
            "    call GCD, $b, $a\n"
            "endfun\n"
            "ENTRY:\n"
            "    call GCD, 12, 18\n";

        const MirListing listing = lowerToMir(source);
        ASSERT_TRUE(listing.succeeded());
        ASSERT_EQ(listing.units.size(), 2u);
        ASSERT_EQ(listing.units.front().instructions.size(), 6u);

        const std::string text = formatMirListing(listing);
        EXPECT_NE(text.find("function GCD\n  GCD:\n    jc $a1 != 0, _RECUR\n"), std::string::npos);
        EXPECT_NE(text.find("  _RECUR:\n"), std::string::npos);
        EXPECT_NE(text.find(hashLine(listing.units[0])), std::string::npos);
        EXPECT_NE(text.find(hashLine(listing.units[1])), std::string::npos);
    }

    TEST(MirListingTest, HashIgnoresLayoutAndComments)
    {
        const MirListing compact = lowerToMir("START:\n    mov $v0, 3\n");
        const MirListing spaced = lowerToMir("\n\nSTART:   // entry\n\n        mov   $v0 ,  3\n");
        EXPECT_EQ(formatMirListing(compact), formatMirListing(spaced));

        const MirListing changed = lowerToMir("START:\n    mov $v0, 4\n");
        ASSERT_EQ(changed.units.size(), 1u);
        EXPECT_NE(mir::canonicalHash(changed.units.front()), mir::canonicalHash(compact.units.front()));
    }

    TEST(MirListingTest, KeepsUnitsThatFailToLower)
    {
        const MirListing listing = lowerToMir("START:\n    j MISSING\nNEXT:\n    frobnicate $v0\n");
        EXPECT_FALSE(listing.succeeded());
        ASSERT_EQ(listing.units.size(), 2u);
        ASSERT_GE(listing.diagnostics.size(), 2u);
        EXPECT_EQ(listing.diagnostics.front().code, "SASM-E2201");
        EXPECT_EQ(listing.diagnostics.back().code, "SASM-E2310");
        EXPECT_TRUE(listing.units.back().instructions.empty());
    }
} // namespace
} // namespace sceneasm::pipeline
