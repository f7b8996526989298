#include "niritaskbar/strings.hpp"

#include <gtest/gtest.h>

namespace {

    TEST(TrimView, TrimsBothEnds) {
        EXPECT_EQ(niritaskbar::trim_view("  firefox \n"), "firefox");
    }

    TEST(TrimView, ReturnsEmptyForWhitespaceOnly) {
        EXPECT_EQ(niritaskbar::trim_view(" \t "), "");
    }

    TEST(TrimCopy, ReturnsTrimmedCopy) {
        EXPECT_EQ(niritaskbar::trim_copy("  org.gnome.Nautilus  "), "org.gnome.Nautilus");
    }

    TEST(EqualsIgnoreCase, ComparesWithoutCase) {
        EXPECT_TRUE(niritaskbar::equals_ignore_case("Foo", "fOO"));
        EXPECT_FALSE(niritaskbar::equals_ignore_case("Foo", "Food"));
        EXPECT_TRUE(niritaskbar::equals_ignore_case("", ""));
    }

    TEST(LastDotSegment, ReturnsTextAfterFinalDot) {
        EXPECT_EQ(niritaskbar::last_dot_segment("org.example.Foo"), "Foo");
    }

    TEST(LastDotSegment, ReturnsWholeValueWithoutDot) {
        EXPECT_EQ(niritaskbar::last_dot_segment("firefox"), "firefox");
    }

    TEST(LastDotSegment, ReturnsEmptyForTrailingDot) {
        EXPECT_EQ(niritaskbar::last_dot_segment("org.example."), "");
    }

}
