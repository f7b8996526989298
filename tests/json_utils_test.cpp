#include "niritaskbar/json_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

    TEST(OptionalStringField, ReturnsNulloptForMissingKey) {
        nlohmann::json obj    = {{"other", "value"}};
        auto           result = niritaskbar::optional_string_field(obj, "app_id");
        EXPECT_FALSE(result.has_value());
    }

    TEST(OptionalStringField, ReturnsNulloptForNullValue) {
        nlohmann::json obj    = {{"app_id", nullptr}};
        auto           result = niritaskbar::optional_string_field(obj, "app_id");
        EXPECT_FALSE(result.has_value());
    }

    TEST(OptionalStringField, ReturnsValueForValidKey) {
        nlohmann::json obj    = {{"title", "Inbox"}};
        auto           result = niritaskbar::optional_string_field(obj, "title");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result.value(), "Inbox");
    }

    TEST(OptionalStringField, ReturnsNulloptForNonObject) {
        nlohmann::json value = nlohmann::json::array({"title"});
        EXPECT_FALSE(niritaskbar::optional_string_field(value, "title").has_value());
    }

    TEST(OptionalIntField, AcceptsSignedIntegers) {
        nlohmann::json obj = {{"pid", -4}};
        EXPECT_EQ(niritaskbar::optional_int_field(obj, "pid"), -4);
    }

    TEST(OptionalIntField, RejectsFloatingPoint) {
        nlohmann::json obj = {{"pid", 4.5}};
        EXPECT_FALSE(niritaskbar::optional_int_field(obj, "pid").has_value());
    }

    TEST(OptionalIdField, AcceptsUnsignedIntegers) {
        nlohmann::json obj = nlohmann::json::parse(R"({"id": 18446744073709551615})");
        EXPECT_EQ(niritaskbar::optional_id_field(obj, "id"), 18446744073709551615ULL);
    }

    TEST(OptionalIdField, RejectsNegativeNumbers) {
        nlohmann::json obj = nlohmann::json::parse(R"({"id": -1})");
        EXPECT_FALSE(niritaskbar::optional_id_field(obj, "id").has_value());
    }

    TEST(BoolFieldOr, UsesFallbackForMissingOrWrongType) {
        nlohmann::json obj = {{"is_focused", "yes"}, {"is_floating", true}};
        EXPECT_FALSE(niritaskbar::bool_field_or(obj, "is_focused", false));
        EXPECT_TRUE(niritaskbar::bool_field_or(obj, "is_urgent", true));
        EXPECT_TRUE(niritaskbar::bool_field_or(obj, "is_floating", false));
    }

}
