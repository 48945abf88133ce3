#include "panelayout/json_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

    TEST(OptionalStringField, ReturnsNulloptForMissingKey) {
        nlohmann::json obj = {{"other", "value"}};
        EXPECT_FALSE(panelayout::optional_string_field(obj, "slot_id").has_value());
    }

    TEST(OptionalStringField, ReturnsNulloptForEmptyOrNonString) {
        nlohmann::json obj = {{"empty", ""}, {"number", 4}, {"null", nullptr}};
        EXPECT_FALSE(panelayout::optional_string_field(obj, "empty").has_value());
        EXPECT_FALSE(panelayout::optional_string_field(obj, "number").has_value());
        EXPECT_FALSE(panelayout::optional_string_field(obj, "null").has_value());
    }

    TEST(OptionalStringField, ReturnsValueForValidKey) {
        nlohmann::json obj = {{"slot_id", "term-1"}};
        EXPECT_EQ(panelayout::optional_string_field(obj, "slot_id"), std::optional<std::string>{"term-1"});
    }

    TEST(OptionalStringField, ToleratesNonObject) {
        nlohmann::json arr = nlohmann::json::array({1, 2});
        EXPECT_FALSE(panelayout::optional_string_field(arr, "slot_id").has_value());
    }

    TEST(OptionalFloatField, AcceptsIntegersAndFloats) {
        nlohmann::json obj = {{"ratio", 0.25}, {"whole", 1}, {"text", "0.5"}};
        EXPECT_EQ(panelayout::optional_float_field(obj, "ratio"), std::optional<float>{0.25f});
        EXPECT_EQ(panelayout::optional_float_field(obj, "whole"), std::optional<float>{1.f});
        EXPECT_FALSE(panelayout::optional_float_field(obj, "text").has_value());
    }

    TEST(OptionalFloatField, RejectsValuesBeyondFloatRange) {
        nlohmann::json obj = {{"huge", 1e300}, {"negative", -1e300}, {"largest", 3.0e38}};
        EXPECT_FALSE(panelayout::optional_float_field(obj, "huge").has_value());
        EXPECT_FALSE(panelayout::optional_float_field(obj, "negative").has_value());
        EXPECT_EQ(panelayout::optional_float_field(obj, "largest"), std::optional<float>{3.0e38f});
    }

    TEST(OptionalBoolField, RejectsNonBoolean) {
        nlohmann::json obj = {{"flag", true}, {"number", 1}};
        EXPECT_EQ(panelayout::optional_bool_field(obj, "flag"), std::optional<bool>{true});
        EXPECT_FALSE(panelayout::optional_bool_field(obj, "number").has_value());
    }

}
