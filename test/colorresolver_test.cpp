// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <gtest/gtest.h>

#include <colorresolver.hpp>

#include <limits>
#include <string>
#include <vector>

using namespace hiccpdf::internal;

TEST(ColorResolver, NamedColors) {
    NamedColorTable table;
    EXPECT_EQ(table.size(), 8u);
    auto red = resolve_color("red", table);
    ASSERT_TRUE(red);
    EXPECT_EQ(*red, (DeviceRGBColor{1, 0, 0}));
    auto magenta = resolve_color("magenta", table);
    ASSERT_TRUE(magenta);
    EXPECT_EQ(*magenta, (DeviceRGBColor{1, 0, 1}));
    auto white = resolve_color("white", table);
    ASSERT_TRUE(white);
    EXPECT_EQ(color_operands(*white), "1 1 1");
}

TEST(ColorResolver, HexColors) {
    NamedColorTable table;
    auto c = resolve_color("#ff0000", table);
    ASSERT_TRUE(c);
    EXPECT_EQ(color_operands(*c), "1 0 0");

    auto mixed = resolve_color("#FF8000", table);
    ASSERT_TRUE(mixed);
    EXPECT_DOUBLE_EQ(mixed->r.v(), 1.0);
    EXPECT_DOUBLE_EQ(mixed->g.v(), 128 / 255.0);
    EXPECT_DOUBLE_EQ(mixed->b.v(), 0.0);
}

TEST(ColorResolver, OperandsKeepFullPrecision) {
    NamedColorTable table;
    auto grey = resolve_color("#808080", table);
    ASSERT_TRUE(grey);
    const auto text = color_operands(*grey);
    EXPECT_EQ(text.find('e'), std::string::npos);
    const auto first = text.substr(0, text.find(' '));
    EXPECT_EQ(std::stod(first), 128 / 255.0);
}

TEST(ColorResolver, RejectsUnknownColors) {
    NamedColorTable table;
    for(const char *bad : {"purple", "#12345", "#1234567", "#gg0000", "", "#", "Red"}) {
        auto c = resolve_color(bad, table);
        ASSERT_FALSE(c) << bad;
        EXPECT_EQ(c.error().code, ErrorCode::BadColor) << bad;
        EXPECT_EQ(error_category(c.error().code), ErrorCategory::UnresolvableColor);
    }
}

TEST(ColorResolver, HexRoundTripIsIdempotent) {
    NamedColorTable table;
    const std::vector<std::string> inputs{
        "red", "green", "blue", "black", "white", "yellow", "cyan", "magenta",
        "#000000", "#ffffff", "#1a2b3c", "#ABCDEF", "#808080", "#010203"};
    for(const auto &input : inputs) {
        auto first = resolve_color(input, table);
        ASSERT_TRUE(first) << input;
        auto second = resolve_color(color_to_hex(*first), table);
        ASSERT_TRUE(second) << input;
        EXPECT_EQ(*first, *second) << input;
    }
}

TEST(ColorResolver, ToHex) {
    EXPECT_EQ(color_to_hex(DeviceRGBColor{1, 0, 0}), "#ff0000");
    EXPECT_EQ(color_to_hex(DeviceRGBColor{0, 0.5, 1}), "#0080ff");
}

TEST(ColorResolver, CustomTable) {
    NamedColorTable table;
    table.add("orange", DeviceRGBColor{1, 0.5, 0});
    auto orange = resolve_color("orange", table);
    ASSERT_TRUE(orange);
    EXPECT_EQ(color_operands(*orange), "1 0.5 0");

    NamedColorTable only_grey({{"grey", DeviceRGBColor{0.5, 0.5, 0.5}}});
    EXPECT_TRUE(resolve_color("grey", only_grey));
    EXPECT_FALSE(resolve_color("red", only_grey));
}

TEST(ColorResolver, ParseKeepsForm) {
    NamedColorTable table;
    auto named = parse_color("blue", table);
    ASSERT_TRUE(named);
    ASSERT_TRUE(std::holds_alternative<NamedColor>(*named));
    EXPECT_EQ(std::get<NamedColor>(*named).name, "blue");

    auto hex = parse_color("#00ff00", table);
    ASSERT_TRUE(hex);
    ASSERT_TRUE(std::holds_alternative<HexColor>(*hex));
    EXPECT_EQ(std::get<HexColor>(*hex).digits, "00ff00");
}

TEST(ColorResolver, ChannelRange) {
    auto grey = rgb_from_channels(0.25, 0.5, 1);
    ASSERT_TRUE(grey);
    EXPECT_EQ(color_operands(*grey), "0.25 0.5 1");

    for(const double bad : {-0.5, 2.0, std::numeric_limits<double>::quiet_NaN(),
                            std::numeric_limits<double>::infinity()}) {
        auto rc = rgb_from_channels(0, bad, 0);
        ASSERT_FALSE(rc);
        EXPECT_EQ(rc.error().code, ErrorCode::BadColor);
        EXPECT_EQ(error_category(rc.error().code), ErrorCategory::UnresolvableColor);
    }
}
