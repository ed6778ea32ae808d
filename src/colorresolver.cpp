// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <colorresolver.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cmath>

namespace hiccpdf::internal {

namespace {

const size_t hex_color_digits = 6;

bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

int hex_value(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

double decode_channel(std::string_view pair) {
    return (hex_value(pair[0]) * 16 + hex_value(pair[1])) / 255.0;
}

int encode_channel(const LimitDouble &v) { return int(std::lround(v.v() * 255.0)); }

} // namespace

NamedColorTable::NamedColorTable()
    : entries{{"red", DeviceRGBColor{1, 0, 0}},
              {"green", DeviceRGBColor{0, 1, 0}},
              {"blue", DeviceRGBColor{0, 0, 1}},
              {"black", DeviceRGBColor{0, 0, 0}},
              {"white", DeviceRGBColor{1, 1, 1}},
              {"yellow", DeviceRGBColor{1, 1, 0}},
              {"cyan", DeviceRGBColor{0, 1, 1}},
              {"magenta", DeviceRGBColor{1, 0, 1}}} {}

std::optional<DeviceRGBColor> NamedColorTable::lookup(std::string_view name) const {
    for(const auto &[key, color] : entries) {
        if(key == name) {
            return color;
        }
    }
    return {};
}

void NamedColorTable::add(std::string name, DeviceRGBColor color) {
    for(auto &[key, existing] : entries) {
        if(key == name) {
            existing = color;
            return;
        }
    }
    entries.emplace_back(std::move(name), color);
}

rvoe<DeviceRGBColor> rgb_from_channels(double r, double g, double b) {
    for(const auto channel : {r, g, b}) {
        if(!std::isfinite(channel) || channel < 0 || channel > 1) {
            RETERR_ATTR(BadColor,
                        "",
                        "colors",
                        "channel values from 0 to 1",
                        fmt::format("{} {} {}", r, g, b));
        }
    }
    return DeviceRGBColor{r, g, b};
}

rvoe<Color> parse_color(std::string_view text, const NamedColorTable &table) {
    if(!text.empty() && text.front() == '#') {
        auto digits = text.substr(1);
        if(digits.size() != hex_color_digits) {
            RETERR_ATTR(BadColor, "", "", "# followed by 6 hex digits", text);
        }
        for(const char c : digits) {
            if(!is_hex_digit(c)) {
                RETERR_ATTR(BadColor, "", "", "# followed by 6 hex digits", text);
            }
        }
        return HexColor{std::string{digits}};
    }
    if(!table.contains(text)) {
        RETERR_ATTR(BadColor, "", "", "a named color or #rrggbb", text);
    }
    return NamedColor{std::string{text}};
}

rvoe<DeviceRGBColor> resolve_color(const Color &color, const NamedColorTable &table) {
    if(auto *named = std::get_if<NamedColor>(&color)) {
        auto rgb = table.lookup(named->name);
        if(!rgb) {
            RETERR_ATTR(BadColor, "", "", "a named color or #rrggbb", named->name);
        }
        return *rgb;
    }
    const auto &hex = std::get<HexColor>(color);
    if(hex.digits.size() != hex_color_digits) {
        RETERR_ATTR(BadColor, "", "", "# followed by 6 hex digits", "#" + hex.digits);
    }
    std::string_view d{hex.digits};
    return DeviceRGBColor{
        decode_channel(d.substr(0, 2)), decode_channel(d.substr(2, 2)), decode_channel(d.substr(4, 2))};
}

rvoe<DeviceRGBColor> resolve_color(std::string_view text, const NamedColorTable &table) {
    ERC(color, parse_color(text, table));
    return resolve_color(color, table);
}

std::string color_to_hex(const DeviceRGBColor &color) {
    return fmt::format("#{:02x}{:02x}{:02x}",
                       encode_channel(color.r),
                       encode_channel(color.g),
                       encode_channel(color.b));
}

std::string color_operands(const DeviceRGBColor &color) {
    return fmt::format("{} {} {}",
                       format_number(color.r.v()),
                       format_number(color.g.v()),
                       format_number(color.b.v()));
}

} // namespace hiccpdf::internal
