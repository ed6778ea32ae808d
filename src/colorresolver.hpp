// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hiccpdf::internal {

class NamedColorTable {
public:
    // red, green, blue, black, white, yellow, cyan and magenta.
    NamedColorTable();
    explicit NamedColorTable(std::vector<std::pair<std::string, DeviceRGBColor>> entries)
        : entries{std::move(entries)} {}

    std::optional<DeviceRGBColor> lookup(std::string_view name) const;
    bool contains(std::string_view name) const { return lookup(name).has_value(); }

    void add(std::string name, DeviceRGBColor color);

    size_t size() const { return entries.size(); }

private:
    std::vector<std::pair<std::string, DeviceRGBColor>> entries;
};

// Channels must be finite and in the range [0, 1].
rvoe<DeviceRGBColor> rgb_from_channels(double r, double g, double b);

// Accepts a name known to the table or '#' followed by exactly six hex digits.
rvoe<Color> parse_color(std::string_view text, const NamedColorTable &table);

rvoe<DeviceRGBColor> resolve_color(const Color &color, const NamedColorTable &table);
rvoe<DeviceRGBColor> resolve_color(std::string_view text, const NamedColorTable &table);

// "#rrggbb", lower case.
std::string color_to_hex(const DeviceRGBColor &color);

// "r g b" ready to be followed by rg or RG.
std::string color_operands(const DeviceRGBColor &color);

} // namespace hiccpdf::internal
