// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hiccpdf::internal {

extern const std::array<const char *, 14> standard_font_names;

// Resource name used in content streams for a user given font name.
std::string fontname2pdfname(std::string_view original);

bool is_standard_font(std::string_view name);

// Font resource names selected with Tf in a content stream, in order of
// first appearance.
std::vector<std::string> scan_font_resources(std::string_view content_stream);

// Maps font resource names to one of the 14 standard fonts.
class FontTable {
public:
    FontTable();

    // Resource names not known to the table fall back to the default font.
    std::string base_font(std::string_view resource_name) const;

    // The base font must be one of the 14 standard fonts.
    rvoe<NoReturnValue> add_alias(std::string_view font_name, std::string_view base_font);

private:
    std::vector<std::pair<std::string, std::string>> aliases;
    std::string fallback;
};

} // namespace hiccpdf::internal
