// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <fonttable.hpp>

#include <algorithm>

namespace hiccpdf::internal {

const std::array<const char *, 14> standard_font_names{
    "Times-Roman",
    "Helvetica",
    "Courier",
    "Symbol",
    "Times-Bold",
    "Helvetica-Bold",
    "Courier-Bold",
    "ZapfDingbats",
    "Times-Italic",
    "Helvetica-Oblique",
    "Courier-Oblique",
    "Times-BoldItalic",
    "Helvetica-BoldOblique",
    "Courier-BoldOblique",
};

std::string fontname2pdfname(std::string_view original) {
    std::string out;
    out.reserve(original.size());
    for(const auto c : original) {
        if(c == ' ') {
            continue;
        }
        if(c == '\\') {
            continue;
        }
        // PDF delimiters and anything outside printable ASCII can not
        // appear in a name token without escaping.
        if(c < '!' || c > '~') {
            continue;
        }
        switch(c) {
        case '(':
        case ')':
        case '<':
        case '>':
        case '[':
        case ']':
        case '{':
        case '}':
        case '/':
        case '%':
        case '#':
            continue;
        default:
            break;
        }
        out += c;
    }
    return out;
}

bool is_standard_font(std::string_view name) {
    for(const auto *f : standard_font_names) {
        if(name == f) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> scan_font_resources(std::string_view content_stream) {
    std::vector<std::string> fonts;
    size_t line_start = 0;
    while(line_start < content_stream.size()) {
        auto line_end = content_stream.find('\n', line_start);
        if(line_end == std::string_view::npos) {
            line_end = content_stream.size();
        }
        auto line = content_stream.substr(line_start, line_end - line_start);
        line_start = line_end + 1;

        const auto first = line.find_first_not_of(' ');
        if(first == std::string_view::npos || line[first] != '/' || !line.ends_with(" Tf")) {
            continue;
        }
        line.remove_prefix(first + 1);
        auto name = std::string{line.substr(0, line.find(' '))};
        if(name.empty()) {
            continue;
        }
        if(std::find(fonts.begin(), fonts.end(), name) == fonts.end()) {
            fonts.emplace_back(std::move(name));
        }
    }
    return fonts;
}

FontTable::FontTable()
    : aliases{{"Arial", "Helvetica"},
              {"Times", "Times-Roman"},
              {"TimesNewRoman", "Times-Roman"}},
      fallback{"Helvetica"} {}

std::string FontTable::base_font(std::string_view resource_name) const {
    if(is_standard_font(resource_name)) {
        return std::string{resource_name};
    }
    for(const auto &[name, base] : aliases) {
        if(name == resource_name) {
            return base;
        }
    }
    return fallback;
}

rvoe<NoReturnValue> FontTable::add_alias(std::string_view font_name, std::string_view base_font) {
    if(!is_standard_font(base_font)) {
        RETERR_ATTR(UnknownBaseFont, "", "fonts", "one of the 14 standard fonts", base_font);
    }
    auto key = fontname2pdfname(font_name);
    for(auto &[name, base] : aliases) {
        if(name == key) {
            base = base_font;
            RETOK;
        }
    }
    aliases.emplace_back(std::move(key), std::string{base_font});
    RETOK;
}

} // namespace hiccpdf::internal
