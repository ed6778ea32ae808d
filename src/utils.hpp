// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <pdfcommon.hpp>

#include <string>
#include <string_view>
#include <cstdio>

namespace hiccpdf::internal {

template<class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
#if defined __APPLE__
// This should not be needed, but Xcode 15 still requires it.
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
#endif

// Shortest decimal that reads back as the same double. PDF has no
// exponent notation so tiny and huge values are written out in full.
std::string format_number(double value);

bool is_valid_utf8(std::string_view input);

bool is_ascii(std::string_view text);

bool is_blank(std::string_view text);

std::string pdfstring_quote(std::string_view raw_string);

std::string utf8_to_pdfutf16be(const u8string &input, bool add_adornments = true);

// Literal string for ASCII input, UTF-16BE hex string otherwise.
std::string u8str2pdftextstring(const u8string &str);

struct FileCloser {
    void operator()(FILE *f) const {
        if(f) {
            fclose(f);
        }
    }
};

} // namespace hiccpdf::internal
