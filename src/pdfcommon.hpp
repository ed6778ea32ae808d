// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <hiccpdf_types.hpp>
#include <errorhandling.hpp>

#include <optional>
#include <array>
#include <string>
#include <string_view>
#include <variant>
#include <iterator>

#include <cstdint>
#include <cmath>

namespace hiccpdf::internal {

// Does not check if the given buffer is valid UTF-8.
// If it is not, UB ensues.
class CodepointIterator {
public:
    struct CharInfo {
        uint32_t codepoint;
        uint32_t byte_count;
    };

    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = uint32_t;
    using pointer = const uint32_t *;
    using reference = const uint32_t &;

    CodepointIterator(const unsigned char *utf8_string) : buf{utf8_string} {}
    CodepointIterator(const CodepointIterator &) = default;
    CodepointIterator(CodepointIterator &&) = default;

    reference operator*() {
        compute_char_info();
        return char_info.value().codepoint;
    }

    pointer operator->() {
        compute_char_info();
        return &char_info.value().codepoint;
    }
    CodepointIterator &operator++() {
        compute_char_info();
        buf += char_info.value().byte_count;
        char_info.reset();
        return *this;
    }
    CodepointIterator operator++(int) {
        compute_char_info();
        CodepointIterator rval{*this};
        ++(*this);
        return rval;
    }

    bool operator==(const CodepointIterator &o) const { return buf == o.buf; }
    bool operator!=(const CodepointIterator &o) const { return !(*this == o); }

private:
    void compute_char_info() {
        if(char_info) {
            return;
        }
        char_info = extract_one_codepoint(buf);
    };

    CharInfo extract_one_codepoint(const unsigned char *buf);
    const unsigned char *buf;
    std::optional<CharInfo> char_info;
};

class u8string {
public:
    u8string() = default;
    u8string(u8string &&o) = default;
    u8string(const u8string &o) = default;

    std::string_view sv() const { return buf; }

    static rvoe<u8string> from_view(std::string_view sv);

    bool empty() const { return buf.empty(); }
    size_t size() const { return buf.size(); }

    CodepointIterator begin() const {
        return CodepointIterator((const unsigned char *)buf.c_str());
    }

    CodepointIterator end() const {
        return CodepointIterator((const unsigned char *)buf.c_str() + buf.size());
    }

    u8string &operator=(u8string &&o) = default;
    u8string &operator=(const u8string &o) = default;

    bool operator==(const u8string &other) const = default;

private:
    explicit u8string(std::string_view prevalidated_utf8) : buf(prevalidated_utf8) {}
    std::string buf;
};

// In PDF only 6 of the 9 values are stored.
struct PdfMatrix {
    double a, b, c, d, e, f;
};

struct Point {
    double x, y;
};

class LimitDouble {
public:
    LimitDouble() : value(minval) {}

    // No "explicit" because we want the following to work for convenience:
    // DeviceRGBColor{0.0, 0.3, 1.0}
    LimitDouble(double new_val) : value(new_val) { clamp(); }

    double v() const { return value; }

    bool operator==(const LimitDouble &o) const = default;

private:
    constexpr static double maxval = 1.0;
    constexpr static double minval = 0.0;

    void clamp() {
        if(std::isnan(value)) {
            value = minval;
        } else if(value < minval) {
            value = minval;
        } else if(value > maxval) {
            value = maxval;
        }
    }

    double value;
};

struct DeviceRGBColor {
    LimitDouble r;
    LimitDouble g;
    LimitDouble b;

    bool operator==(const DeviceRGBColor &o) const = default;
};

// Color as written by the user, before resolving.
struct NamedColor {
    std::string name;
};

struct HexColor {
    std::string digits; // Exactly six, without the leading '#'.
};

typedef std::variant<NamedColor, HexColor> Color;

// Order is top, right, bottom, left.
struct Margins {
    double top{};
    double right{};
    double bottom{};
    double left{};

    bool operator==(const Margins &o) const = default;
};

using hiccpdf::Node;
using hiccpdf::PageSize;
using hiccpdf::Rotate;
using hiccpdf::Scale;
using hiccpdf::TransformOp;
using hiccpdf::Translate;

} // namespace hiccpdf::internal
