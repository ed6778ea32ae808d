// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hiccpdf::internal {

// Validated, strongly typed form of the input tree.

struct Element;

struct RectElement {
    double x{};
    double y{};
    double width{};
    double height{};
    std::optional<Color> fill;
    std::optional<Color> stroke;
    std::optional<double> stroke_width;
};

struct CircleElement {
    double cx{};
    double cy{};
    double r{};
    std::optional<Color> fill;
    std::optional<Color> stroke;
    std::optional<double> stroke_width;
};

struct LineElement {
    double x1{};
    double y1{};
    double x2{};
    double y2{};
    std::optional<Color> stroke;
    std::optional<double> stroke_width;
};

struct PathElement {
    std::string d;
    std::optional<Color> fill;
    std::optional<Color> stroke;
    std::optional<double> stroke_width;
};

struct TextElement {
    double x{};
    double y{};
    std::string font;
    double size{};
    std::optional<Color> fill;
    u8string content;
};

struct GroupElement {
    std::vector<TransformOp> transforms;
    std::vector<Element> children;
};

struct PageElement {
    std::optional<double> width;
    std::optional<double> height;
    std::optional<Margins> margins;
    std::vector<Element> children;
};

struct DocumentMetadata {
    std::optional<u8string> title;
    std::optional<u8string> author;
    std::optional<u8string> subject;
    std::optional<u8string> keywords;
    std::optional<u8string> creator;
    std::optional<u8string> producer;

    bool empty() const {
        return !title && !author && !subject && !keywords && !creator && !producer;
    }
};

struct DocumentDefaults {
    double width = 612;
    double height = 792;
    Margins margins;
};

struct DocumentElement {
    DocumentMetadata metadata;
    DocumentDefaults defaults;
    std::vector<PageElement> pages;
};

typedef std::variant<RectElement,
                     CircleElement,
                     LineElement,
                     PathElement,
                     TextElement,
                     GroupElement,
                     PageElement,
                     DocumentElement>
    ElementVariant;

struct Element {
    ElementVariant e;
};

const char *element_name(const Element &el);

} // namespace hiccpdf::internal
