// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <validation.hpp>
#include <fonttable.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cmath>

namespace hiccpdf::internal {

namespace {

std::string describe_value(const AttrValue &v) {
    return std::visit(overloaded{
                          [](double d) { return format_number(d); },
                          [](const std::string &s) { return fmt::format("\"{}\"", s); },
                          [](const std::vector<double> &l) {
                              return fmt::format("a list of {} numbers", l.size());
                          },
                          [](const std::vector<TransformOp> &l) {
                              return fmt::format("a list of {} transforms", l.size());
                          },
                      },
                      v);
}

class AttributeReader {
public:
    AttributeReader(const Node &node) : node{node} {}

    const char *element() const { return node.tag.c_str(); }

    const AttrValue *find(const char *key) const {
        auto it = node.attrs.find(key);
        if(it == node.attrs.end()) {
            return nullptr;
        }
        return &it->second;
    }

    rvoe<std::optional<double>> optional_number(const char *key) const {
        const auto *v = find(key);
        if(!v) {
            return std::optional<double>{};
        }
        const auto *d = std::get_if<double>(v);
        if(!d) {
            RETERR_ATTR(WrongAttributeType, element(), key, "number", describe_value(*v));
        }
        if(!std::isfinite(*d)) {
            RETERR_ATTR(NotFiniteNumber, element(), key, "finite number", describe_value(*v));
        }
        return std::optional<double>{*d};
    }

    rvoe<double> number(const char *key) const {
        ERC(value, optional_number(key));
        if(!value) {
            RETERR_ATTR(MissingAttribute, element(), key, "number", "nothing");
        }
        return *value;
    }

    rvoe<std::optional<double>> optional_non_negative(const char *key, ErrorCode code) const {
        ERC(value, optional_number(key));
        if(value && *value < 0) {
            return create_error(code, element(), key, "number >= 0", format_number(*value));
        }
        return value;
    }

    rvoe<std::optional<double>> optional_positive(const char *key, ErrorCode code) const {
        ERC(value, optional_number(key));
        if(value && *value <= 0) {
            return create_error(code, element(), key, "number > 0", format_number(*value));
        }
        return value;
    }

    rvoe<std::optional<std::string>> optional_string(const char *key) const {
        const auto *v = find(key);
        if(!v) {
            return std::optional<std::string>{};
        }
        const auto *s = std::get_if<std::string>(v);
        if(!s) {
            RETERR_ATTR(WrongAttributeType, element(), key, "string", describe_value(*v));
        }
        return std::optional<std::string>{*s};
    }

    // Text that ends up in the output, must be valid UTF-8 and not blank.
    rvoe<std::optional<u8string>> optional_text(const char *key) const {
        ERC(value, optional_string(key));
        if(!value) {
            return std::optional<u8string>{};
        }
        if(is_blank(*value)) {
            RETERR_ATTR(EmptyString, element(), key, "non-blank string", describe_value(*value));
        }
        auto text = u8string::from_view(*value);
        if(!text) {
            RETERR_ATTR(BadUtf8, element(), key, "UTF-8 string", "invalid UTF-8");
        }
        return std::optional<u8string>{std::move(*text)};
    }

    rvoe<std::optional<Color>> optional_color(const char *key,
                                              const NamedColorTable &colors) const {
        ERC(value, optional_string(key));
        if(!value) {
            return std::optional<Color>{};
        }
        auto color = parse_color(*value, colors);
        if(!color) {
            auto err = std::move(color.error());
            err.element = element();
            err.field = key;
            return std::unexpected(std::move(err));
        }
        return std::optional<Color>{std::move(*color)};
    }

    rvoe<std::optional<Margins>> optional_margins(const char *key) const {
        const auto *v = find(key);
        if(!v) {
            return std::optional<Margins>{};
        }
        const auto *l = std::get_if<std::vector<double>>(v);
        if(!l) {
            RETERR_ATTR(WrongAttributeType, element(), key, "list of 4 numbers", describe_value(*v));
        }
        if(l->size() != 4) {
            RETERR_ATTR(WrongMarginCount, element(), key, "list of 4 numbers", describe_value(*v));
        }
        for(const auto d : *l) {
            if(!std::isfinite(d)) {
                RETERR_ATTR(NotFiniteNumber, element(), key, "finite number", format_number(d));
            }
            if(d < 0) {
                RETERR_ATTR(NegativeMargin, element(), key, "number >= 0", format_number(d));
            }
        }
        return std::optional<Margins>{Margins{(*l)[0], (*l)[1], (*l)[2], (*l)[3]}};
    }

    rvoe<std::vector<TransformOp>> transforms(const char *key) const {
        const auto *v = find(key);
        if(!v) {
            return std::vector<TransformOp>{};
        }
        const auto *l = std::get_if<std::vector<TransformOp>>(v);
        if(!l) {
            RETERR_ATTR(WrongAttributeType, element(), key, "list of transforms", describe_value(*v));
        }
        for(const auto &op : *l) {
            const bool finite =
                std::visit(overloaded{
                               [](const Translate &t) {
                                   return std::isfinite(t.dx) && std::isfinite(t.dy);
                               },
                               [](const Rotate &r) { return std::isfinite(r.degrees); },
                               [](const Scale &s) {
                                   return std::isfinite(s.sx) && std::isfinite(s.sy);
                               },
                           },
                           op);
            if(!finite) {
                RETERR_ATTR(NotFiniteNumber, element(), key, "finite number", "non-finite value");
            }
        }
        return *l;
    }

private:
    const Node &node;
};

rvoe<NoReturnValue> check_leaf(const Node &node) {
    if(!node.children.empty()) {
        RETERR_ATTR(LeafHasChildren,
                    node.tag,
                    "",
                    "no child elements",
                    fmt::format("{} child elements", node.children.size()));
    }
    RETOK;
}

rvoe<RectElement> validate_rect(const AttributeReader &a, const NamedColorTable &colors) {
    RectElement rect;
    ERC(x, a.number("x"));
    ERC(y, a.number("y"));
    ERC(width, a.number("width"));
    ERC(height, a.number("height"));
    ERC(fill, a.optional_color("fill", colors));
    ERC(stroke, a.optional_color("stroke", colors));
    ERC(stroke_width, a.optional_non_negative("stroke-width", ErrorCode::NegativeLineWidth));
    rect.x = x;
    rect.y = y;
    rect.width = width;
    rect.height = height;
    rect.fill = std::move(fill);
    rect.stroke = std::move(stroke);
    rect.stroke_width = stroke_width;
    return rect;
}

rvoe<CircleElement> validate_circle(const AttributeReader &a, const NamedColorTable &colors) {
    CircleElement circle;
    ERC(cx, a.number("cx"));
    ERC(cy, a.number("cy"));
    ERC(r, a.number("r"));
    if(r < 0) {
        RETERR_ATTR(NegativeRadius, a.element(), "r", "number >= 0", format_number(r));
    }
    ERC(fill, a.optional_color("fill", colors));
    ERC(stroke, a.optional_color("stroke", colors));
    ERC(stroke_width, a.optional_non_negative("stroke-width", ErrorCode::NegativeLineWidth));
    circle.cx = cx;
    circle.cy = cy;
    circle.r = r;
    circle.fill = std::move(fill);
    circle.stroke = std::move(stroke);
    circle.stroke_width = stroke_width;
    return circle;
}

rvoe<LineElement> validate_line(const AttributeReader &a, const NamedColorTable &colors) {
    LineElement line;
    ERC(x1, a.number("x1"));
    ERC(y1, a.number("y1"));
    ERC(x2, a.number("x2"));
    ERC(y2, a.number("y2"));
    ERC(stroke, a.optional_color("stroke", colors));
    ERC(stroke_width, a.optional_non_negative("stroke-width", ErrorCode::NegativeLineWidth));
    line.x1 = x1;
    line.y1 = y1;
    line.x2 = x2;
    line.y2 = y2;
    line.stroke = std::move(stroke);
    line.stroke_width = stroke_width;
    return line;
}

rvoe<PathElement> validate_path(const AttributeReader &a, const NamedColorTable &colors) {
    PathElement path;
    ERC(d, a.optional_string("d"));
    if(!d) {
        RETERR_ATTR(MissingAttribute, a.element(), "d", "string", "nothing");
    }
    if(is_blank(*d)) {
        RETERR_ATTR(EmptyPathData, a.element(), "d", "non-empty path data", fmt::format("\"{}\"", *d));
    }
    ERC(fill, a.optional_color("fill", colors));
    ERC(stroke, a.optional_color("stroke", colors));
    ERC(stroke_width, a.optional_non_negative("stroke-width", ErrorCode::NegativeLineWidth));
    path.d = std::move(*d);
    path.fill = std::move(fill);
    path.stroke = std::move(stroke);
    path.stroke_width = stroke_width;
    return path;
}

rvoe<TextElement> validate_text(const Node &node,
                                const AttributeReader &a,
                                const NamedColorTable &colors) {
    TextElement text;
    ERC(x, a.number("x"));
    ERC(y, a.number("y"));
    ERC(font, a.optional_string("font"));
    if(!font) {
        RETERR_ATTR(MissingAttribute, a.element(), "font", "string", "nothing");
    }
    if(fontname2pdfname(*font).empty()) {
        RETERR_ATTR(EmptyString, a.element(), "font", "font name", fmt::format("\"{}\"", *font));
    }
    ERC(size, a.number("size"));
    if(size <= 0) {
        RETERR_ATTR(NonPositiveSize, a.element(), "size", "number > 0", format_number(size));
    }
    ERC(fill, a.optional_color("fill", colors));
    auto content = u8string::from_view(node.content);
    if(!content) {
        RETERR_ATTR(BadUtf8, a.element(), "content", "UTF-8 string", "invalid UTF-8");
    }
    text.x = x;
    text.y = y;
    text.font = std::move(*font);
    text.size = size;
    text.fill = std::move(fill);
    text.content = std::move(*content);
    return text;
}

rvoe<GroupElement> validate_group(const Node &node,
                                  const AttributeReader &a,
                                  const NamedColorTable &colors) {
    GroupElement group;
    ERC(transforms, a.transforms("transforms"));
    group.transforms = std::move(transforms);
    for(const auto &child : node.children) {
        ERC(e, validate_element(child, colors));
        group.children.emplace_back(std::move(e));
    }
    return group;
}

rvoe<NoReturnValue> check_tag(const Node &node) {
    if(node.tag.empty()) {
        RETERR_ATTR(MissingTag, "", "", "element tag", "empty tag");
    }
    RETOK;
}

} // namespace

rvoe<Element> validate_element(const Node &node, const NamedColorTable &colors) {
    ERCV(check_tag(node));
    AttributeReader a(node);
    const auto &tag = node.tag;
    if(tag == "rect") {
        ERCV(check_leaf(node));
        ERC(rect, validate_rect(a, colors));
        return Element{std::move(rect)};
    } else if(tag == "circle") {
        ERCV(check_leaf(node));
        ERC(circle, validate_circle(a, colors));
        return Element{std::move(circle)};
    } else if(tag == "line") {
        ERCV(check_leaf(node));
        ERC(line, validate_line(a, colors));
        return Element{std::move(line)};
    } else if(tag == "path") {
        ERCV(check_leaf(node));
        ERC(path, validate_path(a, colors));
        return Element{std::move(path)};
    } else if(tag == "text") {
        ERCV(check_leaf(node));
        ERC(text, validate_text(node, a, colors));
        return Element{std::move(text)};
    } else if(tag == "g") {
        ERC(group, validate_group(node, a, colors));
        return Element{std::move(group)};
    } else if(tag == "page") {
        ERC(page, validate_page(node, colors));
        return Element{std::move(page)};
    } else if(tag == "document") {
        ERC(doc, validate_document(node, colors));
        return Element{std::move(doc)};
    }
    RETERR_ATTR(UnimplementedElement,
                tag,
                "",
                "rect, circle, line, path, text or g",
                fmt::format("\"{}\"", tag));
}

rvoe<PageElement> validate_page(const Node &node, const NamedColorTable &colors) {
    ERCV(check_tag(node));
    if(node.tag != "page") {
        RETERR_ATTR(ChildNotPage, node.tag, "", "page", fmt::format("\"{}\"", node.tag));
    }
    AttributeReader a(node);
    PageElement page;
    ERC(width, a.optional_positive("width", ErrorCode::NonPositivePageDimension));
    ERC(height, a.optional_positive("height", ErrorCode::NonPositivePageDimension));
    ERC(margins, a.optional_margins("margins"));
    page.width = width;
    page.height = height;
    page.margins = margins;
    for(const auto &child : node.children) {
        ERC(e, validate_element(child, colors));
        page.children.emplace_back(std::move(e));
    }
    return page;
}

rvoe<DocumentElement> validate_document(const Node &node, const NamedColorTable &colors) {
    ERCV(check_tag(node));
    if(node.tag != "document") {
        RETERR_ATTR(RootNotDocument, node.tag, "", "document", fmt::format("\"{}\"", node.tag));
    }
    AttributeReader a(node);
    DocumentElement doc;
    ERC(width, a.optional_positive("width", ErrorCode::NonPositivePageDimension));
    ERC(height, a.optional_positive("height", ErrorCode::NonPositivePageDimension));
    ERC(margins, a.optional_margins("margins"));
    if(width) {
        doc.defaults.width = *width;
    }
    if(height) {
        doc.defaults.height = *height;
    }
    if(margins) {
        doc.defaults.margins = *margins;
    }
    ERC(title, a.optional_text("title"));
    ERC(author, a.optional_text("author"));
    ERC(subject, a.optional_text("subject"));
    ERC(keywords, a.optional_text("keywords"));
    ERC(creator, a.optional_text("creator"));
    ERC(producer, a.optional_text("producer"));
    doc.metadata.title = std::move(title);
    doc.metadata.author = std::move(author);
    doc.metadata.subject = std::move(subject);
    doc.metadata.keywords = std::move(keywords);
    doc.metadata.creator = std::move(creator);
    doc.metadata.producer = std::move(producer);
    for(const auto &child : node.children) {
        ERC(page, validate_page(child, colors));
        doc.pages.emplace_back(std::move(page));
    }
    return doc;
}

} // namespace hiccpdf::internal
