// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <gtest/gtest.h>

#include <validation.hpp>

#include <cmath>
#include <limits>

using namespace hiccpdf::internal;

namespace {

Node rect_node() {
    return Node{"rect", {{"x", 10.0}, {"y", 20.0}, {"width", 100.0}, {"height", 50.0}}, {}, {}};
}

Node text_node(std::string content) {
    return Node{"text",
                {{"x", 100.0}, {"y", 700.0}, {"font", std::string{"Helvetica"}}, {"size", 12.0}},
                {},
                std::move(content)};
}

class ValidationTest : public ::testing::Test {
protected:
    PdfError element_error(const Node &n) {
        auto rc = validate_element(n, colors);
        EXPECT_FALSE(rc) << n.tag;
        return rc ? PdfError{} : rc.error();
    }

    PdfError document_error(const Node &n) {
        auto rc = validate_document(n, colors);
        EXPECT_FALSE(rc) << n.tag;
        return rc ? PdfError{} : rc.error();
    }

    NamedColorTable colors;
};

} // namespace

TEST_F(ValidationTest, Rect) {
    auto n = rect_node();
    n.attrs["fill"] = std::string{"red"};
    n.attrs["stroke-width"] = 2.0;
    auto rc = validate_element(n, colors);
    ASSERT_TRUE(rc) << describe(rc.error());
    const auto &r = std::get<RectElement>(rc->e);
    EXPECT_EQ(r.x, 10);
    EXPECT_EQ(r.height, 50);
    ASSERT_TRUE(r.fill);
    EXPECT_EQ(std::get<NamedColor>(*r.fill).name, "red");
    EXPECT_FALSE(r.stroke);
    EXPECT_EQ(r.stroke_width, 2.0);
}

TEST_F(ValidationTest, MissingAttribute) {
    auto n = rect_node();
    n.attrs.erase("height");
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::MissingAttribute);
    EXPECT_EQ(e.element, "rect");
    EXPECT_EQ(e.field, "height");
    EXPECT_EQ(error_category(e.code), ErrorCategory::AttributeValidation);
}

TEST_F(ValidationTest, WrongAttributeType) {
    auto n = rect_node();
    n.attrs["x"] = std::string{"10"};
    auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::WrongAttributeType);
    EXPECT_EQ(e.field, "x");
    EXPECT_EQ(e.expected, "number");
    EXPECT_EQ(e.received, "\"10\"");

    auto c = Node{"circle", {{"cx", 1.0}, {"cy", 1.0}, {"r", 1.0}, {"fill", 3.0}}, {}, {}};
    e = element_error(c);
    EXPECT_EQ(e.code, ErrorCode::WrongAttributeType);
    EXPECT_EQ(e.field, "fill");
    EXPECT_EQ(e.received, "3");
}

TEST_F(ValidationTest, NotFinite) {
    auto n = rect_node();
    n.attrs["width"] = std::numeric_limits<double>::infinity();
    auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::NotFiniteNumber);
    EXPECT_EQ(e.field, "width");

    n = rect_node();
    n.attrs["y"] = std::nan("");
    EXPECT_EQ(element_error(n).code, ErrorCode::NotFiniteNumber);
}

TEST_F(ValidationTest, NegativeRadius) {
    auto ok = Node{"circle", {{"cx", 1.0}, {"cy", 1.0}, {"r", 0.0}}, {}, {}};
    EXPECT_TRUE(validate_element(ok, colors));

    auto n = Node{"circle", {{"cx", 1.0}, {"cy", 1.0}, {"r", -5.0}}, {}, {}};
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::NegativeRadius);
    EXPECT_EQ(e.element, "circle");
    EXPECT_EQ(e.field, "r");
    EXPECT_EQ(e.received, "-5");
}

TEST_F(ValidationTest, NegativeLineWidth) {
    auto n = Node{"line",
                  {{"x1", 0.0}, {"y1", 0.0}, {"x2", 1.0}, {"y2", 1.0}, {"stroke-width", -0.5}},
                  {},
                  {}};
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::NegativeLineWidth);
    EXPECT_EQ(e.field, "stroke-width");
}

TEST_F(ValidationTest, Text) {
    auto rc = validate_element(text_node("Hello"), colors);
    ASSERT_TRUE(rc);
    const auto &t = std::get<TextElement>(rc->e);
    EXPECT_EQ(t.font, "Helvetica");
    EXPECT_EQ(t.size, 12);
    EXPECT_EQ(t.content.sv(), "Hello");
    EXPECT_FALSE(t.fill);
}

TEST_F(ValidationTest, TextSize) {
    auto n = text_node("x");
    n.attrs["size"] = 0.0;
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::NonPositiveSize);
    EXPECT_EQ(e.field, "size");
}

TEST_F(ValidationTest, TextFont) {
    auto n = text_node("x");
    n.attrs.erase("font");
    EXPECT_EQ(element_error(n).code, ErrorCode::MissingAttribute);

    n.attrs["font"] = std::string{"  /()  "};
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::EmptyString);
    EXPECT_EQ(e.field, "font");
}

TEST_F(ValidationTest, TextUtf8) {
    const auto e = element_error(text_node("bad \xff byte"));
    EXPECT_EQ(e.code, ErrorCode::BadUtf8);
    EXPECT_EQ(e.element, "text");
    EXPECT_EQ(e.field, "content");
}

TEST_F(ValidationTest, BadColor) {
    auto n = rect_node();
    n.attrs["stroke"] = std::string{"purple"};
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::BadColor);
    EXPECT_EQ(e.element, "rect");
    EXPECT_EQ(e.field, "stroke");
    EXPECT_EQ(error_category(e.code), ErrorCategory::UnresolvableColor);
}

TEST_F(ValidationTest, Path) {
    auto n = Node{"path", {{"d", std::string{"M0 0 L1 1"}}}, {}, {}};
    auto rc = validate_element(n, colors);
    ASSERT_TRUE(rc);
    EXPECT_EQ(std::get<PathElement>(rc->e).d, "M0 0 L1 1");

    n.attrs["d"] = std::string{"   "};
    auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::EmptyPathData);
    EXPECT_EQ(e.field, "d");

    n.attrs.erase("d");
    e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::MissingAttribute);
    EXPECT_EQ(e.field, "d");
}

TEST_F(ValidationTest, LeafWithChildren) {
    auto n = rect_node();
    n.children.push_back(rect_node());
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::LeafHasChildren);
    EXPECT_EQ(e.element, "rect");
    EXPECT_EQ(error_category(e.code), ErrorCategory::Structural);
}

TEST_F(ValidationTest, TagProblems) {
    auto e = element_error(Node{"", {}, {}, {}});
    EXPECT_EQ(e.code, ErrorCode::MissingTag);

    e = element_error(Node{"ellipse", {}, {}, {}});
    EXPECT_EQ(e.code, ErrorCode::UnimplementedElement);
    EXPECT_EQ(e.element, "ellipse");
    EXPECT_EQ(error_category(e.code), ErrorCategory::UnsupportedElement);
}

TEST_F(ValidationTest, GroupRecursion) {
    auto inner = Node{"g", {}, {rect_node()}, {}};
    auto outer = Node{"g",
                      {{"transforms", std::vector<TransformOp>{Translate{1, 2}, Rotate{90}}}},
                      {inner, text_node("hi")},
                      {}};
    auto rc = validate_element(outer, colors);
    ASSERT_TRUE(rc) << describe(rc.error());
    const auto &g = std::get<GroupElement>(rc->e);
    EXPECT_EQ(g.transforms.size(), 2u);
    ASSERT_EQ(g.children.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<GroupElement>(g.children[0].e));
    EXPECT_TRUE(std::holds_alternative<TextElement>(g.children[1].e));

    auto bad_child = rect_node();
    bad_child.attrs["fill"] = std::string{"#12"};
    auto broken = Node{"g", {}, {Node{"g", {}, {bad_child}, {}}}, {}};
    const auto e = element_error(broken);
    EXPECT_EQ(e.code, ErrorCode::BadColor);
    EXPECT_EQ(e.element, "rect");
}

TEST_F(ValidationTest, GroupTransformsType) {
    auto n = Node{"g", {{"transforms", 45.0}}, {}, {}};
    const auto e = element_error(n);
    EXPECT_EQ(e.code, ErrorCode::WrongAttributeType);
    EXPECT_EQ(e.field, "transforms");
}

TEST_F(ValidationTest, DocumentDefaults) {
    auto doc = Node{"document", {}, {Node{"page", {}, {}, {}}}, {}};
    auto rc = validate_document(doc, colors);
    ASSERT_TRUE(rc);
    EXPECT_EQ(rc->defaults.width, 612);
    EXPECT_EQ(rc->defaults.height, 792);
    EXPECT_EQ(rc->defaults.margins, Margins{});
    EXPECT_TRUE(rc->metadata.empty());
    ASSERT_EQ(rc->pages.size(), 1u);
    EXPECT_FALSE(rc->pages[0].width);
}

TEST_F(ValidationTest, DocumentAttributes) {
    auto doc = Node{"document",
                    {{"width", 595.0},
                     {"height", 842.0},
                     {"margins", std::vector<double>{72, 36, 72, 36}},
                     {"title", std::string{"Report"}},
                     {"author", std::string{"J. Doe"}}},
                    {Node{"page", {{"width", 842.0}}, {rect_node()}, {}}},
                    {}};
    auto rc = validate_document(doc, colors);
    ASSERT_TRUE(rc) << describe(rc.error());
    EXPECT_EQ(rc->defaults.width, 595);
    EXPECT_EQ(rc->defaults.height, 842);
    EXPECT_EQ(rc->defaults.margins, (Margins{72, 36, 72, 36}));
    ASSERT_TRUE(rc->metadata.title);
    EXPECT_EQ(rc->metadata.title->sv(), "Report");
    EXPECT_EQ(rc->metadata.author->sv(), "J. Doe");
    EXPECT_FALSE(rc->metadata.subject);
    EXPECT_EQ(rc->pages[0].width, 842.0);
    EXPECT_EQ(rc->pages[0].children.size(), 1u);
}

TEST_F(ValidationTest, Margins) {
    auto doc = Node{"document", {{"margins", std::vector<double>{1, 2, 3}}}, {}, {}};
    auto e = document_error(doc);
    EXPECT_EQ(e.code, ErrorCode::WrongMarginCount);
    EXPECT_EQ(e.field, "margins");
    EXPECT_EQ(e.received, "a list of 3 numbers");

    doc.attrs["margins"] = std::vector<double>{1, -2, 3, 4};
    EXPECT_EQ(document_error(doc).code, ErrorCode::NegativeMargin);

    doc.attrs["margins"] = 10.0;
    EXPECT_EQ(document_error(doc).code, ErrorCode::WrongAttributeType);
}

TEST_F(ValidationTest, PageDimensions) {
    auto doc = Node{"document", {{"height", 0.0}}, {}, {}};
    auto e = document_error(doc);
    EXPECT_EQ(e.code, ErrorCode::NonPositivePageDimension);
    EXPECT_EQ(e.element, "document");
    EXPECT_EQ(e.field, "height");

    auto page_doc = Node{"document", {}, {Node{"page", {{"width", -10.0}}, {}, {}}}, {}};
    e = document_error(page_doc);
    EXPECT_EQ(e.code, ErrorCode::NonPositivePageDimension);
    EXPECT_EQ(e.element, "page");
    EXPECT_EQ(e.field, "width");
}

TEST_F(ValidationTest, BlankMetadata) {
    auto doc = Node{"document", {{"subject", std::string{"  "}}}, {}, {}};
    const auto e = document_error(doc);
    EXPECT_EQ(e.code, ErrorCode::EmptyString);
    EXPECT_EQ(e.field, "subject");
}

TEST_F(ValidationTest, DocumentStructure) {
    auto e = document_error(Node{"page", {}, {}, {}});
    EXPECT_EQ(e.code, ErrorCode::RootNotDocument);
    EXPECT_EQ(e.received, "\"page\"");

    e = document_error(Node{"document", {}, {rect_node()}, {}});
    EXPECT_EQ(e.code, ErrorCode::ChildNotPage);
    EXPECT_EQ(e.element, "rect");
    EXPECT_EQ(error_category(e.code), ErrorCategory::Structural);
}

TEST_F(ValidationTest, ErrorsInsidePages) {
    auto doc = Node{"document",
                    {},
                    {Node{"page", {}, {}, {}}, Node{"page", {}, {Node{"circle", {}, {}, {}}}, {}}},
                    {}};
    const auto e = document_error(doc);
    EXPECT_EQ(e.code, ErrorCode::MissingAttribute);
    EXPECT_EQ(e.element, "circle");
    EXPECT_EQ(e.field, "cx");
}

TEST_F(ValidationTest, CustomColors) {
    colors.add("orange", DeviceRGBColor{1, 0.5, 0});
    auto n = rect_node();
    n.attrs["fill"] = std::string{"orange"};
    EXPECT_TRUE(validate_element(n, colors));
}

TEST_F(ValidationTest, DescribeMentionsContext) {
    auto n = rect_node();
    n.attrs["stroke-width"] = -1.0;
    const auto text = describe(element_error(n));
    EXPECT_NE(text.find("rect"), std::string::npos);
    EXPECT_NE(text.find("stroke-width"), std::string::npos);
}
