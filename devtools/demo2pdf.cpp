// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <hiccpdf.hpp>

#include <cstdio>
#include <cstring>

using hiccpdf::Node;
using hiccpdf::Rotate;
using hiccpdf::Scale;
using hiccpdf::TransformOp;
using hiccpdf::Translate;

namespace {

Node shapes_page() {
    Node page{"page", {}, {}, {}};
    page.children.push_back(Node{"rect",
                                 {{"x", 50.0},
                                  {"y", 50.0},
                                  {"width", 200.0},
                                  {"height", 100.0},
                                  {"fill", std::string{"#3366cc"}},
                                  {"stroke", std::string{"black"}},
                                  {"stroke-width", 2.0}},
                                 {},
                                 {}});
    page.children.push_back(Node{"circle",
                                 {{"cx", 400.0}, {"cy", 100.0}, {"r", 50.0}, {"fill", std::string{"yellow"}}},
                                 {},
                                 {}});
    page.children.push_back(Node{"line",
                                 {{"x1", 50.0},
                                  {"y1", 200.0},
                                  {"x2", 550.0},
                                  {"y2", 200.0},
                                  {"stroke", std::string{"red"}},
                                  {"stroke-width", 0.5}},
                                 {},
                                 {}});
    page.children.push_back(Node{"text",
                                 {{"x", 50.0},
                                  {"y", 250.0},
                                  {"font", std::string{"Times"}},
                                  {"size", 24.0}},
                                 {},
                                 "Shapes drawn from an element tree"});
    return page;
}

Node transforms_page() {
    Node group{"g",
               {{"transforms",
                 std::vector<TransformOp>{Translate{300, 300}, Rotate{30}, Scale{1.5, 1.5}}}},
               {},
               {}};
    group.children.push_back(Node{"path",
                                  {{"d", std::string{"M0 0 L100 0 L50 80 Z"}},
                                   {"fill", std::string{"green"}},
                                   {"stroke", std::string{"#000000"}}},
                                  {},
                                  {}});
    group.children.push_back(Node{"text",
                                  {{"x", 0.0},
                                   {"y", 0.0},
                                   {"font", std::string{"Courier"}},
                                   {"size", 12.0},
                                   {"fill", std::string{"magenta"}}},
                                  {},
                                  "Transformed"});
    Node page{"page", {{"width", 595.0}, {"height", 842.0}}, {}, {}};
    page.children.push_back(std::move(group));
    return page;
}

Node demo_document() {
    Node doc{"document",
             {{"title", std::string{"hiccpdf demo"}},
              {"author", std::string{"hiccpdf"}},
              {"creator", std::string{"hiccpdf-demo"}}},
             {},
             {}};
    doc.children.push_back(shapes_page());
    doc.children.push_back(transforms_page());
    return doc;
}

} // namespace

int main(int argc, char **argv) {
    if(argc == 2 && strcmp(argv[1], "--stream") == 0) {
        try {
            const auto ops = hiccpdf::content_stream(transforms_page().children.front());
            printf("%s\n", ops.c_str());
        } catch(const hiccpdf::PdfException &e) {
            fprintf(stderr, "%s\n", e.what());
            return 1;
        }
        return 0;
    }
    if(argc != 2) {
        printf("%s <pdf output>\n", argv[0]);
        printf("%s --stream\n", argv[0]);
        return 1;
    }
    try {
        hiccpdf::write_document(demo_document(), argv[1]);
    } catch(const hiccpdf::PdfException &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    return 0;
}
