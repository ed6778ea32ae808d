// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <elements.hpp>
#include <fonttable.hpp>
#include <pageprocessor.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hiccpdf::internal {

// Object numbers in file order. Object 0 is the free list head and
// is not counted in `last`.
struct ObjectNumbering {
    int32_t catalog = 1;
    int32_t first_font = 2;
    int32_t first_content = 2;
    int32_t first_page = 2;
    int32_t pages_root = 2;
    std::optional<int32_t> info;
    int32_t last = 2;

    int32_t font(size_t i) const { return first_font + int32_t(i); }
    int32_t content(size_t i) const { return first_content + int32_t(i); }
    int32_t page(size_t i) const { return first_page + int32_t(i); }
};

ObjectNumbering number_objects(size_t num_fonts, size_t num_pages, bool has_info);

// Checks that "N 0 obj" starts at offsets[N-1] for every object.
rvoe<NoReturnValue> verify_object_offsets(std::string_view pdf, const std::vector<size_t> &offsets);

class DocumentAssembler {
public:
    DocumentAssembler(const DocumentMetadata &metadata,
                      const std::vector<PageResult> &pages,
                      const FontTable &fonts);

    rvoe<std::string> assemble();

    // Valid after a successful assemble().
    const std::vector<size_t> &object_offsets() const { return offsets; }
    const std::vector<std::string> &font_resources() const { return font_names; }

private:
    rvoe<NoReturnValue> write_object(int32_t object_number, std::string_view body);

    std::string catalog_object() const;
    std::string font_object(const std::string &resource_name) const;
    std::string content_object(const PageResult &page) const;
    std::string page_object(const PageResult &page, size_t page_index) const;
    std::string pages_root_object() const;
    std::string info_object() const;

    void write_cross_reference_table();
    void write_trailer(size_t xref_offset);

    int32_t font_object_number(std::string_view resource_name) const;

    const DocumentMetadata &metadata;
    const std::vector<PageResult> &pages;
    const FontTable &fonts;

    std::vector<std::string> font_names;
    std::vector<std::vector<std::string>> page_fonts;
    ObjectNumbering numbers;
    std::vector<size_t> offsets;
    std::string buf;
};

rvoe<std::string> assemble(const DocumentMetadata &metadata,
                           const std::vector<PageResult> &pages,
                           const FontTable &fonts);

} // namespace hiccpdf::internal
