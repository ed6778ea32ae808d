// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <documentassembler.hpp>
#include <objectformatter.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <iterator>

namespace hiccpdf::internal {

namespace {

const char pdf_header[] = "%PDF-1.4\n";

void add_info_entry(ObjectFormatter &fmt, const char *key, const std::optional<u8string> &value) {
    if(value) {
        fmt.add_token(key);
        fmt.add_pdfstring(*value);
    }
}

} // namespace

ObjectNumbering number_objects(size_t num_fonts, size_t num_pages, bool has_info) {
    ObjectNumbering n;
    n.catalog = 1;
    n.first_font = n.catalog + 1;
    n.first_content = n.first_font + int32_t(num_fonts);
    n.first_page = n.first_content + int32_t(num_pages);
    n.pages_root = n.first_page + int32_t(num_pages);
    n.last = n.pages_root;
    if(has_info) {
        n.info = n.pages_root + 1;
        n.last = *n.info;
    }
    return n;
}

rvoe<NoReturnValue> verify_object_offsets(std::string_view pdf, const std::vector<size_t> &offsets) {
    for(size_t i = 0; i < offsets.size(); ++i) {
        const auto expected = fmt::format("{} 0 obj", i + 1);
        const auto offset = offsets[i];
        if(offset > pdf.size() || pdf.substr(offset, expected.size()) != expected) {
            RETERR_ATTR(OffsetMismatch,
                        "",
                        "",
                        expected,
                        fmt::format("offset {} of a {} byte file", offset, pdf.size()));
        }
    }
    RETOK;
}

DocumentAssembler::DocumentAssembler(const DocumentMetadata &metadata,
                                     const std::vector<PageResult> &pages,
                                     const FontTable &fonts)
    : metadata{metadata}, pages{pages}, fonts{fonts} {}

rvoe<std::string> DocumentAssembler::assemble() {
    font_names.clear();
    page_fonts.clear();
    offsets.clear();
    buf.clear();

    for(const auto &page : pages) {
        auto used = scan_font_resources(page.content_stream);
        for(const auto &name : used) {
            if(std::find(font_names.begin(), font_names.end(), name) == font_names.end()) {
                font_names.push_back(name);
            }
        }
        page_fonts.emplace_back(std::move(used));
    }
    numbers = number_objects(font_names.size(), pages.size(), !metadata.empty());

    buf += pdf_header;
    ERCV(write_object(numbers.catalog, catalog_object()));
    for(const auto &name : font_names) {
        ERCV(write_object(font_object_number(name), font_object(name)));
    }
    for(size_t i = 0; i < pages.size(); ++i) {
        ERCV(write_object(numbers.content(i), content_object(pages[i])));
    }
    for(size_t i = 0; i < pages.size(); ++i) {
        ERCV(write_object(numbers.page(i), page_object(pages[i], i)));
    }
    ERCV(write_object(numbers.pages_root, pages_root_object()));
    if(numbers.info) {
        ERCV(write_object(*numbers.info, info_object()));
    }

    const size_t xref_offset = buf.size();
    write_cross_reference_table();
    write_trailer(xref_offset);

    ERCV(verify_object_offsets(buf, offsets));
    std::string result = std::move(buf);
    buf.clear();
    return result;
}

rvoe<NoReturnValue> DocumentAssembler::write_object(int32_t object_number, std::string_view body) {
    if(object_number != int32_t(offsets.size()) + 1) {
        RETERR_ATTR(ObjectNumberMismatch,
                    "",
                    "",
                    fmt::format("{}", offsets.size() + 1),
                    fmt::format("{}", object_number));
    }
    offsets.push_back(buf.size());
    auto app = std::back_inserter(buf);
    fmt::format_to(app, "{} 0 obj\n", object_number);
    buf += body;
    if(buf.back() != '\n') {
        buf += '\n';
    }
    buf += "endobj\n";
    RETOK;
}

std::string DocumentAssembler::catalog_object() const {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Catalog");
    fmt.add_token("/Pages");
    fmt.add_object_ref(numbers.pages_root);
    fmt.end_dict();
    return fmt.steal();
}

std::string DocumentAssembler::font_object(const std::string &resource_name) const {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Font");
    fmt.add_token_pair("/Subtype", "/Type1");
    fmt.add_token("/BaseFont");
    fmt.add_token_with_slash(fonts.base_font(resource_name));
    fmt.add_token_pair("/Encoding", "/WinAnsiEncoding");
    fmt.end_dict();
    return fmt.steal();
}

std::string DocumentAssembler::content_object(const PageResult &page) const {
    // The newline before endstream is part of the stream data.
    const auto stream_data = page.content_stream + '\n';
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Length", stream_data.size());
    fmt.end_dict();
    auto body = fmt.steal();
    body += "stream\n";
    body += stream_data;
    body += "endstream\n";
    return body;
}

std::string DocumentAssembler::page_object(const PageResult &page, size_t page_index) const {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Page");
    fmt.add_token("/Parent");
    fmt.add_object_ref(numbers.pages_root);
    fmt.add_token("/MediaBox");
    fmt.begin_array();
    fmt.add_token(page.margins.left);
    fmt.add_token(page.margins.bottom);
    fmt.add_token(page.width);
    fmt.add_token(page.height);
    fmt.end_array();
    fmt.add_token("/Resources");
    fmt.begin_dict();
    const auto &used = page_fonts.at(page_index);
    if(!used.empty()) {
        fmt.add_token("/Font");
        fmt.begin_dict();
        for(const auto &name : used) {
            fmt.add_token_with_slash(name);
            fmt.add_object_ref(font_object_number(name));
        }
        fmt.end_dict();
    }
    fmt.end_dict();
    fmt.add_token("/Contents");
    fmt.add_object_ref(numbers.content(page_index));
    fmt.end_dict();
    return fmt.steal();
}

std::string DocumentAssembler::pages_root_object() const {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Pages");
    fmt.add_token("/Kids");
    fmt.begin_array();
    for(size_t i = 0; i < pages.size(); ++i) {
        fmt.add_object_ref(numbers.page(i));
    }
    fmt.end_array();
    fmt.add_token_pair("/Count", pages.size());
    fmt.end_dict();
    return fmt.steal();
}

std::string DocumentAssembler::info_object() const {
    ObjectFormatter fmt;
    fmt.begin_dict();
    add_info_entry(fmt, "/Title", metadata.title);
    add_info_entry(fmt, "/Author", metadata.author);
    add_info_entry(fmt, "/Subject", metadata.subject);
    add_info_entry(fmt, "/Keywords", metadata.keywords);
    add_info_entry(fmt, "/Creator", metadata.creator);
    add_info_entry(fmt, "/Producer", metadata.producer);
    fmt.end_dict();
    return fmt.steal();
}

void DocumentAssembler::write_cross_reference_table() {
    auto app = std::back_inserter(buf);
    fmt::format_to(app,
                   R"(xref
0 {}
)",
                   offsets.size() + 1);
    buf += "0000000000 65535 f \n"; // The end of line whitespace is significant.
    for(const auto offset : offsets) {
        fmt::format_to(app, "{:010} 00000 n \n", offset);
    }
}

void DocumentAssembler::write_trailer(size_t xref_offset) {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Size", offsets.size() + 1);
    fmt.add_token("/Root");
    fmt.add_object_ref(numbers.catalog);
    if(numbers.info) {
        fmt.add_token("/Info");
        fmt.add_object_ref(*numbers.info);
    }
    fmt.end_dict();
    buf += "trailer\n";
    buf += fmt.steal();
    fmt::format_to(std::back_inserter(buf),
                   R"(startxref
{}
%%EOF
)",
                   xref_offset);
}

int32_t DocumentAssembler::font_object_number(std::string_view resource_name) const {
    auto it = std::find(font_names.begin(), font_names.end(), resource_name);
    return numbers.font(size_t(std::distance(font_names.begin(), it)));
}

rvoe<std::string> assemble(const DocumentMetadata &metadata,
                           const std::vector<PageResult> &pages,
                           const FontTable &fonts) {
    DocumentAssembler assembler(metadata, pages, fonts);
    return assembler.assemble();
}

} // namespace hiccpdf::internal
