// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <hiccpdf.hpp>
#include <documentassembler.hpp>
#include <fonttable.hpp>
#include <operatoremitter.hpp>
#include <pageprocessor.hpp>
#include <pdfwriter.hpp>
#include <validation.hpp>

namespace hiccpdf {

namespace {

struct GenerationTables {
    internal::NamedColorTable colors;
    internal::FontTable fonts;
};

internal::rvoe<GenerationTables> build_tables(const GenerationOptions &opts) {
    GenerationTables tables;
    for(const auto &c : opts.colors) {
        ERC(rgb, internal::rgb_from_channels(c.r, c.g, c.b));
        tables.colors.add(c.name, rgb);
    }
    for(const auto &f : opts.fonts) {
        ERCV(tables.fonts.add_alias(f.font_name, f.base_font));
    }
    return tables;
}

[[noreturn]] void throw_error(const internal::PdfError &e) {
    throw PdfException(internal::describe(e), e.code, e.element, e.field, e.received);
}

template<typename T> T unwrap(internal::rvoe<T> &&rc) {
    if(!rc) {
        throw_error(rc.error());
    }
    return std::move(*rc);
}

internal::rvoe<std::string> generate_document(const Node &doc, const GenerationTables &tables) {
    ERC(validated, internal::validate_document(doc, tables.colors));
    std::vector<internal::PageResult> pages;
    pages.reserve(validated.pages.size());
    for(const auto &page : validated.pages) {
        ERC(result, internal::process_page(page, validated.defaults, tables.colors));
        pages.emplace_back(std::move(result));
    }
    return internal::assemble(validated.metadata, pages, tables.fonts);
}

} // namespace

ErrorCategory PdfException::category() const { return internal::error_category(ec); }

const char *error_text(ErrorCode ec) noexcept { return internal::error_text(ec); }

const char *category_name(ErrorCategory cat) noexcept { return internal::category_name(cat); }

std::string content_stream(const Node &element, const GenerationOptions &opts) {
    const auto tables = unwrap(build_tables(opts));
    auto validated = unwrap(internal::validate_element(element, tables.colors));
    internal::OperatorEmitter emitter(tables.colors);
    return unwrap(emitter.emit(validated));
}

std::string document(const Node &doc, const GenerationOptions &opts) {
    const auto tables = unwrap(build_tables(opts));
    return unwrap(generate_document(doc, tables));
}

void write_document(const Node &doc,
                    const std::filesystem::path &ofilename,
                    const GenerationOptions &opts) {
    const auto pdf = document(doc, opts);
    internal::PdfWriter writer(pdf);
    unwrap(writer.write_to_file(ofilename));
}

} // namespace hiccpdf
