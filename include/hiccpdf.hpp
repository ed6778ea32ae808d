// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

// The functionality in this header is neither ABI nor API stable.

#include <hiccpdf_types.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hiccpdf {

class PdfException : public std::runtime_error {
public:
    PdfException(const std::string &msg,
                 ErrorCode code,
                 std::string element,
                 std::string field,
                 std::string received)
        : std::runtime_error(msg), ec{code}, element_{std::move(element)},
          field_{std::move(field)}, received_{std::move(received)} {}

    ErrorCode code() const { return ec; }
    ErrorCategory category() const;

    // Tag of the offending element, empty if not applicable.
    const std::string &element() const { return element_; }
    // Offending attribute, empty if not applicable.
    const std::string &field() const { return field_; }
    const std::string &received() const { return received_; }

private:
    ErrorCode ec;
    std::string element_;
    std::string field_;
    std::string received_;
};

struct ColorDefinition {
    std::string name;
    double r, g, b;
};

struct FontAlias {
    std::string font_name;
    std::string base_font; // One of the 14 standard fonts.
};

// Additions to the built in named colors and font names.
struct GenerationOptions {
    std::vector<ColorDefinition> colors;
    std::vector<FontAlias> fonts;
};

const char *error_text(ErrorCode ec) noexcept;
const char *category_name(ErrorCategory cat) noexcept;

// Operators for a single element tree, without a stream dictionary.
std::string content_stream(const Node &element, const GenerationOptions &opts = {});

// A complete PDF 1.4 file. The root must be a "document" node whose
// children are "page" nodes.
std::string document(const Node &doc, const GenerationOptions &opts = {});

void write_document(const Node &doc,
                    const std::filesystem::path &ofilename,
                    const GenerationOptions &opts = {});

} // namespace hiccpdf
