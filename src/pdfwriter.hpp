// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdio>
#include <filesystem>
#include <string_view>

namespace hiccpdf::internal {

// Writes finished PDF text to disk. The data goes to a temporary file
// next to the target which is renamed over it once fully synced.
class PdfWriter {
public:
    explicit PdfWriter(std::string_view pdf_text) : pdf_text{pdf_text} {}

    rvoe<NoReturnValue> write_to_file(const std::filesystem::path &ofilename);

private:
    rvoe<NoReturnValue> write_bytes(FILE *ofile, const char *buf, size_t buf_size);

    std::string_view pdf_text;
};

} // namespace hiccpdf::internal
