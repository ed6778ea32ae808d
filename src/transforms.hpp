// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <string>

namespace hiccpdf::internal {

PdfMatrix transform_matrix(const TransformOp &op);

// "a b c d e f cm"
std::string matrix_operator(const PdfMatrix &m);

} // namespace hiccpdf::internal
