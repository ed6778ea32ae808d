// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <transforms.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cmath>
#include <numbers>

namespace hiccpdf::internal {

PdfMatrix transform_matrix(const TransformOp &op) {
    return std::visit(overloaded{
                          [](const Translate &t) { return PdfMatrix{1, 0, 0, 1, t.dx, t.dy}; },
                          [](const Scale &s) { return PdfMatrix{s.sx, 0, 0, s.sy, 0, 0}; },
                          [](const Rotate &r) {
                              const double rad = r.degrees * std::numbers::pi / 180.0;
                              const double c = std::cos(rad);
                              const double s = std::sin(rad);
                              return PdfMatrix{c, s, -s, c, 0, 0};
                          },
                      },
                      op);
}

std::string matrix_operator(const PdfMatrix &m) {
    return fmt::format("{} {} {} {} {} {} cm",
                       format_number(m.a),
                       format_number(m.b),
                       format_number(m.c),
                       format_number(m.d),
                       format_number(m.e),
                       format_number(m.f));
}

} // namespace hiccpdf::internal
