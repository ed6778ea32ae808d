// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <pdfcommon.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hiccpdf::internal {

struct MoveTo {
    Point p;
};

struct LineTo {
    Point p;
};

struct CurveTo {
    Point c1;
    Point c2;
    Point p;
};

struct ClosePath {};

typedef std::variant<MoveTo, LineTo, CurveTo, ClosePath> PathCommand;

// Decodes SVG path data into absolute commands. Only M, L, C and Z are
// understood, in both cases. Lower case commands are relative to the
// current point. Runs with other command letters or with too few numbers
// are skipped.
rvoe<std::vector<PathCommand>> decode_path(std::string_view d);

// One operator per line, without a trailing newline.
std::string path_operators(const std::vector<PathCommand> &commands);

} // namespace hiccpdf::internal
