// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <elements.hpp>

namespace hiccpdf::internal {

// Converts top-left origin coordinates to PDF page space where y grows
// upwards. Path data is left as is. Margins do not move content, they
// only change the page's MediaBox.
Element map_element(const Element &e, double page_height, const Margins &margins);

inline double map_y(double page_height, double y) { return page_height - y; }

} // namespace hiccpdf::internal
