// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <elements.hpp>
#include <colorresolver.hpp>

namespace hiccpdf::internal {

// Checks the tag, attribute types and ranges of a node and its
// descendants. Failures name the element and attribute at fault.
rvoe<Element> validate_element(const Node &node, const NamedColorTable &colors);

rvoe<PageElement> validate_page(const Node &node, const NamedColorTable &colors);

// The root must be a document whose children are all pages.
rvoe<DocumentElement> validate_document(const Node &node, const NamedColorTable &colors);

} // namespace hiccpdf::internal
