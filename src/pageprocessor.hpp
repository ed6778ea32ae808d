// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <elements.hpp>
#include <colorresolver.hpp>

#include <string>
#include <vector>

namespace hiccpdf::internal {

struct PageMetadata {
    size_t element_count = 0;
    bool has_transforms = false;
    // Resource names in order of first use.
    std::vector<std::string> fonts;
};

struct PageResult {
    double width;
    double height;
    Margins margins;
    std::string content_stream;
    PageMetadata metadata;
};

// Page values win over document defaults when present.
DocumentDefaults resolve_page_attributes(const PageElement &page, const DocumentDefaults &defaults);

rvoe<PageResult> process_page(const PageElement &page,
                              const DocumentDefaults &defaults,
                              const NamedColorTable &colors);

} // namespace hiccpdf::internal
