// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <pageprocessor.hpp>
#include <coordinatemapper.hpp>
#include <fonttable.hpp>
#include <operatoremitter.hpp>

namespace hiccpdf::internal {

namespace {

bool uses_transforms(const Element &e) {
    if(const auto *g = std::get_if<GroupElement>(&e.e)) {
        if(!g->transforms.empty()) {
            return true;
        }
        for(const auto &child : g->children) {
            if(uses_transforms(child)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

DocumentDefaults resolve_page_attributes(const PageElement &page, const DocumentDefaults &defaults) {
    DocumentDefaults resolved = defaults;
    if(page.width) {
        resolved.width = *page.width;
    }
    if(page.height) {
        resolved.height = *page.height;
    }
    if(page.margins) {
        resolved.margins = *page.margins;
    }
    return resolved;
}

rvoe<PageResult> process_page(const PageElement &page,
                              const DocumentDefaults &defaults,
                              const NamedColorTable &colors) {
    const auto attrs = resolve_page_attributes(page, defaults);
    PageResult result{attrs.width, attrs.height, attrs.margins, {}, {}};
    OperatorEmitter emitter(colors);
    for(const auto &child : page.children) {
        const auto mapped = map_element(child, attrs.height, attrs.margins);
        ERC(ops, emitter.emit(mapped));
        if(!result.content_stream.empty()) {
            result.content_stream += '\n';
        }
        result.content_stream += ops;
        if(uses_transforms(child)) {
            result.metadata.has_transforms = true;
        }
    }
    result.metadata.element_count = page.children.size();
    result.metadata.fonts = scan_font_resources(result.content_stream);
    return result;
}

} // namespace hiccpdf::internal
