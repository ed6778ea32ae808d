// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <coordinatemapper.hpp>
#include <utils.hpp>

namespace hiccpdf::internal {

namespace {

std::vector<TransformOp> map_transforms(const std::vector<TransformOp> &ops, double page_height) {
    std::vector<TransformOp> mapped;
    mapped.reserve(ops.size());
    for(const auto &op : ops) {
        if(auto *t = std::get_if<Translate>(&op)) {
            mapped.emplace_back(Translate{t->dx, map_y(page_height, t->dy)});
        } else {
            mapped.push_back(op);
        }
    }
    return mapped;
}

} // namespace

Element map_element(const Element &e, double page_height, const Margins &margins) {
    return std::visit(
        overloaded{
            [&](const RectElement &r) {
                auto mapped = r;
                mapped.y = page_height - r.y - r.height;
                return Element{std::move(mapped)};
            },
            [&](const CircleElement &c) {
                auto mapped = c;
                mapped.cy = map_y(page_height, c.cy);
                return Element{std::move(mapped)};
            },
            [&](const LineElement &l) {
                auto mapped = l;
                mapped.y1 = map_y(page_height, l.y1);
                mapped.y2 = map_y(page_height, l.y2);
                return Element{std::move(mapped)};
            },
            [&](const TextElement &t) {
                auto mapped = t;
                mapped.y = map_y(page_height, t.y);
                return Element{std::move(mapped)};
            },
            [&](const GroupElement &g) {
                GroupElement mapped;
                mapped.transforms = map_transforms(g.transforms, page_height);
                mapped.children.reserve(g.children.size());
                for(const auto &child : g.children) {
                    mapped.children.push_back(map_element(child, page_height, margins));
                }
                return Element{std::move(mapped)};
            },
            [&](const auto &unchanged) { return Element{unchanged}; },
        },
        e.e);
}

} // namespace hiccpdf::internal
