// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <operatoremitter.hpp>
#include <fonttable.hpp>
#include <pathdecoder.hpp>
#include <transforms.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <iterator>

namespace hiccpdf::internal {

namespace {

const double circle_bezier_factor = 0.552284749831;

}

double bezier_circle_offset(double r) { return r * circle_bezier_factor; }

std::string encode_text_string(const u8string &text) {
    if(is_ascii(text.sv())) {
        return pdfstring_quote(text.sv());
    }
    std::string encoded("<");
    auto app = std::back_inserter(encoded);
    for(const auto codepoint : text) {
        const uint32_t byte = codepoint <= 0xFF ? codepoint : uint32_t('?');
        fmt::format_to(app, "{:02X}", byte);
    }
    encoded += '>';
    return encoded;
}

rvoe<std::string> OperatorEmitter::emit(const Element &e) {
    cmds.clear();
    ERCV(draw(e));
    ERC(text, cmds.steal());
    if(!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return std::move(text);
}

rvoe<NoReturnValue> OperatorEmitter::draw(const Element &e) {
    return std::visit(overloaded{
                          [this](const RectElement &r) { return draw(r); },
                          [this](const CircleElement &c) { return draw(c); },
                          [this](const LineElement &l) { return draw(l); },
                          [this](const PathElement &p) { return draw(p); },
                          [this](const TextElement &t) { return draw(t); },
                          [this](const GroupElement &g) { return draw(g); },
                          [&e](const PageElement &) -> rvoe<NoReturnValue> {
                              RETERR_ATTR(UnimplementedElement,
                                          element_name(e),
                                          "",
                                          "drawable element",
                                          "page");
                          },
                          [&e](const DocumentElement &) -> rvoe<NoReturnValue> {
                              RETERR_ATTR(UnimplementedElement,
                                          element_name(e),
                                          "",
                                          "drawable element",
                                          "document");
                          },
                      },
                      e.e);
}

rvoe<NoReturnValue> OperatorEmitter::set_style(const std::optional<Color> &fill,
                                               const std::optional<Color> &stroke,
                                               const std::optional<double> &stroke_width) {
    if(stroke_width) {
        ERCV(cmd_w(*stroke_width));
    }
    if(fill) {
        ERC(rgb, resolve_color(*fill, colors));
        ERCV(cmd_rg(rgb));
    }
    if(stroke) {
        ERC(rgb, resolve_color(*stroke, colors));
        ERCV(cmd_RG(rgb));
    }
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::paint(bool has_fill, bool has_stroke) {
    if(has_fill && has_stroke) {
        return cmd_B();
    }
    if(has_stroke) {
        return cmd_S();
    }
    // Fill is also used when neither is given.
    return cmd_f();
}

rvoe<NoReturnValue> OperatorEmitter::draw(const RectElement &rect) {
    ERCV(set_style(rect.fill, rect.stroke, rect.stroke_width));
    ERCV(cmd_re(rect.x, rect.y, rect.width, rect.height));
    return paint(rect.fill.has_value(), rect.stroke.has_value());
}

rvoe<NoReturnValue> OperatorEmitter::draw(const CircleElement &circle) {
    const double cx = circle.cx;
    const double cy = circle.cy;
    const double r = circle.r;
    const double k = bezier_circle_offset(r);
    ERCV(set_style(circle.fill, circle.stroke, circle.stroke_width));
    ERCV(cmd_m(cx, cy + r));
    ERCV(cmd_c(cx + k, cy + r, cx + r, cy + k, cx + r, cy));
    ERCV(cmd_c(cx + r, cy - k, cx + k, cy - r, cx, cy - r));
    ERCV(cmd_c(cx - k, cy - r, cx - r, cy - k, cx - r, cy));
    ERCV(cmd_c(cx - r, cy + k, cx - k, cy + r, cx, cy + r));
    return paint(circle.fill.has_value(), circle.stroke.has_value());
}

rvoe<NoReturnValue> OperatorEmitter::draw(const LineElement &line) {
    if(line.stroke_width) {
        ERCV(cmd_w(*line.stroke_width));
    }
    DeviceRGBColor stroke_color{0, 0, 0};
    if(line.stroke) {
        ERC(rgb, resolve_color(*line.stroke, colors));
        stroke_color = rgb;
    }
    ERCV(cmd_RG(stroke_color));
    ERCV(cmd_m(line.x1, line.y1));
    ERCV(cmd_l(line.x2, line.y2));
    return cmd_S();
}

rvoe<NoReturnValue> OperatorEmitter::draw(const PathElement &path) {
    ERC(commands, decode_path(path.d));
    ERCV(set_style(path.fill, path.stroke, path.stroke_width));
    const auto ops = path_operators(commands);
    std::string_view remaining{ops};
    while(!remaining.empty()) {
        const auto line_end = remaining.find('\n');
        cmds.append(remaining.substr(0, line_end));
        if(line_end == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(line_end + 1);
    }
    return paint(path.fill.has_value(), path.stroke.has_value());
}

rvoe<NoReturnValue> OperatorEmitter::draw(const TextElement &text) {
    ERCV(cmd_BT());
    DeviceRGBColor fill_color{0, 0, 0};
    if(text.fill) {
        ERC(rgb, resolve_color(*text.fill, colors));
        fill_color = rgb;
    }
    ERCV(cmd_rg(fill_color));
    ERCV(cmd_Tf(fontname2pdfname(text.font), text.size));
    ERCV(cmd_Td(text.x, text.y));
    ERCV(cmd_Tj(text.content));
    return cmd_ET();
}

rvoe<NoReturnValue> OperatorEmitter::draw(const GroupElement &group) {
    ERCV(cmd_q());
    for(const auto &op : group.transforms) {
        ERCV(cmd_cm(transform_matrix(op)));
    }
    for(const auto &child : group.children) {
        ERCV(draw(child));
    }
    return cmd_Q();
}

rvoe<NoReturnValue> OperatorEmitter::cmd_B() {
    cmds.append("B");
    RETOK;
}

rvoe<NoReturnValue>
OperatorEmitter::cmd_c(double x1, double y1, double x2, double y2, double x3, double y3) {
    cmds.append_command(x1, y1, x2, y2, x3, y3, "c");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_cm(const PdfMatrix &m) {
    cmds.append(matrix_operator(m));
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_f() {
    cmds.append("f");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_l(double x, double y) {
    cmds.append_command(x, y, "l");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_m(double x, double y) {
    cmds.append_command(x, y, "m");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_q() { return cmds.q(); }

rvoe<NoReturnValue> OperatorEmitter::cmd_Q() { return cmds.Q(); }

rvoe<NoReturnValue> OperatorEmitter::cmd_re(double x, double y, double w, double h) {
    cmds.append_command(x, y, w, h, "re");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_rg(const DeviceRGBColor &c) {
    cmds.append_command(color_operands(c), "rg");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_RG(const DeviceRGBColor &c) {
    cmds.append_command(color_operands(c), "RG");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_S() {
    cmds.append("S");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_w(double w) {
    if(w < 0) {
        RETERR_ATTR(NegativeLineWidth, "", "stroke-width", "number >= 0", format_number(w));
    }
    cmds.append_command(w, "w");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_BT() { return cmds.BT(); }

rvoe<NoReturnValue> OperatorEmitter::cmd_ET() { return cmds.ET(); }

rvoe<NoReturnValue> OperatorEmitter::cmd_Td(double x, double y) {
    cmds.append_command(x, y, "Td");
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_Tf(std::string_view resource_name, double pointsize) {
    cmds.append(fmt::format("/{} {} Tf", resource_name, format_number(pointsize)));
    RETOK;
}

rvoe<NoReturnValue> OperatorEmitter::cmd_Tj(const u8string &text) {
    cmds.append_command(encode_text_string(text), "Tj");
    RETOK;
}

} // namespace hiccpdf::internal
