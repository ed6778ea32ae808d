// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <elements.hpp>
#include <colorresolver.hpp>
#include <commandstreamformatter.hpp>

#include <optional>
#include <string>

namespace hiccpdf::internal {

// Control point distance for a quarter circle drawn as one cubic Bézier.
double bezier_circle_offset(double r);

// Literal string for ASCII text, otherwise a hex string of Latin-1 bytes
// where code points that do not fit become '?'.
std::string encode_text_string(const u8string &text);

// Turns typed elements into content stream operators. Coordinates are
// written as given, mapping to page space happens before this.
class OperatorEmitter {
public:
    explicit OperatorEmitter(const NamedColorTable &colors) : colors{colors} {}

    // Operator text for one element, no trailing newline.
    rvoe<std::string> emit(const Element &e);

    rvoe<NoReturnValue> cmd_B();
    rvoe<NoReturnValue> cmd_c(double x1, double y1, double x2, double y2, double x3, double y3);
    rvoe<NoReturnValue> cmd_cm(const PdfMatrix &m);
    rvoe<NoReturnValue> cmd_f();
    rvoe<NoReturnValue> cmd_l(double x, double y);
    rvoe<NoReturnValue> cmd_m(double x, double y);
    rvoe<NoReturnValue> cmd_q();
    rvoe<NoReturnValue> cmd_Q();
    rvoe<NoReturnValue> cmd_re(double x, double y, double w, double h);
    rvoe<NoReturnValue> cmd_rg(const DeviceRGBColor &c);
    rvoe<NoReturnValue> cmd_RG(const DeviceRGBColor &c);
    rvoe<NoReturnValue> cmd_S();
    rvoe<NoReturnValue> cmd_w(double w);

    rvoe<NoReturnValue> cmd_BT();
    rvoe<NoReturnValue> cmd_ET();
    rvoe<NoReturnValue> cmd_Td(double x, double y);
    rvoe<NoReturnValue> cmd_Tf(std::string_view resource_name, double pointsize);
    rvoe<NoReturnValue> cmd_Tj(const u8string &text);

private:
    rvoe<NoReturnValue> draw(const Element &e);
    rvoe<NoReturnValue> draw(const RectElement &rect);
    rvoe<NoReturnValue> draw(const CircleElement &circle);
    rvoe<NoReturnValue> draw(const LineElement &line);
    rvoe<NoReturnValue> draw(const PathElement &path);
    rvoe<NoReturnValue> draw(const TextElement &text);
    rvoe<NoReturnValue> draw(const GroupElement &group);

    rvoe<NoReturnValue> set_style(const std::optional<Color> &fill,
                                  const std::optional<Color> &stroke,
                                  const std::optional<double> &stroke_width);
    rvoe<NoReturnValue> paint(bool has_fill, bool has_stroke);

    const NamedColorTable &colors;
    CommandStreamFormatter cmds;
};

} // namespace hiccpdf::internal
