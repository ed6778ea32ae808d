// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <commandstreamformatter.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <iterator>

namespace hiccpdf::internal {

CommandStreamFormatter::CommandStreamFormatter() {}

void CommandStreamFormatter::append(std::string_view line_of_text) {
    if(!line_of_text.empty()) {
        buf += lead;
        buf += line_of_text;
        if(buf.back() != '\n') {
            buf += '\n';
        }
    }
}

void CommandStreamFormatter::append_command(std::string_view arg, const char *command) {
    buf += lead;
    buf += arg;
    buf += ' ';
    buf += command;
    buf += '\n';
}

void CommandStreamFormatter::append_command(double arg, const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{} {}\n", lead, format_number(arg), command);
}

void CommandStreamFormatter::append_command(double arg1, double arg2, const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{} {} {}\n",
                   lead,
                   format_number(arg1),
                   format_number(arg2),
                   command);
}

void CommandStreamFormatter::append_command(
    double arg1, double arg2, double arg3, double arg4, const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{} {} {} {} {}\n",
                   lead,
                   format_number(arg1),
                   format_number(arg2),
                   format_number(arg3),
                   format_number(arg4),
                   command);
}

void CommandStreamFormatter::append_command(double arg1,
                                            double arg2,
                                            double arg3,
                                            double arg4,
                                            double arg5,
                                            double arg6,
                                            const char *command) {
    fmt::format_to(std::back_inserter(buf),
                   "{}{} {} {} {} {} {} {}\n",
                   lead,
                   format_number(arg1),
                   format_number(arg2),
                   format_number(arg3),
                   format_number(arg4),
                   format_number(arg5),
                   format_number(arg6),
                   command);
}

rvoe<NoReturnValue> CommandStreamFormatter::BT() {
    append("BT");
    ERCV(indent(DrawStateType::Text));
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::ET() {
    ERCV(dedent(DrawStateType::Text));
    append("ET");
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::q() {
    append("q");
    ERCV(indent(DrawStateType::SaveState));
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::Q() {
    ERCV(dedent(DrawStateType::SaveState));
    append("Q");
    RETOK;
}

void CommandStreamFormatter::clear() {
    lead.clear();
    stack.clear();
    buf.clear();
}

rvoe<NoReturnValue> CommandStreamFormatter::indent(DrawStateType stype) {
    if(stype == DrawStateType::Text && has_state(stype)) {
        RETERR(NestedBT);
    }
    stack.push_back(stype);
    lead += "  ";
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::dedent(DrawStateType stype) {
    if(stack.empty() || stack.back() != stype) {
        RETERR(DrawStateEndMismatch);
    }
    stack.pop_back();
    lead.pop_back();
    lead.pop_back();
    RETOK;
}

bool CommandStreamFormatter::has_state(DrawStateType stype) const {
    for(const auto e : stack) {
        if(e == stype)
            return true;
    }
    return false;
}

rvoe<std::string> CommandStreamFormatter::steal() {
    if(!stack.empty()) {
        RETERR(DrawStateEndMismatch);
    }
    std::string result = std::move(buf);
    buf.clear();
    return result;
}

} // namespace hiccpdf::internal
