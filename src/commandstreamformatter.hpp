// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hiccpdf::internal {

enum class DrawStateType : uint8_t {
    SaveState,
    Text,
};

// Builds content stream text one operator per line. Lines inside
// q/Q and BT/ET pairs are indented by two spaces per level.
class CommandStreamFormatter {

public:
    CommandStreamFormatter();

    void append(std::string_view line_of_text);
    void append_command(std::string_view arg, const char *command);
    void append_command(double arg, const char *command);
    void append_command(double arg1, double arg2, const char *command);
    void append_command(double arg1, double arg2, double arg3, double arg4, const char *command);
    void append_command(double arg1,
                        double arg2,
                        double arg3,
                        double arg4,
                        double arg5,
                        double arg6,
                        const char *command);

    rvoe<NoReturnValue> BT();
    rvoe<NoReturnValue> ET();

    rvoe<NoReturnValue> q();
    rvoe<NoReturnValue> Q();

    void clear();

    rvoe<std::string> steal();

    rvoe<NoReturnValue> indent(DrawStateType stype);
    rvoe<NoReturnValue> dedent(DrawStateType stype);

private:
    bool has_state(DrawStateType stype) const;

    std::string lead;
    std::vector<DrawStateType> stack;
    std::string buf;
};

} // namespace hiccpdf::internal
