// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <pathdecoder.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <charconv>
#include <iterator>

namespace hiccpdf::internal {

namespace {

struct PathRun {
    char command;
    std::vector<double> numbers;
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool starts_number(std::string_view d, size_t i) {
    const char c = d[i];
    if(is_digit(c)) {
        return true;
    }
    if(c == '.') {
        return i + 1 < d.size() && is_digit(d[i + 1]);
    }
    if(c == '-' || c == '+') {
        if(i + 1 >= d.size()) {
            return false;
        }
        const char next = d[i + 1];
        return is_digit(next) || (next == '.' && i + 2 < d.size() && is_digit(d[i + 2]));
    }
    return false;
}

// Returns the number of characters consumed, zero if no number starts at i.
size_t scan_number(std::string_view d, size_t i, double &result) {
    if(!starts_number(d, i)) {
        return 0;
    }
    size_t start = i;
    if(d[start] == '+') {
        ++start;
    }
    const char *first = d.data() + start;
    const char *last = d.data() + d.size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if(ec != std::errc{}) {
        return 0;
    }
    return size_t(ptr - d.data()) - i;
}

std::vector<PathRun> split_runs(std::string_view d) {
    std::vector<PathRun> runs;
    size_t i = 0;
    while(i < d.size()) {
        double value;
        const auto consumed = scan_number(d, i, value);
        if(consumed > 0) {
            // Numbers before the first command letter belong to nothing.
            if(!runs.empty()) {
                runs.back().numbers.push_back(value);
            }
            i += consumed;
        } else {
            if(is_letter(d[i])) {
                runs.push_back(PathRun{d[i], {}});
            }
            ++i;
        }
    }
    return runs;
}

void append_point(std::string &buf, const Point &p) {
    fmt::format_to(std::back_inserter(buf), "{} {} ", format_number(p.x), format_number(p.y));
}

} // namespace

rvoe<std::vector<PathCommand>> decode_path(std::string_view d) {
    if(is_blank(d)) {
        RETERR_ATTR(EmptyPathData, "path", "d", "non-empty path data", d);
    }
    std::vector<PathCommand> commands;
    Point current{0, 0};
    Point subpath_start{0, 0};
    for(const auto &run : split_runs(d)) {
        const bool relative = run.command >= 'a' && run.command <= 'z';
        const Point origin = relative ? current : Point{0, 0};
        const auto &n = run.numbers;
        switch(run.command) {
        case 'M':
        case 'm':
            if(n.size() >= 2) {
                current = Point{origin.x + n[0], origin.y + n[1]};
                subpath_start = current;
                commands.emplace_back(MoveTo{current});
            }
            break;
        case 'L':
        case 'l':
            if(n.size() >= 2) {
                current = Point{origin.x + n[0], origin.y + n[1]};
                commands.emplace_back(LineTo{current});
            }
            break;
        case 'C':
        case 'c':
            if(n.size() >= 6) {
                CurveTo curve{Point{origin.x + n[0], origin.y + n[1]},
                              Point{origin.x + n[2], origin.y + n[3]},
                              Point{origin.x + n[4], origin.y + n[5]}};
                current = curve.p;
                commands.emplace_back(curve);
            }
            break;
        case 'Z':
        case 'z':
            current = subpath_start;
            commands.emplace_back(ClosePath{});
            break;
        default:
            break;
        }
    }
    return commands;
}

std::string path_operators(const std::vector<PathCommand> &commands) {
    std::string buf;
    for(const auto &cmd : commands) {
        if(!buf.empty()) {
            buf += '\n';
        }
        std::visit(overloaded{
                       [&buf](const MoveTo &m) {
                           append_point(buf, m.p);
                           buf += 'm';
                       },
                       [&buf](const LineTo &l) {
                           append_point(buf, l.p);
                           buf += 'l';
                       },
                       [&buf](const CurveTo &c) {
                           append_point(buf, c.c1);
                           append_point(buf, c.c2);
                           append_point(buf, c.p);
                           buf += 'c';
                       },
                       [&buf](const ClosePath &) { buf += 'h'; },
                   },
                   cmd);
    }
    return buf;
}

} // namespace hiccpdf::internal
