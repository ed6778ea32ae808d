// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <objectformatter.hpp>
#include <pdfcommon.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <iterator>

namespace hiccpdf::internal {

ObjectFormatter::ObjectFormatter(std::string_view base_indent)
    : state{std::string{base_indent}, 0} {}

void ObjectFormatter::begin_array() { do_push(ContainerType::Array); }

void ObjectFormatter::begin_dict() { do_push(ContainerType::Dictionary); }

void ObjectFormatter::end_array() { do_pop(ContainerType::Array); }
void ObjectFormatter::end_dict() { do_pop(ContainerType::Dictionary); }

void ObjectFormatter::do_pop(ContainerType ctype) {
    if(stack.empty()) {
        fprintf(stderr, "Stack underrun\n");
        std::abort();
    }
    if(stack.back().type != ctype) {
        fprintf(stderr, "Pop type mismatch.\n");
        std::abort();
    }
    state = std::move(stack.back().params);
    stack.pop_back();
    if(ctype == ContainerType::Array) {
        if(!buf.empty() && buf.back() == ' ') {
            buf.pop_back();
        }
        buf += ']';
    } else {
        if(!buf.empty() && buf.back() == '\n') {
            buf += state.indent;
        }
        buf += ">>";
    }
    added_item();
}

void ObjectFormatter::do_push(ContainerType ctype) {
    check_indent();
    stack.push_back(FormatStash{ctype, state});
    state.num_entries = 0;
    if(ctype == ContainerType::Dictionary) {
        state.indent += "  ";
        buf += "<<\n";
    } else {
        buf += '[';
    }
}

void ObjectFormatter::add_token_pair(const char *t1, const char *t2) {
    add_token(t1);
    add_token(t2);
}

void ObjectFormatter::add_token(const char *raw_text) { add_token(std::string_view{raw_text}); }

void ObjectFormatter::add_token(std::string_view raw_text) {
    check_indent();
    buf += raw_text;
    added_item();
}

void ObjectFormatter::add_token(int32_t number) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{}", number);
    added_item();
}

void ObjectFormatter::add_token(size_t number) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{}", number);
    added_item();
}

void ObjectFormatter::add_token(double number) {
    check_indent();
    buf += format_number(number);
    added_item();
}

void ObjectFormatter::add_token_with_slash(std::string_view name) {
    check_indent();
    assert(name.empty() || name[0] != '/');
    buf += '/';
    buf += name;
    added_item();
}

void ObjectFormatter::add_object_ref(int32_t onum) {
    check_indent();
    fmt::format_to(std::back_inserter(buf), "{} 0 R", onum);
    added_item();
}

void ObjectFormatter::add_pdfstring(const u8string &str) {
    check_indent();
    buf += u8str2pdftextstring(str);
    added_item();
}

void ObjectFormatter::check_indent() {
    if(state.num_entries == 0 && !in_array()) {
        buf += state.indent;
    }
}

void ObjectFormatter::added_item() {
    ++state.num_entries;
    if(stack.empty()) {
        return;
    }
    if(stack.back().type == ContainerType::Array) {
        buf += ' ';
    } else if(stack.back().type == ContainerType::Dictionary) {
        if(state.num_entries >= 2) {
            buf += '\n';
            state.num_entries = 0;
        } else {
            buf += ' ';
        }
    } else {
        std::abort();
    }
}

std::string ObjectFormatter::steal() {
    assert(stack.empty());
    if(buf.empty() || buf.back() != '\n') {
        buf += '\n';
    }
    std::string res = std::move(buf);
    buf.clear();
    state.num_entries = 0;
    return res;
}

} // namespace hiccpdf::internal
