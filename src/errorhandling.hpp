// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#pragma once

#include <hiccpdf_types.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace hiccpdf::internal {

using hiccpdf::ErrorCategory;
using hiccpdf::ErrorCode;

struct PdfError {
    ErrorCode code = ErrorCode::NoError;
    std::string element;
    std::string field;
    std::string expected;
    std::string received;
};

const char *error_text(ErrorCode ec) noexcept;

ErrorCategory error_category(ErrorCode ec) noexcept;

const char *category_name(ErrorCategory cat) noexcept;

// Full human readable message including element and attribute context.
std::string describe(const PdfError &e);

// This error exists solely so you can put a breakpoint in it.
inline std::unexpected<PdfError> create_error(ErrorCode code) {
    return std::unexpected(PdfError{code, {}, {}, {}, {}});
}

inline std::unexpected<PdfError> create_error(ErrorCode code,
                                              std::string_view element,
                                              std::string_view field,
                                              std::string_view expected,
                                              std::string_view received) {
    return std::unexpected(PdfError{code,
                                    std::string{element},
                                    std::string{field},
                                    std::string{expected},
                                    std::string{received}});
}

#define RETERR(code) return create_error(ErrorCode::code)

#define RETERR_ATTR(code, element, field, expected, received)                                      \
    return create_error(ErrorCode::code, element, field, expected, received)

#define RETOK                                                                                      \
    return NoReturnValue {}

// Return value or error.
template<typename T> using rvoe = std::expected<T, PdfError>;

#define ERC(varname, func)                                                                         \
    auto varname##_variant = func;                                                                 \
    if(!(varname##_variant)) {                                                                     \
        return std::unexpected(std::move(varname##_variant.error()));                              \
    }                                                                                              \
    auto &varname = varname##_variant.value();

// For void.

#define ERCV(func)                                                                                 \
    {                                                                                              \
        auto placeholder_name_variant = func;                                                      \
        if(!(placeholder_name_variant)) {                                                          \
            return std::unexpected(std::move(placeholder_name_variant.error()));                   \
        }                                                                                          \
    }

struct NoReturnValue {};

} // namespace hiccpdf::internal
