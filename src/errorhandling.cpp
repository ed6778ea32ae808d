// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen

#include <errorhandling.hpp>
#include <array>

namespace hiccpdf::internal {

namespace {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Unexpected error, the real error message should be in stdout or stderr.",
"Element has no tag.",
"Element can not have child elements.",
"Root element must be a document.",
"Document children must be pages.",
"Element type not implemented.",
"Required attribute is missing.",
"Attribute has the wrong type.",
"Number is not finite.",
"Radius must not be negative.",
"Line width must not be negative.",
"Size must be positive.",
"Page dimension must be positive.",
"Margin must not be negative.",
"Margins must have exactly four values.",
"Path data is empty.",
"String must not be empty.",
"Invalid UTF-8 string.",
"Font alias does not name a standard font.",
"Color is neither a known name nor a six digit hex value.",
"Draw state end mismatch.",
"Text blocks can not be nested.",
"Object number does not match its position.",
"Computed byte offset does not point to its object.",
"Could not open file.",
"Writing to file failed.",
};

// clang-format on

} // namespace

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

ErrorCategory error_category(ErrorCode ec) noexcept {
    switch(ec) {
    case ErrorCode::NoError:
        return ErrorCategory::None;
    case ErrorCode::MissingTag:
    case ErrorCode::LeafHasChildren:
    case ErrorCode::RootNotDocument:
    case ErrorCode::ChildNotPage:
        return ErrorCategory::Structural;
    case ErrorCode::UnimplementedElement:
        return ErrorCategory::UnsupportedElement;
    case ErrorCode::MissingAttribute:
    case ErrorCode::WrongAttributeType:
    case ErrorCode::NotFiniteNumber:
    case ErrorCode::NegativeRadius:
    case ErrorCode::NegativeLineWidth:
    case ErrorCode::NonPositiveSize:
    case ErrorCode::NonPositivePageDimension:
    case ErrorCode::NegativeMargin:
    case ErrorCode::WrongMarginCount:
    case ErrorCode::EmptyPathData:
    case ErrorCode::EmptyString:
    case ErrorCode::BadUtf8:
    case ErrorCode::UnknownBaseFont:
        return ErrorCategory::AttributeValidation;
    case ErrorCode::BadColor:
        return ErrorCategory::UnresolvableColor;
    case ErrorCode::DynamicError:
    case ErrorCode::DrawStateEndMismatch:
    case ErrorCode::NestedBT:
    case ErrorCode::ObjectNumberMismatch:
    case ErrorCode::OffsetMismatch:
        return ErrorCategory::AssemblyInvariant;
    case ErrorCode::CouldNotOpenFile:
    case ErrorCode::FileWriteError:
        return ErrorCategory::Io;
    case ErrorCode::NumErrors:
        break;
    }
    return ErrorCategory::AssemblyInvariant;
}

const char *category_name(ErrorCategory cat) noexcept {
    switch(cat) {
    case ErrorCategory::None:
        return "none";
    case ErrorCategory::Structural:
        return "structural error";
    case ErrorCategory::UnsupportedElement:
        return "unsupported element";
    case ErrorCategory::AttributeValidation:
        return "attribute validation error";
    case ErrorCategory::UnresolvableColor:
        return "unresolvable color";
    case ErrorCategory::AssemblyInvariant:
        return "internal assembly error";
    case ErrorCategory::Io:
        return "I/O error";
    }
    return "unknown";
}

std::string describe(const PdfError &e) {
    std::string msg{error_text(e.code)};
    if(!e.element.empty()) {
        msg += " In ";
        msg += e.element;
        msg += " element";
        if(!e.field.empty()) {
            msg += ", attribute '";
            msg += e.field;
            msg += '\'';
        }
        msg += '.';
    } else if(!e.field.empty()) {
        msg += " Attribute '";
        msg += e.field;
        msg += "'.";
    }
    if(!e.expected.empty()) {
        msg += " Expected: ";
        msg += e.expected;
        msg += '.';
    }
    if(!e.received.empty()) {
        msg += " Got: ";
        msg += e.received;
    }
    return msg;
}

} // namespace hiccpdf::internal
