// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#pragma once

// Plain value types shared by the public API and the implementation.

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace hiccpdf {

enum class ErrorCategory : int32_t {
    None,
    Structural,
    UnsupportedElement,
    AttributeValidation,
    UnresolvableColor,
    AssemblyInvariant,
    Io,
};

enum class ErrorCode : int32_t {
    NoError,
    DynamicError,
    MissingTag,
    LeafHasChildren,
    RootNotDocument,
    ChildNotPage,
    UnimplementedElement,
    MissingAttribute,
    WrongAttributeType,
    NotFiniteNumber,

    NegativeRadius,
    NegativeLineWidth,
    NonPositiveSize,
    NonPositivePageDimension,
    NegativeMargin,
    WrongMarginCount,
    EmptyPathData,
    EmptyString,
    BadUtf8,
    UnknownBaseFont,
    BadColor,

    DrawStateEndMismatch,
    NestedBT,
    ObjectNumberMismatch,
    OffsetMismatch,
    CouldNotOpenFile,
    FileWriteError,
    // When you add an error code here, also add the string representation in the .cpp file.
    NumErrors,
};

struct Translate {
    double dx;
    double dy;
};

struct Rotate {
    double degrees;
};

struct Scale {
    double sx;
    double sy;
};

typedef std::variant<Translate, Rotate, Scale> TransformOp;

typedef std::variant<double, std::string, std::vector<double>, std::vector<TransformOp>> AttrValue;

typedef std::map<std::string, AttrValue> Attributes;

// Generic element tree as given by the caller.
//
//   Node{"rect", {{"x", 10.0}, {"y", 20.0}, {"width", 100.0}, {"height", 50.0}}}
//
// Text elements carry their string in `content`, every other element
// ignores it.
struct Node {
    std::string tag;
    Attributes attrs;
    std::vector<Node> children;
    std::string content;
};

struct PageSize {
    double w;
    double h;

    static PageSize letter() { return PageSize{612, 792}; }
    static PageSize a4() { return PageSize{595, 842}; }
    static PageSize legal() { return PageSize{612, 1008}; }
};

} // namespace hiccpdf
