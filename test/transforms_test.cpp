// SPDX-License-Identifier: Apache-2.0
// Copyright 2024 Jussi Pakkanen

#include <gtest/gtest.h>

#include <transforms.hpp>
#include <utils.hpp>

#include <cmath>
#include <numbers>

using namespace hiccpdf::internal;

TEST(Transforms, Translate) {
    const auto m = transform_matrix(Translate{10, 20});
    EXPECT_EQ(m.a, 1);
    EXPECT_EQ(m.b, 0);
    EXPECT_EQ(m.c, 0);
    EXPECT_EQ(m.d, 1);
    EXPECT_EQ(m.e, 10);
    EXPECT_EQ(m.f, 20);
    EXPECT_EQ(matrix_operator(transform_matrix(Translate{10, 20})), "1 0 0 1 10 20 cm");
}

TEST(Transforms, Scale) {
    EXPECT_EQ(matrix_operator(transform_matrix(Scale{2, 3})), "2 0 0 3 0 0 cm");
    EXPECT_EQ(matrix_operator(transform_matrix(Scale{0.5, -1})), "0.5 0 0 -1 0 0 cm");
}

TEST(Transforms, Rotate) {
    const auto m = transform_matrix(Rotate{90});
    EXPECT_NEAR(m.a, 0, 1e-12);
    EXPECT_NEAR(m.b, 1, 1e-12);
    EXPECT_NEAR(m.c, -1, 1e-12);
    EXPECT_NEAR(m.d, 0, 1e-12);
    EXPECT_EQ(m.e, 0);
    EXPECT_EQ(m.f, 0);

    const auto m30 = transform_matrix(Rotate{30});
    EXPECT_DOUBLE_EQ(m30.a, std::cos(std::numbers::pi / 6));
    EXPECT_DOUBLE_EQ(m30.b, std::sin(std::numbers::pi / 6));
    EXPECT_DOUBLE_EQ(m30.c, -std::sin(std::numbers::pi / 6));
}

TEST(Transforms, ZeroRotationHasNoNegativeZero) {
    EXPECT_EQ(matrix_operator(transform_matrix(Rotate{0})), "1 0 0 1 0 0 cm");
}

TEST(Transforms, NoExponentInOutput) {
    const auto text = matrix_operator(transform_matrix(Rotate{90}));
    EXPECT_EQ(text.find('e'), std::string::npos);
    EXPECT_TRUE(text.ends_with(" cm"));
}

TEST(NumberFormat, ShortestRoundTrip) {
    EXPECT_EQ(format_number(1.0), "1");
    EXPECT_EQ(format_number(722.0), "722");
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(0.1), "0.1");
    EXPECT_EQ(format_number(-12.25), "-12.25");
    EXPECT_EQ(format_number(1.0 / 3.0), "0.3333333333333333");
}

TEST(NumberFormat, NegativeZero) {
    EXPECT_EQ(format_number(-0.0), "0");
    EXPECT_EQ(format_number(0.0), "0");
}

TEST(NumberFormat, NoExponents) {
    EXPECT_EQ(format_number(1e-7), "0.0000001");
    EXPECT_EQ(format_number(1e20), "100000000000000000000");
    EXPECT_EQ(format_number(-2.5e-5), "-0.000025");
}
