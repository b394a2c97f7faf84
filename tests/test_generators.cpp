/*
 * Generator tests - HTTPScript
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <ctime>
#include <regex>
#include <stdexcept>
#include <httpscript/script/generators.hpp>

using namespace httpscript;

TEST(Generators, UuidShape) {
    auto a = generators::uuid();
    auto b = generators::uuid();
    EXPECT_TRUE(std::regex_match(a, std::regex("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$"))) << a;
    EXPECT_NE(a, b);
}

TEST(Generators, EmailShape) {
    auto e = generators::email();
    EXPECT_TRUE(std::regex_match(e, std::regex("^[A-Za-z0-9]{12}@[A-Za-z0-9]{6}\\.[A-Za-z]{2}$"))) << e;
}

TEST(Generators, IntegerRanges) {
    for (int i = 0; i < 200; ++i) {
        auto v = generators::integer(10);
        EXPECT_GE(v, 0);
        EXPECT_LT(v, 10);
        auto w = generators::integer(-5, 5);
        EXPECT_GE(w, -5);
        EXPECT_LT(w, 5);
    }
    EXPECT_EQ(generators::integer(7, 8), 7);
    EXPECT_THROW(generators::integer(3, 3), std::invalid_argument);
    EXPECT_THROW(generators::integer(0), std::invalid_argument);
}

TEST(Generators, FloatRanges) {
    for (int i = 0; i < 200; ++i) {
        auto v = generators::real();
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
        auto w = generators::real(1.5, 2.5);
        EXPECT_GE(w, 1.5);
        EXPECT_LT(w, 2.5);
    }
    EXPECT_THROW(generators::real(2.0, 1.0), std::invalid_argument);
}

TEST(Generators, Strings) {
    EXPECT_TRUE(generators::alphabetic(0).empty());
    EXPECT_TRUE(std::regex_match(generators::alphabetic(20), std::regex("^[A-Za-z]{20}$")));
    EXPECT_TRUE(std::regex_match(generators::alphanumeric(20), std::regex("^[A-Za-z0-9]{20}$")));
    EXPECT_TRUE(std::regex_match(generators::hexadecimal(32), std::regex("^[0-9A-F]{32}$")));
}

TEST(Generators, Timestamps) {
    auto now = static_cast<std::int64_t>(std::time(nullptr));
    auto ts = generators::timestamp();
    EXPECT_LE(std::llabs(ts - now), 2);
    auto iso = generators::iso_timestamp();
    EXPECT_TRUE(std::regex_match(iso, std::regex("^\\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}[+-]\\d{2}:\\d{2}$"))) << iso;
}

TEST(Generators, NumberFormatting) {
    EXPECT_EQ(generators::format_number(3.0), "3");
    EXPECT_EQ(generators::format_number(-2.0), "-2");
    EXPECT_EQ(generators::format_number(0.5), "0.5");
    EXPECT_EQ(generators::format_number(0.1), "0.1");
}
