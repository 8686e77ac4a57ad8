// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================

#include "mustgather/output.hpp"

#include <gtest/gtest.h>
#include <string>

namespace mustgather::output::test {

// ==============================================================================
// Цвета
// ==============================================================================

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Green), "\x1b[32m");
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
}

// ==============================================================================
// display_width
// ==============================================================================

TEST(OutputTest, DisplayWidth_Ascii) {
    EXPECT_EQ(display_width(""), 0u);
    EXPECT_EQ(display_width("ip-10-0-0-1"), 11u);
}

TEST(OutputTest, DisplayWidth_Utf8CountsCodePoints) {
    EXPECT_EQ(display_width("\xd1\x83\xd0\xb7\xd0\xb5\xd0\xbb"), 4u);  // "узел"
    EXPECT_EQ(display_width("\xe2\x94\x82"), 1u);                      // │
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTableTest, Empty_ToStringEmpty) {
    Table table;

    EXPECT_EQ(table.to_string(), "");
}

TEST(OutputTableTest, HeadersAndRows) {
    Table table;
    table.set_headers({"Name", "Ready"});
    table.add_row({"a", "True"});
    table.add_row({"node-2", "False"});

    std::string text = table.to_string();

    const std::string expected =
        "\xe2\x94\x8c\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\xac\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x90\n"
        "\xe2\x94\x82 Name   \xe2\x94\x82 Ready \xe2\x94\x82\n"
        "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\xbc\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\xa4\n"
        "\xe2\x94\x82 a      \xe2\x94\x82 True  \xe2\x94\x82\n"
        "\xe2\x94\x82 node-2 \xe2\x94\x82 False \xe2\x94\x82\n"
        "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\xb4\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x98\n";
    EXPECT_EQ(text, expected);
}

// Короткая строка дополняется пустыми ячейками
TEST(OutputTableTest, ShortRow_PaddedToHeaderWidth) {
    Table table;
    table.set_headers({"Name", "Roles"});
    table.add_row({"n1"});

    std::string text = table.to_string();

    EXPECT_NE(text.find("\xe2\x94\x82 n1   \xe2\x94\x82       \xe2\x94\x82\n"), std::string::npos);
}

TEST(OutputTableTest, UnicodeCellsAligned) {
    Table table;
    table.set_headers({"Name"});
    table.add_row({"\xd1\x83\xd0\xb7\xd0\xb5\xd0\xbb"});  // "узел"

    std::string text = table.to_string();

    EXPECT_NE(text.find("\xe2\x94\x82 Name \xe2\x94\x82"), std::string::npos);
    EXPECT_NE(text.find("\xe2\x94\x82 \xd1\x83\xd0\xb7\xd0\xb5\xd0\xbb \xe2\x94\x82"),
              std::string::npos);
}

// ==============================================================================
// Writer
// ==============================================================================

TEST(OutputWriterTest, KeepsConfig) {
    OutputConfig cfg;
    cfg.quiet = true;
    cfg.verbose = 2;

    Writer writer(cfg);

    EXPECT_TRUE(writer.config().quiet);
    EXPECT_EQ(writer.config().verbose, 2);
}

}  // namespace mustgather::output::test
