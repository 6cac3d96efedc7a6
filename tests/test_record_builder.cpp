#include "record_builder.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace {

std::chrono::year_month_day november2() {
    return {std::chrono::year{2026}, std::chrono::November, std::chrono::day{2}};
}

}

TEST(format_numeric, zero_pads_to_width)
{
    EXPECT_EQ(record::formatNumeric(150000, 10).value(), "0000150000");
    EXPECT_EQ(record::formatNumeric(150000, 6).value(), "150000");
    EXPECT_EQ(record::formatNumeric(0, 3).value(), "000");
}

TEST(format_numeric, never_truncates)
{
    EXPECT_EQ(record::formatNumeric(150000, 5).error(), UNEXPECTED_CODE::FIELD_OVERFLOW);
    EXPECT_EQ(record::formatNumeric(10000, 4).error(), UNEXPECTED_CODE::FIELD_OVERFLOW);
}

TEST(format_numeric, digit_strings)
{
    EXPECT_EQ(record::formatNumeric(std::string_view{"123"}, 5).value(), "00123");
    EXPECT_EQ(record::formatNumeric(std::string_view{""}, 3).value(), "000");
    EXPECT_EQ(record::formatNumeric(std::string_view{"12a"}, 5).error(), UNEXPECTED_CODE::INVALID_INPUT);
    EXPECT_EQ(record::formatNumeric(std::string_view{"123456"}, 5).error(), UNEXPECTED_CODE::FIELD_OVERFLOW);
}

TEST(format_text, pads_and_truncates)
{
    EXPECT_EQ(record::formatText("ABC", 5), "ABC  ");
    EXPECT_EQ(record::formatText("ABCDEF", 3), "ABC");
    EXPECT_EQ(record::formatText("", 2), "  ");
}

TEST(format_text, folds_accents)
{
    EXPECT_EQ(record::formatText("JOÃO", 4), "JOAO");
    EXPECT_EQ(record::formatText("ação é ótima", 12), "acao e otima");
    EXPECT_EQ(record::formatText("SÃO PAULO", 15), "SAO PAULO      ");
}

TEST(format_text, folds_ordinal_indicators)
{
    EXPECT_EQ(record::normalizeText("RUA X Nº 100"), "RUA X No 100");
    EXPECT_EQ(record::normalizeText("1ª TRAVESSA"), "1a TRAVESSA");
    EXPECT_EQ(record::normalizeText("KM 12°"), "KM 12o");
    EXPECT_EQ(record::formatText("Nº 7", 5), "No 7 ");
}

TEST(format_text, replaces_what_cannot_be_folded)
{
    EXPECT_EQ(record::normalizeText("a\tb\r\n"), "a b  ");
    EXPECT_EQ(record::normalizeText("10€"), "10?");
    EXPECT_EQ(record::normalizeText("x\xffy"), "x?y");
    // width counts characters after folding, not UTF-8 bytes
    EXPECT_EQ(record::formatText("ÇÇÇÇ", 4).size(), 4u);
}

TEST(format_date, both_widths)
{
    EXPECT_EQ(record::formatDate(november2(), record::DDMMYYYY), "02112026");
    EXPECT_EQ(record::formatDate(november2(), record::DDMMYY), "021126");
}

TEST(record_builder, builds_exact_width)
{
    record::RecordBuilder builder(20);

    builder.at(1).literal("1")
           .at(2).numeric(42, 4)
           .at(6).text("NAME", 6)
           .at(12).date(november2(), record::DDMMYY)
           .at(18).blanks(1)
           .at(19).zeros(2);

    EXPECT_EQ(builder.build().value(), "10042NAME  021126 00");
}

TEST(record_builder, wrong_start_column)
{
    record::RecordBuilder builder(10);

    builder.at(1).literal("AB")
           .at(4).literal("CDEFGHIJ");

    EXPECT_EQ(builder.build().error(), UNEXPECTED_CODE::LINE_LENGTH_MISMATCH);
    EXPECT_EQ(builder.errorColumn(), 3u);
}

TEST(record_builder, short_line)
{
    record::RecordBuilder builder(10);
    builder.literal("ABC");

    EXPECT_EQ(builder.build().error(), UNEXPECTED_CODE::LINE_LENGTH_MISMATCH);
    EXPECT_FALSE(builder.errorColumn().has_value());
}

TEST(record_builder, first_error_wins)
{
    record::RecordBuilder builder(10);

    builder.at(1).numeric(123456, 3)
           .at(4).numeric(std::string_view{"x"}, 2)
           .at(6).blanks(5);

    EXPECT_EQ(builder.build().error(), UNEXPECTED_CODE::FIELD_OVERFLOW);
    EXPECT_EQ(builder.errorColumn(), 1u);
    // the failed fields still take their width so later columns line up
    EXPECT_EQ(builder.column(), 11u);
}

TEST(digits_only, strips_punctuation)
{
    EXPECT_EQ(record::digitsOnly("11.222.333/0001-81"), "11222333000181");
    EXPECT_EQ(record::digitsOnly("abc"), "");
}
