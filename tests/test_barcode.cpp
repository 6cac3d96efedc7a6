#include "barcode.hpp"
#include "bank_rules.hpp"
#include "checksum.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>

using fixtures::date;

TEST(due_factor, counts_days_from_base)
{
    EXPECT_EQ(barcode::dueFactor(date(1997, 10, 7)).value(), "0000");
    EXPECT_EQ(barcode::dueFactor(date(2000, 7, 3)).value(), "1000");
    EXPECT_EQ(barcode::dueFactor(date(2025, 2, 21)).value(), "9999");
}

TEST(due_factor, restarts_at_1000_after_9999)
{
    EXPECT_EQ(barcode::dueFactor(date(2025, 2, 22)).value(), "1000");
    EXPECT_EQ(barcode::dueFactor(date(2026, 11, 2)).value(), "1618");
}

TEST(due_factor, rejects_dates_before_base)
{
    EXPECT_EQ(barcode::dueFactor(date(1997, 10, 6)).error(), UNEXPECTED_CODE::INVALID_INPUT);
    EXPECT_EQ(barcode::dueFactor(date(2026, 2, 30)).error(), UNEXPECTED_CODE::INVALID_INPUT);
}

TEST(free_field, santander_layout)
{
    const auto *rules = bank::find(bank::SANTANDER);
    ASSERT_NE(rules, nullptr);

    EXPECT_EQ(barcode::freeField(*rules, fixtures::santanderProfile(), 1000000).value(),
              "9123456700000100000030101");
}

TEST(free_field, bmp_layout)
{
    const auto *rules = bank::find(bank::BMP);
    ASSERT_NE(rules, nullptr);

    EXPECT_EQ(barcode::freeField(*rules, fixtures::bmpProfile(), 123).value(),
              "0001109000000001231234567");
}

TEST(free_field, identifier_wider_than_its_slot)
{
    const auto *rules = bank::find(bank::SANTANDER);
    ASSERT_NE(rules, nullptr);

    EXPECT_EQ(barcode::freeField(*rules, fixtures::santanderProfile(), 1234567890123).error(),
              UNEXPECTED_CODE::FIELD_OVERFLOW);
}

TEST(identifier, formatted_with_bank_check_digit)
{
    EXPECT_EQ(bank::formatIdentifier(*bank::find(bank::SANTANDER), fixtures::santanderProfile(), 1000000).value(),
              "000001000000-3");
    EXPECT_EQ(bank::formatIdentifier(*bank::find(bank::SANTANDER), fixtures::santanderProfile(), 1000002).value(),
              "000001000002-0");
    EXPECT_EQ(bank::formatIdentifier(*bank::find(bank::BMP), fixtures::bmpProfile(), 6).value(),
              "00000000006-P");
    EXPECT_EQ(bank::find("999"), nullptr);
}

TEST(encode, santander_barcode_and_line)
{
    auto code = barcode::encode({"033", date(2026, 11, 2), 150000, "9123456700000100000030101"});

    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, "03397161800001500009123456700000100000030101");
    EXPECT_EQ(barcode::digitableLine(*code).value(),
              "03399.12347 56700.000104 00000.301010 7 16180000150000");
}

TEST(encode, bmp_barcode_and_line)
{
    auto code = barcode::encode({"274", date(2026, 11, 2), 2599, "0001109000000001231234567"});

    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, "27498161800000025990001109000000001231234567");
    EXPECT_EQ(barcode::digitableLine(*code).value(),
              "27490.00119 09000.000001 12312.345676 8 16180000002599");
}

TEST(encode, shape_and_round_trip)
{
    const auto *rules = bank::find(bank::BMP);
    const auto profile = fixtures::bmpProfile();

    for(std::int64_t identifier : {1, 6, 14, 999, 123456789}) {
        for(std::int64_t amount : std::initializer_list<std::int64_t>{1, 100, 2599, 9999999999}) {
            auto free = barcode::freeField(*rules, profile, identifier);
            ASSERT_TRUE(free.has_value());

            auto code = barcode::encode({"274", date(2030, 1, 15), amount, *free});
            ASSERT_TRUE(code.has_value());
            EXPECT_EQ(code->size(), barcode::BARCODE_LENGTH);
            EXPECT_TRUE(checksum::isDigits(*code));
            EXPECT_NE((*code)[4], '0');

            auto line = barcode::digitableLine(*code);
            ASSERT_TRUE(line.has_value());
            EXPECT_EQ(std::count_if(line->begin(), line->end(), [](char c) { return c >= '0' && c <= '9'; }), 47);
            EXPECT_EQ(barcode::extractBarcode(*line).value(), *code);
        }
    }
}

TEST(encode, rejects_bad_input)
{
    EXPECT_EQ(barcode::encode({"033", date(2026, 11, 2), 10000000000, "9123456700000100000030101"}).error(),
              UNEXPECTED_CODE::FIELD_OVERFLOW);
    EXPECT_EQ(barcode::encode({"033", date(2026, 11, 2), 100, "912345670000010000003010"}).error(),
              UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
    EXPECT_EQ(barcode::encode({"33", date(2026, 11, 2), 100, "9123456700000100000030101"}).error(),
              UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
    EXPECT_EQ(barcode::digitableLine("0339716180000150000912345670000010000003010x").error(),
              UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
}

TEST(extract_barcode, detects_tampered_field)
{
    EXPECT_EQ(barcode::extractBarcode("03399.12347 56700.000104 00000.301010 7 16180000150000").value(),
              "03397161800001500009123456700000100000030101");

    EXPECT_EQ(barcode::extractBarcode("03399.12347 56701.000104 00000.301010 7 16180000150000").error(),
              UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
    EXPECT_EQ(barcode::extractBarcode("03399.12347").error(), UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
}
