#include "cnab.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using fixtures::date;

namespace {

//1-based, inclusive columns as the bank manuals list them
std::string columns(const std::string &line, std::size_t first, std::size_t last) {
    return line.substr(first - 1, last - first + 1);
}

models::PayableInstrument instrument(std::int64_t id, std::int64_t identifier, std::int64_t amount) {
    models::PayableInstrument instrument;
    static_cast<models::InstrumentRequest &>(instrument) = fixtures::request(amount, date(2026, 11, 2));
    instrument.id = id;
    instrument.owner = 1;
    instrument.identifier = identifier;
    instrument.issueDate = date(2026, 10, 18);
    return instrument;
}

cnab::Remittance santander(std::vector<models::PayableInstrument> instruments) {
    auto profile = fixtures::santanderProfile();
    for(auto &entry : instruments) {
        entry.bankCode = profile.bankCode;
    }
    return {profile, fixtures::beneficiary(), std::move(instruments), 7, date(2026, 10, 18)};
}

cnab::Remittance bmp(std::vector<models::PayableInstrument> instruments) {
    auto profile = fixtures::bmpProfile();
    for(auto &entry : instruments) {
        entry.bankCode = profile.bankCode;
    }
    return {profile, fixtures::beneficiary(), std::move(instruments), 3, date(2026, 10, 18)};
}

}

TEST(segmented_240, record_structure)
{
    auto lines = cnab::assemble(santander({instrument(10, 1000000, 150000),
                                           instrument(11, 1000001, 2599)}));

    ASSERT_TRUE(lines.has_value());
    ASSERT_EQ(lines->size(), 8u);

    for(const auto &line : *lines) {
        EXPECT_EQ(line.size(), 240u);
    }

    const std::vector<std::string> types{"0", "1", "3", "3", "3", "3", "5", "9"};
    for(std::size_t i = 0; i < lines->size(); ++i) {
        EXPECT_EQ(columns((*lines)[i], 8, 8), types[i]) << "line " << i;
    }

    EXPECT_EQ(columns((*lines)[2], 14, 14), "P");
    EXPECT_EQ(columns((*lines)[3], 14, 14), "Q");
    EXPECT_EQ(columns((*lines)[4], 14, 14), "P");
    EXPECT_EQ(columns((*lines)[5], 14, 14), "Q");

    EXPECT_EQ(columns((*lines)[2], 9, 13), "00001");
    EXPECT_EQ(columns((*lines)[5], 9, 13), "00004");
}

TEST(segmented_240, trailer_counts_match_lines)
{
    auto lines = cnab::assemble(santander({instrument(10, 1000000, 150000),
                                           instrument(11, 1000001, 2599)}));
    ASSERT_TRUE(lines.has_value());

    // batch: header + 4 segments + trailer
    EXPECT_EQ(columns((*lines)[6], 18, 23), "000006");
    EXPECT_EQ(columns((*lines)[7], 18, 23), "000001");
    EXPECT_EQ(columns((*lines)[7], 24, 29), "000008");
}

TEST(segmented_240, header_fields)
{
    auto lines = cnab::assemble(santander({instrument(10, 1000000, 150000)}));
    ASSERT_TRUE(lines.has_value());

    const auto &header = (*lines)[0];

    EXPECT_EQ(columns(header, 1, 3), "033");
    EXPECT_EQ(columns(header, 17, 17), "2");
    EXPECT_EQ(columns(header, 18, 32), "011222333000181");
    EXPECT_EQ(columns(header, 33, 47), "1234 0130004567");
    EXPECT_EQ(columns(header, 73, 102), "ACME COMERCIO LTDA            ");
    EXPECT_EQ(columns(header, 103, 117), "BANCO SANTANDER");
    EXPECT_EQ(columns(header, 144, 151), "18102026");
    EXPECT_EQ(columns(header, 158, 163), "000007");
    EXPECT_EQ(columns(header, 164, 166), "040");

    const auto &batch = (*lines)[1];

    EXPECT_EQ(columns(batch, 9, 9), "R");
    EXPECT_EQ(columns(batch, 54, 68), "1234 0130004567");
    EXPECT_EQ(columns(batch, 184, 191), "00000007");
}

TEST(segmented_240, configured_transmission_code)
{
    auto remittance = santander({instrument(10, 1000000, 150000)});
    remittance.profile.transmissionCode = "123400001234567";

    auto lines = cnab::assemble(remittance);
    ASSERT_TRUE(lines.has_value());

    EXPECT_EQ(columns((*lines)[0], 33, 47), "123400001234567");
}

TEST(segmented_240, segment_p_and_q_fields)
{
    auto remittance = santander({instrument(10, 1000000, 150000)});
    remittance.profile.instructions.interestPercent = 1.0;
    remittance.profile.instructions.protestDays = 5;

    auto lines = cnab::assemble(remittance);
    ASSERT_TRUE(lines.has_value());

    const auto &p = (*lines)[2];

    EXPECT_EQ(columns(p, 18, 21), "1234");
    EXPECT_EQ(columns(p, 23, 32), "0130004567");
    EXPECT_EQ(columns(p, 45, 57), "0000010000003");
    EXPECT_EQ(columns(p, 63, 77), "10             ");
    EXPECT_EQ(columns(p, 78, 85), "02112026");
    EXPECT_EQ(columns(p, 86, 100), "000000000150000");
    EXPECT_EQ(columns(p, 107, 108), "02");
    EXPECT_EQ(columns(p, 110, 117), "18102026");
    EXPECT_EQ(columns(p, 118, 118), "1");
    EXPECT_EQ(columns(p, 127, 141), "000000000000050");
    EXPECT_EQ(columns(p, 221, 223), "105");
    EXPECT_EQ(columns(p, 224, 227), "1090");
    EXPECT_EQ(columns(p, 228, 229), "09");

    const auto &q = (*lines)[3];

    EXPECT_EQ(columns(q, 18, 18), "1");
    EXPECT_EQ(columns(q, 19, 33), "000052998224725");
    EXPECT_EQ(columns(q, 34, 73), "JOAO DA SILVA                           ");
    EXPECT_EQ(columns(q, 137, 151), "SAO PAULO      ");
    EXPECT_EQ(columns(q, 129, 133), "01310");
    EXPECT_EQ(columns(q, 134, 136), "100");
    EXPECT_EQ(columns(q, 152, 153), "SP");
}

TEST(segmented_240, no_interest_no_protest)
{
    auto lines = cnab::assemble(santander({instrument(10, 1000000, 150000)}));
    ASSERT_TRUE(lines.has_value());

    const auto &p = (*lines)[2];

    EXPECT_EQ(columns(p, 118, 118), "3");
    EXPECT_EQ(columns(p, 127, 141), "000000000000000");
    EXPECT_EQ(columns(p, 221, 223), "300");
}

TEST(flat_400, two_instruments_four_lines)
{
    auto lines = cnab::assemble(bmp({instrument(20, 6, 2599), instrument(21, 7, 100)}));

    ASSERT_TRUE(lines.has_value());
    ASSERT_EQ(lines->size(), 4u);

    for(const auto &line : *lines) {
        EXPECT_EQ(line.size(), 400u);
    }

    EXPECT_EQ(columns((*lines)[0], 1, 1), "0");
    EXPECT_EQ(columns((*lines)[1], 1, 1), "1");
    EXPECT_EQ(columns((*lines)[2], 1, 1), "1");
    EXPECT_EQ(columns((*lines)[3], 1, 1), "9");

    EXPECT_EQ(columns((*lines)[0], 395, 400), "000001");
    EXPECT_EQ(columns((*lines)[1], 395, 400), "000002");
    EXPECT_EQ(columns((*lines)[2], 395, 400), "000003");
    EXPECT_EQ(columns((*lines)[3], 395, 400), "000004");

    const auto content = cnab::render(*lines);

    EXPECT_EQ(content.size(), 4u * 402u);
    EXPECT_EQ(content.substr(400, 2), "\r\n");
    EXPECT_EQ(content.substr(content.size() - 2), "\r\n");
}

TEST(flat_400, header_and_detail_fields)
{
    auto lines = cnab::assemble(bmp({instrument(20, 6, 2599)}));
    ASSERT_TRUE(lines.has_value());

    const auto &header = (*lines)[0];

    EXPECT_EQ(columns(header, 2, 9), "1REMESSA");
    EXPECT_EQ(columns(header, 77, 79), "274");
    EXPECT_EQ(columns(header, 80, 94), "BMP MONEY PLUS ");
    EXPECT_EQ(columns(header, 95, 100), "181026");
    EXPECT_EQ(columns(header, 111, 117), "0000003");

    const auto &detail = (*lines)[1];

    EXPECT_EQ(columns(detail, 2, 3), "02");
    EXPECT_EQ(columns(detail, 4, 17), "11222333000181");
    EXPECT_EQ(columns(detail, 21, 37), "01090000112345678");
    EXPECT_EQ(columns(detail, 71, 82), "00000000006P");
    EXPECT_EQ(columns(detail, 121, 126), "021126");
    EXPECT_EQ(columns(detail, 127, 139), "0000000002599");
    EXPECT_EQ(columns(detail, 148, 149), "02");
    EXPECT_EQ(columns(detail, 219, 220), "01");
    EXPECT_EQ(columns(detail, 221, 234), "00052998224725");
    EXPECT_EQ(columns(detail, 327, 334), "01310100");
}

TEST(assemble, rejects_empty_batch)
{
    EXPECT_EQ(cnab::assemble(bmp({})).error().code, UNEXPECTED_CODE::INVALID_INPUT);
}

TEST(assemble, overflow_names_the_instrument)
{
    auto failure = cnab::assemble(bmp({instrument(20, 6, 2599), instrument(21, 7, 10000000000000)}));

    ASSERT_FALSE(failure.has_value());
    EXPECT_EQ(failure.error().code, UNEXPECTED_CODE::FIELD_OVERFLOW);
    EXPECT_EQ(failure.error().instrument, 1u);

    failure = cnab::assemble(santander({instrument(10, 1000000000000, 100)}));

    ASSERT_FALSE(failure.has_value());
    EXPECT_EQ(failure.error().code, UNEXPECTED_CODE::FIELD_OVERFLOW);
    EXPECT_EQ(failure.error().instrument, 0u);
}

TEST(assemble, profile_must_match_bank_layout)
{
    auto remittance = santander({instrument(10, 1000000, 100)});
    remittance.profile.layout = models::FLAT_400;
    EXPECT_EQ(cnab::assemble(remittance).error().code, UNEXPECTED_CODE::INVALID_INPUT);

    remittance = santander({instrument(10, 1000000, 100)});
    remittance.profile.bankCode = "001";
    EXPECT_EQ(cnab::assemble(remittance).error().code, UNEXPECTED_CODE::NOT_FOUND);
}

TEST(instructions, daily_interest_and_especie)
{
    EXPECT_EQ(cnab::dailyInterest(150000, 1.0), 50);
    EXPECT_EQ(cnab::dailyInterest(100, 1.0), 0);
    EXPECT_EQ(cnab::dailyInterest(150000, 0.0), 0);

    EXPECT_EQ(cnab::especieCode("DM"), "02");
    EXPECT_EQ(cnab::especieCode("DS"), "04");
}
