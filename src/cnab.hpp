#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "models.hpp"
#include "unexpected_codes.hpp"

namespace cnab {

//File header, batch header, P + Q per instrument, batch trailer, file trailer
struct Segmented240 {
  static constexpr std::size_t WIDTH = 240;
};

//Header, one detail per instrument, trailer
struct Flat400 {
  static constexpr std::size_t WIDTH = 400;
};

using Layout = std::variant<Segmented240, Flat400>;

Layout layoutFor(models::LAYOUT_KIND kind);

inline constexpr std::string_view LINE_TERMINATOR = "\r\n";

struct Remittance {
  models::BankProfile
    profile;
  models::Beneficiary
    beneficiary;
  std::vector<models::PayableInstrument>
    instruments;
  std::int64_t
    sequence;
  std::chrono::year_month_day
    generatedOn;
};

//Every line is checked against the layout width; the first failing line
//aborts the whole file.
std::expected<std::vector<std::string>, Failure>
assemble(const Remittance &remittance);

//Each line followed by LINE_TERMINATOR, the last one included
std::string render(const std::vector<std::string> &lines);

std::string especieCode(std::string_view especie);

//Daily interest in minor units from a monthly percentage
std::int64_t dailyInterest(std::int64_t amount, double monthlyPercent);

}
