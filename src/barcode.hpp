#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "bank_rules.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace barcode {

inline constexpr char CURRENCY_REAL = '9';

inline constexpr std::size_t BARCODE_LENGTH = 44;
inline constexpr std::size_t DIGITABLE_DIGITS = 47;

//Day zero of the due factor
inline constexpr std::chrono::year_month_day FACTOR_BASE{
  std::chrono::year{1997}, std::chrono::October, std::chrono::day{7}};

struct BarcodeInput {
  std::string
    bankCode;
  std::chrono::year_month_day
    dueDate;
  std::int64_t
    amount; //minor units
  std::string
    freeField;
};

//Days since FACTOR_BASE as 4 digits. After 9999 the factor restarts at 1000
//(9999 is 2025-02-21, 1000 is 2025-02-22) and keeps cycling every 9000 days.
std::expected<std::string, UNEXPECTED_CODE>
dueFactor(const std::chrono::year_month_day &dueDate);

//25 digits laid out by the bank's free field table
std::expected<std::string, UNEXPECTED_CODE>
freeField(const bank::BankRules &rules, const models::BankProfile &profile,
          std::int64_t identifier);

std::expected<std::string, UNEXPECTED_CODE>
encode(const BarcodeInput &input);

//"AAAAA.AAAAA BBBBB.BBBBBB CCCCC.CCCCCC D EEEEEEEEEEEEEE"
std::expected<std::string, UNEXPECTED_CODE>
digitableLine(std::string_view barcode);

//Inverse of digitableLine; fails when a field check digit does not match
std::expected<std::string, UNEXPECTED_CODE>
extractBarcode(std::string_view digitableLine);

}
