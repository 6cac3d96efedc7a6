#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "checksum.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace bank {

enum FIELD_SOURCE {
  FIXED,
  AGREEMENT,
  AGENCY,
  WALLET,
  ACCOUNT,
  IDENTIFIER,
  IDENTIFIER_CHECK
};

struct FreeFieldPart {
  FIELD_SOURCE
    source;
  std::size_t
    width;
  std::string_view
    fixed = {};
};

//Nosso numero: its width inside files/barcode and how its check digit is made
struct IdentifierRule {
  std::size_t
    width;
  checksum::Mod11Table
    table;
  int
    maxWeight;
  bool
    prefixWallet;
};

struct BankRules {
  std::string_view
    code;
  std::string_view
    name;
  models::LAYOUT_KIND
    layout;
  std::vector<FreeFieldPart>
    freeField;
  IdentifierRule
    identifier;
};

inline constexpr std::string_view SANTANDER = "033";
inline constexpr std::string_view BMP = "274";

inline constexpr std::size_t FREE_FIELD_WIDTH = 25;

const std::vector<BankRules> &all();

//nullptr for banks without a modeled layout
const BankRules *find(std::string_view bankCode);

std::expected<char, UNEXPECTED_CODE>
identifierCheckDigit(const BankRules &rules, const models::BankProfile &profile,
                     std::int64_t identifier);

//Zero padded identifier, '-', check digit
std::expected<std::string, UNEXPECTED_CODE>
formatIdentifier(const BankRules &rules, const models::BankProfile &profile,
                 std::int64_t identifier);

}
