#include "bank_rules.hpp"
#include "record_builder.hpp"

namespace bank {

const std::vector<BankRules> &all() {
  static const std::vector<BankRules> rules {
    {
      SANTANDER,
      "BANCO SANTANDER",
      models::SEGMENTED_240,
      {
        {FIXED, 1, "9"},
        {AGREEMENT, 7},
        {IDENTIFIER, 12},
        {IDENTIFIER_CHECK, 1},
        {FIXED, 1, "0"}, //IOF, only for insurers
        {WALLET, 3},
      },
      {12, checksum::SANTANDER_IDENTIFIER_TABLE, 9, false}
    },
    {
      BMP,
      "BMP MONEY PLUS",
      models::FLAT_400,
      {
        {AGENCY, 4},
        {WALLET, 3},
        {IDENTIFIER, 11},
        {ACCOUNT, 7},
      },
      {11, checksum::BMP_IDENTIFIER_TABLE, 7, true}
    }
  };

  return rules;
}

const BankRules *find(std::string_view bankCode) {
  for(const auto &rules : all()) {
    if(rules.code == bankCode) {
      return &rules;
    }
  }
  return nullptr;
}

std::expected<char, UNEXPECTED_CODE>
identifierCheckDigit(const BankRules &rules, const models::BankProfile &profile,
                     std::int64_t identifier) {
  if(identifier < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  auto digits = record::formatNumeric(static_cast<std::uint64_t>(identifier),
                                      rules.identifier.width);
  if(!digits.has_value()) {
    return std::unexpected(digits.error());
  }

  std::string base = *digits;
  if(rules.identifier.prefixWallet) {
    base = record::digitsOnly(profile.wallet) + base;
  }

  return checksum::mod11(base, rules.identifier.table, rules.identifier.maxWeight);
}

std::expected<std::string, UNEXPECTED_CODE>
formatIdentifier(const BankRules &rules, const models::BankProfile &profile,
                 std::int64_t identifier) {
  auto check = identifierCheckDigit(rules, profile, identifier);
  if(!check.has_value()) {
    return std::unexpected(check.error());
  }

  auto digits = record::formatNumeric(static_cast<std::uint64_t>(identifier),
                                      rules.identifier.width);
  if(!digits.has_value()) {
    return std::unexpected(digits.error());
  }

  return *digits + "-" + *check;
}

}
