#include "barcode.hpp"
#include "checksum.hpp"
#include "record_builder.hpp"

#include <format>

namespace barcode {

std::expected<std::string, UNEXPECTED_CODE>
dueFactor(const std::chrono::year_month_day &dueDate) {
  if(!dueDate.ok()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  const auto days = (std::chrono::sys_days{dueDate} - std::chrono::sys_days{FACTOR_BASE}).count();

  if(days < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  auto factor = days;
  if(factor > 9999) {
    factor = 1000 + (days - 10000) % 9000;
  }

  return record::formatNumeric(static_cast<std::uint64_t>(factor), 4);
}

std::expected<std::string, UNEXPECTED_CODE>
freeField(const bank::BankRules &rules, const models::BankProfile &profile,
          std::int64_t identifier) {
  if(identifier < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  std::string field;
  field.reserve(bank::FREE_FIELD_WIDTH);

  for(const auto &part : rules.freeField) {
    std::expected<std::string, UNEXPECTED_CODE> value;

    switch(part.source) {
      case bank::FIXED:
        value = std::string{part.fixed};
        break;
      case bank::AGREEMENT:
        value = record::formatNumeric(record::digitsOnly(profile.agreement), part.width);
        break;
      case bank::AGENCY:
        value = record::formatNumeric(record::digitsOnly(profile.agency), part.width);
        break;
      case bank::WALLET:
        value = record::formatNumeric(record::digitsOnly(profile.wallet), part.width);
        break;
      case bank::ACCOUNT:
        value = record::formatNumeric(record::digitsOnly(profile.account), part.width);
        break;
      case bank::IDENTIFIER:
        value = record::formatNumeric(static_cast<std::uint64_t>(identifier), part.width);
        break;
      case bank::IDENTIFIER_CHECK: {
        auto check = bank::identifierCheckDigit(rules, profile, identifier);
        if(!check.has_value()) {
          return std::unexpected(check.error());
        }
        value = std::string(1, *check);
        break;
      }
    }

    if(!value.has_value()) {
      return std::unexpected(value.error());
    }

    field += *value;
  }

  if(field.size() != bank::FREE_FIELD_WIDTH || !checksum::isDigits(field)) {
    return std::unexpected(UNEXPECTED_CODE::LINE_LENGTH_MISMATCH);
  }

  return field;
}

std::expected<std::string, UNEXPECTED_CODE>
encode(const BarcodeInput &input) {
  if(input.bankCode.size() != 3 || !checksum::isDigits(input.bankCode)
      || input.freeField.size() != bank::FREE_FIELD_WIDTH
      || !checksum::isDigits(input.freeField)) {
    return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
  }

  if(input.amount < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  auto factor = dueFactor(input.dueDate);
  if(!factor.has_value()) {
    return std::unexpected(factor.error());
  }

  auto amount = record::formatNumeric(static_cast<std::uint64_t>(input.amount), 10);
  if(!amount.has_value()) {
    return std::unexpected(amount.error());
  }

  const std::string head = input.bankCode + CURRENCY_REAL;
  const std::string tail = *factor + *amount + input.freeField;

  auto check = checksum::mod11(head + tail, checksum::BARCODE_TABLE, 9);
  if(!check.has_value()) {
    return std::unexpected(check.error());
  }

  return head + *check + tail;
}

namespace {

std::expected<std::string, UNEXPECTED_CODE>
withMod10(std::string_view digits) {
  auto check = checksum::mod10(digits);
  if(!check.has_value()) {
    return std::unexpected(check.error());
  }
  return std::string{digits} + static_cast<char>('0' + *check);
}

}

std::expected<std::string, UNEXPECTED_CODE>
digitableLine(std::string_view barcode) {
  if(barcode.size() != BARCODE_LENGTH || !checksum::isDigits(barcode)) {
    return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
  }

  const auto free = barcode.substr(19, 25);

  auto field1 = withMod10(std::string{barcode.substr(0, 4)} + std::string{free.substr(0, 5)});
  auto field2 = withMod10(free.substr(5, 10));
  auto field3 = withMod10(free.substr(15, 10));

  if(!field1.has_value() || !field2.has_value() || !field3.has_value()) {
    return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
  }

  return std::format("{}.{} {}.{} {}.{} {} {}",
      field1->substr(0, 5), field1->substr(5),
      field2->substr(0, 5), field2->substr(5),
      field3->substr(0, 5), field3->substr(5),
      barcode.substr(4, 1),
      barcode.substr(5, 14));
}

std::expected<std::string, UNEXPECTED_CODE>
extractBarcode(std::string_view line) {
  const auto digits = record::digitsOnly(line);

  if(digits.size() != DIGITABLE_DIGITS) {
    return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
  }

  const std::string_view view{digits};
  const auto field1 = view.substr(0, 10);
  const auto field2 = view.substr(10, 11);
  const auto field3 = view.substr(21, 11);

  for(const auto field : {field1, field2, field3}) {
    auto check = checksum::mod10(field.substr(0, field.size() - 1));
    if(!check.has_value() || field.back() != static_cast<char>('0' + *check)) {
      return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
    }
  }

  std::string barcode;
  barcode.reserve(BARCODE_LENGTH);
  barcode += field1.substr(0, 4);
  barcode += view.substr(32, 1);
  barcode += view.substr(33, 14);
  barcode += field1.substr(4, 5);
  barcode += field2.substr(0, 10);
  barcode += field3.substr(0, 10);

  return barcode;
}

}
