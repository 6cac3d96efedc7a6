#include "checksum.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace checksum {

bool isDigits(std::string_view value) {
  return std::all_of(value.begin(), value.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
}

std::expected<int, UNEXPECTED_CODE>
mod10(std::string_view digits) {
  if(digits.empty() || !isDigits(digits)) {
    return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
  }

  int total = 0;
  int weight = 2;

  for(auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int product = (*it - '0') * weight;

    if(product > 9) {
      product = (product / 10) + (product % 10);
    }

    total += product;
    weight = weight == 2 ? 1 : 2;
  }

  return (10 - (total % 10)) % 10;
}

std::expected<char, UNEXPECTED_CODE>
mod11(std::string_view digits, const Mod11Table &table, int maxWeight) {
  if(digits.empty() || !isDigits(digits) || maxWeight < 2) {
    return std::unexpected(UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID);
  }

  long total = 0;
  int weight = 2;

  for(auto it = digits.rbegin(); it != digits.rend(); ++it) {
    total += (*it - '0') * weight;

    if(++weight > maxWeight) {
      weight = 2;
    }
  }

  return table[total % 11];
}

namespace {

std::string digitsOf(std::string_view document) {
  std::string digits;
  std::copy_if(document.begin(), document.end(), std::back_inserter(digits),
               [](char c) { return c >= '0' && c <= '9'; });
  return digits;
}

bool allEqual(std::string_view digits) {
  return std::all_of(digits.begin(), digits.end(),
                     [&](char c) { return c == digits.front(); });
}

//Both check digits: the first over the body, the second over body + first
bool checkDigitsMatch(std::string_view digits, std::size_t body,
                      int firstMaxWeight, int secondMaxWeight) {
  auto first = mod11(digits.substr(0, body), DOCUMENT_TABLE, firstMaxWeight);
  if(!first.has_value() || *first != digits[body]) {
    return false;
  }

  auto second = mod11(digits.substr(0, body + 1), DOCUMENT_TABLE, secondMaxWeight);
  return second.has_value() && *second == digits[body + 1];
}

}

bool validateCpf(std::string_view document) {
  const auto digits = digitsOf(document);

  if(digits.size() != 11 || allEqual(digits)) {
    return false;
  }

  return checkDigitsMatch(digits, 9, 10, 11);
}

bool validateCnpj(std::string_view document) {
  const auto digits = digitsOf(document);

  if(digits.size() != 14 || allEqual(digits)) {
    return false;
  }

  return checkDigitsMatch(digits, 12, 9, 9);
}

bool validateDocument(std::string_view document) {
  switch(digitsOf(document).size()) {
    case 11:
      return validateCpf(document);
    case 14:
      return validateCnpj(document);
    default:
      return false;
  }
}

}
