#pragma once

#include <array>
#include <expected>
#include <string_view>

#include "unexpected_codes.hpp"

namespace checksum {

//Maps a mod11 remainder (0..10) to the check character a caller wants
using Mod11Table = std::array<char, 11>;

//11 - remainder for remainders 2..10; remainders 0 and 1 map to the given characters
constexpr Mod11Table complementTable(char whenZero, char whenOne) {
  Mod11Table table{};
  table[0] = whenZero;
  table[1] = whenOne;
  for(int remainder = 2; remainder <= 10; ++remainder) {
    table[remainder] = static_cast<char>('0' + (11 - remainder));
  }
  return table;
}

//General barcode check digit (position 5): never 0
inline constexpr Mod11Table BARCODE_TABLE = complementTable('1', '1');

//Santander nosso numero
inline constexpr Mod11Table SANTANDER_IDENTIFIER_TABLE = complementTable('0', '0');

//BMP nosso numero, remainder 1 becomes the letter P
inline constexpr Mod11Table BMP_IDENTIFIER_TABLE = complementTable('0', 'P');

//CPF/CNPJ check digits
inline constexpr Mod11Table DOCUMENT_TABLE = complementTable('0', '0');

bool isDigits(std::string_view value);

std::expected<int, UNEXPECTED_CODE>
mod10(std::string_view digits);

//Weights 2..maxWeight right to left, wrapping back to 2
std::expected<char, UNEXPECTED_CODE>
mod11(std::string_view digits, const Mod11Table &table, int maxWeight = 9);

bool validateCpf(std::string_view document);
bool validateCnpj(std::string_view document);

//11 digits are a CPF, 14 digits a CNPJ; punctuation is ignored
bool validateDocument(std::string_view document);

}
