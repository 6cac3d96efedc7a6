#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "unexpected_codes.hpp"

namespace record {

enum DATE_FORMAT {
  DDMMYYYY,
  DDMMYY
};

//Right aligned, zero padded. Never truncates.
std::expected<std::string, UNEXPECTED_CODE>
formatNumeric(std::uint64_t value, std::size_t width);

//Same contract for values that arrive as digit strings (documents, accounts)
std::expected<std::string, UNEXPECTED_CODE>
formatNumeric(std::string_view digits, std::size_t width);

//Left aligned, space padded, truncated on the right
std::string formatText(std::string_view value, std::size_t width);

//UTF-8 in, printable ASCII out: accented latin letters lose the accent,
//controls become blanks, anything else becomes '?'
std::string normalizeText(std::string_view value);

std::string formatDate(const std::chrono::year_month_day &date, DATE_FORMAT format);

std::string digitsOnly(std::string_view value);

class RecordBuilder {
  public:
    explicit RecordBuilder(std::size_t width);

    //Asserts the next field starts at this 1-based column
    RecordBuilder &at(std::size_t column);

    RecordBuilder &literal(std::string_view value);
    RecordBuilder &numeric(std::uint64_t value, std::size_t width);
    RecordBuilder &numeric(std::string_view digits, std::size_t width);
    RecordBuilder &text(std::string_view value, std::size_t width);
    RecordBuilder &date(const std::chrono::year_month_day &value, DATE_FORMAT format);
    RecordBuilder &blanks(std::size_t count);
    RecordBuilder &zeros(std::size_t count);

    std::size_t column() const { return line_.size() + 1; }

    //Column where the first error happened
    std::optional<std::size_t> errorColumn() const { return errorColumn_; }

    std::expected<std::string, UNEXPECTED_CODE> build() const;

  private:
    void fail(UNEXPECTED_CODE code);

    std::size_t width_;
    std::string line_;
    std::optional<UNEXPECTED_CODE> error_;
    std::optional<std::size_t> errorColumn_;
};

}
