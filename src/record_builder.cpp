#include "record_builder.hpp"
#include "checksum.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace record {

namespace {

//U+00C0..U+00FF without diacritics
constexpr std::string_view LATIN1_FOLD =
  "AAAAAAACEEEEIIIIDNOOOOOxOUUUUY?s"
  "aaaaaaaceeeeiiiidnooooo?ouuuuy?y";

char foldCodepoint(unsigned codepoint) {
  if(codepoint >= 0x20 && codepoint < 0x7f) {
    return static_cast<char>(codepoint);
  }

  if(codepoint < 0x20 || codepoint == 0x7f
      || (codepoint >= 0x80 && codepoint <= 0xa0)) {
    return ' ';
  }

  if(codepoint >= 0xc0 && codepoint <= 0xff) {
    return LATIN1_FOLD[codepoint - 0xc0];
  }

  //Ordinal indicators and degree sign, as in "Nº 100" or "1ª andar"
  if(codepoint == 0xaa) {
    return 'a';
  }
  if(codepoint == 0xba || codepoint == 0xb0) {
    return 'o';
  }

  return '?';
}

}

std::expected<std::string, UNEXPECTED_CODE>
formatNumeric(std::uint64_t value, std::size_t width) {
  auto text = std::to_string(value);

  if(text.size() > width) {
    return std::unexpected(UNEXPECTED_CODE::FIELD_OVERFLOW);
  }

  return std::string(width - text.size(), '0') + text;
}

std::expected<std::string, UNEXPECTED_CODE>
formatNumeric(std::string_view digits, std::size_t width) {
  if(!checksum::isDigits(digits)) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  if(digits.size() > width) {
    return std::unexpected(UNEXPECTED_CODE::FIELD_OVERFLOW);
  }

  return std::string(width - digits.size(), '0') + std::string{digits};
}

std::string normalizeText(std::string_view value) {
  std::string out;
  out.reserve(value.size());

  for(std::size_t i = 0; i < value.size();) {
    const auto lead = static_cast<unsigned char>(value[i]);

    if(lead < 0x80) {
      out.push_back(foldCodepoint(lead));
      ++i;
      continue;
    }

    std::size_t length = 0;
    unsigned codepoint = 0;

    if((lead & 0xe0) == 0xc0) {
      length = 2;
      codepoint = lead & 0x1f;
    } else if((lead & 0xf0) == 0xe0) {
      length = 3;
      codepoint = lead & 0x0f;
    } else if((lead & 0xf8) == 0xf0) {
      length = 4;
      codepoint = lead & 0x07;
    }

    bool valid = length != 0 && i + length <= value.size();

    for(std::size_t k = 1; valid && k < length; ++k) {
      const auto next = static_cast<unsigned char>(value[i + k]);
      valid = (next & 0xc0) == 0x80;
      codepoint = (codepoint << 6) | (next & 0x3f);
    }

    if(!valid) {
      out.push_back('?');
      ++i;
      continue;
    }

    out.push_back(foldCodepoint(codepoint));
    i += length;
  }

  return out;
}

std::string formatText(std::string_view value, std::size_t width) {
  auto text = normalizeText(value);
  text.resize(width, ' ');
  return text;
}

std::string formatDate(const std::chrono::year_month_day &date, DATE_FORMAT format) {
  const std::chrono::sys_days days{date};

  switch(format) {
    case DDMMYY:
      return std::format("{0:%d%m%y}", days);
    case DDMMYYYY:
    default:
      return std::format("{0:%d%m%Y}", days);
  }
}

std::string digitsOnly(std::string_view value) {
  std::string digits;
  std::copy_if(value.begin(), value.end(), std::back_inserter(digits),
               [](char c) { return c >= '0' && c <= '9'; });
  return digits;
}

RecordBuilder::RecordBuilder(std::size_t width): width_(width) {
  line_.reserve(width);
}

void RecordBuilder::fail(UNEXPECTED_CODE code) {
  if(!error_.has_value()) {
    error_ = code;
    errorColumn_ = column();
  }
}

RecordBuilder &RecordBuilder::at(std::size_t expected) {
  if(column() != expected) {
    fail(UNEXPECTED_CODE::LINE_LENGTH_MISMATCH);
  }
  return *this;
}

RecordBuilder &RecordBuilder::literal(std::string_view value) {
  line_.append(value);
  return *this;
}

RecordBuilder &RecordBuilder::numeric(std::uint64_t value, std::size_t width) {
  auto field = formatNumeric(value, width);

  if(!field.has_value()) {
    fail(field.error());
    line_.append(width, '0');
    return *this;
  }

  line_.append(*field);
  return *this;
}

RecordBuilder &RecordBuilder::numeric(std::string_view digits, std::size_t width) {
  auto field = formatNumeric(digits, width);

  if(!field.has_value()) {
    fail(field.error());
    line_.append(width, '0');
    return *this;
  }

  line_.append(*field);
  return *this;
}

RecordBuilder &RecordBuilder::text(std::string_view value, std::size_t width) {
  line_.append(formatText(value, width));
  return *this;
}

RecordBuilder &RecordBuilder::date(const std::chrono::year_month_day &value, DATE_FORMAT format) {
  line_.append(formatDate(value, format));
  return *this;
}

RecordBuilder &RecordBuilder::blanks(std::size_t count) {
  line_.append(count, ' ');
  return *this;
}

RecordBuilder &RecordBuilder::zeros(std::size_t count) {
  line_.append(count, '0');
  return *this;
}

std::expected<std::string, UNEXPECTED_CODE> RecordBuilder::build() const {
  if(error_.has_value()) {
    return std::unexpected(*error_);
  }

  if(line_.size() != width_) {
    return std::unexpected(UNEXPECTED_CODE::LINE_LENGTH_MISMATCH);
  }

  return line_;
}

}
