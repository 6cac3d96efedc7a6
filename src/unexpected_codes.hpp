#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

enum class UNEXPECTED_CODE {
  NOT_FOUND,
  UNKNOWN,
  RANGE_EXHAUSTED,
  FIELD_OVERFLOW,
  LINE_LENGTH_MISMATCH,
  CHECKSUM_INPUT_INVALID,
  PROFILE_INACTIVE,
  INVALID_INPUT,
  INVALID_DOCUMENT,
  INVALID_TRANSITION
};

std::string_view toString(UNEXPECTED_CODE code);

//Boundary error: which kind, which instrument (index in the request) and why
struct Failure {
  UNEXPECTED_CODE
    code;
  std::optional<std::size_t>
    instrument;
  std::string
    detail;
};

std::string describe(const Failure &failure);
