#include "unexpected_codes.hpp"

#include <format>

std::string_view toString(UNEXPECTED_CODE code) {
  switch(code) {
    case UNEXPECTED_CODE::NOT_FOUND:
      return "NOT_FOUND";
    case UNEXPECTED_CODE::UNKNOWN:
      return "UNKNOWN";
    case UNEXPECTED_CODE::RANGE_EXHAUSTED:
      return "RANGE_EXHAUSTED";
    case UNEXPECTED_CODE::FIELD_OVERFLOW:
      return "FIELD_OVERFLOW";
    case UNEXPECTED_CODE::LINE_LENGTH_MISMATCH:
      return "LINE_LENGTH_MISMATCH";
    case UNEXPECTED_CODE::CHECKSUM_INPUT_INVALID:
      return "CHECKSUM_INPUT_INVALID";
    case UNEXPECTED_CODE::PROFILE_INACTIVE:
      return "PROFILE_INACTIVE";
    case UNEXPECTED_CODE::INVALID_INPUT:
      return "INVALID_INPUT";
    case UNEXPECTED_CODE::INVALID_DOCUMENT:
      return "INVALID_DOCUMENT";
    case UNEXPECTED_CODE::INVALID_TRANSITION:
      return "INVALID_TRANSITION";
  }

  return "UNKNOWN";
}

std::string describe(const Failure &failure) {
  if(failure.instrument.has_value()) {
    return std::format("{} (instrument #{}): {}",
                       toString(failure.code), *failure.instrument, failure.detail);
  }

  return std::format("{}: {}", toString(failure.code), failure.detail);
}
