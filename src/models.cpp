#include "models.hpp"

#include <charconv>
#include <format>

namespace models {

std::string_view toString(INSTRUMENT_STATUS status) {
  switch(status) {
    case PENDING:
      return "pending";
    case APPROVED:
      return "approved";
    case CANCELLED:
      return "cancelled";
    case REGISTERED:
      return "registered";
  }

  return "pending";
}

std::optional<INSTRUMENT_STATUS> parseStatus(std::string_view text) {
  if(text == "pending")    return PENDING;
  if(text == "approved")   return APPROVED;
  if(text == "cancelled")  return CANCELLED;
  if(text == "registered") return REGISTERED;

  return std::nullopt;
}

std::string_view actionOf(INSTRUMENT_STATUS to) {
  return to == PENDING ? "created" : toString(to);
}

std::optional<LAYOUT_KIND> parseLayout(int width) {
  switch(width) {
    case SEGMENTED_240:
      return SEGMENTED_240;
    case FLAT_400:
      return FLAT_400;
    default:
      return std::nullopt;
  }
}

std::string toIsoDate(const std::chrono::year_month_day &date) {
  return std::format("{0:%F}", std::chrono::sys_days{date});
}

std::optional<std::chrono::year_month_day> parseIsoDate(std::string_view text) {
  if(text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int year = 0;
  unsigned month = 0;
  unsigned day = 0;

  auto parse = [&](std::size_t offset, std::size_t length, auto &out) {
    const char *first = text.data() + offset;
    const char *last = first + length;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
  };

  if(!parse(0, 4, year) || !parse(5, 2, month) || !parse(8, 2, day)) {
    return std::nullopt;
  }

  std::chrono::year_month_day date{
    std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};

  if(!date.ok()) {
    return std::nullopt;
  }

  return date;
}

bool canTransition(INSTRUMENT_STATUS from, INSTRUMENT_STATUS to) {
  switch(from) {
    case PENDING:
      return to == APPROVED || to == CANCELLED || to == REGISTERED;
    case APPROVED:
      return to == CANCELLED || to == REGISTERED;
    case CANCELLED:
    case REGISTERED:
      return false;
  }

  return false;
}

}
