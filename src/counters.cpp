#include "counters.hpp"
#include "record_builder.hpp"

#include <algorithm>
#include <format>
#include <iostream>

namespace counters {

namespace {

struct Counter {
  std::int64_t models::BankProfile::*
    current;
  std::int64_t
    (*lower)(const models::BankProfile &);
  std::int64_t
    (*upper)(const models::BankProfile &);
  std::optional<UNEXPECTED_CODE>
    (*store)(database::Connection *, const models::ProfileKey &, std::int64_t);
  const char *
    name;
};

const Counter IDENTIFIER {
  &models::BankProfile::currentIdentifier,
  [](const models::BankProfile &profile) { return profile.minIdentifier; },
  [](const models::BankProfile &profile) { return profile.maxIdentifier; },
  database::storeIdentifierCounter,
  "identifier"
};

const Counter SEQUENCE {
  &models::BankProfile::currentSequence,
  [](const models::BankProfile &) { return std::int64_t{1}; },
  [](const models::BankProfile &profile) { return profile.maxSequence; },
  database::storeSequenceCounter,
  "sequence"
};

std::expected<std::int64_t, UNEXPECTED_CODE>
allocateFrom(database::Connection *connection, const Counter &counter,
             models::BankProfile &profile) {
  if(!database::inTransaction(connection)) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  const models::ProfileKey key{profile.owner, profile.bankCode};

  //Re-read under the lock; the caller's copy may be stale
  auto stored = database::getProfile(connection, key);
  if(!stored.has_value()) {
    return std::unexpected(stored.error());
  }

  const auto value = std::max((*stored).*(counter.current), counter.lower(*stored));

  if(value > counter.upper(*stored)) {
    std::cout << "[LOG:RANGE_EXHAUSTED] " << counter.name << " owner=" << key.owner
              << " bank=" << key.bankCode << " current=" << value
              << " max=" << counter.upper(*stored) << std::endl;
    return std::unexpected(UNEXPECTED_CODE::RANGE_EXHAUSTED);
  }

  if(auto error = counter.store(connection, key, value + 1)) {
    return std::unexpected(*error);
  }

  profile.*(counter.current) = value + 1;

  return value;
}

std::expected<std::int64_t, UNEXPECTED_CODE>
peekFrom(database::Connection *connection, const Counter &counter,
         const models::ProfileKey &key) {
  auto stored = database::getProfile(connection, key);
  if(!stored.has_value()) {
    return std::unexpected(stored.error());
  }

  return std::max((*stored).*(counter.current), counter.lower(*stored));
}

}

IdentifierAllocator::IdentifierAllocator(database::Connection *connection):
  connection_(connection) {}

std::expected<std::int64_t, UNEXPECTED_CODE>
IdentifierAllocator::allocate(models::BankProfile &profile) {
  return allocateFrom(connection_, IDENTIFIER, profile);
}

std::expected<std::int64_t, UNEXPECTED_CODE>
IdentifierAllocator::peek(const models::ProfileKey &key) const {
  return peekFrom(connection_, IDENTIFIER, key);
}

SequenceTracker::SequenceTracker(database::Connection *connection):
  connection_(connection) {}

std::expected<std::int64_t, UNEXPECTED_CODE>
SequenceTracker::allocate(models::BankProfile &profile) {
  return allocateFrom(connection_, SEQUENCE, profile);
}

std::expected<std::int64_t, UNEXPECTED_CODE>
SequenceTracker::peek(const models::ProfileKey &key) const {
  return peekFrom(connection_, SEQUENCE, key);
}

std::expected<std::string, UNEXPECTED_CODE>
SequenceTracker::filename(std::int64_t sequence, const std::chrono::year_month_day &date) {
  if(sequence < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  auto number = record::formatNumeric(static_cast<std::uint64_t>(sequence), 4);
  if(!number.has_value()) {
    return std::unexpected(number.error());
  }

  return std::format("CB{0:%d%m}{1}.REM", std::chrono::sys_days{date}, *number);
}

}
