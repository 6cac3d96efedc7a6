#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace counters {

//Hands out nosso numero values of one (owner, bank) profile.
//
//The connection must be transactional: BEGIN IMMEDIATE gives the caller the
//write lock, so the read and the increment below cannot interleave with
//another allocator. The increment becomes visible only when the caller
//commits, together with whatever it created from the identifier; releasing
//the connection without commit rolls the counter back.
class IdentifierAllocator {
  public:
    explicit IdentifierAllocator(database::Connection *connection);

    //Returns the current value and advances the stored counter by one.
    //RANGE_EXHAUSTED when the counter is past the profile maximum.
    std::expected<std::int64_t, UNEXPECTED_CODE> allocate(models::BankProfile &profile);

    std::expected<std::int64_t, UNEXPECTED_CODE> peek(const models::ProfileKey &key) const;

  private:
    database::Connection *connection_;
};

//Remittance file numbers; same contract as IdentifierAllocator, own counter
class SequenceTracker {
  public:
    explicit SequenceTracker(database::Connection *connection);

    std::expected<std::int64_t, UNEXPECTED_CODE> allocate(models::BankProfile &profile);

    std::expected<std::int64_t, UNEXPECTED_CODE> peek(const models::ProfileKey &key) const;

    //CB + day + month + 4 digit sequence + .REM
    static std::expected<std::string, UNEXPECTED_CODE>
    filename(std::int64_t sequence, const std::chrono::year_month_day &date);

  private:
    database::Connection *connection_;
};

}
