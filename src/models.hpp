#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace models {
  enum LAYOUT_KIND: const unsigned short {
    SEGMENTED_240 = 240,
    FLAT_400 = 400
  };

  enum INSTRUMENT_STATUS: const unsigned char {
    PENDING = 'p',
    APPROVED = 'a',
    CANCELLED = 'c',
    REGISTERED = 'r'
  };

  struct ProfileKey {
    int
      owner;
    std::string
      bankCode;
  };

  //Collection rules the beneficiary agreed with the bank
  struct Instructions {
    double
      interestPercent = 0.0; //monthly
    double
      finePercent = 0.0;
    int
      protestDays = 0;
    int
      writeOffDays = 0;
  };

  struct BankProfile {
    int
      owner;
    std::string
      bankCode;
    LAYOUT_KIND
      layout;
    std::string
      agency;
    std::string
      account;
    char
      accountDigit = '0';
    std::string
      wallet;
    std::string
      agreement;
    std::string
      transmissionCode;
    std::int64_t
      minIdentifier = 1;
    std::int64_t
      maxIdentifier = 999999999;
    std::int64_t
      currentIdentifier = 1;
    std::int64_t
      currentSequence = 1;
    std::int64_t
      maxSequence = 9999;
    bool
      active = true;
    Instructions
      instructions;
  };

  struct Beneficiary {
    int
      owner;
    std::string
      name;
    std::string
      document;
  };

  struct Address {
    std::string
      street;
    std::string
      neighborhood;
    std::string
      city;
    std::string
      state;
    std::string
      zip;
  };

  struct Payer {
    std::string
      name;
    std::string
      document;
    Address
      address;
  };

  //One normalized invoice as handed over by the invoice collaborator
  struct Invoice {
    Payer
      payer;
    std::int64_t
      amount; //minor units
    std::optional<std::chrono::year_month_day>
      dueDate;
    std::string
      documentNumber;
    std::string
      especie = "DM";
  };

  struct InstrumentRequest {
    Payer
      payer;
    std::int64_t
      amount;
    std::chrono::year_month_day
      dueDate;
    std::vector<std::string>
      sourceDocuments;
    std::string
      especie = "DM";
  };

  struct PayableInstrument: public InstrumentRequest {
    std::int64_t
      id = 0;
    int
      owner;
    std::string
      bankCode;
    std::chrono::year_month_day
      issueDate;
    std::int64_t
      identifier;
    std::string
      formattedIdentifier;
    std::string
      barcode;
    std::string
      digitableLine;
    INSTRUMENT_STATUS
      status = PENDING;
  };

  struct RemittanceBatch {
    std::int64_t
      id = 0;
    int
      owner;
    std::string
      bankCode;
    std::int64_t
      sequence;
    std::string
      filename;
    std::string
      content;
    std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>
      generatedAt;
    std::vector<std::int64_t>
      instruments;
  };

  struct EncodingData {
    std::int64_t
      instrument;
    std::int64_t
      identifier;
    std::string
      formattedIdentifier;
    std::string
      barcode;
    std::string
      digitableLine;
    INSTRUMENT_STATUS
      status;
  };

  //One status change of an instrument, its creation included
  struct HistoryEntry {
    std::int64_t
      id = 0;
    std::int64_t
      instrument;
    std::optional<INSTRUMENT_STATUS>
      from;
    INSTRUMENT_STATUS
      to;
    std::optional<std::int64_t>
      batch; //set when registered
    std::string
      recordedAt;
  };

  struct GeneratedRemittance {
    std::int64_t
      batch = 0;
    std::string
      content;
    std::string
      filename;
    std::int64_t
      sequence;
    std::vector<EncodingData>
      encoding;
  };

  std::string_view toString(INSTRUMENT_STATUS status);
  std::optional<INSTRUMENT_STATUS> parseStatus(std::string_view text);

  //created, approved, cancelled or registered
  std::string_view actionOf(INSTRUMENT_STATUS to);

  std::optional<LAYOUT_KIND> parseLayout(int width);

  //YYYY-MM-DD
  std::string toIsoDate(const std::chrono::year_month_day &date);
  std::optional<std::chrono::year_month_day> parseIsoDate(std::string_view text);

  //Monotonic order pending -> approved -> registered, cancellation is terminal
  bool canTransition(INSTRUMENT_STATUS from, INSTRUMENT_STATUS to);
}
