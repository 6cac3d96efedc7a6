#include "remittance.hpp"
#include "bank_rules.hpp"
#include "barcode.hpp"
#include "checksum.hpp"
#include "cnab.hpp"
#include "counters.hpp"
#include "record_builder.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace remittance {

std::vector<models::InstrumentRequest>
groupByPayer(const std::vector<models::Invoice> &invoices,
             const std::chrono::year_month_day &issueDate) {
  std::vector<models::InstrumentRequest> requests;
  std::vector<std::optional<std::chrono::year_month_day>> dueDates;
  std::unordered_map<std::string, std::size_t> byDocument;

  for(const auto &invoice : invoices) {
    const auto document = record::digitsOnly(invoice.payer.document);

    auto [position, inserted] = byDocument.try_emplace(document, requests.size());

    if(inserted) {
      models::InstrumentRequest request;
      request.payer = invoice.payer;
      request.amount = 0;
      request.especie = invoice.especie;
      requests.push_back(std::move(request));
      dueDates.emplace_back();
    }

    auto &request = requests[position->second];
    auto &dueDate = dueDates[position->second];

    request.amount += invoice.amount;

    if(!invoice.documentNumber.empty()) {
      request.sourceDocuments.push_back(invoice.documentNumber);
    }

    if(invoice.dueDate.has_value() && (!dueDate.has_value() || *invoice.dueDate < *dueDate)) {
      dueDate = invoice.dueDate;
    }
  }

  const auto defaultDue = std::chrono::year_month_day{
    std::chrono::sys_days{issueDate} + DEFAULT_DUE_DAYS};

  for(std::size_t index = 0; index < requests.size(); ++index) {
    requests[index].dueDate = dueDates[index].value_or(defaultDue);
  }

  return requests;
}

namespace {

std::unexpected<Failure>
fail(database::Connection *connection, Failure failure) {
  database::rollback(connection);
  std::cout << "[LOG:" << toString(failure.code) << "] " << describe(failure) << std::endl;
  return std::unexpected(std::move(failure));
}

std::expected<models::BankProfile, Failure>
activeProfile(database::Connection *connection, const models::ProfileKey &key) {
  auto profile = database::getProfile(connection, key);

  if(!profile.has_value()) {
    return std::unexpected(Failure{profile.error(), std::nullopt,
        std::format("profile owner={} bank={}", key.owner, key.bankCode)});
  }

  if(!profile->active) {
    return std::unexpected(Failure{UNEXPECTED_CODE::PROFILE_INACTIVE, std::nullopt,
        std::format("profile owner={} bank={} is inactive", key.owner, key.bankCode)});
  }

  return *profile;
}

std::expected<const bank::BankRules *, Failure>
rulesFor(const models::BankProfile &profile) {
  const auto *rules = bank::find(profile.bankCode);

  if(rules == nullptr) {
    return std::unexpected(Failure{UNEXPECTED_CODE::NOT_FOUND, std::nullopt,
                                   "no rules for bank " + profile.bankCode});
  }

  if(rules->layout != profile.layout) {
    return std::unexpected(Failure{UNEXPECTED_CODE::INVALID_INPUT, std::nullopt,
        std::format("bank {} uses the {} column layout", profile.bankCode,
                    static_cast<int>(rules->layout))});
  }

  return rules;
}

std::expected<models::PayableInstrument, UNEXPECTED_CODE>
encodeInstrument(const bank::BankRules &rules, const models::BankProfile &profile,
                 const models::InstrumentRequest &request, std::int64_t identifier,
                 const std::chrono::year_month_day &issueDate) {
  auto formatted = bank::formatIdentifier(rules, profile, identifier);
  if(!formatted.has_value()) {
    return std::unexpected(formatted.error());
  }

  auto free = barcode::freeField(rules, profile, identifier);
  if(!free.has_value()) {
    return std::unexpected(free.error());
  }

  auto code = barcode::encode({profile.bankCode, request.dueDate, request.amount, *free});
  if(!code.has_value()) {
    return std::unexpected(code.error());
  }

  auto line = barcode::digitableLine(*code);
  if(!line.has_value()) {
    return std::unexpected(line.error());
  }

  models::PayableInstrument instrument;

  static_cast<models::InstrumentRequest &>(instrument) = request;
  instrument.owner = profile.owner;
  instrument.bankCode = profile.bankCode;
  instrument.issueDate = issueDate;
  instrument.identifier = identifier;
  instrument.formattedIdentifier = *formatted;
  instrument.barcode = *code;
  instrument.digitableLine = *line;
  instrument.status = models::PENDING;

  return instrument;
}

std::expected<models::PayableInstrument, Failure>
transition(database::Connection *connection, std::int64_t id, models::INSTRUMENT_STATUS to) {
  if(!database::inTransaction(connection)) {
    return std::unexpected(Failure{UNEXPECTED_CODE::UNKNOWN, std::nullopt,
                                   "status changes need a transactional connection"});
  }

  auto instrument = database::getInstrument(connection, id);

  if(!instrument.has_value()) {
    return fail(connection, {instrument.error(), std::nullopt, std::format("instrument {}", id)});
  }

  if(!models::canTransition(instrument->status, to)) {
    return fail(connection, {UNEXPECTED_CODE::INVALID_TRANSITION, std::nullopt,
        std::format("instrument {} is {}, cannot become {}", id,
                    models::toString(instrument->status), models::toString(to))});
  }

  if(auto error = database::updateInstrumentStatus(connection, id, to)) {
    return fail(connection, {*error, std::nullopt, std::format("instrument {}", id)});
  }

  if(auto error = database::recordHistory(connection, {0, id, instrument->status, to, std::nullopt, {}})) {
    return fail(connection, {*error, std::nullopt, std::format("history of instrument {}", id)});
  }

  if(auto error = database::commit(connection)) {
    return fail(connection, {*error, std::nullopt, "commit"});
  }

  instrument->status = to;

  return *instrument;
}

}

std::expected<std::vector<models::PayableInstrument>, Failure>
issueInstruments(database::Connection *connection, const models::ProfileKey &key,
                 const std::vector<models::InstrumentRequest> &requests,
                 const std::chrono::year_month_day &issueDate) {
  if(!database::inTransaction(connection)) {
    return std::unexpected(Failure{UNEXPECTED_CODE::UNKNOWN, std::nullopt,
                                   "issuing needs a transactional connection"});
  }

  if(requests.empty()) {
    return fail(connection, {UNEXPECTED_CODE::INVALID_INPUT, std::nullopt, "no requests"});
  }

  auto profile = activeProfile(connection, key);
  if(!profile.has_value()) {
    return fail(connection, profile.error());
  }

  auto rules = rulesFor(*profile);
  if(!rules.has_value()) {
    return fail(connection, rules.error());
  }

  counters::IdentifierAllocator allocator(connection);

  std::vector<models::PayableInstrument> issued;
  issued.reserve(requests.size());

  for(std::size_t index = 0; index < requests.size(); ++index) {
    const auto &request = requests[index];

    if(!checksum::validateDocument(request.payer.document)) {
      return fail(connection, {UNEXPECTED_CODE::INVALID_DOCUMENT, index,
                                "payer document " + request.payer.document});
    }

    if(request.amount <= 0) {
      return fail(connection, {UNEXPECTED_CODE::INVALID_INPUT, index,
                                std::format("amount {}", request.amount)});
    }

    auto identifier = allocator.allocate(*profile);
    if(!identifier.has_value()) {
      return fail(connection, {identifier.error(), index,
          std::format("identifier range [{}, {}]", profile->minIdentifier, profile->maxIdentifier)});
    }

    auto instrument = encodeInstrument(**rules, *profile, request, *identifier, issueDate);
    if(!instrument.has_value()) {
      return fail(connection, {instrument.error(), index,
                                std::format("encoding identifier {}", *identifier)});
    }

    auto id = database::insertInstrument(connection, *instrument);
    if(!id.has_value()) {
      return fail(connection, {id.error(), index, "storing instrument"});
    }

    if(auto error = database::recordHistory(connection, {0, *id, std::nullopt, models::PENDING, std::nullopt, {}})) {
      return fail(connection, {*error, index, "history of new instrument"});
    }

    instrument->id = *id;
    issued.push_back(std::move(*instrument));
  }

  if(auto error = database::commit(connection)) {
    return fail(connection, {*error, std::nullopt, "commit"});
  }

  std::cout << "[LOG:ISSUED] owner=" << key.owner << " bank=" << key.bankCode
            << " count=" << issued.size() << std::endl;

  return issued;
}

std::expected<models::PayableInstrument, Failure>
approve(database::Connection *connection, std::int64_t id) {
  return transition(connection, id, models::APPROVED);
}

std::expected<models::PayableInstrument, Failure>
cancel(database::Connection *connection, std::int64_t id) {
  return transition(connection, id, models::CANCELLED);
}

namespace {

//Everything generate does short of committing
std::expected<models::GeneratedRemittance, Failure>
stage(database::Connection *connection, const std::vector<std::int64_t> &instrumentIds,
      const models::ProfileKey &key, GeneratedAt generatedAt) {
  if(!database::inTransaction(connection)) {
    return std::unexpected(Failure{UNEXPECTED_CODE::UNKNOWN, std::nullopt,
                                   "generating needs a transactional connection"});
  }

  if(instrumentIds.empty()) {
    return fail(connection, {UNEXPECTED_CODE::INVALID_INPUT, std::nullopt, "no instruments"});
  }

  auto profile = activeProfile(connection, key);
  if(!profile.has_value()) {
    return fail(connection, profile.error());
  }

  auto rules = rulesFor(*profile);
  if(!rules.has_value()) {
    return fail(connection, rules.error());
  }

  auto beneficiary = database::getBeneficiary(connection, key.owner);
  if(!beneficiary.has_value()) {
    return fail(connection, {beneficiary.error(), std::nullopt,
                              std::format("beneficiary of owner {}", key.owner)});
  }

  std::vector<models::PayableInstrument> instruments;
  std::set<std::int64_t> seen;

  for(std::size_t index = 0; index < instrumentIds.size(); ++index) {
    const auto id = instrumentIds[index];

    if(!seen.insert(id).second) {
      return fail(connection, {UNEXPECTED_CODE::INVALID_INPUT, index,
                                std::format("instrument {} listed twice", id)});
    }

    auto instrument = database::getInstrument(connection, id);
    if(!instrument.has_value()) {
      return fail(connection, {instrument.error(), index, std::format("instrument {}", id)});
    }

    if(instrument->owner != key.owner || instrument->bankCode != key.bankCode) {
      return fail(connection, {UNEXPECTED_CODE::INVALID_INPUT, index,
          std::format("instrument {} belongs to owner={} bank={}", id,
                      instrument->owner, instrument->bankCode)});
    }

    if(!models::canTransition(instrument->status, models::REGISTERED)) {
      return fail(connection, {UNEXPECTED_CODE::INVALID_TRANSITION, index,
          std::format("instrument {} is {}", id, models::toString(instrument->status))});
    }

    instruments.push_back(std::move(*instrument));
  }

  counters::SequenceTracker tracker(connection);

  auto sequence = tracker.allocate(*profile);
  if(!sequence.has_value()) {
    return fail(connection, {sequence.error(), std::nullopt,
                              std::format("sequence limit {}", profile->maxSequence)});
  }

  const std::chrono::year_month_day generatedOn{
    std::chrono::floor<std::chrono::days>(generatedAt)};

  auto filename = counters::SequenceTracker::filename(*sequence, generatedOn);
  if(!filename.has_value()) {
    return fail(connection, {filename.error(), std::nullopt,
                              std::format("filename for sequence {}", *sequence)});
  }

  auto lines = cnab::assemble({*profile, *beneficiary, instruments, *sequence, generatedOn});
  if(!lines.has_value()) {
    return fail(connection, lines.error());
  }

  models::GeneratedRemittance generated;

  generated.content = cnab::render(*lines);
  generated.filename = *filename;
  generated.sequence = *sequence;

  models::RemittanceBatch batch;

  batch.owner = key.owner;
  batch.bankCode = key.bankCode;
  batch.sequence = *sequence;
  batch.filename = generated.filename;
  batch.content = generated.content;
  batch.generatedAt = generatedAt;
  batch.instruments = instrumentIds;

  auto batchId = database::insertBatch(connection, batch);
  if(!batchId.has_value()) {
    return fail(connection, {batchId.error(), std::nullopt, "storing batch"});
  }

  generated.batch = *batchId;

  for(std::size_t index = 0; index < instruments.size(); ++index) {
    auto &instrument = instruments[index];

    if(auto error = database::updateInstrumentStatus(connection, instrument.id, models::REGISTERED)) {
      return fail(connection, {*error, index, std::format("registering instrument {}", instrument.id)});
    }

    if(auto error = database::recordHistory(connection,
          {0, instrument.id, instrument.status, models::REGISTERED, *batchId, {}})) {
      return fail(connection, {*error, index, std::format("history of instrument {}", instrument.id)});
    }

    instrument.status = models::REGISTERED;

    generated.encoding.push_back({
      instrument.id,
      instrument.identifier,
      instrument.formattedIdentifier,
      instrument.barcode,
      instrument.digitableLine,
      instrument.status
    });
  }

  return generated;
}

void logGenerated(const models::GeneratedRemittance &generated, const models::ProfileKey &key) {
  std::cout << "[LOG:GENERATED] " << generated.filename << " batch=" << generated.batch
            << " owner=" << key.owner << " bank=" << key.bankCode
            << " instruments=" << generated.encoding.size() << std::endl;
}

std::filesystem::path stagingPath(const std::filesystem::path &path) {
  auto staging = path;
  staging += ".tmp";
  return staging;
}

void discard(const std::filesystem::path &path) {
  std::error_code error;
  std::filesystem::remove(path, error);

  if(error) {
    std::cerr << "[LOG:CLEANUP] " << path.string() << ": " << error.message() << std::endl;
  }
}

//Writes the whole content or leaves nothing behind
std::optional<UNEXPECTED_CODE>
writeFile(const std::filesystem::path &path, const std::string &content) {
  std::ofstream file{path, std::ios::binary | std::ios::trunc};
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();

  if(!file) {
    discard(path);
    return UNEXPECTED_CODE::UNKNOWN;
  }

  return std::nullopt;
}

std::optional<UNEXPECTED_CODE>
moveIntoPlace(const std::filesystem::path &staging, const std::filesystem::path &path) {
  std::error_code error;
  std::filesystem::rename(staging, path, error);

  if(error) {
    std::cerr << "[LOG:RENAME] " << staging.string() << ": " << error.message() << std::endl;
    discard(staging);
    return UNEXPECTED_CODE::UNKNOWN;
  }

  return std::nullopt;
}

}

std::expected<models::GeneratedRemittance, Failure>
generate(database::Connection *connection, const std::vector<std::int64_t> &instrumentIds,
         const models::ProfileKey &key, GeneratedAt generatedAt) {
  auto generated = stage(connection, instrumentIds, key, generatedAt);
  if(!generated.has_value()) {
    return generated;
  }

  if(auto error = database::commit(connection)) {
    return fail(connection, {*error, std::nullopt, "commit"});
  }

  logGenerated(*generated, key);

  return generated;
}

std::expected<models::GeneratedRemittance, Failure>
generateInto(database::Connection *connection, const std::vector<std::int64_t> &instrumentIds,
             const models::ProfileKey &key, GeneratedAt generatedAt,
             const std::filesystem::path &directory) {
  auto generated = stage(connection, instrumentIds, key, generatedAt);
  if(!generated.has_value()) {
    return generated;
  }

  const auto path = directory / generated->filename;
  const auto staging = stagingPath(path);

  if(auto error = writeFile(staging, generated->content)) {
    return fail(connection, {*error, std::nullopt, "cannot write " + staging.string()});
  }

  if(auto error = database::commit(connection)) {
    discard(staging);
    return fail(connection, {*error, std::nullopt, "commit"});
  }

  //Committed from here on; a file that cannot be placed is recovered with exportBatch
  if(auto error = moveIntoPlace(staging, path)) {
    return fail(connection, {*error, std::nullopt,
        std::format("batch {} stored but {} could not be written", generated->batch, path.string())});
  }

  logGenerated(*generated, key);

  return generated;
}

std::expected<std::filesystem::path, Failure>
exportBatch(database::Connection *connection, std::int64_t batchId,
            const std::filesystem::path &directory) {
  auto batch = database::getBatch(connection, batchId);

  if(!batch.has_value()) {
    return std::unexpected(Failure{batch.error(), std::nullopt, std::format("batch {}", batchId)});
  }

  const auto path = directory / batch->filename;
  const auto staging = stagingPath(path);

  if(auto error = writeFile(staging, batch->content)) {
    return std::unexpected(Failure{*error, std::nullopt, "cannot write " + staging.string()});
  }

  if(auto error = moveIntoPlace(staging, path)) {
    return std::unexpected(Failure{*error, std::nullopt, "cannot write " + path.string()});
  }

  std::cout << "[LOG:EXPORTED] batch=" << batchId << " " << path.string() << std::endl;

  return path;
}

std::expected<std::vector<models::HistoryEntry>, Failure>
history(database::Connection *connection, std::int64_t id) {
  auto instrument = database::getInstrument(connection, id);

  if(!instrument.has_value()) {
    return std::unexpected(Failure{instrument.error(), std::nullopt, std::format("instrument {}", id)});
  }

  auto entries = database::getHistory(connection, id);

  if(!entries.has_value()) {
    return std::unexpected(Failure{entries.error(), std::nullopt, std::format("history of instrument {}", id)});
  }

  return *entries;
}

}
