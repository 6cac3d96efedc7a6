#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace remittance {

//Due date of a group whose invoices carry none
inline constexpr std::chrono::days DEFAULT_DUE_DAYS{5};

using GeneratedAt = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

//One request per payer document: amounts summed, earliest due date,
//name and address of the first invoice, every document number kept.
//Groups come out in the order their payer first appears.
std::vector<models::InstrumentRequest>
groupByPayer(const std::vector<models::Invoice> &invoices,
             const std::chrono::year_month_day &issueDate);

//Status changes of one instrument, oldest first
std::expected<std::vector<models::HistoryEntry>, Failure>
history(database::Connection *connection, std::int64_t id);

//Writes a stored batch again as directory/filename
std::expected<std::filesystem::path, Failure>
exportBatch(database::Connection *connection, std::int64_t batchId,
            const std::filesystem::path &directory);

//All functions below take a transactional connection and finish it: commit
//on success, rollback on any failure (counter advances included).

std::expected<std::vector<models::PayableInstrument>, Failure>
issueInstruments(database::Connection *connection, const models::ProfileKey &key,
                 const std::vector<models::InstrumentRequest> &requests,
                 const std::chrono::year_month_day &issueDate);

std::expected<models::PayableInstrument, Failure>
approve(database::Connection *connection, std::int64_t id);

std::expected<models::PayableInstrument, Failure>
cancel(database::Connection *connection, std::int64_t id);

//Builds the remittance file for the given instruments, in the given order,
//stores the batch and marks every instrument registered.
std::expected<models::GeneratedRemittance, Failure>
generate(database::Connection *connection, const std::vector<std::int64_t> &instrumentIds,
         const models::ProfileKey &key, GeneratedAt generatedAt);

//Same as generate, and the file is written as directory/filename. The content
//goes to filename.tmp before the commit and is renamed after it, so a failed
//write leaves neither a file nor a consumed sequence.
std::expected<models::GeneratedRemittance, Failure>
generateInto(database::Connection *connection, const std::vector<std::int64_t> &instrumentIds,
             const models::ProfileKey &key, GeneratedAt generatedAt,
             const std::filesystem::path &directory);

}
