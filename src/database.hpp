#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "models.hpp"
#include "unexpected_codes.hpp"

namespace database {

struct Connection;

using ConnectionPtr = std::unique_ptr<Connection, void(*)(Connection*)>;

//Database specific

//A transactional connection holds the database write lock (BEGIN IMMEDIATE)
//until commit() or until it is released, which rolls back.
ConnectionPtr getConnection(const std::string &path, bool transactional = false);

std::optional<UNEXPECTED_CODE> commit(Connection *connection);
void rollback(Connection *connection);
bool inTransaction(const Connection *connection);

void run_stmt(Connection *connection, const char *sql);
void initSchema(Connection *connection);

//Model operations

std::optional<UNEXPECTED_CODE>
saveBeneficiary(Connection *connection, const models::Beneficiary &beneficiary);

std::expected<models::Beneficiary, UNEXPECTED_CODE>
getBeneficiary(Connection *connection, int owner);

//Creates the profile or updates its settings; counters are only written on creation
std::optional<UNEXPECTED_CODE>
saveProfile(Connection *connection, const models::BankProfile &profile);

std::expected<models::BankProfile, UNEXPECTED_CODE>
getProfile(Connection *connection, const models::ProfileKey &key);

std::optional<UNEXPECTED_CODE>
storeIdentifierCounter(Connection *connection, const models::ProfileKey &key,
                       std::int64_t next);

std::optional<UNEXPECTED_CODE>
storeSequenceCounter(Connection *connection, const models::ProfileKey &key,
                     std::int64_t next);

std::expected<std::int64_t, UNEXPECTED_CODE>
insertInstrument(Connection *connection, const models::PayableInstrument &instrument);

std::expected<models::PayableInstrument, UNEXPECTED_CODE>
getInstrument(Connection *connection, std::int64_t id);

std::expected<std::vector<models::PayableInstrument>, UNEXPECTED_CODE>
getInstrumentsByStatus(Connection *connection, const models::ProfileKey &key,
                       models::INSTRUMENT_STATUS status);

std::optional<UNEXPECTED_CODE>
updateInstrumentStatus(Connection *connection, std::int64_t id,
                       models::INSTRUMENT_STATUS status);

std::expected<std::int64_t, UNEXPECTED_CODE>
insertBatch(Connection *connection, const models::RemittanceBatch &batch);

std::expected<models::RemittanceBatch, UNEXPECTED_CODE>
getBatch(Connection *connection, std::int64_t id);

//Audit trail, written in the same transaction as the change it records
std::optional<UNEXPECTED_CODE>
recordHistory(Connection *connection, const models::HistoryEntry &entry);

//Oldest first; empty for an instrument without history
std::expected<std::vector<models::HistoryEntry>, UNEXPECTED_CODE>
getHistory(Connection *connection, std::int64_t instrument);

}
