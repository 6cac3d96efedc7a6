#include "database.hpp"
#include "sqlite3.h"
#include <stdexcept>
#include <string>

#include <iostream>

namespace database {

struct Connection {
  sqlite3 *db = nullptr;
  sqlite3_stmt* stmt = nullptr;
  const bool transactional;
  bool finished = false;
  int rc = SQLITE_OK;

  Connection(const std::string &path, bool transactional): transactional(transactional) {
    rc = sqlite3_open(path.c_str(), &db);

    if(rc != SQLITE_OK) {
      sqlite3_close(db);
      throw std::runtime_error("DATABASE couldn't be opened: " + path);
    }

    sqlite3_busy_timeout(db, 1000);

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON", 0, 0, 0);

    if(transactional) {
      do {
        rc = sqlite3_exec(db, "BEGIN IMMEDIATE", 0, 0, 0);
      }
      while(rc == SQLITE_BUSY);

    }

    if(rc != SQLITE_OK) {
      sqlite3_close(db);
      throw std::runtime_error("DATABASE couldn't start a transaction: " + path);
    }
  }

  bool ok() const {
    return rc == SQLITE_DONE || rc == SQLITE_ROW || rc == SQLITE_OK;
  }

  template<typename Functor>
  void prepare(Functor functor) {
    if(stmt != nullptr) {
      sqlite3_finalize(stmt);
      stmt = nullptr;
    }
    command(functor);
  }

  template<typename Functor>
  void command(Functor functor) {

    if(ok()) {

      do {
        rc = functor();
      } while(rc == SQLITE_BUSY);
    } else {
      std::cerr << "[SQLITE3_ERROR] " << sqlite3_errmsg(db) << std::endl;
    }
  }

  template<typename... Functors>
  void command(Functors&&... functors) {
    ([&]{
     command(functors);
    } (), ...);
  }

  void end(const char *sql) {
    if(stmt != nullptr) {
      sqlite3_finalize(stmt);
      stmt = nullptr;
    }

    do {
      rc = sqlite3_exec(db, sql, 0, 0, 0);
    } while(rc == SQLITE_BUSY);

    finished = true;
  }
};

void deleteConnection(Connection* connection) {
  connection->rc = sqlite3_finalize(connection->stmt);
  connection->stmt = nullptr;

  if(connection->transactional && !connection->finished) {
    connection->end("ROLLBACK");
  }

  connection->rc = sqlite3_close(connection->db);

  if (connection->rc != SQLITE_OK) {
    std::cerr << "[SQLITE3_ERROR DELETE] " << sqlite3_errmsg(connection->db) << std::endl;
  }

  delete connection;
};

ConnectionPtr getConnection(const std::string &path, bool transactional) {
  return ConnectionPtr(new Connection(path, transactional), deleteConnection);
}

std::optional<UNEXPECTED_CODE> commit(Connection *connection) {
  if(!connection->transactional || connection->finished) {
    return UNEXPECTED_CODE::UNKNOWN;
  }

  if(!connection->ok()) {
    std::cerr << "[SQLITE3_ERROR COMMIT] " << sqlite3_errmsg(connection->db) << std::endl;
    connection->end("ROLLBACK");
    return UNEXPECTED_CODE::UNKNOWN;
  }

  connection->end("COMMIT");

  if(connection->rc != SQLITE_OK) {
    std::cerr << "[SQLITE3_ERROR COMMIT] " << sqlite3_errmsg(connection->db) << std::endl;
    sqlite3_exec(connection->db, "ROLLBACK", 0, 0, 0);
    return UNEXPECTED_CODE::UNKNOWN;
  }

  return std::nullopt;
}

void rollback(Connection *connection) {
  if(connection->transactional && !connection->finished) {
    connection->end("ROLLBACK");
  }
}

bool inTransaction(const Connection *connection) {
  return connection->transactional && !connection->finished;
}

void run_stmt(Connection *connection, const char *sql) {
  char *zErrMsg = 0;

  int rc = sqlite3_exec(connection->db, sql, nullptr, 0, &zErrMsg);

  if (rc != SQLITE_OK) {
    std::cerr << "[SQLITE3_ERROR] " << zErrMsg << std::endl;
    sqlite3_free(zErrMsg);
  }
}

void initSchema(Connection *connection) {
  auto sql = R"(
    CREATE TABLE IF NOT EXISTS beneficiaries (
      owner INTEGER PRIMARY KEY,
      name TEXT NOT NULL,
      document TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS bank_profiles (
      owner INTEGER NOT NULL,
      bank_code TEXT NOT NULL,
      layout INTEGER NOT NULL,
      agency TEXT NOT NULL,
      account TEXT NOT NULL,
      account_digit TEXT NOT NULL,
      wallet TEXT NOT NULL,
      agreement TEXT NOT NULL,
      transmission_code TEXT NOT NULL,
      min_identifier INTEGER NOT NULL,
      max_identifier INTEGER NOT NULL,
      current_identifier INTEGER NOT NULL,
      current_sequence INTEGER NOT NULL,
      max_sequence INTEGER NOT NULL,
      active INTEGER NOT NULL,
      interest_percent REAL NOT NULL,
      fine_percent REAL NOT NULL,
      protest_days INTEGER NOT NULL,
      write_off_days INTEGER NOT NULL,
      PRIMARY KEY (owner, bank_code)
    );

    CREATE TABLE IF NOT EXISTS instruments (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      owner INTEGER NOT NULL,
      bank_code TEXT NOT NULL,
      identifier INTEGER NOT NULL,
      formatted_identifier TEXT NOT NULL,
      payer_name TEXT NOT NULL,
      payer_document TEXT NOT NULL,
      street TEXT NOT NULL,
      neighborhood TEXT NOT NULL,
      city TEXT NOT NULL,
      state TEXT NOT NULL,
      zip TEXT NOT NULL,
      amount INTEGER NOT NULL,
      due_date TEXT NOT NULL,
      issue_date TEXT NOT NULL,
      especie TEXT NOT NULL,
      barcode TEXT NOT NULL,
      digitable_line TEXT NOT NULL,
      status TEXT NOT NULL,
      UNIQUE (owner, bank_code, identifier),
      FOREIGN KEY (owner, bank_code) REFERENCES bank_profiles (owner, bank_code)
    );

    CREATE TABLE IF NOT EXISTS instrument_sources (
      instrument_id INTEGER NOT NULL REFERENCES instruments (id),
      position INTEGER NOT NULL,
      reference TEXT NOT NULL,
      PRIMARY KEY (instrument_id, position)
    );

    CREATE TABLE IF NOT EXISTS remittance_batches (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      owner INTEGER NOT NULL,
      bank_code TEXT NOT NULL,
      sequence INTEGER NOT NULL,
      filename TEXT NOT NULL,
      content BLOB NOT NULL,
      generated_at INTEGER NOT NULL,
      UNIQUE (owner, bank_code, sequence)
    );

    CREATE TABLE IF NOT EXISTS batch_items (
      batch_id INTEGER NOT NULL REFERENCES remittance_batches (id),
      position INTEGER NOT NULL,
      instrument_id INTEGER NOT NULL REFERENCES instruments (id),
      PRIMARY KEY (batch_id, position)
    );

    CREATE TABLE IF NOT EXISTS instrument_history (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      instrument_id INTEGER NOT NULL REFERENCES instruments (id),
      action TEXT NOT NULL,
      from_status TEXT,
      to_status TEXT NOT NULL,
      batch_id INTEGER REFERENCES remittance_batches (id),
      recorded_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%SZ', 'now'))
    );

    CREATE INDEX IF NOT EXISTS instrument_history_instrument
      ON instrument_history (instrument_id);
  )";

  run_stmt(connection, sql);
}

namespace {

int bindText(Connection *connection, int index, const std::string &value) {
  return sqlite3_bind_text(connection->stmt, index, value.c_str(),
                           static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string columnText(Connection *connection, int index) {
  auto text = sqlite3_column_text(connection->stmt, index);
  return text == nullptr ? std::string{} : std::string{reinterpret_cast<const char *>(text)};
}

}

std::optional<UNEXPECTED_CODE>
saveBeneficiary(Connection *connection, const models::Beneficiary &beneficiary) {

  auto sql = R"(
    INSERT INTO beneficiaries(owner, name, document) VALUES(?, ?, ?)
    ON CONFLICT(owner) DO UPDATE SET name = excluded.name, document = excluded.document
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, beneficiary.owner); },
      [&]() { return bindText(connection, 2, beneficiary.name); },
      [&]() { return bindText(connection, 3, beneficiary.document); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc == SQLITE_DONE) {
    return std::nullopt;
  }

  return UNEXPECTED_CODE::UNKNOWN;
}

std::expected<models::Beneficiary, UNEXPECTED_CODE>
getBeneficiary(Connection *connection, int owner) {

  auto sql = "SELECT name, document FROM beneficiaries WHERE owner = ? LIMIT 1";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, owner); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if(connection->rc == SQLITE_ROW) {
    return models::Beneficiary{owner, columnText(connection, 0), columnText(connection, 1)};
  }

  return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
}

std::optional<UNEXPECTED_CODE>
saveProfile(Connection *connection, const models::BankProfile &profile) {

  auto sql = R"(
    INSERT INTO bank_profiles(owner, bank_code, layout, agency, account, account_digit,
      wallet, agreement, transmission_code, min_identifier, max_identifier,
      current_identifier, current_sequence, max_sequence, active,
      interest_percent, fine_percent, protest_days, write_off_days)
    VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(owner, bank_code) DO UPDATE SET
      layout = excluded.layout,
      agency = excluded.agency,
      account = excluded.account,
      account_digit = excluded.account_digit,
      wallet = excluded.wallet,
      agreement = excluded.agreement,
      transmission_code = excluded.transmission_code,
      min_identifier = excluded.min_identifier,
      max_identifier = excluded.max_identifier,
      max_sequence = excluded.max_sequence,
      active = excluded.active,
      interest_percent = excluded.interest_percent,
      fine_percent = excluded.fine_percent,
      protest_days = excluded.protest_days,
      write_off_days = excluded.write_off_days
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  const std::string accountDigit{profile.accountDigit};

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, profile.owner); },
      [&]() { return bindText(connection, 2, profile.bankCode); },
      [&]() { return sqlite3_bind_int(connection->stmt, 3, profile.layout); },
      [&]() { return bindText(connection, 4, profile.agency); },
      [&]() { return bindText(connection, 5, profile.account); },
      [&]() { return bindText(connection, 6, accountDigit); },
      [&]() { return bindText(connection, 7, profile.wallet); },
      [&]() { return bindText(connection, 8, profile.agreement); },
      [&]() { return bindText(connection, 9, profile.transmissionCode); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 10, profile.minIdentifier); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 11, profile.maxIdentifier); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 12, profile.currentIdentifier); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 13, profile.currentSequence); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 14, profile.maxSequence); },
      [&]() { return sqlite3_bind_int(connection->stmt, 15, profile.active ? 1 : 0); },
      [&]() { return sqlite3_bind_double(connection->stmt, 16, profile.instructions.interestPercent); },
      [&]() { return sqlite3_bind_double(connection->stmt, 17, profile.instructions.finePercent); },
      [&]() { return sqlite3_bind_int(connection->stmt, 18, profile.instructions.protestDays); },
      [&]() { return sqlite3_bind_int(connection->stmt, 19, profile.instructions.writeOffDays); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc == SQLITE_DONE) {
    return std::nullopt;
  }

  return UNEXPECTED_CODE::UNKNOWN;
}

std::expected<models::BankProfile, UNEXPECTED_CODE>
getProfile(Connection *connection, const models::ProfileKey &key) {

  auto sql = R"(
    SELECT layout, agency, account, account_digit, wallet, agreement, transmission_code,
      min_identifier, max_identifier, current_identifier, current_sequence, max_sequence,
      active, interest_percent, fine_percent, protest_days, write_off_days
    FROM bank_profiles
    WHERE owner = ? AND bank_code = ?
    LIMIT 1
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, key.owner); },
      [&]() { return bindText(connection, 2, key.bankCode); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if(connection->rc != SQLITE_ROW) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  auto layout = models::parseLayout(sqlite3_column_int(connection->stmt, 0));
  if(!layout.has_value()) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  models::BankProfile profile;

  profile.owner = key.owner;
  profile.bankCode = key.bankCode;
  profile.layout = *layout;
  profile.agency = columnText(connection, 1);
  profile.account = columnText(connection, 2);
  const auto accountDigit = columnText(connection, 3);
  profile.accountDigit = accountDigit.empty() ? '0' : accountDigit.front();
  profile.wallet = columnText(connection, 4);
  profile.agreement = columnText(connection, 5);
  profile.transmissionCode = columnText(connection, 6);
  profile.minIdentifier = sqlite3_column_int64(connection->stmt, 7);
  profile.maxIdentifier = sqlite3_column_int64(connection->stmt, 8);
  profile.currentIdentifier = sqlite3_column_int64(connection->stmt, 9);
  profile.currentSequence = sqlite3_column_int64(connection->stmt, 10);
  profile.maxSequence = sqlite3_column_int64(connection->stmt, 11);
  profile.active = sqlite3_column_int(connection->stmt, 12) != 0;
  profile.instructions.interestPercent = sqlite3_column_double(connection->stmt, 13);
  profile.instructions.finePercent = sqlite3_column_double(connection->stmt, 14);
  profile.instructions.protestDays = sqlite3_column_int(connection->stmt, 15);
  profile.instructions.writeOffDays = sqlite3_column_int(connection->stmt, 16);

  return profile;
}

namespace {

std::optional<UNEXPECTED_CODE>
storeCounter(Connection *connection, const char *sql,
             const models::ProfileKey &key, std::int64_t next) {

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, next); },
      [&]() { return sqlite3_bind_int(connection->stmt, 2, key.owner); },
      [&]() { return bindText(connection, 3, key.bankCode); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc != SQLITE_DONE) {
    return UNEXPECTED_CODE::UNKNOWN;
  }

  if(sqlite3_changes(connection->db) == 0) {
    return UNEXPECTED_CODE::NOT_FOUND;
  }

  return std::nullopt;
}

}

std::optional<UNEXPECTED_CODE>
storeIdentifierCounter(Connection *connection, const models::ProfileKey &key,
                       std::int64_t next) {
  return storeCounter(connection,
      "UPDATE bank_profiles SET current_identifier = ? WHERE owner = ? AND bank_code = ?",
      key, next);
}

std::optional<UNEXPECTED_CODE>
storeSequenceCounter(Connection *connection, const models::ProfileKey &key,
                     std::int64_t next) {
  return storeCounter(connection,
      "UPDATE bank_profiles SET current_sequence = ? WHERE owner = ? AND bank_code = ?",
      key, next);
}

std::expected<std::int64_t, UNEXPECTED_CODE>
insertInstrument(Connection *connection, const models::PayableInstrument &instrument) {

  auto sql = R"(
    INSERT INTO instruments(owner, bank_code, identifier, formatted_identifier,
      payer_name, payer_document, street, neighborhood, city, state, zip,
      amount, due_date, issue_date, especie, barcode, digitable_line, status)
    VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  const auto &address = instrument.payer.address;
  const auto dueDate = models::toIsoDate(instrument.dueDate);
  const auto issueDate = models::toIsoDate(instrument.issueDate);
  const std::string status{models::toString(instrument.status)};

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, instrument.owner); },
      [&]() { return bindText(connection, 2, instrument.bankCode); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 3, instrument.identifier); },
      [&]() { return bindText(connection, 4, instrument.formattedIdentifier); },
      [&]() { return bindText(connection, 5, instrument.payer.name); },
      [&]() { return bindText(connection, 6, instrument.payer.document); },
      [&]() { return bindText(connection, 7, address.street); },
      [&]() { return bindText(connection, 8, address.neighborhood); },
      [&]() { return bindText(connection, 9, address.city); },
      [&]() { return bindText(connection, 10, address.state); },
      [&]() { return bindText(connection, 11, address.zip); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 12, instrument.amount); },
      [&]() { return bindText(connection, 13, dueDate); },
      [&]() { return bindText(connection, 14, issueDate); },
      [&]() { return bindText(connection, 15, instrument.especie); },
      [&]() { return bindText(connection, 16, instrument.barcode); },
      [&]() { return bindText(connection, 17, instrument.digitableLine); },
      [&]() { return bindText(connection, 18, status); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc != SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  const auto id = sqlite3_last_insert_rowid(connection->db);

  auto sourceSql = "INSERT INTO instrument_sources(instrument_id, position, reference) VALUES(?, ?, ?)";

  for(std::size_t position = 0; position < instrument.sourceDocuments.size(); ++position) {
    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sourceSql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() { return sqlite3_bind_int64(connection->stmt, 1, id); },
        [&]() { return sqlite3_bind_int(connection->stmt, 2, static_cast<int>(position)); },
        [&]() { return bindText(connection, 3, instrument.sourceDocuments[position]); },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc != SQLITE_DONE) {
      return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
    }
  }

  return id;
}

std::expected<models::PayableInstrument, UNEXPECTED_CODE>
getInstrument(Connection *connection, std::int64_t id) {

  auto sql = R"(
    SELECT owner, bank_code, identifier, formatted_identifier, payer_name, payer_document,
      street, neighborhood, city, state, zip, amount, due_date, issue_date, especie,
      barcode, digitable_line, status
    FROM instruments
    WHERE id = ?
    LIMIT 1
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, id); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if(connection->rc != SQLITE_ROW) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  models::PayableInstrument instrument;

  instrument.id = id;
  instrument.owner = sqlite3_column_int(connection->stmt, 0);
  instrument.bankCode = columnText(connection, 1);
  instrument.identifier = sqlite3_column_int64(connection->stmt, 2);
  instrument.formattedIdentifier = columnText(connection, 3);
  instrument.payer.name = columnText(connection, 4);
  instrument.payer.document = columnText(connection, 5);
  instrument.payer.address.street = columnText(connection, 6);
  instrument.payer.address.neighborhood = columnText(connection, 7);
  instrument.payer.address.city = columnText(connection, 8);
  instrument.payer.address.state = columnText(connection, 9);
  instrument.payer.address.zip = columnText(connection, 10);
  instrument.amount = sqlite3_column_int64(connection->stmt, 11);

  auto dueDate = models::parseIsoDate(columnText(connection, 12));
  auto issueDate = models::parseIsoDate(columnText(connection, 13));
  auto status = models::parseStatus(columnText(connection, 17));

  if(!dueDate.has_value() || !issueDate.has_value() || !status.has_value()) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  instrument.dueDate = *dueDate;
  instrument.issueDate = *issueDate;
  instrument.especie = columnText(connection, 14);
  instrument.barcode = columnText(connection, 15);
  instrument.digitableLine = columnText(connection, 16);
  instrument.status = *status;

  auto sourceSql = R"(
    SELECT reference FROM instrument_sources
    WHERE instrument_id = ?
    ORDER BY position
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sourceSql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, id); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  while(connection->rc == SQLITE_ROW) {
    instrument.sourceDocuments.push_back(columnText(connection, 0));

    connection->command([&]() {
      return sqlite3_step(connection->stmt);
    });
  }

  if(connection->rc == SQLITE_DONE) {
    return instrument;
  }

  return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
}

std::expected<std::vector<models::PayableInstrument>, UNEXPECTED_CODE>
getInstrumentsByStatus(Connection *connection, const models::ProfileKey &key,
                       models::INSTRUMENT_STATUS status) {

  auto sql = R"(
    SELECT id FROM instruments
    WHERE owner = ? AND bank_code = ? AND status = ?
    ORDER BY identifier
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  const std::string statusText{models::toString(status)};

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, key.owner); },
      [&]() { return bindText(connection, 2, key.bankCode); },
      [&]() { return bindText(connection, 3, statusText); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  std::vector<std::int64_t> ids;

  while(connection->rc == SQLITE_ROW) {
    ids.push_back(sqlite3_column_int64(connection->stmt, 0));

    connection->command([&]() {
      return sqlite3_step(connection->stmt);
    });
  }

  if(connection->rc != SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  std::vector<models::PayableInstrument> instruments;

  for(const auto id : ids) {
    auto instrument = getInstrument(connection, id);

    if(!instrument.has_value()) {
      return std::unexpected(instrument.error());
    }

    instruments.push_back(std::move(*instrument));
  }

  return instruments;
}

std::optional<UNEXPECTED_CODE>
updateInstrumentStatus(Connection *connection, std::int64_t id,
                       models::INSTRUMENT_STATUS status) {

  auto sql = "UPDATE instruments SET status = ? WHERE id = ?";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  const std::string statusText{models::toString(status)};

  connection->command(
      [&]() { return bindText(connection, 1, statusText); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 2, id); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc != SQLITE_DONE) {
    return UNEXPECTED_CODE::UNKNOWN;
  }

  if(sqlite3_changes(connection->db) == 0) {
    return UNEXPECTED_CODE::NOT_FOUND;
  }

  return std::nullopt;
}

std::expected<std::int64_t, UNEXPECTED_CODE>
insertBatch(Connection *connection, const models::RemittanceBatch &batch) {

  auto sql = R"(
    INSERT INTO remittance_batches(owner, bank_code, sequence, filename, content, generated_at)
    VALUES(?, ?, ?, ?, ?, ?)
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, batch.owner); },
      [&]() { return bindText(connection, 2, batch.bankCode); },
      [&]() { return sqlite3_bind_int64(connection->stmt, 3, batch.sequence); },
      [&]() { return bindText(connection, 4, batch.filename); },
      [&]() {
        return sqlite3_bind_blob(connection->stmt, 5, batch.content.data(),
                                 static_cast<int>(batch.content.size()), SQLITE_TRANSIENT);
      },
      [&]() {
        return sqlite3_bind_int64(connection->stmt, 6, batch.generatedAt.time_since_epoch().count());
      },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc != SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  const auto id = sqlite3_last_insert_rowid(connection->db);

  auto itemSql = "INSERT INTO batch_items(batch_id, position, instrument_id) VALUES(?, ?, ?)";

  for(std::size_t position = 0; position < batch.instruments.size(); ++position) {
    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, itemSql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() { return sqlite3_bind_int64(connection->stmt, 1, id); },
        [&]() { return sqlite3_bind_int(connection->stmt, 2, static_cast<int>(position)); },
        [&]() { return sqlite3_bind_int64(connection->stmt, 3, batch.instruments[position]); },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc != SQLITE_DONE) {
      return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
    }
  }

  return id;
}

std::expected<models::RemittanceBatch, UNEXPECTED_CODE>
getBatch(Connection *connection, std::int64_t id) {

  auto sql = R"(
    SELECT owner, bank_code, sequence, filename, content, generated_at
    FROM remittance_batches
    WHERE id = ?
    LIMIT 1
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, id); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if(connection->rc != SQLITE_ROW) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  models::RemittanceBatch batch;

  batch.id = id;
  batch.owner = sqlite3_column_int(connection->stmt, 0);
  batch.bankCode = columnText(connection, 1);
  batch.sequence = sqlite3_column_int64(connection->stmt, 2);
  batch.filename = columnText(connection, 3);

  auto blob = static_cast<const char *>(sqlite3_column_blob(connection->stmt, 4));
  auto size = sqlite3_column_bytes(connection->stmt, 4);
  batch.content = blob == nullptr ? std::string{} : std::string(blob, static_cast<std::size_t>(size));

  batch.generatedAt = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>{
    std::chrono::seconds{sqlite3_column_int64(connection->stmt, 5)}};

  auto itemSql = R"(
    SELECT instrument_id FROM batch_items
    WHERE batch_id = ?
    ORDER BY position
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, itemSql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, id); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  while(connection->rc == SQLITE_ROW) {
    batch.instruments.push_back(sqlite3_column_int64(connection->stmt, 0));

    connection->command([&]() {
      return sqlite3_step(connection->stmt);
    });
  }

  if(connection->rc == SQLITE_DONE) {
    return batch;
  }

  return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
}

std::optional<UNEXPECTED_CODE>
recordHistory(Connection *connection, const models::HistoryEntry &entry) {

  auto sql = R"(
    INSERT INTO instrument_history(instrument_id, action, from_status, to_status, batch_id)
    VALUES(?, ?, ?, ?, ?)
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  const std::string action{models::actionOf(entry.to)};
  const std::string to{models::toString(entry.to)};

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, entry.instrument); },
      [&]() { return bindText(connection, 2, action); },
      [&]() {
        if(!entry.from.has_value()) {
          return sqlite3_bind_null(connection->stmt, 3);
        }
        return bindText(connection, 3, std::string{models::toString(*entry.from)});
      },
      [&]() { return bindText(connection, 4, to); },
      [&]() {
        if(!entry.batch.has_value()) {
          return sqlite3_bind_null(connection->stmt, 5);
        }
        return sqlite3_bind_int64(connection->stmt, 5, *entry.batch);
      },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if(connection->rc != SQLITE_DONE) {
    return UNEXPECTED_CODE::UNKNOWN;
  }

  return std::nullopt;
}

std::expected<std::vector<models::HistoryEntry>, UNEXPECTED_CODE>
getHistory(Connection *connection, std::int64_t instrument) {

  auto sql = R"(
    SELECT id, from_status, to_status, batch_id, recorded_at
    FROM instrument_history
    WHERE instrument_id = ?
    ORDER BY id
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, instrument); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  std::vector<models::HistoryEntry> entries;

  while(connection->rc == SQLITE_ROW) {
    models::HistoryEntry entry;

    entry.id = sqlite3_column_int64(connection->stmt, 0);
    entry.instrument = instrument;

    if(sqlite3_column_type(connection->stmt, 1) != SQLITE_NULL) {
      entry.from = models::parseStatus(columnText(connection, 1));

      if(!entry.from.has_value()) {
        return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
      }
    }

    auto to = models::parseStatus(columnText(connection, 2));
    if(!to.has_value()) {
      return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
    }
    entry.to = *to;

    if(sqlite3_column_type(connection->stmt, 3) != SQLITE_NULL) {
      entry.batch = sqlite3_column_int64(connection->stmt, 3);
    }

    entry.recordedAt = columnText(connection, 4);
    entries.push_back(std::move(entry));

    connection->command([&]() {
      return sqlite3_step(connection->stmt);
    });
  }

  if(connection->rc != SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
  }

  return entries;
}

}
