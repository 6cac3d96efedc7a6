#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace config {

struct OwnerConfig {
  models::Beneficiary
    beneficiary;
  std::vector<models::BankProfile>
    profiles;
};

struct Configuration {
  std::string
    database = "boleto.db";
  std::vector<OwnerConfig>
    owners;
};

//Invoices of one (owner, bank) waiting to become instruments
struct RequestFile {
  models::ProfileKey
    key;
  std::optional<std::chrono::year_month_day>
    issueDate;
  std::vector<models::Invoice>
    invoices;
};

std::expected<Configuration, Failure> parseConfiguration(std::string_view text);
std::expected<Configuration, Failure> loadConfiguration(const std::filesystem::path &path);

std::expected<RequestFile, Failure> parseRequests(std::string_view text);
std::expected<RequestFile, Failure> loadRequests(const std::filesystem::path &path);

//"13000456-7" -> account 13000456, digit 7
struct SplitAccount {
  std::string
    account;
  char
    digit;
};

std::expected<SplitAccount, UNEXPECTED_CODE> splitAccount(std::string_view text);

//Creates the schema, then upserts every beneficiary and profile. Counters of
//existing profiles are kept. Commits on success.
std::optional<Failure> seed(database::Connection *connection, const Configuration &configuration);

}
