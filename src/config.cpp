#include "config.hpp"
#include "bank_rules.hpp"
#include "checksum.hpp"
#include "record_builder.hpp"

#include "nlohmann/json.hpp"

#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace config {

namespace {

//Reads typed members of one JSON object. The first missing or mistyped
//member is kept and every later read returns the fallback.
class Reader {
  public:
    Reader(const nlohmann::json &object, std::string path):
      object_(object), path_(std::move(path)) {
      if(!object_.is_object()) {
        fail(path_, "an object");
      }
    }

    template<typename T>
    T optional(const char *name, T fallback) {
      if(failure_.has_value()) {
        return fallback;
      }

      auto found = object_.find(name);

      if(found == object_.end() || found->is_null()) {
        return fallback;
      }

      if(!matches<T>(*found)) {
        fail(member(name), expectation<T>());
        return fallback;
      }

      return found->template get<T>();
    }

    template<typename T>
    T require(const char *name) {
      if(!failure_.has_value() && !object_.contains(name)) {
        fail(member(name), "present");
      }
      return optional<T>(name, T{});
    }

    const nlohmann::json *child(const char *name) {
      if(failure_.has_value()) {
        return nullptr;
      }

      auto found = object_.find(name);
      if(found == object_.end() || found->is_null()) {
        return nullptr;
      }

      return &*found;
    }

    std::optional<std::chrono::year_month_day> date(const char *name) {
      auto text = optional<std::string>(name, "");
      if(text.empty()) {
        return std::nullopt;
      }

      auto parsed = models::parseIsoDate(text);
      if(!parsed.has_value()) {
        fail(member(name), "a YYYY-MM-DD date");
      }
      return parsed;
    }

    std::string member(std::string_view name) const {
      return std::format("{}.{}", path_, name);
    }

    void fail(const std::string &where, std::string_view expected) {
      if(!failure_.has_value()) {
        failure_ = Failure{UNEXPECTED_CODE::INVALID_INPUT, std::nullopt,
                           std::format("{} must be {}", where, expected)};
      }
    }

    const std::optional<Failure> &failure() const { return failure_; }

  private:
    template<typename T>
    static bool matches(const nlohmann::json &value) {
      if constexpr (std::is_same_v<T, std::string>) {
        return value.is_string();
      } else if constexpr (std::is_same_v<T, bool>) {
        return value.is_boolean();
      } else if constexpr (std::is_integral_v<T>) {
        return value.is_number_integer();
      } else {
        return value.is_number();
      }
    }

    template<typename T>
    static std::string_view expectation() {
      if constexpr (std::is_same_v<T, std::string>) {
        return "a string";
      } else if constexpr (std::is_same_v<T, bool>) {
        return "a boolean";
      } else if constexpr (std::is_integral_v<T>) {
        return "an integer";
      } else {
        return "a number";
      }
    }

    const nlohmann::json &object_;
    std::string path_;
    std::optional<Failure> failure_;
};

std::unexpected<Failure> invalid(std::string detail) {
  return std::unexpected(Failure{UNEXPECTED_CODE::INVALID_INPUT, std::nullopt, std::move(detail)});
}

std::expected<std::string, Failure> readFile(const std::filesystem::path &path) {
  std::ifstream stream{path};

  if(!stream.is_open()) {
    return std::unexpected(Failure{UNEXPECTED_CODE::NOT_FOUND, std::nullopt,
                                   "cannot open " + path.string()});
  }

  std::stringstream content;
  content << stream.rdbuf();

  return content.str();
}

std::expected<models::BankProfile, Failure>
parseProfile(const nlohmann::json &object, const std::string &path, int owner) {
  Reader reader(object, path);

  models::BankProfile profile;

  profile.owner = owner;
  profile.bankCode = reader.require<std::string>("bank");
  const auto layout = reader.optional<int>("layout", 0);
  profile.agency = reader.require<std::string>("agency");
  const auto account = reader.require<std::string>("account");
  profile.wallet = reader.require<std::string>("wallet");
  profile.agreement = reader.optional<std::string>("agreement", "");
  profile.transmissionCode = reader.optional<std::string>("transmission_code", "");
  profile.minIdentifier = reader.optional<std::int64_t>("min_identifier", profile.minIdentifier);
  profile.maxIdentifier = reader.optional<std::int64_t>("max_identifier", profile.maxIdentifier);
  profile.currentIdentifier = reader.optional<std::int64_t>("current_identifier", profile.minIdentifier);
  profile.currentSequence = reader.optional<std::int64_t>("current_sequence", profile.currentSequence);
  profile.maxSequence = reader.optional<std::int64_t>("max_sequence", profile.maxSequence);
  profile.active = reader.optional<bool>("active", true);

  if(const auto *instructions = reader.child("instructions")) {
    Reader inner(*instructions, reader.member("instructions"));

    profile.instructions.interestPercent = inner.optional<double>("interest_percent", 0.0);
    profile.instructions.finePercent = inner.optional<double>("fine_percent", 0.0);
    profile.instructions.protestDays = inner.optional<int>("protest_days", 0);
    profile.instructions.writeOffDays = inner.optional<int>("write_off_days", 0);

    if(inner.failure().has_value()) {
      return std::unexpected(*inner.failure());
    }
  }

  if(reader.failure().has_value()) {
    return std::unexpected(*reader.failure());
  }

  const auto *rules = bank::find(profile.bankCode);
  if(rules == nullptr) {
    return invalid(std::format("{}: bank {} is not supported", path, profile.bankCode));
  }

  if(layout == 0) {
    profile.layout = rules->layout;
  } else if(auto parsed = models::parseLayout(layout); parsed.has_value() && *parsed == rules->layout) {
    profile.layout = *parsed;
  } else {
    return invalid(std::format("{}: bank {} uses the {} column layout", path,
                               profile.bankCode, static_cast<int>(rules->layout)));
  }

  auto split = splitAccount(account);
  if(!split.has_value()) {
    return invalid(std::format("{}: account {} is not numeric", path, account));
  }

  profile.account = split->account;
  profile.accountDigit = split->digit;

  if(profile.minIdentifier < 0 || profile.minIdentifier > profile.maxIdentifier) {
    return invalid(std::format("{}: identifier range [{}, {}] is empty", path,
                               profile.minIdentifier, profile.maxIdentifier));
  }

  if(std::to_string(profile.maxIdentifier).size() > rules->identifier.width) {
    return invalid(std::format("{}: max_identifier {} does not fit {} digits", path,
                               profile.maxIdentifier, rules->identifier.width));
  }

  if(profile.maxSequence < 1) {
    return invalid(std::format("{}: max_sequence must be positive", path));
  }

  return profile;
}

std::expected<models::Payer, Failure>
parsePayer(const nlohmann::json &object, const std::string &path) {
  Reader reader(object, path);

  models::Payer payer;

  payer.name = reader.require<std::string>("name");
  payer.document = reader.require<std::string>("document");

  if(const auto *address = reader.child("address")) {
    Reader inner(*address, reader.member("address"));

    payer.address.street = inner.optional<std::string>("street", "");
    payer.address.neighborhood = inner.optional<std::string>("neighborhood", "");
    payer.address.city = inner.optional<std::string>("city", "");
    payer.address.state = inner.optional<std::string>("state", "");
    payer.address.zip = inner.optional<std::string>("zip", "");

    if(inner.failure().has_value()) {
      return std::unexpected(*inner.failure());
    }
  }

  if(reader.failure().has_value()) {
    return std::unexpected(*reader.failure());
  }

  return payer;
}

}

std::expected<SplitAccount, UNEXPECTED_CODE> splitAccount(std::string_view text) {
  std::string_view account = text;
  char digit = '0';

  if(auto dash = text.rfind('-'); dash != std::string_view::npos) {
    account = text.substr(0, dash);
    const auto tail = text.substr(dash + 1);

    if(tail.size() != 1 || !checksum::isDigits(tail)) {
      return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
    }
    digit = tail.front();
  }

  if(account.empty() || !checksum::isDigits(account)) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  return SplitAccount{std::string{account}, digit};
}

std::expected<Configuration, Failure> parseConfiguration(std::string_view text) {
  nlohmann::json data = nlohmann::json::parse(text, nullptr, false);

  if(data.is_discarded()) {
    return invalid("configuration is not valid JSON");
  }

  Reader reader(data, "configuration");

  Configuration configuration;
  configuration.database = reader.optional<std::string>("database", configuration.database);

  const auto *owners = reader.child("owners");

  if(reader.failure().has_value()) {
    return std::unexpected(*reader.failure());
  }

  if(owners == nullptr || !owners->is_array()) {
    return invalid("configuration.owners must be an array");
  }

  for(std::size_t index = 0; index < owners->size(); ++index) {
    const auto path = std::format("owners[{}]", index);
    Reader owner((*owners)[index], path);

    OwnerConfig entry;
    entry.beneficiary.owner = owner.require<int>("owner");
    entry.beneficiary.name = owner.require<std::string>("name");
    entry.beneficiary.document = owner.require<std::string>("document");

    const auto *profiles = owner.child("profiles");

    if(owner.failure().has_value()) {
      return std::unexpected(*owner.failure());
    }

    if(!checksum::validateCnpj(entry.beneficiary.document)) {
      return std::unexpected(Failure{UNEXPECTED_CODE::INVALID_DOCUMENT, std::nullopt,
          std::format("{}.document {} is not a valid CNPJ", path, entry.beneficiary.document)});
    }

    if(profiles != nullptr) {
      if(!profiles->is_array()) {
        return invalid(path + ".profiles must be an array");
      }

      for(std::size_t position = 0; position < profiles->size(); ++position) {
        auto profile = parseProfile((*profiles)[position],
                                    std::format("{}.profiles[{}]", path, position),
                                    entry.beneficiary.owner);
        if(!profile.has_value()) {
          return std::unexpected(profile.error());
        }
        entry.profiles.push_back(std::move(*profile));
      }
    }

    configuration.owners.push_back(std::move(entry));
  }

  return configuration;
}

std::expected<Configuration, Failure> loadConfiguration(const std::filesystem::path &path) {
  auto text = readFile(path);
  if(!text.has_value()) {
    return std::unexpected(text.error());
  }
  return parseConfiguration(*text);
}

std::expected<RequestFile, Failure> parseRequests(std::string_view text) {
  nlohmann::json data = nlohmann::json::parse(text, nullptr, false);

  if(data.is_discarded()) {
    return invalid("requests are not valid JSON");
  }

  Reader reader(data, "requests");

  RequestFile requests;
  requests.key.owner = reader.require<int>("owner");
  requests.key.bankCode = reader.require<std::string>("bank");
  requests.issueDate = reader.date("issue_date");

  const auto *invoices = reader.child("invoices");

  if(reader.failure().has_value()) {
    return std::unexpected(*reader.failure());
  }

  if(invoices == nullptr || !invoices->is_array()) {
    return invalid("requests.invoices must be an array");
  }

  for(std::size_t index = 0; index < invoices->size(); ++index) {
    const auto path = std::format("invoices[{}]", index);
    Reader invoice((*invoices)[index], path);

    models::Invoice entry;
    entry.amount = invoice.require<std::int64_t>("amount");
    entry.dueDate = invoice.date("due_date");
    entry.documentNumber = invoice.optional<std::string>("document_number", "");
    entry.especie = invoice.optional<std::string>("especie", entry.especie);

    const auto *payer = invoice.child("payer");

    if(invoice.failure().has_value()) {
      return std::unexpected(*invoice.failure());
    }

    if(payer == nullptr) {
      return invalid(path + ".payer must be present");
    }

    auto parsed = parsePayer(*payer, path + ".payer");
    if(!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }

    entry.payer = std::move(*parsed);
    requests.invoices.push_back(std::move(entry));
  }

  return requests;
}

std::expected<RequestFile, Failure> loadRequests(const std::filesystem::path &path) {
  auto text = readFile(path);
  if(!text.has_value()) {
    return std::unexpected(text.error());
  }
  return parseRequests(*text);
}

std::optional<Failure> seed(database::Connection *connection, const Configuration &configuration) {
  database::initSchema(connection);

  for(const auto &owner : configuration.owners) {
    if(auto error = database::saveBeneficiary(connection, owner.beneficiary)) {
      database::rollback(connection);
      return Failure{*error, std::nullopt,
                     std::format("saving beneficiary {}", owner.beneficiary.owner)};
    }

    for(const auto &profile : owner.profiles) {
      if(auto error = database::saveProfile(connection, profile)) {
        database::rollback(connection);
        return Failure{*error, std::nullopt,
                       std::format("saving profile owner={} bank={}", profile.owner, profile.bankCode)};
      }
    }
  }

  if(database::inTransaction(connection)) {
    if(auto error = database::commit(connection)) {
      return Failure{*error, std::nullopt, "commit"};
    }
  }

  std::cout << "[LOG:SEEDED] owners=" << configuration.owners.size() << std::endl;

  return std::nullopt;
}

}
