#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "config.hpp"
#include "counters.hpp"
#include "database.hpp"
#include "remittance.hpp"

#define PROJECT_NAME "boleto-remessa"

namespace {

constexpr int EXIT_USAGE = 2;

nlohmann::json
failureJson(const Failure &failure) {
  nlohmann::json data;
  data["error"] = std::string{toString(failure.code)};
  data["detail"] = failure.detail;

  if(failure.instrument.has_value()) {
    data["instrument"] = *failure.instrument;
  }

  return data;
}

nlohmann::json
instrumentJson(const models::PayableInstrument &instrument) {
  nlohmann::json data;
  data["id"] = instrument.id;
  data["owner"] = instrument.owner;
  data["bank"] = instrument.bankCode;
  data["payer"]["name"] = instrument.payer.name;
  data["payer"]["document"] = instrument.payer.document;
  data["amount"] = instrument.amount;
  data["due_date"] = models::toIsoDate(instrument.dueDate);
  data["issue_date"] = models::toIsoDate(instrument.issueDate);
  data["identifier"] = instrument.formattedIdentifier;
  data["barcode"] = instrument.barcode;
  data["digitable_line"] = instrument.digitableLine;
  data["status"] = std::string{models::toString(instrument.status)};
  data["documents"] = instrument.sourceDocuments;

  return data;
}

int
fail(const Failure &failure) {
  std::cout << failureJson(failure).dump() << std::endl;
  return EXIT_FAILURE;
}

std::chrono::year_month_day
today() {
  return std::chrono::year_month_day{
    std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

int
init(const config::Configuration &configuration) {
  auto connection = database::getConnection(configuration.database, true);

  if(auto failure = config::seed(connection.get(), configuration)) {
    return fail(*failure);
  }

  nlohmann::json data;
  data["database"] = configuration.database;
  data["owners"] = configuration.owners.size();

  std::cout << data.dump() << std::endl;
  return EXIT_SUCCESS;
}

int
issue(const config::Configuration &configuration, const std::filesystem::path &requestsPath) {
  auto requests = config::loadRequests(requestsPath);

  if(!requests.has_value()) {
    return fail(requests.error());
  }

  const auto issueDate = requests->issueDate.value_or(today());
  const auto grouped = remittance::groupByPayer(requests->invoices, issueDate);

  auto connection = database::getConnection(configuration.database, true);

  auto issued = remittance::issueInstruments(connection.get(), requests->key, grouped, issueDate);

  if(!issued.has_value()) {
    return fail(issued.error());
  }

  nlohmann::json data = nlohmann::json::array();

  for(const auto &instrument : *issued) {
    data.push_back(instrumentJson(instrument));
  }

  std::cout << data.dump() << std::endl;
  return EXIT_SUCCESS;
}

template<typename Transition>
int
transitionAll(const config::Configuration &configuration, const std::vector<std::string> &ids,
              Transition transition) {
  nlohmann::json data = nlohmann::json::array();
  int status = EXIT_SUCCESS;

  for(const auto &text : ids) {
    std::int64_t id = 0;

    try {
      id = std::stoll(text);
    } catch(const std::exception &) {
      data.push_back(failureJson({UNEXPECTED_CODE::INVALID_INPUT, std::nullopt, "bad id " + text}));
      status = EXIT_FAILURE;
      continue;
    }

    //One transaction per instrument
    auto connection = database::getConnection(configuration.database, true);

    auto result = transition(connection.get(), id);

    if(!result.has_value()) {
      auto entry = failureJson(result.error());
      entry["id"] = id;
      data.push_back(entry);
      status = EXIT_FAILURE;
      continue;
    }

    data.push_back(instrumentJson(*result));
  }

  std::cout << data.dump() << std::endl;
  return status;
}

int
generate(const config::Configuration &configuration, const models::ProfileKey &key,
         const std::filesystem::path &directory) {
  auto connection = database::getConnection(configuration.database, true);

  auto approved = database::getInstrumentsByStatus(connection.get(), key, models::APPROVED);

  if(!approved.has_value()) {
    return fail({approved.error(), std::nullopt, "listing approved instruments"});
  }

  std::vector<std::int64_t> ids;
  for(const auto &instrument : *approved) {
    ids.push_back(instrument.id);
  }

  const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());

  auto generated = remittance::generateInto(connection.get(), ids, key, now, directory);

  if(!generated.has_value()) {
    return fail(generated.error());
  }

  const auto path = directory / generated->filename;

  nlohmann::json data;
  data["batch"] = generated->batch;
  data["filename"] = generated->filename;
  data["path"] = path.string();
  data["sequence"] = generated->sequence;
  data["instruments"] = nlohmann::json::array();

  for(const auto &encoding : generated->encoding) {
    nlohmann::json entry;
    entry["id"] = encoding.instrument;
    entry["identifier"] = encoding.formattedIdentifier;
    entry["barcode"] = encoding.barcode;
    entry["digitable_line"] = encoding.digitableLine;
    entry["status"] = std::string{models::toString(encoding.status)};
    data["instruments"].push_back(entry);
  }

  std::cout << data.dump() << std::endl;
  return EXIT_SUCCESS;
}

int
peek(const config::Configuration &configuration, const models::ProfileKey &key) {
  auto connection = database::getConnection(configuration.database, false);

  counters::IdentifierAllocator allocator(connection.get());
  counters::SequenceTracker tracker(connection.get());

  auto identifier = allocator.peek(key);
  auto sequence = tracker.peek(key);

  if(!identifier.has_value()) {
    return fail({identifier.error(), std::nullopt,
                 std::format("profile owner={} bank={}", key.owner, key.bankCode)});
  }

  if(!sequence.has_value()) {
    return fail({sequence.error(), std::nullopt,
                 std::format("profile owner={} bank={}", key.owner, key.bankCode)});
  }

  nlohmann::json data;
  data["owner"] = key.owner;
  data["bank"] = key.bankCode;
  data["next_identifier"] = *identifier;
  data["next_sequence"] = *sequence;

  std::cout << data.dump() << std::endl;
  return EXIT_SUCCESS;
}

int
exportBatch(const config::Configuration &configuration, const std::string &batch,
            const std::filesystem::path &directory) {
  std::int64_t id = 0;

  try {
    id = std::stoll(batch);
  } catch(const std::exception &) {
    return fail({UNEXPECTED_CODE::INVALID_INPUT, std::nullopt, "bad batch id " + batch});
  }

  auto connection = database::getConnection(configuration.database, false);

  auto path = remittance::exportBatch(connection.get(), id, directory);

  if(!path.has_value()) {
    return fail(path.error());
  }

  nlohmann::json data;
  data["batch"] = id;
  data["path"] = path->string();

  std::cout << data.dump() << std::endl;
  return EXIT_SUCCESS;
}

int
history(const config::Configuration &configuration, const std::string &instrument) {
  std::int64_t id = 0;

  try {
    id = std::stoll(instrument);
  } catch(const std::exception &) {
    return fail({UNEXPECTED_CODE::INVALID_INPUT, std::nullopt, "bad id " + instrument});
  }

  auto connection = database::getConnection(configuration.database, false);

  auto entries = remittance::history(connection.get(), id);

  if(!entries.has_value()) {
    return fail(entries.error());
  }

  nlohmann::json data = nlohmann::json::array();

  for(const auto &entry : *entries) {
    nlohmann::json item;
    item["action"] = std::string{models::actionOf(entry.to)};
    item["from"] = entry.from.has_value() ? nlohmann::json(std::string{models::toString(*entry.from)}) : nlohmann::json();
    item["to"] = std::string{models::toString(entry.to)};
    if(entry.batch.has_value()) {
      item["batch"] = *entry.batch;
    }
    item["at"] = entry.recordedAt;
    data.push_back(item);
  }

  std::cout << data.dump() << std::endl;
  return EXIT_SUCCESS;
}

int
usage() {
  std::cerr << "usage: " PROJECT_NAME " <config.json> <command>\n"
               "  init\n"
               "  issue <requests.json>\n"
               "  approve <id>...\n"
               "  cancel <id>...\n"
               "  generate <owner> <bank> [dir]\n"
               "  export <batch> [dir]\n"
               "  history <id>\n"
               "  peek <owner> <bank>" << std::endl;
  return EXIT_USAGE;
}

std::optional<models::ProfileKey>
profileKey(const std::string &owner, const std::string &bank) {
  try {
    return models::ProfileKey{std::stoi(owner), bank};
  } catch(const std::exception &) {
    return std::nullopt;
  }
}

}

int
main(int argc, char **argv) {
  if(argc < 3) {
    return usage();
  }

  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto &command = args[1];

  auto configuration = config::loadConfiguration(args[0]);

  if(!configuration.has_value()) {
    return fail(configuration.error());
  }

  try {
    if(command == "init") {
      return init(*configuration);
    }

    if(command == "issue" && args.size() == 3) {
      return issue(*configuration, args[2]);
    }

    if(command == "approve" && args.size() > 2) {
      return transitionAll(*configuration, {args.begin() + 2, args.end()}, remittance::approve);
    }

    if(command == "cancel" && args.size() > 2) {
      return transitionAll(*configuration, {args.begin() + 2, args.end()}, remittance::cancel);
    }

    if(command == "export" && (args.size() == 3 || args.size() == 4)) {
      return exportBatch(*configuration, args[2], args.size() == 4 ? args[3] : ".");
    }

    if(command == "history" && args.size() == 3) {
      return history(*configuration, args[2]);
    }

    if((command == "generate" && (args.size() == 4 || args.size() == 5))
        || (command == "peek" && args.size() == 4)) {
      auto key = profileKey(args[2], args[3]);

      if(!key.has_value()) {
        return usage();
      }

      if(command == "peek") {
        return peek(*configuration, *key);
      }

      return generate(*configuration, *key, args.size() == 5 ? args[4] : ".");
    }
  } catch(const std::runtime_error &error) {
    std::cerr << "[LOG:500] " << error.what() << std::endl;
    return EXIT_FAILURE;
  }

  return usage();
}
