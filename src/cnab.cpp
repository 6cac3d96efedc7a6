#include "cnab.hpp"
#include "bank_rules.hpp"
#include "record_builder.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <optional>

namespace cnab {

using record::RecordBuilder;

Layout layoutFor(models::LAYOUT_KIND kind) {
  if(kind == models::FLAT_400) {
    return Flat400{};
  }
  return Segmented240{};
}

std::string render(const std::vector<std::string> &lines) {
  std::string content;

  for(const auto &line : lines) {
    content += line;
    content += LINE_TERMINATOR;
  }

  return content;
}

std::string especieCode(std::string_view especie) {
  if(especie == "DM") return "02";
  if(especie == "DS") return "04";
  return "04";
}

std::int64_t dailyInterest(std::int64_t amount, double monthlyPercent) {
  if(monthlyPercent <= 0.0) {
    return 0;
  }
  return static_cast<std::int64_t>(static_cast<double>(amount) * monthlyPercent / 3000.0);
}

namespace {

//1 for CPF, 2 for CNPJ
char documentKind(std::string_view document) {
  return record::digitsOnly(document).size() > 11 ? '2' : '1';
}

struct LineSink {
  std::size_t width;
  std::vector<std::string> lines;

  std::optional<Failure> add(const RecordBuilder &builder, std::string_view label,
                             std::optional<std::size_t> instrument = std::nullopt) {
    auto line = builder.build();

    if(!line.has_value()) {
      auto column = builder.errorColumn().value_or(builder.column());
      return Failure{line.error(), instrument,
                     std::format("{} at column {}", label, column)};
    }

    if(line->size() != width) {
      return Failure{UNEXPECTED_CODE::LINE_LENGTH_MISMATCH, instrument,
                     std::format("{} is {} wide", label, line->size())};
    }

    lines.push_back(std::move(*line));
    return std::nullopt;
  }
};

std::uint64_t unsignedAmount(std::int64_t value) {
  return value < 0 ? 0 : static_cast<std::uint64_t>(value);
}

//Santander transmission code: configured, or agency + account when absent
void transmissionCode(RecordBuilder &builder, const models::BankProfile &profile) {
  if(!profile.transmissionCode.empty()) {
    builder.numeric(record::digitsOnly(profile.transmissionCode), 15);
    return;
  }

  builder.numeric(record::digitsOnly(profile.agency), 4)
         .blanks(1)
         .numeric(record::digitsOnly(profile.account), 9)
         .literal(std::string(1, profile.accountDigit));
}

std::optional<Failure>
segmentP(LineSink &sink, const Remittance &remittance, const bank::BankRules &rules,
         std::size_t index, std::uint64_t sequence) {
  const auto &profile = remittance.profile;
  const auto &instrument = remittance.instruments[index];
  const auto &instructions = profile.instructions;

  auto check = bank::identifierCheckDigit(rules, profile, instrument.identifier);
  if(!check.has_value()) {
    return Failure{check.error(), index, "identifier check digit"};
  }

  const auto seuNumero = std::to_string(instrument.id);
  const auto interest = dailyInterest(instrument.amount, instructions.interestPercent);

  RecordBuilder line(Segmented240::WIDTH);

  line.at(1).literal(profile.bankCode)
      .at(4).literal("0001")
      .at(8).literal("3")
      .at(9).numeric(sequence, 5)
      .at(14).literal("P")
      .at(15).blanks(1)
      .at(16).literal("01")
      .at(18).numeric(record::digitsOnly(profile.agency), 4)
      .at(22).literal("0")
      .at(23).numeric(record::digitsOnly(profile.account), 9)
      .at(32).literal(std::string(1, profile.accountDigit))
      .at(33).zeros(9)
      .at(42).literal("0")
      .at(43).blanks(2)
      .at(45).numeric(unsignedAmount(instrument.identifier), 12)
      .at(57).literal(std::string(1, *check))
      .at(58).literal("5")
      .at(59).literal("1")
      .at(60).literal("1")
      .at(61).blanks(2)
      .at(63).text(seuNumero, 15)
      .at(78).date(instrument.dueDate, record::DDMMYYYY)
      .at(86).numeric(unsignedAmount(instrument.amount), 15)
      .at(101).literal("0000")
      .at(105).literal("0")
      .at(106).blanks(1)
      .at(107).literal(especieCode(instrument.especie))
      .at(109).literal("N")
      .at(110).date(instrument.issueDate, record::DDMMYYYY)
      .at(118).literal(interest > 0 ? "1" : "3")
      .at(119).zeros(8)
      .at(127).numeric(unsignedAmount(interest), 15)
      .at(142).literal("0")
      .at(143).zeros(8)
      .at(151).zeros(15)
      .at(166).zeros(15)
      .at(181).zeros(15)
      .at(196).text(seuNumero, 25);

  if(instructions.protestDays > 0) {
    line.at(221).literal("1").numeric(unsignedAmount(instructions.protestDays), 2);
  } else {
    line.at(221).literal("3").zeros(2);
  }

  line.at(224).literal("1")
      .at(225).literal("0")
      .at(226).numeric(instructions.writeOffDays > 0
                           ? unsignedAmount(instructions.writeOffDays) : 90, 2)
      .at(228).literal("09")
      .at(230).blanks(11);

  return sink.add(line, "segment P", index);
}

std::optional<Failure>
segmentQ(LineSink &sink, const Remittance &remittance, std::size_t index,
         std::uint64_t sequence) {
  const auto &profile = remittance.profile;
  const auto &payer = remittance.instruments[index].payer;
  const auto zip = record::digitsOnly(payer.address.zip);
  const std::string_view zipView{zip};

  RecordBuilder line(Segmented240::WIDTH);

  line.at(1).literal(profile.bankCode)
      .at(4).literal("0001")
      .at(8).literal("3")
      .at(9).numeric(sequence, 5)
      .at(14).literal("Q")
      .at(15).blanks(1)
      .at(16).literal("01")
      .at(18).literal(std::string(1, documentKind(payer.document)))
      .at(19).numeric(record::digitsOnly(payer.document), 15)
      .at(34).text(payer.name, 40)
      .at(74).text(payer.address.street, 40)
      .at(114).text(payer.address.neighborhood, 15)
      .at(129).numeric(zipView.substr(0, std::min<std::size_t>(5, zipView.size())), 5)
      .at(134).numeric(zipView.size() > 5 ? zipView.substr(5) : std::string_view{}, 3)
      .at(137).text(payer.address.city, 15)
      .at(152).text(payer.address.state, 2)
      .at(154).literal("0")
      .at(155).zeros(15)
      .at(170).blanks(40)
      .at(210).blanks(31);

  return sink.add(line, "segment Q", index);
}

std::expected<std::vector<std::string>, Failure>
assembleLayout(const Segmented240 &, const Remittance &remittance, const bank::BankRules &rules) {
  const auto &profile = remittance.profile;
  const auto &beneficiary = remittance.beneficiary;
  const auto sequence = unsignedAmount(remittance.sequence);
  const auto beneficiaryDocument = record::digitsOnly(beneficiary.document);

  LineSink sink{Segmented240::WIDTH, {}};

  RecordBuilder fileHeader(Segmented240::WIDTH);

  fileHeader.at(1).literal(profile.bankCode)
            .at(4).literal("0000")
            .at(8).literal("0")
            .at(9).blanks(8)
            .at(17).literal(std::string(1, documentKind(beneficiaryDocument)))
            .at(18).numeric(beneficiaryDocument, 15)
            .at(33);
  transmissionCode(fileHeader, profile);
  fileHeader.at(48).blanks(25)
            .at(73).text(beneficiary.name, 30)
            .at(103).text(rules.name, 30)
            .at(133).blanks(10)
            .at(143).literal("1")
            .at(144).date(remittance.generatedOn, record::DDMMYYYY)
            .at(152).blanks(6)
            .at(158).numeric(sequence, 6)
            .at(164).literal("040")
            .at(167).blanks(74);

  if(auto failure = sink.add(fileHeader, "file header")) {
    return std::unexpected(*failure);
  }

  RecordBuilder batchHeader(Segmented240::WIDTH);

  batchHeader.at(1).literal(profile.bankCode)
             .at(4).literal("0001")
             .at(8).literal("1")
             .at(9).literal("R")
             .at(10).literal("01")
             .at(12).blanks(2)
             .at(14).literal("030")
             .at(17).blanks(1)
             .at(18).literal(std::string(1, documentKind(beneficiaryDocument)))
             .at(19).numeric(beneficiaryDocument, 15)
             .at(34).blanks(20)
             .at(54);
  transmissionCode(batchHeader, profile);
  batchHeader.at(69).blanks(5)
             .at(74).text(beneficiary.name, 30)
             .at(104).blanks(40)
             .at(144).blanks(40)
             .at(184).numeric(sequence, 8)
             .at(192).date(remittance.generatedOn, record::DDMMYYYY)
             .at(200).blanks(41);

  if(auto failure = sink.add(batchHeader, "batch header")) {
    return std::unexpected(*failure);
  }

  std::uint64_t detail = 1;

  for(std::size_t index = 0; index < remittance.instruments.size(); ++index) {
    if(auto failure = segmentP(sink, remittance, rules, index, detail++)) {
      return std::unexpected(*failure);
    }
    if(auto failure = segmentQ(sink, remittance, index, detail++)) {
      return std::unexpected(*failure);
    }
  }

  //Batch header + details + this trailer; the file header is not counted
  const auto batchRecords = sink.lines.size();

  RecordBuilder batchTrailer(Segmented240::WIDTH);

  batchTrailer.at(1).literal(profile.bankCode)
              .at(4).literal("0001")
              .at(8).literal("5")
              .at(9).blanks(9)
              .at(18).numeric(batchRecords, 6)
              .at(24).blanks(217);

  if(auto failure = sink.add(batchTrailer, "batch trailer")) {
    return std::unexpected(*failure);
  }

  RecordBuilder fileTrailer(Segmented240::WIDTH);

  fileTrailer.at(1).literal(profile.bankCode)
             .at(4).literal("9999")
             .at(8).literal("9")
             .at(9).blanks(9)
             .at(18).numeric(1, 6)
             .at(24).numeric(sink.lines.size() + 1, 6)
             .at(30).blanks(211);

  if(auto failure = sink.add(fileTrailer, "file trailer")) {
    return std::unexpected(*failure);
  }

  return sink.lines;
}

std::optional<Failure>
flatDetail(LineSink &sink, const Remittance &remittance, const bank::BankRules &rules,
           std::size_t index, std::uint64_t sequence) {
  const auto &profile = remittance.profile;
  const auto &instrument = remittance.instruments[index];
  const auto &instructions = profile.instructions;
  const auto &payer = instrument.payer;
  const auto beneficiaryDocument = record::digitsOnly(remittance.beneficiary.document);

  auto check = bank::identifierCheckDigit(rules, profile, instrument.identifier);
  if(!check.has_value()) {
    return Failure{check.error(), index, "identifier check digit"};
  }

  const auto seuNumero = std::to_string(instrument.id);

  std::string_view instruction = "00";
  if(instructions.protestDays > 0) {
    instruction = "09";
  } else if(instructions.writeOffDays > 0) {
    instruction = "15";
  }

  RecordBuilder line(Flat400::WIDTH);

  line.at(1).literal("1")
      .at(2).literal(documentKind(beneficiaryDocument) == '2' ? "02" : "01")
      .at(4).numeric(beneficiaryDocument, 14)
      .at(18).literal("0")
      .at(19).literal("0")
      .at(20).blanks(1)
      .at(21).literal("0")
      .at(22).numeric(record::digitsOnly(profile.wallet), 3)
      .at(25).numeric(record::digitsOnly(profile.agency), 5)
      .at(30).numeric(record::digitsOnly(profile.account), 7)
      .at(37).literal(std::string(1, profile.accountDigit))
      .at(38).text(seuNumero, 25)
      .at(63).zeros(8)
      .at(71).numeric(unsignedAmount(instrument.identifier), 11)
      .at(82).literal(std::string(1, *check))
      .at(83).zeros(10)
      .at(93).literal("2")
      .at(94).literal("N")
      .at(95).blanks(13)
      .at(108).literal("I")
      .at(109).literal("01")
      .at(111).text(seuNumero, 10)
      .at(121).date(instrument.dueDate, record::DDMMYY)
      .at(127).numeric(unsignedAmount(instrument.amount), 13)
      .at(140).literal(profile.bankCode)
      .at(143).zeros(5)
      .at(148).literal(especieCode(instrument.especie))
      .at(150).literal("N")
      .at(151).date(instrument.issueDate, record::DDMMYY)
      .at(157).literal(instruction)
      .at(159).literal("00")
      .at(161).numeric(unsignedAmount(dailyInterest(instrument.amount, instructions.interestPercent)), 13)
      .at(174).zeros(6)
      .at(180).zeros(13)
      .at(193).zeros(13)
      .at(206).zeros(13)
      .at(219).literal(documentKind(payer.document) == '2' ? "02" : "01")
      .at(221).numeric(record::digitsOnly(payer.document), 14)
      .at(235).text(payer.name, 40)
      .at(275).text(payer.address.street, 40)
      .at(315).text(payer.address.neighborhood, 12)
      .at(327).numeric(record::digitsOnly(payer.address.zip), 8)
      .at(335).text(payer.address.city, 15)
      .at(350).text(payer.address.state, 2)
      .at(352).blanks(42)
      .at(394).literal("0")
      .at(395).numeric(sequence, 6);

  return sink.add(line, "detail", index);
}

std::expected<std::vector<std::string>, Failure>
assembleLayout(const Flat400 &, const Remittance &remittance, const bank::BankRules &rules) {
  const auto &profile = remittance.profile;

  LineSink sink{Flat400::WIDTH, {}};

  RecordBuilder header(Flat400::WIDTH);

  header.at(1).literal("0")
        .at(2).literal("1")
        .at(3).literal("REMESSA")
        .at(10).literal("01")
        .at(12).text("COBRANCA", 15)
        .at(27).text(profile.agreement, 20)
        .at(47).text(remittance.beneficiary.name, 30)
        .at(77).literal(profile.bankCode)
        .at(80).text(rules.name, 15)
        .at(95).date(remittance.generatedOn, record::DDMMYY)
        .at(101).blanks(8)
        .at(109).literal("MX")
        .at(111).numeric(unsignedAmount(remittance.sequence), 7)
        .at(118).blanks(277)
        .at(395).numeric(1, 6);

  if(auto failure = sink.add(header, "header")) {
    return std::unexpected(*failure);
  }

  for(std::size_t index = 0; index < remittance.instruments.size(); ++index) {
    if(auto failure = flatDetail(sink, remittance, rules, index, sink.lines.size() + 1)) {
      return std::unexpected(*failure);
    }
  }

  RecordBuilder trailer(Flat400::WIDTH);

  trailer.at(1).literal("9")
         .at(2).blanks(393)
         .at(395).numeric(sink.lines.size() + 1, 6);

  if(auto failure = sink.add(trailer, "trailer")) {
    return std::unexpected(*failure);
  }

  return sink.lines;
}

}

std::expected<std::vector<std::string>, Failure>
assemble(const Remittance &remittance) {
  const auto *rules = bank::find(remittance.profile.bankCode);

  if(rules == nullptr) {
    return std::unexpected(Failure{UNEXPECTED_CODE::NOT_FOUND, std::nullopt,
                                   "no layout for bank " + remittance.profile.bankCode});
  }

  if(rules->layout != remittance.profile.layout) {
    return std::unexpected(Failure{UNEXPECTED_CODE::INVALID_INPUT, std::nullopt,
                                   std::format("bank {} does not use the {} column layout",
                                               remittance.profile.bankCode,
                                               static_cast<int>(remittance.profile.layout))});
  }

  if(remittance.instruments.empty()) {
    return std::unexpected(Failure{UNEXPECTED_CODE::INVALID_INPUT, std::nullopt,
                                   "remittance without instruments"});
  }

  auto lines = std::visit([&](const auto &layout) {
    return assembleLayout(layout, remittance, *rules);
  }, layoutFor(remittance.profile.layout));

  if(!lines.has_value()) {
    std::cout << "[LOG:" << toString(lines.error().code) << "] " << describe(lines.error()) << std::endl;
  }

  return lines;
}

}
