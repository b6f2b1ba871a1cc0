#include "test_ingest.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "clearcore/ingest/csv_reader.hpp"

namespace clearcore::tests {

using common::Amount;

void test_decode_record() {
  auto deposit = ingest::decode_record({"deposit", "1", "7", "2.5"});
  assert(deposit.ok());
  const auto& dep = std::get<engine::Deposit>(*deposit.transaction);
  assert(dep.client == 1);
  assert(dep.tx == 7);
  assert(dep.amount == Amount::from_units(25'000));

  auto withdrawal = ingest::decode_record({"withdrawal", "65535", "4294967295", "1"});
  assert(withdrawal.ok());
  assert(std::get<engine::Withdrawal>(*withdrawal.transaction).client == 65535);

  assert(std::holds_alternative<engine::Dispute>(*ingest::decode_record({"dispute", "1", "7"}).transaction));
  assert(std::holds_alternative<engine::Resolve>(*ingest::decode_record({"resolve", "1", "7", ""}).transaction));
  assert(std::holds_alternative<engine::Chargeback>(*ingest::decode_record({"chargeback", "1", "7"}).transaction));

  assert(!ingest::decode_record({"deposit", "1", "7"}).ok());
  assert(!ingest::decode_record({"deposit", "1", "7", ""}).ok());
  assert(!ingest::decode_record({"deposit", "1", "7", "-3"}).ok());
  assert(!ingest::decode_record({"withdrawal", "1", "7", "x"}).ok());
  assert(!ingest::decode_record({"dispute", "1", "7", "1.0"}).ok());
  assert(!ingest::decode_record({"transfer", "1", "7", "1.0"}).ok());
  assert(!ingest::decode_record({"Deposit", "1", "7", "1.0"}).ok());
  assert(!ingest::decode_record({"deposit", "65536", "7", "1.0"}).ok());
  assert(!ingest::decode_record({"deposit", "1", "-7", "1.0"}).ok());
  assert(!ingest::decode_record({"deposit", "1"}).ok());

  const auto failed = ingest::decode_record({"deposit", "x", "1", "1.0"});
  assert(failed.error.find("client") != std::string::npos);
}

void test_csv_reader() {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\r\n"
      "\n"
      "withdrawal,\t2, 5, 3.25\n"
      "dispute, 1, 1,\n"
      "resolve, 1, 1\n");

  ingest::CsvReader reader(input, {});
  std::vector<engine::Transaction> transactions;
  engine::Transaction tx;
  while (reader.next(tx)) {
    transactions.push_back(tx);
  }

  assert(transactions.size() == 4);
  assert(engine::kind_of(transactions[0]) == engine::TransactionKind::kDeposit);
  assert(std::get<engine::Withdrawal>(transactions[1]).amount == Amount::from_units(32'500));
  assert(engine::kind_of(transactions[2]) == engine::TransactionKind::kDispute);
  assert(engine::kind_of(transactions[3]) == engine::TransactionKind::kResolve);

  assert(reader.stats().lines == 6);
  assert(reader.stats().decoded == 4);
  assert(reader.stats().rejected == 0);
}

void test_csv_reader_rejects() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,1.0\n"
      "deposit,1,2\n"
      "refund,1,3,1.0\n"
      "deposit,1,4,2.0\n");

  ingest::CsvReader reader(input, {});
  std::vector<ingest::DecodeError> errors;
  reader.set_error_handler([&](const ingest::DecodeError& err) { errors.push_back(err); });

  std::vector<engine::Transaction> transactions;
  engine::Transaction tx;
  while (reader.next(tx)) {
    transactions.push_back(tx);
  }

  assert(transactions.size() == 2);
  assert(std::get<engine::Deposit>(transactions[1]).tx == 4);
  assert(errors.size() == 2);
  assert(errors[0].line == 3);
  assert(errors[1].line == 4);
  assert(errors[1].message.find("refund") != std::string::npos);
  assert(reader.stats().rejected == 2);
}

void test_csv_reader_options() {
  // Headerless input: the first line is data.
  std::istringstream headerless("deposit;1;1;4.0\ndispute;1;1\n");
  ingest::CsvReader reader(headerless, {.delimiter = ';', .has_header = false, .trim_whitespace = true});
  engine::Transaction tx;
  assert(reader.next(tx));
  assert(std::get<engine::Deposit>(tx).amount == Amount::from_units(40'000));
  assert(reader.next(tx));
  assert(!reader.next(tx));

  // Missing header row while one is expected: the data line still decodes.
  std::istringstream missing_header("deposit,2,1,4.0\n");
  ingest::CsvReader lenient(missing_header, {});
  assert(lenient.next(tx));
  assert(std::get<engine::Deposit>(tx).client == 2);

  // A garbage first line is reported as an unexpected header.
  std::istringstream bad_header("kind,who,id\ndeposit,2,1,4.0\n");
  ingest::CsvReader strict(bad_header, {});
  std::vector<ingest::DecodeError> errors;
  strict.set_error_handler([&](const ingest::DecodeError& err) { errors.push_back(err); });
  assert(strict.next(tx));
  assert(errors.size() == 1);
  assert(errors[0].line == 1);
  assert(errors[0].message.find("unexpected header") == 0);

  // Without trimming, padded fields fail to decode.
  std::istringstream padded("deposit, 1, 1, 1.0\n");
  ingest::CsvReader untrimmed(padded, {.delimiter = ',', .has_header = false, .trim_whitespace = false});
  assert(!untrimmed.next(tx));
  assert(untrimmed.stats().rejected == 1);
}

}  // namespace clearcore::tests
