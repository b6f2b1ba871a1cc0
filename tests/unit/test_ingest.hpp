#pragma once

namespace clearcore::tests {

void test_decode_record();
void test_csv_reader();
void test_csv_reader_rejects();
void test_csv_reader_options();

}  // namespace clearcore::tests
