#pragma once

namespace clearcore::tests {

void test_write_accounts();

}  // namespace clearcore::tests
