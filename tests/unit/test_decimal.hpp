#pragma once

namespace settlecore::tests {

void test_decimal_rendering();
void test_decimal_parsing();
void test_decimal_arithmetic();

}  // namespace settlecore::tests
