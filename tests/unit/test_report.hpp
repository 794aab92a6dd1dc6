#pragma once

namespace settlecore::tests {

void test_report_empty();
void test_report_rows();
void test_report_stream_failure();

}  // namespace settlecore::tests
