#pragma once

namespace settlecore::tests {

void test_telemetry_sink();
void test_streaming_histogram();

}  // namespace settlecore::tests
