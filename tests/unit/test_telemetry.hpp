#pragma once

namespace txledger::tests {

void test_telemetry_sink();
void test_streaming_histogram();

}  // namespace txledger::tests
