#pragma once

#include <vector>

#include "test_runner_utils.hpp"

namespace lansync::test {

std::vector<TestCase> peer_table_tests();
std::vector<TestCase> diff_engine_tests();
std::vector<TestCase> catalog_tests();
std::vector<TestCase> protocol_tests();
std::vector<TestCase> chunk_transfer_tests();
std::vector<TestCase> discovery_tests();
std::vector<TestCase> settings_tests();

} // namespace lansync::test
