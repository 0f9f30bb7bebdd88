#include "tests.hpp"

#include <iostream>

#include "tests/test_support.hpp"

int run_tests() {
	run_configuration_tests();
	run_transfer_tests();
	run_snapshot_tests();
	run_orchestrator_tests();
	run_script_tests();

	std::cout << "All tests passed." << std::endl;
	return 0;
}
