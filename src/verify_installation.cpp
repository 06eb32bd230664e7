// Installation check: generates a bounded random walk and runs every test
// configuration once. Exit code 0 when everything ran, 1 otherwise.

#include "include/verification.hpp"
#include "utils/tracing.hpp"

#include <iostream>

int main() {
	boundedtest::Tracer::Initialize();
	try {
		return boundedtest::RunVerification(std::cout, std::cerr, boundedtest::DefaultTestRunner());
	} catch (...) {
		// Only non-standard exceptions get here
		std::cout << "\n✗ ERROR: unknown exception" << std::endl;
		return 1;
	}
}
