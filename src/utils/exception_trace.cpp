#include "exception_trace.hpp"

namespace boundedtest {

static void CollectInto(const std::exception &e, std::vector<std::string> &trace) {
	trace.emplace_back(e.what());
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		CollectInto(nested, trace);
	} catch (...) {
		trace.emplace_back("unknown exception");
	}
}

std::vector<std::string> CollectExceptionTrace(const std::exception &e) {
	std::vector<std::string> trace;
	CollectInto(e, trace);
	return trace;
}

void PrintExceptionTrace(std::ostream &out, const std::exception &e) {
	const auto trace = CollectExceptionTrace(e);
	out << "Traceback (outermost first):\n";
	for (size_t i = 0; i < trace.size(); i++) {
		out << "  #" << i << " " << trace[i] << '\n';
	}
}

} // namespace boundedtest
