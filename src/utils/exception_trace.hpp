#pragma once

#include <exception>
#include <ostream>
#include <string>
#include <vector>

namespace boundedtest {

/**
 * @brief Messages of an exception and everything nested in it
 *
 * Walks std::nested_exception links (std::throw_with_nested), outermost
 * first. Nested exceptions that do not derive from std::exception are
 * reported as "unknown exception".
 */
std::vector<std::string> CollectExceptionTrace(const std::exception &e);

/**
 * @brief Print the trace as "Traceback (outermost first):" followed by one
 * indented "#i message" line per level
 */
void PrintExceptionTrace(std::ostream &out, const std::exception &e);

} // namespace boundedtest
