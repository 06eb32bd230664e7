#pragma once

#include "boundedtest.hpp"
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace boundedtest {

/// Signature of BoundedUnitRootTest without the extra options
using TestRunner = std::function<TestReport(const std::vector<double> &data, const Bounds &bounds,
                                            const std::string &statistic, const std::string &detrending,
                                            const std::string &lrv_method)>;

/// Runner calling BoundedUnitRootTest with its default options
TestRunner DefaultTestRunner();

/**
 * Installation check: generates a bounded random walk (seed 42, T = 100,
 * bounds [-5, 5]) and runs every detrending method, the all-statistics mode
 * and the autoregressive LRV through run.
 *
 * Progress and results go to out. On the first failure prints
 * "✗ ERROR: <message>" to out and the nested exception trace to err.
 *
 * @return 0 when every step ran, 1 otherwise
 */
int RunVerification(std::ostream &out, std::ostream &err, const TestRunner &run);

} // namespace boundedtest
