#pragma once

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace boundedtest {

/**
 * Leveled stderr logging for the test driver and the front-end.
 *
 * Lines look like "[timestamp] [boundedtest/LEVEL] file.cpp:42 - message".
 * The threshold comes from BOUNDEDTEST_LOG_LEVEL (trace, debug, info, warn,
 * error, none) unless SetLogLevel overrides it. Writes are serialized.
 *
 *   BOUNDEDTEST_DEBUG("Detrending " << n << " observations");
 *   BOUNDEDTEST_TIMING_START();
 *   ...
 *   BOUNDEDTEST_TIMING_END("Critical value simulation");
 */
enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Read BOUNDEDTEST_LOG_LEVEL once
	 *
	 * Unset or unrecognized values keep the build default
	 * (WARN with NDEBUG, INFO otherwise).
	 */
	static void Initialize();

	static void SetLogLevel(LogLevel level);
	static LogLevel GetLogLevel();

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @return Level, or std::nullopt for unknown names
	 */
	static std::optional<LogLevel> ParseLogLevel(const std::string &name);

	static bool ShouldLog(LogLevel level);

	/// Writes one line tagged with the basename of file
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/// Local time as "YYYY-mm-dd HH:MM:SS.mmm"
	static std::string GetTimestamp();

	/// Monotonic nanosecond stamp consumed by TimingEnd
	static uint64_t TimingStart();

	/// Logs "<operation> completed in X ms" at debug level and returns X
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();
	static void Write(LogLevel level, const std::string &prefix, const std::string &message);

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define BOUNDEDTEST_LOG_AT(level, msg)                                                                                 \
	do {                                                                                                               \
		if (boundedtest::Tracer::ShouldLog(level)) {                                                                   \
			std::ostringstream oss;                                                                                    \
			oss << msg;                                                                                                \
			boundedtest::Tracer::Log(level, __FILE__, __LINE__, oss.str());                                            \
		}                                                                                                              \
	} while (0)

/// Usage: BOUNDEDTEST_TRACE(message << stream << contents)
#define BOUNDEDTEST_TRACE(msg) BOUNDEDTEST_LOG_AT(boundedtest::LogLevel::TRACE, msg)
#define BOUNDEDTEST_DEBUG(msg) BOUNDEDTEST_LOG_AT(boundedtest::LogLevel::DBG, msg)
#define BOUNDEDTEST_INFO(msg)  BOUNDEDTEST_LOG_AT(boundedtest::LogLevel::INFO, msg)
#define BOUNDEDTEST_WARN(msg)  BOUNDEDTEST_LOG_AT(boundedtest::LogLevel::WARN, msg)
#define BOUNDEDTEST_ERROR(msg) BOUNDEDTEST_LOG_AT(boundedtest::LogLevel::ERR, msg)

/**
 * Usage:
 *   BOUNDEDTEST_TIMING_START();
 *   // ... do work ...
 *   BOUNDEDTEST_TIMING_END("Operation name");
 */
#define BOUNDEDTEST_TIMING_START() uint64_t boundedtest_timing_handle_ = boundedtest::Tracer::TimingStart()

#define BOUNDEDTEST_TIMING_END(operation_name) boundedtest::Tracer::TimingEnd(boundedtest_timing_handle_, operation_name)

} // namespace boundedtest
