#include "tracing.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace boundedtest {

LogLevel Tracer::current_level_ = Tracer::DefaultLevel();
bool Tracer::initialized_ = false;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

LogLevel Tracer::DefaultLevel() {
	// Release builds suppress INFO messages
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

std::optional<LogLevel> Tracer::ParseLogLevel(const std::string &name) {
	std::string key = name;
	for (auto &c : key) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (key == "trace") {
		return LogLevel::TRACE;
	} else if (key == "debug") {
		return LogLevel::DBG;
	} else if (key == "info") {
		return LogLevel::INFO;
	} else if (key == "warn") {
		return LogLevel::WARN;
	} else if (key == "error") {
		return LogLevel::ERR;
	} else if (key == "none") {
		return LogLevel::NONE;
	}
	return std::nullopt;
}

void Tracer::Initialize() {
	if (initialized_) {
		return;
	}
	initialized_ = true;
	current_level_ = DefaultLevel();

	const char *env_level = std::getenv("BOUNDEDTEST_LOG_LEVEL");
	if (env_level == nullptr) {
		return;
	}
	auto parsed = ParseLogLevel(env_level);
	if (parsed) {
		current_level_ = *parsed;
	}
}

void Tracer::SetLogLevel(LogLevel level) {
	current_level_ = level;
	initialized_ = true;
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	Initialize();
	return level != LogLevel::NONE && level >= current_level_;
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	}
	return "UNKNOWN";
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_time {};
	localtime_r(&time, &local_time);

	std::ostringstream oss;
	oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}

void Tracer::Write(LogLevel level, const std::string &prefix, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}
	const std::string stamp = GetTimestamp();
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << stamp << "] [boundedtest/" << GetLevelName(level) << "] " << prefix << message << '\n';
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	const auto slash = file.find_last_of("/\\");
	const std::string base = slash == std::string::npos ? file : file.substr(slash + 1);
	Write(level, base + ":" + std::to_string(line) + " - ", message);
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	Write(level, "", message);
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
	                                 std::chrono::steady_clock::now().time_since_epoch())
	                                 .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	uint64_t end_ns = TimingStart();
	double duration_ms = static_cast<double>(end_ns - handle) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << operation_name << " completed in " << duration_ms << " ms";
	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace boundedtest
