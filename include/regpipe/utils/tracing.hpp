#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace regpipe {
namespace utils {

/**
 * @brief Leveled logging for fit/transform/export operations
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error)
 * - Timestamped lines with file/line info on stderr
 * - Timing of operations at debug level
 *
 * Control via environment variable: REGPIPE_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   REGPIPE_DEBUG("Fitting " << rows << " rows");
 *   REGPIPE_TIMING_START();
 *   // ... do work ...
 *   REGPIPE_TIMING_END("Standardizer fit");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Read REGPIPE_LOG_LEVEL once; later calls are no-ops
	 */
	static void Initialize();

	/**
	 * @brief Override the level (also marks the tracer as initialized)
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name, case-insensitive
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	static uint64_t TimingStart();

	/**
	 * @brief Log the duration since TimingStart() at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

#define REGPIPE_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (regpipe::utils::Tracer::ShouldLog(level)) {                                                                \
			std::ostringstream regpipe_log_oss_;                                                                       \
			regpipe_log_oss_ << msg;                                                                                   \
			regpipe::utils::Tracer::Log(level, __FILE__, __LINE__, regpipe_log_oss_.str());                            \
		}                                                                                                              \
	} while (0)

#define REGPIPE_TRACE(msg) REGPIPE_LOG_AT(regpipe::utils::LogLevel::TRACE, msg)
#define REGPIPE_DEBUG(msg) REGPIPE_LOG_AT(regpipe::utils::LogLevel::DBG, msg)
#define REGPIPE_INFO(msg)  REGPIPE_LOG_AT(regpipe::utils::LogLevel::INFO, msg)
#define REGPIPE_WARN(msg)  REGPIPE_LOG_AT(regpipe::utils::LogLevel::WARN, msg)
#define REGPIPE_ERROR(msg) REGPIPE_LOG_AT(regpipe::utils::LogLevel::ERR, msg)

#define REGPIPE_TIMING_START() uint64_t regpipe_timing_handle_ = regpipe::utils::Tracer::TimingStart()

#define REGPIPE_TIMING_END(operation_name) regpipe::utils::Tracer::TimingEnd(regpipe_timing_handle_, operation_name)

} // namespace utils
} // namespace regpipe
