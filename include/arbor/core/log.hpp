#pragma once

/// @file log.hpp
/// @brief Logging channels for arbor
///
/// arbor logs through three spdlog loggers, one per channel. They share one
/// sink list, so configure_logging() redirects every channel at once.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor_core {

// =============================================================================
// Channels
// =============================================================================

enum class LogChannel : std::uint8_t {
    Core,     ///< Configuration and error plumbing
    Widgets,  ///< Error reports, global key lifecycle
    Build,    ///< Build scopes, scheduling, rebuild tracing
};

inline constexpr std::size_t log_channel_count = 3;

/// spdlog registry name of a channel ("arbor_core", "arbor_widgets", "arbor_build")
const char* log_channel_name(LogChannel channel);

/// Logger for a channel, created on first use
std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel);

inline std::shared_ptr<spdlog::logger> core_logger() { return channel_logger(LogChannel::Core); }
inline std::shared_ptr<spdlog::logger> widgets_logger() { return channel_logger(LogChannel::Widgets); }
inline std::shared_ptr<spdlog::logger> build_logger() { return channel_logger(LogChannel::Build); }

// =============================================================================
// Sinks
// =============================================================================

/// Where arbor log output goes
struct LogSinks {
    bool console = true;

    /// Rotating log file shared by all channels; empty disables it
    std::string file;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

/// Replace the sinks of every channel, including loggers already handed out.
///
/// Returns false when the file sink could not be opened; console output is
/// configured regardless.
bool configure_logging(const LogSinks& sinks);

// =============================================================================
// Levels
// =============================================================================

/// Set the level of every channel
void set_log_level(spdlog::level::level_enum level);

void set_channel_level(LogChannel channel, spdlog::level::level_enum level);

/// Level last passed to set_log_level()
spdlog::level::level_enum log_level();

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Fields
// =============================================================================

/// Ordered key/value pairs appended to a log line
using LogFields = std::vector<std::pair<std::string, std::string>>;

/// Render message followed by {key="value", ...}
std::string format_fields(const std::string& message, const LogFields& fields);

/// Log message with fields; fields are only rendered when the level is enabled
void log_fields(spdlog::logger& logger, spdlog::level::level_enum level,
                const std::string& message, const LogFields& fields);

// =============================================================================
// PassTrace
// =============================================================================

/// Traces one framework pass (a build scope, a finalize) on a channel.
///
/// Logs at debug level on entry and exit when enabled. Fields added during
/// the pass are reported on exit, together with the elapsed time and whether
/// the pass was left by an exception.
class PassTrace {
public:
    PassTrace(LogChannel channel, std::string name, bool enabled);
    ~PassTrace();

    PassTrace(const PassTrace&) = delete;
    PassTrace& operator=(const PassTrace&) = delete;

    [[nodiscard]] bool enabled() const noexcept { return m_logger != nullptr; }

    void add_field(std::string key, std::string value);

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    LogFields m_fields;
    std::chrono::steady_clock::time_point m_start;
    int m_uncaught_on_entry = 0;
};

} // namespace arbor_core
