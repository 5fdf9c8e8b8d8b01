/// @file log.cpp
/// @brief Channel loggers over spdlog
///
/// - One logger per LogChannel, registered with spdlog under its channel name
/// - A single sink list shared by all channels, swapped by configure_logging()
/// - Ordered structured fields and pass tracing

#include <arbor/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <exception>
#include <mutex>
#include <sstream>

namespace arbor_core {

// =============================================================================
// Channel registry
// =============================================================================

namespace {

struct ChannelRegistry {
    std::mutex mutex;
    std::array<std::shared_ptr<spdlog::logger>, log_channel_count> loggers;
    std::vector<spdlog::sink_ptr> sinks;
    bool sinks_ready = false;
    spdlog::level::level_enum level = spdlog::level::info;
};

ChannelRegistry& registry() {
    static ChannelRegistry instance;
    return instance;
}

spdlog::sink_ptr make_console_sink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    return sink;
}

/// Requires reg.mutex
std::shared_ptr<spdlog::logger>& logger_locked(ChannelRegistry& reg, LogChannel channel) {
    auto& slot = reg.loggers[static_cast<std::size_t>(channel)];
    if (slot) {
        return slot;
    }
    if (!reg.sinks_ready) {
        reg.sinks.push_back(make_console_sink());
        reg.sinks_ready = true;
    }

    const char* name = log_channel_name(channel);
    if (auto existing = spdlog::get(name)) {
        // Registered by someone else; take it over so configure_logging() reaches it
        existing->sinks() = reg.sinks;
        slot = existing;
    } else {
        slot = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
        spdlog::register_logger(slot);
    }
    slot->set_level(reg.level);
    return slot;
}

} // anonymous namespace

const char* log_channel_name(LogChannel channel) {
    switch (channel) {
        case LogChannel::Core: return "arbor_core";
        case LogChannel::Widgets: return "arbor_widgets";
        case LogChannel::Build: return "arbor_build";
    }
    return "arbor";
}

std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return logger_locked(reg, channel);
}

// =============================================================================
// Sinks
// =============================================================================

bool configure_logging(const LogSinks& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(make_console_sink());
    }

    std::string file_error;
    if (!config.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size, config.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    reg.sinks = std::move(sinks);
    reg.sinks_ready = true;
    for (auto& logger : reg.loggers) {
        if (logger) {
            logger->flush();
            logger->sinks() = reg.sinks;
        }
    }

    if (!file_error.empty()) {
        logger_locked(reg, LogChannel::Core)->warn("Log file '{}' unavailable: {}", config.file, file_error);
        return false;
    }
    return true;
}

// =============================================================================
// Levels
// =============================================================================

void set_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.level = level;
    for (auto& logger : reg.loggers) {
        if (logger) {
            logger->set_level(level);
        }
    }
}

void set_channel_level(LogChannel channel, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    logger_locked(reg, channel)->set_level(level);
}

spdlog::level::level_enum log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Fields
// =============================================================================

std::string format_fields(const std::string& message, const LogFields& fields) {
    if (fields.empty()) {
        return message;
    }

    std::ostringstream oss;
    oss << message << " {";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << fields[i].first << "=\"" << fields[i].second << "\"";
    }
    oss << "}";
    return oss.str();
}

void log_fields(spdlog::logger& logger, spdlog::level::level_enum level,
                const std::string& message, const LogFields& fields) {
    if (!logger.should_log(level)) {
        return;
    }
    logger.log(level, "{}", format_fields(message, fields));
}

// =============================================================================
// PassTrace
// =============================================================================

PassTrace::PassTrace(LogChannel channel, std::string name, bool enabled)
    : m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
    , m_uncaught_on_entry(std::uncaught_exceptions())
{
    if (!enabled) {
        return;
    }
    auto logger = channel_logger(channel);
    if (logger->should_log(spdlog::level::debug)) {
        m_logger = std::move(logger);
        m_logger->debug("{} started", m_name);
    }
}

PassTrace::~PassTrace() {
    if (!m_logger) {
        return;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_fields.emplace_back("us", std::to_string(elapsed.count()));
    const bool aborted = std::uncaught_exceptions() > m_uncaught_on_entry;
    m_logger->debug("{}", format_fields(m_name + (aborted ? " aborted" : " finished"), m_fields));
}

void PassTrace::add_field(std::string key, std::string value) {
    if (m_logger) {
        m_fields.emplace_back(std::move(key), std::move(value));
    }
}

} // namespace arbor_core
