#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_core module

#include <cstdint>

namespace arbor_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct TreeError;
class Error;
class TreeException;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

enum class LogChannel : std::uint8_t;
struct LogSinks;
class PassTrace;

} // namespace arbor_core
