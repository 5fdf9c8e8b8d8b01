/// @file error.cpp
/// @brief Error handling implementation for arbor_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Structured formatting for tree diagnostics
/// - Explicit template instantiations for common Result types
/// - Error statistics

#include <arbor/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace arbor_core {

// =============================================================================
// TreeError
// =============================================================================

const char* tree_error_kind_name(TreeError::Kind kind) {
    switch (kind) {
        case TreeError::Kind::ContractViolation: return "ContractViolation";
        case TreeError::Kind::DuplicateGlobalKey: return "DuplicateGlobalKey";
        case TreeError::Kind::DuplicateKeys: return "DuplicateKeys";
        case TreeError::Kind::InternalConsistency: return "InternalConsistency";
        case TreeError::Kind::BuildFailure: return "BuildFailure";
        default: return "Unknown";
    }
}

std::string TreeError::format() const {
    std::ostringstream oss;
    oss << summary;
    for (const auto& line : details) {
        oss << "\n" << line;
    }
    for (const auto& chain : chains) {
        oss << "\n  " << chain;
    }
    return oss.str();
}

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

std::string format_tree_error(const TreeError& err) {
    std::ostringstream oss;
    oss << "[TreeError:" << tree_error_kind_name(err.kind) << "] " << err.format();
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, TreeError>) {
            oss << detail::format_tree_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " (" << key << ": " << value << ")";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> tree_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<TreeError>()) {
        s_error_stats.tree_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t tree_error_count() {
    return s_error_stats.tree_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.tree_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Tree: " << s_error_stats.tree_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace arbor_core
