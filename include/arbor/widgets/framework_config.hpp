#pragma once

/// @file framework_config.hpp
/// @brief Debug and diagnostics switches for a widget tree
///
/// @code
/// auto config = FrameworkConfig::load("arbor.json");
/// if (config) {
///     config->apply_logging();
///     BuildOwner owner(*config);
/// }
/// @endcode
///
/// JSON layout (every key optional):
/// @code
/// {
///   "log_level": "debug",
///   "log_console": true,
///   "log_file": "logs/arbor.log",
///   "verify_global_keys": true,
///   "check_for_cycles": true,
///   "print_build_scope": false,
///   "print_schedule_build": false,
///   "print_rebuild_dirty_widgets": false,
///   "print_global_key_lifecycle": false,
///   "error_widget_details": true
/// }
/// @endcode

#include "fwd.hpp"

#include <arbor/core/error.hpp>

#include <string>

namespace arbor_widgets {

struct FrameworkConfig {
    /// spdlog level name applied by apply_logging()
    std::string log_level = "info";

    /// Echo log output to stdout
    bool log_console = true;

    /// Rotating log file shared by every channel; empty for none
    std::string log_file;

    /// Track global key reservations and verify them in finalize_tree()
    bool verify_global_keys = true;

    /// Reject attaching an element beneath itself
    bool check_for_cycles = true;

    /// Trace build scope entry and exit
    bool print_build_scope = false;

    /// Trace every schedule_build_for()
    bool print_schedule_build = false;

    /// Trace each dirty element as it rebuilds
    bool print_rebuild_dirty_widgets = false;

    /// Trace global key register, unregister and reclaim
    bool print_global_key_lifecycle = false;

    /// Include the exception message in the default error widget
    bool error_widget_details = true;

    [[nodiscard]] static arbor_core::Result<FrameworkConfig> from_json(const std::string& text);
    [[nodiscard]] static arbor_core::Result<FrameworkConfig> load(const std::string& path);

    [[nodiscard]] std::string to_json() const;

    /// Install the log sinks and apply log_level to every arbor channel
    [[nodiscard]] arbor_core::Result<void> apply_logging() const;
};

} // namespace arbor_widgets
