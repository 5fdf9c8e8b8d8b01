/// @file framework_config.cpp
/// @brief JSON loading for FrameworkConfig

#include <arbor/widgets/framework_config.hpp>

#include <arbor/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace arbor_widgets {

using arbor_core::ConfigError;
using arbor_core::Err;
using arbor_core::Ok;
using arbor_core::Result;

namespace {

/// Read an optional boolean; a present key of another type is an error
bool read_flag(const nlohmann::json& j, const char* key, bool& out, std::string& error_key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        error_key = key;
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // anonymous namespace

Result<FrameworkConfig> FrameworkConfig::from_json(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Err<FrameworkConfig>(ConfigError::parse_failed(e.what()));
    }

    if (!j.is_object()) {
        return Err<FrameworkConfig>(ConfigError::parse_failed("top-level value must be an object"));
    }

    FrameworkConfig config;

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string()) {
            return Err<FrameworkConfig>(ConfigError::invalid_value("log_level", "expected a string"));
        }
        config.log_level = it->get<std::string>();
        if (!arbor_core::parse_log_level(config.log_level)) {
            return Err<FrameworkConfig>(ConfigError::invalid_value("log_level", "unknown level '" + config.log_level + "'"));
        }
    }

    if (auto it = j.find("log_file"); it != j.end()) {
        if (!it->is_string()) {
            return Err<FrameworkConfig>(ConfigError::invalid_value("log_file", "expected a string"));
        }
        config.log_file = it->get<std::string>();
    }

    std::string bad_key;
    bool ok = read_flag(j, "log_console", config.log_console, bad_key)
        && read_flag(j, "verify_global_keys", config.verify_global_keys, bad_key)
        && read_flag(j, "check_for_cycles", config.check_for_cycles, bad_key)
        && read_flag(j, "print_build_scope", config.print_build_scope, bad_key)
        && read_flag(j, "print_schedule_build", config.print_schedule_build, bad_key)
        && read_flag(j, "print_rebuild_dirty_widgets", config.print_rebuild_dirty_widgets, bad_key)
        && read_flag(j, "print_global_key_lifecycle", config.print_global_key_lifecycle, bad_key)
        && read_flag(j, "error_widget_details", config.error_widget_details, bad_key);
    if (!ok) {
        return Err<FrameworkConfig>(ConfigError::invalid_value(bad_key, "expected a boolean"));
    }

    return Ok(std::move(config));
}

Result<FrameworkConfig> FrameworkConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<FrameworkConfig>(ConfigError::file_not_found(path));
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto result = from_json(contents.str());
    if (!result) {
        result.error().with_context("path", path);
        arbor_core::core_logger()->warn("Failed to load framework config: {}",
                                        arbor_core::build_error_chain(result.error()));
    }
    return result;
}

std::string FrameworkConfig::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level;
    j["log_console"] = log_console;
    j["log_file"] = log_file;
    j["verify_global_keys"] = verify_global_keys;
    j["check_for_cycles"] = check_for_cycles;
    j["print_build_scope"] = print_build_scope;
    j["print_schedule_build"] = print_schedule_build;
    j["print_rebuild_dirty_widgets"] = print_rebuild_dirty_widgets;
    j["print_global_key_lifecycle"] = print_global_key_lifecycle;
    j["error_widget_details"] = error_widget_details;
    return j.dump(2);
}

Result<void> FrameworkConfig::apply_logging() const {
    auto level = arbor_core::parse_log_level(log_level);
    if (!level) {
        return Err(ConfigError::invalid_value("log_level", "unknown level '" + log_level + "'"));
    }

    arbor_core::LogSinks sinks;
    sinks.console = log_console;
    sinks.file = log_file;
    if (!arbor_core::configure_logging(sinks)) {
        return Err(ConfigError::invalid_value("log_file", "cannot open '" + log_file + "' for writing"));
    }
    arbor_core::set_log_level(*level);
    return Ok();
}

} // namespace arbor_widgets
