/// @file test_config.cpp
/// @brief Tests for FrameworkConfig JSON loading

#include <catch2/catch.hpp>

#include <arbor/core/log.hpp>
#include <arbor/widgets/framework_config.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace arbor_widgets;
using arbor_core::ErrorCode;

TEST_CASE("FrameworkConfig defaults", "[widgets][config]") {
    FrameworkConfig config;
    REQUIRE(config.log_level == "info");
    REQUIRE(config.log_console);
    REQUIRE(config.log_file.empty());
    REQUIRE(config.verify_global_keys);
    REQUIRE(config.check_for_cycles);
    REQUIRE_FALSE(config.print_build_scope);
    REQUIRE(config.error_widget_details);
}

TEST_CASE("FrameworkConfig::from_json", "[widgets][config]") {
    SECTION("empty object keeps defaults") {
        auto result = FrameworkConfig::from_json("{}");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().verify_global_keys);
        REQUIRE(result.value().log_level == "info");
    }

    SECTION("every key is read") {
        auto result = FrameworkConfig::from_json(R"({
            "log_level": "debug",
            "log_console": false,
            "log_file": "logs/arbor.log",
            "verify_global_keys": false,
            "check_for_cycles": false,
            "print_build_scope": true,
            "print_schedule_build": true,
            "print_rebuild_dirty_widgets": true,
            "print_global_key_lifecycle": true,
            "error_widget_details": false
        })");
        REQUIRE(result.is_ok());
        const FrameworkConfig& config = result.value();
        REQUIRE(config.log_level == "debug");
        REQUIRE_FALSE(config.log_console);
        REQUIRE(config.log_file == "logs/arbor.log");
        REQUIRE_FALSE(config.verify_global_keys);
        REQUIRE_FALSE(config.check_for_cycles);
        REQUIRE(config.print_build_scope);
        REQUIRE(config.print_schedule_build);
        REQUIRE(config.print_rebuild_dirty_widgets);
        REQUIRE(config.print_global_key_lifecycle);
        REQUIRE_FALSE(config.error_widget_details);
    }

    SECTION("malformed JSON") {
        auto result = FrameworkConfig::from_json("{ not json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("top level must be an object") {
        REQUIRE(FrameworkConfig::from_json("[1, 2]").error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong value types") {
        auto flag = FrameworkConfig::from_json(R"({"check_for_cycles": "yes"})");
        REQUIRE(flag.is_err());
        REQUIRE(flag.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(flag.error().as<arbor_core::ConfigError>()->key == "check_for_cycles");

        auto level = FrameworkConfig::from_json(R"({"log_level": 3})");
        REQUIRE(level.error().as<arbor_core::ConfigError>()->key == "log_level");

        auto file = FrameworkConfig::from_json(R"({"log_file": false})");
        REQUIRE(file.error().as<arbor_core::ConfigError>()->key == "log_file");
    }

    SECTION("unknown log level") {
        auto result = FrameworkConfig::from_json(R"({"log_level": "chatty"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("chatty") != std::string::npos);
    }
}

TEST_CASE("FrameworkConfig::to_json", "[widgets][config]") {
    FrameworkConfig config;
    config.log_level = "warn";
    config.log_file = "arbor.log";
    config.check_for_cycles = false;

    auto parsed = nlohmann::json::parse(config.to_json());
    REQUIRE(parsed["log_level"] == "warn");
    REQUIRE(parsed["check_for_cycles"] == false);
    REQUIRE(parsed["log_file"] == "arbor.log");
    REQUIRE(parsed["log_console"] == true);
    REQUIRE(parsed["verify_global_keys"] == true);

    auto reloaded = FrameworkConfig::from_json(config.to_json());
    REQUIRE(reloaded.is_ok());
    REQUIRE(reloaded.value().log_level == "warn");
    REQUIRE_FALSE(reloaded.value().check_for_cycles);
}

TEST_CASE("FrameworkConfig::load", "[widgets][config]") {
    SECTION("missing file") {
        auto result = FrameworkConfig::load("arbor_config_that_does_not_exist.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("file on disk") {
        const std::string path = "arbor_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"print_build_scope": true})";
        }
        auto result = FrameworkConfig::load(path);
        std::remove(path.c_str());

        REQUIRE(result.is_ok());
        REQUIRE(result.value().print_build_scope);
    }

    SECTION("bad file records its path") {
        const std::string path = "arbor_test_bad_config.json";
        {
            std::ofstream out(path);
            out << "[]";
        }
        auto result = FrameworkConfig::load(path);
        std::remove(path.c_str());

        REQUIRE(result.is_err());
        auto* recorded = result.error().get_context("path");
        REQUIRE(recorded != nullptr);
        REQUIRE(*recorded == path);
    }
}

TEST_CASE("FrameworkConfig::apply_logging", "[widgets][config]") {
    SECTION("levels") {
        FrameworkConfig config;
        config.log_level = "error";
        REQUIRE(config.apply_logging().is_ok());
        REQUIRE(arbor_core::widgets_logger()->level() == spdlog::level::err);
        REQUIRE(arbor_core::build_logger()->level() == spdlog::level::err);

        config.log_level = "nonsense";
        REQUIRE(config.apply_logging().is_err());

        config.log_level = "info";
        REQUIRE(config.apply_logging().is_ok());
    }

    SECTION("log file") {
        const std::string path = "arbor_test_config.log";
        FrameworkConfig config;
        config.log_console = false;
        config.log_file = path;
        config.log_level = "debug";
        REQUIRE(config.apply_logging().is_ok());
        arbor_core::widgets_logger()->info("routed through the config");

        REQUIRE(FrameworkConfig{}.apply_logging().is_ok());
        std::ostringstream contents;
        {
            std::ifstream in(path);
            contents << in.rdbuf();
        }
        std::remove(path.c_str());
        REQUIRE(contents.str().find("[arbor_widgets] routed through the config") != std::string::npos);
    }

    SECTION("unwritable log file") {
        const std::string blocker = "arbor_test_config_blocker";
        {
            std::ofstream out(blocker);
            out << "x";
        }
        FrameworkConfig config;
        config.log_file = blocker + "/arbor.log";
        auto result = config.apply_logging();
        std::remove(blocker.c_str());

        REQUIRE(result.is_err());
        REQUIRE(result.error().as<arbor_core::ConfigError>()->key == "log_file");
        REQUIRE(FrameworkConfig{}.apply_logging().is_ok());
    }
}
