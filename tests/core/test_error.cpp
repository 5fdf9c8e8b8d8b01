// arbor_core Error and Result tests

#include <catch2/catch.hpp>
#include <arbor/core/error.hpp>
#include <string>

using namespace arbor_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ConfigError::file_not_found") {
        Error err = ConfigError::file_not_found("arbor.json");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.message().find("arbor.json") != std::string::npos);
        REQUIRE(err.as<ConfigError>()->path == "arbor.json");
    }

    SECTION("ConfigError::parse_failed") {
        Error err = ConfigError::parse_failed("unexpected token");
        REQUIRE(err.code() == ErrorCode::ParseError);
    }

    SECTION("ConfigError::invalid_value") {
        Error err = ConfigError::invalid_value("log_level", "expected a string");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "log_level");
    }

    SECTION("TreeError kinds map to codes") {
        REQUIRE(Error(TreeError::contract_violation("x")).code() == ErrorCode::ContractViolation);
        REQUIRE(Error(TreeError::duplicate_global_key("x", {}, {})).code() == ErrorCode::DuplicateKey);
        REQUIRE(Error(TreeError::duplicate_keys("x")).code() == ErrorCode::DuplicateKey);
        REQUIRE(Error(TreeError::internal_consistency("x")).code() == ErrorCode::InternalConsistency);
        REQUIRE(Error(TreeError::build_failure("x")).code() == ErrorCode::BuildFailure);
    }
}

// =============================================================================
// TreeError Tests
// =============================================================================

TEST_CASE("TreeError formatting", "[core][error][tree]") {
    TreeError error = TreeError::contract_violation("setState() called after dispose()",
                                                    {"Cancel timers in dispose()."});
    error.with_chain("Leaf ← Column ← RootWidget").with_detail("Check mounted() first.");

    const std::string text = error.format();
    REQUIRE(text.rfind("setState() called after dispose()", 0) == 0);
    REQUIRE(text.find("\nCancel timers in dispose().") != std::string::npos);
    REQUIRE(text.find("\nCheck mounted() first.") != std::string::npos);
    REQUIRE(text.find("\n  Leaf ← Column ← RootWidget") != std::string::npos);

    // Details come before chains
    REQUIRE(text.find("Check mounted()") < text.find("Leaf ← Column"));
}

TEST_CASE("TreeException", "[core][error][tree]") {
    TreeException ex(TreeError::duplicate_keys("Duplicate keys found."));
    REQUIRE(std::string(ex.what()) == "Duplicate keys found.");
    REQUIRE(ex.kind() == TreeError::Kind::DuplicateKeys);
    REQUIRE(ex.error().summary == "Duplicate keys found.");
    REQUIRE(std::string(tree_error_kind_name(ex.kind())) == "DuplicateKeys");
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with error") {
        Result<int> r = Err<int>(Error(ErrorCode::InvalidState, "Bad state"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidState);
    }
}

TEST_CASE("Result operations", "[core][result]") {
    SECTION("value_or") {
        Result<int> ok = Ok(42);
        Result<int> err = Err<int>(Error("error"));
        REQUIRE(ok.value_or(0) == 42);
        REQUIRE(err.value_or(0) == 0);
    }

    SECTION("map") {
        Result<int> r = Ok(21);
        auto mapped = r.map([](int x) { return x * 2; });
        REQUIRE(mapped.is_ok());
        REQUIRE(mapped.value() == 42);
    }

    SECTION("map on error") {
        Result<int> r = Err<int>(Error("error"));
        auto mapped = r.map([](int x) { return x * 2; });
        REQUIRE(mapped.is_err());
    }

    SECTION("and_then") {
        Result<int> r = Ok(21);
        auto chained = r.and_then([](int x) -> Result<int> { return Ok(x * 2); });
        REQUIRE(chained.is_ok());
        REQUIRE(chained.value() == 42);
    }

    SECTION("or_else") {
        Result<int> r = Err<int>(Error("error"));
        auto recovered = r.or_else([](const Error&) -> Result<int> { return Ok(0); });
        REQUIRE(recovered.is_ok());
        REQUIRE(recovered.value() == 0);
    }

    SECTION("unwrap on error throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }
}

// =============================================================================
// Error chain and statistics
// =============================================================================

TEST_CASE("build_error_chain", "[core][error]") {
    SECTION("generic message with context") {
        Error err = Error(ErrorCode::InvalidState, "bad").with_context("element", "Leaf");
        REQUIRE(build_error_chain(err) == "[InvalidState] bad (element: Leaf)");
    }

    SECTION("tree error") {
        Error err(TreeError::internal_consistency("Cycle detected."));
        const std::string text = build_error_chain(err);
        REQUIRE(text.find("[InternalConsistency]") == 0);
        REQUIRE(text.find("TreeError:InternalConsistency") != std::string::npos);
        REQUIRE(text.find("Cycle detected.") != std::string::npos);
    }

    SECTION("config error") {
        Error err = ConfigError::file_not_found("missing.json");
        REQUIRE(build_error_chain(err).find("(path: missing.json)") != std::string::npos);
    }
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);

    debug::record_error(Error("generic"));
    debug::record_error(Error(TreeError::build_failure("build threw")));

    REQUIRE(debug::total_error_count() == 2);
    REQUIRE(debug::tree_error_count() == 1);
    REQUIRE(debug::error_stats_summary().find("Tree: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
