// linkvec_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <linkvec/core/error.hpp>
#include <string>

using namespace linkvec_core;

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

TEST_CASE("ListError factory methods", "[core][error]") {
    SECTION("out_of_bounds") {
        Error err = ListError::out_of_bounds(3, 2);
        REQUIRE(err.code() == ErrorCode::OutOfRange);
        REQUIRE(err.is<ListError>());

        const ListError* list_err = err.as<ListError>();
        REQUIRE(list_err != nullptr);
        REQUIRE(list_err->kind == ListError::Kind::OutOfBounds);
        REQUIRE(list_err->index == 3);
        REQUIRE(list_err->length == 2);
        REQUIRE(err.message() == "Index 3 out of bounds (len 2)");
    }

    SECTION("structural errors map to InvalidState") {
        REQUIRE(Error(ListError::broken_chain(1, 4)).code() == ErrorCode::InvalidState);
        REQUIRE(Error(ListError::count_mismatch(5, 2, 2)).code() == ErrorCode::InvalidState);
        REQUIRE(Error(ListError::endpoint_mismatch("x", 0)).code() == ErrorCode::InvalidState);
        REQUIRE(Error(ListError::cycle(7, 3)).code() == ErrorCode::InvalidState);
        REQUIRE(Error(ListError::slot_aliased(1, 3)).code() == ErrorCode::InvalidState);
    }

    SECTION("count_mismatch message names all three counts") {
        Error err = ListError::count_mismatch(5, 2, 2);
        REQUIRE(err.message().find("5") != std::string::npos);
        REQUIRE(err.message().find("len 2") != std::string::npos);
        REQUIRE(err.message().find("free 2") != std::string::npos);
    }
}

TEST_CASE("ConfigError factory methods", "[core][error]") {
    SECTION("file_not_found") {
        Error err = ConfigError::file_not_found("bench.toml");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<ConfigError>()->source == "bench.toml");
    }

    SECTION("parse_error") {
        Error err = ConfigError::parse_error("bench.toml", "unexpected '='");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message().find("unexpected '='") != std::string::npos);
    }

    SECTION("invalid_value") {
        Error err = ConfigError::invalid_value("struct_count", "must be greater than zero");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "struct_count");
        REQUIRE_FALSE(err.is<ListError>());
        REQUIRE(err.as<ListError>() == nullptr);
    }
}

TEST_CASE("build_error_chain", "[core][error]") {
    SECTION("list error") {
        Error err = ListError::out_of_bounds(1, 1);
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[OutOfRange]") != std::string::npos);
        REQUIRE(chain.find("[ListError:OutOfBounds]") != std::string::npos);
    }

    SECTION("config error with key") {
        Error err = ConfigError::invalid_value("log.level", "unknown level 'loud'");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[InvalidArgument]") != std::string::npos);
        REQUIRE(chain.find("(key: log.level)") != std::string::npos);
    }

    SECTION("context entries") {
        Error err("plain");
        err.with_context("phase", "construction");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[Unknown] plain") == 0);
        REQUIRE(chain.find("phase: construction") != std::string::npos);
    }
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();

    debug::record_error(ListError::out_of_bounds(0, 0));
    debug::record_error(ConfigError::file_not_found("a.toml"));
    debug::record_error(Error("generic"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::list_error_count() == 1);
    REQUIRE(debug::config_error_count() == 1);
    REQUIRE(debug::error_stats_summary().find("Total: 3") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
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
        REQUIRE_FALSE(r.is_ok());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with list error") {
        Result<int> r = Err<int>(ListError::out_of_bounds(4, 1));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::OutOfRange);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.unwrap() == 42);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("and_then on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
    }
}
