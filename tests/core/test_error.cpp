#include <catch2/catch_test_macros.hpp>

#include "cmdguard/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        cmdguard::Error err(cmdguard::ErrorCode::NotFound, "policy not found");
        CHECK(err.code() == cmdguard::ErrorCode::NotFound);
        CHECK(err.message() == "policy not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "policy not found");
    }

    SECTION("error with detail") {
        cmdguard::Error err(cmdguard::ErrorCode::PolicyValidation,
                            "Invalid policy field 'profiles'", "required field is missing");
        CHECK(err.code() == cmdguard::ErrorCode::PolicyValidation);
        CHECK(err.detail() == "required field is missing");
        CHECK(err.what() == "Invalid policy field 'profiles': required field is missing");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = cmdguard::make_error(cmdguard::ErrorCode::IoError, "disk full");
        CHECK(err.code() == cmdguard::ErrorCode::IoError);
        CHECK(err.message() == "disk full");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = cmdguard::make_error(cmdguard::ErrorCode::SerializationError,
                                        "Corrupt policy file", "line 3");
        CHECK(err.what() == "Corrupt policy file: line 3");
    }
}

TEST_CASE("Result type success and error", "[error]") {
    SECTION("success") {
        cmdguard::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("error") {
        cmdguard::Result<int> result = std::unexpected(
            cmdguard::make_error(cmdguard::ErrorCode::InvalidArgument, "bad value"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == cmdguard::ErrorCode::InvalidArgument);
    }

    SECTION("void result") {
        cmdguard::VoidResult ok{};
        CHECK(ok.has_value());

        cmdguard::VoidResult failed = std::unexpected(
            cmdguard::make_error(cmdguard::ErrorCode::InternalError, "boom"));
        CHECK_FALSE(failed.has_value());
    }
}

TEST_CASE("error_code_to_string covers all codes", "[error]") {
    using cmdguard::ErrorCode;
    CHECK(cmdguard::error_code_to_string(ErrorCode::Unknown) == "UNKNOWN");
    CHECK(cmdguard::error_code_to_string(ErrorCode::PolicyValidation) == "POLICY_VALIDATION_ERROR");
    CHECK(cmdguard::error_code_to_string(ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(cmdguard::error_code_to_string(ErrorCode::InvalidArgument) == "INVALID_ARGUMENT");
    CHECK(cmdguard::error_code_to_string(ErrorCode::NotFound) == "NOT_FOUND");
    CHECK(cmdguard::error_code_to_string(ErrorCode::IoError) == "IO_ERROR");
    CHECK(cmdguard::error_code_to_string(ErrorCode::SerializationError) == "SERIALIZATION_ERROR");
    CHECK(cmdguard::error_code_to_string(ErrorCode::InternalError) == "INTERNAL_ERROR");
}
