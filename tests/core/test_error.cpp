#include <catch2/catch_test_macros.hpp>

#include "slackline/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        slackline::Error err(slackline::ErrorCode::NotFound, "config not found");
        CHECK(err.code() == slackline::ErrorCode::NotFound);
        CHECK(err.message() == "config not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "config not found");
    }

    SECTION("error with detail") {
        slackline::Error err(slackline::ErrorCode::SerializationError,
                             "bad envelope", "missing payload");
        CHECK(err.code() == slackline::ErrorCode::SerializationError);
        CHECK(err.detail() == "missing payload");
        CHECK(err.what() == "bad envelope: missing payload");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = slackline::make_error(slackline::ErrorCode::InvalidConfig, "bad policy");
        CHECK(err.code() == slackline::ErrorCode::InvalidConfig);
        CHECK(err.message() == "bad policy");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = slackline::make_error(slackline::ErrorCode::IoError,
                                         "cannot open", "/tmp/x.json");
        CHECK(err.what() == "cannot open: /tmp/x.json");
    }
}

TEST_CASE("Result type success and error", "[error]") {
    SECTION("success") {
        slackline::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("error") {
        slackline::Result<int> result = std::unexpected(
            slackline::make_error(slackline::ErrorCode::InvalidArgument, "bad value"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == slackline::ErrorCode::InvalidArgument);
    }

    SECTION("void result") {
        slackline::VoidResult ok{};
        CHECK(ok.has_value());

        slackline::VoidResult failed = std::unexpected(
            slackline::make_error(slackline::ErrorCode::InternalError, "boom"));
        CHECK_FALSE(failed.has_value());
    }
}

TEST_CASE("error_code_to_string covers every code", "[error]") {
    using slackline::ErrorCode;
    using slackline::error_code_to_string;

    CHECK(error_code_to_string(ErrorCode::Unknown) == "UNKNOWN");
    CHECK(error_code_to_string(ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(error_code_to_string(ErrorCode::InvalidArgument) == "INVALID_ARGUMENT");
    CHECK(error_code_to_string(ErrorCode::NotFound) == "NOT_FOUND");
    CHECK(error_code_to_string(ErrorCode::SerializationError) == "SERIALIZATION_ERROR");
    CHECK(error_code_to_string(ErrorCode::IoError) == "IO_ERROR");
    CHECK(error_code_to_string(ErrorCode::ChannelError) == "CHANNEL_ERROR");
    CHECK(error_code_to_string(ErrorCode::InternalError) == "INTERNAL_ERROR");
}
