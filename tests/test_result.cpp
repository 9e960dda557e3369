#include <catch2/catch.hpp>
#include <strata/result.hpp>
#include <string>

using namespace strata;

static Result<int> try_double(Result<int> input) {
    STRATA_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status check_positive(int x) {
    if (x <= 0) {
        return StrataError{StrataError::InvalidArg, "not positive", "pass a number above zero"};
    }
    return ok_status();
}

static Result<std::string> describe(int x) {
    STRATA_TRY(check_positive(x));
    return Result<std::string>::ok("positive " + std::to_string(x));
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(StrataError{StrataError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("STRATA_TRY passes Ok through and returns Err early", "[result]") {
    REQUIRE(try_double(Result<int>::ok(4)).value() == 8);

    auto err = try_double(Result<int>::err(StrataError{StrataError::Parse, "bad"}));
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == StrataError::Parse);
}

TEST_CASE("STRATA_TRY converts a Status error into another Result type", "[result]") {
    REQUIRE(describe(3).value() == "positive 3");

    auto r = describe(-1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::InvalidArg);
    REQUIRE(r.error().hint == "pass a number above zero");
}

TEST_CASE("with_context prefixes the message of errors only", "[result]") {
    auto err = Result<int>::err(StrataError{StrataError::IO, "disk full"})
        .with_context("writing record");
    REQUIRE(err.error().message == "writing record: disk full");

    auto ok = Result<int>::ok(1).with_context("unused");
    REQUIRE(ok.value() == 1);
}

TEST_CASE("format() renders code, hint and location", "[result]") {
    StrataError e{StrataError::Manifest, "unknown field 'x'", "remove it", "strata.toml", 7};
    REQUIRE(e.format() ==
        "error[Manifest]: unknown field 'x'\n  help: remove it\n  --> strata.toml:7");

    StrataError bare{StrataError::IO, "boom"};
    REQUIRE(bare.format() == "error[IO]: boom");
}
