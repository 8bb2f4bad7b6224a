#include <catch2/catch.hpp>
#include <uidkit/result.hpp>
#include <memory>
#include <string>

using namespace uidkit;

static Result<std::string> namespace_or_fail(bool fail) {
    if (fail) {
        return UidError{UidError::InvalidNamespace, "invalid namespace UUID: 'x'"};
    }
    return Result<std::string>::ok("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
}

// Helper that uses UIDKIT_TRY to forward errors across Result types
static Result<size_t> namespace_length(bool fail) {
    auto ns = namespace_or_fail(fail);
    UIDKIT_TRY(ns);
    return Result<size_t>::ok(ns.value().size());
}

TEST_CASE("Ok result exposes its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result exposes its error", "[result]") {
    auto r = Result<int>::err(UidError{UidError::Parse, "bad hex"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == UidError::Parse);
    REQUIRE(r.error().message == "bad hex");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back only on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(UidError{UidError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("map() transforms Ok and forwards Err", "[result]") {
    auto ok = Result<int>::ok(5).map([](int x) { return std::to_string(x); });
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == "5");

    bool called = false;
    auto err = Result<int>::err(UidError{UidError::Config, "nope"})
        .map([&](int x) { called = true; return x; });
    REQUIRE(err.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(err.error().code == UidError::Config);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto chained = Result<int>::ok(5).and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.value() == 15);

    auto stopped = Result<int>::err(UidError{UidError::IO, "gone"}).and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(stopped.is_err());
    REQUIRE(stopped.error().code == UidError::IO);
}

TEST_CASE("or_else() recovers from Err", "[result]") {
    auto recovered = Result<int>::err(UidError{UidError::IO, "disk"})
        .or_else([](UidError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("UIDKIT_TRY forwards errors across Result types", "[result]") {
    auto ok = namespace_length(false);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 36);

    auto err = namespace_length(true);
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == UidError::InvalidNamespace);
}

TEST_CASE("Status carries no value", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(UidError{UidError::Config, "bad config"});
    REQUIRE(s.error().code == UidError::Config);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

TEST_CASE("UidError format() with hint and file", "[error]") {
    UidError e{UidError::Config, "seed: out of range", "use 0..4294967295", "ids.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("seed: out of range") != std::string::npos);
    REQUIRE(formatted.find("hint: use 0..4294967295") != std::string::npos);
    REQUIRE(formatted.find("--> ids.toml:3") != std::string::npos);
}

TEST_CASE("UidError format() without hint or file", "[error]") {
    UidError e{UidError::InvalidNamespace, "invalid namespace UUID: 'abc'"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[InvalidNamespace]: invalid namespace UUID: 'abc'");
}

TEST_CASE("UidError code_name() for all codes", "[error]") {
    REQUIRE(std::string(UidError::code_name(UidError::IO)) == "IO");
    REQUIRE(std::string(UidError::code_name(UidError::Parse)) == "Parse");
    REQUIRE(std::string(UidError::code_name(UidError::Config)) == "Config");
    REQUIRE(std::string(UidError::code_name(UidError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(UidError::code_name(UidError::InvalidNamespace)) == "InvalidNamespace");
}
