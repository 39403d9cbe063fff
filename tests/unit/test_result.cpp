#include <catch2/catch_test_macros.hpp>
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include <string>
using namespace qkdnet::protocol;
namespace {
    Result<int, ProtocolFailure> Halve(int value) {
        if (value % 2 != 0) {
            return Result<int, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("odd"));
        }
        return Result<int, ProtocolFailure>::Ok(value / 2);
    }
    Result<int, ProtocolFailure> HalveTwice(int value) {
        auto first = Halve(value);
        if (first.IsErr()) {
            return first;
        }
        return Halve(first.Unwrap());
    }
    Result<Unit, ProtocolFailure> RequireEven(int value) {
        QKDNET_TRY(Halve(value).Map([](int) { return unit; }));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind chains operations") {
        auto bound = Result<int, ProtocolFailure>::Ok(12).Bind(Halve);
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 6);
    }
    SECTION("Ok() yields an optional") {
        REQUIRE(Result<int, std::string>::Ok(3).Ok() == 3);
        REQUIRE_FALSE(Result<int, std::string>::Err("x").Ok().has_value());
    }
}
TEST_CASE("Result<T, E> - UnwrapOr", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
}
TEST_CASE("Result<T, E> - Error propagation", "[result][core]") {
    SECTION("Early return forwards the first failure") {
        auto result = HalveTwice(6);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(HalveTwice(8).Unwrap() == 2);
    }
    SECTION("QKDNET_TRY returns the failing result") {
        REQUIRE(RequireEven(4).IsOk());
        auto result = RequireEven(3);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "odd");
    }
}
TEST_CASE("ProtocolFailure - Session fatality", "[result][core][failures]") {
    REQUIRE(ProtocolFailure::Authentication("x").IsSessionFatal());
    REQUIRE(ProtocolFailure::KeyMismatch("x").IsSessionFatal());
    REQUIRE_FALSE(ProtocolFailure::InvalidInput("x").IsSessionFatal());
    REQUIRE(ToString(ProtocolFailureType::NoPath) == "NoPathError");
}
