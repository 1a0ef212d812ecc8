#include <catch2/catch_test_macros.hpp>

#include <simplest_mcp/core/result.hpp>

#include <string>

using namespace simplest_mcp;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-out of value and error", "[result]") {
    auto ok = Result<std::string, int>::Ok("payload");
    CHECK(std::move(ok).Value() == "payload");

    auto err = Result<int, std::string>::Err("reason");
    CHECK(std::move(err).Error() == "reason");
}

// ===========================================================================
// AndThen
// ===========================================================================

TEST_CASE("Result: AndThen chains on Ok", "[result]") {
    auto r = Result<int, std::string>::Ok(10).AndThen([](int v) {
        return Result<std::string, std::string>::Ok(std::to_string(v * 2));
    });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "20");
}

TEST_CASE("Result: AndThen short-circuits on Err", "[result]") {
    bool called = false;
    auto r = Result<int, std::string>::Err("early").AndThen([&called](int) {
        called = true;
        return Result<int, std::string>::Ok(0);
    });
    CHECK_FALSE(called);
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "early");
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, std::string>::Err("bad");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "bad");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: exit codes follow the category", "[result][error]") {
    CHECK(Error{"ConfigLoader", "m", ErrorCategory::Config}.ExitCode() == 2);
    CHECK(Error{"HttpServer", "m", ErrorCategory::Transport}.ExitCode() == 3);
    CHECK(Error{"main", "m", ErrorCategory::Internal}.ExitCode() == 99);
}

TEST_CASE("Error: ToString names operation, category and message", "[result][error]") {
    Error e{"HttpServer", "Could not bind localhost:9000", ErrorCategory::Transport};
    CHECK(e.ToString() == "HttpServer (transport): Could not bind localhost:9000");
    CHECK(e == Error{"HttpServer", "Could not bind localhost:9000",
                     ErrorCategory::Transport});
    CHECK(e != Error{"HttpServer", "other", ErrorCategory::Transport});
}
