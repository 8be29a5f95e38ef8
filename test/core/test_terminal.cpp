#include <catch2/catch_test_macros.hpp>

#include <dgraph_client/core/terminal.hpp>

#include <cstdlib>

using namespace dgraph_client;

// ===========================================================================
// Terminal detection: basic smoke tests.
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("IsStdoutTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStdoutTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: returns bool without crashing", "[core][terminal]") {
    auto result = NoColorEnvSet();
    CHECK((result == true || result == false));
}

// ===========================================================================
// ResolveUseColor
// ===========================================================================

TEST_CASE("ResolveUseColor: --no-color always wins", "[core][terminal]") {
    CHECK_FALSE(ResolveUseColor(true, true, true));
    CHECK_FALSE(ResolveUseColor(false, true, true));
}

TEST_CASE("ResolveUseColor: follows tty without flags", "[core][terminal]") {
#ifndef _WIN32
    unsetenv("NO_COLOR");
#endif
    CHECK(ResolveUseColor(false, false, true));
    CHECK_FALSE(ResolveUseColor(false, false, false));
    CHECK(ResolveUseColor(true, false, false));
}

#ifndef _WIN32
TEST_CASE("ResolveUseColor: NO_COLOR disables color", "[core][terminal]") {
    setenv("NO_COLOR", "1", 1);
    CHECK_FALSE(ResolveUseColor(true, false, true));
    unsetenv("NO_COLOR");
}
#endif
