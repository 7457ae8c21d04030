#include <catch2/catch_test_macros.hpp>

#include <mcp_base/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace mcp_base;

namespace {
void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}
} // namespace

TEST_CASE("IsTerminal: a closed descriptor is not a terminal", "[core][terminal]") {
    CHECK_FALSE(IsTerminal(-1));
}

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    SetEnv("NO_COLOR", "1");
    CHECK(NoColorEnvSet());

    SetEnv("NO_COLOR", "");
    CHECK_FALSE(NoColorEnvSet());

    UnsetEnv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}
