#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/core/terminal.hpp>

#include <cstdlib>

using namespace xrdinfo;

TEST_CASE("IsStderrTty: answers without side effects", "[core][terminal]") {
    auto first = IsStderrTty();
    CHECK(IsStderrTty() == first);
}

#ifndef _WIN32
TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    ::setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());

    ::unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}
#endif
