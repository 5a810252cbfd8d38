#include <catch2/catch_test_macros.hpp>

#include <mcp_proxy/core/terminal.hpp>

#include <cstdlib>
#include <string>

using namespace mcp_proxy;

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    const char* saved = std::getenv("NO_COLOR");
    std::string saved_value = saved ? saved : "";

    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());

    if (saved) {
        setenv("NO_COLOR", saved_value.c_str(), 1);
    }
}

TEST_CASE("ConsoleColorEnabled: flag and NO_COLOR disable color", "[core][terminal]") {
    CHECK_FALSE(ConsoleColorEnabled(true));

    const char* saved = std::getenv("NO_COLOR");
    std::string saved_value = saved ? saved : "";

    setenv("NO_COLOR", "", 1);
    CHECK_FALSE(ConsoleColorEnabled(false));
    unsetenv("NO_COLOR");
    CHECK(ConsoleColorEnabled(false) == IsStderrTty());

    if (saved) {
        setenv("NO_COLOR", saved_value.c_str(), 1);
    }
}
