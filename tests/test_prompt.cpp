#include <catch2/catch.hpp>
#include <sstream>
#include "prompt.hpp"

TEST_CASE("is_yes accepts y in any case, nothing else", "[prompt]") {
    REQUIRE(is_yes("y"));
    REQUIRE(is_yes("Y"));
    REQUIRE(is_yes(" y\r\n"));
    REQUIRE_FALSE(is_yes("yes"));
    REQUIRE_FALSE(is_yes("n"));
    REQUIRE_FALSE(is_yes(""));
}

TEST_CASE("stream prompt asks once per call and reads one line", "[prompt]") {
    std::istringstream in("y\nnope\n");
    std::ostringstream out;
    StreamPrompt prompt(in, out);

    REQUIRE(prompt.confirm("Apply these changes?"));
    REQUIRE(out.str() == "Apply these changes? ");
    REQUIRE_FALSE(prompt.confirm("Apply these changes?"));
}

TEST_CASE("end of input is a no", "[prompt]") {
    std::istringstream in("");
    std::ostringstream out;
    StreamPrompt prompt(in, out);
    REQUIRE_FALSE(prompt.confirm("Apply these changes?"));
}
