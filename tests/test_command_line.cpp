#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "app/CommandLine.hpp"

using blockfall::app::parseCommandLine;

TEST_CASE("parseCommandLine keeps defaults with no arguments", "[cli]") {
    const auto cl = parseCommandLine(std::vector<std::string>{});

    REQUIRE_FALSE(cl.showHelp);
    REQUIRE(cl.config.rows == 20);
    REQUIRE(cl.config.cols == 10);
    REQUIRE(cl.config.gravityIntervalMs == 1000);
    REQUIRE_FALSE(cl.config.seed.has_value());
}

TEST_CASE("parseCommandLine reads every option", "[cli]") {
    const auto cl = parseCommandLine(std::vector<std::string>{
        "--rows", "24", "--cols", "12", "--gravity-ms", "400", "--seed", "77"});

    REQUIRE(cl.config.rows == 24);
    REQUIRE(cl.config.cols == 12);
    REQUIRE(cl.config.gravityIntervalMs == 400);
    REQUIRE(cl.config.seed.has_value());
    REQUIRE(*cl.config.seed == 77u);
}

TEST_CASE("parseCommandLine recognises help", "[cli]") {
    REQUIRE(parseCommandLine(std::vector<std::string>{"--help"}).showHelp);
    REQUIRE(parseCommandLine(std::vector<std::string>{"-h"}).showHelp);
}

TEST_CASE("parseCommandLine rejects bad input", "[cli]") {
    using Args = std::vector<std::string>;

    REQUIRE_THROWS_AS(parseCommandLine(Args{"--speed", "3"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows", "abc"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--rows", "12x"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--cols", "0"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--gravity-ms", "-5"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parseCommandLine(Args{"--seed", "-1"}), std::invalid_argument);
}

TEST_CASE("usage lists the options", "[cli]") {
    const std::string text = blockfall::app::usage("blockfall");
    REQUIRE(text.find("--rows") != std::string::npos);
    REQUIRE(text.find("--gravity-ms") != std::string::npos);
    REQUIRE(text.find("--seed") != std::string::npos);
}
