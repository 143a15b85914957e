#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include "infraget/log.h"

TEST_CASE("FileLogging", "[Logging]")
{
    auto file_name = "logfile-test.log";

    setenv("INFRAGET_LOG_LEVEL", "trace", 1);
    setenv("INFRAGET_LOG_FILE", file_name, 1);
    setenv("INFRAGET_LOG_FILE_MAXSIZE", "100000", 1);

    std::filesystem::path test_log_file = std::filesystem::current_path() / file_name;
    std::cout << "Using test log file: " << test_log_file << std::endl;
    auto test_log_size = 0;
    if (std::filesystem::exists(test_log_file)) {
        test_log_size = std::filesystem::file_size(test_log_file);
    }

    infraget::log().trace("Hello from logging test!");
    infraget::log().flush();
    auto new_test_log_size = std::filesystem::file_size(test_log_file);
    REQUIRE(test_log_size < new_test_log_size);

    SECTION("Raise logs before throwing")
    {
        REQUIRE_THROWS_AS(infraget::raise<std::invalid_argument>("Bad input."), std::invalid_argument);
        REQUIRE_THROWS_AS(infraget::raiseFmt("Bad value {}.", 42), std::runtime_error);
        infraget::log().flush();
        REQUIRE(new_test_log_size < std::filesystem::file_size(test_log_file));
    }

    SECTION("Set log level")
    {
        infraget::setLogLevel("WARN", infraget::log());
        REQUIRE(infraget::log().level() == spdlog::level::warn);
        infraget::setLogLevel("", infraget::log());
        REQUIRE(infraget::log().level() == spdlog::level::info);
        infraget::setLogLevel("trace", infraget::log());
    }
}
