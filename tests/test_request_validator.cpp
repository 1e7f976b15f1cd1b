#include <catch2/catch_test_macros.hpp>

#include "tools/request_validator.hpp"
#include "tools/tool_registry.hpp"

using json = nlohmann::json;

TEST_CASE("RequestValidator", "[validator]") {
    ToolRegistry registry;
    RequestValidator validator(registry);

    SECTION("AcceptsMinimalScript") {
        REQUIRE_FALSE(validator.validate("execute_pwsh_script", {{"script", "Get-Date"}}));
    }

    SECTION("AcceptsTimeoutBounds") {
        REQUIRE_FALSE(validator.validate("execute_pwsh_script", {{"script", "ls"}, {"timeout", 1}}));
        REQUIRE_FALSE(validator.validate("execute_pwsh_script", {{"script", "ls"}, {"timeout", 300}}));
    }

    SECTION("MissingScript") {
        auto err = validator.validate("execute_pwsh_script", json::object());
        REQUIRE(err);
        REQUIRE(*err == "Missing required argument: script");
    }

    SECTION("MissingFieldReportedBeforeBadType") {
        auto err = validator.validate("execute_pwsh_script", {{"timeout", "soon"}});
        REQUIRE(err);
        REQUIRE(*err == "Missing required argument: script");
    }

    SECTION("ScriptMustBeString") {
        auto err = validator.validate("execute_pwsh_script", {{"script", 42}});
        REQUIRE(err);
        REQUIRE(*err == "Script must be a string");
    }

    SECTION("WhitespaceScriptRejected") {
        for (auto script : {"", "   ", "\t\n  \r\n"}) {
            auto err = validator.validate("execute_pwsh_script", {{"script", script}});
            REQUIRE(err);
            REQUIRE(*err == "Script cannot be empty");
        }
    }

    SECTION("TimeoutOutOfRange") {
        for (int timeout : {0, -5, 301, 100000}) {
            auto err = validator.validate("execute_pwsh_script", {{"script", "ls"}, {"timeout", timeout}});
            REQUIRE(err);
            REQUIRE(*err == "Timeout must be an integer between 1 and 300 seconds");
        }
    }

    SECTION("TimeoutRejectsNonIntegers") {
        for (auto timeout : {json(30.5), json(true), json("30"), json(nullptr)}) {
            auto err = validator.validate("execute_pwsh_script", {{"script", "ls"}, {"timeout", timeout}});
            REQUIRE(err);
        }
    }

    SECTION("ClipboardIgnoresExtraArguments") {
        REQUIRE_FALSE(validator.validate("get_clipboard", json::object()));
        REQUIRE_FALSE(validator.validate("get_clipboard", {{"anything", 1}}));
    }

    SECTION("CaptureArguments") {
        REQUIRE_FALSE(validator.validate("capture_pwsh_response", json::object()));
        REQUIRE_FALSE(validator.validate("capture_pwsh_response", {{"save_path", nullptr}}));
        REQUIRE_FALSE(validator.validate("capture_pwsh_response",
                                         {{"save_path", "/tmp/x.png"}, {"exclude_titlebar", false}}));
        REQUIRE(validator.validate("capture_pwsh_response", {{"exclude_titlebar", "yes"}}));
        REQUIRE(validator.validate("capture_pwsh_response", {{"save_path", 7}}));
    }

    SECTION("ArgumentsMustBeObject") {
        REQUIRE(validator.validate("get_clipboard", json::array()));
    }

    SECTION("UnknownTool") {
        auto err = validator.validate("nope", json::object());
        REQUIRE(err);
        REQUIRE(*err == "Unknown tool: nope");
    }
}

TEST_CASE("is_blank", "[validator]") {
    REQUIRE(is_blank(""));
    REQUIRE(is_blank(" \t\r\n"));
    REQUIRE_FALSE(is_blank(" x "));
}
