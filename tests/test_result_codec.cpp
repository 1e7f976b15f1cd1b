#include <catch2/catch_test_macros.hpp>

#include "protocol/result_codec.hpp"

using json = nlohmann::json;

TEST_CASE("Result codec", "[codec]") {

    SECTION("SuccessFlattensData") {
        ToolOutcome outcome = json{{"content", "x"}, {"length", 1}};
        auto encoded = result_codec::encode(outcome);
        REQUIRE(encoded == json{{"success", true}, {"content", "x"}, {"length", 1}});
    }

    SECTION("SuccessFlagCannotBeOverridden") {
        ToolOutcome outcome = json{{"success", false}, {"n", 2}};
        auto encoded = result_codec::encode(outcome);
        REQUIRE(encoded["success"] == true);
        REQUIRE(encoded["n"] == 2);
    }

    SECTION("FailureCarriesMessage") {
        ToolOutcome outcome = tool_error(ToolErrorKind::Clipboard, "no clipboard");
        auto encoded = result_codec::encode(outcome);
        REQUIRE(encoded == json{{"success", false}, {"error", "no clipboard"}});
    }

    SECTION("ToolCallResultIsPrettyPrintedText") {
        ToolOutcome outcome = json{{"lines_count", 1}};
        auto result = result_codec::tool_call_result(outcome);
        REQUIRE(result["isError"] == false);
        REQUIRE(result["content"].size() == 1);
        REQUIRE(result["content"][0]["type"] == "text");

        auto text = result["content"][0]["text"].get<std::string>();
        REQUIRE(text.find('\n') != std::string::npos);
        REQUIRE(json::parse(text) == json{{"success", true}, {"lines_count", 1}});
    }

    SECTION("ToolCallResultMarksErrors") {
        auto result = result_codec::tool_call_result(tool_error(ToolErrorKind::Capture, "boom"));
        REQUIRE(result["isError"] == true);
        REQUIRE(json::parse(result["content"][0]["text"].get<std::string>())["error"] == "boom");
    }

    SECTION("InvalidUtf8IsReplacedNotThrown") {
        ToolOutcome outcome = json{{"content", std::string("bad \xff byte")}};
        auto result = result_codec::tool_call_result(outcome);
        REQUIRE(result["content"][0]["text"].get<std::string>().find("bad") != std::string::npos);
    }

    SECTION("Envelopes") {
        auto ok = result_codec::success(5, json{{"a", 1}});
        REQUIRE(ok == json{{"jsonrpc", "2.0"}, {"id", 5}, {"result", {{"a", 1}}}});

        auto err = result_codec::error("abc", -32601, "Unknown method: x");
        REQUIRE(err["jsonrpc"] == "2.0");
        REQUIRE(err["id"] == "abc");
        REQUIRE(err["error"]["code"] == -32601);
        REQUIRE(err["error"]["message"] == "Unknown method: x");
        REQUIRE_FALSE(err.contains("result"));
    }
}

TEST_CASE("Tool error kind names", "[codec]") {
    REQUIRE(std::string(to_string(ToolErrorKind::InvalidInput)) == "invalid_input");
    REQUIRE(std::string(to_string(ToolErrorKind::TerminalUnavailable)) == "terminal_unavailable");
}
