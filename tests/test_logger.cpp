#include <catch2/catch_test_macros.hpp>

#include "logger.hpp"

#include <cstdio>
#include <string>

namespace {

std::string contents(std::FILE* f) {
    std::rewind(f);
    std::string out;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

} // namespace

TEST_CASE("Logger", "[logger]") {
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    SECTION("QuietByDefault") {
        Logger log("pwsh-mcp", false, sink);
        log.debug("hidden");
        log.info("hidden too");
        log.warn("window not found");
        log.error("launch failed");
        REQUIRE(contents(sink) == "[pwsh-mcp] warning: window not found\n[pwsh-mcp] error: launch failed\n");
    }

    SECTION("VerboseShowsEverything") {
        Logger log("pwsh-mcp", true, sink);
        log.debug("polling");
        log.info("ready");
        REQUIRE(contents(sink) == "[pwsh-mcp] debug: polling\n[pwsh-mcp] ready\n");
    }

    SECTION("NullSinkDiscards") {
        Logger log("pwsh-mcp", true, nullptr);
        log.error("nowhere");
        REQUIRE(contents(sink).empty());
    }

    std::fclose(sink);
}
