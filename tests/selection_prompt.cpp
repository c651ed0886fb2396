// tests/selection_prompt.cpp
#include <catch2/catch.hpp>
#include "PromptManager.hpp"
#include "recording_io.hpp"

#include <sstream>
#include <string>
#include <vector>

TEST_CASE("Selection: line composition", "[prompt][selection]") {
    SECTION("unstyled") {
        std::istringstream in("\n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        PromptManager(io).promptSelection("Choose", "(a)pples, (D)efault", std::nullopt, "D");
        REQUIRE(out.str() == "Choose: [(a)pples, (D)efault]: ");
    }
    SECTION("unstyled trims prompt and choices") {
        std::istringstream in("\n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        PromptManager(io).promptSelection("  Choose \t", " (a), (b) ", std::nullopt, "a");
        REQUIRE(out.str() == "Choose: [(a), (b)]: ");
    }
    SECTION("styled colors only the choices and trims nothing") {
        std::istringstream in("\n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        StyleChoice cyan{ StyleVariant::Normal, StyleColor::Cyan };
        PromptManager(io).promptSelection("Choose ", "(a), (b)", cyan, "a");
        REQUIRE(out.str() == "Choose : [\x1b[36m(a), (b)\x1b[0m]: ");
    }
    SECTION("styled with colorize off") {
        std::istringstream in("\n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        PromptConfig cfg;
        cfg.colorize = false;
        StyleChoice red{ StyleVariant::BrightBackground, StyleColor::Red };
        PromptManager(io, cfg).promptSelection("Choose", " (a) ", red, "a");
        REQUIRE(out.str() == "Choose: [ (a) ]: ");
    }
}

TEST_CASE("Selection: answers", "[prompt][selection]") {
    SECTION("empty input returns the default byte-for-byte") {
        std::istringstream in("   \n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        REQUIRE(PromptManager(io).promptSelection("Choose", "x", std::nullopt, " D ") == " D ");
    }
    SECTION("default keeps its case") {
        std::istringstream in("\n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        REQUIRE(PromptManager(io).promptSelection("Choose", "x", std::nullopt, "D") == "D");
    }
    SECTION("input is trimmed") {
        std::istringstream in("  b  \n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        REQUIRE(PromptManager(io).promptSelection("Choose", "(a), (b)", std::nullopt, "a") == "b");
    }
    SECTION("answers outside the choices are returned as typed") {
        std::istringstream in("Zebra crossing\n");
        std::ostringstream out;
        StreamLineIO io(in, out);
        REQUIRE(PromptManager(io).promptSelection("Choose", "(a), (b)", std::nullopt, "a")
                == "Zebra crossing");
    }
    SECTION("EOF returns the default") {
        std::istringstream in("");
        std::ostringstream out;
        StreamLineIO io(in, out);
        REQUIRE(PromptManager(io).promptSelection("Choose", "x", std::nullopt, "D") == "D");
    }
}

TEST_CASE("Selection: exactly one read", "[prompt][selection]") {
    RecordingLineIO io({ "not-a-choice", "second" });
    REQUIRE(PromptManager(io).promptSelection("Q", "a, b", std::nullopt, "a") == "not-a-choice");

    REQUIRE(io.events == std::vector<std::string>{ "write", "flush", "read" });
    REQUIRE(io.written.size() == 1);
    REQUIRE(io.remaining() == 1);
}

TEST_CASE("Selection: I/O failures propagate", "[prompt][selection][io]") {
    SECTION("flush failure") {
        RecordingLineIO io({ "a" });
        io.failFlush = true;
        try {
            PromptManager(io).promptSelection("Q", "a", std::nullopt, "a");
            FAIL("expected PromptIOError");
        } catch (const PromptIOError& ex) {
            REQUIRE(ex.kind() == PromptIOError::Kind::FlushFailure);
        }
        REQUIRE(io.remaining() == 1);
    }
    SECTION("read failure") {
        std::istream badIn(nullptr);
        std::ostringstream out;
        StreamLineIO io(badIn, out);
        try {
            PromptManager(io).promptSelection("Q", "a", std::nullopt, "a");
            FAIL("expected PromptIOError");
        } catch (const PromptIOError& ex) {
            REQUIRE(ex.kind() == PromptIOError::Kind::ReadFailure);
        }
        REQUIRE(out.str() == "Q: [a]: ");
    }
}
