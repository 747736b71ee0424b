#include "catch2_custom.hpp"

#include <patchgrader/harness/log_parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace patchgrader;

namespace {

constexpr std::string_view SESSION_START = "============================= test session starts ==============================\n";
constexpr std::string_view SUMMARY_START = "=========================== short test summary info ============================\n";

} // namespace

TEST_CASE("Session header and summary line merge into one record") {
    auto parsed = PytestLogParser::parse_file(resources_dir() / "logs" / "pytest_failures.log");
    REQUIRE(parsed.has_value());

    const auto& outcomes = parsed->outcomes;

    REQUIRE(parsed->found);
    REQUIRE(outcomes.size() == 2);

    // Matched by its short name, then re-keyed under the full one
    REQUIRE_FALSE(outcomes.contains("Foo.test_x"));

    const TestOutcome* test_x = outcomes.find("test_mod.py::Foo::test_x");
    REQUIRE(test_x != nullptr);
    REQUIRE(test_x->status == TestStatus::Failed);
    REQUIRE(test_x->failure_description == "boom");
    REQUIRE(test_x->captured_stdout == "hello from test_x\n");
    REQUIRE(test_x->test_output() == "hello from test_x\n");

    const TestOutcome* test_a = outcomes.find("test_mod.py::test_a");
    REQUIRE(test_a != nullptr);
    REQUIRE(test_a->status == TestStatus::Passed);
    REQUIRE_FALSE(test_a->test_output().has_value());
}

TEST_CASE("Parsing is idempotent") {
    auto first = PytestLogParser::parse_file(resources_dir() / "logs" / "pytest_failures.log");
    auto second = PytestLogParser::parse_file(resources_dir() / "logs" / "pytest_failures.log");

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->outcomes == second->outcomes);
}

TEST_CASE("Output without a session banner yields nothing") {
    auto parsed = PytestLogParser::parse_file(resources_dir() / "logs" / "no_session.log");

    REQUIRE(parsed.has_value());
    REQUIRE_FALSE(parsed->found);
    REQUIRE(parsed->outcomes.empty());

    // Summary-looking lines before the banner are ignored
    auto early = PytestLogParser::parse("PASSED test_mod.py::test_a\n");
    REQUIRE_FALSE(early.found);
    REQUIRE(early.outcomes.empty());
}

TEST_CASE("Missing log file is an error") {
    REQUIRE(PytestLogParser::parse_file(resources_dir() / "logs" / "does_not_exist.log").has_error());
}

TEST_CASE("Summary status lines") {
    std::string log{SESSION_START};
    log += SUMMARY_START;
    log += "PASSED test_a.py::test_one\r\n";
    log += "ERROR test_a.py::test_two\n";
    log += "SKIPPED: test_a.py::test_three\n";
    log += "XFAIL test_a.py::test_four - flaky\n";
    log += "PASSEDX test_a.py::test_five\n";
    log += "FAILED test_a.py::test_six - AssertionError: 1 - 2 != 0\n";
    log += "FAILED\n";

    auto parsed = PytestLogParser::parse(log);
    const auto& outcomes = parsed.outcomes;

    REQUIRE(parsed.found);
    REQUIRE(outcomes.size() == 5);

    REQUIRE(outcomes.find("test_a.py::test_one")->status == TestStatus::Passed);
    REQUIRE(outcomes.find("test_a.py::test_two")->status == TestStatus::Error);
    REQUIRE(outcomes.find("test_a.py::test_three")->status == TestStatus::Skipped);

    // Only the last " - " separates the description
    const TestOutcome* test_six = outcomes.find("test_a.py::test_six - AssertionError: 1");
    REQUIRE(test_six != nullptr);
    REQUIRE(test_six->status == TestStatus::Failed);
    REQUIRE(test_six->failure_description == "2 != 0");

    // Only FAILED lines carry a description
    REQUIRE(outcomes.find("test_a.py::test_four - flaky")->status == TestStatus::XFail);
    REQUIRE_FALSE(outcomes.contains("test_a.py::test_five"));
}

TEST_CASE("Captured log sections are kept per test") {
    std::string log{SESSION_START};
    log += "______________________________ test_alpha ______________________________\n";
    log += "------------------------------ Captured log call -------------------------------\n";
    log += "WARNING  root:mod.py:3 careful\n";
    log += "______________________________ test_beta _______________________________\n";
    log += "----------------------------- Captured stdout call -----------------------------\n";
    log += "beta out\n";
    log += "------------------------------ Captured log call -------------------------------\n";
    log += "INFO     root:mod.py:9 beta log\n";
    log += SUMMARY_START;
    log += "FAILED mod.py::test_alpha - oops\n";

    auto parsed = PytestLogParser::parse(log);
    const auto& outcomes = parsed.outcomes;

    REQUIRE(outcomes.size() == 2);

    const TestOutcome* alpha = outcomes.find("mod.py::test_alpha");
    REQUIRE(alpha != nullptr);
    REQUIRE(alpha->status == TestStatus::Failed);
    REQUIRE(alpha->captured_log == "WARNING  root:mod.py:3 careful\n");
    REQUIRE_FALSE(alpha->captured_stdout.has_value());

    // No summary entry: the session record stays with an unknown status
    const TestOutcome* beta = outcomes.find("test_beta");
    REQUIRE(beta != nullptr);
    REQUIRE(beta->status == TestStatus::Unknown);
    REQUIRE(beta->test_output() == "beta out\n\n\nINFO     root:mod.py:9 beta log\n");
}

TEST_CASE("strip_file_prefix") {
    REQUIRE(PytestLogParser::strip_file_prefix("test_mod.py::Foo::test_x") == "Foo.test_x");
    REQUIRE(PytestLogParser::strip_file_prefix("test_mod.py::test_x") == "test_x");
    REQUIRE_FALSE(PytestLogParser::strip_file_prefix("test_x").has_value());
}

TEST_CASE("OutcomeMap keeps insertion order across erase and replace") {
    OutcomeMap outcomes;
    outcomes.insert_or_assign("a", {.status = TestStatus::Passed});
    outcomes.insert_or_assign("b", {.status = TestStatus::Failed});
    outcomes.insert_or_assign("c", {.status = TestStatus::Skipped});

    outcomes.insert_or_assign("a", {.status = TestStatus::Failed});
    REQUIRE(outcomes.begin()->first == "a");
    REQUIRE(outcomes.begin()->second.status == TestStatus::Failed);

    REQUIRE(outcomes.erase("b"));
    REQUIRE_FALSE(outcomes.erase("b"));

    REQUIRE(outcomes.size() == 2);
    REQUIRE(outcomes.find("c")->status == TestStatus::Skipped);
    REQUIRE((outcomes.begin() + 1)->first == "c");
}
