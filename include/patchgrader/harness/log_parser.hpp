#pragma once

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/common/expected.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchgrader {

enum class TestStatus { Passed, Failed, Skipped, Error, XFail, Unknown };

/// Names are the keywords pytest prints in its short test summary
PATCHGRADER_ENUM_NAMES(TestStatus,                        //
                       {TestStatus::Passed, "PASSED"},    //
                       {TestStatus::Failed, "FAILED"},    //
                       {TestStatus::Skipped, "SKIPPED"},  //
                       {TestStatus::Error, "ERROR"},      //
                       {TestStatus::XFail, "XFAIL"},      //
                       {TestStatus::Unknown, "UNKNOWN"});

struct TestOutcome
{
    TestStatus status = TestStatus::Unknown;
    std::optional<std::string> captured_stdout;
    std::optional<std::string> captured_log;
    std::optional<std::string> failure_description;

    /// Captured stdout and log, joined by a blank line. nullopt if neither was captured.
    std::optional<std::string> test_output() const;

    bool operator==(const TestOutcome&) const = default;
};

/// Test name -> outcome, iterated in insertion order
class OutcomeMap
{
public:
    using value_type = std::pair<std::string, TestOutcome>;
    using const_iterator = std::vector<value_type>::const_iterator;

    TestOutcome* find(std::string_view name);
    const TestOutcome* find(std::string_view name) const;

    bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Replaces the outcome in place if ``name`` is already present, otherwise appends
    void insert_or_assign(std::string name, TestOutcome outcome);

    bool erase(std::string_view name);

    std::size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }

    const_iterator end() const { return entries_.end(); }

    bool operator==(const OutcomeMap& rhs) const { return entries_ == rhs.entries_; }

private:
    std::vector<value_type> entries_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

struct LogParseResult
{
    OutcomeMap outcomes;
    /// Whether a pytest session start marker was seen at all
    bool found = false;
};

/// Single forward pass over pytest output.
///
/// Everything before the ``=== test session starts ===`` banner is ignored. During the
/// session, each ``___ name ___`` header begins a new record whose captured stdout / log
/// call sections are accumulated. The ``=== short test summary info ===`` banner switches
/// to reading status lines, which are merged into the session records.
///
/// Parsing is pure: the same input always yields the same result.
class PytestLogParser
{
public:
    static LogParseResult parse(std::string_view log);

    static Expected<LogParseResult, std::string> parse_file(const std::filesystem::path& path);

    /// ``file.py::Class::test`` -> ``Class.test``; nullopt if there is no file prefix
    static std::optional<std::string> strip_file_prefix(std::string_view test_name);

private:
    enum class State { PreSession, Session, ShortSummary };
    enum class Section { None, Stdout, Log };

    struct Context
    {
        State state = State::PreSession;
        Section section = Section::None;

        std::optional<std::pair<std::string, TestOutcome>> current;

        LogParseResult result;
    };

    static void parse_session_line(std::string_view line, Context& ctx);
    static void parse_summary_line(std::string_view line, Context& ctx);

    static void flush_current(Context& ctx);

    /// Merge a summary entry into the session records
    static void merge_outcome(OutcomeMap& outcomes, std::string name, TestOutcome outcome);
};

} // namespace patchgrader
