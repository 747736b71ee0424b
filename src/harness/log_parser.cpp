#include <patchgrader/harness/log_parser.hpp>

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/common/strings.hpp>
#include <patchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchgrader {

namespace {

// NOLINTBEGIN(cert-err58-cpp)
const std::regex TEST_SESSION_START_REGEX{R"(===+ test session starts ===+)"};
const std::regex TEST_NAME_HEADER_REGEX{R"(___+ (.+) ___+)"};
const std::regex CAPTURED_STDOUT_REGEX{R"(---+ Captured stdout call ---+)"};
const std::regex CAPTURED_LOG_REGEX{R"(---+ Captured log call ---+)"};
const std::regex SHORT_SUMMARY_HEADER_REGEX{R"(===+ short test summary info ===+)"};
// NOLINTEND(cert-err58-cpp)

/// Match anchored at the start of ``line`` (but not at its end)
bool match_start(std::string_view line, const std::regex& pattern, std::cmatch* match = nullptr) {
    std::cmatch local_match;

    return std::regex_search(line.data(), line.data() + line.size(), match != nullptr ? *match : local_match, pattern,
                             std::regex_constants::match_continuous);
}

std::string_view strip_line_terminator(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    return line;
}

/// Summary statuses that are recorded. Anything else (XPASS, ...) is ignored.
constexpr auto SUMMARY_STATUSES = std::to_array<TestStatus>(
    {TestStatus::Passed, TestStatus::Failed, TestStatus::Skipped, TestStatus::Error, TestStatus::XFail});

/// Take ``from`` if it holds a non-empty string, otherwise keep ``into``
void merge_field(std::optional<std::string>& into, std::optional<std::string> from) {
    if (from && !from->empty()) {
        into = std::move(from);
    }
}

} // namespace

std::optional<std::string> TestOutcome::test_output() const {
    std::vector<std::string_view> parts;

    if (captured_stdout && !captured_stdout->empty()) {
        parts.emplace_back(*captured_stdout);
    }

    if (captured_log && !captured_log->empty()) {
        parts.emplace_back(*captured_log);
    }

    if (parts.empty()) {
        return std::nullopt;
    }

    return fmt::format("{}", fmt::join(parts, "\n\n"));
}

TestOutcome* OutcomeMap::find(std::string_view name) {
    auto iter = index_.find(name);

    if (iter == index_.end()) {
        return nullptr;
    }

    return &entries_[iter->second].second;
}

const TestOutcome* OutcomeMap::find(std::string_view name) const {
    auto iter = index_.find(name);

    if (iter == index_.end()) {
        return nullptr;
    }

    return &entries_[iter->second].second;
}

void OutcomeMap::insert_or_assign(std::string name, TestOutcome outcome) {
    if (TestOutcome* existing = find(name)) {
        *existing = std::move(outcome);
        return;
    }

    index_.emplace(name, entries_.size());
    entries_.emplace_back(std::move(name), std::move(outcome));
}

bool OutcomeMap::erase(std::string_view name) {
    auto iter = index_.find(name);

    if (iter == index_.end()) {
        return false;
    }

    std::size_t pos = iter->second;
    index_.erase(iter);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));

    // Shift the positions of every entry after the removed one
    for (auto& [entry_name, entry_pos] : index_) {
        if (entry_pos > pos) {
            --entry_pos;
        }
    }

    return true;
}

std::optional<std::string> PytestLogParser::strip_file_prefix(std::string_view test_name) {
    auto sep = test_name.find("::");

    if (sep == std::string_view::npos) {
        return std::nullopt;
    }

    return replace_all(std::string{test_name.substr(sep + 2)}, "::", ".");
}

void PytestLogParser::flush_current(Context& ctx) {
    if (ctx.current && !ctx.current->first.empty()) {
        ctx.result.outcomes.insert_or_assign(std::move(ctx.current->first), std::move(ctx.current->second));
    }

    ctx.current.reset();
}

void PytestLogParser::merge_outcome(OutcomeMap& outcomes, std::string name, TestOutcome outcome) {
    std::optional<std::string> stripped_name;
    TestOutcome* existing = outcomes.find(name);

    if (existing == nullptr) {
        stripped_name = strip_file_prefix(name);
        if (stripped_name) {
            existing = outcomes.find(*stripped_name);
        }
    }

    if (existing == nullptr) {
        outcomes.insert_or_assign(std::move(name), std::move(outcome));
        return;
    }

    if (outcome.status != TestStatus::Unknown) {
        existing->status = outcome.status;
    }
    merge_field(existing->captured_stdout, std::move(outcome.captured_stdout));
    merge_field(existing->captured_log, std::move(outcome.captured_log));
    merge_field(existing->failure_description, std::move(outcome.failure_description));

    // Re-key a record that was matched by its short name under the full name
    if (stripped_name) {
        TestOutcome merged = std::move(*existing);
        outcomes.erase(*stripped_name);
        outcomes.insert_or_assign(std::move(name), std::move(merged));
    }
}

void PytestLogParser::parse_session_line(std::string_view line, Context& ctx) {
    if (std::cmatch match; match_start(line, TEST_NAME_HEADER_REGEX, &match)) {
        flush_current(ctx);

        ctx.current.emplace(match[1].str(), TestOutcome{});
        ctx.section = Section::None;
        return;
    }

    if (match_start(line, CAPTURED_STDOUT_REGEX)) {
        ctx.section = Section::None;

        if (ctx.current) {
            ctx.section = Section::Stdout;
            auto& field = ctx.current->second.captured_stdout;
            field = field.value_or("");
        }
        return;
    }

    if (match_start(line, CAPTURED_LOG_REGEX)) {
        ctx.section = Section::None;

        if (ctx.current) {
            ctx.section = Section::Log;
            auto& field = ctx.current->second.captured_log;
            field = field.value_or("");
        }
        return;
    }

    if (match_start(line, SHORT_SUMMARY_HEADER_REGEX)) {
        flush_current(ctx);

        ctx.state = State::ShortSummary;
        ctx.section = Section::None;
        return;
    }

    if (!ctx.current) {
        return;
    }

    switch (ctx.section) {
    case Section::Stdout:
        *ctx.current->second.captured_stdout += line;
        break;
    case Section::Log:
        *ctx.current->second.captured_log += line;
        break;
    case Section::None:
        break;
    }
}

void PytestLogParser::parse_summary_line(std::string_view line, Context& ctx) {
    line = strip_line_terminator(line);

    auto status_iter = ranges::find_if(
        SUMMARY_STATUSES, [line](TestStatus status) { return line.starts_with(enum_to_string(status)); });

    if (status_iter == SUMMARY_STATUSES.end()) {
        return;
    }

    std::optional<std::string> failure_description;

    if (*status_iter == TestStatus::Failed) {
        if (auto sep = line.rfind(" - "); sep != std::string_view::npos) {
            failure_description = std::string{line.substr(sep + 3)};
            line = line.substr(0, sep);
        }
    }

    // "<STATUS>[:] <name>"
    auto tokens_begin = line.find_first_of(" \t");
    if (tokens_begin == std::string_view::npos) {
        return;
    }

    std::string_view status_token = line.substr(0, tokens_begin);
    std::string_view name = trim(line.substr(tokens_begin));

    if (name.empty()) {
        return;
    }

    while (status_token.ends_with(':')) {
        status_token.remove_suffix(1);
    }

    auto status = enum_from_string<TestStatus>(status_token);
    if (!status) {
        // e.g. "PASSEDX" starts with a keyword but is not one
        return;
    }

    merge_outcome(ctx.result.outcomes, std::string{name},
                  TestOutcome{.status = *status,
                              .captured_stdout = std::nullopt,
                              .captured_log = std::nullopt,
                              .failure_description = std::move(failure_description)});
}

LogParseResult PytestLogParser::parse(std::string_view log) {
    Context ctx;

    for (std::string_view line : split_lines_keep_ends(log)) {
        switch (ctx.state) {
        case State::PreSession:
            if (match_start(line, TEST_SESSION_START_REGEX)) {
                ctx.state = State::Session;
                ctx.result.found = true;
            }
            break;
        case State::Session:
            parse_session_line(line, ctx);
            break;
        case State::ShortSummary:
            parse_summary_line(line, ctx);
            break;
        }
    }

    LOG_TRACE("Parsed {} test outcomes (session found: {})", ctx.result.outcomes.size(), ctx.result.found);

    return std::move(ctx.result);
}

Expected<LogParseResult, std::string> PytestLogParser::parse_file(const std::filesystem::path& path) {
    std::ifstream in_file{path};

    if (!in_file.is_open()) {
        return fmt::format("Failed to open log file {}", path);
    }

    std::stringstream buffer;
    buffer << in_file.rdbuf();

    if (in_file.bad()) {
        return fmt::format("IO error reading log file {}", path);
    }

    return parse(buffer.str());
}

} // namespace patchgrader
