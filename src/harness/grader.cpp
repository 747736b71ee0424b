#include <patchgrader/harness/grader.hpp>

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/common/unreachable.hpp>
#include <patchgrader/harness/log_parser.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace patchgrader {

void to_json(nlohmann::json& json, Resolution resolution) {
    json = std::string{enum_to_string(resolution)};
}

Resolution resolve(bool any_fail_to_pass, bool any_pass_to_pass, bool any_fail_to_fail, bool any_pass_to_fail) {
    if (any_fail_to_pass) {
        return Resolution::Success;
    }

    if (any_pass_to_pass) {
        return Resolution::NoFailToPass;
    }

    if (any_fail_to_fail || any_pass_to_fail) {
        return Resolution::NoToPass;
    }

    return Resolution::NoTestsRun;
}

FailureMode to_failure_mode(Resolution resolution) {
    switch (resolution) {
    case Resolution::Success:
        return FailureMode::Success;
    case Resolution::NoFailToPass:
        return FailureMode::NoFailToPass;
    case Resolution::NoToPass:
        return FailureMode::NoToPass;
    case Resolution::NoTestsRun:
        return FailureMode::NoTestsRun;
    }

    unreachable();
}

void to_json(nlohmann::json& json, const TransitionReport& report) {
    json = nlohmann::json{
        {"FAIL_TO_PASS", report.fail_to_pass},
        {"PASS_TO_PASS", report.pass_to_pass},
        {"FAIL_TO_FAIL", report.fail_to_fail},
        {"PASS_TO_FAIL", report.pass_to_fail},
    };
}

void from_json(const nlohmann::json& json, TransitionReport& report) {
    using Names = std::vector<std::string>;

    report.fail_to_pass = json.value("FAIL_TO_PASS", Names{});
    report.pass_to_pass = json.value("PASS_TO_PASS", Names{});
    report.fail_to_fail = json.value("FAIL_TO_FAIL", Names{});
    report.pass_to_fail = json.value("PASS_TO_FAIL", Names{});
}

TransitionReport classify(const OutcomeMap& before, const OutcomeMap& after) {
    using enum TestStatus;

    TransitionReport report;

    for (const auto& [test_name, outcome] : after) {
        const TestOutcome* prev = before.find(test_name);

        if (prev == nullptr) {
            continue;
        }

        if (outcome.status == Passed && prev->status == Failed) {
            report.fail_to_pass.push_back(test_name);
        } else if (outcome.status == Passed && prev->status == Passed) {
            report.pass_to_pass.push_back(test_name);
        } else if (outcome.status == Failed && prev->status == Failed) {
            report.fail_to_fail.push_back(test_name);
        } else if (outcome.status == Failed && prev->status == Passed) {
            report.pass_to_fail.push_back(test_name);
        }
    }

    return report;
}

} // namespace patchgrader
