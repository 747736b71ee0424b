#pragma once

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/harness/log_parser.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace patchgrader {

/// Verdict for an instance whose tests ran to completion
enum class Resolution { Success, NoFailToPass, NoToPass, NoTestsRun };

PATCHGRADER_ENUM_NAMES(Resolution,                                    //
                       {Resolution::Success, "success"},              //
                       {Resolution::NoFailToPass, "no_fail_to_pass"}, //
                       {Resolution::NoToPass, "no_to_pass"},          //
                       {Resolution::NoTestsRun, "no_tests_run"});

void to_json(nlohmann::json& json, Resolution resolution);

/// Priority ordered: any fail->pass wins, then any pass->pass, then any fail->fail or pass->fail
Resolution resolve(bool any_fail_to_pass, bool any_pass_to_pass, bool any_fail_to_fail, bool any_pass_to_fail);

FailureMode to_failure_mode(Resolution resolution);

/// How each test's status changed between the pre-patch and post-patch runs
struct TransitionReport
{
    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;
    std::vector<std::string> fail_to_fail;
    std::vector<std::string> pass_to_fail;

    Resolution resolution() const {
        return resolve(!fail_to_pass.empty(), !pass_to_pass.empty(), !fail_to_fail.empty(), !pass_to_fail.empty());
    }

    bool operator==(const TransitionReport&) const = default;
};

/// Keys are the upper-case list names (FAIL_TO_PASS, ...)
void to_json(nlohmann::json& json, const TransitionReport& report);
void from_json(const nlohmann::json& json, TransitionReport& report);

/// Visits the tests of ``after`` in order. Only tests that were passed or failed in both
/// runs are classified; tests absent before, skipped, errored or of unknown status are not.
TransitionReport classify(const OutcomeMap& before, const OutcomeMap& after);

} // namespace patchgrader
