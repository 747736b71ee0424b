#pragma once

#include <patchgrader/common/enum_names.hpp>

#include <nlohmann/json.hpp>

namespace patchgrader {

/// Why an instance did (or did not) validate. Serialized as its lowercase string name.
enum class FailureMode {
    Unknown,
    Success,
    NoFailToPass,
    NoToPass,
    NoTestsRun,
    Timeout,
    ApplyPatchFailure,
    BuildImageFailure,
    RunInstanceFailure,
    DuplicateInstance,
};

PATCHGRADER_ENUM_NAMES(FailureMode,                                    //
                       {FailureMode::Unknown, "unknown"},              //
                       {FailureMode::Success, "success"},              //
                       {FailureMode::NoFailToPass, "no_fail_to_pass"}, //
                       {FailureMode::NoToPass, "no_to_pass"},          //
                       {FailureMode::NoTestsRun, "no_tests_run"},      //
                       {FailureMode::Timeout, "timeout"},              //
                       {FailureMode::ApplyPatchFailure, "apply_patch_failure"},
                       {FailureMode::BuildImageFailure, "build_image_failure"},
                       {FailureMode::RunInstanceFailure, "run_instance_failure"},
                       {FailureMode::DuplicateInstance, "duplicate_instance"});

void to_json(nlohmann::json& json, FailureMode mode);
void from_json(const nlohmann::json& json, FailureMode& mode);

/// The per-instance value kept in GlobalState
struct InstanceValidationStats
{
    FailureMode failure_mode = FailureMode::Unknown;

    bool operator==(const InstanceValidationStats&) const = default;
};

void to_json(nlohmann::json& json, const InstanceValidationStats& stats);
void from_json(const nlohmann::json& json, InstanceValidationStats& stats);

} // namespace patchgrader
