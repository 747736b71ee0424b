#pragma once

#include <patchgrader/common/class_traits.hpp>
#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/harness/grader.hpp>
#include <patchgrader/harness/task_instance.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/runner/image_cache.hpp>
#include <patchgrader/runtime/container_runtime.hpp>
#include <patchgrader/state/failure_mode.hpp>
#include <patchgrader/state/global_state.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
} // namespace spdlog

namespace patchgrader {

/// How the candidate patch ended up applied
enum class PatchStrategy { GitApply, PatchFuzz, Empty };

PATCHGRADER_ENUM_NAMES(PatchStrategy,                           //
                       {PatchStrategy::GitApply, "git_apply"},   //
                       {PatchStrategy::PatchFuzz, "patch_fuzz"}, //
                       {PatchStrategy::Empty, "empty"});

void to_json(nlohmann::json& json, PatchStrategy strategy);
void from_json(const nlohmann::json& json, PatchStrategy& strategy);

/// The ``report.json`` written for every graded instance
struct InstanceReport
{
    std::string instance_id;
    TransitionReport transitions;
    PatchStrategy patch_strategy = PatchStrategy::Empty;
    double elapsed_seconds = 0.0;

    Resolution resolution() const { return transitions.resolution(); }
};

void to_json(nlohmann::json& json, const InstanceReport& report);
void from_json(const nlohmann::json& json, InstanceReport& report);

struct InstanceRunOptions
{
    std::string run_id;
    std::filesystem::path log_root = "logs/run_validation";

    /// Applies separately to the pre-patch and the post-patch test runs
    std::chrono::seconds timeout{std::chrono::minutes{30}};

    CacheLevel cache_level = CacheLevel::Env;
    bool force_rebuild = false;
};

/// Files an instance run leaves in its log directory
namespace instance_files {
constexpr std::string_view RUN_LOG = "run_instance.log";
constexpr std::string_view EVAL_SCRIPT = "eval.sh";
constexpr std::string_view PATCH = "patch.diff";
constexpr std::string_view OUTPUT_BEFORE_PATCH = "test_output_before_patch.txt";
constexpr std::string_view OUTPUT = "test_output.txt";
constexpr std::string_view REPORT = "report.json";
} // namespace instance_files

/// Stages of a single instance run, in order. Any stage may instead end in a recorded FailureMode.
enum class RunStage { Pending, ContainerReady, PrePatchRun, PatchApplied, PostPatchRun, Graded };

PATCHGRADER_ENUM_NAMES(RunStage,                                    //
                       {RunStage::Pending, "PENDING"},               //
                       {RunStage::ContainerReady, "CONTAINER_READY"}, //
                       {RunStage::PrePatchRun, "PRE_PATCH_RUN"},     //
                       {RunStage::PatchApplied, "PATCH_APPLIED"},    //
                       {RunStage::PostPatchRun, "POST_PATCH_RUN"},   //
                       {RunStage::Graded, "GRADED"});

/// The FailureMode recorded for an exception escaping an instance run
FailureMode failure_mode_for(const std::exception& err);

/// Drives one instance end to end: container, pre-patch eval, patch, post-patch eval, grading.
///
/// Per-instance errors never escape ``run``. They are recorded in the GlobalState and ``run``
/// returns nullopt. The container (and, depending on the cache level, the instance image) is
/// always released.
class InstanceRunner : NonCopyable, NonMovable
{
public:
    InstanceRunner(ContainerRuntime& runtime, GlobalState& state, InstanceRunOptions opts);

    std::optional<InstanceReport> run(const TestSpec& spec, const Prediction& prediction);

    /// ``<log_root>/<run_id>/<model>/<instance_id>``
    std::filesystem::path log_dir_for(const TestSpec& spec, const Prediction& prediction) const;

    const InstanceRunOptions& options() const { return opts_; }

    static constexpr std::string_view CONTAINER_EVAL_PATH = "/eval.sh";
    static constexpr std::string_view CONTAINER_PATCH_PATH = "/tmp/patch.diff";
    static constexpr std::string_view CONTAINER_TESTBED = "/testbed";

private:
    class Attempt;

    ContainerRuntime* runtime_;
    GlobalState* state_;
    InstanceRunOptions opts_;
};

} // namespace patchgrader
