#include "catch2_custom.hpp"

#include <patchgrader/exceptions.hpp>
#include <patchgrader/harness/grader.hpp>
#include <patchgrader/harness/task_instance.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/runner/image_cache.hpp>
#include <patchgrader/runner/instance_runner.hpp>
#include <patchgrader/state/failure_mode.hpp>
#include <patchgrader/state/global_state.hpp>

#include "fake_runtime.hpp"
#include "pytest_output.hpp"
#include "temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>
#include <gsl/util>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace patchgrader;

namespace {

constexpr const char* INSTANCE_ID = "owner__sample-1";

const std::string FAILING_RUN = pytest_output({"FAILED tests/test_div.py::test_div - ZeroDivisionError"});
const std::string PASSING_RUN = pytest_output({"PASSED tests/test_div.py::test_div"});

constexpr const char* GOLD_PATCH = "diff --git a/sample/div.py b/sample/div.py\n"
                                   "--- a/sample/div.py\n"
                                   "+++ b/sample/div.py\n"
                                   "@@ -1 +1 @@\n"
                                   "-return a / b\n"
                                   "+return a / b if b else 0\n";

TestSpec sample_spec() {
    return TestSpec{
        .instance_id = INSTANCE_ID,
        .repo = "owner/sample",
        .version = "1.0",
        .env_script_list = {"conda create -n testbed python=3.9 -y"},
        .repo_script_list = {"git clone -o origin https://github.com/owner/sample /testbed"},
        .eval_script_list = {"cd /testbed", "pytest -rA tests/test_div.py"},
        .arch = "x86_64",
    };
}

Prediction prediction_with(std::string patch) {
    return Prediction{.instance_id = INSTANCE_ID, .model_name_or_path = "gold", .model_patch = std::move(patch)};
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path.string());
    }
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

struct RunnerFixture
{
    RunnerFixture() { state.set(INSTANCE_ID, InstanceValidationStats{}); }

    InstanceRunOptions options(CacheLevel level = CacheLevel::Env) const {
        return {.run_id = "run-1", .log_root = log_root.path(), .cache_level = level};
    }

    FailureMode recorded_mode() const {
        return state.get_as<InstanceValidationStats>(INSTANCE_ID).value().failure_mode;
    }

    TempDir log_root;
    FakeRuntime runtime;
    GlobalState state;
};

} // namespace

TEST_CASE_METHOD(RunnerFixture, "Empty patch with a test failing in both runs") {
    runtime.scripts[INSTANCE_ID] = {.output_before = FAILING_RUN, .output_after = FAILING_RUN};

    InstanceRunner runner{runtime, state, options()};
    auto report = runner.run(sample_spec(), prediction_with(""));

    REQUIRE(report.has_value());
    REQUIRE(report->patch_strategy == PatchStrategy::Empty);
    REQUIRE(report->transitions.fail_to_fail == std::vector<std::string>{"tests/test_div.py::test_div"});
    REQUIRE(report->transitions.fail_to_pass.empty());
    REQUIRE(report->resolution() == Resolution::NoToPass);
    REQUIRE(to_failure_mode(report->resolution()) == FailureMode::NoToPass);

    // Nothing was applied
    REQUIRE(runtime.patch_commands.empty());

    // Verdicts are recorded by the caller, not the runner
    REQUIRE(recorded_mode() == FailureMode::Unknown);
}

TEST_CASE_METHOD(RunnerFixture, "Correct patch turns a failing test into a passing one") {
    runtime.scripts[INSTANCE_ID] = {.output_before = FAILING_RUN, .output_after = PASSING_RUN};

    InstanceRunner runner{runtime, state, options()};
    auto report = runner.run(sample_spec(), prediction_with(GOLD_PATCH));

    REQUIRE(report.has_value());
    REQUIRE(report->patch_strategy == PatchStrategy::GitApply);
    REQUIRE(report->transitions.fail_to_pass == std::vector<std::string>{"tests/test_div.py::test_div"});
    REQUIRE(report->resolution() == Resolution::Success);

    REQUIRE(runtime.patch_commands == std::vector<std::string>{"git apply --allow-empty -v /tmp/patch.diff"});
    REQUIRE(runtime.copied_files == std::vector<std::string>{"/eval.sh", "/tmp/patch.diff", "/eval.sh"});

    SECTION("every artifact lands in the instance log directory") {
        const auto log_dir = runner.log_dir_for(sample_spec(), prediction_with(GOLD_PATCH));
        REQUIRE(log_dir == log_root.path() / "run-1" / "gold" / INSTANCE_ID);

        for (auto name : {instance_files::RUN_LOG, instance_files::EVAL_SCRIPT, instance_files::PATCH,
                          instance_files::OUTPUT_BEFORE_PATCH, instance_files::OUTPUT, instance_files::REPORT}) {
            CAPTURE(name);
            REQUIRE(std::filesystem::exists(log_dir / name));
        }

        REQUIRE(read_file(log_dir / instance_files::PATCH) == GOLD_PATCH);
        REQUIRE(read_file(log_dir / instance_files::OUTPUT) == PASSING_RUN);
        REQUIRE(read_file(log_dir / instance_files::EVAL_SCRIPT) == sample_spec().eval_script());

        auto report_json = nlohmann::json::parse(read_file(log_dir / instance_files::REPORT));
        REQUIRE(report_json.at("instance_id") == INSTANCE_ID);
        REQUIRE(report_json.at("resolution") == "success");
        REQUIRE(report_json.at("patch_strategy") == "git_apply");
        REQUIRE(report_json.at("FAIL_TO_PASS").size() == 1);
    }

    SECTION("the container and the uncached instance image are released") {
        REQUIRE(runtime.started_containers == 1);
        REQUIRE(runtime.removed_containers == 1);
        REQUIRE(runtime.removed_images == std::vector<std::string>{sample_spec().instance_image_key()});
        REQUIRE(runtime.images.contains(sample_spec().env_image_key()));
    }

    SECTION("a second run reuses the existing report") {
        InstanceRunner again{runtime, state, options()};
        auto reused = again.run(sample_spec(), prediction_with(GOLD_PATCH));

        REQUIRE(reused.has_value());
        REQUIRE(reused->transitions == report->transitions);
        REQUIRE(reused->patch_strategy == PatchStrategy::GitApply);
        REQUIRE(runtime.started_containers == 1);
    }
}

TEST_CASE_METHOD(RunnerFixture, "Instance images are kept at cache level instance") {
    runtime.scripts[INSTANCE_ID] = {.output_before = FAILING_RUN, .output_after = PASSING_RUN};

    InstanceRunner runner{runtime, state, options(CacheLevel::Instance)};
    REQUIRE(runner.run(sample_spec(), prediction_with(GOLD_PATCH)).has_value());

    REQUIRE(runtime.removed_images.empty());
    REQUIRE(runtime.images.contains(sample_spec().instance_image_key()));
}

TEST_CASE_METHOD(RunnerFixture, "Fuzzy patching is tried when git apply fails") {
    runtime.scripts[INSTANCE_ID] = {
        .output_before = FAILING_RUN, .output_after = PASSING_RUN, .git_apply_exit = 1, .patch_fuzz_exit = 0};

    InstanceRunner runner{runtime, state, options()};
    auto report = runner.run(sample_spec(), prediction_with(GOLD_PATCH));

    REQUIRE(report.has_value());
    REQUIRE(report->patch_strategy == PatchStrategy::PatchFuzz);
    REQUIRE(runtime.patch_commands == std::vector<std::string>{"git apply --allow-empty -v /tmp/patch.diff",
                                                               "patch --batch --fuzz=5 -p1 -i /tmp/patch.diff"});
}

TEST_CASE_METHOD(RunnerFixture, "A patch that applies with neither strategy") {
    runtime.scripts[INSTANCE_ID] = {
        .output_before = FAILING_RUN, .output_after = PASSING_RUN, .git_apply_exit = 1, .patch_fuzz_exit = 1};

    InstanceRunner runner{runtime, state, options()};

    REQUIRE_FALSE(runner.run(sample_spec(), prediction_with(GOLD_PATCH)).has_value());
    REQUIRE(recorded_mode() == FailureMode::ApplyPatchFailure);
    // Cleanup still happened
    REQUIRE(runtime.removed_containers == 1);
}

TEST_CASE_METHOD(RunnerFixture, "A timed out test run keeps its partial output") {
    runtime.scripts[INSTANCE_ID] = {.output_before = FAILING_RUN, .output_after = PASSING_RUN, .timeout_on_run = 2};

    InstanceRunner runner{runtime, state, options()};

    REQUIRE_FALSE(runner.run(sample_spec(), prediction_with(GOLD_PATCH)).has_value());
    REQUIRE(recorded_mode() == FailureMode::Timeout);

    const auto log_dir = runner.log_dir_for(sample_spec(), prediction_with(GOLD_PATCH));
    REQUIRE(read_file(log_dir / instance_files::OUTPUT_BEFORE_PATCH) == FAILING_RUN);
    REQUIRE(read_file(log_dir / instance_files::OUTPUT) ==
            "partial output\n\nTimeout error: 1800 seconds exceeded.");
    REQUIRE_FALSE(std::filesystem::exists(log_dir / instance_files::REPORT));
}

TEST_CASE_METHOD(RunnerFixture, "A failed image build") {
    runtime.scripts[INSTANCE_ID] = {.fail_build = true};

    InstanceRunner runner{runtime, state, options()};

    REQUIRE_FALSE(runner.run(sample_spec(), prediction_with(GOLD_PATCH)).has_value());
    REQUIRE(recorded_mode() == FailureMode::BuildImageFailure);
    REQUIRE(runtime.started_containers == 0);
}

TEST_CASE_METHOD(RunnerFixture, "Output without a pytest session cannot be graded") {
    runtime.scripts[INSTANCE_ID] = {.output_before = "bash: pytest: command not found\n",
                                    .output_after = "bash: pytest: command not found\n"};

    InstanceRunner runner{runtime, state, options()};

    REQUIRE_FALSE(runner.run(sample_spec(), prediction_with("")).has_value());
    REQUIRE(recorded_mode() == FailureMode::RunInstanceFailure);
}

TEST_CASE_METHOD(RunnerFixture, "A terminal failure mode is never overwritten") {
    state.set(INSTANCE_ID, InstanceValidationStats{.failure_mode = FailureMode::DuplicateInstance});
    runtime.scripts[INSTANCE_ID] = {.fail_build = true};

    InstanceRunner runner{runtime, state, options()};
    REQUIRE_FALSE(runner.run(sample_spec(), prediction_with("")).has_value());

    REQUIRE(recorded_mode() == FailureMode::DuplicateInstance);
}

TEST_CASE("Exceptions translate to failure modes") {
    REQUIRE(failure_mode_for(InstanceFailure(FailureMode::Timeout, "slow")) == FailureMode::Timeout);
    REQUIRE(failure_mode_for(InstanceFailure(FailureMode::ApplyPatchFailure, "bad")) == FailureMode::ApplyPatchFailure);
    REQUIRE(failure_mode_for(BuildImageError("img", "no base")) == FailureMode::BuildImageFailure);
    REQUIRE(failure_mode_for(std::runtime_error("anything else")) == FailureMode::RunInstanceFailure);
    REQUIRE(failure_mode_for(std::out_of_range("map::at")) == FailureMode::RunInstanceFailure);
}

TEST_CASE_METHOD(RunnerFixture, "The per-instance log is kept out of the global logger registry") {
    const std::string name = fmt::format("instance.{}", INSTANCE_ID);
    auto existing = spdlog::null_logger_mt(name);
    auto unregister = gsl::finally([&name] { spdlog::drop(name); });

    runtime.scripts[INSTANCE_ID] = {.output_before = FAILING_RUN, .output_after = PASSING_RUN};

    InstanceRunner runner{runtime, state, options()};
    REQUIRE(runner.run(sample_spec(), prediction_with(GOLD_PATCH)).has_value());

    REQUIRE(spdlog::get(name) == existing);

    const auto log_dir = runner.log_dir_for(sample_spec(), prediction_with(GOLD_PATCH));
    REQUIRE(read_file(log_dir / instance_files::RUN_LOG).find("Validating " + std::string{INSTANCE_ID}) !=
            std::string::npos);
}
