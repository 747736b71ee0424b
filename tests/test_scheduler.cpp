#include "catch2_custom.hpp"

#include <patchgrader/harness/env_manager.hpp>
#include <patchgrader/harness/repo_config.hpp>
#include <patchgrader/harness/task_instance.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/output/serializer.hpp>
#include <patchgrader/runner/image_cache.hpp>
#include <patchgrader/runner/scheduler.hpp>
#include <patchgrader/state/failure_mode.hpp>
#include <patchgrader/state/global_state.hpp>

#include "fake_runtime.hpp"
#include "pytest_output.hpp"
#include "string_sink.hpp"
#include "temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

using namespace patchgrader;

namespace {

/// Keeps the failure mode reported for each instance
class RecordingSerializer : public Serializer
{
public:
    explicit RecordingSerializer(Sink& sink)
        : Serializer{sink, VerbosityLevel::Quiet} {}

    void on_run_metadata(const RunMetadata& /*data*/) override {}
    void on_repo_begin(std::string_view /*repo_name*/, std::size_t /*num_instances*/) override {}

    void on_instance_result(const InstanceOutcome& data) override { outcomes[data.instance_id] = data.failure_mode; }

    void on_repo_result(const RepoSummary& /*data*/) override {}
    void on_warning(std::string_view /*what*/) override {}
    void on_error(std::string_view /*what*/) override {}
    void finalize() override {}

    std::map<std::string, FailureMode> outcomes;
};

constexpr const char* GOLD_PATCH = "diff --git a/sample/div.py b/sample/div.py\n"
                                   "--- a/sample/div.py\n"
                                   "+++ b/sample/div.py\n"
                                   "@@ -1 +1 @@\n"
                                   "-return a / b\n"
                                   "+return a / b if b else 0\n";

TaskInstance make_instance(std::string instance_id, std::string repo) {
    return TaskInstance{
        .instance_id = std::move(instance_id),
        .repo = std::move(repo),
        .base_commit = "0a1b2c3d",
        .test_patch = "diff --git a/tests/test_div.py b/tests/test_div.py\n",
        .patch = GOLD_PATCH,
        .version = "1.0",
    };
}

} // namespace

TEST_CASE("Scheduling the instances of one repository") {
    TempDir log_root;
    FakeRuntime runtime;
    GlobalState state;
    StringSink sink;
    RecordingSerializer serializer{sink};

    auto manager = make_env_manager(EnvManagerKind::Conda, {.python_version = "3.9"});
    TestSpecBuilder builder{*manager, {.host_processor = ProcessorKind::x86_64}};
    RepoConfigStore configs{resources_dir() / "repo_configs"};

    const std::vector<TaskInstance> instances{
        make_instance("owner__sample-1", "owner/sample"),
        make_instance("owner__sample-2", "owner/sample"),
        make_instance("owner__sample-3", "owner/sample"),
        // Needs an inline requirements.txt it does not have
        make_instance("owner__needs_reqs-1", "owner/needs_reqs"),
    };

    for (const auto& instance : instances) {
        state.set(instance.instance_id, InstanceValidationStats{});
    }

    const std::string failing = pytest_output({"FAILED tests/test_div.py::test_div - ZeroDivisionError"});
    const std::string passing = pytest_output({"PASSED tests/test_div.py::test_div"});

    runtime.scripts["owner__sample-1"] = {.output_before = failing, .output_after = passing};
    runtime.scripts["owner__sample-2"] = {.fail_build = true};
    runtime.scripts["owner__sample-3"] = {.output_before = passing, .output_after = passing};

    SchedulerOptions opts{
        .max_workers = 2,
        .run = {.run_id = "sched", .log_root = log_root.path(), .cache_level = CacheLevel::Env},
    };

    ConcurrencyScheduler scheduler{runtime, state, builder, configs, opts, &serializer};
    SchedulerResult result = scheduler.run(instances);

    auto mode_of = [&](const std::string& instance_id) {
        return state.get_as<InstanceValidationStats>(instance_id).value().failure_mode;
    };

    SECTION("graded instances have reports") {
        REQUIRE(result.reports.size() == 2);
        REQUIRE(result.reports.at("owner__sample-1").resolution() == Resolution::Success);
        REQUIRE(result.reports.at("owner__sample-3").resolution() == Resolution::NoFailToPass);
    }

    SECTION("failures are recorded without affecting siblings") {
        REQUIRE(result.spec_failures == std::vector<std::string>{"owner__needs_reqs-1"});
        REQUIRE(mode_of("owner__needs_reqs-1") == FailureMode::RunInstanceFailure);
        REQUIRE(mode_of("owner__sample-2") == FailureMode::BuildImageFailure);

        // Grading verdicts are left for the caller
        REQUIRE(mode_of("owner__sample-1") == FailureMode::Unknown);
    }

    SECTION("every instance is reported to the serializer") {
        REQUIRE(serializer.outcomes == std::map<std::string, FailureMode>{
                                           {"owner__needs_reqs-1", FailureMode::RunInstanceFailure},
                                           {"owner__sample-1", FailureMode::Success},
                                           {"owner__sample-2", FailureMode::BuildImageFailure},
                                           {"owner__sample-3", FailureMode::NoFailToPass},
                                       });
    }

    SECTION("only the shared environment layers stay cached") {
        REQUIRE(runtime.started_containers == 2);
        REQUIRE(runtime.removed_containers == 2);

        std::vector<std::string> left(runtime.images.begin(), runtime.images.end());
        REQUIRE(left.size() == 2);

        for (const auto& key : left) {
            CAPTURE(key);
            REQUIRE(key.find(".eval.") == std::string::npos);
        }
    }
}

TEST_CASE("Existing instance images are reused unless rebuilding") {
    FakeRuntime runtime;
    GlobalState state;

    auto manager = make_env_manager(EnvManagerKind::Conda, {.python_version = "3.9"});
    TestSpecBuilder builder{*manager, {.host_processor = ProcessorKind::x86_64}};
    RepoConfigStore configs{resources_dir() / "repo_configs"};

    std::vector<std::string> failures;
    ConcurrencyScheduler plain{runtime, state, builder, configs, {}};
    auto specs = plain.build_specs({make_instance("owner__sample-1", "owner/sample")}, failures);

    REQUIRE(failures.empty());
    REQUIRE(specs.size() == 1);

    const std::set<std::string> existing{specs[0].instance_image_key(), "unrelated:latest"};

    REQUIRE(plain.reusable_images(specs, existing) == std::set<std::string>{specs[0].instance_image_key()});

    SchedulerOptions rebuild_opts;
    rebuild_opts.run.force_rebuild = true;
    ConcurrencyScheduler rebuilding{runtime, state, builder, configs, rebuild_opts};

    REQUIRE(rebuilding.reusable_images(specs, existing).empty());
}

TEST_CASE("A repeated instance id is run only once") {
    TempDir log_root;
    FakeRuntime runtime;
    GlobalState state;
    StringSink sink;
    RecordingSerializer serializer{sink};

    auto manager = make_env_manager(EnvManagerKind::Conda, {.python_version = "3.9"});
    TestSpecBuilder builder{*manager, {.host_processor = ProcessorKind::x86_64}};
    RepoConfigStore configs{resources_dir() / "repo_configs"};

    const std::vector<TaskInstance> instances{
        make_instance("owner__sample-1", "owner/sample"),
        make_instance("owner__sample-1", "owner/sample"),
    };
    state.set("owner__sample-1", InstanceValidationStats{});

    const std::string failing = pytest_output({"FAILED tests/test_div.py::test_div - ZeroDivisionError"});
    const std::string passing = pytest_output({"PASSED tests/test_div.py::test_div"});
    runtime.scripts["owner__sample-1"] = {.output_before = failing, .output_after = passing};

    SchedulerOptions opts{
        .max_workers = 2,
        .run = {.run_id = "sched", .log_root = log_root.path(), .cache_level = CacheLevel::Env},
    };

    ConcurrencyScheduler scheduler{runtime, state, builder, configs, opts, &serializer};
    SchedulerResult result = scheduler.run(instances);

    REQUIRE(runtime.started_containers == 1);
    REQUIRE(result.duplicates == std::vector<std::string>{"owner__sample-1"});
    REQUIRE(state.get_as<InstanceValidationStats>("owner__sample-1").value().failure_mode ==
            FailureMode::DuplicateInstance);
}
