#pragma once

#include <patchgrader/common/class_traits.hpp>
#include <patchgrader/harness/repo_config.hpp>
#include <patchgrader/harness/task_instance.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/output/serializer.hpp>
#include <patchgrader/runner/image_cache.hpp>
#include <patchgrader/runner/instance_runner.hpp>
#include <patchgrader/runtime/container_runtime.hpp>
#include <patchgrader/state/global_state.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace patchgrader {

struct SchedulerOptions
{
    std::size_t max_workers = 4;
    /// Remove pre-existing base and env images too when sweeping
    bool clean = false;

    InstanceRunOptions run;
};

struct SchedulerResult
{
    std::map<std::string, InstanceReport> reports;
    /// Instances for which no TestSpec could be built
    std::vector<std::string> spec_failures;
    /// Repeated instance ids; only the first occurrence of each is run
    std::vector<std::string> duplicates;
    std::vector<std::string> removed_images;
};

/// Runs the instances of one repository on a bounded pool of worker threads and sweeps
/// images once every worker has finished.
///
/// A failing instance never affects its siblings: its reason is recorded in the GlobalState.
class ConcurrencyScheduler : NonCopyable, NonMovable
{
public:
    /// ``serializer`` may be null
    ConcurrencyScheduler(ContainerRuntime& runtime, GlobalState& state, const TestSpecBuilder& builder,
                         const RepoConfigStore& configs, SchedulerOptions opts, Serializer* serializer = nullptr);

    /// An instance id seen more than once is recorded as duplicate_instance and its later
    /// occurrences are not scheduled
    SchedulerResult run(const std::vector<TaskInstance>& instances);

    /// One TestSpec per instance. Instances whose spec cannot be built are logged, recorded as
    /// run_instance_failure, added to ``failures`` and left out.
    std::vector<TestSpec> build_specs(const std::vector<TaskInstance>& instances, std::vector<std::string>& failures);

    /// Instance images of ``specs`` already present in ``existing_images``; none when force-rebuilding
    std::set<std::string> reusable_images(const std::vector<TestSpec>& specs,
                                          const std::set<std::string>& existing_images) const;

private:
    void report_outcome(const std::string& instance_id, const std::optional<InstanceReport>& report);

    ContainerRuntime* runtime_;
    GlobalState* state_;
    const TestSpecBuilder* builder_;
    const RepoConfigStore* configs_;
    SchedulerOptions opts_;
    Serializer* serializer_;

    std::mutex output_mutex_;
};

} // namespace patchgrader
