#pragma once

#include <patchgrader/harness/env_manager.hpp>
#include <patchgrader/harness/repo_config.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/output/sink.hpp>
#include <patchgrader/runner/instance_runner.hpp>
#include <patchgrader/runtime/container_runtime.hpp>
#include <patchgrader/state/global_state.hpp>

#include "app/app.hpp" // IWYU pragma: export
#include "output/plaintext_serializer.hpp"
#include "user/program_options.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace patchgrader {

/// Validates every task-instance file named by the options, one repository at a time.
///
/// For an input ``<dir>/<name>.jsonl`` the run writes ``<dir>/<name>_validated.all.jsonl`` (every
/// instance, with its test lists filled in) and ``<dir>/<name>_validated.jsonl`` (only instances
/// with at least one fail->pass test), then moves them to ``<pre_validated_dir>/<name>.jsonl`` and
/// ``<validated_dir>/<name>.jsonl`` respectively.
class ValidatorApp final : public App
{
public:
    ValidatorApp(ProgramOptions opts, ContainerRuntime& runtime, Sink& sink);

    /// The input file itself, or the ``*.jsonl`` files of the input directory in name order
    std::vector<std::filesystem::path> input_files() const;

    /// Whether a non-empty validated output for ``input_file`` already exists
    bool already_validated(const std::filesystem::path& input_file) const;

    /// Records of ``input_file`` with results merged in. Throws on a malformed file and on
    /// DuplicateInstanceError.
    std::vector<nlohmann::json> validate_file(const std::filesystem::path& input_file);

    GlobalState& state() { return state_; }

    /// ``<stem>`` with any ``-task-instances`` suffix removed
    static std::string repo_name_for(const std::filesystem::path& input_file);

    static std::filesystem::path validated_all_path(const std::filesystem::path& input_file);
    static std::filesystem::path validated_path(const std::filesystem::path& input_file);

    /// Replace FAIL_TO_PASS / PASS_TO_PASS of each record by its graded lists and add FAIL_TO_FAIL /
    /// PASS_TO_FAIL. Records without a report get empty lists.
    ///
    /// A record that already carries a result (its id was merged before, or it has a
    /// FAIL_TO_FAIL / PASS_TO_FAIL key) is recorded as duplicate_instance, then
    /// DuplicateInstanceError is thrown.
    static void merge_results(std::vector<nlohmann::json>& records,
                              const std::map<std::string, InstanceReport>& reports, GlobalState& state);

    /// Post-grading pass: every instance still ``unknown`` gets the failure mode of its merged lists
    static void update_failure_modes(const std::vector<nlohmann::json>& records, GlobalState& state);

private:
    int run_impl() override;

    /// Returns false if the repository failed as a whole
    bool run_repo(const std::filesystem::path& input_file);

    void finish_repo(const std::vector<nlohmann::json>& records, const std::string& repo_name);

    void reorganize_output(const std::filesystem::path& input_file) const;

    RepoSummary summarize(const std::string& repo_name, const std::vector<nlohmann::json>& records,
                          std::chrono::duration<double> elapsed) const;

    ContainerRuntime* runtime_;
    GlobalState state_;
    RepoConfigStore configs_;

    std::unique_ptr<EnvManager> env_manager_;
    TestSpecBuilder spec_builder_;

    PlainTextSerializer serializer_;
};

} // namespace patchgrader
