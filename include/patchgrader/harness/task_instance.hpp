#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace patchgrader {

/// One benchmark task: a repository at a base commit plus the patches and tests that
/// describe the issue. Immutable once loaded.
struct TaskInstance
{
    std::string instance_id;
    /// "owner/name"
    std::string repo;
    std::string base_commit;
    std::string problem_statement;
    std::string test_patch;
    /// Candidate (gold) patch; may be empty
    std::string patch;

    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;

    /// "none" when absent from the source record
    std::string version = "none";

    std::optional<std::string> hints_text;

    /// Inline contents of the manifests referenced by the `requirements.txt` and
    /// `environment.yml` package kinds
    std::optional<std::string> requirements_txt;
    std::optional<std::string> environment_yml;

    /// The "name" part of "owner/name"
    std::string repo_name() const;
};

/// Accepts FAIL_TO_PASS / PASS_TO_PASS either as JSON arrays or as JSON-encoded strings of arrays
void from_json(const nlohmann::json& json, TaskInstance& instance);
void to_json(nlohmann::json& json, const TaskInstance& instance);

/// A patch proposed for an instance by some model
struct Prediction
{
    std::string instance_id;
    std::string model_name_or_path;
    std::string model_patch;

    /// ``model_name_or_path`` with '/' replaced so it can be used as a directory name
    std::string model_dir_name() const;
};

/// The instance's own reference patch, attributed to the "gold" model
Prediction gold_prediction(const TaskInstance& instance);

} // namespace patchgrader
