#pragma once

#include <patchgrader/common/expected.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchgrader {

/// How to build and test one version of a repository
struct RepoBuildSpec
{
    std::string python;
    std::string test_cmd;

    std::optional<std::string> install;
    /// Space-separated package list, or one of the literals "requirements.txt" / "environment.yml"
    std::optional<std::string> packages;
    std::optional<std::vector<std::string>> pip_packages;
    std::optional<std::vector<std::string>> pre_install;
    std::optional<std::vector<std::string>> eval_commands;
    std::optional<std::vector<std::string>> env_vars;
    std::optional<bool> execute_test_as_nonroot;
    std::optional<bool> no_use_env;
    std::optional<std::int64_t> nano_cpus;

    static constexpr std::string_view REQUIREMENTS_TXT = "requirements.txt";
    static constexpr std::string_view ENVIRONMENT_YML = "environment.yml";
};

void from_json(const nlohmann::json& json, RepoBuildSpec& spec);
/// Absent optional fields are omitted
void to_json(nlohmann::json& json, const RepoBuildSpec& spec);

struct RepoConfig
{
    std::string repo_name;
    std::string repo_path;
    std::string github_url;
    std::string log_parser;

    /// Fixed install command that applies to every version of the repository
    std::optional<std::string> repo_install;

    /// version -> spec; ordered so that the greatest version is the last entry
    std::map<std::string, RepoBuildSpec> specs;

    /// Exact version, then the entry named "default", then the lexicographically greatest version.
    /// Fails if there are no specs at all.
    Expected<RepoBuildSpec, std::string> specs_with_fallback(std::string_view version) const;
};

void from_json(const nlohmann::json& json, RepoConfig& config);
void to_json(nlohmann::json& json, const RepoConfig& config);

/// Parse a single repository config file
Expected<RepoConfig, std::string> read_repo_config(const std::filesystem::path& path);

/// Repository configs stored as ``<config_dir>/<repo_name>.json``, falling back to
/// ``<config_dir>/_default.json`` when a repository has no usable config.
/// Loaded configs are cached; lookups are thread-safe.
class RepoConfigStore
{
public:
    explicit RepoConfigStore(std::filesystem::path config_dir);

    /// ``repo`` may be either "owner/name" or just "name"
    Expected<RepoConfig, std::string> load(std::string_view repo) const;

    Expected<RepoBuildSpec, std::string> lookup(std::string_view repo, std::string_view version) const;

    const std::filesystem::path& config_dir() const { return config_dir_; }

    static constexpr std::string_view DEFAULT_CONFIG_NAME = "_default.json";

private:
    Expected<RepoConfig, std::string> load_uncached(const std::string& repo_name) const;

    std::filesystem::path config_dir_;

    mutable std::mutex cache_mutex_;
    mutable std::map<std::string, RepoConfig, std::less<>> cache_;
};

} // namespace patchgrader
