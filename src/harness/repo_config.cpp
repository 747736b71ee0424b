#include <patchgrader/harness/repo_config.hpp>

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/expected.hpp>
#include <patchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace patchgrader {

namespace {

template <typename T>
void get_optional(const nlohmann::json& json, const char* key, std::optional<T>& out) {
    if (json.contains(key) && !json.at(key).is_null()) {
        out = json.at(key).get<T>();
    } else {
        out = std::nullopt;
    }
}

template <typename T>
void put_optional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
    if (value) {
        json[key] = *value;
    }
}

} // namespace

void from_json(const nlohmann::json& json, RepoBuildSpec& spec) {
    json.at("python").get_to(spec.python);
    json.at("test_cmd").get_to(spec.test_cmd);

    get_optional(json, "install", spec.install);
    get_optional(json, "packages", spec.packages);
    get_optional(json, "pip_packages", spec.pip_packages);
    get_optional(json, "pre_install", spec.pre_install);
    get_optional(json, "eval_commands", spec.eval_commands);
    get_optional(json, "env_vars", spec.env_vars);
    get_optional(json, "execute_test_as_nonroot", spec.execute_test_as_nonroot);
    get_optional(json, "no_use_env", spec.no_use_env);
    get_optional(json, "nano_cpus", spec.nano_cpus);
}

void to_json(nlohmann::json& json, const RepoBuildSpec& spec) {
    json = nlohmann::json{{"python", spec.python}, {"test_cmd", spec.test_cmd}};

    put_optional(json, "install", spec.install);
    put_optional(json, "packages", spec.packages);
    put_optional(json, "pip_packages", spec.pip_packages);
    put_optional(json, "pre_install", spec.pre_install);
    put_optional(json, "eval_commands", spec.eval_commands);
    put_optional(json, "env_vars", spec.env_vars);
    put_optional(json, "execute_test_as_nonroot", spec.execute_test_as_nonroot);
    put_optional(json, "no_use_env", spec.no_use_env);
    put_optional(json, "nano_cpus", spec.nano_cpus);
}

void from_json(const nlohmann::json& json, RepoConfig& config) {
    config.repo_name = json.value("repo_name", "");
    config.repo_path = json.value("repo_path", "");
    config.github_url = json.value("github_url", "");
    config.log_parser = json.value("log_parser", "");
    get_optional(json, "repo_install", config.repo_install);

    config.specs.clear();
    if (json.contains("specs")) {
        json.at("specs").get_to(config.specs);
    }
}

void to_json(nlohmann::json& json, const RepoConfig& config) {
    json = nlohmann::json{
        {"repo_name", config.repo_name},   {"repo_path", config.repo_path}, {"github_url", config.github_url},
        {"log_parser", config.log_parser}, {"specs", config.specs},
    };

    put_optional(json, "repo_install", config.repo_install);
}

Expected<RepoBuildSpec, std::string> RepoConfig::specs_with_fallback(std::string_view version) const {
    if (specs.empty()) {
        return fmt::format("No specs found in repo config for {:?}", repo_name);
    }

    if (auto iter = specs.find(std::string{version}); iter != specs.end()) {
        return iter->second;
    }

    if (auto iter = specs.find("default"); iter != specs.end()) {
        return iter->second;
    }

    return specs.rbegin()->second;
}

Expected<RepoConfig, std::string> read_repo_config(const std::filesystem::path& path) {
    std::ifstream in_file{path};

    if (!in_file.is_open()) {
        return fmt::format("Failed to open repo config {}", path);
    }

    try {
        return nlohmann::json::parse(in_file).get<RepoConfig>();
    } catch (const nlohmann::json::exception& ex) {
        return fmt::format("Malformed repo config {}: {}", path, ex.what());
    }
}

RepoConfigStore::RepoConfigStore(std::filesystem::path config_dir)
    : config_dir_{std::move(config_dir)} {}

Expected<RepoConfig, std::string> RepoConfigStore::load(std::string_view repo) const {
    std::string repo_name{repo.substr(repo.find_last_of('/') + 1)};

    {
        std::scoped_lock lock{cache_mutex_};
        if (auto iter = cache_.find(repo_name); iter != cache_.end()) {
            return iter->second;
        }
    }

    RepoConfig config = TRY(load_uncached(repo_name));

    std::scoped_lock lock{cache_mutex_};
    cache_.try_emplace(repo_name, config);

    return config;
}

Expected<RepoConfig, std::string> RepoConfigStore::load_uncached(const std::string& repo_name) const {
    const auto repo_path = config_dir_ / (repo_name + ".json");
    const auto default_path = config_dir_ / DEFAULT_CONFIG_NAME;

    if (std::filesystem::exists(repo_path)) {
        RepoConfig config = TRY(read_repo_config(repo_path));

        if (!config.specs.empty()) {
            return config;
        }

        LOG_DEBUG("Repo config {} has no specs; falling back to {}", repo_path, default_path);
    }

    if (!std::filesystem::exists(default_path)) {
        return fmt::format("No config found for {:?} and no default config found in {}", repo_name, config_dir_);
    }

    return read_repo_config(default_path);
}

Expected<RepoBuildSpec, std::string> RepoConfigStore::lookup(std::string_view repo, std::string_view version) const {
    RepoConfig config = TRY(load(repo));

    return config.specs_with_fallback(version);
}

} // namespace patchgrader
