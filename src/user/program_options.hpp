#pragma once

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/expected.hpp>
#include <patchgrader/harness/env_manager.hpp>
#include <patchgrader/output/verbosity.hpp>
#include <patchgrader/runner/image_cache.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace patchgrader {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for stdout progress output
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// A JSONL file, or a directory whose ``*.jsonl`` files are validated one by one
    std::filesystem::path input_path;
    std::string run_id;

    std::size_t max_workers = DEFAULT_MAX_WORKERS;
    std::size_t open_file_limit = DEFAULT_OPEN_FILE_LIMIT;
    /// Per test run
    std::chrono::seconds timeout{DEFAULT_TIMEOUT_SECONDS};

    bool force_rebuild = false;
    CacheLevel cache_level = CacheLevel::Env;
    bool clean = false;
    bool overwrite = false;

    std::filesystem::path state_output_path = DEFAULT_STATE_OUTPUT_PATH;
    std::filesystem::path validated_dir;
    std::filesystem::path pre_validated_dir;

    std::filesystem::path repo_config_dir = DEFAULT_REPO_CONFIG_DIR;
    std::filesystem::path log_root = DEFAULT_LOG_ROOT;

    EnvManagerKind env_manager = EnvManagerKind::Conda;
    std::string python_version = std::string{DEFAULT_PYTHON_VERSION};

    std::optional<std::filesystem::path> instance_repos_dir;
    std::optional<std::filesystem::path> local_repos_dir;
    std::optional<std::filesystem::path> local_pip_dir;
    std::optional<std::filesystem::path> local_channel_dir;

    /// The docker client binary
    std::string docker = std::string{DEFAULT_DOCKER_BINARY};

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;
    static constexpr std::size_t DEFAULT_MAX_WORKERS = 4;
    static constexpr std::size_t DEFAULT_OPEN_FILE_LIMIT = 4096;
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 1800;
    static constexpr std::string_view DEFAULT_STATE_OUTPUT_PATH = "validation_state";
    static constexpr std::string_view DEFAULT_REPO_CONFIG_DIR = "repo_configs";
    static constexpr std::string_view DEFAULT_LOG_ROOT = "logs/run_validation";
    static constexpr std::string_view DEFAULT_PYTHON_VERSION = "3.9";
    static constexpr std::string_view DEFAULT_DOCKER_BINARY = "docker";

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Assume that all enumerators have valid values except for verbosity
        // which we will just clamp to [MIN, MAX)

        constexpr auto MAX_VERBOSITY = VerbosityLevel::All;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (run_id.empty()) {
            return "Run ID must not be empty";
        }

        if (max_workers == 0) {
            return "Max workers must be at least 1";
        }

        if (timeout.count() <= 0) {
            return "Timeout must be positive";
        }

        TRY(ensure_file_exists(input_path, "Input path {:?}"));

        if (validated_dir.empty() || pre_validated_dir.empty()) {
            return "Both the validated and pre-validated directories must be specified";
        }

        TRY(ensure_is_directory(repo_config_dir, "Repo config directory {:?}"));

        if (instance_repos_dir) {
            TRY(ensure_is_directory(*instance_repos_dir, "Instance repos directory {:?}"));
        }

        if (local_repos_dir) {
            TRY(ensure_is_directory(*local_repos_dir, "Local repos directory {:?}"));
        }

        return {};
    }
};

} // namespace patchgrader

template <>
struct fmt::formatter<::patchgrader::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::patchgrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, input_path={}, run_id={}, max_workers={}, timeout={}s, "
                              "force_rebuild={}, cache_level={}, clean={}, overwrite={}, env_manager={}, "
                              "python={}, repo_config_dir={}, log_root={}}}",
                              fmt::underlying(from.verbosity), from.input_path, from.run_id, from.max_workers,
                              from.timeout.count(), from.force_rebuild, from.cache_level, from.clean, from.overwrite,
                              from.env_manager, from.python_version, from.repo_config_dir, from.log_root);
    }
};
