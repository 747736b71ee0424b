#include <patchgrader/harness/test_spec.hpp>

#include <patchgrader/common/os.hpp>
#include <patchgrader/exceptions.hpp>
#include <patchgrader/harness/env_manager.hpp>
#include <patchgrader/harness/repo_config.hpp>
#include <patchgrader/harness/task_instance.hpp>
#include <patchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/copy.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchgrader {

namespace {

constexpr auto NON_TEST_EXTS = std::to_array<std::string_view>(
    {".json", ".png", "csv", ".txt", ".md", ".jpg", ".jpeg", ".pkl", ".yml", ".yaml", ".toml"});

std::vector<std::string> regex_captures(std::string_view text, const std::regex& pattern) {
    std::vector<std::string> result;

    for (auto iter = std::cregex_iterator{text.data(), text.data() + text.size(), pattern}; iter != std::cregex_iterator{};
         ++iter) {
        result.push_back((*iter)[1].str());
    }

    return result;
}

/// 64-bit FNV-1a; stable across platforms and runs
std::uint64_t stable_hash(std::string_view data) {
    constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
    constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (char chr : data) {
        hash ^= static_cast<unsigned char>(chr);
        hash *= FNV_PRIME;
    }

    return hash;
}

void append(std::vector<std::string>& dest, const std::vector<std::string>& src) {
    ranges::copy(src, std::back_inserter(dest));
}

std::string heredoc(std::string_view header, std::string_view content, std::string_view delimiter) {
    return fmt::format("{}\n{}\n{}", header, content, delimiter);
}

} // namespace

std::string TestSpec::render_script(const std::vector<std::string>& cmds) {
    return fmt::format("#!/bin/bash\nset -uxo pipefail\n{}\n", fmt::join(cmds, "\n"));
}

std::string TestSpec::base_image_key() const {
    return fmt::format("{}.base.{}:latest", IMAGE_PREFIX, arch);
}

std::string TestSpec::env_image_key() const {
    return fmt::format("{}.env.{}.{:016x}:latest", IMAGE_PREFIX, arch, stable_hash(setup_env_script() + arch));
}

std::string TestSpec::instance_image_key() const {
    return fmt::format("{}.eval.{}.{}:latest", IMAGE_PREFIX, arch, instance_id);
}

std::string TestSpec::platform() const {
    if (arch == "arm64") {
        return "linux/arm64/v8";
    }

    return "linux/x86_64";
}

std::vector<std::string> diff_modified_files(std::string_view diff) {
    static const std::regex DIFF_MODIFIED_FILE_REGEX{R"(--- a/(.*))"};

    return regex_captures(diff, DIFF_MODIFIED_FILE_REGEX);
}

std::vector<std::string> diff_test_directives(std::string_view diff) {
    static const std::regex DIFF_HEADER_REGEX{R"(diff --git a/.* b/(.*))"};

    std::vector<std::string> directives = regex_captures(diff, DIFF_HEADER_REGEX);

    std::erase_if(directives, [](const std::string& path) {
        return ranges::any_of(NON_TEST_EXTS, [&path](std::string_view ext) { return path.ends_with(ext); });
    });

    return directives;
}

TestSpecBuilder::TestSpecBuilder(const EnvManager& manager, TestSpecBuilderOptions opts)
    : manager_{&manager}
    , opts_{std::move(opts)} {}

std::filesystem::path TestSpecBuilder::instance_repo_dir(std::string_view instance_id) const {
    ASSERT(opts_.instance_repos_dir.has_value());

    return *opts_.instance_repos_dir / fmt::format("repo__{}", instance_id);
}

std::filesystem::path TestSpecBuilder::local_repo_dir(std::string_view instance_id) const {
    ASSERT(opts_.local_repos_dir.has_value());

    // "owner__name-1234" -> "owner__name"
    std::string_view repo = instance_id.substr(0, instance_id.find_last_of('-'));

    return *opts_.local_repos_dir / fmt::format("repo__{}", repo);
}

std::string TestSpecBuilder::arch_for(std::string_view instance_id) const {
    if (opts_.host_processor == ProcessorKind::Aarch64 && !opts_.x86_instance_ids.contains(instance_id)) {
        return "arm64";
    }

    return "x86_64";
}

std::string TestSpecBuilder::reset_tests_command(const TaskInstance& instance) const {
    std::vector<std::string> test_files = diff_modified_files(instance.test_patch);

    if (opts_.instance_repos_dir) {
        auto repo_dir = instance_repo_dir(instance.instance_id);
        auto sources = test_files | ranges::views::transform([&repo_dir](const std::string& file) {
                           return (repo_dir / file).string();
                       });

        return fmt::format("cp -f {}", fmt::join(sources, " "));
    }

    return fmt::format("git checkout {} {}", instance.base_commit, fmt::join(test_files, " "));
}

std::vector<std::string> TestSpecBuilder::make_env_script_list(const TaskInstance& instance,
                                                               const RepoBuildSpec& spec,
                                                               const EnvManager& manager) const {
    std::vector<std::string> cmds = manager.add_channel_commands();
    append(cmds, manager.pre_activate_commands());

    const std::string pkgs = spec.packages.value_or("");

    if (pkgs == RepoBuildSpec::REQUIREMENTS_TXT) {
        if (!instance.requirements_txt) {
            throw SpecError(fmt::format("Instance {} requires a requirements.txt, but none was provided",
                                        instance.instance_id));
        }

        std::string reqs_path = fmt::format("{}/requirements.txt", opts_.requirements_dir);

        append(cmds, manager.create_commands());
        cmds.push_back(heredoc(fmt::format("cat <<'{}' > {}", HEREDOC_DELIMITER_REQUIREMENTS, reqs_path),
                               *instance.requirements_txt, HEREDOC_DELIMITER_REQUIREMENTS));
        append(cmds, manager.activate_commands());
        cmds.push_back(manager.wrap_run_command(fmt::format("python -m pip install -r {}", reqs_path)));
        cmds.push_back(fmt::format("rm {}", reqs_path));
    } else if (pkgs == RepoBuildSpec::ENVIRONMENT_YML) {
        if (!instance.environment_yml) {
            throw SpecError(fmt::format("Instance {} requires an environment.yml, but none was provided",
                                        instance.instance_id));
        }

        constexpr std::string_view YML_PATH = "environment.yml";

        cmds.push_back(heredoc(fmt::format("cat <<'{}' > {}", HEREDOC_DELIMITER_REQUIREMENTS, YML_PATH),
                               *instance.environment_yml, HEREDOC_DELIMITER_REQUIREMENTS));

        if (spec.no_use_env.value_or(false)) {
            cmds.push_back(fmt::format("conda create -c conda-forge -n {} python={} -y", manager.env_name(),
                                       manager.python_version()));
            cmds.push_back(fmt::format("conda env update -f {}", YML_PATH));
        } else {
            cmds.push_back(fmt::format("conda env create --file {}", YML_PATH));
            cmds.push_back(fmt::format("conda activate {} && conda install python={} -y", manager.env_name(),
                                       manager.python_version()));
        }

        cmds.push_back(fmt::format("rm {}", YML_PATH));
    } else if (!manager.is_venv()) {
        append(cmds, manager.create_commands(pkgs));
    }

    if (!manager.is_venv()) {
        append(cmds, manager.activate_commands());

        if (spec.pip_packages) {
            cmds.push_back(manager.wrap_run_command(
                fmt::format("python -m pip install {}", fmt::join(*spec.pip_packages, " "))));
        }
    }

    return cmds;
}

std::vector<std::string> TestSpecBuilder::make_repo_script_list(const TaskInstance& instance,
                                                                const RepoConfig& repo_config,
                                                                const RepoBuildSpec& spec,
                                                                const EnvManager& manager) const {
    const std::string& testbed = opts_.testbed_dir;
    const bool prefetched = opts_.instance_repos_dir.has_value();

    std::vector<std::string> cmds;

    if (prefetched) {
        cmds = {
            fmt::format("cp -r {} {}", instance_repo_dir(instance.instance_id).string(), testbed),
            // So a nonroot user can run tests
            fmt::format("chmod -R 777 {}", testbed),
            fmt::format("cd {}", testbed),
        };

        if (!opts_.activate_only_in_eval) {
            if (manager.is_venv()) {
                append(cmds, manager.create_commands());
            } else {
                append(cmds, manager.pre_activate_commands());
            }
            append(cmds, manager.activate_commands());
        }

        cmds.push_back(
            fmt::format("echo \"Current environment: {}\"", manager.is_venv() ? "venv" : "$CONDA_DEFAULT_ENV"));
    } else {
        std::string clone_cmd = opts_.local_repos_dir
                                    ? fmt::format("git clone {} {}", local_repo_dir(instance.instance_id).string(),
                                                  testbed)
                                    : fmt::format("git clone -o origin https://github.com/{} {}", instance.repo,
                                                  testbed);

        cmds = {
            std::move(clone_cmd),
            fmt::format("chmod -R 777 {}", testbed),
            fmt::format("cd {}", testbed),
            fmt::format("git reset --hard {}", instance.base_commit),
            // Hide newer commits from anything running in the container
            "git remote remove origin",
        };

        if (manager.is_venv()) {
            append(cmds, manager.create_commands());
        } else {
            append(cmds, manager.pre_activate_commands());
            append(cmds, manager.activate_commands());
        }
    }

    if (repo_config.repo_install) {
        cmds.push_back(*repo_config.repo_install);
    }

    for (const std::string& pre_install : spec.pre_install.value_or(std::vector<std::string>{})) {
        // A pre-fetched checkout is already at its base state
        if (prefetched && pre_install.find("git ") != std::string::npos) {
            continue;
        }
        if (opts_.disable_apt_install && pre_install.find("apt-get ") != std::string::npos) {
            continue;
        }

        cmds.push_back(pre_install);
    }

    if (spec.pip_packages && manager.is_venv() && !opts_.activate_only_in_eval) {
        cmds.push_back(
            manager.wrap_run_command(fmt::format("python -m pip install {}", fmt::join(*spec.pip_packages, " "))));
    }

    if (spec.install && opts_.include_install_in_repo_setup && !opts_.activate_only_in_eval) {
        cmds.push_back(manager.wrap_run_command(*spec.install));
    }

    return cmds;
}

std::vector<std::string> TestSpecBuilder::make_eval_script_list(const TaskInstance& instance,
                                                                const RepoBuildSpec& spec,
                                                                const EnvManager& manager,
                                                                const std::optional<std::string>& test_patch_path,
                                                                const std::optional<std::string>& model_patch_path) const {
    const std::string& testbed = opts_.testbed_dir;
    const bool prefetched = opts_.instance_repos_dir.has_value();
    const std::string reset_tests = reset_tests_command(instance);

    std::vector<std::string> cmds{fmt::format("cd {}", testbed)};
    append(cmds, manager.pre_activate_commands());
    append(cmds, manager.activate_commands());

    if (spec.eval_commands) {
        append(cmds, *spec.eval_commands);
    }

    if (!prefetched) {
        // Informational only, so that the logs record the repository state
        cmds.push_back(fmt::format("git config --global --add safe.directory {}", testbed));
        cmds.emplace_back("git status");
        cmds.emplace_back("git show");
        cmds.push_back(fmt::format("git diff {}", instance.base_commit));
    }

    if (spec.install && !opts_.include_install_in_repo_setup && !opts_.activate_only_in_eval) {
        std::string env_vars;
        if (spec.env_vars) {
            env_vars = fmt::format("{} ", fmt::join(*spec.env_vars, " "));
        }

        cmds.push_back(env_vars + manager.wrap_run_command(*spec.install));
    }

    if (!prefetched) {
        cmds.push_back(reset_tests);
    }

    if (model_patch_path) {
        cmds.push_back(fmt::format("echo \"{} (pred)\"", APPLY_PATCH_PASS));
        cmds.push_back(prefetched ? fmt::format("patch -p1 < {}", *model_patch_path)
                                  : fmt::format("git apply {} -v", *model_patch_path));
    }

    if (test_patch_path) {
        cmds.push_back(prefetched ? fmt::format("patch -p1 < {}", *test_patch_path)
                                  : fmt::format("git apply {}", *test_patch_path));
    } else {
        cmds.push_back(heredoc(fmt::format("git apply -v - <<'{}'", HEREDOC_DELIMITER_GIT_APPLY), instance.test_patch,
                               HEREDOC_DELIMITER_GIT_APPLY));
    }

    std::vector<std::string> test_command{manager.wrap_run_command(spec.test_cmd)};
    append(test_command, diff_test_directives(instance.test_patch));
    cmds.push_back(fmt::format("{}", fmt::join(test_command, " ")));

    if (opts_.reset_tests_after_eval) {
        // Leave the repository as it was before the run
        cmds.push_back(reset_tests);
    }

    return cmds;
}

TestSpec TestSpecBuilder::build(const TaskInstance& instance, const RepoConfig& repo_config,
                                const std::optional<std::string>& test_patch_path,
                                const std::optional<std::string>& model_patch_path) const {
    auto spec_res = repo_config.specs_with_fallback(instance.version);

    if (!spec_res) {
        throw SpecError(fmt::format("Could not find build spec for {}: {}", instance.instance_id, spec_res.error()));
    }

    const RepoBuildSpec& spec = spec_res.value();

    std::unique_ptr<EnvManager> spec_python_manager;
    if (opts_.use_spec_python) {
        spec_python_manager = manager_->with_python_version(spec.python);
    }
    const EnvManager& manager = spec_python_manager ? *spec_python_manager : *manager_;

    LOG_DEBUG("Building test spec for {} (repo={}, version={}, manager={})", instance.instance_id, instance.repo,
              instance.version, manager.kind());

    return TestSpec{
        .instance_id = instance.instance_id,
        .repo = instance.repo,
        .version = instance.version,
        .env_script_list = make_env_script_list(instance, spec, manager),
        .repo_script_list = make_repo_script_list(instance, repo_config, spec, manager),
        .eval_script_list = make_eval_script_list(instance, spec, manager, test_patch_path, model_patch_path),
        .arch = arch_for(instance.instance_id),
        .fail_to_pass = instance.fail_to_pass,
        .pass_to_pass = instance.pass_to_pass,
        .execute_test_as_nonroot = spec.execute_test_as_nonroot.value_or(false),
        .nano_cpus = spec.nano_cpus,
    };
}

} // namespace patchgrader
