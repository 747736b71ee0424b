#pragma once

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/runtime/container_runtime.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

/// In-memory ContainerRuntime. Each instance id can be given a script of what its test runs print
/// and how patching behaves; images are tracked as a set of keys.
class FakeRuntime : public patchgrader::ContainerRuntime
{
public:
    struct Script
    {
        std::string output_before;
        std::string output_after;

        int git_apply_exit = 0;
        int patch_fuzz_exit = 1;

        bool fail_build = false;
        /// Time out on the n-th test run (1-based); 0 never
        int timeout_on_run = 0;
    };

    std::map<std::string, Script> scripts;

    std::set<std::string> images;
    std::vector<std::string> removed_images;
    std::vector<std::string> patch_commands;
    std::vector<std::string> copied_files;

    int started_containers = 0;
    int removed_containers = 0;

    patchgrader::Result<void> build_image_if_absent(const patchgrader::TestSpec& spec) override {
        std::scoped_lock lock{mutex_};

        if (script_for(spec.instance_id).fail_build) {
            return patchgrader::ErrorKind::CommandFailed;
        }

        images.insert(spec.base_image_key());
        images.insert(spec.env_image_key());
        images.insert(spec.instance_image_key());

        return {};
    }

    patchgrader::Result<patchgrader::ContainerHandle> start_container(const std::string& image_key,
                                                                      const patchgrader::TestSpec& spec) override {
        std::scoped_lock lock{mutex_};

        if (!images.contains(image_key)) {
            return patchgrader::ErrorKind::NotFound;
        }

        ++started_containers;
        return patchgrader::ContainerHandle{.id = spec.instance_id, .name = fmt::format("fake.{}", spec.instance_id)};
    }

    patchgrader::Result<patchgrader::TimedExecResult> exec_with_timeout(const patchgrader::ContainerHandle& handle,
                                                                        const std::string& /*cmd*/,
                                                                        std::chrono::seconds /*timeout*/) override {
        std::scoped_lock lock{mutex_};

        const Script& script = script_for(handle.id);
        const int run = ++eval_runs_[handle.id];

        if (run == script.timeout_on_run) {
            return patchgrader::TimedExecResult{.output = "partial output", .timed_out = true};
        }

        return patchgrader::TimedExecResult{.output = run == 1 ? script.output_before : script.output_after};
    }

    patchgrader::Result<patchgrader::ExecResult> exec(const patchgrader::ContainerHandle& handle,
                                                      const std::string& cmd, const std::string& /*workdir*/,
                                                      const std::string& /*user*/) override {
        std::scoped_lock lock{mutex_};

        const Script& script = script_for(handle.id);

        if (cmd.starts_with("git apply")) {
            patch_commands.push_back(cmd);
            return patchgrader::ExecResult{.exit_code = script.git_apply_exit, .output = "git apply output"};
        }

        if (cmd.starts_with("patch ")) {
            patch_commands.push_back(cmd);
            return patchgrader::ExecResult{.exit_code = script.patch_fuzz_exit, .output = "patch output"};
        }

        return patchgrader::ExecResult{.exit_code = 0, .output = ""};
    }

    patchgrader::Result<void> copy_file_in(const patchgrader::ContainerHandle& /*handle*/,
                                           const std::filesystem::path& src, const std::string& dest) override {
        std::scoped_lock lock{mutex_};

        if (!std::filesystem::exists(src)) {
            return patchgrader::ErrorKind::NotFound;
        }

        copied_files.push_back(dest);
        return {};
    }

    patchgrader::Result<void> stop(const patchgrader::ContainerHandle& /*handle*/) override { return {}; }

    patchgrader::Result<void> remove(const patchgrader::ContainerHandle& /*handle*/) override {
        std::scoped_lock lock{mutex_};
        ++removed_containers;
        return {};
    }

    patchgrader::Result<void> remove_image(const std::string& image_key) override {
        std::scoped_lock lock{mutex_};

        if (images.erase(image_key) == 0) {
            return patchgrader::ErrorKind::NotFound;
        }

        removed_images.push_back(image_key);
        return {};
    }

    patchgrader::Result<std::vector<std::string>> list_images() override {
        std::scoped_lock lock{mutex_};
        return std::vector<std::string>(images.begin(), images.end());
    }

private:
    const Script& script_for(const std::string& instance_id) { return scripts[instance_id]; }

    std::mutex mutex_;
    std::map<std::string, int> eval_runs_;
};
