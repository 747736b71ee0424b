#include <patchgrader/runtime/docker_cli_runtime.hpp>

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/strings.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <gsl/util>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <unistd.h>

namespace patchgrader {

namespace {

constexpr std::string_view NO_SUCH_CONTAINER = "No such container";
constexpr std::string_view NO_SUCH_IMAGE = "No such image";

// Keeps a container alive until it is explicitly stopped
const std::vector<std::string> IDLE_COMMAND = {"tail", "-f", "/dev/null"};

std::string unique_suffix() {
    static std::atomic<unsigned> counter{0};

    return fmt::format("{}.{}", ::getpid(), counter++);
}

std::string to_container_name(std::string_view instance_id) {
    // Docker names allow [a-zA-Z0-9_.-]
    std::string name{instance_id};
    for (char& chr : name) {
        bool allowed = (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || (chr >= '0' && chr <= '9') ||
                       chr == '_' || chr == '.' || chr == '-';
        if (!allowed) {
            chr = '_';
        }
    }
    return name;
}

/// Map a failed docker invocation to an ErrorKind, logging its output
ErrorKind command_error(const CommandResult& res, std::string_view what) {
    if (res.timed_out) {
        LOG_WARN("docker {} timed out after {:.1f}s", what, res.elapsed.count());
        return ErrorKind::TimedOut;
    }

    if (res.output.find(NO_SUCH_CONTAINER) != std::string::npos ||
        res.output.find(NO_SUCH_IMAGE) != std::string::npos) {
        LOG_DEBUG("docker {}: target not found", what);
        return ErrorKind::NotFound;
    }

    LOG_WARN("docker {} failed with code {}: {}", what, res.exit_code.value_or(-1), trim(res.output));
    return ErrorKind::CommandFailed;
}

constexpr std::string_view NONROOT_USER = "nonroot";
constexpr double NANO_CPUS_PER_CPU = 1e9;

Result<std::filesystem::path> write_temp_script(std::string_view script_name, const std::string& contents) {
    std::error_code err;
    auto dir = std::filesystem::temp_directory_path(err);

    if (err) {
        LOG_WARN("Could not locate a temp directory: {}", err.message());
        return ErrorKind::SyscallFailure;
    }

    auto path = dir / fmt::format("{}.{}", unique_suffix(), script_name);

    std::ofstream out{path, std::ios::trunc};
    out << contents;

    if (!out) {
        LOG_WARN("Failed to write {}", path);
        return ErrorKind::SyscallFailure;
    }

    return path;
}

} // namespace

DockerCliRuntime::DockerCliRuntime(DockerCliOptions opts)
    : opts_{std::move(opts)} {}

Result<CommandResult> DockerCliRuntime::docker(const std::vector<std::string>& args) {
    return docker(args, opts_.command_timeout);
}

Result<CommandResult> DockerCliRuntime::docker(const std::vector<std::string>& args, std::chrono::seconds timeout) {
    LOG_TRACE("{} {}", opts_.docker_binary, fmt::join(args, " "));

    return run_command(opts_.docker_binary, args, timeout);
}

std::mutex& DockerCliRuntime::build_mutex_for(const std::string& image_key) {
    std::scoped_lock lock{build_mutexes_mutex_};

    auto& mutex = build_mutexes_[image_key];
    if (!mutex) {
        mutex = std::make_unique<std::mutex>();
    }

    return *mutex;
}

bool DockerCliRuntime::image_exists(const std::string& image_key) {
    auto res = docker({"image", "inspect", "--format", "{{.Id}}", image_key});

    return res && res->succeeded();
}

Result<void> DockerCliRuntime::layer_image(const std::string& from_image, const std::string& to_image,
                                           const std::string& platform, std::string_view script_name,
                                           const std::string& script) {
    LOG_INFO("Building image {} from {} with {}", to_image, from_image, script_name);

    const auto script_path = TRY(write_temp_script(script_name, script));
    auto remove_script = gsl::finally([&script_path] {
        std::error_code err;
        std::filesystem::remove(script_path, err);
    });

    const std::string container_name = fmt::format("pg.build.{}", unique_suffix());

    std::vector<std::string> run_args = {"run", "-d", "--platform", platform, "--name", container_name, from_image};
    run_args.insert(run_args.end(), IDLE_COMMAND.begin(), IDLE_COMMAND.end());

    auto run_res = TRY(docker(run_args));
    if (!run_res.succeeded()) {
        return command_error(run_res, "run");
    }

    auto remove_container = gsl::finally([this, &container_name] {
        if (auto res = docker({"rm", "-f", container_name}); !res || !res->succeeded()) {
            LOG_WARN("Failed to remove build container {}", container_name);
        }
    });

    const std::string container_script = fmt::format("/root/{}", script_name);

    auto cp_res = TRY(docker({"cp", script_path.string(), fmt::format("{}:{}", container_name, container_script)}));
    if (!cp_res.succeeded()) {
        return command_error(cp_res, "cp");
    }

    auto setup_res =
        TRY(docker({"exec", container_name, "/bin/bash", container_script}, opts_.build_timeout));
    if (!setup_res.succeeded()) {
        LOG_WARN("{} failed while building {}:\n{}", script_name, to_image, setup_res.output);
        return setup_res.timed_out ? ErrorKind::TimedOut : ErrorKind::CommandFailed;
    }

    LOG_DEBUG("{} output for {}:\n{}", script_name, to_image, setup_res.output);

    auto commit_res = TRY(docker({"commit", container_name, to_image}));
    if (!commit_res.succeeded()) {
        return command_error(commit_res, "commit");
    }

    LOG_INFO("Built image {} in {:.1f}s", to_image, setup_res.elapsed.count());

    return {};
}

Result<void> DockerCliRuntime::build_image_if_absent(const TestSpec& spec) {
    const auto base_key = spec.base_image_key();
    const auto env_key = spec.env_image_key();
    const auto instance_key = spec.instance_image_key();

    if (image_exists(instance_key)) {
        LOG_DEBUG("Image {} already exists", instance_key);
        return {};
    }

    {
        std::scoped_lock lock{build_mutex_for(env_key)};

        if (!image_exists(env_key)) {
            if (!image_exists(base_key)) {
                LOG_ERROR("Base image {} not found; it must be provided before validation", base_key);
                return ErrorKind::NotFound;
            }

            TRY(layer_image(base_key, env_key, spec.platform(), "setup_env.sh", spec.setup_env_script()));
        }
    }

    std::scoped_lock lock{build_mutex_for(instance_key)};

    if (image_exists(instance_key)) {
        return {};
    }

    return layer_image(env_key, instance_key, spec.platform(), "setup_repo.sh", spec.install_repo_script());
}

std::vector<std::string> docker_run_args(const std::string& image_key, const TestSpec& spec,
                                         const std::string& container_name) {
    std::vector<std::string> args = {"run", "-d", "--platform", spec.platform(), "--name", container_name};

    if (spec.execute_test_as_nonroot) {
        args.insert(args.end(), {"-u", std::string{NONROOT_USER}});
    }

    if (spec.nano_cpus) {
        args.insert(args.end(), {"--cpus", fmt::format("{}", static_cast<double>(*spec.nano_cpus) / NANO_CPUS_PER_CPU)});
    }

    args.push_back(image_key);
    args.insert(args.end(), IDLE_COMMAND.begin(), IDLE_COMMAND.end());

    return args;
}

Result<ContainerHandle> DockerCliRuntime::start_container(const std::string& image_key, const TestSpec& spec) {
    const std::string name = fmt::format("pg.val.{}.{}", to_container_name(spec.instance_id), unique_suffix());

    auto res = TRY(docker(docker_run_args(image_key, spec, name)));
    if (!res.succeeded()) {
        return command_error(res, "run");
    }

    ContainerHandle handle{.id = std::string{trim(res.output)}, .name = name};

    LOG_DEBUG("Started container {} ({}) from {}", handle.name, handle.id, image_key);

    return handle;
}

Result<TimedExecResult> DockerCliRuntime::exec_with_timeout(const ContainerHandle& handle, const std::string& cmd,
                                                            std::chrono::seconds timeout) {
    auto res = TRY(docker({"exec", handle.id, "/bin/bash", "-c", cmd}, timeout));

    return TimedExecResult{.output = std::move(res.output), .timed_out = res.timed_out, .elapsed = res.elapsed};
}

Result<ExecResult> DockerCliRuntime::exec(const ContainerHandle& handle, const std::string& cmd,
                                          const std::string& workdir, const std::string& user) {
    auto res = TRY(docker({"exec", "-w", workdir, "-u", user, handle.id, "/bin/bash", "-c", cmd}));

    if (res.timed_out) {
        return command_error(res, "exec");
    }

    return ExecResult{.exit_code = res.exit_code.value_or(-1), .output = std::move(res.output)};
}

Result<void> DockerCliRuntime::copy_file_in(const ContainerHandle& handle, const std::filesystem::path& src,
                                            const std::string& dest) {
    auto res = TRY(docker({"cp", src.string(), fmt::format("{}:{}", handle.id, dest)}));

    if (!res.succeeded()) {
        return command_error(res, "cp");
    }

    return {};
}

Result<void> DockerCliRuntime::stop(const ContainerHandle& handle) {
    auto res = TRY(docker({"stop", "-t", "15", handle.id}));

    if (!res.succeeded()) {
        return command_error(res, "stop");
    }

    return {};
}

Result<void> DockerCliRuntime::remove(const ContainerHandle& handle) {
    auto res = TRY(docker({"rm", "-f", handle.id}));

    if (!res.succeeded()) {
        return command_error(res, "rm");
    }

    return {};
}

Result<void> DockerCliRuntime::remove_image(const std::string& image_key) {
    auto res = TRY(docker({"rmi", "-f", image_key}));

    if (!res.succeeded()) {
        return command_error(res, "rmi");
    }

    LOG_DEBUG("Removed image {}", image_key);

    return {};
}

Result<std::vector<std::string>> DockerCliRuntime::list_images() {
    auto res = TRY(docker({"images", "--format", "{{.Repository}}:{{.Tag}}"}));

    if (!res.succeeded()) {
        return command_error(res, "images");
    }

    auto lines = split_lines_keep_ends(res.output);

    return lines                                                                   //
           | ranges::views::transform([](std::string_view line) { return trim(line); }) //
           | ranges::views::filter([](std::string_view line) { return !line.empty(); }) //
           | ranges::views::transform([](std::string_view line) { return std::string{line}; }) //
           | ranges::to<std::vector>();
}

} // namespace patchgrader
