#pragma once

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/runtime/container_runtime.hpp>
#include <patchgrader/subprocess/subprocess.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace patchgrader {

struct DockerCliOptions
{
    /// Name or path of the docker client binary
    std::string docker_binary = "docker";

    /// Limit for the short management commands (inspect, cp, stop, ...)
    std::chrono::seconds command_timeout{std::chrono::minutes{10}};

    /// Limit for running one setup script while layering an image
    std::chrono::seconds build_timeout{std::chrono::hours{2}};
};

/// Arguments of the ``docker run`` that starts a detached, idle container of ``image_key``.
/// Applies the spec's user and CPU limit.
std::vector<std::string> docker_run_args(const std::string& image_key, const TestSpec& spec,
                                         const std::string& container_name);

/// ContainerRuntime driving the ``docker`` command-line client.
///
/// Images are never built from Dockerfiles. The env image is layered on the base image by
/// running the spec's env setup script in a container and committing it, and the instance
/// image likewise on the env image with the repo setup script.
class DockerCliRuntime : public ContainerRuntime
{
public:
    explicit DockerCliRuntime(DockerCliOptions opts = {});

    Result<void> build_image_if_absent(const TestSpec& spec) override;

    Result<ContainerHandle> start_container(const std::string& image_key, const TestSpec& spec) override;

    Result<TimedExecResult> exec_with_timeout(const ContainerHandle& handle, const std::string& cmd,
                                              std::chrono::seconds timeout) override;

    Result<ExecResult> exec(const ContainerHandle& handle, const std::string& cmd, const std::string& workdir,
                            const std::string& user) override;

    Result<void> copy_file_in(const ContainerHandle& handle, const std::filesystem::path& src,
                              const std::string& dest) override;

    Result<void> stop(const ContainerHandle& handle) override;

    Result<void> remove(const ContainerHandle& handle) override;

    Result<void> remove_image(const std::string& image_key) override;

    Result<std::vector<std::string>> list_images() override;

    bool image_exists(const std::string& image_key);

private:
    Result<CommandResult> docker(const std::vector<std::string>& args);
    Result<CommandResult> docker(const std::vector<std::string>& args, std::chrono::seconds timeout);

    /// Run ``script`` in a container of ``from_image`` and commit the result as ``to_image``
    Result<void> layer_image(const std::string& from_image, const std::string& to_image, const std::string& platform,
                             std::string_view script_name, const std::string& script);

    /// Serializes builds of the same image key between workers
    std::mutex& build_mutex_for(const std::string& image_key);

    DockerCliOptions opts_;

    std::mutex build_mutexes_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> build_mutexes_;
};

} // namespace patchgrader
