#pragma once

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/harness/test_spec.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace patchgrader {

/// Opaque handle to a started container
struct ContainerHandle
{
    std::string id;
    std::string name;
};

struct TimedExecResult
{
    std::string output;
    bool timed_out = false;
    std::chrono::duration<double> elapsed{};
};

struct ExecResult
{
    int exit_code = -1;
    std::string output;
};

/// The container primitives an instance run needs.
///
/// Implementations must make each call safe to use from several worker threads at once.
/// ``NotFound`` from stop/remove/remove_image means there was nothing to tear down.
class ContainerRuntime
{
public:
    ContainerRuntime() = default;
    ContainerRuntime(const ContainerRuntime&) = delete;
    ContainerRuntime(ContainerRuntime&&) = delete;
    ContainerRuntime& operator=(const ContainerRuntime&) = delete;
    ContainerRuntime& operator=(ContainerRuntime&&) = delete;
    virtual ~ContainerRuntime() = default;

    /// Make sure the instance image of ``spec`` (and the images it is layered on) exists
    virtual Result<void> build_image_if_absent(const TestSpec& spec) = 0;

    virtual Result<ContainerHandle> start_container(const std::string& image_key, const TestSpec& spec) = 0;

    /// Run ``cmd`` through a shell in the container, killing it once ``timeout`` is reached.
    /// Output produced before the deadline is returned either way.
    virtual Result<TimedExecResult> exec_with_timeout(const ContainerHandle& handle, const std::string& cmd,
                                                      std::chrono::seconds timeout) = 0;

    virtual Result<ExecResult> exec(const ContainerHandle& handle, const std::string& cmd,
                                    const std::string& workdir = "/", const std::string& user = "root") = 0;

    virtual Result<void> copy_file_in(const ContainerHandle& handle, const std::filesystem::path& src,
                                      const std::string& dest) = 0;

    virtual Result<void> stop(const ContainerHandle& handle) = 0;

    virtual Result<void> remove(const ContainerHandle& handle) = 0;

    virtual Result<void> remove_image(const std::string& image_key) = 0;

    /// ``repository:tag`` of every image present
    virtual Result<std::vector<std::string>> list_images() = 0;
};

} // namespace patchgrader
