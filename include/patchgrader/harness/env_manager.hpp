#pragma once

#include <patchgrader/common/enum_names.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchgrader {

/// Package-management back end that owns the Python environment inside a container
enum class EnvManagerKind { Conda, Mamba, Micromamba, Venv };

PATCHGRADER_ENUM_NAMES(EnvManagerKind,                          //
                       {EnvManagerKind::Conda, "conda"},        //
                       {EnvManagerKind::Mamba, "mamba"},        //
                       {EnvManagerKind::Micromamba, "micromamba"}, //
                       {EnvManagerKind::Venv, "venv"});

struct EnvManagerOptions
{
    /// Defaults to "testbed" ("venv" for the venv back end)
    std::optional<std::string> env_name;
    std::string python_version;

    /// Offline conda channel made available via `file://`
    std::optional<std::filesystem::path> local_channel_dir;
    /// Offline wheel directory; rewrites every `pip install` to use it
    std::optional<std::filesystem::path> local_pip_dir;

    bool force_x86 = false;
};

/// Produces the shell command fragments needed to create, activate and tear down a
/// named environment. All members are pure string producers.
class EnvManager
{
public:
    virtual ~EnvManager() = default;

    virtual EnvManagerKind kind() const = 0;

    bool is_venv() const { return kind() == EnvManagerKind::Venv; }

    const std::string& env_name() const { return env_name_; }

    const std::string& python_version() const { return opts_.python_version; }

    const EnvManagerOptions& options() const { return opts_; }

    /// Create the environment with ``pkgs`` (a space-separated package list) installed
    virtual std::vector<std::string> create_commands(std::string_view pkgs = "") const = 0;

    /// Commands that must run before ``activate_commands`` in a fresh shell
    virtual std::vector<std::string> pre_activate_commands() const { return {}; }

    virtual std::vector<std::string> activate_commands() const = 0;

    /// Register the local channel globally; empty when no local channel is configured
    virtual std::vector<std::string> add_channel_commands() const { return {}; }

    virtual std::vector<std::string> remove_all_commands() const { return {}; }

    /// Prefix that runs a command inside the environment without activation. Empty for
    /// back ends that activate instead.
    virtual std::string run_prefix() const { return ""; }

    /// Rewrite ``cmd`` so that it runs inside the environment and installs from the
    /// local package dir, if any
    std::string wrap_run_command(std::string cmd) const;

    /// Same back end and options, with a different interpreter version
    std::unique_ptr<EnvManager> with_python_version(std::string python_version) const;

protected:
    EnvManager(EnvManagerOptions opts, std::string_view default_env_name);

private:
    EnvManagerOptions opts_;
    std::string env_name_;
};

/// Shared behavior of conda, mamba and micromamba, which only differ in their tool
/// name and in how they are activated
class CondaFamilyEnvManager : public EnvManager
{
public:
    std::vector<std::string> create_commands(std::string_view pkgs = "") const override;
    std::vector<std::string> add_channel_commands() const override;
    std::vector<std::string> remove_all_commands() const override;

protected:
    CondaFamilyEnvManager(EnvManagerOptions opts, std::string_view tool);

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

class CondaEnvManager final : public CondaFamilyEnvManager
{
public:
    explicit CondaEnvManager(EnvManagerOptions opts);

    EnvManagerKind kind() const override { return EnvManagerKind::Conda; }

    std::vector<std::string> pre_activate_commands() const override;
    std::vector<std::string> activate_commands() const override;
};

class MambaEnvManager final : public CondaFamilyEnvManager
{
public:
    explicit MambaEnvManager(EnvManagerOptions opts);

    EnvManagerKind kind() const override { return EnvManagerKind::Mamba; }

    std::vector<std::string> activate_commands() const override;
};

/// micromamba is never activated; commands run through ``micromamba run`` instead
class MicromambaEnvManager final : public CondaFamilyEnvManager
{
public:
    explicit MicromambaEnvManager(EnvManagerOptions opts);

    EnvManagerKind kind() const override { return EnvManagerKind::Micromamba; }

    std::vector<std::string> activate_commands() const override { return {}; }

    std::string run_prefix() const override;
};

class VenvEnvManager final : public EnvManager
{
public:
    explicit VenvEnvManager(EnvManagerOptions opts);

    EnvManagerKind kind() const override { return EnvManagerKind::Venv; }

    std::vector<std::string> create_commands(std::string_view pkgs = "") const override;
    std::vector<std::string> activate_commands() const override;
};

std::unique_ptr<EnvManager> make_env_manager(EnvManagerKind kind, EnvManagerOptions opts);

/// Throws UnsupportedManagerError if ``name`` is not one of the canonical back end names
std::unique_ptr<EnvManager> make_env_manager(std::string_view name, EnvManagerOptions opts);

} // namespace patchgrader
