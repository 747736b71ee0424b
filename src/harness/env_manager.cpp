#include <patchgrader/harness/env_manager.hpp>

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/common/strings.hpp>
#include <patchgrader/common/unreachable.hpp>
#include <patchgrader/exceptions.hpp>

#include <fmt/format.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchgrader {

EnvManager::EnvManager(EnvManagerOptions opts, std::string_view default_env_name)
    : opts_{std::move(opts)}
    , env_name_{opts_.env_name.value_or(std::string{default_env_name})} {}

std::string EnvManager::wrap_run_command(std::string cmd) const {
    if (opts_.local_pip_dir) {
        cmd = replace_all(std::move(cmd), "pip install",
                          fmt::format("pip install --no-index --find-links={}", opts_.local_pip_dir->string()));
    }

    std::string prefix = run_prefix();

    if (prefix.empty()) {
        return cmd;
    }

    return prefix + replace_all(std::move(cmd), "&&", "&& " + prefix);
}

std::unique_ptr<EnvManager> EnvManager::with_python_version(std::string python_version) const {
    EnvManagerOptions new_opts = opts_;
    new_opts.python_version = std::move(python_version);

    return make_env_manager(kind(), std::move(new_opts));
}

CondaFamilyEnvManager::CondaFamilyEnvManager(EnvManagerOptions opts, std::string_view tool)
    : EnvManager{std::move(opts), "testbed"}
    , tool_{tool} {}

std::vector<std::string> CondaFamilyEnvManager::create_commands(std::string_view pkgs) const {
    std::string channel_opts;

    if (const auto& channel_dir = options().local_channel_dir) {
        channel_opts = fmt::format("--channel file://{} --override-channels ", channel_dir->string());
    }

    return {fmt::format("{} create {}-n {} python={} {} -y", tool_, channel_opts, env_name(), python_version(), pkgs)};
}

std::vector<std::string> CondaFamilyEnvManager::add_channel_commands() const {
    if (!options().local_channel_dir) {
        return {};
    }

    return {fmt::format("{} config --add channels file://{}", tool_, options().local_channel_dir->string())};
}

std::vector<std::string> CondaFamilyEnvManager::remove_all_commands() const {
    return {fmt::format("{} remove -n {} --all --yes", tool_, env_name())};
}

CondaEnvManager::CondaEnvManager(EnvManagerOptions opts)
    : CondaFamilyEnvManager{std::move(opts), "conda"} {}

std::vector<std::string> CondaEnvManager::pre_activate_commands() const {
    return {"source /opt/conda/bin/activate"};
}

std::vector<std::string> CondaEnvManager::activate_commands() const {
    std::vector<std::string> cmds{fmt::format("conda activate {}", env_name())};

    if (options().force_x86) {
        cmds.emplace_back("conda config --env --set subdir osx-64");
    }

    return cmds;
}

MambaEnvManager::MambaEnvManager(EnvManagerOptions opts)
    : CondaFamilyEnvManager{std::move(opts), "mamba"} {}

std::vector<std::string> MambaEnvManager::activate_commands() const {
    return {fmt::format("mamba activate {}", env_name())};
}

MicromambaEnvManager::MicromambaEnvManager(EnvManagerOptions opts)
    : CondaFamilyEnvManager{std::move(opts), "micromamba"} {}

std::string MicromambaEnvManager::run_prefix() const {
    return fmt::format("micromamba run -n {} ", env_name());
}

VenvEnvManager::VenvEnvManager(EnvManagerOptions opts)
    : EnvManager{std::move(opts), "venv"} {}

std::vector<std::string> VenvEnvManager::create_commands(std::string_view pkgs) const {
    std::vector<std::string> cmds{"python -m venv venv"};

    if (!pkgs.empty()) {
        cmds.push_back(fmt::format("pip install {}", pkgs));
    }

    return cmds;
}

std::vector<std::string> VenvEnvManager::activate_commands() const {
    return {fmt::format("source ./{}/bin/activate", env_name())};
}

std::unique_ptr<EnvManager> make_env_manager(EnvManagerKind kind, EnvManagerOptions opts) {
    switch (kind) {
    case EnvManagerKind::Conda:
        return std::make_unique<CondaEnvManager>(std::move(opts));
    case EnvManagerKind::Mamba:
        return std::make_unique<MambaEnvManager>(std::move(opts));
    case EnvManagerKind::Micromamba:
        return std::make_unique<MicromambaEnvManager>(std::move(opts));
    case EnvManagerKind::Venv:
        return std::make_unique<VenvEnvManager>(std::move(opts));
    }

    unreachable();
}

std::unique_ptr<EnvManager> make_env_manager(std::string_view name, EnvManagerOptions opts) {
    auto kind = enum_from_string<EnvManagerKind>(name);

    if (!kind) {
        throw UnsupportedManagerError(std::string{name});
    }

    return make_env_manager(*kind, std::move(opts));
}

} // namespace patchgrader
