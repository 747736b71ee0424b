#include <patchgrader/state/global_state.hpp>

#include <patchgrader/logging.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace patchgrader {

std::optional<nlohmann::json> GlobalState::get(std::string_view key) const {
    std::scoped_lock lock{mutex_};

    auto iter = state_.find(key);
    if (iter == state_.end()) {
        return std::nullopt;
    }

    return iter->second;
}

void GlobalState::erase(std::string_view key) {
    std::scoped_lock lock{mutex_};

    if (auto iter = state_.find(key); iter != state_.end()) {
        state_.erase(iter);
    }
}

void GlobalState::clear() {
    std::scoped_lock lock{mutex_};
    state_.clear();
}

GlobalState::Map GlobalState::snapshot() const {
    std::scoped_lock lock{mutex_};
    return state_;
}

void GlobalState::transform(const std::function<Map(Map)>& func) {
    std::scoped_lock lock{mutex_};
    state_ = func(state_);
}

Expected<void, std::string> GlobalState::save(const std::filesystem::path& path) const {
    constexpr int INDENT = 4;

    std::string serialized;
    {
        std::scoped_lock lock{mutex_};
        serialized = nlohmann::json(state_).dump(INDENT);
    }

    if (path.has_parent_path()) {
        std::error_code err;
        std::filesystem::create_directories(path.parent_path(), err);

        if (err) {
            return fmt::format("Failed to create directory {}: {}", path.parent_path(), err.message());
        }
    }

    std::ofstream out_file{path, std::ios::trunc};

    if (!out_file.is_open()) {
        return fmt::format("Failed to open {} for writing", path);
    }

    out_file << serialized;

    if (!out_file) {
        return fmt::format("IO error writing state to {}", path);
    }

    LOG_DEBUG("Saved global state ({} keys) to {}", nlohmann::json::parse(serialized).size(), path);

    return {};
}

bool GlobalState::update_unknown_instance_state(const std::string& instance_id, FailureMode mode) {
    nlohmann::json encoded = InstanceValidationStats{.failure_mode = mode};

    std::scoped_lock lock{mutex_};

    auto iter = state_.find(instance_id);

    if (iter == state_.end()) {
        LOG_WARN("Instance {} not found in state", instance_id);
        state_.emplace(instance_id, std::move(encoded));
        return true;
    }

    auto current = iter->second.get<InstanceValidationStats>();

    if (current.failure_mode != FailureMode::Unknown) {
        LOG_DEBUG("Not overwriting failure mode {} of {} with {}", current.failure_mode, instance_id, mode);
        return false;
    }

    iter->second = std::move(encoded);
    return true;
}

} // namespace patchgrader
