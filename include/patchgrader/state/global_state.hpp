#pragma once

#include <patchgrader/common/class_traits.hpp>
#include <patchgrader/common/expected.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace patchgrader {

/// Thread-safe string-keyed store of JSON-compatible values, shared by every worker of a
/// validation run. One FailureMode record is kept per instance id.
///
/// Values are converted to JSON on the way in (enums as their names, aggregates through
/// their ``to_json``), so what is stored is exactly what ``save`` writes.
class GlobalState : NonCopyable, NonMovable
{
public:
    using Map = std::map<std::string, nlohmann::json, std::less<>>;

    GlobalState() = default;

    std::optional<nlohmann::json> get(std::string_view key) const;

    /// nullopt if absent or not convertible to ``T``
    template <typename T>
    std::optional<T> get_as(std::string_view key) const;

    template <typename T>
    void set(const std::string& key, const T& value);

    /// Set every key in ``keys`` to ``value``
    template <typename T>
    void set(const std::vector<std::string>& keys, const T& value);

    void erase(std::string_view key);

    void clear();

    /// Copy of the whole state
    Map snapshot() const;

    /// ``func`` receives a copy of the state to mutate. If it returns normally, the keys it
    /// added or changed are written back; keys it left alone or removed keep whatever value
    /// the state holds at that point. If it throws, nothing changes and the exception propagates.
    template <std::invocable<Map&> Func>
    void atomic_update(Func&& func);

    /// Replace the state with ``func(old_state)`` while holding the lock
    void transform(const std::function<Map(Map)>& func);

    /// Pretty-printed JSON (indent 4); parent directories are created
    Expected<void, std::string> save(const std::filesystem::path& path) const;

    /// Record ``mode`` for ``instance_id`` only if it has no terminal failure mode yet
    /// (absent, or still unknown). Returns whether the record was written.
    bool update_unknown_instance_state(const std::string& instance_id, FailureMode mode);

private:
    mutable std::mutex mutex_;
    Map state_;
};

template <typename T>
std::optional<T> GlobalState::get_as(std::string_view key) const {
    auto value = get(key);

    if (!value) {
        return std::nullopt;
    }

    try {
        return value->template get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

template <typename T>
void GlobalState::set(const std::string& key, const T& value) {
    nlohmann::json encoded = value;

    std::scoped_lock lock{mutex_};
    state_.insert_or_assign(key, std::move(encoded));
}

template <typename T>
void GlobalState::set(const std::vector<std::string>& keys, const T& value) {
    nlohmann::json encoded = value;

    std::scoped_lock lock{mutex_};
    for (const auto& key : keys) {
        state_.insert_or_assign(key, encoded);
    }
}

template <std::invocable<GlobalState::Map&> Func>
void GlobalState::atomic_update(Func&& func) {
    const Map original = snapshot();
    Map working_copy = original;

    std::invoke(std::forward<Func>(func), working_copy);

    std::scoped_lock lock{mutex_};
    for (auto& [key, value] : working_copy) {
        // Untouched keys may have been written by someone else meanwhile
        if (auto iter = original.find(key); iter != original.end() && iter->second == value) {
            continue;
        }
        state_.insert_or_assign(key, std::move(value));
    }
}

} // namespace patchgrader
