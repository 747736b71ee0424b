#include <patchgrader/state/failure_mode.hpp>

#include <patchgrader/common/enum_names.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace patchgrader {

void to_json(nlohmann::json& json, FailureMode mode) {
    json = std::string{enum_to_string(mode)};
}

void from_json(const nlohmann::json& json, FailureMode& mode) {
    auto name = json.get<std::string>();
    auto parsed = enum_from_string<FailureMode>(name);

    if (!parsed) {
        throw std::invalid_argument(fmt::format("'{}' is not a valid failure mode", name));
    }

    mode = *parsed;
}

void to_json(nlohmann::json& json, const InstanceValidationStats& stats) {
    json = nlohmann::json{{"failure_mode", stats.failure_mode}};
}

void from_json(const nlohmann::json& json, InstanceValidationStats& stats) {
    stats.failure_mode = json.value("failure_mode", FailureMode::Unknown);
}

} // namespace patchgrader
