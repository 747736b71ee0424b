#include <patchgrader/harness/task_instance.hpp>

#include <patchgrader/common/strings.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace patchgrader {

namespace {

std::vector<std::string> names_from_json_or_str(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return {};
    }

    const auto& field = json.at(key);

    if (field.is_string()) {
        return nlohmann::json::parse(field.get<std::string>()).get<std::vector<std::string>>();
    }

    return field.get<std::vector<std::string>>();
}

std::optional<std::string> optional_string(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return std::nullopt;
    }

    return json.at(key).get<std::string>();
}

} // namespace

std::string TaskInstance::repo_name() const {
    auto slash = repo.find_last_of('/');

    if (slash == std::string::npos) {
        return repo;
    }

    return repo.substr(slash + 1);
}

void from_json(const nlohmann::json& json, TaskInstance& instance) {
    json.at("instance_id").get_to(instance.instance_id);
    json.at("repo").get_to(instance.repo);
    json.at("base_commit").get_to(instance.base_commit);
    instance.problem_statement = json.value("problem_statement", "");
    json.at("test_patch").get_to(instance.test_patch);
    instance.patch = optional_string(json, "patch").value_or("");

    instance.fail_to_pass = names_from_json_or_str(json, "FAIL_TO_PASS");
    instance.pass_to_pass = names_from_json_or_str(json, "PASS_TO_PASS");

    instance.version = optional_string(json, "version").value_or("none");
    instance.hints_text = optional_string(json, "hints_text");
    instance.requirements_txt = optional_string(json, "requirements_txt");
    instance.environment_yml = optional_string(json, "environment_yml");
}

void to_json(nlohmann::json& json, const TaskInstance& instance) {
    json = nlohmann::json{
        {"instance_id", instance.instance_id},
        {"repo", instance.repo},
        {"base_commit", instance.base_commit},
        {"problem_statement", instance.problem_statement},
        {"test_patch", instance.test_patch},
        {"patch", instance.patch},
        {"FAIL_TO_PASS", instance.fail_to_pass},
        {"PASS_TO_PASS", instance.pass_to_pass},
        {"version", instance.version},
    };

    if (instance.hints_text) {
        json["hints_text"] = *instance.hints_text;
    }
    if (instance.requirements_txt) {
        json["requirements_txt"] = *instance.requirements_txt;
    }
    if (instance.environment_yml) {
        json["environment_yml"] = *instance.environment_yml;
    }
}

std::string Prediction::model_dir_name() const {
    return replace_all(model_name_or_path, "/", "__");
}

Prediction gold_prediction(const TaskInstance& instance) {
    return {.instance_id = instance.instance_id, .model_name_or_path = "gold", .model_patch = instance.patch};
}

} // namespace patchgrader
