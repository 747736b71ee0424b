#include "app/validator_app.hpp"

#include <patchgrader/dataset_reader.hpp>
#include <patchgrader/exceptions.hpp>
#include <patchgrader/harness/env_manager.hpp>
#include <patchgrader/harness/grader.hpp>
#include <patchgrader/harness/task_instance.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/output/serializer.hpp>
#include <patchgrader/runner/scheduler.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include "version.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace patchgrader {

namespace {

constexpr const char* KEY_INSTANCE_ID = "instance_id";
constexpr const char* KEY_INSTANCE_IDS = "instance_ids";
constexpr const char* KEY_FAIL_TO_PASS = "FAIL_TO_PASS";
constexpr const char* KEY_PASS_TO_PASS = "PASS_TO_PASS";
constexpr const char* KEY_FAIL_TO_FAIL = "FAIL_TO_FAIL";
constexpr const char* KEY_PASS_TO_FAIL = "PASS_TO_FAIL";

constexpr std::string_view REPO_FILE_SUFFIX = "-task-instances";
constexpr std::string_view VALIDATED_ALL_SUFFIX = "_validated.all";
constexpr std::string_view VALIDATED_SUFFIX = "_validated";

bool has_nonempty_list(const nlohmann::json& record, const char* key) {
    auto iter = record.find(key);
    return iter != record.end() && iter->is_array() && !iter->empty();
}

bool is_validated(const nlohmann::json& record) {
    return has_nonempty_list(record, KEY_FAIL_TO_PASS);
}

EnvManagerOptions env_manager_options(const ProgramOptions& opts) {
    return {.python_version = opts.python_version,
            .local_channel_dir = opts.local_channel_dir,
            .local_pip_dir = opts.local_pip_dir};
}

/// Outputs left behind by an earlier run are not inputs
bool is_output_file(const std::filesystem::path& path) {
    std::string stem = path.stem().string();
    return stem.ends_with(VALIDATED_SUFFIX) || stem.ends_with(VALIDATED_ALL_SUFFIX);
}

void move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code err;
    std::filesystem::rename(from, to, err);

    if (!err) {
        return;
    }

    // rename(2) cannot cross file systems
    LOG_DEBUG("Could not rename {} to {} ({}); copying instead", from, to, err.message());
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
    std::filesystem::remove(from);
}

} // namespace

ValidatorApp::ValidatorApp(ProgramOptions opts, ContainerRuntime& runtime, Sink& sink)
    : App{std::move(opts)}
    , runtime_{&runtime}
    , configs_{OPTS.repo_config_dir}
    , env_manager_{make_env_manager(OPTS.env_manager, env_manager_options(OPTS))}
    , spec_builder_{*env_manager_, TestSpecBuilderOptions{.instance_repos_dir = OPTS.instance_repos_dir,
                                                          .local_repos_dir = OPTS.local_repos_dir,
                                                          .use_spec_python = true}}
    , serializer_{sink, OPTS.colorize_option, OPTS.verbosity} {}

std::vector<std::filesystem::path> ValidatorApp::input_files() const {
    namespace fs = std::filesystem;

    if (fs::is_regular_file(OPTS.input_path)) {
        return {OPTS.input_path};
    }

    std::vector<fs::path> files;
    for (const auto& dirent : fs::directory_iterator{OPTS.input_path}) {
        const auto& path = dirent.path();

        if (dirent.is_regular_file() && path.extension() == ".jsonl" && !is_output_file(path)) {
            files.push_back(path);
        }
    }

    ranges::sort(files);

    return files;
}

bool ValidatorApp::already_validated(const std::filesystem::path& input_file) const {
    namespace fs = std::filesystem;

    fs::path validated = OPTS.validated_dir / fmt::format("{}.jsonl", input_file.stem().string());

    std::error_code err;
    auto size = fs::file_size(validated, err);

    return !err && size > 0;
}

std::string ValidatorApp::repo_name_for(const std::filesystem::path& input_file) {
    std::string stem = input_file.stem().string();

    if (stem.ends_with(REPO_FILE_SUFFIX)) {
        stem.erase(stem.size() - REPO_FILE_SUFFIX.size());
    }

    return stem;
}

std::filesystem::path ValidatorApp::validated_all_path(const std::filesystem::path& input_file) {
    return input_file.parent_path() /
           fmt::format("{}{}{}", input_file.stem().string(), VALIDATED_ALL_SUFFIX, input_file.extension().string());
}

std::filesystem::path ValidatorApp::validated_path(const std::filesystem::path& input_file) {
    return input_file.parent_path() /
           fmt::format("{}{}{}", input_file.stem().string(), VALIDATED_SUFFIX, input_file.extension().string());
}

void ValidatorApp::merge_results(std::vector<nlohmann::json>& records,
                                 const std::map<std::string, InstanceReport>& reports, GlobalState& state) {
    std::set<std::string> merged;

    for (auto& record : records) {
        auto instance_id = record.at(KEY_INSTANCE_ID).get<std::string>();

        if (merged.contains(instance_id) || record.contains(KEY_FAIL_TO_FAIL) || record.contains(KEY_PASS_TO_FAIL)) {
            state.set(instance_id, InstanceValidationStats{.failure_mode = FailureMode::DuplicateInstance});
            throw DuplicateInstanceError(instance_id);
        }
        merged.insert(instance_id);

        TransitionReport transitions;
        if (auto iter = reports.find(instance_id); iter != reports.end()) {
            transitions = iter->second.transitions;
        }

        record[KEY_FAIL_TO_PASS] = transitions.fail_to_pass;
        record[KEY_PASS_TO_PASS] = transitions.pass_to_pass;
        record[KEY_FAIL_TO_FAIL] = transitions.fail_to_fail;
        record[KEY_PASS_TO_FAIL] = transitions.pass_to_fail;
    }
}

void ValidatorApp::update_failure_modes(const std::vector<nlohmann::json>& records, GlobalState& state) {
    for (const auto& record : records) {
        auto instance_id = record.at(KEY_INSTANCE_ID).get<std::string>();

        Resolution resolution =
            resolve(has_nonempty_list(record, KEY_FAIL_TO_PASS), has_nonempty_list(record, KEY_PASS_TO_PASS),
                    has_nonempty_list(record, KEY_FAIL_TO_FAIL), has_nonempty_list(record, KEY_PASS_TO_FAIL));

        state.update_unknown_instance_state(instance_id, to_failure_mode(resolution));
    }
}

std::vector<nlohmann::json> ValidatorApp::validate_file(const std::filesystem::path& input_file) {
    DatasetReader reader{input_file};

    auto records = reader.read_records();
    if (!records) {
        throw SpecError(records.error());
    }

    std::vector<TaskInstance> instances;
    std::vector<std::string> instance_ids;
    instances.reserve(records->size());

    for (const auto& record : records.value()) {
        auto instance = record.get<TaskInstance>();

        // Results are recomputed from scratch
        instance.fail_to_pass.clear();
        instance.pass_to_pass.clear();

        instance_ids.push_back(instance.instance_id);
        instances.push_back(std::move(instance));
    }

    state_.set(std::string{KEY_INSTANCE_IDS}, instance_ids);
    state_.set(instance_ids, InstanceValidationStats{});

    serializer_.on_repo_begin(repo_name_for(input_file), instances.size());

    SchedulerOptions sched_opts{.max_workers = OPTS.max_workers,
                                .clean = OPTS.clean,
                                .run = {.run_id = OPTS.run_id,
                                        .log_root = OPTS.log_root,
                                        .timeout = OPTS.timeout,
                                        .cache_level = OPTS.cache_level,
                                        .force_rebuild = OPTS.force_rebuild}};

    ConcurrencyScheduler scheduler{*runtime_, state_, spec_builder_, configs_, std::move(sched_opts), &serializer_};
    SchedulerResult result = scheduler.run(instances);

    if (!result.removed_images.empty()) {
        LOG_DEBUG("Removed images: {}", result.removed_images);
    }

    merge_results(records.value(), result.reports, state_);

    std::vector<nlohmann::json> validated;
    for (const auto& record : records.value()) {
        if (is_validated(record)) {
            validated.push_back(record);
        }
    }

    if (auto res = write_jsonl(validated_all_path(input_file), records.value()); !res) {
        throw std::runtime_error(res.error());
    }

    if (auto res = write_jsonl(validated_path(input_file), validated); !res) {
        throw std::runtime_error(res.error());
    }

    return std::move(records.value());
}

bool ValidatorApp::run_repo(const std::filesystem::path& input_file) {
    const auto start = std::chrono::steady_clock::now();
    const std::string repo_name = repo_name_for(input_file);

    LOG_INFO("Processing: {}", input_file);

    std::vector<nlohmann::json> records;
    bool succeeded = true;

    try {
        records = validate_file(input_file);
    } catch (const std::exception& err) {
        LOG_ERROR("Error processing {}: {}", input_file, err.what());
        serializer_.on_error(fmt::format("Error processing {}: {}", input_file.string(), err.what()));
        records.clear();
        succeeded = false;
    }

    finish_repo(records, repo_name);
    reorganize_output(input_file);

    serializer_.on_repo_result(summarize(repo_name, records, std::chrono::steady_clock::now() - start));

    return succeeded;
}

void ValidatorApp::finish_repo(const std::vector<nlohmann::json>& records, const std::string& repo_name) {
    if (!records.empty()) {
        update_failure_modes(records, state_);
    }

    std::filesystem::path output_path = OPTS.state_output_path / fmt::format("{}.json", repo_name);

    if (auto res = state_.save(output_path); !res) {
        LOG_ERROR("Failed to save validation state for {}: {}", repo_name, res.error());
        serializer_.on_warning(fmt::format("Could not save validation state to {}", output_path.string()));
    }
}

void ValidatorApp::reorganize_output(const std::filesystem::path& input_file) const {
    namespace fs = std::filesystem;

    fs::create_directories(OPTS.validated_dir);
    fs::create_directories(OPTS.pre_validated_dir);

    const std::string dest_name = fmt::format("{}.jsonl", input_file.stem().string());

    if (fs::path all_file = validated_all_path(input_file); fs::exists(all_file)) {
        move_file(all_file, OPTS.pre_validated_dir / dest_name);
    }

    if (fs::path validated_file = validated_path(input_file); fs::exists(validated_file)) {
        move_file(validated_file, OPTS.validated_dir / dest_name);
    }
}

RepoSummary ValidatorApp::summarize(const std::string& repo_name, const std::vector<nlohmann::json>& records,
                                    std::chrono::duration<double> elapsed) const {
    RepoSummary summary{.repo_name = repo_name, .elapsed = elapsed};

    auto instance_ids = state_.get_as<std::vector<std::string>>(KEY_INSTANCE_IDS).value_or(std::vector<std::string>{});

    summary.num_instances = instance_ids.size();
    summary.num_validated = static_cast<std::size_t>(ranges::count_if(records, is_validated));

    for (const auto& instance_id : instance_ids) {
        auto stats = state_.get_as<InstanceValidationStats>(instance_id).value_or(InstanceValidationStats{});
        ++summary.failure_mode_counts[stats.failure_mode];
    }

    return summary;
}

int ValidatorApp::run_impl() {
    const auto start_time = std::chrono::system_clock::now();

    std::vector<std::filesystem::path> all_files = input_files();

    serializer_.on_run_metadata({.version_string = PATCHGRADER_VERSION_STRING,
                                 .run_id = OPTS.run_id,
                                 .start_time = start_time,
                                 .num_input_files = all_files.size()});

    std::vector<std::filesystem::path> to_validate;
    for (const auto& file : all_files) {
        if (OPTS.overwrite || !already_validated(file)) {
            to_validate.push_back(file);
        }
    }

    if (OPTS.overwrite) {
        std::size_t num_existing = static_cast<std::size_t>(
            ranges::count_if(all_files, [this](const auto& file) { return already_validated(file); }));
        LOG_INFO("Overwriting {} existing validation file(s)", num_existing);
    }

    LOG_INFO("Processing {} files out of {} total file(s)", to_validate.size(), all_files.size());

    std::size_t num_failed = 0;

    for (const auto& file : to_validate) {
        state_.clear();

        if (!run_repo(file)) {
            ++num_failed;
        }
    }

    serializer_.finalize();

    if (num_failed > 0) {
        LOG_WARN("{} of {} file(s) failed to validate", num_failed, to_validate.size());
        return 1;
    }

    return 0;
}

} // namespace patchgrader
