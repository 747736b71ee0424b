#include <patchgrader/runner/instance_runner.hpp>

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/strings.hpp>
#include <patchgrader/exceptions.hpp>
#include <patchgrader/harness/grader.hpp>
#include <patchgrader/harness/log_parser.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/runner/image_cache.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace patchgrader {

void to_json(nlohmann::json& json, PatchStrategy strategy) {
    json = std::string{enum_to_string(strategy)};
}

void from_json(const nlohmann::json& json, PatchStrategy& strategy) {
    auto name = json.get<std::string>();
    auto parsed = enum_from_string<PatchStrategy>(name);

    if (!parsed) {
        throw std::invalid_argument(fmt::format("'{}' is not a valid patch strategy", name));
    }

    strategy = *parsed;
}

void to_json(nlohmann::json& json, const InstanceReport& report) {
    json = report.transitions;
    json["instance_id"] = report.instance_id;
    json["resolution"] = report.resolution();
    json["patch_strategy"] = report.patch_strategy;
    json["elapsed_seconds"] = report.elapsed_seconds;
}

void from_json(const nlohmann::json& json, InstanceReport& report) {
    report.instance_id = json.at("instance_id").get<std::string>();
    report.transitions = json.get<TransitionReport>();
    report.patch_strategy = json.value("patch_strategy", PatchStrategy::Empty);
    report.elapsed_seconds = json.value("elapsed_seconds", 0.0);
}

FailureMode failure_mode_for(const std::exception& err) {
    if (const auto* failure = dynamic_cast<const InstanceFailure*>(&err)) {
        return failure->get_mode();
    }

    if (dynamic_cast<const BuildImageError*>(&err) != nullptr) {
        return FailureMode::BuildImageFailure;
    }

    return FailureMode::RunInstanceFailure;
}

namespace {

std::string timeout_marker(std::chrono::seconds timeout) {
    return fmt::format("\n\nTimeout error: {} seconds exceeded.", timeout.count());
}

void write_file(const std::filesystem::path& path, std::string_view contents) {
    std::ofstream out{path, std::ios::trunc | std::ios::binary};
    out << contents;

    if (!out) {
        throw std::runtime_error(fmt::format("Failed to write {}", path));
    }
}

Expected<InstanceReport, std::string> read_report(const std::filesystem::path& path) {
    std::ifstream file{path};

    if (!file.is_open()) {
        return fmt::format("Could not open {}", path);
    }

    try {
        return nlohmann::json::parse(file).get<InstanceReport>();
    } catch (const std::exception& err) {
        return fmt::format("Malformed report {}: {}", path, err.what());
    }
}

} // namespace

/// State of one call to InstanceRunner::run
class InstanceRunner::Attempt : NonCopyable, NonMovable
{
public:
    Attempt(InstanceRunner& runner, const TestSpec& spec, const Prediction& prediction, std::filesystem::path log_dir)
        : runner_{&runner}
        , spec_{&spec}
        , prediction_{&prediction}
        , log_dir_{std::move(log_dir)}
        , logger_name_{fmt::format("instance.{}", spec.instance_id)} {}

    InstanceReport execute();

    /// Stop and remove the container, drop the instance image if it is not cached, close the log
    void cleanup();

    spdlog::logger& log() { return logger_ ? *logger_ : *spdlog::default_logger(); }

    RunStage stage() const { return stage_; }

private:
    void open_log();
    void advance(RunStage next);

    void start_container();
    std::string run_eval(std::string_view output_file);
    PatchStrategy apply_patch();
    std::string git_diff();

    ContainerRuntime& runtime() { return *runner_->runtime_; }

    const ContainerHandle& handle() const {
        ASSERT(handle_.has_value(), "No container started");
        return handle_.value();
    }

    InstanceRunner* runner_;
    const TestSpec* spec_;
    const Prediction* prediction_;
    std::filesystem::path log_dir_;

    std::string logger_name_;
    std::shared_ptr<spdlog::logger> logger_;

    RunStage stage_ = RunStage::Pending;
    std::optional<ContainerHandle> handle_;
};

void InstanceRunner::Attempt::open_log() {
    logger_ = make_file_logger(logger_name_, log_dir_ / instance_files::RUN_LOG);
}

void InstanceRunner::Attempt::advance(RunStage next) {
    DEBUG_ASSERT(next > stage_, "Instance run stages only move forward");

    log().debug("{} -> {}", stage_, next);
    stage_ = next;
}

InstanceReport InstanceRunner::Attempt::execute() {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();

    open_log();
    log().info("Validating {} with patch from {}", spec_->instance_id, prediction_->model_name_or_path);

    start_container();

    std::string output_before = run_eval(instance_files::OUTPUT_BEFORE_PATCH);
    advance(RunStage::PrePatchRun);

    PatchStrategy strategy = apply_patch();
    advance(RunStage::PatchApplied);

    std::string diff_before = git_diff();
    std::string output_after = run_eval(instance_files::OUTPUT);
    std::string diff_after = git_diff();

    if (diff_after != diff_before) {
        log().info("git diff changed after running eval script:\n{}", diff_after);
    }
    advance(RunStage::PostPatchRun);

    auto parsed_before = PytestLogParser::parse(output_before);
    if (!parsed_before.found) {
        throw InstanceFailure(FailureMode::RunInstanceFailure, "No pytest session found in the pre-patch test output");
    }

    auto parsed_after = PytestLogParser::parse(output_after);
    if (!parsed_after.found) {
        throw InstanceFailure(FailureMode::RunInstanceFailure, "No pytest session found in the post-patch test output");
    }

    InstanceReport report{
        .instance_id = spec_->instance_id,
        .transitions = classify(parsed_before.outcomes, parsed_after.outcomes),
        .patch_strategy = strategy,
        .elapsed_seconds = std::chrono::duration<double>(steady_clock::now() - start_time).count(),
    };

    constexpr int REPORT_INDENT = 4;
    nlohmann::json report_json = report;
    write_file(log_dir_ / instance_files::REPORT, report_json.dump(REPORT_INDENT));

    log().info("Graded {}: {} (fail->pass {}, pass->pass {}, fail->fail {}, pass->fail {})", spec_->instance_id,
               report.resolution(), report.transitions.fail_to_pass.size(), report.transitions.pass_to_pass.size(),
               report.transitions.fail_to_fail.size(), report.transitions.pass_to_fail.size());
    advance(RunStage::Graded);

    return report;
}

void InstanceRunner::Attempt::start_container() {
    const auto image_key = spec_->instance_image_key();

    if (runner_->opts_.force_rebuild) {
        if (auto res = runtime().remove_image(image_key); !res && res.error() != ErrorKind::NotFound) {
            log().warn("Could not remove {} before rebuilding: {}", image_key, res.error());
        }
    }

    if (auto res = runtime().build_image_if_absent(*spec_); !res) {
        throw BuildImageError(image_key, fmt::format("Failed to build image ({})", res.error()));
    }

    auto handle = runtime().start_container(image_key, *spec_);
    if (!handle) {
        throw BuildImageError(image_key, fmt::format("Failed to start container ({})", handle.error()));
    }

    handle_ = std::move(handle).value();
    log().info("Container {} started from {}", handle_->name, image_key);

    advance(RunStage::ContainerReady);
}

std::string InstanceRunner::Attempt::run_eval(std::string_view output_file) {
    const auto eval_path = log_dir_ / instance_files::EVAL_SCRIPT;
    write_file(eval_path, spec_->eval_script());

    if (auto res = runtime().copy_file_in(handle(), eval_path, std::string{CONTAINER_EVAL_PATH}); !res) {
        throw std::runtime_error(fmt::format("Failed to copy eval script into container ({})", res.error()));
    }

    const auto timeout = runner_->opts_.timeout;
    auto res = runtime().exec_with_timeout(handle(), fmt::format("/bin/bash {}", CONTAINER_EVAL_PATH), timeout);

    if (!res) {
        throw std::runtime_error(fmt::format("Failed to run eval script ({})", res.error()));
    }

    std::string output = std::move(res->output);
    const auto output_path = log_dir_ / output_file;

    if (res->timed_out) {
        output += timeout_marker(timeout);
        write_file(output_path, output);
        throw InstanceFailure(FailureMode::Timeout,
                              fmt::format("Test run timed out after {} seconds", timeout.count()));
    }

    write_file(output_path, output);
    log().info("Test run took {:.2f}s; output written to {}", res->elapsed.count(), output_path);

    return output;
}

PatchStrategy InstanceRunner::Attempt::apply_patch() {
    const auto& patch = prediction_->model_patch;
    const auto patch_path = log_dir_ / instance_files::PATCH;

    write_file(patch_path, patch);

    if (is_blank(patch)) {
        log().info("Empty patch; nothing to apply");
        return PatchStrategy::Empty;
    }

    if (auto res = runtime().copy_file_in(handle(), patch_path, std::string{CONTAINER_PATCH_PATH}); !res) {
        throw std::runtime_error(fmt::format("Failed to copy patch into container ({})", res.error()));
    }

    const std::string testbed{CONTAINER_TESTBED};

    auto try_apply = [&](PatchStrategy strategy, const std::string& cmd) {
        auto res = runtime().exec(handle(), cmd, testbed, "root");

        if (!res) {
            throw std::runtime_error(fmt::format("Failed to run {:?} ({})", cmd, res.error()));
        }

        if (res->exit_code == 0) {
            log().info("Patch applied with {}:\n{}", strategy, res->output);
            return true;
        }

        log().info("{} failed with code {}:\n{}", strategy, res->exit_code, res->output);
        return false;
    };

    if (try_apply(PatchStrategy::GitApply, fmt::format("git apply --allow-empty -v {}", CONTAINER_PATCH_PATH))) {
        return PatchStrategy::GitApply;
    }

    if (try_apply(PatchStrategy::PatchFuzz, fmt::format("patch --batch --fuzz=5 -p1 -i {}", CONTAINER_PATCH_PATH))) {
        return PatchStrategy::PatchFuzz;
    }

    throw InstanceFailure(FailureMode::ApplyPatchFailure, "Patch could not be applied with git apply or patch");
}

std::string InstanceRunner::Attempt::git_diff() {
    auto res = runtime().exec(handle(), "git -c core.fileMode=false diff", std::string{CONTAINER_TESTBED}, "root");

    if (!res) {
        log().warn("Could not capture git diff ({})", res.error());
        return "";
    }

    return std::move(res->output);
}

void InstanceRunner::Attempt::cleanup() {
    if (handle_) {
        if (auto res = runtime().stop(*handle_); !res && res.error() != ErrorKind::NotFound) {
            log().warn("Failed to stop container {}: {}", handle_->name, res.error());
        }
        if (auto res = runtime().remove(*handle_); !res && res.error() != ErrorKind::NotFound) {
            log().warn("Failed to remove container {}: {}", handle_->name, res.error());
        }
    }

    if (remove_instance_image_after_run(runner_->opts_.cache_level)) {
        const auto image_key = spec_->instance_image_key();
        if (auto res = runtime().remove_image(image_key); !res && res.error() != ErrorKind::NotFound) {
            log().warn("Failed to remove image {}: {}", image_key, res.error());
        }
    }

    if (logger_) {
        logger_->flush();
        logger_.reset();
    }
}

InstanceRunner::InstanceRunner(ContainerRuntime& runtime, GlobalState& state, InstanceRunOptions opts)
    : runtime_{&runtime}
    , state_{&state}
    , opts_{std::move(opts)} {}

std::filesystem::path InstanceRunner::log_dir_for(const TestSpec& spec, const Prediction& prediction) const {
    return opts_.log_root / opts_.run_id / prediction.model_dir_name() / spec.instance_id;
}

std::optional<InstanceReport> InstanceRunner::run(const TestSpec& spec, const Prediction& prediction) {
    const auto log_dir = log_dir_for(spec, prediction);

    std::error_code err;
    std::filesystem::create_directories(log_dir, err);

    if (err) {
        LOG_ERROR("Could not create log directory {} for {}: {}", log_dir, spec.instance_id, err.message());
        state_->update_unknown_instance_state(spec.instance_id, FailureMode::RunInstanceFailure);
        return std::nullopt;
    }

    if (const auto report_path = log_dir / instance_files::REPORT; std::filesystem::exists(report_path)) {
        auto existing = read_report(report_path);

        if (existing) {
            LOG_INFO("{} already graded; reusing {}", spec.instance_id, report_path);
            return existing.value();
        }

        LOG_WARN("{}; running {} again", existing.error(), spec.instance_id);
    }

    Attempt attempt{*this, spec, prediction, log_dir};
    auto release = gsl::finally([&attempt] { attempt.cleanup(); });

    try {
        return attempt.execute();
    } catch (const std::exception& ex) {
        const FailureMode mode = failure_mode_for(ex);

        attempt.log().error("{} failed during {} with {}: {}", spec.instance_id, attempt.stage(), mode, ex.what());
        LOG_WARN("{} failed ({}): {}", spec.instance_id, mode, ex.what());

        state_->update_unknown_instance_state(spec.instance_id, mode);

        return std::nullopt;
    }
}

} // namespace patchgrader
