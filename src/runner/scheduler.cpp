#include <patchgrader/runner/scheduler.hpp>

#include <patchgrader/exceptions.hpp>
#include <patchgrader/harness/grader.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/runner/image_cache.hpp>
#include <patchgrader/runner/instance_runner.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace patchgrader {

ConcurrencyScheduler::ConcurrencyScheduler(ContainerRuntime& runtime, GlobalState& state,
                                           const TestSpecBuilder& builder, const RepoConfigStore& configs,
                                           SchedulerOptions opts, Serializer* serializer)
    : runtime_{&runtime}
    , state_{&state}
    , builder_{&builder}
    , configs_{&configs}
    , opts_{std::move(opts)}
    , serializer_{serializer} {}

std::vector<TestSpec> ConcurrencyScheduler::build_specs(const std::vector<TaskInstance>& instances,
                                                        std::vector<std::string>& failures) {
    std::vector<TestSpec> specs;
    specs.reserve(instances.size());

    for (const auto& instance : instances) {
        try {
            auto config = configs_->load(instance.repo);

            if (!config) {
                throw SpecError(config.error());
            }

            specs.push_back(builder_->build(instance, config.value()));
        } catch (const std::exception& err) {
            LOG_ERROR("Failed to build test spec for {}: {}", instance.instance_id, err.what());
            state_->update_unknown_instance_state(instance.instance_id, FailureMode::RunInstanceFailure);
            failures.push_back(instance.instance_id);
        }
    }

    return specs;
}

std::set<std::string> ConcurrencyScheduler::reusable_images(const std::vector<TestSpec>& specs,
                                                            const std::set<std::string>& existing_images) const {
    std::set<std::string> reusable;

    if (opts_.run.force_rebuild) {
        return reusable;
    }

    for (const auto& spec : specs) {
        if (auto key = spec.instance_image_key(); existing_images.contains(key)) {
            reusable.insert(std::move(key));
        }
    }

    return reusable;
}

void ConcurrencyScheduler::report_outcome(const std::string& instance_id,
                                          const std::optional<InstanceReport>& report) {
    if (serializer_ == nullptr) {
        return;
    }

    InstanceOutcome outcome{.instance_id = instance_id, .report = report};

    if (report) {
        outcome.failure_mode = to_failure_mode(report->resolution());
    } else if (auto stats = state_->get_as<InstanceValidationStats>(instance_id)) {
        outcome.failure_mode = stats->failure_mode;
    }

    std::scoped_lock lock{output_mutex_};
    serializer_->on_instance_result(outcome);
}

SchedulerResult ConcurrencyScheduler::run(const std::vector<TaskInstance>& instances) {
    SchedulerResult result;

    std::set<std::string> prior_images;
    if (auto images = runtime_->list_images()) {
        prior_images.insert(images->begin(), images->end());
    } else {
        LOG_WARN("Could not list images before the run ({})", images.error());
    }

    std::vector<TaskInstance> unique_instances;
    std::set<std::string, std::less<>> seen_ids;

    for (const auto& instance : instances) {
        if (!seen_ids.insert(instance.instance_id).second) {
            LOG_WARN("Instance {} appears more than once; skipping the repeat", instance.instance_id);
            state_->set(instance.instance_id, InstanceValidationStats{.failure_mode = FailureMode::DuplicateInstance});
            result.duplicates.push_back(instance.instance_id);
            continue;
        }
        unique_instances.push_back(instance);
    }

    std::vector<TestSpec> specs = build_specs(unique_instances, result.spec_failures);

    for (const auto& failed_id : result.spec_failures) {
        report_outcome(failed_id, std::nullopt);
    }

    for (const auto& duplicate_id : result.duplicates) {
        report_outcome(duplicate_id, std::nullopt);
    }

    const auto reusable = reusable_images(specs, prior_images);
    LOG_INFO("Running {} instance(s); {} instance image(s) already built", specs.size(), reusable.size());

    std::map<std::string, Prediction> predictions;
    for (const auto& instance : unique_instances) {
        predictions.emplace(instance.instance_id, gold_prediction(instance));
    }

    InstanceRunner runner{*runtime_, *state_, opts_.run};

    std::mutex reports_mutex;
    std::atomic<std::size_t> next_index{0};

    auto worker = [&] {
        while (true) {
            const std::size_t idx = next_index++;
            if (idx >= specs.size()) {
                return;
            }

            const TestSpec& spec = specs[idx];
            std::optional<InstanceReport> report;

            try {
                report = runner.run(spec, predictions.at(spec.instance_id));
            } catch (const std::exception& err) {
                LOG_ERROR("Unexpected error running {}: {}", spec.instance_id, err.what());
                state_->update_unknown_instance_state(spec.instance_id, FailureMode::RunInstanceFailure);
            }

            if (report) {
                std::scoped_lock lock{reports_mutex};
                result.reports.insert_or_assign(spec.instance_id, *report);
            }

            report_outcome(spec.instance_id, report);
        }
    };

    const std::size_t num_workers = std::clamp<std::size_t>(opts_.max_workers, 1, std::max<std::size_t>(specs.size(), 1));

    {
        std::vector<std::jthread> workers;
        workers.reserve(num_workers);

        for (std::size_t i = 0; i < num_workers; ++i) {
            workers.emplace_back(worker);
        }
        // jthreads join on destruction
    }

    result.removed_images = sweep_images(*runtime_, specs, opts_.run.cache_level, opts_.clean, prior_images);

    LOG_INFO("Finished {} instance(s): {} graded", specs.size(), result.reports.size());

    return result;
}

} // namespace patchgrader
