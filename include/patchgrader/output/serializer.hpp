#pragma once

#include <patchgrader/common/class_traits.hpp>
#include <patchgrader/output/sink.hpp>
#include <patchgrader/output/verbosity.hpp>
#include <patchgrader/runner/instance_runner.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace patchgrader {

struct RunMetadata
{
    std::string version_string;
    std::string run_id;
    std::chrono::system_clock::time_point start_time;
    std::size_t num_input_files = 0;
};

/// What became of one instance
struct InstanceOutcome
{
    std::string instance_id;
    FailureMode failure_mode = FailureMode::Unknown;
    /// Present only if the instance was graded
    std::optional<InstanceReport> report;

    /// Whether the instance made it into the validated output
    bool validated() const { return report.has_value() && !report->transitions.fail_to_pass.empty(); }
};

struct RepoSummary
{
    std::string repo_name;
    std::size_t num_instances = 0;
    std::size_t num_validated = 0;
    std::map<FailureMode, std::size_t> failure_mode_counts;
    std::chrono::duration<double> elapsed{};
};

/// Receives progress events of a validation run. Calls are serialized by the caller.
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;
    virtual void on_repo_begin(std::string_view repo_name, std::size_t num_instances) = 0;
    virtual void on_instance_result(const InstanceOutcome& data) = 0;
    virtual void on_repo_result(const RepoSummary& data) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_; // NOLINT(*-non-private-member-variables-in-classes)
    VerbosityLevel verbosity_; // NOLINT(*-non-private-member-variables-in-classes)
};

} // namespace patchgrader
