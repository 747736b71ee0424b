#pragma once

namespace patchgrader {

/// Amount of progress output written to stdout. Logging (stderr) is controlled separately.
/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing; the exit code is the only result
    Quiet,   ///< Only the per-repository summaries
    Summary, ///< Summaries plus one line per instance that did not validate
    All,     ///< One line per instance
    Max
};

constexpr bool should_output_instance(VerbosityLevel level, bool validated) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !validated));
}

constexpr bool should_output_repo_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Quiet);
}

constexpr bool should_output_transitions(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= All);
}

constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level > Silent);
}

} // namespace patchgrader
