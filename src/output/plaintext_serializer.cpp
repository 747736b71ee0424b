#include "output/plaintext_serializer.hpp"

#include <patchgrader/harness/grader.hpp>
#include <patchgrader/logging.hpp>
#include <patchgrader/output/serializer.hpp>
#include <patchgrader/output/sink.hpp>
#include <patchgrader/output/verbosity.hpp>
#include <patchgrader/runner/instance_runner.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include "common/terminal_checks.hpp"
#include "common/time.hpp"
#include "user/program_options.hpp"

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace patchgrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_run_metadata(const RunMetadata& data) {
    if (!should_output_run_metadata(verbosity_)) {
        return;
    }

    constexpr std::string_view header_text = " Validation Run ";
    constexpr std::string_view version_label = "Version: ";
    constexpr std::string_view run_id_label = "Run ID: ";
    constexpr std::string_view date_label = "Date and Time: ";
    constexpr std::string_view files_label = "Input files: ";

    std::string local_timepoint_text =
        patchgrader::to_localtime_string(data.start_time, "%a %b %d %T %Y").value_or("<ERROR>");

    auto right_aligned = [this](std::string_view label, std::string_view value) {
        return fmt::format("{}{:>{}}\n", label, value, terminal_width_ - label.size());
    };

    std::string out = fmt::format("{:#^{}}\n", header_text, terminal_width_);
    out += right_aligned(version_label, data.version_string);
    out += right_aligned(run_id_label, data.run_id);
    out += right_aligned(date_label, local_timepoint_text);
    out += right_aligned(files_label, fmt::to_string(data.num_input_files));
    out += LINE_DIVIDER_2EM(terminal_width_) + "\n\n";

    sink_.write(out);
}

void PlainTextSerializer::on_repo_begin(std::string_view repo_name, std::size_t num_instances) {
    if (!should_output_repo_summary(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{0}\nRepository: {1} ({2} {3})\n{0}\n", LINE_DIVIDER_EM(terminal_width_),
                                  style(repo_name, POP_OUT_STYLE), num_instances,
                                  pluralize("instance", num_instances));

    sink_.write(out);
}

void PlainTextSerializer::on_instance_result(const InstanceOutcome& data) {
    if (!should_output_instance(verbosity_, data.validated())) {
        return;
    }

    std::string out = fmt::format("{} : {}\n", style(data.instance_id, VALUE_STYLE),
                                  style_str(data.failure_mode, style_for(data.failure_mode)));

    if (data.report && should_output_transitions(verbosity_)) {
        const auto& transitions = data.report->transitions;

        out += fmt::format("    fail->pass {} | pass->pass {} | fail->fail {} | pass->fail {}  ({}, {})\n",
                           transitions.fail_to_pass.size(), transitions.pass_to_pass.size(),
                           transitions.fail_to_fail.size(), transitions.pass_to_fail.size(),
                           data.report->patch_strategy,
                           format_duration(std::chrono::duration<double>(data.report->elapsed_seconds)));
    }

    sink_.write(out);
}

void PlainTextSerializer::on_repo_result(const RepoSummary& data) {
    if (!should_output_repo_summary(verbosity_)) {
        return;
    }

    std::string out = LINE_DIVIDER(terminal_width_) + "\n";

    if (data.num_instances == 0) {
        out += style_str("No instances were validated", WARNING_STYLE) + "\n";
        sink_.write(out);
        return;
    }

    std::string validated_msg = fmt::format("{} validated", data.num_validated);
    auto validated_style = data.num_validated > 0 ? SUCCESS_STYLE : ERROR_STYLE;

    out += fmt::format("{}: {} of {} {} in {}\n", style(data.repo_name, POP_OUT_STYLE),
                       style_str(validated_msg, validated_style), data.num_instances,
                       pluralize("instance", data.num_instances), format_duration(data.elapsed));

    // We would need >99999 instances for this to look off
    static constexpr std::size_t field_width = 22;

    for (const auto& [mode, count] : data.failure_mode_counts) {
        std::string label = fmt::format("{:<{}}", enum_to_string(mode), field_width);
        out += fmt::format("  {}{:>6}\n", style_str(label, style_for(mode)), count);
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    std::string out = style_str(what, WARNING_STYLE) + "\n";
    sink_.write(out);
}

void PlainTextSerializer::on_error(std::string_view what) {
    std::string out = style_str(what, ERROR_STYLE) + "\n";
    sink_.write(out);
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

fmt::text_style PlainTextSerializer::style_for(FailureMode mode) {
    switch (mode) {
    case FailureMode::Success:
        return SUCCESS_STYLE;
    case FailureMode::Unknown:
    case FailureMode::NoFailToPass:
    case FailureMode::NoToPass:
    case FailureMode::NoTestsRun:
        return WARNING_STYLE;
    default:
        return ERROR_STYLE;
    }
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return static_cast<std::size_t>(size.ws_col); });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    auto result = width.value_or(DEFAULT_WIDTH);

    // Not a terminal, or a nonsensically narrow one
    return result < DEFAULT_WIDTH / 2 ? DEFAULT_WIDTH : result;
}

} // namespace patchgrader
